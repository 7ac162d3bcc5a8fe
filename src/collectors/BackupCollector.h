#pragma once
#include "BackupApi.h"
#include "../core/ResourceCollector.h"
#include <vector>

namespace cloud_audit {

struct BackupVault {
    std::string arn;
    std::string name;
    std::string region;
    std::optional<std::string> encryption;
    std::int64_t recovery_points = 0;
    bool locked = false;
    std::optional<std::int64_t> min_retention_days;
    std::optional<std::int64_t> max_retention_days;
};

struct BackupPlan {
    std::string arn;
    std::string id;
    std::string region;
    std::string name;
    std::string version_id;
    std::optional<std::chrono::system_clock::time_point> last_execution_date;
    std::vector<AdvancedBackupSetting> advanced_settings;
};

struct BackupReportPlan {
    std::string arn;
    std::string region;
    std::string name;
    std::optional<std::chrono::system_clock::time_point> last_attempted_execution_date;
    std::optional<std::chrono::system_clock::time_point> last_successful_execution_date;
};

class BackupCollector : public ResourceCollector<BackupApi> {
public:
    static constexpr const char* kService = "backup";

    BackupCollector(RegionalClients<BackupApi> clients, ScopeFilter filter, const std::string& profile_region = "")
        : ResourceCollector<BackupApi>(kService, std::move(clients), std::move(filter), profile_region) {}

    std::string description() const override { return "Backup vaults, plans and report plans"; }
    void collect(Report& report) override;
    std::size_t resource_count() const override;
    nlohmann::json inventory() const override;

    // Valid once collect() has returned.
    const std::vector<BackupVault>& backup_vaults() const { return backup_vaults_; }
    const std::vector<BackupPlan>& backup_plans() const { return backup_plans_; }
    const std::vector<BackupReportPlan>& backup_report_plans() const { return backup_report_plans_; }

private:
    void list_backup_vaults(const RegionalClient<BackupApi>& rc);
    void list_backup_plans(const RegionalClient<BackupApi>& rc);
    void list_backup_report_plans(const RegionalClient<BackupApi>& rc);

    std::vector<BackupVault> backup_vaults_;
    std::vector<BackupPlan> backup_plans_;
    std::vector<BackupReportPlan> backup_report_plans_;
};

}
