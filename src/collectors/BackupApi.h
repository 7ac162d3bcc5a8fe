#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cloud_audit {

// Subset of the backup control plane the collector reads.

struct BackupVaultSummary {
    std::string arn;
    std::string name;
    std::optional<std::string> encryption_key_arn;
    std::int64_t recovery_points = 0;
    bool locked = false;
    std::optional<std::int64_t> min_retention_days;
    std::optional<std::int64_t> max_retention_days;
};

struct AdvancedBackupSetting {
    std::string resource_type;
    std::map<std::string, std::string> options;
};

struct BackupPlanSummary {
    std::string arn;
    std::string id;
    std::string name;
    std::string version_id;
    std::optional<std::chrono::system_clock::time_point> last_execution_date;
    std::vector<AdvancedBackupSetting> advanced_settings;
};

struct ReportPlanSummary {
    std::string arn;
    std::string name;
    std::optional<std::chrono::system_clock::time_point> last_attempted_execution;
    std::optional<std::chrono::system_clock::time_point> last_successful_execution;
};

template <class T>
struct Page {
    std::vector<T> items;
    std::optional<std::string> next_token;
};

class BackupApi {
public:
    virtual ~BackupApi() = default;
    virtual Page<BackupVaultSummary> list_backup_vaults(const std::optional<std::string>& next_token) = 0;
    virtual Page<BackupPlanSummary> list_backup_plans(const std::optional<std::string>& next_token) = 0;
    virtual Page<ReportPlanSummary> list_report_plans(const std::optional<std::string>& next_token) = 0;
};

}
