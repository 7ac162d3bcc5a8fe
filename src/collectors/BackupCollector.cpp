#include "BackupCollector.h"
#include "../core/JsonUtil.h"
#include "../core/Pagination.h"

namespace cloud_audit {

void BackupCollector::collect(Report& report) {
    threading_call(report, "list_backup_vaults", [this](const RegionalClient<BackupApi>& rc){ list_backup_vaults(rc); });
    threading_call(report, "list_backup_plans", [this](const RegionalClient<BackupApi>& rc){ list_backup_plans(rc); });
    threading_call(report, "list_report_plans", [this](const RegionalClient<BackupApi>& rc){ list_backup_report_plans(rc); });
}

// Each worker buffers its region's records and publishes them only once the
// listing has completed, so a failed region contributes nothing.

void BackupCollector::list_backup_vaults(const RegionalClient<BackupApi>& rc) {
    std::vector<BackupVault> found;
    paginate([&](const std::optional<std::string>& token){ return rc.client->list_backup_vaults(token); },
             [&](const BackupVaultSummary& v){
                 if(!included(v.arn)) return;
                 found.push_back(BackupVault{v.arn, v.name, rc.region, v.encryption_key_arn, v.recovery_points,
                                             v.locked, v.min_retention_days, v.max_retention_days});
             });
    std::lock_guard<std::mutex> lock(results_mutex_);
    backup_vaults_.insert(backup_vaults_.end(), found.begin(), found.end());
}

void BackupCollector::list_backup_plans(const RegionalClient<BackupApi>& rc) {
    std::vector<BackupPlan> found;
    paginate([&](const std::optional<std::string>& token){ return rc.client->list_backup_plans(token); },
             [&](const BackupPlanSummary& p){
                 if(!included(p.arn)) return;
                 found.push_back(BackupPlan{p.arn, p.id, rc.region, p.name, p.version_id,
                                            p.last_execution_date, p.advanced_settings});
             });
    std::lock_guard<std::mutex> lock(results_mutex_);
    backup_plans_.insert(backup_plans_.end(), found.begin(), found.end());
}

void BackupCollector::list_backup_report_plans(const RegionalClient<BackupApi>& rc) {
    std::vector<BackupReportPlan> found;
    paginate([&](const std::optional<std::string>& token){ return rc.client->list_report_plans(token); },
             [&](const ReportPlanSummary& r){
                 if(!included(r.arn)) return;
                 found.push_back(BackupReportPlan{r.arn, rc.region, r.name,
                                                  r.last_attempted_execution, r.last_successful_execution});
             });
    std::lock_guard<std::mutex> lock(results_mutex_);
    backup_report_plans_.insert(backup_report_plans_.end(), found.begin(), found.end());
}

std::size_t BackupCollector::resource_count() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return backup_vaults_.size() + backup_plans_.size() + backup_report_plans_.size();
}

nlohmann::json BackupCollector::inventory() const {
    using namespace jsonutil;
    std::lock_guard<std::mutex> lock(results_mutex_);
    nlohmann::json vaults = nlohmann::json::array();
    for(const auto& v : backup_vaults_) {
        vaults.push_back({{"arn", v.arn}, {"name", v.name}, {"region", v.region},
                          {"encryption", optional_value(v.encryption)}, {"recovery_points", v.recovery_points},
                          {"locked", v.locked}, {"min_retention_days", optional_value(v.min_retention_days)},
                          {"max_retention_days", optional_value(v.max_retention_days)}});
    }
    nlohmann::json plans = nlohmann::json::array();
    for(const auto& p : backup_plans_) {
        nlohmann::json settings = nlohmann::json::array();
        for(const auto& s : p.advanced_settings) settings.push_back({{"resource_type", s.resource_type}, {"options", s.options}});
        plans.push_back({{"arn", p.arn}, {"id", p.id}, {"region", p.region}, {"name", p.name},
                         {"version_id", p.version_id}, {"last_execution_date", optional_time(p.last_execution_date)},
                         {"advanced_settings", settings}});
    }
    nlohmann::json report_plans = nlohmann::json::array();
    for(const auto& r : backup_report_plans_) {
        report_plans.push_back({{"arn", r.arn}, {"region", r.region}, {"name", r.name},
                                {"last_attempted_execution_date", optional_time(r.last_attempted_execution_date)},
                                {"last_successful_execution_date", optional_time(r.last_successful_execution_date)}});
    }
    return {{"backup_vaults", vaults}, {"backup_plans", plans}, {"backup_report_plans", report_plans}};
}

}
