#include "AwsBackupClient.h"
#include "SdkCredentials.h"
#include "../core/Errors.h"
#include <aws/core/client/ClientConfiguration.h>
#include <aws/backup/BackupClient.h>
#include <aws/backup/BackupEndpointProvider.h>
#include <aws/backup/model/ListBackupPlansRequest.h>
#include <aws/backup/model/ListBackupVaultsRequest.h>
#include <aws/backup/model/ListReportPlansRequest.h>

namespace cloud_audit {
namespace aws {

static const char* kAllocationTag = "cloud-audit-backup";

template <class Outcome>
static void throw_if_failed(const Outcome& outcome) {
    if(outcome.IsSuccess()) return;
    const auto& err = outcome.GetError();
    throw ProviderError(err.GetExceptionName(), err.GetMessage());
}

static std::optional<std::string> next_of(const Aws::String& token) {
    if(token.empty()) return std::nullopt;
    return std::string(token);
}

AwsBackupClient::AwsBackupClient(const Session& session, const std::string& region)
    : credentials_(session.credentials) {
    Aws::Client::ClientConfiguration config;
    config.region = region;
    client_ = std::make_unique<Aws::Backup::BackupClient>(
        std::make_shared<SdkCredentialsProvider>(credentials_),
        Aws::MakeShared<Aws::Backup::Endpoint::BackupEndpointProvider>(kAllocationTag),
        Aws::Backup::BackupClientConfiguration(config));
}

AwsBackupClient::~AwsBackupClient() = default;

std::unique_ptr<BackupApi> AwsBackupClient::make(const Session& session, const std::string& region) {
    return std::make_unique<AwsBackupClient>(session, region);
}

void AwsBackupClient::ensure_credentials() {
    credentials_->current_valid();
}

Page<BackupVaultSummary> AwsBackupClient::list_backup_vaults(const std::optional<std::string>& next_token) {
    ensure_credentials();
    Aws::Backup::Model::ListBackupVaultsRequest req;
    if(next_token) req.SetNextToken(*next_token);
    auto outcome = client_->ListBackupVaults(req);
    throw_if_failed(outcome);
    const auto& result = outcome.GetResult();
    Page<BackupVaultSummary> page;
    for(const auto& v : result.GetBackupVaultList()) {
        BackupVaultSummary s;
        s.arn = v.GetBackupVaultArn();
        s.name = v.GetBackupVaultName();
        if(v.EncryptionKeyArnHasBeenSet()) s.encryption_key_arn = v.GetEncryptionKeyArn();
        s.recovery_points = v.GetNumberOfRecoveryPoints();
        s.locked = v.GetLocked();
        if(v.MinRetentionDaysHasBeenSet()) s.min_retention_days = v.GetMinRetentionDays();
        if(v.MaxRetentionDaysHasBeenSet()) s.max_retention_days = v.GetMaxRetentionDays();
        page.items.push_back(std::move(s));
    }
    page.next_token = next_of(result.GetNextToken());
    return page;
}

Page<BackupPlanSummary> AwsBackupClient::list_backup_plans(const std::optional<std::string>& next_token) {
    ensure_credentials();
    Aws::Backup::Model::ListBackupPlansRequest req;
    if(next_token) req.SetNextToken(*next_token);
    auto outcome = client_->ListBackupPlans(req);
    throw_if_failed(outcome);
    const auto& result = outcome.GetResult();
    Page<BackupPlanSummary> page;
    for(const auto& p : result.GetBackupPlansList()) {
        BackupPlanSummary s;
        s.arn = p.GetBackupPlanArn();
        s.id = p.GetBackupPlanId();
        s.name = p.GetBackupPlanName();
        s.version_id = p.GetVersionId();
        if(p.LastExecutionDateHasBeenSet()) s.last_execution_date = p.GetLastExecutionDate().UnderlyingTimestamp();
        for(const auto& a : p.GetAdvancedBackupSettings()) {
            AdvancedBackupSetting setting;
            setting.resource_type = a.GetResourceType();
            for(const auto& kv : a.GetBackupOptions()) setting.options[kv.first] = kv.second;
            s.advanced_settings.push_back(std::move(setting));
        }
        page.items.push_back(std::move(s));
    }
    page.next_token = next_of(result.GetNextToken());
    return page;
}

Page<ReportPlanSummary> AwsBackupClient::list_report_plans(const std::optional<std::string>& next_token) {
    ensure_credentials();
    Aws::Backup::Model::ListReportPlansRequest req;
    if(next_token) req.SetNextToken(*next_token);
    auto outcome = client_->ListReportPlans(req);
    throw_if_failed(outcome);
    const auto& result = outcome.GetResult();
    Page<ReportPlanSummary> page;
    for(const auto& r : result.GetReportPlans()) {
        ReportPlanSummary s;
        s.arn = r.GetReportPlanArn();
        s.name = r.GetReportPlanName();
        if(r.LastAttemptedExecutionTimeHasBeenSet()) s.last_attempted_execution = r.GetLastAttemptedExecutionTime().UnderlyingTimestamp();
        if(r.LastSuccessfulExecutionTimeHasBeenSet()) s.last_successful_execution = r.GetLastSuccessfulExecutionTime().UnderlyingTimestamp();
        page.items.push_back(std::move(s));
    }
    page.next_token = next_of(result.GetNextToken());
    return page;
}

}
}
