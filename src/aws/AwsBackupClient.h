#pragma once
#include "../collectors/BackupApi.h"
#include "../core/CredentialSession.h"
#include <memory>

namespace Aws { namespace Backup { class BackupClient; } }

namespace cloud_audit {
namespace aws {

// BackupApi over Aws::Backup::BackupClient, bound to one region.
class AwsBackupClient : public BackupApi {
public:
    AwsBackupClient(const Session& session, const std::string& region);
    ~AwsBackupClient() override;

    Page<BackupVaultSummary> list_backup_vaults(const std::optional<std::string>& next_token) override;
    Page<BackupPlanSummary> list_backup_plans(const std::optional<std::string>& next_token) override;
    Page<ReportPlanSummary> list_report_plans(const std::optional<std::string>& next_token) override;

    static std::unique_ptr<BackupApi> make(const Session& session, const std::string& region);

private:
    // Surfaces a RefreshError to the caller before the SDK signs the request.
    void ensure_credentials();

    std::shared_ptr<CredentialProvider> credentials_;
    std::unique_ptr<Aws::Backup::BackupClient> client_;
};

}
}
