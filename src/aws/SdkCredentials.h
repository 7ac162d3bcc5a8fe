#pragma once
#include "../core/AuditInfo.h"
#include "../core/CredentialProvider.h"
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <memory>

namespace cloud_audit {
namespace aws {

Aws::Auth::AWSCredentials to_sdk(const Credentials& c);
Credentials from_sdk(const Aws::Auth::AWSCredentials& c);

// Exposes a CredentialProvider to SDK clients; the SDK asks for credentials
// while signing every request.
class SdkCredentialsProvider : public Aws::Auth::AWSCredentialsProvider {
public:
    explicit SdkCredentialsProvider(std::shared_ptr<CredentialProvider> provider) : provider_(std::move(provider)) {}
    // The SDK cannot carry our exceptions: a RefreshError is logged and empty
    // credentials are returned, so the request fails as unauthenticated.
    // Callers that need the RefreshError call current_valid() first (see AwsBackupClient).
    Aws::Auth::AWSCredentials GetAWSCredentials() override;
private:
    std::shared_ptr<CredentialProvider> provider_;
};

}
}
