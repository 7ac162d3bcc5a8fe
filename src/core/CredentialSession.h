#pragma once
#include "AuditInfo.h"
#include "CredentialProvider.h"
#include "Provider.h"
#include <memory>
#include <string>

namespace cloud_audit {

// Authenticated session shared (read-only) by every regional client.
struct Session {
    std::string profile;
    std::string region; // profile region; may be empty
    std::shared_ptr<CredentialProvider> credentials;
    bool assumed_role = false;
};

class CredentialSessionManager {
public:
    static constexpr const char* kExternalIdSessionName = "CloudAuditAssessmentSession";
    static constexpr const char* kDefaultSessionName = "CloudAuditProAssessmentSession";
    static constexpr const char* kStsRegion = "us-east-1";

    CredentialSessionManager(IdentityResolver& resolver, StsApi& sts) : resolver_(resolver), sts_(sts) {}

    // Builds the session for an audit. Without audit.credentials the local
    // profile (or default chain) is used and STS is never called; with them
    // the session refreshes by assuming audit.assumed_role_info again.
    // Throws AuthError when no usable identity can be resolved.
    Session establish(const AuditInfo& audit);

    // Initial role assumption on behalf of `base`. Throws AuthError(AssumeRoleFailed) on any failure.
    Credentials assume_role(const Session& base, const AssumedRoleInfo& role);

    static AssumeRoleRequest make_request(const AssumedRoleInfo& role);

private:
    Session profile_session(const AuditInfo& audit);

    IdentityResolver& resolver_;
    StsApi& sts_;
};

}
