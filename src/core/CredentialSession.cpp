#include "CredentialSession.h"
#include "Errors.h"
#include "Logging.h"

namespace cloud_audit {

namespace {

// One token exchange. ProviderError propagates unchanged; the caller decides what it means.
Credentials exchange(StsApi& sts, const Session& base, const AssumedRoleInfo& role) {
    Credentials caller = base.credentials->current_valid();
    std::string region = base.region.empty() ? CredentialSessionManager::kStsRegion : base.region;
    return sts.assume_role(caller, region, CredentialSessionManager::make_request(role));
}

}

AssumeRoleRequest CredentialSessionManager::make_request(const AssumedRoleInfo& role) {
    AssumeRoleRequest req;
    req.role_arn = role.role_arn;
    req.duration_seconds = role.session_duration;
    if(!role.external_id.empty()) {
        req.external_id = role.external_id;
        req.role_session_name = kExternalIdSessionName;
    } else {
        req.role_session_name = kDefaultSessionName;
    }
    if(!role.session_name.empty()) req.role_session_name = role.session_name;
    return req;
}

Session CredentialSessionManager::profile_session(const AuditInfo& audit) {
    std::optional<Credentials> creds;
    try {
        creds = resolver_.resolve(audit.profile);
    } catch(const ProviderError& ex) {
        throw AuthError(AuthError::Kind::NoUsableIdentity, ex.code() + ": " + ex.what());
    }
    if(!creds) {
        std::string what = audit.profile.empty() ? "default credential chain" : "profile " + audit.profile;
        throw AuthError(AuthError::Kind::NoUsableIdentity, "no usable identity from " + what);
    }
    Session s;
    s.profile = audit.profile;
    s.region = audit.profile_region;
    s.credentials = std::make_shared<StaticCredentialProvider>(std::move(*creds));
    return s;
}

Session CredentialSessionManager::establish(const AuditInfo& audit) {
    if(!audit.credentials) {
        Logger::instance().info("Creating session for not assumed identity ...");
        return profile_session(audit);
    }
    Logger::instance().info("Creating session for assumed role ...");
    if(!audit.assumed_role_info)
        throw AuthError(AuthError::Kind::NoUsableIdentity, "assumed credentials supplied without role information");

    Session base = profile_session(audit);
    AssumedRoleInfo role = *audit.assumed_role_info;
    StsApi& sts = sts_;
    auto refresh = [&sts, base, role]() { return exchange(sts, base, role); };

    Session s;
    s.profile = audit.profile;
    s.region = audit.profile_region;
    s.assumed_role = true;
    s.credentials = std::make_shared<RefreshableCredentialProvider>(*audit.credentials, refresh);
    return s;
}

Credentials CredentialSessionManager::assume_role(const Session& base, const AssumedRoleInfo& role) {
    Logger::instance().info("Assuming role " + role.role_arn);
    try {
        return exchange(sts_, base, role);
    } catch(const ProviderError& ex) {
        throw AuthError(AuthError::Kind::AssumeRoleFailed, ex.code() + " -- " + ex.what());
    } catch(const RefreshError& ex) {
        throw AuthError(AuthError::Kind::AssumeRoleFailed, std::string("RefreshError -- ") + ex.what());
    }
}

}
