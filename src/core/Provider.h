#pragma once
#include "AuditInfo.h"
#include <string>
#include <optional>

namespace cloud_audit {

// Control-plane collaborators. Implementations throw ProviderError on API failures.

struct AssumeRoleRequest {
    std::string role_arn;
    std::string role_session_name;
    int duration_seconds = 3600;
    std::optional<std::string> external_id;
};

// Resolves a named local profile, or the ambient/default chain when profile is empty.
class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;
    virtual std::optional<Credentials> resolve(const std::string& profile) = 0;
};

// Security token exchange.
class StsApi {
public:
    virtual ~StsApi() = default;
    virtual Credentials assume_role(const Credentials& caller, const std::string& region, const AssumeRoleRequest& request) = 0;
};

}
