#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>

namespace cloud_audit {

using Clock = std::chrono::system_clock;

struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    Clock::time_point expiration = Clock::time_point::max(); // max() = does not expire

    bool expires() const { return expiration != Clock::time_point::max(); }
};

struct AssumedRoleInfo {
    std::string role_arn;
    std::string external_id; // empty = not sent
    int session_duration = 3600; // seconds
    std::string session_name; // empty = derived from external_id presence
};

// Everything the audit needs to know about who and what is being audited.
struct AuditInfo {
    std::string audited_account;
    std::string audited_partition = "aws";
    std::string profile; // empty = default credential chain
    std::string profile_region;
    std::vector<std::string> audited_regions; // empty = every region the catalog lists
    std::vector<std::string> audit_resources; // ARNs; empty = no inclusion filter
    std::optional<AssumedRoleInfo> assumed_role_info;
    std::optional<Credentials> credentials; // set when already running under an assumed role
};

}
