#pragma once
#include <string>
#include <vector>
#include <utility>

namespace cloud_audit {

// arn:partition:service:region:account-id:resource
// Fields past the sixth belong to the resource part and are joined back with ':'.
class Arn {
public:
    // Throws MalformedIdentifier when fewer than six fields are present or the prefix is not "arn".
    static Arn parse(const std::string& text);
    static bool is_valid(const std::string& text);

    const std::string& str() const { return text_; }
    const std::string& partition() const { return partition_; }
    const std::string& service() const { return service_; }
    const std::string& region() const { return region_; }
    const std::string& account_id() const { return account_id_; }
    const std::string& resource() const { return resource_; }

    // First segment of the resource part, split on '/' or ':' ("security-group/sg-1" -> "security-group").
    std::string resource_type() const;

private:
    Arn() = default;
    std::string text_;
    std::string partition_;
    std::string service_;
    std::string region_;
    std::string account_id_;
    std::string resource_;
};

// Decides whether a listed resource falls inside the caller-supplied ARN set.
class ScopeFilter {
public:
    ScopeFilter() = default;
    explicit ScopeFilter(std::vector<std::string> arns) : arns_(std::move(arns)) {}

    bool active() const { return !arns_.empty(); }
    // A candidate is included when it equals a filter entry or lives under one
    // (entry followed by '/' or ':' is a prefix of the candidate).
    bool is_included(const std::string& candidate_arn) const;
    const std::vector<std::string>& arns() const { return arns_; }

private:
    std::vector<std::string> arns_;
};

}
