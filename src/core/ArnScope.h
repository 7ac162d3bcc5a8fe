#pragma once
#include "CheckRegistry.h"
#include <string>
#include <vector>
#include <set>
#include <optional>

namespace cloud_audit {

// Narrowing derived from the --resource-arn list. scoped == false means "audit everything".
struct ScopeDecision {
    bool scoped = false;
    std::set<std::string> services;
    std::set<std::string> subservices;
    std::optional<std::vector<std::string>> regions; // nullopt = all regions
};

// Maps an ARN service token to the service name used by the check catalog.
// Returns an empty string for services that never have checks (waf, wafv2).
std::string normalize_service(const std::string& arn_service);

// Subservice token for a normalized service and the ARN's resource type.
std::string subservice_token(const std::string& service, const std::string& resource_type);

// Throws MalformedIdentifier for any ARN that does not parse.
ScopeDecision resolve_scope(const std::vector<std::string>& resource_arns, const CheckRegistry& registry);

// Regions named by the ARNs, deduplicated in first-appearance order; nullopt if none carries a region.
std::optional<std::vector<std::string>> regions_from_resources(const std::vector<std::string>& resource_arns);

// Checks of the scoped services whose name contains a subservice token. Sorted.
// The token "policy" never selects a "password_policy" check: those are different controls.
std::vector<std::string> select_checks(const ScopeDecision& decision, const CheckRegistry& registry);

}
