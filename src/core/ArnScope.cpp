#include "ArnScope.h"
#include "Arn.h"
#include "Errors.h"
#include "Logging.h"
#include <algorithm>
#include <map>

namespace cloud_audit {

namespace {

const std::set<std::string> kServicesWithoutSubservices = {"guardduty", "kms", "s3", "elb"};

const std::map<std::string, std::map<std::string, std::string>> kSubserviceAliases = {
    {"ec2", {{"security_group", "securitygroup"}, {"network_acl", "networkacl"}, {"image", "ami"}}},
    {"rds", {{"cluster_snapshot", "snapshot"}}},
};

}

std::string normalize_service(const std::string& arn_service) {
    if(arn_service == "waf" || arn_service == "wafv2") return "";
    if(arn_service == "lambda") return "awslambda";
    if(arn_service == "elasticloadbalancing") return "elb";
    if(arn_service == "logs") return "cloudwatch";
    return arn_service;
}

std::string subservice_token(const std::string& service, const std::string& resource_type) {
    if(kServicesWithoutSubservices.count(service)) return service;
    std::string token = resource_type;
    std::replace(token.begin(), token.end(), '-', '_');
    auto svc = kSubserviceAliases.find(service);
    if(svc != kSubserviceAliases.end()) {
        auto alias = svc->second.find(token);
        if(alias != svc->second.end()) return alias->second;
    }
    return token;
}

std::optional<std::vector<std::string>> regions_from_resources(const std::vector<std::string>& resource_arns) {
    std::vector<std::string> regions;
    for(const auto& text : resource_arns) {
        Arn arn = Arn::parse(text);
        if(arn.region().empty()) continue;
        if(std::find(regions.begin(), regions.end(), arn.region()) == regions.end()) regions.push_back(arn.region());
    }
    if(regions.empty()) return std::nullopt;
    return regions;
}

ScopeDecision resolve_scope(const std::vector<std::string>& resource_arns, const CheckRegistry& registry) {
    ScopeDecision d;
    if(resource_arns.empty()) return d;
    d.scoped = true;
    for(const auto& text : resource_arns) {
        Arn arn = Arn::parse(text);
        std::string service = normalize_service(arn.service());
        if(service.empty()) continue;
        try {
            registry.list_checks_for_service(service);
            d.services.insert(service);
        } catch(const CheckNotFound&) {
            Logger::instance().debug("no checks for service " + service + " (from " + text + ")");
        }
        d.subservices.insert(subservice_token(service, arn.resource_type()));
    }
    d.regions = regions_from_resources(resource_arns);
    return d;
}

std::vector<std::string> select_checks(const ScopeDecision& decision, const CheckRegistry& registry) {
    std::vector<std::string> out;
    for(const auto& check : registry.checks_for_services(decision.services)) {
        bool matched = std::any_of(decision.subservices.begin(), decision.subservices.end(), [&](const std::string& token){
            if(check.find(token) == std::string::npos) return false;
            return !(token == "policy" && check.find("password_policy") != std::string::npos);
        });
        if(matched) out.push_back(check);
    }
    std::sort(out.begin(), out.end());
    return out;
}

}
