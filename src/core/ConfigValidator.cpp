#include "ConfigValidator.h"
#include "Arn.h"
#include "Logging.h"
#include "ServiceRegionCatalog.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>

namespace cloud_audit {

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if(start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool ConfigValidator::validate(Config& cfg) {
    LogLevel lvl;
    if(!parse_log_level(cfg.log_level, lvl)) {
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    if(!cfg.external_id.empty() && cfg.role_arn.empty()) {
        std::cerr << "--external-id requires --role\n";
        return false;
    }
    if(!cfg.session_name.empty() && cfg.role_arn.empty()) {
        std::cerr << "--session-name requires --role\n";
        return false;
    }
    if(!cfg.role_arn.empty()) {
        if(!Arn::is_valid(cfg.role_arn) || Arn::parse(cfg.role_arn).service() != "iam") {
            std::cerr << "Invalid --role value (expected an IAM role ARN): " << cfg.role_arn << "\n";
            return false;
        }
        if(cfg.session_duration < kMinSessionDuration || cfg.session_duration > kMaxSessionDuration) {
            std::cerr << "--session-duration must be between " << kMinSessionDuration << " and "
                      << kMaxSessionDuration << " seconds\n";
            return false;
        }
    }

    if(!validate_arn_list(cfg.resource_arns, "--resource-arn")) return false;

    // Dedupe while keeping order: the first region given stays first.
    std::vector<std::string> regions;
    for(auto& r : cfg.regions) {
        r = trim(r);
        if(!r.empty() && std::find(regions.begin(), regions.end(), r) == regions.end()) regions.push_back(r);
    }
    cfg.regions = regions;

    for(const auto& s : cfg.services) {
        if(std::find(cfg.excluded_services.begin(), cfg.excluded_services.end(), s) != cfg.excluded_services.end()) {
            std::cerr << "Cannot include and exclude the same service: " << s << "\n";
            return false;
        }
    }
    return true;
}

bool ConfigValidator::validate_arn_list(const std::vector<std::string>& arns, const std::string& flag_name) {
    for(const auto& a : arns) {
        if(!Arn::is_valid(a)) {
            std::cerr << "Invalid " << flag_name << " value: " << a << "\n";
            return false;
        }
    }
    return true;
}

bool ConfigValidator::load_external_files(Config& cfg) {
    if(cfg.resource_arn_file.empty()) return true;
    std::ifstream af(cfg.resource_arn_file);
    if(!af) {
        std::cerr << "Failed to open resource ARN file: " << cfg.resource_arn_file << "\n";
        return false;
    }
    std::string line;
    while(std::getline(af, line)) {
        line = trim(line);
        if(line.empty()) continue;
        if(line[0] == '#') continue;
        cfg.resource_arns.push_back(line);
    }
    return true;
}

bool ConfigValidator::validate_regions(const Config& cfg, const ServiceRegionCatalog& catalog) {
    if(cfg.regions.empty()) return true;
    auto known = catalog.all_regions();
    std::set<std::string> known_set(known.begin(), known.end());
    for(const auto& r : cfg.regions) {
        if(!known_set.count(r)) {
            std::cerr << "Unknown region: " << r << "\n";
            return false;
        }
    }
    return true;
}

bool ConfigValidator::load_config_file(const std::string& path, Config& cfg) {
    std::ifstream f(path);
    if(!f) {
        std::cerr << "Failed to open config file: " << path << "\n";
        return false;
    }
    nlohmann::json doc;
    try {
        f >> doc;
    } catch(const nlohmann::json::parse_error& ex) {
        std::cerr << "Invalid config file " << path << ": " << ex.what() << "\n";
        return false;
    }
    if(!doc.is_object()) {
        std::cerr << "Config file must contain a JSON object: " << path << "\n";
        return false;
    }
    try {
        for(auto it = doc.begin(); it != doc.end(); ++it) {
            const std::string& k = it.key();
            const auto& v = it.value();
            if(k == "profile") cfg.profile = v.get<std::string>();
            else if(k == "profile_region") cfg.profile_region = v.get<std::string>();
            else if(k == "account") cfg.audited_account = v.get<std::string>();
            else if(k == "partition") cfg.partition = v.get<std::string>();
            else if(k == "role") cfg.role_arn = v.get<std::string>();
            else if(k == "external_id") cfg.external_id = v.get<std::string>();
            else if(k == "session_name") cfg.session_name = v.get<std::string>();
            else if(k == "session_duration") cfg.session_duration = v.get<int>();
            else if(k == "regions") cfg.regions = v.get<std::vector<std::string>>();
            else if(k == "resource_arns") cfg.resource_arns = v.get<std::vector<std::string>>();
            else if(k == "resource_arn_file") cfg.resource_arn_file = v.get<std::string>();
            else if(k == "services") cfg.services = v.get<std::vector<std::string>>();
            else if(k == "excluded_services") cfg.excluded_services = v.get<std::vector<std::string>>();
            else if(k == "catalog") cfg.catalog_file = v.get<std::string>();
            else if(k == "checks") cfg.checks_file = v.get<std::string>();
            else if(k == "output") cfg.output_file = v.get<std::string>();
            else if(k == "pretty") cfg.pretty = v.get<bool>();
            else if(k == "parallel") cfg.parallel = v.get<bool>();
            else if(k == "log_level") cfg.log_level = v.get<std::string>();
            else {
                std::cerr << "Unknown key in config file " << path << ": " << k << "\n";
                return false;
            }
        }
    } catch(const nlohmann::json::type_error& ex) {
        std::cerr << "Invalid value in config file " << path << ": " << ex.what() << "\n";
        return false;
    }
    return true;
}

std::string ConfigValidator::locate_data_file(const std::string& name, const std::vector<std::string>& dirs) {
    for(const auto& d : dirs) {
        std::error_code ec;
        std::filesystem::path p = std::filesystem::path(d) / name;
        if(std::filesystem::is_regular_file(p, ec)) return p.string();
    }
    if(dirs.empty()) return name;
    return (std::filesystem::path(dirs.front()) / name).string();
}

AuditInfo ConfigValidator::build_audit_info(const Config& cfg) {
    AuditInfo a;
    a.audited_account = cfg.audited_account;
    a.audited_partition = cfg.partition;
    a.profile = cfg.profile;
    a.profile_region = cfg.profile_region;
    a.audited_regions = cfg.regions;
    a.audit_resources = cfg.resource_arns;
    if(!cfg.role_arn.empty()) {
        AssumedRoleInfo role;
        role.role_arn = cfg.role_arn;
        role.external_id = cfg.external_id;
        role.session_duration = cfg.session_duration;
        role.session_name = cfg.session_name;
        a.assumed_role_info = role;
        // The role ARN decides the partition; it also supplies the account when none was given.
        Arn arn = Arn::parse(cfg.role_arn);
        if(a.audited_account.empty()) a.audited_account = arn.account_id();
        if(!arn.partition().empty()) a.audited_partition = arn.partition();
    }
    return a;
}

}
