#pragma once
#include "Config.h"
#include "AuditInfo.h"
#include <string>
#include <vector>

namespace cloud_audit {

class ServiceRegionCatalog;

// Post-parse validation and normalization of Config. Problems are reported on
// std::cerr and signalled by a false return (exit status 2 in main).
class ConfigValidator {
public:
    static constexpr int kMinSessionDuration = 900;
    static constexpr int kMaxSessionDuration = 43200;

    bool validate(Config& cfg);

    // Merges resource_arn_file into resource_arns.
    bool load_external_files(Config& cfg);

    // Every requested region must exist somewhere in the catalog.
    bool validate_regions(const Config& cfg, const ServiceRegionCatalog& catalog);

    // Applies a JSON config document ({"profile": ..., "regions": [...], ...}) onto cfg.
    // Unknown keys are rejected.
    bool load_config_file(const std::string& path, Config& cfg);

    static AuditInfo build_audit_info(const Config& cfg);

    // First dirs[i]/name that exists; dirs.front()/name when none does.
    static std::string locate_data_file(const std::string& name, const std::vector<std::string>& dirs);

private:
    bool validate_arn_list(const std::vector<std::string>& arns, const std::string& flag_name);
};

std::vector<std::string> split_csv(const std::string& s);

}
