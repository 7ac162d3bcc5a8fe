#pragma once
#include <string>
#include <vector>

namespace cloud_audit {

struct Config {
    // Identity
    std::string profile; // empty = default credential chain
    std::string profile_region;
    std::string audited_account;
    std::string partition = "aws";
    std::string role_arn; // if set, the audit runs under this assumed role
    std::string external_id;
    std::string session_name;
    int session_duration = 3600; // seconds, 900..43200
    // Scope
    std::vector<std::string> regions; // empty = all catalog regions
    std::vector<std::string> resource_arns;
    std::string resource_arn_file; // newline-delimited ARNs, '#' comments
    std::vector<std::string> services; // if non-empty, only these
    std::vector<std::string> excluded_services;
    // Data files
    std::string catalog_file;
    std::string checks_file;
    // Output
    std::string output_file; // empty = stdout
    bool pretty = false;
    bool list_checks = false; // print checks selected by --resource-arn and exit
    // Execution
    bool parallel = true; // run collectors for different services concurrently
    std::string log_level = "info";
    std::string config_file; // optional JSON file merged under command-line values
};

Config& config();
void set_config(const Config& c);

}
