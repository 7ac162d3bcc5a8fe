#include "core/ArnScope.h"
#include "core/CheckRegistry.h"
#include "core/CollectorRegistry.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/CredentialSession.h"
#include "core/Errors.h"
#include "core/InventoryWriter.h"
#include "core/Logging.h"
#include "core/RegionalClientFactory.h"
#include "core/Report.h"
#include "core/ServiceRegionCatalog.h"
#include "aws/AwsBackupClient.h"
#include "aws/AwsIdentityResolver.h"
#include "aws/AwsStsClient.h"
#include "aws/SdkApiGuard.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

using namespace cloud_audit;

static void print_help(){
    std::cout << "cloud-audit options:\n";
    struct Line { std::string name; std::string help; };
    static const std::vector<Line> lines = {
        {"--config FILE", "JSON config file (command-line flags take precedence)"},
        {"--profile NAME", "Local credentials profile (default: SDK default chain)"},
        {"--profile-region REGION", "Region of the profile, preferred for global services"},
        {"--account ID", "Audited account id (default: taken from --role)"},
        {"--partition NAME", "Partition: aws, aws-cn, aws-us-gov (default aws)"},
        {"--role ARN", "Assume this role for the audit"},
        {"--external-id ID", "External id for --role"},
        {"--session-name NAME", "Role session name"},
        {"--session-duration S", "Assumed role session duration in seconds (900-43200)"},
        {"--region r[,r...]", "Only audit these regions"},
        {"--resource-arn a[,a...]", "Only audit these resources"},
        {"--resource-arn-file FILE", "Newline-delimited resource ARNs"},
        {"--services s[,s...]", "Only collect these services"},
        {"--exclude-services s[,s...]", "Skip these services"},
        {"--catalog FILE", "Service/region catalog JSON"},
        {"--checks FILE", "Check catalog JSON"},
        {"--list-checks", "Print the checks selected by --resource-arn and exit"},
        {"--output FILE", "Write JSON to FILE (default stdout)"},
        {"--pretty", "Pretty-print JSON"},
        {"--sequential", "Run service collectors one after another"},
        {"--log-level LEVEL", "critical, error, warn, info, debug, trace"},
        {"--version", "Print version & exit"},
        {"--help", "Show this help"}
    };
    for(const auto& l : lines){ std::cout << "  " << l.name; if(l.name.size() < 30) for(size_t i=l.name.size(); i<30; ++i) std::cout << ' '; else std::cout<<' '; std::cout << l.help << "\n"; }
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ConfigValidator validator;

    // The config file is applied first so that flags override it.
    for(int i=1;i+1<argc;++i){
        if(std::string(argv[i])=="--config"){
            cfg.config_file = argv[i+1];
            if(!validator.load_config_file(cfg.config_file, cfg)) return 2;
            break;
        }
    }

    enum class ArgKind { None, String, Int, CSV };
    struct FlagSpec { const char* name; ArgKind kind; std::function<void(const std::string&)> apply; };
    auto need_int = [](const std::string& v, const char* flag){ try { return std::stoi(v); } catch(const std::exception&) { std::cerr<<"Invalid integer for "<<flag<<"\n"; std::exit(2);} };
    auto append = [](std::vector<std::string>& dst, const std::vector<std::string>& src){ dst.insert(dst.end(), src.begin(), src.end()); };
    std::vector<FlagSpec> specs = {
        {"--config", ArgKind::String, [&](const std::string&){ }},
        {"--profile", ArgKind::String, [&](const std::string& v){ cfg.profile = v; }},
        {"--profile-region", ArgKind::String, [&](const std::string& v){ cfg.profile_region = v; }},
        {"--account", ArgKind::String, [&](const std::string& v){ cfg.audited_account = v; }},
        {"--partition", ArgKind::String, [&](const std::string& v){ cfg.partition = v; }},
        {"--role", ArgKind::String, [&](const std::string& v){ cfg.role_arn = v; }},
        {"--external-id", ArgKind::String, [&](const std::string& v){ cfg.external_id = v; }},
        {"--session-name", ArgKind::String, [&](const std::string& v){ cfg.session_name = v; }},
        {"--session-duration", ArgKind::Int, [&](const std::string& v){ cfg.session_duration = need_int(v, "--session-duration"); }},
        {"--region", ArgKind::CSV, [&](const std::string& v){ cfg.regions = split_csv(v); }},
        {"--resource-arn", ArgKind::CSV, [&](const std::string& v){ append(cfg.resource_arns, split_csv(v)); }},
        {"--resource-arn-file", ArgKind::String, [&](const std::string& v){ cfg.resource_arn_file = v; }},
        {"--services", ArgKind::CSV, [&](const std::string& v){ cfg.services = split_csv(v); }},
        {"--exclude-services", ArgKind::CSV, [&](const std::string& v){ cfg.excluded_services = split_csv(v); }},
        {"--catalog", ArgKind::String, [&](const std::string& v){ cfg.catalog_file = v; }},
        {"--checks", ArgKind::String, [&](const std::string& v){ cfg.checks_file = v; }},
        {"--list-checks", ArgKind::None, [&](const std::string&){ cfg.list_checks = true; }},
        {"--output", ArgKind::String, [&](const std::string& v){ cfg.output_file = v; }},
        {"--pretty", ArgKind::None, [&](const std::string&){ cfg.pretty = true; }},
        {"--sequential", ArgKind::None, [&](const std::string&){ cfg.parallel = false; }},
        {"--log-level", ArgKind::String, [&](const std::string& v){ cfg.log_level = v; }}
    };
    auto find_spec = [&](const std::string& flag)->FlagSpec*{ for(auto& s: specs) if(flag==s.name) return &s; return nullptr; };
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help"){ print_help(); return 0; }
        if(a=="--version"){ std::cout << "cloud-audit " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n"; return 0; }
        auto* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: "<<a<<"\n"; print_help(); return 2; }
        std::string val;
        if(spec->kind != ArgKind::None){ if(i+1>=argc){ std::cerr << "Missing value for "<<a<<"\n"; return 2; } val = argv[++i]; }
        spec->apply(val);
    }

    if(!validator.load_external_files(cfg)) return 2;
    if(!validator.validate(cfg)) return 2;
    LogLevel level = LogLevel::Info;
    parse_log_level(cfg.log_level, level);
    Logger::instance().set_level(level);
    const std::vector<std::string> data_dirs = {buildinfo::DATA_DIR, buildinfo::SOURCE_DATA_DIR};
    if(cfg.catalog_file.empty()) cfg.catalog_file = ConfigValidator::locate_data_file("aws_regions_by_service.json", data_dirs);
    if(cfg.checks_file.empty()) cfg.checks_file = ConfigValidator::locate_data_file("checks.json", data_dirs);
    set_config(cfg);

    ServiceRegionCatalog catalog;
    CheckCatalog checks;
    try {
        catalog = ServiceRegionCatalog::load(cfg.catalog_file);
        checks = CheckCatalog::load(cfg.checks_file);
    } catch(const CatalogError& ex) {
        Logger::instance().critical(std::string("CatalogError -- ") + ex.what());
        return 1;
    }
    if(!validator.validate_regions(cfg, catalog)) return 2;

    AuditInfo audit = ConfigValidator::build_audit_info(cfg);
    ScopeDecision scope;
    try {
        scope = resolve_scope(audit.audit_resources, checks);
    } catch(const MalformedIdentifier& ex) {
        Logger::instance().critical(std::string("MalformedIdentifier -- ") + ex.what());
        return 1;
    }
    InventoryMeta meta;
    meta.tool_version = buildinfo::APP_VERSION;
    meta.catalog_digest = catalog.digest();
    if(scope.scoped) {
        if(scope.regions) audit.audited_regions = *scope.regions;
        meta.selected_checks = select_checks(scope, checks);
    }
    if(cfg.list_checks) {
        for(const auto& c : meta.selected_checks) std::cout << c << "\n";
        return 0;
    }

    aws::SdkApiGuard sdk;
    aws::AwsIdentityResolver resolver;
    aws::AwsStsClient sts;
    CredentialSessionManager sessions(resolver, sts);
    Session session;
    try {
        if(audit.assumed_role_info) {
            AuditInfo caller = audit;
            caller.assumed_role_info.reset();
            Session base = sessions.establish(caller);
            audit.credentials = sessions.assume_role(base, *audit.assumed_role_info);
        }
        session = sessions.establish(audit);
    } catch(const AuthError& ex) {
        Logger::instance().critical(std::string("AuthError -- ") + ex.what());
        return 1;
    }

    RegionalClientFactory factory(catalog, session, audit);
    ProviderClients provider_clients;
    provider_clients.backup = &aws::AwsBackupClient::make;

    CollectorRegistry registry;
    registry.register_all_default(factory, provider_clients, scope.scoped ? std::optional<std::set<std::string>>(scope.services) : std::nullopt);
    Report report;
    registry.run_all(report);

    InventoryWriter writer;
    std::string json = writer.write(report, registry.collectors(), audit, meta, cfg.pretty);
    if(cfg.output_file.empty()) std::cout << json;
    else {
        std::ofstream ofs(cfg.output_file);
        if(!ofs){ Logger::instance().error("Cannot write output file: " + cfg.output_file); return 1; }
        ofs << json;
    }
    return 0;
}
