#include "CollectorRegistry.h"
#include "Report.h"
#include "Logging.h"
#include "Config.h"
#include "JoinGuard.h"
#include "../collectors/BackupCollector.h"
#include <algorithm>
#include <thread>

namespace cloud_audit {

void CollectorRegistry::register_collector(CollectorPtr collector) {
    collectors_.push_back(std::move(collector));
}

void CollectorRegistry::register_all_default(const RegionalClientFactory& factory, const ProviderClients& clients,
                                             const std::optional<std::set<std::string>>& services) {
    auto wanted = [&](const std::string& name){ return !services || services->count(name) != 0; };
    const AuditInfo& audit = factory.audit();
    ScopeFilter filter(audit.audit_resources);
    if(wanted(BackupCollector::kService) && clients.backup) {
        register_collector(std::make_unique<BackupCollector>(
            factory.build<BackupApi>(BackupCollector::kService, false, clients.backup), filter, audit.profile_region));
    }
}

void CollectorRegistry::run_all(Report& report) {
    auto& cfg = config();
    auto is_enabled = [&](const std::string& name){
        if(!cfg.services.empty()) {
            bool found = std::find(cfg.services.begin(), cfg.services.end(), name)!=cfg.services.end();
            if(!found) return false;
        }
        if(!cfg.excluded_services.empty()) {
            if(std::find(cfg.excluded_services.begin(), cfg.excluded_services.end(), name)!=cfg.excluded_services.end()) return false;
        }
        return true;
    };
    auto run_one = [&](Collector& c){
        Logger::instance().debug("Starting collector: " + c.name());
        report.start_collector(c.name());
        try {
            c.collect(report);
        } catch(const std::exception& ex) {
            Logger::instance().error(c.name() + " -- " + error_class(ex) + ": " + ex.what());
            report.add_failure(CollectionFailure{c.name(), "", "collect", error_class(ex), ex.what()});
        }
        report.end_collector(c.name(), c.resource_count());
        Logger::instance().debug("Finished collector: " + c.name());
    };

    std::vector<Collector*> enabled;
    for(auto& c : collectors_) if(is_enabled(c->name())) enabled.push_back(c.get());

    if(!cfg.parallel || enabled.size() < 2) {
        for(auto* c : enabled) run_one(*c);
        return;
    }
    std::vector<std::thread> threads;
    JoinGuard joiner(threads);
    threads.reserve(enabled.size());
    for(auto* c : enabled) threads.emplace_back([&run_one, c](){ run_one(*c); });
    joiner.join();
}

std::vector<const Collector*> CollectorRegistry::collectors() const {
    std::vector<const Collector*> out;
    for(const auto& c : collectors_) out.push_back(c.get());
    return out;
}

}
