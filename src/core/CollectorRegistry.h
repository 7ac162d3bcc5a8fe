#pragma once
#include "Collector.h"
#include "RegionalClientFactory.h"
#include "../collectors/BackupApi.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cloud_audit {

// Client makers for every service the registry knows how to collect.
struct ProviderClients {
    ClientMaker<BackupApi> backup;
};

class CollectorRegistry {
public:
    void register_collector(CollectorPtr collector);
    // Builds the default collectors, restricted to `services` when given,
    // using `factory` for regional clients.
    void register_all_default(const RegionalClientFactory& factory, const ProviderClients& clients,
                              const std::optional<std::set<std::string>>& services = std::nullopt);
    void run_all(Report& report);

    std::vector<const Collector*> collectors() const;

private:
    std::vector<CollectorPtr> collectors_;
};

}
