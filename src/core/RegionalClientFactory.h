#pragma once
#include "AuditInfo.h"
#include "CredentialSession.h"
#include "ServiceRegionCatalog.h"
#include "Logging.h"
#include "Errors.h"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cloud_audit {

// A provider client bound to exactly one region for its whole lifetime.
template <class Client>
struct RegionalClient {
    RegionalClient(std::string r, std::unique_ptr<Client> c) : region(std::move(r)), client(std::move(c)) {}
    const std::string region;
    std::unique_ptr<Client> client;
};

template <class Client>
using RegionalClients = std::map<std::string, std::unique_ptr<RegionalClient<Client>>>;

template <class Client>
using ClientMaker = std::function<std::unique_ptr<Client>(const Session&, const std::string& region)>;

// Regions a service is audited in.
// catalog_regions ∩ allow_list (catalog order) or all of catalog_regions when the allow-list is empty;
// a global service collapses to profile_region when it survives, else to the first region.
std::vector<std::string> effective_regions(const std::vector<std::string>& catalog_regions,
                                           const std::vector<std::string>& allow_list,
                                           const std::string& profile_region,
                                           bool global_service);

class RegionalClientFactory {
public:
    RegionalClientFactory(const ServiceRegionCatalog& catalog, const Session& session, const AuditInfo& audit)
        : catalog_(catalog), session_(session), audit_(audit) {}

    std::vector<std::string> regions_for(const std::string& service, bool global_service) const;

    // One client per resolved region. A region whose client cannot be created
    // is logged and skipped; the others are still built.
    template <class Client>
    RegionalClients<Client> build(const std::string& service, bool global_service, const ClientMaker<Client>& make) const {
        RegionalClients<Client> clients;
        for(const auto& region : regions_for(service, global_service)) {
            try {
                auto c = make(session_, region);
                if(!c) {
                    Logger::instance().error(region + " -- " + service + ": client factory returned no client");
                    continue;
                }
                clients.emplace(region, std::make_unique<RegionalClient<Client>>(region, std::move(c)));
            } catch(const std::exception& ex) {
                Logger::instance().error(region + " -- " + error_class(ex) + ": cannot create " + service + " client: " + ex.what());
            }
        }
        return clients;
    }

    const Session& session() const { return session_; }
    const AuditInfo& audit() const { return audit_; }

private:
    const ServiceRegionCatalog& catalog_;
    const Session& session_;
    const AuditInfo& audit_;
};

}
