#pragma once
#include "Arn.h"
#include "Collector.h"
#include "Errors.h"
#include "JoinGuard.h"
#include "Logging.h"
#include "RegionalClientFactory.h"
#include "Report.h"
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cloud_audit {

// Base for per-service collectors: owns the regional clients, applies the
// ARN inclusion filter and fans listing operations out over regions.
template <class Client>
class ResourceCollector : public Collector {
public:
    ResourceCollector(std::string service, RegionalClients<Client> clients, ScopeFilter filter, const std::string& profile_region)
        : service_(std::move(service)), clients_(std::move(clients)), filter_(std::move(filter)) {
        if(!profile_region.empty()) region_ = profile_region;
        else if(!clients_.empty()) region_ = clients_.begin()->first;
    }

    std::string name() const override { return service_; }

    // Region used for calls that are not per-region.
    const std::string& region() const { return region_; }
    const RegionalClients<Client>& regional_clients() const { return clients_; }

protected:
    using Worker = std::function<void(const RegionalClient<Client>&)>;

    // One thread per regional client; returns once every thread has finished.
    // An exception in one region is logged and recorded, siblings are unaffected.
    void threading_call(Report& report, const std::string& operation, const Worker& worker) {
        Logger::instance().info(service_ + " - " + operation + "...");
        std::vector<std::thread> threads;
        JoinGuard joiner(threads);
        threads.reserve(clients_.size());
        for(const auto& kv : clients_) {
            const RegionalClient<Client>& rc = *kv.second;
            threads.emplace_back([this, &report, &operation, &worker, &rc]() {
                try {
                    worker(rc);
                } catch(const std::exception& ex) {
                    std::string cls = error_class(ex);
                    Logger::instance().error(rc.region + " -- " + cls + ": " + ex.what());
                    report.add_failure(CollectionFailure{service_, rc.region, operation, cls, ex.what()});
                }
            });
        }
        joiner.join();
    }

    bool included(const std::string& arn) const { return !filter_.active() || filter_.is_included(arn); }

    // Guards every result container of the derived collector.
    mutable std::mutex results_mutex_;

private:
    std::string service_;
    RegionalClients<Client> clients_;
    ScopeFilter filter_;
    std::string region_;
};

}
