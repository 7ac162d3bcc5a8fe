#include "RegionalClientFactory.h"
#include <algorithm>

namespace cloud_audit {

std::vector<std::string> effective_regions(const std::vector<std::string>& catalog_regions,
                                           const std::vector<std::string>& allow_list,
                                           const std::string& profile_region,
                                           bool global_service) {
    std::vector<std::string> regions;
    if(allow_list.empty()) {
        regions = catalog_regions;
    } else {
        for(const auto& r : catalog_regions) {
            if(std::find(allow_list.begin(), allow_list.end(), r) != allow_list.end()) regions.push_back(r);
        }
    }
    if(global_service && !regions.empty()) {
        if(!profile_region.empty() && std::find(regions.begin(), regions.end(), profile_region) != regions.end())
            return {profile_region};
        regions.resize(1);
    }
    return regions;
}

std::vector<std::string> RegionalClientFactory::regions_for(const std::string& service, bool global_service) const {
    const auto* catalog_regions = catalog_.regions(service, audit_.audited_partition);
    if(!catalog_regions) {
        Logger::instance().debug("No regions for " + service + " in partition " + audit_.audited_partition);
        return {};
    }
    return effective_regions(*catalog_regions, audit_.audited_regions, audit_.profile_region, global_service);
}

}
