#pragma once
#include <string>
#include <vector>
#include <map>

namespace cloud_audit {

// Immutable (service, partition) -> ordered region list, loaded once from the packaged JSON file.
// Safe to share between threads after construction.
class ServiceRegionCatalog {
public:
    ServiceRegionCatalog() = default;

    // Throws CatalogError if the file cannot be read or does not match
    // {"services": {"<svc>": {"regions": {"<partition>": ["<region>", ...]}}}}.
    static ServiceRegionCatalog load(const std::string& path);
    static ServiceRegionCatalog parse(const std::string& json_text);

    // nullptr when the service or partition is unknown.
    const std::vector<std::string>* regions(const std::string& service, const std::string& partition) const;
    bool has_service(const std::string& service) const { return services_.count(service) != 0; }

    // Every region of every partition, sorted and unique.
    std::vector<std::string> all_regions() const;

    // SHA-256 of the source document (hex); empty for catalogs built in memory.
    const std::string& digest() const { return digest_; }
    const std::string& source() const { return source_; }

private:
    using PartitionRegions = std::map<std::string, std::vector<std::string>>;
    std::map<std::string, PartitionRegions> services_;
    std::string digest_;
    std::string source_;
};

std::string sha256_hex(const std::string& data);

}
