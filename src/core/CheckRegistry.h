#pragma once
#include <string>
#include <vector>
#include <set>
#include <map>
#include <utility>

namespace cloud_audit {

// Lookup of the check names available per service.
class CheckRegistry {
public:
    virtual ~CheckRegistry() = default;
    // Throws CheckNotFound when the service has no check module.
    virtual std::vector<std::string> list_checks_for_service(const std::string& service) const = 0;
    virtual std::set<std::string> checks_for_services(const std::set<std::string>& services) const = 0;
};

// CheckRegistry backed by a JSON document: {"services": {"<service>": ["check", ...]}}
class CheckCatalog : public CheckRegistry {
public:
    CheckCatalog() = default;
    explicit CheckCatalog(std::map<std::string, std::vector<std::string>> checks) : checks_(std::move(checks)) {}

    // Throws CatalogError on unreadable or malformed input.
    static CheckCatalog load(const std::string& path);
    static CheckCatalog parse(const std::string& json_text);

    std::vector<std::string> list_checks_for_service(const std::string& service) const override;
    std::set<std::string> checks_for_services(const std::set<std::string>& services) const override;

private:
    std::map<std::string, std::vector<std::string>> checks_;
};

}
