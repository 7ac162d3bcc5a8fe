#include "CheckRegistry.h"
#include "Errors.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace cloud_audit {

CheckCatalog CheckCatalog::load(const std::string& path) {
    std::ifstream f(path);
    if(!f.is_open()) throw CatalogError("cannot open check catalog: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return parse(ss.str());
}

CheckCatalog CheckCatalog::parse(const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch(const nlohmann::json::parse_error& ex) {
        throw CatalogError(std::string("invalid check catalog: ") + ex.what());
    }
    if(!doc.contains("services") || !doc["services"].is_object())
        throw CatalogError("check catalog has no \"services\" object");
    std::map<std::string, std::vector<std::string>> checks;
    for(auto it = doc["services"].begin(); it != doc["services"].end(); ++it) {
        if(!it.value().is_array()) throw CatalogError("checks for service " + it.key() + " are not an array");
        auto& names = checks[it.key()];
        for(const auto& n : it.value()) {
            if(!n.is_string()) throw CatalogError("non-string check name under " + it.key());
            names.push_back(n.get<std::string>());
        }
    }
    return CheckCatalog(std::move(checks));
}

std::vector<std::string> CheckCatalog::list_checks_for_service(const std::string& service) const {
    auto it = checks_.find(service);
    if(it == checks_.end()) throw CheckNotFound(service);
    return it->second;
}

std::set<std::string> CheckCatalog::checks_for_services(const std::set<std::string>& services) const {
    std::set<std::string> out;
    for(const auto& s : services) {
        auto it = checks_.find(s);
        if(it == checks_.end()) continue;
        out.insert(it->second.begin(), it->second.end());
    }
    return out;
}

}
