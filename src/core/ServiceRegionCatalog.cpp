#include "ServiceRegionCatalog.h"
#include "Errors.h"
#include "Logging.h"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <set>
#include <memory>

namespace cloud_audit {

std::string sha256_hex(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx) return {};
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdlen = 0;
    if(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return {};
    if(EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return {};
    if(EVP_DigestFinal_ex(ctx.get(), md, &mdlen) != 1) return {};
    static const char* hx = "0123456789abcdef";
    std::string out; out.reserve(mdlen * 2);
    for(unsigned i = 0; i < mdlen; ++i) { out.push_back(hx[md[i] >> 4]); out.push_back(hx[md[i] & 0xF]); }
    return out;
}

ServiceRegionCatalog ServiceRegionCatalog::load(const std::string& path) {
    std::ifstream f(path);
    if(!f.is_open()) throw CatalogError("cannot open region catalog: " + path);
    std::stringstream ss; ss << f.rdbuf();
    std::string text = ss.str();
    ServiceRegionCatalog cat = parse(text);
    cat.digest_ = sha256_hex(text);
    cat.source_ = path;
    Logger::instance().info("Loaded region catalog " + path + " (" + std::to_string(cat.services_.size()) +
                            " services, sha256=" + cat.digest_ + ")");
    return cat;
}

ServiceRegionCatalog ServiceRegionCatalog::parse(const std::string& json_text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json_text);
    } catch(const nlohmann::json::parse_error& ex) {
        throw CatalogError(std::string("invalid region catalog: ") + ex.what());
    }
    if(!doc.contains("services") || !doc["services"].is_object())
        throw CatalogError("region catalog has no \"services\" object");

    ServiceRegionCatalog cat;
    for(auto svc = doc["services"].begin(); svc != doc["services"].end(); ++svc) {
        const auto& entry = svc.value();
        if(!entry.is_object() || !entry.contains("regions") || !entry["regions"].is_object())
            throw CatalogError("service " + svc.key() + " has no \"regions\" object");
        auto& partitions = cat.services_[svc.key()];
        for(auto part = entry["regions"].begin(); part != entry["regions"].end(); ++part) {
            if(!part.value().is_array()) throw CatalogError("regions of " + svc.key() + "/" + part.key() + " are not an array");
            auto& list = partitions[part.key()];
            for(const auto& r : part.value()) {
                if(!r.is_string()) throw CatalogError("non-string region under " + svc.key() + "/" + part.key());
                list.push_back(r.get<std::string>());
            }
        }
    }
    return cat;
}

const std::vector<std::string>* ServiceRegionCatalog::regions(const std::string& service, const std::string& partition) const {
    auto svc = services_.find(service);
    if(svc == services_.end()) return nullptr;
    auto part = svc->second.find(partition);
    if(part == svc->second.end()) return nullptr;
    return &part->second;
}

std::vector<std::string> ServiceRegionCatalog::all_regions() const {
    std::set<std::string> all;
    for(const auto& svc : services_)
        for(const auto& part : svc.second)
            all.insert(part.second.begin(), part.second.end());
    return std::vector<std::string>(all.begin(), all.end());
}

}
