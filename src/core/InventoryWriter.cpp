#include "InventoryWriter.h"
#include "JsonUtil.h"
#include <nlohmann/json.hpp>

namespace cloud_audit {

std::string InventoryWriter::write(const Report& report, const std::vector<const Collector*>& collectors,
                                   const AuditInfo& audit, const InventoryMeta& meta, bool pretty) const {
    using nlohmann::json;
    using jsonutil::time_to_iso;

    json doc;
    doc["meta"] = {
        {"tool_version", meta.tool_version},
        {"generated_at", time_to_iso(std::chrono::system_clock::now())},
        {"account", audit.audited_account},
        {"partition", audit.audited_partition},
        {"regions", audit.audited_regions},
        {"resource_filter", audit.audit_resources},
        {"assumed_role", audit.assumed_role_info ? json(audit.assumed_role_info->role_arn) : json(nullptr)},
        {"catalog_sha256", meta.catalog_digest},
    };
    if(!meta.selected_checks.empty()) doc["meta"]["selected_checks"] = meta.selected_checks;

    json runs = json::array();
    for(const auto& r : report.results()) {
        json run = {{"collector", r.collector_name}, {"start_time", time_to_iso(r.start_time)},
                    {"end_time", time_to_iso(r.end_time)}, {"resources", r.resources}};
        for(const auto* c : collectors) {
            if(c->name() == r.collector_name) { run["inventory"] = c->inventory(); break; }
        }
        runs.push_back(std::move(run));
    }
    doc["collectors"] = std::move(runs);

    json errors = json::array();
    for(const auto& f : report.failures()) {
        errors.push_back({{"collector", f.collector}, {"region", f.region}, {"operation", f.operation},
                          {"error_class", f.error_class}, {"message", f.message}});
    }
    doc["errors"] = std::move(errors);

    return doc.dump(pretty ? 2 : -1) + "\n";
}

}
