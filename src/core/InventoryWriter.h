#pragma once
#include "AuditInfo.h"
#include "Collector.h"
#include "Report.h"
#include <string>
#include <vector>

namespace cloud_audit {

struct InventoryMeta {
    std::string tool_version;
    std::string catalog_digest;
    std::vector<std::string> selected_checks;
};

// Renders collected inventories and collection failures as one JSON document:
// {"meta": {...}, "collectors": [...], "errors": [...]}.
class InventoryWriter {
public:
    std::string write(const Report& report, const std::vector<const Collector*>& collectors,
                      const AuditInfo& audit, const InventoryMeta& meta, bool pretty) const;
};

}
