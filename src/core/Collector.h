#pragma once
#include <string>
#include <memory>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace cloud_audit {

class Report; // fwd

// Inventory collector for one service.
class Collector {
public:
    virtual ~Collector() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual void collect(Report& report) = 0;
    virtual std::size_t resource_count() const = 0;
    // Collected records, keyed by resource kind.
    virtual nlohmann::json inventory() const = 0;
};

using CollectorPtr = std::unique_ptr<Collector>;

}
