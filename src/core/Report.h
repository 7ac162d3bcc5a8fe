#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <cstddef>

namespace cloud_audit {

struct CollectorRun {
    std::string collector_name;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::size_t resources = 0;
};

// A listing call that failed and contributed nothing.
struct CollectionFailure {
    std::string collector;
    std::string region; // empty when not attributable to one region
    std::string operation;
    std::string error_class;
    std::string message;
};

// Thread-safe record of a collection round.
class Report {
public:
    void start_collector(const std::string& name);
    void end_collector(const std::string& name, std::size_t resources);
    void add_failure(CollectionFailure failure);

    // Copies, so callers never observe a vector another thread is appending to.
    std::vector<CollectorRun> results() const;
    std::vector<CollectionFailure> failures() const;

private:
    std::vector<CollectorRun> results_;
    std::vector<CollectionFailure> failures_;
    mutable std::mutex mutex_;
};

}
