#include "Report.h"
#include <algorithm>

namespace cloud_audit {

void Report::start_collector(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    CollectorRun run;
    run.collector_name = name;
    run.start_time = std::chrono::system_clock::now();
    results_.push_back(std::move(run));
}

void Report::end_collector(const std::string& name, std::size_t resources) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(results_.begin(), results_.end(), [&](auto& r){ return r.collector_name == name; });
    if(it != results_.end()) {
        it->end_time = std::chrono::system_clock::now();
        it->resources = resources;
    }
}

void Report::add_failure(CollectionFailure failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.push_back(std::move(failure));
}

std::vector<CollectorRun> Report::results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_;
}

std::vector<CollectionFailure> Report::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

}
