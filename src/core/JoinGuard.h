#pragma once
#include <thread>
#include <vector>

namespace cloud_audit {

// Joins every joinable thread in `threads` when the scope ends, so a fan-out
// that throws while starting threads never destroys a joinable std::thread.
// Declare the vector before the guard.
class JoinGuard {
public:
    explicit JoinGuard(std::vector<std::thread>& threads) : threads_(threads) {}
    ~JoinGuard() { join(); }
    JoinGuard(const JoinGuard&) = delete;
    JoinGuard& operator=(const JoinGuard&) = delete;

    void join() {
        for(auto& t : threads_) if(t.joinable()) t.join();
    }

private:
    std::vector<std::thread>& threads_;
};

}
