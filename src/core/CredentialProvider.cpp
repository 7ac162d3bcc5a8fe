#include "CredentialProvider.h"
#include "Errors.h"
#include "Logging.h"
#include "JsonUtil.h"
#include <algorithm>

namespace cloud_audit {

RefreshableCredentialProvider::RefreshableCredentialProvider(Credentials initial, RefreshFn refresh,
                                                             std::chrono::seconds refresh_window, NowFn now)
    : current_(std::move(initial)), refresh_(std::move(refresh)), window_(refresh_window), now_(std::move(now)) {}

bool RefreshableCredentialProvider::needs_refresh_locked(Clock::time_point now) const {
    if(!current_.expires()) return false;
    Clock::duration window = std::chrono::duration_cast<Clock::duration>(window_);
    if(issued_) window = std::min(window, (current_.expiration - *issued_) / 2);
    return current_.expiration - now <= window;
}

Credentials RefreshableCredentialProvider::current_valid() {
    std::unique_lock<std::mutex> lock(mutex_);
    if(!needs_refresh_locked(now_())) return current_;
    return run_refresh(lock);
}

Credentials RefreshableCredentialProvider::refresh() {
    std::unique_lock<std::mutex> lock(mutex_);
    return run_refresh(lock);
}

Credentials RefreshableCredentialProvider::run_refresh(std::unique_lock<std::mutex>& lock) {
    if(inflight_.valid()) {
        auto pending = inflight_;
        lock.unlock();
        return pending.get();
    }
    std::promise<Credentials> promise;
    inflight_ = promise.get_future().share();
    const Clock::time_point previous = current_.expiration;
    lock.unlock();

    Logger::instance().info("Refreshing assumed credentials...");
    const Clock::time_point requested = now_();
    try {
        Credentials fresh;
        try {
            fresh = refresh_();
        } catch(const RefreshError&) {
            throw;
        } catch(const std::exception& ex) {
            throw RefreshError(error_class(ex) + ": " + ex.what());
        }
        if(fresh.expiration <= now_()) throw RefreshError("refreshed credentials are already expired");
        if(fresh.expiration <= previous)
            Logger::instance().warn("Refreshed credentials expire at " + jsonutil::time_to_iso(fresh.expiration) +
                                    ", not later than the ones they replace");
        lock.lock();
        current_ = fresh;
        issued_ = requested;
        ++refresh_count_;
        inflight_ = {};
        lock.unlock();
        Logger::instance().info("Refreshed credentials valid until " + jsonutil::time_to_iso(fresh.expiration));
        promise.set_value(fresh);
        return fresh;
    } catch(const RefreshError&) {
        if(!lock.owns_lock()) lock.lock();
        inflight_ = {};
        lock.unlock();
        promise.set_exception(std::current_exception());
        throw;
    }
}

Clock::time_point RefreshableCredentialProvider::expiration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.expiration;
}

unsigned RefreshableCredentialProvider::refresh_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refresh_count_;
}

}
