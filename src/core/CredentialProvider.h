#pragma once
#include "AuditInfo.h"
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

namespace cloud_audit {

// Source of valid credentials for outbound requests. The transport calls
// current_valid() before every request.
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;
    // Throws RefreshError when fresh credentials cannot be obtained.
    virtual Credentials current_valid() = 0;
    virtual bool refreshable() const = 0;
};

// Long-lived profile credentials, handed out as-is.
class StaticCredentialProvider : public CredentialProvider {
public:
    explicit StaticCredentialProvider(Credentials creds) : creds_(std::move(creds)) {}
    Credentials current_valid() override { return creds_; }
    bool refreshable() const override { return false; }
private:
    Credentials creds_;
};

// Temporary credentials renewed through a refresh function once they are
// within refresh_window of expiring. For credentials obtained by a refresh the
// window is capped at half their lifetime, so short sessions are not renewed
// on every call. At most one refresh runs at a time; callers arriving during a
// refresh wait for it and share its result (or its error).
class RefreshableCredentialProvider : public CredentialProvider {
public:
    using RefreshFn = std::function<Credentials()>;
    using NowFn = std::function<Clock::time_point()>;

    static constexpr std::chrono::seconds kDefaultRefreshWindow{15 * 60};

    RefreshableCredentialProvider(Credentials initial, RefreshFn refresh,
                                  std::chrono::seconds refresh_window = kDefaultRefreshWindow,
                                  NowFn now = &Clock::now);

    Credentials current_valid() override;
    bool refreshable() const override { return true; }

    // Runs (or joins) a refresh regardless of the current expiration.
    Credentials refresh();

    Clock::time_point expiration() const;
    unsigned refresh_count() const;

private:
    bool needs_refresh_locked(Clock::time_point now) const;
    Credentials run_refresh(std::unique_lock<std::mutex>& lock);

    Credentials current_;
    std::optional<Clock::time_point> issued_; // unknown for the initial credentials
    RefreshFn refresh_;
    std::chrono::seconds window_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::shared_future<Credentials> inflight_;
    unsigned refresh_count_ = 0;
};

}
