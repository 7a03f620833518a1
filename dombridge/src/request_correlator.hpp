#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace dombridge {

enum class RequestState {
    Created,
    Sent,
    Matched,
    TimedOut,
    Cancelled,
};

const char* to_string(RequestState state);

enum class ResolveOutcome {
    Direct,
    Fifo,
    Unmatched,
};

/// Terminal outcome handed to the waiting caller.
struct Resolution {
    RequestState state = RequestState::Cancelled;
    nlohmann::json envelope;  // set when state == Matched
    std::string reason;       // set when state == Cancelled
};

/// Blocking handle returned by RequestCorrelator::track().
class PendingWaiter {
public:
    PendingWaiter() = default;
    PendingWaiter(std::string id, std::future<Resolution> future);

    PendingWaiter(PendingWaiter&&) = default;
    PendingWaiter& operator=(PendingWaiter&&) = default;

    const std::string& id() const { return id_; }
    bool valid() const { return future_.valid(); }

    /// Returns nullopt if nothing arrived within timeout.
    std::optional<Resolution> wait_for(std::chrono::milliseconds timeout);

    /// Blocks until the request reaches a terminal state.
    Resolution get();

private:
    std::string id_;
    std::future<Resolution> future_;
};

/**
 * Matches outstanding commands to results arriving on the channel.
 *
 * Shared by the protocol server (track/expire) and the channel thread
 * (resolve). The pending map and the FIFO order are guarded by one mutex.
 * Every tracked id reaches exactly one terminal state and is then removed.
 */
class RequestCorrelator {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::seconds kDefaultStaleAge{60};
    static constexpr std::chrono::seconds kDefaultSweepGrace{5};

    /// sweep_grace is how long past its caller's deadline an entry is still left alone.
    explicit RequestCorrelator(Clock::duration sweep_grace = kDefaultSweepGrace);

    /**
     * Starts tracking id. wait is how long the caller intends to block on it;
     * zero means unknown. Throws std::logic_error for an empty or already
     * tracked id.
     */
    PendingWaiter track(const std::string& id, const std::string& tool_name,
                        std::chrono::milliseconds wait = std::chrono::milliseconds::zero());

    /// CREATED -> SENT. False if id is not tracked.
    bool mark_sent(const std::string& id);

    /// Binds an inbound result envelope to at most one pending request.
    ResolveOutcome resolve(const nlohmann::json& envelope);

    /// Releases the waiter with a timeout. False if id already reached a terminal state.
    bool expire(const std::string& id);

    /// Releases the waiter as cancelled. False if id is not tracked.
    bool cancel(const std::string& id, const std::string& reason);

    /**
     * Drops entries older than max_age that were never resolved or expired.
     * An entry tracked with a wait is kept until its deadline plus the sweep
     * grace has passed, even when that is later than max_age.
     */
    std::size_t sweep(Clock::duration max_age = kDefaultStaleAge);

    std::size_t pending_count() const;
    std::uint64_t unmatched_count() const { return unmatched_.load(); }
    std::optional<RequestState> state_of(const std::string& id) const;

private:
    struct PendingRequest {
        std::string id;
        std::string tool_name;
        Clock::time_point created_at;
        Clock::duration wait = Clock::duration::zero();
        RequestState state = RequestState::Created;
        std::promise<Resolution> promise;
    };

    using PendingMap = std::unordered_map<std::string, PendingRequest>;

    void finish_locked(PendingMap::iterator it, Resolution resolution);
    void log_unmatched_locked(const std::string& request_id, const char* why);

    Clock::duration sweep_grace_;
    mutable std::mutex mutex_;
    PendingMap pending_;
    std::deque<std::string> order_;
    std::atomic<std::uint64_t> unmatched_{0};
};

/**
 * Shape check used by the FIFO fallback for results that carry no request id.
 *
 * Only a result whose fields are consistent with tool_name may be bound to a
 * pending call of that tool. Two id-less calls of the same tool in flight can
 * still be swapped; ids are the real contract.
 */
bool result_fits_tool(const nlohmann::json& envelope, const std::string& tool_name);

} // namespace dombridge
