#pragma once
#include "token_store.hpp"
#include "channels/notifier.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace tokenwarden {

struct SweepReport {
    size_t due = 0;
    size_t notified = 0;
    size_t failed = 0;
    bool aborted = false;    // store error cut the sweep short
    std::string error;
};

// Sweeps the store for due tokens on a fixed interval and notifies the
// destination once per due token per sweep. last_notified is written after
// each successful send and never consulted to suppress repeats.
class ExpiryDaemon {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    ExpiryDaemon(TokenStore& store, Notifier& notifier, std::string destination,
                 int64_t threshold_days, int64_t interval_seconds,
                 Clock clock = [] { return std::chrono::system_clock::now(); })
        : store_(store), notifier_(notifier), destination_(std::move(destination))
        , threshold_days_(threshold_days), interval_s_(interval_seconds)
        , clock_(std::move(clock)) {}

    // One Checking pass. Never throws.
    SweepReport run_sweep();

    // Idle/Checking loop until running becomes false.
    void run(const std::atomic<bool>& running);

private:
    TokenStore& store_;
    Notifier& notifier_;
    std::string destination_;
    int64_t threshold_days_;
    int64_t interval_s_;
    Clock clock_;
};

} // namespace tokenwarden
