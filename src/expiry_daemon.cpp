#include "expiry_daemon.hpp"
#include "expiry.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>
#include <thread>

namespace tokenwarden {

SweepReport ExpiryDaemon::run_sweep() {
    SweepReport report;
    try {
        CivilDate today = CivilDate::local(clock_());
        auto due = store_.find_expiring(threshold_days_, today);
        report.due = due.size();

        for (auto& token : due) {
            std::string message = format_expiry_message(
                token.name, days_remaining(token.expires_at, today));
            try {
                notifier_.send(destination_, message);
            } catch (const NotificationDeliveryError& e) {
                std::cerr << "[daemon] Failed to send notification for '" << token.name
                          << "': " << e.what() << "\n";
                report.failed++;
                continue;
            }
            store_.mark_notified(token.name, format_utc_timestamp(clock_()));
            report.notified++;
        }
    } catch (const std::exception& e) {
        report.aborted = true;
        report.error = e.what();
        std::cerr << "[daemon] Error checking tokens: " << e.what() << "\n";
    }
    return report;
}

void ExpiryDaemon::run(const std::atomic<bool>& running) {
    std::cerr << "[daemon] Starting token expiration notifier (channel=" << notifier_.name() << ")\n";
    std::cerr << "[daemon] Checking every " << interval_s_ << " seconds\n";
    std::cerr << "[daemon] Notification threshold: " << threshold_days_ << " days\n";

    while (running) {
        auto report = run_sweep();
        if (!report.aborted) {
            std::cerr << "[daemon] Sweep done: due=" << report.due
                      << " notified=" << report.notified
                      << " failed=" << report.failed << "\n";
        }

        // Sleep in 1s slices so a stop request is seen promptly
        for (int64_t i = 0; i < interval_s_ && running; ++i) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    std::cerr << "[daemon] Stopped\n";
}

} // namespace tokenwarden
