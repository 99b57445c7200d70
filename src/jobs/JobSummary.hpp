/**
 * SEL: Sweets Economy Ledger - Batch Job Summary
 * Purpose: Per-run counters returned by every scheduled job and logged at
 * the end of the run.
 */

#ifndef SEL_JOB_SUMMARY_HPP
#define SEL_JOB_SUMMARY_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include "../core/types.hpp"

namespace sel {

struct JobSummary {
    std::string job;
    int candidates = 0;
    int processed = 0;
    int skipped = 0;      // already claimed or no longer pending
    int failed = 0;
    int released = 0;     // transient store failure, left pending for the next run
    int deferred = 0;     // not reached before the run deadline
    int timed_out = 0;    // overran jobs.item_timeout_ms, also counted as failed
    int notification_failures = 0;
    coin_amount amount = 0;
    bool daily_reset = false;
    timestamp started_at;
    timestamp finished_at;
};

// Time budget of a single batch item.
class ItemClock {
public:
    explicit ItemClock(int timeout_ms) : start_(std::chrono::steady_clock::now()), timeout_ms_(timeout_ms) {}

    long long elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }
    bool overran() const { return elapsed_ms() > timeout_ms_; }

private:
    std::chrono::steady_clock::time_point start_;
    int timeout_ms_;
};

// Thrown inside a job when an item overruns its budget before its commit.
class ItemTimedOut : public std::runtime_error {
public:
    explicit ItemTimedOut(const std::string& message) : std::runtime_error(message) {}
};

inline void to_json(json& j, const JobSummary& s) {
    j = {
        {"job", s.job},
        {"candidates", s.candidates},
        {"processed", s.processed},
        {"skipped", s.skipped},
        {"failed", s.failed},
        {"released", s.released},
        {"deferred", s.deferred},
        {"timed_out", s.timed_out},
        {"notification_failures", s.notification_failures},
        {"amount", s.amount},
        {"daily_reset", s.daily_reset},
        {"started_at", format_iso8601(s.started_at)},
        {"finished_at", format_iso8601(s.finished_at)}
    };
}

inline std::string describe(const JobSummary& s) {
    return s.job + ": " + std::to_string(s.processed) + "/" + std::to_string(s.candidates) + " processed, " +
           std::to_string(s.failed) + " failed, " + std::to_string(s.skipped) + " skipped, " +
           std::to_string(s.released) + " released, " + std::to_string(s.deferred) + " deferred, " +
           std::to_string(s.timed_out) + " timed out, " +
           std::to_string(s.amount) + " coins";
}

} // namespace sel

#endif // SEL_JOB_SUMMARY_HPP
