#pragma once
#include <ostream>
#include <vector>

#include "rping/ping.hpp"

namespace rping {

/**
 * Counters for one ping session.
 *
 * Invariants: received <= transmitted, rtts.size() == received.
 * rtts keeps arrival order.
 */
struct SessionStats {
    int transmitted{0};
    int received{0};
    std::vector<double> rtts;

    /** Count one finished probe, successful or not. */
    void record(const PingProbeResult& probe);
};

/**
 * Derived figures. All RTT fields are 0 when nothing was received.
 */
struct RttSummary {
    double min_ms{0.0};
    double avg_ms{0.0};
    double max_ms{0.0};
    double stddev_ms{0.0};     // population standard deviation
    double loss_pct{0.0};
};

RttSummary summarize(const SessionStats& stats);

/**
 * Print the closing statistics block:
 *
 *   --- Statistics ---
 *   N packets transmitted, M packets received, L% packet loss
 *   round-trip min/avg/max/std-dev = a/b/c/d ms
 */
void print_statistics(std::ostream& out, const SessionStats& stats);

} // namespace rping
