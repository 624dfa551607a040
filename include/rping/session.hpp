#pragma once
#include <functional>
#include <ostream>

#include "rping/cancel.hpp"
#include "rping/ping.hpp"
#include "rping/resolver.hpp"
#include "rping/stats.hpp"

namespace rping {

/**
 * Scheduling parameters for a ping session.
 */
struct SessionConfig {
    int count{0};             // 0 = run until cancelled
    int interval_ms{1000};    // Sleep after each probe, not adjusted for probe time
};

/**
 * Performs the probe for one sequence number. The CLI binds this to
 * ping_once(); tests substitute scripted results.
 */
using Prober = std::function<PingProbeResult(int seq)>;

/**
 * Run the probe loop until the count is exhausted or @p cancel fires.
 *
 * Each iteration probes sequence i, prints a per-packet or timeout line to
 * @p out, records the outcome into @p stats, sleeps the interval and then
 * checks for cancellation. Statistics are not printed here. A negative
 * count is rejected without sending anything.
 */
void run_session(const SessionConfig& cfg,
                 const ResolvedAddress& target,
                 const Prober& prober,
                 CancelToken& cancel,
                 SessionStats& stats,
                 std::ostream& out);

/**
 * Prober that sends real echo requests to @p target.
 */
Prober make_icmp_prober(const ResolvedAddress& target, const PingOptions& opt);

} // namespace rping
