/**
 * Probe loop: one outstanding echo at a time, fixed sleep between probes.
 */

#include "rping/session.hpp"
#include "rping/log.hpp"

#include <iomanip>

namespace rping {

static void print_reply(std::ostream& out, const ResolvedAddress& target,
                        int seq, const PingProbeResult& probe)
{
    std::ios::fmtflags flags = out.flags();
    std::streamsize prec = out.precision();

    out << "Packet from " << target.ip
        << ": icmp_seq=" << seq << " "
        << family_traits(target.version).ttl_label << "=";
    // No TTL / hop limit when the kernel withheld the ancillary data
    if (probe.ttl >= 0)
        out << probe.ttl;
    else
        out << "?";
    out << " time=" << std::fixed << std::setprecision(3) << probe.rtt_ms
        << " ms\n";

    out.flags(flags);
    out.precision(prec);
}

void run_session(const SessionConfig& cfg,
                 const ResolvedAddress& target,
                 const Prober& prober,
                 CancelToken& cancel,
                 SessionStats& stats,
                 std::ostream& out)
{
    if (cfg.count < 0) {
        log(LogLevel::ERROR, "invalid probe count " + std::to_string(cfg.count));
        return;
    }

    const bool bounded = cfg.count > 0;

    for (int seq = 0; !bounded || seq < cfg.count; ++seq) {
        PingProbeResult probe = prober(seq);

        if (probe.success) {
            print_reply(out, target, seq, probe);
        } else {
            out << "Request timeout for icmp_seq " << seq << "\n";
        }
        out.flush();

        stats.record(probe);

        if (cancel.wait_for(std::chrono::milliseconds(cfg.interval_ms))) {
            log(LogLevel::DEBUG, "cancelled after icmp_seq " + std::to_string(seq));
            return;
        }
    }
}

Prober make_icmp_prober(const ResolvedAddress& target, const PingOptions& opt) {
    return [target, opt](int seq) {
        return ping_once(target, seq, opt);
    };
}

} // namespace rping
