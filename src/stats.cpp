#include "rping/stats.hpp"

#include <cmath>
#include <iomanip>

namespace rping {

void SessionStats::record(const PingProbeResult& probe) {
    if (probe.success) {
        received++;
        rtts.push_back(probe.rtt_ms);
    }
    transmitted++;
}

/**
 * Compute min / avg / max / std-dev and packet loss.
 *
 * Loss is 0% when nothing was transmitted, so an interrupted session that
 * never sent a probe does not report a division by zero.
 */
RttSummary summarize(const SessionStats& s) {
    RttSummary r{};

    if (s.transmitted > 0) {
        r.loss_pct = (1.0 - static_cast<double>(s.received) / s.transmitted) * 100.0;
    }

    if (s.received == 0 || s.rtts.empty())
        return r;

    r.min_ms = s.rtts[0];
    r.max_ms = s.rtts[0];
    double sum = 0.0;
    for (double v : s.rtts) {
        if (v < r.min_ms) r.min_ms = v;
        if (v > r.max_ms) r.max_ms = v;
        sum += v;
    }
    const double n = static_cast<double>(s.rtts.size());
    r.avg_ms = sum / n;

    double var = 0.0;
    for (double v : s.rtts) var += (v - r.avg_ms) * (v - r.avg_ms);
    r.stddev_ms = std::sqrt(var / n);

    return r;
}

void print_statistics(std::ostream& out, const SessionStats& s) {
    const RttSummary r = summarize(s);

    std::ios::fmtflags flags = out.flags();
    std::streamsize prec = out.precision();

    out << std::fixed << std::setprecision(3);
    out << "\n--- Statistics ---\n";
    out << s.transmitted << " packets transmitted, "
        << s.received << " packets received, "
        << r.loss_pct << "% packet loss\n";
    out << "round-trip min/avg/max/std-dev = "
        << r.min_ms << "/"
        << r.avg_ms << "/"
        << r.max_ms << "/"
        << r.stddev_ms << " ms\n";

    out.flags(flags);
    out.precision(prec);
}

} // namespace rping
