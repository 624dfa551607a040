/**
 * Runner: orchestrates a ping session.
 *
 * This module handles:
 * - Usage and resolution errors (fatal, before any probe)
 * - SIGINT / SIGTERM driven cancellation
 * - The startup banner and the closing statistics
 */

#include "runner.hpp"
#include "rping/cancel.hpp"
#include "rping/log.hpp"
#include "rping/resolver.hpp"
#include "rping/session.hpp"
#include "rping/stats.hpp"

using namespace rping;

int run_ping(const CliOptions& opt, std::ostream& out) {
    if (opt.help) {
        out << usage_text() << "\n";
        return 0;
    }

    if (!opt.error.empty() || opt.show_usage) {
        if (!opt.error.empty())
            out << opt.error << "\n";
        if (opt.show_usage)
            out << usage_text() << "\n";
        return 1;
    }

    set_log_level(opt.verbose ? LogLevel::DEBUG : LogLevel::WARN);

    auto target = resolve(opt.host);
    if (!target) {
        out << "ping: unknown host\n";
        return 1;
    }
    log(LogLevel::DEBUG, opt.host + " resolved to " + target->ip);

    CancelToken cancel;
    SignalWatcher watcher(cancel);
    if (!watcher.start())
        log(LogLevel::WARN, "signal handling unavailable; statistics need a bounded count");

    out << "PING " << opt.host << " (" << target->ip << "): "
        << opt.ping.data_size << " data bytes\n";

    SessionStats stats;
    run_session(opt.session, *target, make_icmp_prober(*target, opt.ping), cancel, stats, out);

    watcher.stop();

    print_statistics(out, stats);
    out.flush();
    return 0;
}
