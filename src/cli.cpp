#include "cli.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace {

bool parse_int(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        if (pos != s.size())
            return false;
        out = v;
        return true;
    } catch (const std::logic_error&) {
        // invalid_argument / out_of_range
        return false;
    }
}

// Seconds (fractional allowed) -> milliseconds; must be positive
bool parse_seconds(const std::string& s, int& out_ms) {
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size() || !(v > 0.0) || v > 86400.0)
            return false;
        out_ms = static_cast<int>(std::lround(v * 1000.0));
        if (out_ms < 1) out_ms = 1;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

CliOptions usage_error(CliOptions opt, const std::string& msg, bool show_usage) {
    opt.error = msg;
    opt.show_usage = show_usage;
    return opt;
}

} // namespace

const char* usage_text() {
    return "usage: ping [-c count] [-s size] [-i interval] [-W timeout] [-v] host";
}

/**
 * Parse command-line arguments into a CliOptions struct.
 *
 * Mirrors classic ping syntax: `rping [-c count] host`, plus
 *   -s size       ICMP data bytes (>= 8, timestamp included)
 *   -i interval   seconds between probes
 *   -W timeout    seconds to wait for each reply
 *   -v            verbose diagnostics
 *
 * Flags may appear before or after the host. Exactly one host is required.
 */
CliOptions parse_args(int argc, char** argv) {
    CliOptions opt{};
    opt.ping.id = rping::default_identifier();

    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];

        if (a == "-h" || a == "--help") {
            opt.help = true;
            return opt;

        } else if (a == "-v") {
            opt.verbose = true;

        } else if (a == "-c" || a == "-s" || a == "-i" || a == "-W") {
            if (i + 1 >= argc)
                return usage_error(opt, "ping: option requires an argument -- " + a.substr(1), true);
            std::string v = argv[++i];

            if (a == "-c") {
                if (!parse_int(v, opt.session.count))
                    return usage_error(opt, "ping: invalid count: " + v, false);
                if (opt.session.count < 0)
                    return usage_error(opt, "ping: count must be a positive number", false);

            } else if (a == "-s") {
                if (!parse_int(v, opt.ping.data_size))
                    return usage_error(opt, "ping: invalid packet size: " + v, false);
                if (opt.ping.data_size < rping::kMinDataSize ||
                    opt.ping.data_size > rping::kMaxDataSize)
                    return usage_error(opt, "ping: packet size must be between " +
                                            std::to_string(rping::kMinDataSize) + " and " +
                                            std::to_string(rping::kMaxDataSize), false);

            } else if (a == "-i") {
                if (!parse_seconds(v, opt.session.interval_ms))
                    return usage_error(opt, "ping: invalid interval: " + v, false);

            } else {
                if (!parse_seconds(v, opt.ping.timeout_ms))
                    return usage_error(opt, "ping: invalid timeout: " + v, false);
            }

        } else if (a.size() > 1 && a[0] == '-') {
            return usage_error(opt, "ping: unknown option " + a, true);

        } else {
            opt.host = a;
            positional++;
        }
    }

    if (positional != 1)
        return usage_error(opt, "", true);

    return opt;
}
