#pragma once
#include <string>
#include "rping/ping.hpp"
#include "rping/session.hpp"

/**
 * Parsed command-line options for the rping executable.
 *
 * Flat and CLI-oriented; the library-facing parts live in the embedded
 * rping::PingOptions and rping::SessionConfig.
 */
struct CliOptions {
    std::string host;             // Target host (mandatory)

    rping::PingOptions ping;      // Per-probe parameters
    rping::SessionConfig session; // Count and interval

    bool verbose{false};          // Debug diagnostics on stderr
    bool help{false};             // -h given

    std::string error;            // Non-empty: usage error, do not ping
    bool show_usage{false};       // Print the usage line for this error
};

/**
 * Parse all command-line arguments into a CliOptions struct.
 * Any invalid flag or value sets `error`; nothing is pinged in that case.
 */
CliOptions parse_args(int argc, char** argv);

/**
 * One-line usage text.
 */
const char* usage_text();
