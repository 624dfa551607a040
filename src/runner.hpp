/**
 * High-level ping execution logic.
 *
 * Exposes a single entry point used by the CLI frontend.
 * The ICMP work is delegated to rping::run_session() and rping::ping_once().
 */

#pragma once
#include <iostream>
#include "cli.hpp"

/**
 * Resolve the host, run the session and print the final statistics.
 *
 * Returns 0 after a session ran, 1 on usage or resolution errors (in which
 * case no probe is sent).
 */
int run_ping(const CliOptions& opt, std::ostream& out = std::cout);
