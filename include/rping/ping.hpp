#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "rping/echo.hpp"
#include "rping/resolver.hpp"

namespace rping {

/**
 * Why a probe failed. Every kind is local to one probe.
 */
enum class ProbeError {
    None,
    Dial,      // socket()/connect() failed
    Encode,    // request could not be built
    Send,      // send() failed
    Receive,   // recvmsg()/poll() failed
    Parse,     // malformed reply
    Timeout    // no matching reply before the deadline
};

const char* probe_error_name(ProbeError e);

/**
 * Represents the result of a single ICMP probe.
 */
struct PingProbeResult {
    bool success{false};                 // Whether a valid reply was received
    double rtt_ms{-1.0};                 // RTT in milliseconds (-1 = invalid)
    int  ttl{-1};                        // Observed TTL / hop limit (-1 = invalid)
    ProbeError error{ProbeError::None};
    std::string error_msg;               // Error detail (empty if success=true)
};

/**
 * Options for a single probe.
 */
struct PingOptions {
    int timeout_ms{1000};                // Reply deadline, measured from send
    int data_size{kDefaultDataSize};     // Timestamp + filler bytes
    uint16_t id{0};                      // Echo identifier
};

/**
 * Process-scoped echo identifier (pid & 0xffff).
 */
uint16_t default_identifier();

/**
 * Send one Echo Request to @p dst and wait for its reply.
 *
 * A raw socket is opened, connected, used and closed inside this call.
 * Replies of other ICMP types, or carrying another identifier or sequence,
 * are skipped without extending the deadline.
 */
PingProbeResult ping_once(const ResolvedAddress& dst, int seq, const PingOptions& opt);

/**
 * Receive loop used by ping_once(), usable on any datagram descriptor.
 *
 * Reads until a matching Echo Reply arrives or @p deadline passes.
 * RTT is computed from the timestamp embedded in the reply.
 */
PingProbeResult receive_echo_reply(int fd, IpVersion version,
                                   uint16_t id, uint16_t seq,
                                   std::chrono::steady_clock::time_point deadline,
                                   size_t buf_size);

} // namespace rping
