#pragma once
#include <cstdint>

namespace rping {

/**
 * Minimal ICMP header (Echo Request/Reply only), shared by ICMP and ICMPv6.
 * Matches wire format exactly, so keep this struct packed.
 */
#pragma pack(push, 1)
struct IcmpHeader {
    uint8_t  type;      // see the constants below
    uint8_t  code;      // unused for Echo
    uint16_t checksum;  // ICMP checksum (kernel-computed for ICMPv6)
    uint16_t id;        // Identifier (host-chosen)
    uint16_t seq;       // Sequence number
    // The variable payload follows immediately
};
#pragma pack(pop)

constexpr uint8_t kIcmpEchoReply     = 0;
constexpr uint8_t kIcmpEchoRequest   = 8;
constexpr uint8_t kIcmp6EchoRequest  = 128;
constexpr uint8_t kIcmp6EchoReply    = 129;

// Send timestamp, little endian nanoseconds, first field of the echo body
constexpr int kTimestampLen = 8;

} // namespace rping
