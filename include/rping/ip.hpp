#pragma once
#include <cstdint>

namespace rping {

/**
 * Minimal IPv4 header representation (network byte order).
 * Raw IPv4 ICMP sockets prepend this to every datagram they deliver.
 *
 * Note: This struct must remain packed to match wire format.
 */
#pragma pack(push, 1)
struct Ipv4Header {
    uint8_t  ver_ihl;   // Version (4 bits) + IHL (4 bits)
    uint8_t  tos;
    uint16_t tot_len;
    uint16_t id;
    uint16_t frag_off;
    uint8_t  ttl;
    uint8_t  protocol;  // 1 = ICMP
    uint16_t check;
    uint32_t saddr;
    uint32_t daddr;
};

/**
 * Fixed IPv6 base header (RFC 8200). Extension headers are not parsed.
 */
struct Ipv6Header {
    uint32_t ver_tc_flow;   // Version (4) + Traffic class (8) + Flow label (20)
    uint16_t payload_len;
    uint8_t  next_header;   // 58 = ICMPv6
    uint8_t  hop_limit;
    uint8_t  saddr[16];
    uint8_t  daddr[16];
};
#pragma pack(pop)

constexpr int kIpv4MinHeaderLen = 20;
constexpr int kIpv6HeaderLen    = 40;

static_assert(sizeof(Ipv4Header) == kIpv4MinHeaderLen, "IPv4 header must stay packed");
static_assert(sizeof(Ipv6Header) == kIpv6HeaderLen, "IPv6 header must stay packed");

} // namespace rping
