#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "rping/family.hpp"
#include "rping/icmp.hpp"
#include "rping/ip.hpp"

namespace rping {

constexpr int kDefaultDataSize = 56;
constexpr int kMinDataSize     = kTimestampLen;
// 65535 minus the IPv4 and ICMP headers
constexpr int kMaxDataSize     = 65535 - kIpv4MinHeaderLen - static_cast<int>(sizeof(IcmpHeader));

/**
 * Outcome of encode_echo_request().
 */
struct EncodeResult {
    bool ok{false};
    std::vector<uint8_t> bytes;   // Complete ICMP message, ready for send()
    int64_t sent_ns{0};           // Timestamp written into the body
    std::string error_msg;        // Set when ok == false
};

enum class DecodeStatus {
    Ok,            // Echo Reply for this IP version
    NotEchoReply,  // Well-formed ICMP of another type; caller keeps waiting
    ParseError     // Truncated or malformed datagram
};

/**
 * Fields recovered from an Echo Reply.
 */
struct EchoReply {
    int      ttl{-1};      // TTL (IPv4) or hop limit (IPv6); -1 if unknown
    uint8_t  type{0};
    uint16_t id{0};        // Host order
    uint16_t seq{0};       // Host order
    int64_t  sent_ns{0};   // Timestamp embedded by the sender
};

struct DecodeResult {
    DecodeStatus status{DecodeStatus::ParseError};
    EchoReply reply;
    std::string error_msg;
};

/**
 * Build an ICMP Echo Request.
 *
 * Body layout: 8-byte little-endian send timestamp (ns since the Unix epoch)
 * followed by data_size - 8 filler bytes. IPv4 messages carry a checksum;
 * ICMPv6 leaves it zero for the kernel to fill in.
 *
 * Fails when data_size is below 8 or above kMaxDataSize.
 */
EncodeResult encode_echo_request(uint16_t id, uint16_t seq,
                                 IpVersion version, int data_size,
                                 int64_t timestamp_ns);

/**
 * Same as above, stamping the current wall-clock time.
 */
EncodeResult encode_echo_request(uint16_t id, uint16_t seq,
                                 IpVersion version, int data_size);

/**
 * Decode a datagram read from a raw socket.
 *
 * IPv4: the buffer starts with the IP header; its IHL locates the ICMP
 * message and its TTL is reported.
 * IPv6: the buffer starts with the ICMPv6 message; the hop limit is taken
 * from @p hop_limit (ancillary data collected by the caller).
 */
DecodeResult decode_echo_reply(const uint8_t* data, size_t len,
                               IpVersion version, int hop_limit = -1);

/**
 * Parse and validate an IPv4 header. On success @p header_len holds IHL * 4.
 */
bool parse_ipv4_header(const uint8_t* data, size_t len,
                       Ipv4Header& out, size_t& header_len);

/**
 * Parse and validate a fixed IPv6 base header (version must be 6).
 */
bool parse_ipv6_header(const uint8_t* data, size_t len, Ipv6Header& out);

} // namespace rping
