/**
 * ICMP / ICMPv6 Echo codec.
 *
 * All header offset arithmetic for both IP versions lives in this file.
 * Multi-byte header fields are network order on the wire; the timestamp in
 * the echo body is little endian.
 */

#include "rping/echo.hpp"
#include "rping/icmp.hpp"
#include "rping/util.hpp"

#include <cstring>

#include <arpa/inet.h>

namespace rping {

// Offset of the timestamp inside the ICMP message: header (4) + id/seq (4)
static constexpr size_t kTimestampOffset = sizeof(IcmpHeader);
static constexpr char   kFiller = ' ';

// ============================================================================
// Encode
// ============================================================================
EncodeResult encode_echo_request(uint16_t id, uint16_t seq,
                                 IpVersion version, int data_size,
                                 int64_t timestamp_ns)
{
    EncodeResult res{};

    if (data_size < kMinDataSize) {
        res.error_msg = "data size " + std::to_string(data_size) +
                        " is smaller than the " + std::to_string(kMinDataSize) +
                        "-byte timestamp";
        return res;
    }
    if (data_size > kMaxDataSize) {
        res.error_msg = "data size " + std::to_string(data_size) + " is too large";
        return res;
    }

    const FamilyTraits& ft = family_traits(version);

    res.bytes.assign(sizeof(IcmpHeader) + static_cast<size_t>(data_size),
                     static_cast<uint8_t>(kFiller));

    IcmpHeader hdr{};
    hdr.type     = ft.echo_request;
    hdr.code     = 0;
    hdr.checksum = 0;
    hdr.id       = htons(id);
    hdr.seq      = htons(seq);
    std::memcpy(res.bytes.data(), &hdr, sizeof(hdr));

    store_le64(res.bytes.data() + kTimestampOffset,
               static_cast<uint64_t>(timestamp_ns));

    if (version == IpVersion::V4) {
        uint16_t sum = checksum16(res.bytes.data(), res.bytes.size());
        std::memcpy(res.bytes.data() + offsetof(IcmpHeader, checksum), &sum, sizeof(sum));
    }

    res.sent_ns = timestamp_ns;
    res.ok = true;
    return res;
}

EncodeResult encode_echo_request(uint16_t id, uint16_t seq,
                                 IpVersion version, int data_size)
{
    return encode_echo_request(id, seq, version, data_size, unix_time_ns());
}

// ============================================================================
// IP headers
// ============================================================================
bool parse_ipv4_header(const uint8_t* data, size_t len,
                       Ipv4Header& out, size_t& header_len)
{
    if (!data || len < sizeof(Ipv4Header))
        return false;

    std::memcpy(&out, data, sizeof(out));

    if ((out.ver_ihl >> 4) != 4)
        return false;

    header_len = static_cast<size_t>(out.ver_ihl & 0x0F) * 4;
    if (header_len < static_cast<size_t>(kIpv4MinHeaderLen) || header_len > len)
        return false;

    return true;
}

bool parse_ipv6_header(const uint8_t* data, size_t len, Ipv6Header& out) {
    if (!data || len < static_cast<size_t>(kIpv6HeaderLen))
        return false;

    std::memcpy(&out, data, sizeof(out));
    return (data[0] >> 4) == 6;
}

// ============================================================================
// Decode
// ============================================================================
DecodeResult decode_echo_reply(const uint8_t* data, size_t len,
                               IpVersion version, int hop_limit)
{
    DecodeResult res{};
    const FamilyTraits& ft = family_traits(version);

    const uint8_t* msg = data;
    size_t msg_len = len;

    if (version == IpVersion::V4) {
        Ipv4Header ip{};
        size_t ihl = 0;
        if (!parse_ipv4_header(data, len, ip, ihl)) {
            res.error_msg = "malformed IPv4 header";
            return res;
        }
        res.reply.ttl = ip.ttl;
        msg     = data + ihl;
        msg_len = len - ihl;
    } else {
        res.reply.ttl = hop_limit;
    }

    if (!msg || msg_len < sizeof(IcmpHeader)) {
        res.error_msg = "truncated ICMP header";
        return res;
    }

    IcmpHeader hdr{};
    std::memcpy(&hdr, msg, sizeof(hdr));
    res.reply.type = hdr.type;

    if (hdr.type != ft.echo_reply) {
        res.status = DecodeStatus::NotEchoReply;
        return res;
    }

    if (msg_len < kTimestampOffset + kTimestampLen) {
        res.error_msg = "echo reply too short for timestamp";
        return res;
    }

    res.reply.id      = ntohs(hdr.id);
    res.reply.seq     = ntohs(hdr.seq);
    res.reply.sent_ns = static_cast<int64_t>(load_le64(msg + kTimestampOffset));
    res.status = DecodeStatus::Ok;
    return res;
}

} // namespace rping
