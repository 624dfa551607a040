#include "rping/echo.hpp"
#include "rping/fd.hpp"
#include "rping/icmp.hpp"
#include "rping/ip.hpp"
#include "rping/ping.hpp"
#include "rping/resolver.hpp"
#include "rping/util.hpp"
#include "test_harness.hpp"

#include <chrono>
#include <cstring>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <sys/socket.h>

using namespace rping;

static const uint16_t kId = 0x4242;

// Turn an encoded request into the matching reply, as the peer would
static std::vector<uint8_t> as_reply(std::vector<uint8_t> icmp, IpVersion v) {
    icmp[0] = family_traits(v).echo_reply;
    return icmp;
}

// Prefix an ICMP message with an IPv4 header of ihl_words * 4 bytes
static std::vector<uint8_t> with_ipv4_header(const std::vector<uint8_t>& icmp,
                                             uint8_t ttl, int ihl_words = 5) {
    std::vector<uint8_t> pkt(static_cast<size_t>(ihl_words) * 4, 0);
    Ipv4Header ip{};
    ip.ver_ihl  = static_cast<uint8_t>(0x40 | ihl_words);
    ip.tot_len  = htons(static_cast<uint16_t>(pkt.size() + icmp.size()));
    ip.ttl      = ttl;
    ip.protocol = IPPROTO_ICMP;
    std::memcpy(pkt.data(), &ip, sizeof(ip));
    pkt.insert(pkt.end(), icmp.begin(), icmp.end());
    return pkt;
}

// ============================================================================
// Encode
// ============================================================================
bool test_encode_layout_ipv4() {
    auto req = encode_echo_request(kId, 7, IpVersion::V4, kDefaultDataSize, 0x0102030405060708LL);
    if (!req.ok) return false;
    if (req.bytes.size() != 8 + 56) return false;

    IcmpHeader hdr{};
    std::memcpy(&hdr, req.bytes.data(), sizeof(hdr));
    if (hdr.type != kIcmpEchoRequest || hdr.code != 0) return false;
    if (ntohs(hdr.id) != kId || ntohs(hdr.seq) != 7) return false;

    // Little-endian timestamp right after the header
    if (req.bytes[8] != 0x08 || req.bytes[15] != 0x01) return false;

    // Filler
    for (size_t i = 16; i < req.bytes.size(); ++i)
        if (req.bytes[i] != ' ') return false;

    // A valid Internet checksum sums to zero
    return checksum16(req.bytes.data(), req.bytes.size()) == 0;
}

bool test_encode_ipv6_leaves_checksum() {
    auto req = encode_echo_request(kId, 1, IpVersion::V6, 16, 99);
    if (!req.ok) return false;
    if (req.bytes[0] != kIcmp6EchoRequest) return false;
    if (req.bytes.size() != 8 + 16) return false;
    return req.bytes[2] == 0 && req.bytes[3] == 0;
}

bool test_encode_rejects_small_size() {
    auto req = encode_echo_request(kId, 0, IpVersion::V4, 7, 0);
    if (req.ok || req.error_msg.empty()) return false;
    // Exactly the timestamp is fine
    auto min = encode_echo_request(kId, 0, IpVersion::V4, 8, 0);
    return min.ok && min.bytes.size() == 16;
}

bool test_encode_max_data_size() {
    // 65535 - 20 (IPv4) - 8 (ICMP)
    if (kMaxDataSize != 65507) return false;

    auto max = encode_echo_request(kId, 0, IpVersion::V4, 65507, 0);
    if (!max.ok || max.bytes.size() != 8 + 65507u) return false;
    if (checksum16(max.bytes.data(), max.bytes.size()) != 0) return false;

    auto over = encode_echo_request(kId, 0, IpVersion::V4, 65508, 0);
    return !over.ok && !over.error_msg.empty();
}

bool test_encode_uses_current_time() {
    int64_t before = unix_time_ns();
    auto req = encode_echo_request(kId, 0, IpVersion::V4, kDefaultDataSize);
    int64_t after = unix_time_ns();
    return req.ok && req.sent_ns >= before && req.sent_ns <= after;
}

// ============================================================================
// Decode
// ============================================================================
bool test_timestamp_round_trip_ipv4() {
    const int64_t ts = 1700000000123456789LL;
    auto req = encode_echo_request(kId, 3, IpVersion::V4, kDefaultDataSize, ts);
    auto pkt = with_ipv4_header(as_reply(req.bytes, IpVersion::V4), 57);

    auto dec = decode_echo_reply(pkt.data(), pkt.size(), IpVersion::V4);
    return dec.status == DecodeStatus::Ok &&
           dec.reply.sent_ns == ts &&
           dec.reply.ttl == 57 &&
           dec.reply.id == kId &&
           dec.reply.seq == 3;
}

bool test_timestamp_round_trip_ipv6() {
    const int64_t ts = 1234567890987654321LL;
    auto req = encode_echo_request(kId, 65535, IpVersion::V6, 32, ts);
    auto msg = as_reply(req.bytes, IpVersion::V6);

    auto dec = decode_echo_reply(msg.data(), msg.size(), IpVersion::V6, 61);
    return dec.status == DecodeStatus::Ok &&
           dec.reply.sent_ns == ts &&
           dec.reply.ttl == 61 &&
           dec.reply.seq == 65535;
}

bool test_decode_ipv4_with_options() {
    auto req = encode_echo_request(kId, 1, IpVersion::V4, kDefaultDataSize, 42);
    auto pkt = with_ipv4_header(as_reply(req.bytes, IpVersion::V4), 10, 8);

    auto dec = decode_echo_reply(pkt.data(), pkt.size(), IpVersion::V4);
    return dec.status == DecodeStatus::Ok && dec.reply.sent_ns == 42 && dec.reply.ttl == 10;
}

bool test_decode_skips_other_types() {
    // Our own request looped back on 127.0.0.1
    auto req = encode_echo_request(kId, 1, IpVersion::V4, kDefaultDataSize, 42);
    auto pkt = with_ipv4_header(req.bytes, 64);
    auto dec = decode_echo_reply(pkt.data(), pkt.size(), IpVersion::V4);
    if (dec.status != DecodeStatus::NotEchoReply) return false;

    // IPv4 Echo Reply number on an ICMPv6 socket is not a reply
    auto v6 = as_reply(req.bytes, IpVersion::V4);
    auto dec6 = decode_echo_reply(v6.data(), v6.size(), IpVersion::V6);
    if (dec6.status != DecodeStatus::NotEchoReply) return false;

    // Destination unreachable with a short body
    std::vector<uint8_t> unreach{3, 1, 0, 0, 0, 0, 0, 0};
    auto pkt2 = with_ipv4_header(unreach, 64);
    return decode_echo_reply(pkt2.data(), pkt2.size(), IpVersion::V4).status ==
           DecodeStatus::NotEchoReply;
}

bool test_decode_truncated() {
    auto req = encode_echo_request(kId, 1, IpVersion::V4, kDefaultDataSize, 42);
    auto pkt = with_ipv4_header(as_reply(req.bytes, IpVersion::V4), 64);

    // IP header only
    if (decode_echo_reply(pkt.data(), 20, IpVersion::V4).status != DecodeStatus::ParseError)
        return false;
    // Shorter than an IP header
    if (decode_echo_reply(pkt.data(), 12, IpVersion::V4).status != DecodeStatus::ParseError)
        return false;
    // Echo reply cut inside the timestamp
    if (decode_echo_reply(pkt.data(), 20 + 12, IpVersion::V4).status != DecodeStatus::ParseError)
        return false;
    // IPv6: four bytes of ICMP
    auto msg = as_reply(req.bytes, IpVersion::V6);
    return decode_echo_reply(msg.data(), 4, IpVersion::V6).status == DecodeStatus::ParseError;
}

bool test_decode_bad_ip_header() {
    auto req = encode_echo_request(kId, 1, IpVersion::V4, kDefaultDataSize, 42);
    auto pkt = with_ipv4_header(as_reply(req.bytes, IpVersion::V4), 64);

    auto wrong_version = pkt;
    wrong_version[0] = 0x65;
    if (decode_echo_reply(wrong_version.data(), wrong_version.size(), IpVersion::V4).status !=
        DecodeStatus::ParseError)
        return false;

    auto short_ihl = pkt;
    short_ihl[0] = 0x44;
    if (decode_echo_reply(short_ihl.data(), short_ihl.size(), IpVersion::V4).status !=
        DecodeStatus::ParseError)
        return false;

    // IHL pointing past the end of the buffer
    auto long_ihl = pkt;
    long_ihl[0] = 0x4F;
    return decode_echo_reply(long_ihl.data(), 40, IpVersion::V4).status ==
           DecodeStatus::ParseError;
}

bool test_parse_ipv6_header() {
    std::vector<uint8_t> hdr(40, 0);
    hdr[0] = 0x60;
    hdr[6] = IPPROTO_ICMPV6;
    hdr[7] = 33;

    Ipv6Header out{};
    if (!parse_ipv6_header(hdr.data(), hdr.size(), out)) return false;
    if (out.hop_limit != 33 || out.next_header != IPPROTO_ICMPV6) return false;

    if (parse_ipv6_header(hdr.data(), kIpv6HeaderLen - 1, out)) return false;
    hdr[0] = 0x45;
    return !parse_ipv6_header(hdr.data(), hdr.size(), out);
}

// ============================================================================
// Receive loop over a datagram socketpair
// ============================================================================
struct DgramPair {
    Fd reader;
    Fd writer;
    bool open() {
        int sv[2];
        if (::socketpair(AF_UNIX, SOCK_DGRAM, 0, sv) < 0) return false;
        reader.reset(sv[0]);
        writer.reset(sv[1]);
        return true;
    }
    bool write(const std::vector<uint8_t>& d) {
        return ::send(writer.get(), d.data(), d.size(), 0) == static_cast<ssize_t>(d.size());
    }
};

bool test_receive_skips_non_replies() {
    DgramPair p;
    if (!p.open()) return false;

    auto now = unix_time_ns();
    auto req = encode_echo_request(kId, 5, IpVersion::V4, kDefaultDataSize, now);

    // Noise first: our own request, a foreign ping, a stale sequence
    p.write(with_ipv4_header(req.bytes, 64));
    auto foreign = encode_echo_request(static_cast<uint16_t>(kId + 1), 5, IpVersion::V4, kDefaultDataSize, now);
    p.write(with_ipv4_header(as_reply(foreign.bytes, IpVersion::V4), 64));
    auto stale = encode_echo_request(kId, 4, IpVersion::V4, kDefaultDataSize, now);
    p.write(with_ipv4_header(as_reply(stale.bytes, IpVersion::V4), 64));
    // Then the real reply
    p.write(with_ipv4_header(as_reply(req.bytes, IpVersion::V4), 52));

    auto start = std::chrono::steady_clock::now();
    auto res = receive_echo_reply(p.reader.get(), IpVersion::V4, kId, 5,
                                  start + std::chrono::seconds(1), 84);
    auto elapsed = std::chrono::steady_clock::now() - start;

    return res.success &&
           res.ttl == 52 &&
           res.rtt_ms >= 0.0 &&
           res.error == ProbeError::None &&
           elapsed < std::chrono::milliseconds(500);
}

bool test_receive_reply_after_noise_keeps_deadline() {
    DgramPair p;
    if (!p.open()) return false;

    auto req = encode_echo_request(kId, 9, IpVersion::V6, kDefaultDataSize);
    p.write(std::vector<uint8_t>{135, 0, 0, 0, 0, 0, 0, 0});  // neighbour solicitation

    std::thread late([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        p.write(as_reply(req.bytes, IpVersion::V6));
    });

    auto res = receive_echo_reply(p.reader.get(), IpVersion::V6, kId, 9,
                                  std::chrono::steady_clock::now() + std::chrono::seconds(1),
                                  64);
    late.join();

    // No ancillary hop limit on a unix socket
    return res.success && res.ttl == -1 && res.rtt_ms >= 100.0;
}

bool test_receive_timeout() {
    DgramPair p;
    if (!p.open()) return false;

    auto start = std::chrono::steady_clock::now();
    auto res = receive_echo_reply(p.reader.get(), IpVersion::V4, kId, 0,
                                  start + std::chrono::milliseconds(120), 84);
    auto elapsed = std::chrono::steady_clock::now() - start;

    return !res.success &&
           res.error == ProbeError::Timeout &&
           elapsed >= std::chrono::milliseconds(120);
}

bool test_receive_parse_error() {
    DgramPair p;
    if (!p.open()) return false;
    p.write(std::vector<uint8_t>{0x45, 0, 0});

    auto res = receive_echo_reply(p.reader.get(), IpVersion::V4, kId, 0,
                                  std::chrono::steady_clock::now() + std::chrono::seconds(1), 84);
    return !res.success && res.error == ProbeError::Parse;
}

// ============================================================================
// Resolver
// ============================================================================
bool test_resolve_literals() {
    auto v4 = resolve("127.0.0.1");
    if (!v4 || v4->version != IpVersion::V4 || v4->ip != "127.0.0.1") return false;
    if (v4->addr.ss_family != AF_INET) return false;

    auto v6 = resolve("::1");
    if (!v6 || v6->version != IpVersion::V6 || v6->ip != "::1") return false;

    auto mapped = resolve("::ffff:10.1.2.3");
    return mapped && mapped->version == IpVersion::V4 && mapped->ip == "10.1.2.3";
}

bool test_resolve_unknown() {
    // .invalid never resolves (RFC 6761)
    return !resolve("no-such-host.invalid") && !resolve("");
}

int main() {
    std::cout << "Running echo tests...\n";

    run_test("Encode IPv4 layout", test_encode_layout_ipv4);
    run_test("Encode IPv6 checksum left to kernel", test_encode_ipv6_leaves_checksum);
    run_test("Encode rejects data size below 8", test_encode_rejects_small_size);
    run_test("Encode largest data size", test_encode_max_data_size);
    run_test("Encode stamps current time", test_encode_uses_current_time);
    run_test("Timestamp round trip IPv4", test_timestamp_round_trip_ipv4);
    run_test("Timestamp round trip IPv6", test_timestamp_round_trip_ipv6);
    run_test("Decode IPv4 with options", test_decode_ipv4_with_options);
    run_test("Decode skips other ICMP types", test_decode_skips_other_types);
    run_test("Decode truncated buffers", test_decode_truncated);
    run_test("Decode malformed IPv4 header", test_decode_bad_ip_header);
    run_test("Parse IPv6 base header", test_parse_ipv6_header);
    run_test("Receive skips non-replies", test_receive_skips_non_replies);
    run_test("Receive late reply within deadline", test_receive_reply_after_noise_keeps_deadline);
    run_test("Receive timeout", test_receive_timeout);
    run_test("Receive parse error", test_receive_parse_error);
    run_test("Resolve literals", test_resolve_literals);
    run_test("Resolve unknown host", test_resolve_unknown);

    return finish("Echo tests");
}
