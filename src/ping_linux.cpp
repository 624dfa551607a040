/**
 * Linux implementation of the echo round trip.
 *
 * This file provides the raw-socket ICMP Echo workflow using:
 *   - SOCK_RAW + IPPROTO_ICMP / IPPROTO_ICMPV6, connected to the target
 *   - poll() against a fixed per-attempt deadline
 *   - recvmsg() with IPV6_RECVHOPLIMIT to recover the IPv6 hop limit
 *   - the send timestamp carried in the echo body for RTT
 */

#include "rping/ping.hpp"
#include "rping/fd.hpp"
#include "rping/log.hpp"
#include "rping/util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace rping {

namespace {

constexpr size_t kMinRecvBuffer = 1500;

std::string errno_text(const char* call) {
    return std::string(call) + " failed: " + std::strerror(errno);
}

PingProbeResult failure(ProbeError e, std::string msg) {
    PingProbeResult probe{};
    probe.error = e;
    probe.error_msg = std::move(msg);
    return probe;
}

// Pull IPV6_HOPLIMIT out of the ancillary data, -1 if absent
int hop_limit_from_cmsg(msghdr& msg) {
    for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg);
         cmsg;
         cmsg = CMSG_NXTHDR(&msg, cmsg))
    {
        if (cmsg->cmsg_level == IPPROTO_IPV6 &&
            cmsg->cmsg_type == IPV6_HOPLIMIT)
        {
            int hlim = -1;
            std::memcpy(&hlim, CMSG_DATA(cmsg), sizeof(hlim));
            return hlim;
        }
    }
    return -1;
}

} // namespace

const char* probe_error_name(ProbeError e) {
    switch (e) {
        case ProbeError::None:    return "none";
        case ProbeError::Dial:    return "dial";
        case ProbeError::Encode:  return "encode";
        case ProbeError::Send:    return "send";
        case ProbeError::Receive: return "receive";
        case ProbeError::Parse:   return "parse";
        case ProbeError::Timeout: return "timeout";
    }
    return "?";
}

uint16_t default_identifier() {
    return static_cast<uint16_t>(::getpid() & 0xFFFF);
}


// ============================================================================
// Receive loop
// ============================================================================
PingProbeResult receive_echo_reply(int fd, IpVersion version,
                                   uint16_t id, uint16_t seq,
                                   std::chrono::steady_clock::time_point deadline,
                                   size_t buf_size)
{
    using clock = std::chrono::steady_clock;

    std::vector<uint8_t> buf(std::max(buf_size, kMinRecvBuffer));
    alignas(cmsghdr) char cbuf[256];

    while (true) {
        auto now = clock::now();
        if (now >= deadline)
            return failure(ProbeError::Timeout, "No reply received");

        // Round up so a sub-millisecond remainder still waits
        auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(deadline - now);
        int wait_ms = static_cast<int>((remaining.count() + 999) / 1000);

        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            return failure(ProbeError::Receive, errno_text("poll()"));
        }
        if (rc == 0)
            continue;   // re-check the deadline

        iovec iov{ buf.data(), buf.size() };

        msghdr msg{};
        msg.msg_iov        = &iov;
        msg.msg_iovlen     = 1;
        msg.msg_control    = cbuf;
        msg.msg_controllen = sizeof(cbuf);

        ssize_t n = ::recvmsg(fd, &msg, MSG_DONTWAIT);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;
            return failure(ProbeError::Receive, errno_text("recvmsg()"));
        }

        int hop_limit = -1;
        if (version == IpVersion::V6)
            hop_limit = hop_limit_from_cmsg(msg);

        DecodeResult dec = decode_echo_reply(buf.data(), static_cast<size_t>(n),
                                             version, hop_limit);

        if (dec.status == DecodeStatus::ParseError)
            return failure(ProbeError::Parse, dec.error_msg);

        if (dec.status == DecodeStatus::NotEchoReply) {
            log(LogLevel::DEBUG, "skipping ICMP type " + std::to_string(dec.reply.type));
            continue;
        }

        // Another process's ping, or a late reply to an earlier probe
        if (dec.reply.id != id || dec.reply.seq != seq) {
            log(LogLevel::DEBUG, "skipping echo reply id=" + std::to_string(dec.reply.id) +
                                 " seq=" + std::to_string(dec.reply.seq));
            continue;
        }

        PingProbeResult probe{};
        probe.success = true;
        probe.ttl     = dec.reply.ttl;
        probe.rtt_ms  = static_cast<double>(unix_time_ns() - dec.reply.sent_ns) / 1e6;
        return probe;
    }
}


// ============================================================================
// Single round trip
// ============================================================================
PingProbeResult ping_once(const ResolvedAddress& dst, int seq, const PingOptions& opt) {
    const FamilyTraits& ft = family_traits(dst.version);

    // ---------------------------------------------------------------------
    // Dial
    // ---------------------------------------------------------------------
    Fd sock(::socket(ft.domain, SOCK_RAW | SOCK_CLOEXEC, ft.protocol));
    if (!sock) {
        auto res = failure(ProbeError::Dial, errno_text("socket()"));
        log(LogLevel::WARN, "Failed to dial " + dst.ip + ": " + res.error_msg);
        return res;
    }

    if (dst.version == IpVersion::V6) {
        int one = 1;
        if (::setsockopt(sock.get(), IPPROTO_IPV6, IPV6_RECVHOPLIMIT, &one, sizeof(one)) < 0)
            log(LogLevel::WARN, errno_text("setsockopt(IPV6_RECVHOPLIMIT)") +
                                "; hop limit will be reported as unknown");
    }

    if (::connect(sock.get(), reinterpret_cast<const sockaddr*>(&dst.addr), dst.addr_len) < 0) {
        auto res = failure(ProbeError::Dial, errno_text("connect()"));
        log(LogLevel::WARN, "Failed to dial " + dst.ip + ": " + res.error_msg);
        return res;
    }

    // ---------------------------------------------------------------------
    // Build and send
    // ---------------------------------------------------------------------
    const uint16_t wire_seq = static_cast<uint16_t>(seq);
    EncodeResult req = encode_echo_request(opt.id, wire_seq, dst.version, opt.data_size);
    if (!req.ok) {
        log(LogLevel::WARN, "Failed to encode echo: " + req.error_msg);
        return failure(ProbeError::Encode, req.error_msg);
    }

    ssize_t sent = ::send(sock.get(), req.bytes.data(), req.bytes.size(), 0);
    if (sent < 0) {
        auto res = failure(ProbeError::Send, errno_text("send()"));
        log(LogLevel::WARN, res.error_msg);
        return res;
    }

    auto deadline = std::chrono::steady_clock::now()
                  + std::chrono::milliseconds(std::max(1, opt.timeout_ms));

    // ---------------------------------------------------------------------
    // Wait for the reply; the socket closes when `sock` leaves scope
    // ---------------------------------------------------------------------
    size_t buf_size = static_cast<size_t>(sent) + static_cast<size_t>(ft.recv_overhead);
    PingProbeResult probe = receive_echo_reply(sock.get(), dst.version, opt.id, wire_seq,
                                               deadline, buf_size);
    if (!probe.success)
        log(LogLevel::DEBUG, "icmp_seq " + std::to_string(seq) + ": " +
                             probe_error_name(probe.error) + " (" + probe.error_msg + ")");
    return probe;
}

} // namespace rping
