#pragma once
#include <cstdint>
#include <netinet/in.h>
#include <sys/socket.h>

#include "rping/icmp.hpp"
#include "rping/ip.hpp"

namespace rping {

/**
 * IP version of a ping target. Every version-dependent decision (socket
 * type, ICMP type numbers, header offsets, output label) hangs off this tag
 * through family_traits().
 */
enum class IpVersion {
    V4,
    V6
};

/**
 * Per-version constants for the echo exchange.
 */
struct FamilyTraits {
    IpVersion   version;
    int         domain;         // AF_INET / AF_INET6
    int         protocol;       // IPPROTO_ICMP / IPPROTO_ICMPV6
    uint8_t     echo_request;
    uint8_t     echo_reply;
    int         recv_overhead;  // bytes the kernel prepends to received datagrams
    const char* ttl_label;      // "ttl" / "hlim"
};

inline const FamilyTraits& family_traits(IpVersion v) {
    static const FamilyTraits v4{
        IpVersion::V4, AF_INET, IPPROTO_ICMP,
        kIcmpEchoRequest, kIcmpEchoReply,
        kIpv4MinHeaderLen, "ttl"
    };
    // Raw ICMPv6 sockets never hand out the IPv6 header
    static const FamilyTraits v6{
        IpVersion::V6, AF_INET6, IPPROTO_ICMPV6,
        kIcmp6EchoRequest, kIcmp6EchoReply,
        0, "hlim"
    };
    return v == IpVersion::V6 ? v6 : v4;
}

} // namespace rping
