/**
 * Host resolution: literal parse first, DNS second.
 */

#include "rping/resolver.hpp"
#include "rping/log.hpp"

#include <cstring>
#include <memory>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>

namespace rping {

namespace {

ResolvedAddress from_ipv4(const in_addr& a) {
    ResolvedAddress out{};
    out.version = IpVersion::V4;

    auto* sin = reinterpret_cast<sockaddr_in*>(&out.addr);
    sin->sin_family = AF_INET;
    sin->sin_addr   = a;
    out.addr_len    = sizeof(sockaddr_in);

    char buf[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &a, buf, sizeof(buf));
    out.ip = buf;
    return out;
}

ResolvedAddress from_ipv6(const sockaddr_in6& src) {
    // ::ffff:a.b.c.d is an IPv4 destination
    if (IN6_IS_ADDR_V4MAPPED(&src.sin6_addr)) {
        in_addr a{};
        std::memcpy(&a, src.sin6_addr.s6_addr + 12, sizeof(a));
        return from_ipv4(a);
    }

    ResolvedAddress out{};
    out.version = IpVersion::V6;

    auto* sin6 = reinterpret_cast<sockaddr_in6*>(&out.addr);
    *sin6 = src;
    sin6->sin6_family = AF_INET6;
    sin6->sin6_port   = 0;
    out.addr_len      = sizeof(sockaddr_in6);

    char buf[INET6_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET6, &src.sin6_addr, buf, sizeof(buf));
    out.ip = buf;
    return out;
}

struct AddrInfoDeleter {
    void operator()(addrinfo* ai) const { ::freeaddrinfo(ai); }
};

} // namespace

std::optional<ResolvedAddress> resolve(const std::string& host) {
    if (host.empty())
        return std::nullopt;

    // ---------------------------------------------------------------------
    // Literal addresses
    // ---------------------------------------------------------------------
    in_addr a4{};
    if (::inet_pton(AF_INET, host.c_str(), &a4) == 1)
        return from_ipv4(a4);

    sockaddr_in6 a6{};
    if (::inet_pton(AF_INET6, host.c_str(), &a6.sin6_addr) == 1)
        return from_ipv6(a6);

    // ---------------------------------------------------------------------
    // DNS lookup, first answer wins
    // ---------------------------------------------------------------------
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_RAW;

    addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw);
    if (rc != 0 || !raw) {
        log(LogLevel::DEBUG, "getaddrinfo(" + host + "): " + ::gai_strerror(rc));
        return std::nullopt;
    }
    std::unique_ptr<addrinfo, AddrInfoDeleter> list(raw);

    for (const addrinfo* ai = list.get(); ai; ai = ai->ai_next) {
        if (ai->ai_family == AF_INET && ai->ai_addr) {
            return from_ipv4(reinterpret_cast<const sockaddr_in*>(ai->ai_addr)->sin_addr);
        }
        if (ai->ai_family == AF_INET6 && ai->ai_addr) {
            return from_ipv6(*reinterpret_cast<const sockaddr_in6*>(ai->ai_addr));
        }
    }

    return std::nullopt;
}

} // namespace rping
