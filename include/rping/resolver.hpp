#pragma once
#include <optional>
#include <string>
#include <sys/socket.h>

#include "rping/family.hpp"

namespace rping {

/**
 * A concrete destination produced by resolve().
 */
struct ResolvedAddress {
    std::string      ip;                 // Numeric form, as printed
    IpVersion        version{IpVersion::V4};
    sockaddr_storage addr{};             // Ready for connect()
    socklen_t        addr_len{0};
};

/**
 * Turn a host string into an address.
 *
 * A literal IPv4/IPv6 address is parsed first; otherwise a DNS lookup is
 * performed and the first returned address wins. IPv4-mapped IPv6 literals
 * are reported as IPv4.
 *
 * @return std::nullopt when the host is neither a literal nor resolvable.
 */
std::optional<ResolvedAddress> resolve(const std::string& host);

} // namespace rping
