#include "rping/util.hpp"

#include <chrono>
#include <cstring>

namespace rping {

/**
 * Compute the standard Internet checksum (RFC 1071).
 *
 * Used for ICMP Echo Requests over IPv4. ICMPv6 checksums cover a
 * pseudo-header and are left to the kernel.
 *
 * This is the classic 16-bit one's-complement sum:
 *   - sum words
 *   - fold carries
 *   - invert result
 */
uint16_t checksum16(const void* data, size_t len) {
    uint32_t sum = 0;
    const uint8_t* p = static_cast<const uint8_t*>(data);

    // Sum 16-bit chunks (host order; the folded sum is order independent)
    while (len > 1) {
        uint16_t word;
        std::memcpy(&word, p, sizeof(word));
        sum += word;
        p += 2;
        len -= 2;
    }

    // Handle remaining odd byte
    if (len) {
        uint16_t word = 0;
        std::memcpy(&word, p, 1);
        sum += word;
    }

    // Fold carries
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

void store_le64(uint8_t* dst, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        dst[i] = static_cast<uint8_t>(v >> (8 * i));
    }
}

uint64_t load_le64(const uint8_t* src) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(src[i]) << (8 * i);
    }
    return v;
}

int64_t unix_time_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace rping
