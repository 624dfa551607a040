#pragma once
#include <cstddef>
#include <cstdint>

namespace rping {

/**
 * Compute a classic 16-bit Internet checksum (RFC 1071).
 *
 * @param data  Pointer to raw buffer
 * @param len   Buffer length in bytes
 * @return      One's-complement 16-bit checksum
 */
uint16_t checksum16(const void* data, size_t len);

/**
 * Little-endian 64-bit store/load used for the embedded send timestamp.
 * Independent of host byte order.
 */
void store_le64(uint8_t* dst, uint64_t v);
uint64_t load_le64(const uint8_t* src);

/**
 * Nanoseconds since the Unix epoch (wall clock). Both ends of an RTT
 * measurement are taken from this clock.
 */
int64_t unix_time_ns();

} // namespace rping
