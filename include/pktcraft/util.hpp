#pragma once
#include <cstddef>
#include <cstdint>
#include "pktcraft/visibility.h"

namespace pktcraft {

/**
 * Compute a classic 16-bit Internet checksum (RFC 1071).
 *
 * Bytes are summed as big-endian words, so the result is the value of the
 * checksum field in host order (store it with store_be16()).
 *
 * @param data  Pointer to raw buffer
 * @param len   Buffer length in bytes
 * @return      One's-complement 16-bit checksum
 */
PKTCRAFT_API uint16_t checksum16(const void* data, size_t len);

/**
 * Add `len` bytes to a running one's-complement sum.
 *
 * The returned value is folded to 16 bits but not inverted, so several
 * regions (pseudo-header, header, payload) can be chained before
 * checksum_finish(). An odd trailing byte is padded with zero, so only the
 * last region of a chain may have an odd length.
 */
PKTCRAFT_API uint32_t checksum_accumulate(uint32_t sum, const void* data, size_t len);

/**
 * Fold carries and invert a running sum into the final checksum.
 */
PKTCRAFT_API uint16_t checksum_finish(uint32_t sum);

/**
 * Extend an already-finished checksum with `len` more bytes.
 * Used by outer layers that append a trailer after the checksum was written.
 */
PKTCRAFT_API uint16_t checksum_extend(uint16_t checksum, const void* data, size_t len);

// Big-endian load/store on unaligned byte buffers
inline uint16_t load_be16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

inline void store_be16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v & 0xFF);
}

inline void store_be32(uint8_t* p, uint32_t v) {
    store_be16(p, static_cast<uint16_t>(v >> 16));
    store_be16(p + 2, static_cast<uint16_t>(v & 0xFFFF));
}

} // namespace pktcraft
