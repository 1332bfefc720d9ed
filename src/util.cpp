#include "pktcraft/util.hpp"

namespace pktcraft {

/**
 * Running one's-complement sum over big-endian 16-bit words.
 *
 * Used for:
 *   - IPv4 header checksums
 *   - UDP pseudo-header + header sums
 *   - trailer payload folded in by the frame composer
 */
uint32_t checksum_accumulate(uint32_t sum, const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);

    // Sum 16-bit chunks
    while (len > 1) {
        sum += static_cast<uint32_t>((p[0] << 8) | p[1]);
        p += 2;
        len -= 2;

        // Keep headroom for 64 KiB regions
        if (sum & 0x80000000u)
            sum = (sum & 0xFFFF) + (sum >> 16);
    }

    // Handle remaining odd byte (padded on the right)
    if (len) {
        sum += static_cast<uint32_t>(p[0] << 8);
    }

    // Fold carries
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return sum;
}


uint16_t checksum_finish(uint32_t sum) {
    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum);
}


/**
 * Compute the standard Internet checksum (RFC 1071):
 *   - sum words
 *   - fold carries
 *   - invert result
 */
uint16_t checksum16(const void* data, size_t len) {
    return checksum_finish(checksum_accumulate(0, data, len));
}


uint16_t checksum_extend(uint16_t checksum, const void* data, size_t len) {
    // Undo the final inversion to recover the folded sum
    uint32_t sum = static_cast<uint16_t>(~checksum);
    return checksum_finish(checksum_accumulate(sum, data, len));
}

} // namespace pktcraft
