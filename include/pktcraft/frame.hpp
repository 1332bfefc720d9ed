#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pktcraft/udp.hpp"
#include "pktcraft/visibility.h"

namespace pktcraft {

constexpr uint8_t DEFAULT_TTL = 64;

/**
 * A composed raw IP frame (IP header + UDP header + payload).
 */
struct FrameResult {
    bool ok{false};
    std::string error_msg;          // Empty if ok
    std::vector<uint8_t> bytes;     // Complete frame, LINKTYPE_RAW layout
};

/**
 * UDP layer recovered from a raw IP frame.
 */
struct DecodedFrame {
    Udp udp;                        // Header fields only (payload dropped)
    size_t payload_len{0};          // Bytes following the UDP header in the frame
};

/**
 * Compose a raw IP frame around `udp`, with `payload` as its trailer.
 *
 * The IP header family follows the layer's addresses. The UDP header is
 * written with serialize_n(payload.size()), then the payload bytes are
 * folded into its checksum so the frame carries a complete RFC 768 checksum
 * (a computed zero is sent as 0xFFFF).
 */
PKTCRAFT_API FrameResult build_frame(const Udp& udp, const std::vector<uint8_t>& payload);

/**
 * Decode a raw IPv4/IPv6 frame carrying UDP.
 * @return std::nullopt for truncated frames, other protocols, IPv6
 *         extension headers and non-first IPv4 fragments.
 */
PKTCRAFT_API std::optional<DecodedFrame> decode_frame(const uint8_t* data, size_t len);

/**
 * Verify the full UDP checksum (pseudo-header + header + payload) of a raw
 * IP frame. A zero checksum field is accepted on IPv4 ("not computed")
 * and rejected on IPv6.
 */
PKTCRAFT_API bool udp_checksum_valid(const uint8_t* data, size_t len);

} // namespace pktcraft
