#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "pktcraft/ip.hpp"
#include "pktcraft/layer.hpp"
#include "pktcraft/visibility.h"

namespace pktcraft {

constexpr size_t UDP_HEADER_LEN = 8;

/**
 * Raw UDP header as it appears on the wire (network byte order).
 * Keep this struct packed; parse() reads straight from it.
 */
#pragma pack(push, 1)
struct UdpWireHeader {
    uint16_t source;
    uint16_t dest;
    uint16_t len;       // Header + payload
    uint16_t check;     // Pseudo-header checksum
};
#pragma pack(pop)

static_assert(sizeof(UdpWireHeader) == UDP_HEADER_LEN, "UdpWireHeader must be packed");

/**
 * Logical UDP header fields (host byte order).
 */
struct UdpHeader {
    uint16_t source_port{0};
    uint16_t destination_port{0};
    uint16_t length{0};             // Declared length, written as-is by serialize()
    uint16_t checksum{0};           // Informational; recomputed on every serialization
    std::vector<uint8_t> payload;   // Never written by the layer itself
};

/**
 * UDP layer: header fields plus the enclosing IP addresses needed for the
 * pseudo-header checksum.
 *
 * Values are plain copies; serialization never mutates the layer, so one
 * instance can be serialized from several threads into distinct buffers.
 */
class PKTCRAFT_API Udp : public Layer {
public:
    Udp(UdpHeader header, IpAddress src, IpAddress dst);

    /**
     * Build a layer from a captured header.
     * Payload bytes after the header are dropped; the checksum is copied
     * but not verified.
     */
    static Udp parse(const UdpWireHeader& raw, const IpAddress& src, const IpAddress& dst);

    /**
     * Checked variant of parse() over a byte range.
     * @return std::nullopt if fewer than UDP_HEADER_LEN bytes are available.
     */
    static std::optional<Udp> from_bytes(const uint8_t* data, size_t len,
                                         const IpAddress& src, const IpAddress& dst);

    LayerKind type() const override;
    size_t size() const override;
    SerializeResult serialize(uint8_t* buf, size_t len) const override;
    SerializeResult serialize_n(size_t n, uint8_t* buf, size_t len) const override;

    /** "UDP: <src port> -> <dst port>, Length = <length>" */
    std::string describe() const override;

    const UdpHeader& header() const { return header_; }
    const IpAddress& source_address() const { return src_; }
    const IpAddress& destination_address() const { return dst_; }

private:
    SerializeResult write_header(uint8_t* buf, size_t len,
                                 uint16_t length, size_t total) const;

    UdpHeader header_;
    IpAddress src_;
    IpAddress dst_;
};

PKTCRAFT_API std::ostream& operator<<(std::ostream& os, const Udp& udp);

/**
 * One's-complement sum of the UDP pseudo-header (not inverted).
 *
 * IPv4: src(4) dst(4) zero(1) proto(1) length(2)
 * IPv6: src(16) dst(16) length(4) zero(3) next header(1)
 *
 * @return std::nullopt if the two addresses are of different families.
 */
PKTCRAFT_API std::optional<uint32_t> udp_pseudo_header_sum(const IpAddress& src,
                                                           const IpAddress& dst,
                                                           uint16_t udp_length);

} // namespace pktcraft
