#include "pktcraft/udp.hpp"
#include "pktcraft/util.hpp"

#include <cstring>
#include <sstream>
#include <type_traits>
#include <utility>

#include <arpa/inet.h>

namespace pktcraft {

namespace {

// ============================================================================
// Pseudo-header sum for an N-byte address family
// ============================================================================
template <size_t N>
uint32_t pseudo_header_sum(const std::array<uint8_t, N>& src,
                           const std::array<uint8_t, N>& dst,
                           uint16_t udp_length)
{
    static_assert(N == 4 || N == 16, "IPv4 or IPv6 addresses only");

    uint32_t sum = 0;
    sum = checksum_accumulate(sum, src.data(), N);
    sum = checksum_accumulate(sum, dst.data(), N);

    if constexpr (N == 4) {
        // zero, protocol, 16-bit length
        uint8_t tail[4] = {0, IP_PROTO_UDP, 0, 0};
        store_be16(tail + 2, udp_length);
        sum = checksum_accumulate(sum, tail, sizeof(tail));
    } else {
        // 32-bit length, three zero bytes, next header
        uint8_t tail[8] = {0, 0, 0, 0, 0, 0, 0, IP_PROTO_UDP};
        store_be32(tail, udp_length);
        sum = checksum_accumulate(sum, tail, sizeof(tail));
    }

    return sum;
}

} // namespace


std::optional<uint32_t> udp_pseudo_header_sum(const IpAddress& src,
                                               const IpAddress& dst,
                                               uint16_t udp_length)
{
    if (!same_family(src, dst))
        return std::nullopt;

    return std::visit([&](const auto& s) -> uint32_t {
        using Addr = std::decay_t<decltype(s)>;
        const auto& d = std::get<Addr>(dst);
        return pseudo_header_sum(s.octets, d.octets, udp_length);
    }, src);
}


// ============================================================================
// Construction
// ============================================================================
Udp::Udp(UdpHeader header, IpAddress src, IpAddress dst)
    : header_(std::move(header)), src_(std::move(src)), dst_(std::move(dst)) {}


Udp Udp::parse(const UdpWireHeader& raw, const IpAddress& src, const IpAddress& dst) {
    UdpHeader h{};
    h.source_port      = ntohs(raw.source);
    h.destination_port = ntohs(raw.dest);
    h.length           = ntohs(raw.len);
    h.checksum         = ntohs(raw.check);
    // payload intentionally left empty

    return Udp(std::move(h), src, dst);
}


std::optional<Udp> Udp::from_bytes(const uint8_t* data, size_t len,
                                   const IpAddress& src, const IpAddress& dst)
{
    if (!data || len < UDP_HEADER_LEN)
        return std::nullopt;

    UdpWireHeader raw{};
    std::memcpy(&raw, data, sizeof(raw));
    return parse(raw, src, dst);
}


// ============================================================================
// Layer contract
// ============================================================================
LayerKind Udp::type() const {
    return LayerKind::Udp;
}

size_t Udp::size() const {
    return UDP_HEADER_LEN;
}

SerializeResult Udp::serialize(uint8_t* buf, size_t len) const {
    return write_header(buf, len, header_.length, size());
}

SerializeResult Udp::serialize_n(size_t n, uint8_t* buf, size_t len) const {
    // The 16-bit field wraps for n > 65527; the returned size does not
    const size_t total = size() + n;
    return write_header(buf, len, static_cast<uint16_t>(total), total);
}


/**
 * Writes the four header fields, then replaces the checksum placeholder
 * with the pseudo-header checksum computed over `length`.
 */
SerializeResult Udp::write_header(uint8_t* buf, size_t len,
                                  uint16_t length, size_t total) const
{
    SerializeResult res{};

    if (!buf || len < size()) {
        res.error = LayerError::BufferTooSmall;
        res.error_msg = "buffer is too small";
        return res;
    }

    store_be16(buf + 0, header_.source_port);
    store_be16(buf + 2, header_.destination_port);
    store_be16(buf + 4, length);
    store_be16(buf + 6, 0);

    auto pseudo = udp_pseudo_header_sum(src_, dst_, length);
    if (!pseudo) {
        res.error = LayerError::AddressFamilyMismatch;
        res.error_msg = "source and destination IP versions do not match";
        return res;
    }

    uint32_t sum = checksum_accumulate(*pseudo, buf, UDP_HEADER_LEN);
    store_be16(buf + 6, checksum_finish(sum));

    res.ok = true;
    res.size = total;
    return res;
}


std::string Udp::describe() const {
    std::ostringstream oss;
    oss << to_string(type()) << ": "
        << header_.source_port << " -> " << header_.destination_port
        << ", Length = " << header_.length;
    return oss.str();
}


std::ostream& operator<<(std::ostream& os, const Udp& udp) {
    return os << udp.describe();
}

} // namespace pktcraft
