#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include "pktcraft/visibility.h"

namespace pktcraft {

constexpr uint8_t IP_PROTO_UDP = 17;

constexpr size_t IPV4_HEADER_LEN = 20;
constexpr size_t IPV6_HEADER_LEN = 40;

/**
 * Minimal IPv4 header representation (network byte order).
 * Used to compose and decode raw IP frames around a UDP layer.
 *
 * Note: This struct must remain packed to match wire format.
 */
#pragma pack(push, 1)
struct IpHeader {
    uint8_t  ver_ihl;   // Version (4 bits) + IHL (4 bits)
    uint8_t  tos;
    uint16_t tot_len;
    uint16_t id;
    uint16_t frag_off;  // Flags (3 bits) + fragment offset (13 bits)
    uint8_t  ttl;
    uint8_t  protocol;  // 17 = UDP
    uint16_t check;
    uint32_t saddr;
    uint32_t daddr;
};

/**
 * Fixed IPv6 header (network byte order). Extension headers are not modeled.
 */
struct Ipv6Header {
    uint32_t ver_tc_flow;   // Version (4) + traffic class (8) + flow label (20)
    uint16_t payload_len;   // Everything after this fixed header
    uint8_t  next_header;   // 17 = UDP
    uint8_t  hop_limit;
    uint8_t  saddr[16];
    uint8_t  daddr[16];
};
#pragma pack(pop)

static_assert(sizeof(IpHeader) == IPV4_HEADER_LEN, "IpHeader must be packed");
static_assert(sizeof(Ipv6Header) == IPV6_HEADER_LEN, "Ipv6Header must be packed");

/**
 * IPv4 / IPv6 addresses, octets in network order.
 */
struct Ipv4Address {
    std::array<uint8_t, 4> octets{};
};

struct Ipv6Address {
    std::array<uint8_t, 16> octets{};
};

inline bool operator==(const Ipv4Address& a, const Ipv4Address& b) { return a.octets == b.octets; }
inline bool operator!=(const Ipv4Address& a, const Ipv4Address& b) { return !(a == b); }
inline bool operator==(const Ipv6Address& a, const Ipv6Address& b) { return a.octets == b.octets; }
inline bool operator!=(const Ipv6Address& a, const Ipv6Address& b) { return !(a == b); }

/**
 * Network-layer address of either family.
 * The UDP layer carries two of these for its pseudo-header checksum.
 */
using IpAddress = std::variant<Ipv4Address, Ipv6Address>;

inline bool is_v4(const IpAddress& addr) {
    return std::holds_alternative<Ipv4Address>(addr);
}

inline bool same_family(const IpAddress& a, const IpAddress& b) {
    return a.index() == b.index();
}

/**
 * Parse textual IPv4 ("10.0.0.1") or IPv6 ("fe80::1") notation.
 * @return std::nullopt if the text is neither.
 */
PKTCRAFT_API std::optional<IpAddress> parse_ip_address(const std::string& text);

/**
 * Format an address in its canonical textual form.
 */
PKTCRAFT_API std::string to_string(const IpAddress& addr);

/**
 * Address plus transport port, as given on the command line.
 */
struct Endpoint {
    IpAddress address;
    uint16_t  port{0};
};

/**
 * Parse "<ipv4>:<port>" or "[<ipv6>]:<port>".
 * @return std::nullopt on malformed text or a port outside 0..65535.
 */
PKTCRAFT_API std::optional<Endpoint> parse_endpoint(const std::string& text);

} // namespace pktcraft
