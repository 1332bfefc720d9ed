/**
 * Raw IP frame composition around a UDP layer.
 *
 * This is the "outer composition layer" for UDP:
 *   - writes the IPv4 or IPv6 header
 *   - lets the UDP layer write its header via serialize_n()
 *   - appends the trailer and folds it into the UDP checksum
 *
 * Decoding goes the other way and recovers a Udp layer from a frame.
 */

#include "pktcraft/frame.hpp"
#include "pktcraft/util.hpp"

#include <algorithm>
#include <cstring>

#include <arpa/inet.h>

#ifdef PKTCRAFT_DEBUG
#include <iostream>
#endif

namespace pktcraft {

namespace {

constexpr size_t MAX_IP_TOTAL_LEN = 65535;
constexpr uint16_t IP_FLAG_DF = 0x4000;
constexpr uint16_t IP_FRAG_OFFSET_MASK = 0x1FFF;

// Where the UDP bytes of a frame live, and the addresses around them
struct UdpView {
    IpAddress src;
    IpAddress dst;
    const uint8_t* data{nullptr};
    size_t len{0};
};

// ============================================================================
// Helper: locate the UDP portion of a raw IPv4/IPv6 frame
// ============================================================================
std::optional<UdpView> locate_udp(const uint8_t* data, size_t len) {
    if (!data || len == 0)
        return std::nullopt;

    const uint8_t version = data[0] >> 4;

    if (version == 4) {
        if (len < sizeof(IpHeader))
            return std::nullopt;

        IpHeader ip{};
        std::memcpy(&ip, data, sizeof(ip));

        const size_t ihl = size_t(ip.ver_ihl & 0x0F) * 4;
        if (ihl < sizeof(IpHeader) || len < ihl)
            return std::nullopt;
        if (ip.protocol != IP_PROTO_UDP)
            return std::nullopt;
        if (ntohs(ip.frag_off) & IP_FRAG_OFFSET_MASK)
            return std::nullopt; // later fragment, no UDP header here

        // Trust tot_len when it fits inside the capture (drops link padding)
        size_t end = ntohs(ip.tot_len);
        if (end < ihl || end > len)
            end = len;

        Ipv4Address s, d;
        std::memcpy(s.octets.data(), &ip.saddr, 4);
        std::memcpy(d.octets.data(), &ip.daddr, 4);

        return UdpView{s, d, data + ihl, end - ihl};
    }

    if (version == 6) {
        if (len < sizeof(Ipv6Header))
            return std::nullopt;

        Ipv6Header ip{};
        std::memcpy(&ip, data, sizeof(ip));

        if (ip.next_header != IP_PROTO_UDP)
            return std::nullopt;

        size_t end = sizeof(Ipv6Header) + ntohs(ip.payload_len);
        if (end > len)
            end = len;

        Ipv6Address s, d;
        std::memcpy(s.octets.data(), ip.saddr, 16);
        std::memcpy(d.octets.data(), ip.daddr, 16);

        return UdpView{s, d, data + sizeof(Ipv6Header), end - sizeof(Ipv6Header)};
    }

#ifdef PKTCRAFT_DEBUG
    std::cerr << "[DBG] unsupported IP version " << int(version) << "\n";
#endif
    return std::nullopt;
}


// ============================================================================
// Helper: network-layer headers
// ============================================================================
void write_ipv4_header(uint8_t* out, const Ipv4Address& src,
                       const Ipv4Address& dst, size_t total_len)
{
    IpHeader ip{};
    ip.ver_ihl  = 0x45;
    ip.tos      = 0;
    ip.tot_len  = htons(static_cast<uint16_t>(total_len));
    ip.id       = 0;
    ip.frag_off = htons(IP_FLAG_DF);
    ip.ttl      = DEFAULT_TTL;
    ip.protocol = IP_PROTO_UDP;
    ip.check    = 0;
    std::memcpy(&ip.saddr, src.octets.data(), 4);
    std::memcpy(&ip.daddr, dst.octets.data(), 4);

    ip.check = htons(checksum16(&ip, sizeof(ip)));
    std::memcpy(out, &ip, sizeof(ip));
}

void write_ipv6_header(uint8_t* out, const Ipv6Address& src,
                       const Ipv6Address& dst, size_t payload_len)
{
    Ipv6Header ip{};
    ip.ver_tc_flow = htonl(6u << 28);
    ip.payload_len = htons(static_cast<uint16_t>(payload_len));
    ip.next_header = IP_PROTO_UDP;
    ip.hop_limit   = DEFAULT_TTL;
    std::memcpy(ip.saddr, src.octets.data(), 16);
    std::memcpy(ip.daddr, dst.octets.data(), 16);

    std::memcpy(out, &ip, sizeof(ip));
}

} // namespace


FrameResult build_frame(const Udp& udp, const std::vector<uint8_t>& payload) {
    FrameResult res{};

    const bool v4 = is_v4(udp.source_address());
    const size_t ip_len = v4 ? IPV4_HEADER_LEN : IPV6_HEADER_LEN;

    // IPv4 counts its own header in tot_len; IPv6 only counts the payload
    const size_t max_payload = MAX_IP_TOTAL_LEN - udp.size() - (v4 ? ip_len : 0);
    if (payload.size() > max_payload) {
        res.error_msg = "payload too large (" + std::to_string(payload.size()) +
                        " > " + std::to_string(max_payload) + " bytes)";
        return res;
    }

    std::vector<uint8_t> frame(ip_len + udp.size() + payload.size(), 0);
    uint8_t* l4 = frame.data() + ip_len;

    // Transport header first: it validates the address families for us
    auto sr = udp.serialize_n(payload.size(), l4, frame.size() - ip_len);
    if (!sr.ok) {
#ifdef PKTCRAFT_DEBUG
        std::cerr << "[ERR] UDP serialize failed: " << sr.error_msg << "\n";
#endif
        res.error_msg = sr.error_msg;
        return res;
    }

    if (v4) {
        write_ipv4_header(frame.data(),
                          std::get<Ipv4Address>(udp.source_address()),
                          std::get<Ipv4Address>(udp.destination_address()),
                          frame.size());
    } else {
        write_ipv6_header(frame.data(),
                          std::get<Ipv6Address>(udp.source_address()),
                          std::get<Ipv6Address>(udp.destination_address()),
                          sr.size);
    }

    // Trailer, and its share of the UDP checksum
    if (!payload.empty()) {
        std::copy(payload.begin(), payload.end(), l4 + udp.size());
        store_be16(l4 + 6, checksum_extend(load_be16(l4 + 6),
                                           payload.data(), payload.size()));
    }

    // RFC 768: a computed zero goes on the wire as all ones
    if (load_be16(l4 + 6) == 0)
        store_be16(l4 + 6, 0xFFFF);

    res.ok = true;
    res.bytes = std::move(frame);
    return res;
}


std::optional<DecodedFrame> decode_frame(const uint8_t* data, size_t len) {
    auto view = locate_udp(data, len);
    if (!view)
        return std::nullopt;

    auto udp = Udp::from_bytes(view->data, view->len, view->src, view->dst);
    if (!udp)
        return std::nullopt;

    return DecodedFrame{*udp, view->len - UDP_HEADER_LEN};
}


bool udp_checksum_valid(const uint8_t* data, size_t len) {
    auto view = locate_udp(data, len);
    if (!view || view->len < UDP_HEADER_LEN)
        return false;

    const uint16_t udp_len = load_be16(view->data + 4);
    const uint16_t check   = load_be16(view->data + 6);

    // Zero means "not computed" on IPv4 and is never legal on IPv6
    if (check == 0)
        return is_v4(view->src);

    if (udp_len < UDP_HEADER_LEN || udp_len > view->len)
        return false;

    auto sum = udp_pseudo_header_sum(view->src, view->dst, udp_len);
    if (!sum)
        return false;

    return checksum_finish(checksum_accumulate(*sum, view->data, udp_len)) == 0;
}

} // namespace pktcraft
