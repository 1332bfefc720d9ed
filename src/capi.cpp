/**
 * C API wrapper for pktcraft (C++ backend).
 *
 * Exposes a stable C ABI for the UDP layer so C projects and foreign
 * language bindings can build and inspect headers without C++ types.
 */

#include "pktcraft_capi.h"
#include "pktcraft/frame.hpp"
#include "pktcraft/udp.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

using namespace pktcraft;

// ---------------------------------------------------------------------------
// Conversion helpers
// ---------------------------------------------------------------------------
static int to_error_code(LayerError err) {
    switch (err) {
        case LayerError::None:                  return PKTCRAFT_OK;
        case LayerError::BufferTooSmall:        return PKTCRAFT_ERR_BUFFER_TOO_SMALL;
        case LayerError::AddressFamilyMismatch: return PKTCRAFT_ERR_ADDRESS_FAMILY_MISMATCH;
    }
    return PKTCRAFT_ERR_INVALID_ARGUMENT;
}

static void set_error(int* out_error, int code) {
    if (out_error) *out_error = code;
}


// ---------------------------------------------------------------------------
// C API implementation
// ---------------------------------------------------------------------------
extern "C" {

PKTCRAFT_API int pktcraft_udp_serialize(const char* src_ip,
                                        const char* dst_ip,
                                        const struct PktcraftUdpC* hdr,
                                        size_t trailer_len,
                                        uint8_t* buf,
                                        size_t buf_len,
                                        size_t* out_size,
                                        int* out_error)
{
    if (!src_ip || !dst_ip || !hdr) {
        set_error(out_error, PKTCRAFT_ERR_INVALID_ARGUMENT);
        return 0;
    }

    auto src = parse_ip_address(src_ip);
    auto dst = parse_ip_address(dst_ip);
    if (!src || !dst) {
        set_error(out_error, PKTCRAFT_ERR_INVALID_ARGUMENT);
        return 0;
    }

    UdpHeader h{};
    h.source_port      = hdr->source_port;
    h.destination_port = hdr->destination_port;
    h.length           = hdr->length;

    Udp udp(std::move(h), *src, *dst);

    SerializeResult r = (trailer_len == 0)
        ? udp.serialize(buf, buf_len)
        : udp.serialize_n(trailer_len, buf, buf_len);

    set_error(out_error, to_error_code(r.error));
    if (!r.ok)
        return 0;

    if (out_size) *out_size = udp.size() + trailer_len;
    return 1;
}


PKTCRAFT_API int pktcraft_udp_describe(const uint8_t* raw,
                                       size_t raw_len,
                                       char* out,
                                       size_t out_len)
{
    if (!raw || !out || out_len == 0) return 0;

    // Addresses do not show up in the summary line
    const IpAddress any = Ipv4Address{};
    auto udp = Udp::from_bytes(raw, raw_len, any, any);
    if (!udp) return 0;

    std::string line = udp->describe();
    size_t n = std::min(line.size(), out_len - 1);
    std::memcpy(out, line.data(), n);
    out[n] = '\0';
    return 1;
}


PKTCRAFT_API int pktcraft_udp_checksum_valid(const uint8_t* frame,
                                             size_t frame_len)
{
    if (!frame) return 0;
    return udp_checksum_valid(frame, frame_len) ? 1 : 0;
}

} // extern "C"
