#pragma once

#include <stddef.h>
#include <stdint.h>

#include "pktcraft/visibility.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * C representation of the UDP header fields (host byte order).
 * Return codes follow the C convention (1=success, 0=failure).
 */
struct PktcraftUdpC {
    uint16_t source_port;
    uint16_t destination_port;
    uint16_t length;            /* Written as-is when trailer_len is 0 */
};

/**
 * Error codes reported through out_error.
 */
enum PktcraftErrorC {
    PKTCRAFT_OK = 0,
    PKTCRAFT_ERR_BUFFER_TOO_SMALL = 1,
    PKTCRAFT_ERR_ADDRESS_FAMILY_MISMATCH = 2,
    PKTCRAFT_ERR_INVALID_ARGUMENT = 3
};


// ---------------------------------------------------------------------------
// UDP LAYER
// ---------------------------------------------------------------------------
/**
 * Serialize an 8-byte UDP header into buf.
 *
 * trailer_len == 0 behaves like serialize() (length field taken from hdr);
 * otherwise like serialize_n() (length = 8 + trailer_len).
 *
 * out_size receives 8 + trailer_len; out_error one of PktcraftErrorC.
 * Both out parameters may be NULL.
 */
PKTCRAFT_API int pktcraft_udp_serialize(const char* src_ip,
                                        const char* dst_ip,
                                        const struct PktcraftUdpC* hdr,
                                        size_t trailer_len,
                                        uint8_t* buf,
                                        size_t buf_len,
                                        size_t* out_size,
                                        int* out_error);

/**
 * Write the one-line summary of a raw UDP header into out
 * (NUL-terminated, truncated to out_len).
 */
PKTCRAFT_API int pktcraft_udp_describe(const uint8_t* raw,
                                       size_t raw_len,
                                       char* out,
                                       size_t out_len);

/**
 * Verify the UDP checksum of a raw IPv4/IPv6 frame.
 * @return 1 if valid, 0 otherwise.
 */
PKTCRAFT_API int pktcraft_udp_checksum_valid(const uint8_t* frame,
                                             size_t frame_len);

#ifdef __cplusplus
}
#endif
