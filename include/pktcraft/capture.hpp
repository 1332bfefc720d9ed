#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pktcraft/udp.hpp"
#include "pktcraft/visibility.h"

namespace pktcraft {

/**
 * A UDP datagram found in a capture file.
 */
struct CapturedDatagram {
    size_t frame_index{0};      // 0-based record number in the file
    Udp udp;                    // Header fields only (payload dropped)
    size_t payload_len{0};      // Payload bytes present after the header
    bool checksum_ok{false};    // Full RFC 768 checksum verified
};

/**
 * Result of read_capture().
 */
struct CaptureReadResult {
    bool ok{false};
    std::string error_msg;                  // Empty if ok
    size_t frames_seen{0};                  // Records read, UDP or not
    std::vector<CapturedDatagram> datagrams;
};

/**
 * Result of write_capture().
 */
struct CaptureWriteResult {
    bool ok{false};
    std::string error_msg;
    size_t written{0};
};

/**
 * Read every UDP datagram from an offline .pcap file.
 *
 * Supported link types: Ethernet (with at most one 802.1Q tag), raw IP,
 * BSD loopback (DLT_NULL) and Linux cooked capture (DLT_LINUX_SLL).
 * Non-UDP records are counted in frames_seen and skipped.
 */
PKTCRAFT_API CaptureReadResult read_capture(const std::string& path);

/**
 * Write raw IP frames (as produced by build_frame()) to a .pcap file
 * with link type RAW. An existing file is overwritten.
 */
PKTCRAFT_API CaptureWriteResult write_capture(const std::string& path,
                                              const std::vector<std::vector<uint8_t>>& frames);

} // namespace pktcraft
