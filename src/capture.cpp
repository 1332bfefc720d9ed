/**
 * Offline libpcap helpers.
 *
 * Responsibilities:
 * - Open a saved capture and walk its records
 * - Strip the link-layer header so frame decoding sees raw IP
 * - Dump composed frames into a new capture (LINKTYPE_RAW)
 *
 * Live capture and injection are intentionally not supported.
 */

#include "pktcraft/capture.hpp"
#include "pktcraft/frame.hpp"
#include "pktcraft/util.hpp"

#include <pcap.h>

#include <algorithm>
#include <chrono>
#include <optional>

#ifdef PKTCRAFT_DEBUG
#include <iostream>
#endif

namespace pktcraft {

namespace {

constexpr int SNAPLEN = 65535;

constexpr size_t ETHER_LEN     = 14;
constexpr size_t VLAN_TAG_LEN  = 4;
constexpr size_t NULL_LEN      = 4;
constexpr size_t SLL_LEN       = 16;

constexpr uint16_t ETHERTYPE_IPV4 = 0x0800;
constexpr uint16_t ETHERTYPE_IPV6 = 0x86DD;
constexpr uint16_t ETHERTYPE_VLAN = 0x8100;

/**
 * Small RAII wrapper for pcap handles.
 */
struct Capture {
    pcap_t* h{nullptr};
    ~Capture() { if (h) pcap_close(h); }
};

/**
 * Same for savefile writers. Declared after Capture so it closes first.
 */
struct Dumper {
    pcap_dumper_t* d{nullptr};
    ~Dumper() { if (d) pcap_dump_close(d); }
};

bool is_ip_ethertype(uint16_t type) {
    return type == ETHERTYPE_IPV4 || type == ETHERTYPE_IPV6;
}

// ============================================================================
// Helper: offset of the IP header for a given link type
// Returns std::nullopt for records that cannot carry IP.
// ============================================================================
std::optional<size_t> ip_offset(int linktype, const u_char* data, size_t caplen) {
    switch (linktype) {
        case DLT_EN10MB: {
            if (caplen < ETHER_LEN)
                return std::nullopt;

            uint16_t type = load_be16(data + 12);
            size_t off = ETHER_LEN;

            if (type == ETHERTYPE_VLAN) {
                if (caplen < ETHER_LEN + VLAN_TAG_LEN)
                    return std::nullopt;
                type = load_be16(data + 16);
                off += VLAN_TAG_LEN;
            }

            if (!is_ip_ethertype(type))
                return std::nullopt;
            return off;
        }

        case DLT_RAW:
#ifdef DLT_IPV4
        case DLT_IPV4:
#endif
#ifdef DLT_IPV6
        case DLT_IPV6:
#endif
            return size_t{0};

        case DLT_NULL:
            // 4-byte address family in the writer's byte order; the IP
            // version nibble is checked by decode_frame()
            if (caplen < NULL_LEN)
                return std::nullopt;
            return NULL_LEN;

        case DLT_LINUX_SLL:
            if (caplen < SLL_LEN || !is_ip_ethertype(load_be16(data + 14)))
                return std::nullopt;
            return SLL_LEN;

        default:
            return std::nullopt;
    }
}

bool supported_linktype(int linktype) {
    switch (linktype) {
        case DLT_EN10MB:
        case DLT_RAW:
        case DLT_NULL:
        case DLT_LINUX_SLL:
#ifdef DLT_IPV4
        case DLT_IPV4:
#endif
#ifdef DLT_IPV6
        case DLT_IPV6:
#endif
            return true;
        default:
            return false;
    }
}

} // namespace


// ============================================================================
// Reader
// ============================================================================
CaptureReadResult read_capture(const std::string& path) {
    CaptureReadResult res{};
    char errbuf[PCAP_ERRBUF_SIZE] = {};

    Capture cap;
    cap.h = pcap_open_offline(path.c_str(), errbuf);
    if (!cap.h) {
#ifdef PKTCRAFT_DEBUG
        std::cerr << "[ERR] pcap_open_offline failed: " << errbuf << "\n";
#endif
        res.error_msg = errbuf;
        return res;
    }

    const int linktype = pcap_datalink(cap.h);
    if (!supported_linktype(linktype)) {
        const char* name = pcap_datalink_val_to_name(linktype);
        res.error_msg = std::string("unsupported link type: ") +
                        (name ? std::string(name) : std::to_string(linktype));
        return res;
    }

#ifdef PKTCRAFT_DEBUG
    std::cout << "[DBG] " << path << ": link type " << linktype << "\n";
#endif

    for (;;) {
        pcap_pkthdr* h = nullptr;
        const u_char* data = nullptr;

        int r = pcap_next_ex(cap.h, &h, &data);
        if (r == -2)
            break; // end of file
        if (r == -1) {
            res.error_msg = pcap_geterr(cap.h);
            return res;
        }
        if (r == 0 || !h || !data)
            continue;

        const size_t index = res.frames_seen++;

#ifdef PKTCRAFT_DEBUG
        if (h->caplen < h->len) {
            std::cerr << "[WRN] record " << index << " truncated ("
                      << h->caplen << "/" << h->len << " bytes)\n";
        }
#endif

        auto off = ip_offset(linktype, data, h->caplen);
        if (!off)
            continue;

        const uint8_t* ip = data + *off;
        const size_t ip_len = h->caplen - *off;

        auto decoded = decode_frame(ip, ip_len);
        if (!decoded)
            continue;

        res.datagrams.push_back(CapturedDatagram{
            index,
            decoded->udp,
            decoded->payload_len,
            udp_checksum_valid(ip, ip_len)
        });
    }

    res.ok = true;
    return res;
}


// ============================================================================
// Writer
// ============================================================================
CaptureWriteResult write_capture(const std::string& path,
                                 const std::vector<std::vector<uint8_t>>& frames)
{
    CaptureWriteResult res{};

    Capture cap;
    cap.h = pcap_open_dead(DLT_RAW, SNAPLEN);
    if (!cap.h) {
        res.error_msg = "pcap_open_dead failed";
        return res;
    }

    Dumper out;
    out.d = pcap_dump_open(cap.h, path.c_str());
    if (!out.d) {
#ifdef PKTCRAFT_DEBUG
        std::cerr << "[ERR] pcap_dump_open failed: " << pcap_geterr(cap.h) << "\n";
#endif
        res.error_msg = pcap_geterr(cap.h);
        return res;
    }

    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto usec = std::chrono::duration_cast<std::chrono::microseconds>(now).count();

    for (const auto& frame : frames) {
        pcap_pkthdr hdr{};
        hdr.ts.tv_sec  = static_cast<decltype(hdr.ts.tv_sec)>(usec / 1000000);
        hdr.ts.tv_usec = static_cast<decltype(hdr.ts.tv_usec)>(usec % 1000000);
        hdr.caplen = static_cast<bpf_u_int32>(std::min<size_t>(frame.size(), SNAPLEN));
        hdr.len    = static_cast<bpf_u_int32>(frame.size());

        pcap_dump(reinterpret_cast<u_char*>(out.d), &hdr, frame.data());
        res.written++;
    }

    if (pcap_dump_flush(out.d) != 0) {
        res.error_msg = "failed to flush " + path;
        return res;
    }

    res.ok = true;
    return res;
}

} // namespace pktcraft
