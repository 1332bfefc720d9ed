#include "pktcraft/layer.hpp"

namespace pktcraft {

const char* to_string(LayerKind kind) {
    switch (kind) {
        case LayerKind::Ethernet: return "Ethernet";
        case LayerKind::Ipv4:     return "IPv4";
        case LayerKind::Ipv6:     return "IPv6";
        case LayerKind::Icmp:     return "ICMP";
        case LayerKind::Tcp:      return "TCP";
        case LayerKind::Udp:      return "UDP";
    }
    return "Unknown";
}

const char* to_string(LayerError err) {
    switch (err) {
        case LayerError::None:                  return "None";
        case LayerError::BufferTooSmall:        return "BufferTooSmall";
        case LayerError::AddressFamilyMismatch: return "AddressFamilyMismatch";
    }
    return "Unknown";
}

} // namespace pktcraft
