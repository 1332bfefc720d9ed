#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "pktcraft/visibility.h"

namespace pktcraft {

/**
 * Protocol layers known to the toolkit.
 * Composition code switches on this tag when walking a packet.
 */
enum class LayerKind {
    Ethernet,
    Ipv4,
    Ipv6,
    Icmp,
    Tcp,
    Udp
};

/**
 * Display name of a layer kind ("UDP", "IPv4", ...).
 */
PKTCRAFT_API const char* to_string(LayerKind kind);

/**
 * Reasons a layer refuses to serialize.
 */
enum class LayerError {
    None,
    BufferTooSmall,         // Destination shorter than size()
    AddressFamilyMismatch   // Source/destination addresses differ in family
};

PKTCRAFT_API const char* to_string(LayerError err);

/**
 * Outcome of Layer::serialize() / Layer::serialize_n().
 */
struct SerializeResult {
    bool ok{false};                     // Header written with a valid checksum
    LayerError error{LayerError::None}; // Failure reason (None if ok)
    size_t size{0};                     // Logical bytes accounted for (header + trailer)
    std::string error_msg;              // Human readable detail (empty if ok)
};

/**
 * Contract shared by every protocol layer.
 *
 * A layer only ever writes its own header. Payload that follows it (the
 * trailer) belongs to the composing code, which announces its length via
 * serialize_n() so length and checksum fields can account for it.
 */
class PKTCRAFT_API Layer {
public:
    virtual ~Layer() = default;

    virtual LayerKind type() const = 0;

    /** Bytes this layer writes, excluding any payload. */
    virtual size_t size() const = 0;

    virtual SerializeResult serialize(uint8_t* buf, size_t len) const = 0;

    /**
     * Serialize, accounting for `n` trailer bytes the caller writes right
     * after this header. On success result.size is size() + n.
     */
    virtual SerializeResult serialize_n(size_t n, uint8_t* buf, size_t len) const = 0;

    /** One-line human readable summary. */
    virtual std::string describe() const = 0;
};

} // namespace pktcraft
