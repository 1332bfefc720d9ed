#include "pktcraft/ip.hpp"

#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace pktcraft {

std::optional<IpAddress> parse_ip_address(const std::string& text) {
    in_addr v4{};
    if (inet_pton(AF_INET, text.c_str(), &v4) == 1) {
        Ipv4Address addr;
        std::memcpy(addr.octets.data(), &v4, addr.octets.size());
        return IpAddress{addr};
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, text.c_str(), &v6) == 1) {
        Ipv6Address addr;
        std::memcpy(addr.octets.data(), &v6, addr.octets.size());
        return IpAddress{addr};
    }

    return std::nullopt;
}


std::string to_string(const IpAddress& addr) {
    char buf[INET6_ADDRSTRLEN] = {};

    if (const auto* v4 = std::get_if<Ipv4Address>(&addr)) {
        if (!inet_ntop(AF_INET, v4->octets.data(), buf, sizeof(buf)))
            return {};
    } else {
        const auto& v6 = std::get<Ipv6Address>(addr);
        if (!inet_ntop(AF_INET6, v6.octets.data(), buf, sizeof(buf)))
            return {};
    }

    return buf;
}


std::optional<Endpoint> parse_endpoint(const std::string& text) {
    std::string host;
    std::string port;

    if (!text.empty() && text[0] == '[') {
        // [v6]:port
        auto close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':')
            return std::nullopt;
        host = text.substr(1, close - 1);
        port = text.substr(close + 2);
    } else {
        // v4:port (a bare v6 address would contain more than one ':')
        auto colon = text.find(':');
        if (colon == std::string::npos || text.find(':', colon + 1) != std::string::npos)
            return std::nullopt;
        host = text.substr(0, colon);
        port = text.substr(colon + 1);
    }

    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string::npos)
        return std::nullopt;

    unsigned long value = std::stoul(port);
    if (value > 65535)
        return std::nullopt;

    auto addr = parse_ip_address(host);
    if (!addr)
        return std::nullopt;

    // "[10.0.0.1]:53" is rejected; brackets are reserved for IPv6
    if (text[0] == '[' && is_v4(*addr))
        return std::nullopt;

    Endpoint ep{*addr, static_cast<uint16_t>(value)};
    return ep;
}

} // namespace pktcraft
