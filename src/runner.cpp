/**
 * Runner: executes pktcraft sub-commands.
 *
 * This module handles:
 * - craft: endpoint parsing, frame composition, hex dump, optional capture
 * - read:  capture decoding and per-datagram summary lines
 * - terminal color setup and exit codes
 *
 * The packet logic itself lives in the pktcraft library.
 */

#include "runner.hpp"
#include "pktcraft/capture.hpp"
#include "pktcraft/frame.hpp"
#include "pktcraft/ip.hpp"
#include "pktcraft/udp.hpp"
#include "terminal.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

using namespace pktcraft;

/**
 * Hex dump, 16 bytes per line with an offset column.
 */
static void print_hex(const std::vector<uint8_t>& bytes) {
    for (size_t off = 0; off < bytes.size(); off += 16) {
        std::ostringstream line;
        line << std::hex << std::setfill('0') << std::setw(4) << off << "  ";

        for (size_t i = off; i < off + 16 && i < bytes.size(); ++i)
            line << std::setw(2) << int(bytes[i]) << ' ';

        std::cout << term::code(term::Color::Gray) << line.str()
                  << term::code(term::Color::Reset) << "\n";
    }
}


// -------------------------------------------------------------
// craft
// -------------------------------------------------------------
static int run_craft(const CliOptions& opt) {
    auto src = parse_endpoint(opt.src);
    if (!src) {
        std::cerr << term::paint("Invalid source endpoint: ", term::Color::Red)
                  << opt.src << "\n";
        return 1;
    }

    auto dst = parse_endpoint(opt.dst);
    if (!dst) {
        std::cerr << term::paint("Invalid destination endpoint: ", term::Color::Red)
                  << opt.dst << "\n";
        return 1;
    }

    std::vector<uint8_t> payload(opt.payload.begin(), opt.payload.end());

    UdpHeader h{};
    h.source_port      = src->port;
    h.destination_port = dst->port;
    h.length           = static_cast<uint16_t>(UDP_HEADER_LEN + payload.size());

    Udp udp(h, src->address, dst->address);

    auto frame = build_frame(udp, payload);
    if (!frame.ok) {
        std::cerr << term::paint("Cannot build frame: ", term::Color::Red)
                  << frame.error_msg << "\n";
        return 1;
    }

    std::cout << term::paint(udp.describe(), term::Color::Green)
              << "  " << to_string(src->address) << " -> " << to_string(dst->address)
              << " (" << frame.bytes.size() << " bytes)\n";

    if (!opt.quiet)
        print_hex(frame.bytes);

    if (!opt.out_path.empty()) {
        auto wr = write_capture(opt.out_path, {frame.bytes});
        if (!wr.ok) {
            std::cerr << term::paint("Cannot write capture: ", term::Color::Red)
                      << wr.error_msg << "\n";
            return 1;
        }
        if (!opt.quiet)
            std::cout << "Wrote " << wr.written << " frame(s) to " << opt.out_path << "\n";
    }

    return 0;
}


// -------------------------------------------------------------
// read
// -------------------------------------------------------------
static int run_read(const CliOptions& opt) {
    auto res = read_capture(opt.in_path);
    if (!res.ok) {
        std::cerr << term::paint("Cannot read capture: ", term::Color::Red)
                  << res.error_msg << "\n";
        return 1;
    }

    for (const auto& dg : res.datagrams) {
        std::cout << term::code(term::Color::Cyan) << "#" << dg.frame_index
                  << term::code(term::Color::Reset) << " "
                  << dg.udp.describe();

        if (!opt.quiet) {
            std::cout << "  " << to_string(dg.udp.source_address())
                      << " -> " << to_string(dg.udp.destination_address())
                      << "  payload=" << dg.payload_len;
        }

        std::cout << "  "
                  << (dg.checksum_ok ? term::paint("checksum ok", term::Color::Green)
                                     : term::paint("checksum bad", term::Color::Yellow))
                  << "\n";
    }

    std::cout << term::code(term::Color::Bold) << res.datagrams.size()
              << " UDP datagram(s) in " << res.frames_seen << " frame(s)"
              << term::code(term::Color::Reset) << "\n";
    return 0;
}


/**
 * Main execution entry for the CLI.
 * Never throws; converts every failure into an exit code.
 */
int run(const CliOptions& opt) {
    // Terminal configuration
    term::g_enabled = !opt.no_color && ::isatty(STDOUT_FILENO);

    if (opt.usage_error || opt.command == Command::None) {
        print_usage();
        return 2;
    }

    switch (opt.command) {
        case Command::Craft: return run_craft(opt);
        case Command::Read:  return run_read(opt);
        case Command::None:  break;
    }

    return 2;
}
