#pragma once
#include <string>

/**
 * Sub-commands of the pktcraft executable.
 */
enum class Command {
    None,
    Craft,      // Compose one IP/UDP frame
    Read        // Summarize UDP datagrams of a capture file
};

/**
 * Parsed command-line options for the pktcraft executable.
 *
 * Endpoints stay textual here; the runner turns them into
 * pktcraft::Endpoint values and reports malformed ones.
 */
struct CliOptions {
    Command command{Command::None};

    std::string src;            // craft: <ip>:<port> or [<ipv6>]:<port>
    std::string dst;            // craft: destination endpoint
    std::string payload;        // craft: trailer bytes (taken verbatim)
    std::string out_path;       // craft: optional .pcap output

    std::string in_path;        // read: .pcap input

    bool quiet{false};          // Summary lines only, no hex dump
    bool no_color{false};       // Disable ANSI colors
    bool usage_error{false};    // Missing/invalid command or operands
};

/**
 * Parse all command-line arguments into a CliOptions struct.
 * Unknown flags produce warnings but parsing continues.
 */
CliOptions parse_args(int argc, char** argv);

/**
 * Print the usage text on stderr.
 */
void print_usage();
