#include "cli.hpp"
#include <iostream>
#include <string>

void print_usage() {
    std::cerr << "Usage:\n"
              << "  pktcraft craft --src <ip>:<port> --dst <ip>:<port>\n"
              << "                 [--payload <text>] [--out <file.pcap>]\n"
              << "  pktcraft read <file.pcap>\n"
              << "\n"
              << "Common options: --quiet, --no-color\n"
              << "IPv6 endpoints are written [addr]:port\n";
}


/**
 * Parse command-line arguments into a CliOptions struct.
 *
 * The first argument selects the sub-command. Flags may appear in any
 * order after it. Invalid or unknown flags are reported but do not stop
 * parsing; missing operands set usage_error.
 */
CliOptions parse_args(int argc, char** argv) {
    CliOptions opt{};

    if (argc < 2) {
        opt.usage_error = true;
        return opt;
    }

    std::string cmd = argv[1];
    if (cmd == "craft") {
        opt.command = Command::Craft;
    } else if (cmd == "read") {
        opt.command = Command::Read;
    } else {
        std::cerr << "Unknown command: " << cmd << "\n";
        opt.usage_error = true;
        return opt;
    }

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];

        // ------------------------------
        // craft operands
        // ------------------------------
        if ((a == "--src" || a == "-s") && i + 1 < argc) {
            opt.src = argv[++i];

        } else if ((a == "--dst" || a == "-d") && i + 1 < argc) {
            opt.dst = argv[++i];

        } else if ((a == "--payload" || a == "-p") && i + 1 < argc) {
            opt.payload = argv[++i];

        } else if ((a == "--out" || a == "-o") && i + 1 < argc) {
            opt.out_path = argv[++i];

        // ------------------------------
        // Output handling
        // ------------------------------
        } else if (a == "--quiet" || a == "-q") {
            opt.quiet = true;

        } else if (a == "--no-color") {
            opt.no_color = true;

        // ------------------------------
        // read operand (positional)
        // ------------------------------
        } else if (opt.command == Command::Read && opt.in_path.empty() &&
                   !a.empty() && a[0] != '-') {
            opt.in_path = a;

        } else {
            std::cerr << "Unknown arg: " << a << "\n";
        }
    }

    if (opt.command == Command::Craft && (opt.src.empty() || opt.dst.empty())) {
        std::cerr << "craft needs --src and --dst\n";
        opt.usage_error = true;
    }
    if (opt.command == Command::Read && opt.in_path.empty()) {
        std::cerr << "read needs a capture file\n";
        opt.usage_error = true;
    }

    return opt;
}
