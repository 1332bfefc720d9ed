/**
 * Entry point for the pktcraft CLI.
 *
 * Responsible only for:
 * - Parsing command-line options
 * - Delegating execution to `run`
 */

#include "cli.hpp"
#include "runner.hpp"

int main(int argc, char** argv) {
    auto options = parse_args(argc, argv);
    return run(options);
}
