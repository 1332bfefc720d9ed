/**
 * High-level command execution.
 *
 * Exposes a single entry point used by the CLI frontend.
 * Packet work is delegated to the pktcraft library.
 */

#pragma once
#include "cli.hpp"

/**
 * Executes the selected sub-command.
 *
 * @return 0 on success, 1 on failure, 2 on usage errors.
 */
int run(const CliOptions& opt);
