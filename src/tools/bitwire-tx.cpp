// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

/**
 * bitwire-tx - Transaction inspection tool
 *
 * Usage:
 *   bitwire-tx [options] <hex|->
 *     --conf=<file>     Configuration file (default: ~/.bitwire/bitwire.conf)
 *     --json            Print the JSON view instead of the text rendering
 *     --fromjson        Argument is a JSON document; print the raw hex
 *     --debug           Log at DEBUG level to the console
 */

#include <tools/tx_tool.h>

#include <iostream>

int main(int argc, char* argv[]) {
    return RunTool(argc, argv, std::cin, std::cout, std::cerr);
}
