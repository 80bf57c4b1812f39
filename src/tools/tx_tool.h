// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#ifndef BITWIRE_TOOLS_TX_TOOL_H
#define BITWIRE_TOOLS_TX_TOOL_H

#include <util/config.h>

#include <iosfwd>
#include <string>

/**
 * bitwire-tx command implementation
 *
 * Everything the executable does lives here so that the test suite can
 * drive it with in-memory streams. main() only forwards to RunTool().
 */

// Exit status
static const int TOOL_EXIT_OK = 0;
static const int TOOL_EXIT_USAGE = 1;   // Bad arguments or unusable configuration
static const int TOOL_EXIT_DECODE = 2;  // Input did not decode

/**
 * Command-line options
 */
struct ToolConfig {
    std::string conf_file = "";     // Empty = default location
    std::string input = "";         // Hex or JSON text, "-" for stdin
    bool json_output = false;
    bool from_json = false;
    bool debug = false;
    bool show_help = false;

    /**
     * Parse argv. Problems are reported on err.
     * @return false on a usage error or when --help was given
     */
    bool ParseArgs(int argc, const char* const argv[], std::ostream& err);

    void PrintUsage(const char* program, std::ostream& out) const;
};

/**
 * Configure CLoggingConfig from the command line and the config keys
 * loglevel, logfile, printtoconsole, debug (categories), maxlogsize (MiB)
 * and maxlogfiles.
 */
void ApplyLoggingSettings(const ToolConfig& config, const CConfigParser& parser, std::ostream& err);

/** Decode a hex transaction and print the text (or JSON) view. */
int DecodeHex(const std::string& text, bool json_output, std::ostream& out, std::ostream& err);

/** Parse a JSON transaction and print its serialized hex. */
int EncodeJSON(const std::string& text, std::ostream& out, std::ostream& err);

/**
 * Full tool run: arguments, configuration, logging, command.
 * @return process exit status (TOOL_EXIT_*)
 */
int RunTool(int argc, const char* const argv[], std::istream& in, std::ostream& out, std::ostream& err);

#endif // BITWIRE_TOOLS_TX_TOOL_H
