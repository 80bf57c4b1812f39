// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#include <tools/tx_tool.h>

#include <primitives/codec_error.h>
#include <primitives/transaction.h>
#include <primitives/transaction_json.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <cstdint>
#include <istream>
#include <iterator>
#include <ostream>
#include <vector>

bool ToolConfig::ParseArgs(int argc, const char* const argv[], std::ostream& err) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg.find("--conf=") == 0) {
            conf_file = arg.substr(7);
        }
        else if (arg == "--json") {
            json_output = true;
        }
        else if (arg == "--fromjson") {
            from_json = true;
        }
        else if (arg == "--debug") {
            debug = true;
        }
        else if (arg == "--help" || arg == "-h") {
            show_help = true;
            return false;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            err << "Unknown option: " << arg << std::endl;
            return false;
        }
        else if (!input.empty()) {
            err << "Error: more than one input given" << std::endl;
            return false;
        }
        else {
            input = arg;
        }
    }

    if (input.empty()) {
        err << "Error: no input given" << std::endl;
        return false;
    }
    return true;
}

void ToolConfig::PrintUsage(const char* program, std::ostream& out) const {
    out << "Bitwire transaction inspector" << std::endl;
    out << std::endl;
    out << "Usage: " << program << " [options] <hex|->" << std::endl;
    out << std::endl;
    out << "Decodes a serialized transaction (version, inputs, lock time) and prints it." << std::endl;
    out << "Pass - to read the input from standard input." << std::endl;
    out << std::endl;
    out << "Options:" << std::endl;
    out << "  --conf=<file>         Configuration file (default: ~/.bitwire/bitwire.conf)" << std::endl;
    out << "  --json                Print the JSON view instead of the text rendering" << std::endl;
    out << "  --fromjson            Input is a JSON document; print the serialized hex" << std::endl;
    out << "  --debug               Log at DEBUG level to the console" << std::endl;
    out << "  --help, -h            Show this help message" << std::endl;
    out << std::endl;
    out << "Configuration:" << std::endl;
    out << "  Keys: loglevel, logfile, printtoconsole, debug, maxlogsize, maxlogfiles," << std::endl;
    out << "        format (text|json)" << std::endl;
    out << "  Environment variables: BITWIRE_* (e.g., BITWIRE_LOGLEVEL=debug)" << std::endl;
    out << "  Priority: Command-line > Environment > Config file > Default" << std::endl;
    out << std::endl;
    out << "Exit status: 0 success, 1 usage or configuration error, 2 decode error" << std::endl;
}

void ApplyLoggingSettings(const ToolConfig& config, const CConfigParser& parser, std::ostream& err) {
    CLoggingConfig& logConfig = CLoggingConfig::GetInstance();

    logConfig.SetConsoleLogging(config.debug || parser.GetBool("printtoconsole", false));

    LogLevel level = LogLevel::LVL_WARN;
    std::string levelName = parser.GetString("loglevel", "");
    if (!levelName.empty() && !ParseLogLevel(levelName, level)) {
        err << "Warning: unknown loglevel '" << levelName << "', using warn" << std::endl;
    }
    if (config.debug) {
        level = LogLevel::LVL_DEBUG;
    }
    logConfig.SetLogLevel(level);

    // debug=<category> may repeat; listing any narrows logging to those
    std::vector<std::string> categories = parser.GetList("debug");
    if (categories.empty()) {
        logConfig.EnableCategory(LogCategory::ALL);
    } else {
        logConfig.DisableCategory(LogCategory::ALL);
        for (const std::string& name : categories) {
            LogCategory category = LogCategory::NONE;
            if (ParseLogCategory(name, category)) {
                logConfig.EnableCategory(category);
            } else {
                err << "Warning: unknown debug category '" << name << "'" << std::endl;
            }
        }
    }

    int64_t maxSizeMiB = parser.GetInt64("maxlogsize", 10);
    if (maxSizeMiB > 0) {
        logConfig.SetMaxLogSize(static_cast<size_t>(maxSizeMiB) * 1024 * 1024);
    } else {
        err << "Warning: maxlogsize must be positive, keeping "
            << logConfig.GetMaxLogSize() / (1024 * 1024) << " MiB" << std::endl;
    }

    int64_t maxFiles = parser.GetInt64("maxlogfiles", 10);
    if (maxFiles > 0) {
        logConfig.SetMaxLogFiles(static_cast<size_t>(maxFiles));
    } else {
        err << "Warning: maxlogfiles must be positive, keeping "
            << logConfig.GetMaxLogFiles() << std::endl;
    }

    std::string logFile = parser.GetString("logfile", "");
    if (!logFile.empty()) {
        logConfig.SetLogFile(logFile);
    }
}

static std::string ReadInput(const std::string& arg, std::istream& in) {
    if (arg != "-") {
        return arg;
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return contents;
}

int DecodeHex(const std::string& text, bool json_output, std::ostream& out, std::ostream& err) {
    std::string hex = TrimString(text);
    if (!IsHex(hex)) {
        LogPrintTool(ERROR, "Input is not an even-length hex string (%zu chars)", hex.size());
        err << "error: " << CodecErrorString(CodecError::INVALID_FORMAT)
            << ": input is not an even-length hex string" << std::endl;
        return TOOL_EXIT_DECODE;
    }

    std::vector<uint8_t> raw = ParseHex(hex);
    CTransaction tx;
    size_t consumed = 0;
    CodecError error = CodecError::NONE;
    if (!tx.Deserialize(raw, &consumed, &error)) {
        LogPrintTool(ERROR, "Failed to decode %zu-byte transaction: %s", raw.size(), CodecErrorString(error));
        err << "error: " << CodecErrorString(error)
            << ": buffer of " << raw.size() << " bytes does not hold a complete transaction" << std::endl;
        return TOOL_EXIT_DECODE;
    }

    if (consumed < raw.size()) {
        LogPrintTool(WARN, "%zu trailing bytes after transaction", raw.size() - consumed);
        err << "warning: " << (raw.size() - consumed)
            << " trailing bytes after transaction ignored" << std::endl;
    }

    if (json_output) {
        out << TransactionToJSON(tx, 2) << std::endl;
    } else {
        out << tx.ToString();
    }
    return TOOL_EXIT_OK;
}

int EncodeJSON(const std::string& text, std::ostream& out, std::ostream& err) {
    CTransaction tx;
    CodecError error = CodecError::NONE;
    std::string message;
    if (!TransactionFromJSON(text, tx, &error, &message)) {
        LogPrintTool(ERROR, "Failed to parse transaction JSON: %s", message.c_str());
        err << "error: " << CodecErrorString(error) << ": " << message << std::endl;
        return TOOL_EXIT_DECODE;
    }

    out << HexStr(tx.Serialize()) << std::endl;
    return TOOL_EXIT_OK;
}

int RunTool(int argc, const char* const argv[], std::istream& in, std::ostream& out, std::ostream& err) {
    // Nothing may reach the console before the config says so
    CLoggingConfig::GetInstance().SetConsoleLogging(false);

    ToolConfig config;
    const char* program = argc > 0 ? argv[0] : "bitwire-tx";
    if (!config.ParseArgs(argc, argv, err)) {
        if (config.show_help) {
            config.PrintUsage(program, out);
            return TOOL_EXIT_OK;
        }
        config.PrintUsage(program, err);
        return TOOL_EXIT_USAGE;
    }

    std::string config_file = config.conf_file.empty() ? GetConfigFilePath() : config.conf_file;
    CConfigParser config_parser;
    if (!config_parser.LoadConfigFile(config_file)) {
        err << "ERROR: Failed to load configuration file: " << config_file << std::endl;
        return TOOL_EXIT_USAGE;
    }

    ApplyLoggingSettings(config, config_parser, err);
    CLogger& logger = CLogger::GetInstance();
    if (!logger.Initialize()) {
        err << "ERROR: Failed to open log file: " << CLoggingConfig::GetInstance().GetLogFile() << std::endl;
        return TOOL_EXIT_USAGE;
    }

    // Command line beats the config file
    if (!config.json_output && !config.from_json) {
        std::string format = config_parser.GetString("format", "text");
        if (format == "json") {
            config.json_output = true;
        } else if (format != "text") {
            LogPrintTool(WARN, "Unknown output format '%s', using text", format.c_str());
        }
    }

    std::string input = ReadInput(config.input, in);
    LogPrintTool(DEBUG, "Read %zu characters of input", input.size());

    int status = config.from_json ? EncodeJSON(input, out, err) : DecodeHex(input, config.json_output, out, err);

    logger.Shutdown();
    return status;
}
