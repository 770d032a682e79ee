#ifndef BOWTIEMODEL_CLI_COMMON_HPP
#define BOWTIEMODEL_CLI_COMMON_HPP

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace bowtiemodel::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<std::string> preset;
    int precision = 6;
    bool verbose = false;
    bool help = false;
};

// Significant digits for --precision, 1 to 17
inline int parse_precision(const std::string& text) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::runtime_error("--precision requires an integer, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw std::runtime_error("--precision requires an integer, got '" + text + "'");
    }
    if (value < 1 || value > 17) {
        throw std::runtime_error("--precision must be between 1 and 17");
    }
    return value;
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (arg == "-p" || arg == "--preset") {
            if (i + 1 < argc) {
                ctx.preset = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-p/--preset requires an argument");
            }
        } else if (arg == "--precision") {
            if (i + 1 < argc) {
                ctx.precision = parse_precision(argv[++i]);
                ++i;
            } else {
                throw std::runtime_error("--precision requires an argument");
            }
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    return {ctx, i};
}

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Command function declarations
int command_model(int argc, char** argv);
int command_geometry(int argc, char** argv);
int command_presets(int argc, char** argv);

}  // namespace bowtiemodel::cli

#endif // BOWTIEMODEL_CLI_COMMON_HPP
