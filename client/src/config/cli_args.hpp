#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config/upload_config.hpp"

// Raw command line of the chunkup tool. Values stay strings until
// apply_cli_overrides() validates them against a loaded configuration.
struct cli_args {
    std::optional<std::string> config_path;
    std::optional<std::string> method;
    std::optional<std::string> chunk_size;
    std::vector<std::string> headers;
    std::optional<std::string> size;
    std::optional<std::string> name;
    std::optional<std::string> timeout;
    bool verbose = false;

    // Set only when the URL was given on the command line
    std::optional<std::string> url;
    // File path, or "-" for stdin
    std::string source;
};

// Accepts `[options] <url> <file|->` and `[options] <file|->`; the short form
// relies on the configuration file for the URL.
bool parse_cli_args(int argc, char** argv, cli_args& args, std::string& out_error);

// Applies the command line on top of `config` and validates the result. On
// failure `config` may be partially updated.
bool apply_cli_overrides(const cli_args& args, upload_config& config, std::string& out_error);
