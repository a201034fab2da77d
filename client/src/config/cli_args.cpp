#include "config/cli_args.hpp"

#include <cstdint>
#include <exception>

#include "util/byte_utils.hpp"

namespace {
// The whole string must be a number; "12abc" is rejected.
bool parse_long(const std::string& text, long& out) {
    try {
        size_t pos = 0;
        long value = std::stol(text, &pos);
        if (pos != text.size())
            return false;
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}
} // namespace

bool parse_cli_args(int argc, char** argv, cli_args& args, std::string& out_error) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&](std::optional<std::string>& target) {
            if (i + 1 >= argc) {
                out_error = arg + " requires a value";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--config") {
            if (!next_value(args.config_path))
                return false;
        } else if (arg == "--method") {
            if (!next_value(args.method))
                return false;
        } else if (arg == "--chunk-size") {
            if (!next_value(args.chunk_size))
                return false;
        } else if (arg == "--header") {
            std::optional<std::string> header;
            if (!next_value(header))
                return false;
            args.headers.push_back(*header);
        } else if (arg == "--size") {
            if (!next_value(args.size))
                return false;
        } else if (arg == "--name") {
            if (!next_value(args.name))
                return false;
        } else if (arg == "--timeout") {
            if (!next_value(args.timeout))
                return false;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            out_error = "unknown option " + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() == 2) {
        args.url = positional[0];
        args.source = positional[1];
    } else if (positional.size() == 1) {
        args.source = positional[0];
    } else {
        out_error = "expected [<url>] <file|->";
        return false;
    }
    return true;
}

bool apply_cli_overrides(const cli_args& args, upload_config& config, std::string& out_error) {
    if (args.url)
        config.url = *args.url;
    if (args.method)
        config.method = *args.method;
    if (args.chunk_size) {
        auto size = byte_utils::parse_size(*args.chunk_size);
        if (!size || *size == 0 || *size > static_cast<std::uint64_t>(INT64_MAX)) {
            out_error = "invalid --chunk-size " + *args.chunk_size;
            return false;
        }
        config.chunk_size = static_cast<std::int64_t>(*size);
    }
    for (const auto& line : args.headers) {
        auto header = parse_header_line(line);
        if (!header) {
            out_error = "invalid --header \"" + line + "\", expected \"Name: value\"";
            return false;
        }
        config.headers[header->first] = header->second;
    }
    if (args.timeout && !parse_long(*args.timeout, config.timeout_seconds)) {
        out_error = "invalid --timeout " + *args.timeout;
        return false;
    }
    if (args.verbose)
        config.verbose = true;

    if (config.url.empty()) {
        out_error = "no upload URL: pass <url> or set \"url\" in the configuration";
        return false;
    }
    return validate_upload_config(config, out_error);
}
