#include "config/upload_config.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>

#include "util/byte_utils.hpp"

namespace {
std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t");
    if (first == std::string::npos)
        return "";
    size_t last = str.find_last_not_of(" \t");
    return str.substr(first, (last - first + 1));
}

bool read_chunk_size(const nlohmann::json& value, std::int64_t& out, std::string& out_error) {
    if (value.is_number_integer()) {
        auto size = value.get<std::int64_t>();
        if (size <= 0) {
            out_error = "chunk_size must be positive";
            return false;
        }
        out = size;
        return true;
    }
    if (value.is_string()) {
        auto size = byte_utils::parse_size(value.get<std::string>());
        if (!size || *size == 0 || *size > static_cast<std::uint64_t>(INT64_MAX)) {
            out_error = "invalid chunk_size \"" + value.get<std::string>() + "\"";
            return false;
        }
        out = static_cast<std::int64_t>(*size);
        return true;
    }
    out_error = "chunk_size must be an integer or a size string";
    return false;
}
} // namespace

chunked_upload::options upload_config::to_options() const {
    chunked_upload::options opts;
    opts.method = method;
    opts.url = url;
    opts.headers = headers;
    opts.chunk_size = chunk_size;
    if (verbose)
        opts.log.debug_sink = &std::cout;
    return opts;
}

bool validate_upload_config(const upload_config& config, std::string& out_error) {
    if (config.method.empty()) {
        out_error = "method must not be empty";
        return false;
    }
    if (config.timeout_seconds < 0) {
        out_error = "timeout_seconds must not be negative";
        return false;
    }
    return true;
}

bool apply_upload_config(const nlohmann::json& json, upload_config& config,
                         std::string& out_error) {
    if (!json.is_object()) {
        out_error = "configuration must be a JSON object";
        return false;
    }

    try {
        if (json.contains("method"))
            config.method = json["method"].get<std::string>();
        if (json.contains("url"))
            config.url = json["url"].get<std::string>();
        if (json.contains("chunk_size") &&
            !read_chunk_size(json["chunk_size"], config.chunk_size, out_error))
            return false;
        if (json.contains("headers")) {
            const auto& headers = json["headers"];
            if (!headers.is_object()) {
                out_error = "headers must be an object of strings";
                return false;
            }
            for (auto it = headers.begin(); it != headers.end(); ++it) {
                config.headers[it.key()] = it.value().get<std::string>();
            }
        }
        if (json.contains("timeout_seconds"))
            config.timeout_seconds = json["timeout_seconds"].get<long>();
        if (json.contains("verbose"))
            config.verbose = json["verbose"].get<bool>();
    } catch (const nlohmann::json::exception& e) {
        out_error = std::string("invalid configuration value: ") + e.what();
        return false;
    }

    return validate_upload_config(config, out_error);
}

std::optional<upload_config> parse_upload_config(const std::string& text, std::string& out_error) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        out_error = std::string("failed to parse configuration: ") + e.what();
        return std::nullopt;
    }

    upload_config config;
    if (!apply_upload_config(json, config, out_error))
        return std::nullopt;
    return config;
}

std::optional<upload_config> load_upload_config(const std::string& path, std::string& out_error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        out_error = "cannot open configuration file " + path;
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_upload_config(contents.str(), out_error);
}

std::optional<std::pair<std::string, std::string>> parse_header_line(const std::string& line) {
    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos)
        return std::nullopt;

    std::string name = trim(line.substr(0, colon_pos));
    if (name.empty())
        return std::nullopt;
    return std::make_pair(name, trim(line.substr(colon_pos + 1)));
}
