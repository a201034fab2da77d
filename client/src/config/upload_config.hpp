#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

#include "net/chunked_upload.hpp"

// Settings for one upload run, read from a JSON document such as
//
//   {
//     "method": "PUT",
//     "url": "https://example.org/upload",
//     "chunk_size": "4MB",
//     "headers": { "Authorization": "Bearer ..." },
//     "timeout_seconds": 120,
//     "verbose": false
//   }
//
// Every key is optional; absent keys keep the defaults below.
struct upload_config {
    std::string method = "PUT";
    std::string url;
    std::int64_t chunk_size = 1048576;
    std::map<std::string, std::string> headers;
    long timeout_seconds = 0;
    bool verbose = false;

    chunked_upload::options to_options() const;
};

// Checks the fields every source of settings must agree on: a non-empty
// method and a non-negative timeout.
bool validate_upload_config(const upload_config& config, std::string& out_error);

// Fills `config` from `json`, leaving absent keys untouched. Returns false and
// sets out_error on a wrongly typed or invalid value.
bool apply_upload_config(const nlohmann::json& json, upload_config& config, std::string& out_error);

std::optional<upload_config> parse_upload_config(const std::string& text, std::string& out_error);
std::optional<upload_config> load_upload_config(const std::string& path, std::string& out_error);

// "Name: value" -> {"Name", "value"}
std::optional<std::pair<std::string, std::string>> parse_header_line(const std::string& line);
