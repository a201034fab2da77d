#pragma once

#include <map>
#include <optional>
#include <string>

#include "net/http_transport.hpp"
#include "net/upload_error.hpp"

constexpr const char* SESSION_ID_HEADER = "Session-ID";

struct chunk_request {
    std::string method;
    std::string url;
    std::string session_id;
    std::string content_range;
    std::string file_name;
    std::map<std::string, std::string> extra_headers;
};

struct send_result {
    bool success = false;
    int status_code = 0;
    std::string body;
    std::optional<upload_error> error;
};

// Header set for one chunk. Caller headers are applied last and replace a
// standard header of the same name.
std::map<std::string, std::string> build_chunk_headers(const chunk_request& chunk);

// Issues one chunk request. success is true only for a completed exchange with a
// 2xx status; the body is returned whatever the status.
send_result send_chunk(http_transport& transport, const chunk_request& chunk,
                       const std::string& payload);
