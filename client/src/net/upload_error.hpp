#pragma once

#include <ostream>
#include <string>

enum class upload_error_kind {
    init,            // source cannot be opened or sized
    short_read,      // source ended before a full chunk
    io,              // source or response body read failure
    transport,       // request never completed
    server_rejected, // non-2xx status
    parse,           // malformed server-reported range
};

struct upload_error {
    upload_error_kind kind;
    std::string message;
};

inline const char* to_string(upload_error_kind kind) {
    switch (kind) {
    case upload_error_kind::init:
        return "init";
    case upload_error_kind::short_read:
        return "short_read";
    case upload_error_kind::io:
        return "io";
    case upload_error_kind::transport:
        return "transport";
    case upload_error_kind::server_rejected:
        return "server_rejected";
    case upload_error_kind::parse:
        return "parse";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, const upload_error& error) {
    return os << to_string(error.kind) << ": " << error.message;
}
