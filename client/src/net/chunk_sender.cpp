#include "net/chunk_sender.hpp"

#include <utility>

std::map<std::string, std::string> build_chunk_headers(const chunk_request& chunk) {
    std::map<std::string, std::string> headers;
    headers["Content-Type"] = "application/octet-stream";
    headers["Content-Disposition"] = "attachment; filename=\"" + chunk.file_name + "\"";
    headers["Content-Range"] = chunk.content_range;
    headers[SESSION_ID_HEADER] = chunk.session_id;

    for (const auto& header : chunk.extra_headers) {
        headers[header.first] = header.second;
    }
    return headers;
}

send_result send_chunk(http_transport& transport, const chunk_request& chunk,
                       const std::string& payload) {
    http_transport::request req(chunk.method, chunk.url);
    req.headers = build_chunk_headers(chunk);
    req.body = payload;

    auto resp = transport.send(req);

    send_result result;
    result.status_code = resp.status_code;
    result.body = std::move(resp.body);

    if (!resp.completed()) {
        // A status line arrived, so the connection broke while draining the body
        if (resp.status_code != 0) {
            result.error = upload_error{upload_error_kind::io,
                                        "failed to read response body: " + resp.error};
        } else {
            result.error = upload_error{upload_error_kind::transport, resp.error};
        }
        return result;
    }

    result.success = resp.status_code >= 200 && resp.status_code <= 299;
    if (!result.success) {
        result.error = upload_error{upload_error_kind::server_rejected,
                                    "HTTP status " + std::to_string(resp.status_code)};
    }
    return result;
}
