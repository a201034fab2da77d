#pragma once

#include <map>
#include <string>

// Abstract request/response seam between the upload engine and the wire.
class http_transport {
public:
    struct response {
        int status_code;
        std::string body;
        // Non-empty when the exchange did not complete (connect, timeout, body read)
        std::string error;

        response() : status_code(0) {}

        bool completed() const {
            return error.empty();
        }
    };

    struct request {
        std::string method;
        std::string url;
        std::map<std::string, std::string> headers;
        std::string body;

        request(const std::string& method, const std::string& url) : method(method), url(url) {}
    };

    virtual ~http_transport() = default;

    virtual response send(const request& req) = 0;
};
