#pragma once

#include <memory>
#include <string>

#include "net/http_transport.hpp"

// Logging control: define CHUNKUP_HTTP_ENABLE_LOG to dump requests and responses
#ifdef CHUNKUP_HTTP_ENABLE_LOG
#include <iostream>
#define CHUNKUP_HTTP_LOG(stmt)                                                                     \
    do {                                                                                           \
        stmt;                                                                                      \
    } while (0)
#else
#define CHUNKUP_HTTP_LOG(stmt)                                                                     \
    do {                                                                                           \
    } while (0)
#endif

// libcurl backed transport. One easy handle per client; requests issued from
// several threads are serialized on it.
class http_client : public http_transport {
public:
    http_client();
    ~http_client() override;

    // Disable copy constructor and assignment operator
    http_client(const http_client&) = delete;
    http_client& operator=(const http_client&) = delete;

    // Enable move constructor and assignment operator
    http_client(http_client&&) noexcept;
    http_client& operator=(http_client&&) noexcept;

    response send(const request& req) override;

    // Applies to every subsequent request, 0 disables the limit
    void set_timeout(long timeout_seconds);

private:
    class impl;
    std::unique_ptr<impl> pimpl;

    response perform_request(const request& req);
    void print_request_details(const request& req);
    void print_response_details(const response& resp);
};
