#include "net/http.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>
#include <curl/curl.h>

constexpr const char* USER_AGENT = "chunkup/1.0";

namespace {
// Callback function to write response data
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}
} // namespace

class http_client::impl {
public:
    impl() : curl_handle(nullptr), timeout_seconds(0) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl_handle = curl_easy_init();
        if (!curl_handle) {
            throw std::runtime_error("Failed to initialize curl handle");
        }

        curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_handle, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl_handle, CURLOPT_MAXREDIRS, 0L);
        curl_easy_setopt(curl_handle, CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl_handle, CURLOPT_USERAGENT, USER_AGENT);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl_handle, CURLOPT_SSL_VERIFYHOST, 2L);
        curl_easy_setopt(curl_handle, CURLOPT_NOSIGNAL, 1L);
#ifdef CHUNKUP_HTTP_ENABLE_LOG
        // curl_easy_setopt(curl_handle, CURLOPT_VERBOSE, 1L);
#endif
    }

    ~impl() {
        if (curl_handle) {
            curl_easy_cleanup(curl_handle);
        }
        curl_global_cleanup();
    }

    impl(const impl&) = delete;
    impl& operator=(const impl&) = delete;

    CURL* curl_handle;
    long timeout_seconds;
    std::mutex request_mutex;
};

http_client::http_client() : pimpl(std::make_unique<impl>()) {}

http_client::~http_client() = default;

http_client::http_client(http_client&&) noexcept = default;
http_client& http_client::operator=(http_client&&) noexcept = default;

http_client::response http_client::send(const request& req) {
    return perform_request(req);
}

void http_client::set_timeout(long timeout_seconds) {
    std::lock_guard<std::mutex> lock(pimpl->request_mutex);
    pimpl->timeout_seconds = timeout_seconds;
    curl_easy_setopt(pimpl->curl_handle, CURLOPT_TIMEOUT, timeout_seconds);
}

http_client::response http_client::perform_request(const request& req) {
    std::lock_guard<std::mutex> lock(pimpl->request_mutex);

    response resp;
    std::string response_body;

    print_request_details(req);

    CURL* curl = pimpl->curl_handle;
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);

    const std::string method = to_upper(req.method);
    if (method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, nullptr);
        curl_easy_setopt(curl, CURLOPT_NOBODY, 0L);
    } else if (method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, nullptr);
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        // POSTFIELDS makes curl send the body; CUSTOMREQUEST then swaps the verb (PUT, PATCH, ...)
        curl_easy_setopt(curl, CURLOPT_NOBODY, 0L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(req.body.size()));
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method == "POST" ? nullptr : method.c_str());
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& header : req.headers) {
        std::string header_string = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, header_string.c_str());
    }
    // Suppress the 100-continue round trip curl adds to large bodies
    header_list = curl_slist_append(header_list, "Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl);

    // Clear from handle to avoid a dangling pointer across requests
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(header_list);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, nullptr);

    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);
    resp.status_code = static_cast<int>(status_code);

    if (res != CURLE_OK) {
        resp.error = curl_easy_strerror(res);
        CHUNKUP_HTTP_LOG(std::cerr << "curl_easy_perform() failed: " << resp.error << std::endl);
        resp.body = response_body;
        return resp;
    }

    resp.body = response_body;

    print_response_details(resp);

    return resp;
}

void http_client::print_request_details(const request& req) {
    CHUNKUP_HTTP_LOG(std::cout << "\n=== HTTP REQUEST ===" << std::endl);
    CHUNKUP_HTTP_LOG(std::cout << "Method: " << req.method << std::endl);
    CHUNKUP_HTTP_LOG(std::cout << "URL: " << req.url << std::endl);

    if (!req.headers.empty()) {
        CHUNKUP_HTTP_LOG(std::cout << "Headers:" << std::endl);
        for (const auto& header : req.headers) {
            CHUNKUP_HTTP_LOG(std::cout << "  " << header.first << ": " << header.second
                                       << std::endl);
        }
    }
    CHUNKUP_HTTP_LOG(std::cout << "Body: " << req.body.size() << " bytes" << std::endl);
    CHUNKUP_HTTP_LOG(std::cout << "===================\n" << std::endl);
}

void http_client::print_response_details(const response& resp) {
    CHUNKUP_HTTP_LOG(std::cout << "\n=== HTTP RESPONSE ===" << std::endl);
    CHUNKUP_HTTP_LOG(std::cout << "Status Code: " << resp.status_code << std::endl);
    CHUNKUP_HTTP_LOG(std::cout << "Body: " << resp.body.size() << " bytes" << std::endl);
    CHUNKUP_HTTP_LOG(std::cout << "====================\n" << std::endl);
}
