#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "io/byte_source.hpp"
#include "log/upload_logger.hpp"
#include "net/http_transport.hpp"
#include "net/upload_error.hpp"
#include "net/upload_status.hpp"

// Uploads one payload as a sequence of Content-Range requests, strictly in
// order, one request in flight at a time. Every request carries the same
// Session-ID so the server can stitch the parts together.
class chunked_upload {
public:
    enum class state {
        pending,
        running,
        succeeded,
        failed,
    };

    struct progress_info {
        std::uint64_t part_index;
        std::int64_t part_bytes;
        std::int64_t transferred_bytes;
        std::int64_t total_bytes;
        double bytes_per_sec;
    };

    using progress_callback_t = std::function<void(const progress_info&)>;

    struct options {
        std::string method;
        std::string url;
        std::map<std::string, std::string> headers; // merged into every chunk request
        std::int64_t chunk_size;                    // bytes per request, must be > 0
        std::string file_name;                      // Content-Disposition name, defaults to the file's base name
        logger_options log;

        options();
    };

    // Uploads the file at `file_path`; it is opened by init() and closed before init() returns.
    chunked_upload(const std::string& file_path, const options& opts,
                   std::shared_ptr<http_transport> transport);

    // Uploads `size` bytes read from `stream`. The stream stays owned by the caller.
    chunked_upload(std::istream& stream, std::int64_t size, const options& opts,
                   std::shared_ptr<http_transport> transport);

    ~chunked_upload();

    chunked_upload(const chunked_upload&) = delete;
    chunked_upload& operator=(const chunked_upload&) = delete;

    // Runs the whole upload. Returns an error only when the upload could not be
    // started; failures after the first chunk are reported through status().failed.
    std::optional<upload_error> init();

    // Consistent copy, safe to call from other threads while init() runs.
    upload_status status() const;
    state current_state() const;

    const std::string& session_id() const {
        return m_session_id;
    }

    // Must be set before init()
    void set_progress_callback(progress_callback_t on_progress) {
        m_on_progress = std::move(on_progress);
    }

private:
    std::optional<upload_error> open_source();
    void close_source();
    std::optional<upload_error> fail_init(upload_error error);

    void upload_file();
    void upload_chunk(std::uint64_t index);
    void upload_done(bool is_exception);
    void report_progress(std::uint64_t index, std::int64_t part_size);

    std::string m_file_path;
    std::istream* m_stream;
    std::int64_t m_stream_size;
    std::unique_ptr<byte_source> m_source;

    options m_options;
    std::string m_file_name;
    std::shared_ptr<http_transport> m_transport;
    upload_logger m_logger;
    std::string m_session_id;
    progress_callback_t m_on_progress;
    std::chrono::steady_clock::time_point m_start_tp;

    mutable std::mutex m_status_mutex;
    upload_status m_status;
    state m_state;
};

const char* to_string(chunked_upload::state s);
