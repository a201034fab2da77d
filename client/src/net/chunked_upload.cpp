#include "net/chunked_upload.hpp"

#include <filesystem>
#include <sstream>
#include <utility>

#include "net/chunk_sender.hpp"
#include "net/content_range.hpp"
#include "net/retry.hpp"
#include "util/byte_utils.hpp"
#include "util/defer.hpp"
#include "util/session_id.hpp"

chunked_upload::options::options()
    : method("PUT"), url(""), chunk_size(static_cast<std::int64_t>(byte_utils::MB)),
      file_name("") {}

chunked_upload::chunked_upload(const std::string& file_path, const options& opts,
                               std::shared_ptr<http_transport> transport)
    : m_file_path(file_path), m_stream(nullptr), m_stream_size(0), m_options(opts),
      m_transport(std::move(transport)), m_logger(opts.log), m_session_id(generate_session_id()),
      m_state(state::pending) {
    m_file_name = !opts.file_name.empty()
                      ? opts.file_name
                      : std::filesystem::path(file_path).filename().string();
    m_logger.set_tag("upload " + m_session_id);
}

chunked_upload::chunked_upload(std::istream& stream, std::int64_t size, const options& opts,
                               std::shared_ptr<http_transport> transport)
    : m_stream(&stream), m_stream_size(size), m_options(opts), m_file_name(opts.file_name),
      m_transport(std::move(transport)), m_logger(opts.log), m_session_id(generate_session_id()),
      m_state(state::pending) {
    m_logger.set_tag("upload " + m_session_id);
}

chunked_upload::~chunked_upload() {
    close_source();
}

upload_status chunked_upload::status() const {
    std::lock_guard<std::mutex> lock(m_status_mutex);
    return m_status;
}

chunked_upload::state chunked_upload::current_state() const {
    std::lock_guard<std::mutex> lock(m_status_mutex);
    return m_state;
}

std::optional<upload_error> chunked_upload::init() {
    if (current_state() != state::pending)
        return upload_error{upload_error_kind::init, "upload was already started"};

    if (!m_transport)
        return fail_init(upload_error{upload_error_kind::init, "no HTTP transport"});
    if (m_options.url.empty())
        return fail_init(upload_error{upload_error_kind::init, "no destination URL"});
    if (m_options.chunk_size <= 0)
        return fail_init(upload_error{upload_error_kind::init,
                                      "chunk size must be positive, got " +
                                          std::to_string(m_options.chunk_size)});

    // Released on every path out of init(), including the early ones below
    DEFER(close_source(););

    if (auto err = open_source())
        return fail_init(*err);

    {
        std::lock_guard<std::mutex> lock(m_status_mutex);
        m_status.total_parts = content_range::count_parts(m_status.total_size, m_options.chunk_size);
        m_state = state::running;
    }

    m_logger.info("Uploading " + byte_utils::format_bytes(m_status.total_size) + " to " +
                  m_options.url + " in " + std::to_string(m_status.total_parts) + " part(s)");

    m_start_tp = std::chrono::steady_clock::now();
    upload_file();
    m_logger.info("Done");
    return std::nullopt;
}

std::optional<upload_error> chunked_upload::open_source() {
    if (m_stream) {
        if (m_stream_size < 0)
            return upload_error{upload_error_kind::init,
                                "negative stream size " + std::to_string(m_stream_size)};
        m_source = std::make_unique<stream_byte_source>(*m_stream);
        std::lock_guard<std::mutex> lock(m_status_mutex);
        m_status.total_size = m_stream_size;
        return std::nullopt;
    }

    auto file = std::make_unique<file_byte_source>(m_file_path);
    if (auto err = file->open())
        return err;

    m_logger.debug("Opened " + m_file_path);
    {
        std::lock_guard<std::mutex> lock(m_status_mutex);
        m_status.total_size = file->size();
    }
    m_source = std::move(file);
    return std::nullopt;
}

void chunked_upload::close_source() {
    if (!m_source)
        return;

    m_logger.debug("Close uploader " + m_session_id);
    if (auto* file = dynamic_cast<file_byte_source*>(m_source.get())) {
        m_logger.debug("Close file " + file->path());
        if (auto err = file->close())
            m_logger.error(err->message);
    }
    m_source.reset();
}

std::optional<upload_error> chunked_upload::fail_init(upload_error error) {
    m_logger.error(error.message);
    upload_done(true);
    return error;
}

void chunked_upload::upload_file() {
    for (std::uint64_t i = 0; !status().is_done; ++i) {
        upload_chunk(i);
    }
}

void chunked_upload::upload_chunk(std::uint64_t index) {
    const upload_status snapshot = status();

    if (index >= snapshot.total_parts) {
        m_logger.info("Upload " + m_session_id + ": done");
        upload_done(false);
        return;
    }
    if (current_state() == state::failed) {
        m_logger.error("Upload already failed, chunk " + std::to_string(index) + " skipped");
        return;
    }

    std::int64_t part_size =
        content_range::compute_part_size(index, m_options.chunk_size, snapshot.total_size);
    if (part_size <= 0)
        return;

    std::string part_buffer;
    if (auto err = m_source->read_exact(part_buffer, static_cast<std::size_t>(part_size))) {
        m_logger.error(err->message);
        upload_done(true);
        return;
    }
    m_logger.debug("Read " + std::to_string(part_buffer.size()) + " bytes");

    chunk_request chunk;
    chunk.method = m_options.method;
    chunk.url = m_options.url;
    chunk.session_id = m_session_id;
    chunk.content_range =
        content_range::format(index, m_options.chunk_size, part_size, snapshot.total_size);
    chunk.file_name = m_file_name;
    chunk.extra_headers = m_options.headers;

    auto result =
        retry::with_attempts(retry::DEFAULT_MAX_ATTEMPTS, [&](std::size_t attempt) {
            auto sent = send_chunk(*m_transport, chunk, part_buffer);
            m_logger.debug("  " + chunk.content_range + " attempt " + std::to_string(attempt) +
                           "/" + std::to_string(retry::DEFAULT_MAX_ATTEMPTS) + " HTTP code " +
                           std::to_string(sent.status_code));
            if (!sent.success && sent.error) {
                std::ostringstream oss;
                oss << "chunk " << index << " attempt " << attempt << ": " << *sent.error;
                m_logger.error(oss.str());
            }
            return sent;
        });

    if (!result.success) {
        m_logger.error("Chunk " + std::to_string(index) + " not accepted after " +
                       std::to_string(retry::DEFAULT_MAX_ATTEMPTS) + " attempts");
        upload_done(true);
        return;
    }
    if (!result.body.empty())
        m_logger.debug("  Body " + result.body);

    std::string parse_error;
    auto transferred = content_range::reconcile_transferred_size(result.body, part_size,
                                                                 snapshot, parse_error);
    if (!transferred) {
        m_logger.error(parse_error);
        upload_done(true);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_status_mutex);
        m_status.transferred_size += *transferred;
        m_status.transferred_parts = index + 1;
    }
    m_logger.debug("Part: " + std::to_string(index + 1) + " of: " +
                   std::to_string(snapshot.total_parts));
    report_progress(index, part_size);
}

void chunked_upload::upload_done(bool is_exception) {
    if (is_exception) {
        m_logger.error("Upload process done by exception");
    } else {
        m_logger.info("Upload process done");
    }

    std::lock_guard<std::mutex> lock(m_status_mutex);
    m_status.is_done = true;
    m_status.failed = is_exception;
    m_state = is_exception ? state::failed : state::succeeded;
}

void chunked_upload::report_progress(std::uint64_t index, std::int64_t part_size) {
    const upload_status current = status();

    using clock = std::chrono::steady_clock;
    double secs =
        std::chrono::duration_cast<std::chrono::duration<double>>(clock::now() - m_start_tp)
            .count();
    double bps = secs > 0.0 ? static_cast<double>(current.transferred_size) / secs : 0.0;

    m_logger.info("Uploaded " + byte_utils::format_bytes(current.transferred_size) + " of " +
                  byte_utils::format_bytes(current.total_size) + " (" +
                  byte_utils::format_rate(bps) + ")");

    if (m_on_progress) {
        progress_info p{index, part_size, current.transferred_size, current.total_size, bps};
        m_on_progress(p);
    }
}

const char* to_string(chunked_upload::state s) {
    switch (s) {
    case chunked_upload::state::pending:
        return "pending";
    case chunked_upload::state::running:
        return "running";
    case chunked_upload::state::succeeded:
        return "succeeded";
    case chunked_upload::state::failed:
        return "failed";
    }
    return "unknown";
}
