#include "io/byte_source.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace {
std::optional<upload_error> read_exact_from(std::istream& stream, std::string& buffer,
                                            std::size_t size) {
    buffer.resize(size);
    if (size == 0)
        return std::nullopt;

    stream.read(&buffer[0], static_cast<std::streamsize>(size));
    const auto n = static_cast<std::size_t>(stream.gcount());

    if (n == size)
        return std::nullopt;

    if (stream.bad()) {
        buffer.resize(n);
        return upload_error{upload_error_kind::io, "stream read failed after " +
                                                       std::to_string(n) + " bytes"};
    }

    std::ostringstream oss;
    oss << "unexpected end of stream: wanted " << size << " bytes, got " << n;
    buffer.resize(n);
    return upload_error{upload_error_kind::short_read, oss.str()};
}
} // namespace

std::optional<upload_error> stream_byte_source::read_exact(std::string& buffer, std::size_t size) {
    return read_exact_from(m_stream, buffer, size);
}

file_byte_source::~file_byte_source() {
    if (m_file.is_open())
        m_file.close();
}

std::optional<upload_error> file_byte_source::open() {
    std::error_code ec;
    auto status = std::filesystem::status(m_path, ec);
    if (ec)
        return upload_error{upload_error_kind::init, "stat " + m_path + ": " + ec.message()};
    if (!std::filesystem::is_regular_file(status))
        return upload_error{upload_error_kind::init, m_path + " is not a regular file"};

    auto file_size = std::filesystem::file_size(m_path, ec);
    if (ec)
        return upload_error{upload_error_kind::init, "stat " + m_path + ": " + ec.message()};

    errno = 0;
    m_file.open(m_path, std::ios::in | std::ios::binary);
    if (!m_file.is_open()) {
        std::string reason = errno != 0 ? std::strerror(errno) : "cannot open file";
        return upload_error{upload_error_kind::init, "open " + m_path + ": " + reason};
    }

    m_size = static_cast<std::int64_t>(file_size);
    return std::nullopt;
}

std::optional<upload_error> file_byte_source::close() {
    if (!m_file.is_open())
        return std::nullopt;

    // Drop eof/fail left behind by a short read so only the close outcome is checked
    m_file.clear();
    m_file.close();
    if (m_file.fail())
        return upload_error{upload_error_kind::io, "close " + m_path + " failed"};
    return std::nullopt;
}

std::optional<upload_error> file_byte_source::read_exact(std::string& buffer, std::size_t size) {
    if (!m_file.is_open())
        return upload_error{upload_error_kind::io, "read " + m_path + ": file is not open"};
    return read_exact_from(m_file, buffer, size);
}
