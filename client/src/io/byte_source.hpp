#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <istream>
#include <optional>
#include <string>

#include "net/upload_error.hpp"

// Sequential reader the upload engine pulls chunk bytes from.
class byte_source {
public:
    virtual ~byte_source() = default;

    // Replaces `buffer` with exactly `size` bytes. short_read when the source ends
    // first, io on any other failure.
    virtual std::optional<upload_error> read_exact(std::string& buffer, std::size_t size) = 0;
};

// Reads from a caller owned stream; never closes it.
class stream_byte_source : public byte_source {
public:
    explicit stream_byte_source(std::istream& stream) : m_stream(stream) {}

    std::optional<upload_error> read_exact(std::string& buffer, std::size_t size) override;

private:
    std::istream& m_stream;
};

// Owns an input file for the lifetime of the object. The file is closed by
// close() or, at the latest, by the destructor.
class file_byte_source : public byte_source {
public:
    explicit file_byte_source(const std::string& path) : m_path(path) {}
    ~file_byte_source() override;

    file_byte_source(const file_byte_source&) = delete;
    file_byte_source& operator=(const file_byte_source&) = delete;

    // Stats and opens the file, the size is available through size() afterwards
    std::optional<upload_error> open();
    std::optional<upload_error> close();

    std::optional<upload_error> read_exact(std::string& buffer, std::size_t size) override;

    bool is_open() const {
        return m_file.is_open();
    }
    std::int64_t size() const {
        return m_size;
    }
    const std::string& path() const {
        return m_path;
    }

private:
    std::string m_path;
    std::ifstream m_file;
    std::int64_t m_size = 0;
};
