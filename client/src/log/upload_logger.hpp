#pragma once

#include <iostream>
#include <ostream>
#include <string>

// Where each severity goes. A null sink discards that severity.
struct logger_options {
    std::ostream* debug_sink = nullptr;
    std::ostream* info_sink = &std::cout;
    std::ostream* error_sink = &std::cerr;
};

// Line oriented logger: "<LEVEL>\t<yyyy/mm/dd hh:mm:ss> [<tag>] <message>"
class upload_logger {
public:
    explicit upload_logger(const logger_options& options = logger_options());

    void set_tag(const std::string& tag) {
        m_tag = tag;
    }

    void debug(const std::string& message) const;
    void info(const std::string& message) const;
    void error(const std::string& message) const;

    bool debug_enabled() const {
        return m_options.debug_sink != nullptr;
    }

private:
    void write(std::ostream* sink, const char* level, const std::string& message) const;

    logger_options m_options;
    std::string m_tag;
};
