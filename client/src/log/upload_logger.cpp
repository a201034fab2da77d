#include "log/upload_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

upload_logger::upload_logger(const logger_options& options) : m_options(options) {}

void upload_logger::debug(const std::string& message) const {
    write(m_options.debug_sink, "DEBUG", message);
}

void upload_logger::info(const std::string& message) const {
    write(m_options.info_sink, "INFO", message);
}

void upload_logger::error(const std::string& message) const {
    write(m_options.error_sink, "ERROR", message);
}

void upload_logger::write(std::ostream* sink, const char* level, const std::string& message) const {
    if (!sink)
        return;

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);

    // Format the whole line first so sinks shared between uploads get it in one write
    std::ostringstream line;
    line << level << '\t' << std::put_time(&local_tm, "%Y/%m/%d %H:%M:%S") << ' ';
    if (!m_tag.empty())
        line << '[' << m_tag << "] ";
    line << message << '\n';

    *sink << line.str() << std::flush;
}
