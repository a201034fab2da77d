#pragma once

#include <cctype>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

namespace byte_utils {

constexpr std::uint64_t KB = 1024ULL;
constexpr std::uint64_t MB = 1024ULL * KB;
constexpr std::uint64_t GB = 1024ULL * MB;

// 1536 -> "1.50 KB"
inline std::string format_bytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};

    int unit_index = 0;
    std::uint64_t scale = 1ULL;
    while (unit_index < 5 && bytes >= scale * 1024ULL) {
        scale *= 1024ULL;
        ++unit_index;
    }

    double in_unit = static_cast<double>(bytes) / static_cast<double>(scale);

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    if (unit_index == 0) {
        oss.precision(0);
    } else {
        oss.precision(in_unit < 10.0 ? 2 : (in_unit < 100.0 ? 1 : 0));
    }

    oss << in_unit << ' ' << units[unit_index];
    return oss.str();
}

inline std::string format_rate(double bytes_per_sec) {
    if (bytes_per_sec <= 0.0)
        return "0 B/s";
    return format_bytes(static_cast<std::uint64_t>(bytes_per_sec)) + "/s";
}

// Accepts a plain byte count or a count with a binary unit suffix:
// "1048576", "512K", "4MB", "1 GiB". Case insensitive.
inline std::optional<std::uint64_t> parse_size(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])))
        ++pos;
    if (pos == 0 || pos > 19)
        return std::nullopt;

    std::uint64_t value = std::stoull(text.substr(0, pos));

    std::string unit;
    for (size_t i = pos; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isspace(c))
            unit.push_back(static_cast<char>(std::toupper(c)));
    }

    std::uint64_t scale = 1;
    if (unit.empty() || unit == "B") {
        scale = 1;
    } else if (unit == "K" || unit == "KB" || unit == "KIB") {
        scale = KB;
    } else if (unit == "M" || unit == "MB" || unit == "MIB") {
        scale = MB;
    } else if (unit == "G" || unit == "GB" || unit == "GIB") {
        scale = GB;
    } else {
        return std::nullopt;
    }

    if (value > UINT64_MAX / scale)
        return std::nullopt;
    return value * scale;
}

} // namespace byte_utils
