#include "net/content_range.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {
std::string trim_whitespace(const std::string& str) {
    size_t first = 0;
    while (first < str.size() && std::isspace(static_cast<unsigned char>(str[first])))
        ++first;
    size_t last = str.size();
    while (last > first && std::isspace(static_cast<unsigned char>(str[last - 1])))
        --last;
    return str.substr(first, last - first);
}

bool parse_offset(const std::string& digits, std::int64_t& out) {
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    try {
        out = std::stoll(digits);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}
} // namespace

namespace content_range {

std::uint64_t count_parts(std::int64_t total_size, std::int64_t chunk_size) {
    if (total_size <= 0 || chunk_size <= 0)
        return 0;
    auto total = static_cast<std::uint64_t>(total_size);
    auto chunk = static_cast<std::uint64_t>(chunk_size);
    return total / chunk + (total % chunk != 0 ? 1 : 0);
}

std::int64_t compute_part_size(std::uint64_t index, std::int64_t chunk_size,
                               std::int64_t total_size) {
    if (chunk_size <= 0 || total_size <= 0)
        return 0;
    // index * chunk_size would already be at or past the end
    if (index >= count_parts(total_size, chunk_size))
        return 0;

    std::int64_t offset = static_cast<std::int64_t>(index) * chunk_size;
    return std::max<std::int64_t>(0, std::min(chunk_size, total_size - offset));
}

std::string format(std::uint64_t index, std::int64_t chunk_size, std::int64_t part_size,
                   std::int64_t total_size) {
    std::uint64_t from = 0;
    std::uint64_t to = 0;
    if (index == 0) {
        to = static_cast<std::uint64_t>(part_size);
    } else {
        from = static_cast<std::uint64_t>(chunk_size) * index;
        to = std::min(static_cast<std::uint64_t>(chunk_size) * (index + 1),
                      static_cast<std::uint64_t>(total_size - 1));
    }

    std::ostringstream oss;
    oss << "bytes " << from << "-" << to << "/" << total_size;
    return oss.str();
}

std::optional<std::int64_t> parse_accepted_end(const std::string& value, std::string& out_error) {
    std::string range = trim_whitespace(value);
    if (range.compare(0, 6, "bytes ") == 0)
        range = trim_whitespace(range.substr(6));

    std::string from_to = range.substr(0, range.find('/'));
    size_t dash_pos = from_to.find('-');
    if (dash_pos == std::string::npos) {
        out_error = "accepted range has no '-': \"" + value + "\"";
        return std::nullopt;
    }

    std::int64_t from = 0;
    std::int64_t to = 0;
    if (!parse_offset(from_to.substr(0, dash_pos), from) ||
        !parse_offset(from_to.substr(dash_pos + 1), to)) {
        out_error = "accepted range is not numeric: \"" + value + "\"";
        return std::nullopt;
    }

    return to;
}

std::optional<std::int64_t> reconcile_transferred_size(const std::string& response_body,
                                                       std::int64_t part_size,
                                                       const upload_status& status,
                                                       std::string& out_error) {
    std::int64_t delta = part_size;
    if (!trim_whitespace(response_body).empty()) {
        auto accepted = parse_accepted_end(response_body, out_error);
        if (!accepted)
            return std::nullopt;
        delta = *accepted;
    }

    std::int64_t remaining = std::max<std::int64_t>(0, status.total_size - status.transferred_size);
    return std::max<std::int64_t>(0, std::min(delta, remaining));
}

} // namespace content_range
