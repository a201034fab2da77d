#pragma once

#include <cstdint>

struct upload_status {
    std::int64_t total_size = 0;
    std::int64_t transferred_size = 0;
    std::uint64_t total_parts = 0;
    std::uint64_t transferred_parts = 0;
    bool is_done = false;
    bool failed = false;

    bool operator==(const upload_status& other) const {
        return total_size == other.total_size && transferred_size == other.transferred_size &&
               total_parts == other.total_parts && transferred_parts == other.transferred_parts &&
               is_done == other.is_done && failed == other.failed;
    }
    bool operator!=(const upload_status& other) const {
        return !(*this == other);
    }
};
