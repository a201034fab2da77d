#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "net/upload_status.hpp"

// Chunk boundary and Content-Range arithmetic. All sizes are in bytes and
// chunk_size must be positive.
namespace content_range {

// ceil(total_size / chunk_size); 0 for an empty payload
std::uint64_t count_parts(std::int64_t total_size, std::int64_t chunk_size);

// Bytes carried by chunk `index`, never negative. 0 means the payload is exhausted.
std::int64_t compute_part_size(std::uint64_t index, std::int64_t chunk_size,
                               std::int64_t total_size);

// Wire value "bytes {from}-{to}/{total}".
// The first chunk declares to == part_size (one past its last byte) while later
// chunks use min(chunk_size * (index + 1), total_size - 1). Receivers of this
// protocol depend on the asymmetry, keep it.
std::string format(std::uint64_t index, std::int64_t chunk_size, std::int64_t part_size,
                   std::int64_t total_size);

// Parses an accepted range "{from}-{to}/{total}" (an optional "bytes " prefix and
// a missing "/total" are tolerated) and returns `to`.
std::optional<std::int64_t> parse_accepted_end(const std::string& value, std::string& out_error);

// Number of bytes to add to status.transferred_size after a chunk was accepted.
// A non-empty response body is read as the server's accepted range, otherwise the
// requested part size is assumed. The result never takes transferred_size past
// total_size. Returns nullopt and fills out_error when the body is malformed.
std::optional<std::int64_t> reconcile_transferred_size(const std::string& response_body,
                                                       std::int64_t part_size,
                                                       const upload_status& status,
                                                       std::string& out_error);

} // namespace content_range
