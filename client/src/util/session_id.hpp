#pragma once

#include <cstddef>
#include <string>

// Width of the random part in bytes; the hex form is twice as long
constexpr std::size_t SESSION_ID_BYTES = 8;

// Fresh upper-case hex token drawn from std::random_device
std::string generate_session_id();
