#include "util/session_id.hpp"

#include <iomanip>
#include <random>
#include <sstream>

std::string generate_session_id() {
    std::random_device rd;
    std::uniform_int_distribution<unsigned int> dist(0, 0xFF);

    std::ostringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0');
    for (std::size_t i = 0; i < SESSION_ID_BYTES; ++i) {
        ss << std::setw(2) << dist(rd);
    }
    return ss.str();
}
