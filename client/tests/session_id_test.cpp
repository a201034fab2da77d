#include <gtest/gtest.h>

#include <cctype>
#include <set>
#include <string>

#include "util/session_id.hpp"

TEST(SessionIdTest, IsFixedWidthUpperHex) {
    const std::string id = generate_session_id();
    ASSERT_EQ(id.size(), 2 * SESSION_ID_BYTES);
    for (char c : id) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << id;
        EXPECT_FALSE(std::islower(static_cast<unsigned char>(c))) << id;
    }
}

TEST(SessionIdTest, DiffersBetweenCalls) {
    std::set<std::string> ids;
    for (int i = 0; i < 32; ++i)
        ids.insert(generate_session_id());
    EXPECT_EQ(ids.size(), 32u);
}
