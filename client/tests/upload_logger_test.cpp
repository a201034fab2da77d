#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "log/upload_logger.hpp"

TEST(UploadLoggerTest, RoutesSeveritiesToTheirSinks) {
    std::ostringstream debug_out, info_out, error_out;
    logger_options options;
    options.debug_sink = &debug_out;
    options.info_sink = &info_out;
    options.error_sink = &error_out;
    upload_logger logger(options);

    logger.debug("reading");
    logger.info("sending");
    logger.error("broken");

    EXPECT_EQ(debug_out.str().rfind("DEBUG\t", 0), 0u);
    EXPECT_NE(debug_out.str().find("reading\n"), std::string::npos);
    EXPECT_EQ(info_out.str().rfind("INFO\t", 0), 0u);
    EXPECT_NE(info_out.str().find("sending\n"), std::string::npos);
    EXPECT_EQ(error_out.str().rfind("ERROR\t", 0), 0u);
    EXPECT_NE(error_out.str().find("broken\n"), std::string::npos);
    EXPECT_EQ(info_out.str().find("broken"), std::string::npos);
}

TEST(UploadLoggerTest, NullSinkDiscards) {
    std::ostringstream info_out;
    logger_options options;
    options.info_sink = &info_out;
    options.error_sink = nullptr;
    upload_logger logger(options);

    EXPECT_FALSE(logger.debug_enabled());
    logger.debug("hidden");
    logger.error("also hidden");
    EXPECT_TRUE(info_out.str().empty());
}

TEST(UploadLoggerTest, TagIsPrefixedToMessages) {
    std::ostringstream info_out;
    logger_options options;
    options.info_sink = &info_out;
    upload_logger logger(options);
    logger.set_tag("upload 00FF");

    logger.info("Done");
    EXPECT_NE(info_out.str().find("[upload 00FF] Done"), std::string::npos);
}

TEST(UploadLoggerTest, DefaultsMatchConsoleLayout) {
    logger_options options;
    EXPECT_EQ(options.debug_sink, nullptr);
    EXPECT_EQ(options.info_sink, &std::cout);
    EXPECT_EQ(options.error_sink, &std::cerr);
}
