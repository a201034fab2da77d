#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

#include "config/cli_args.hpp"

namespace {
// Owns the strings behind an argv array
class command_line {
public:
    command_line(std::initializer_list<std::string> args) : m_args{"chunkup"} {
        m_args.insert(m_args.end(), args.begin(), args.end());
        for (auto& arg : m_args)
            m_argv.push_back(&arg[0]);
    }

    command_line(const command_line&) = delete;
    command_line& operator=(const command_line&) = delete;

    int argc() const {
        return static_cast<int>(m_argv.size());
    }

    char** argv() {
        return m_argv.data();
    }

private:
    std::vector<std::string> m_args;
    std::vector<char*> m_argv;
};

bool parse(command_line cmd, cli_args& args, std::string& error) {
    return parse_cli_args(cmd.argc(), cmd.argv(), args, error);
}
} // namespace

TEST(CliArgsTest, UrlAndSource) {
    cli_args args;
    std::string error;
    ASSERT_TRUE(parse({"--chunk-size", "4MB", "https://files.test/up", "data.bin"}, args, error))
        << error;
    ASSERT_TRUE(args.url.has_value());
    EXPECT_EQ(*args.url, "https://files.test/up");
    EXPECT_EQ(args.source, "data.bin");
    EXPECT_EQ(*args.chunk_size, "4MB");
}

TEST(CliArgsTest, SourceOnlyLeavesUrlToConfig) {
    cli_args args;
    std::string error;
    ASSERT_TRUE(parse({"--config", "upload.json", "-"}, args, error)) << error;
    EXPECT_FALSE(args.url.has_value());
    EXPECT_EQ(args.source, "-");
    EXPECT_EQ(*args.config_path, "upload.json");
}

TEST(CliArgsTest, RejectsBadCommandLines) {
    cli_args args;
    std::string error;
    EXPECT_FALSE(parse({}, args, error));
    EXPECT_FALSE(parse({"a", "b", "c"}, args, error));
    EXPECT_FALSE(parse({"--bogus", "a"}, args, error));
    EXPECT_EQ(error, "unknown option --bogus");
    EXPECT_FALSE(parse({"file.bin", "--timeout"}, args, error));
    EXPECT_EQ(error, "--timeout requires a value");
}

TEST(CliArgsTest, ConfigUrlIsUsedWhenCommandLineHasNone) {
    upload_config config;
    config.url = "https://from-config.test/up";

    cli_args args;
    args.source = "file.bin";
    std::string error;
    ASSERT_TRUE(apply_cli_overrides(args, config, error)) << error;
    EXPECT_EQ(config.url, "https://from-config.test/up");
}

TEST(CliArgsTest, CommandLineUrlOverridesConfig) {
    upload_config config;
    config.url = "https://from-config.test/up";

    cli_args args;
    args.url = "https://from-cli.test/up";
    args.source = "file.bin";
    std::string error;
    ASSERT_TRUE(apply_cli_overrides(args, config, error)) << error;
    EXPECT_EQ(config.url, "https://from-cli.test/up");
}

TEST(CliArgsTest, MissingUrlIsRejected) {
    upload_config config;
    cli_args args;
    args.source = "file.bin";
    std::string error;
    EXPECT_FALSE(apply_cli_overrides(args, config, error));
    EXPECT_NE(error.find("no upload URL"), std::string::npos);
}

TEST(CliArgsTest, AppliesOverrides) {
    upload_config config;
    config.headers["X-Tenant"] = "1";

    cli_args args;
    args.url = "https://files.test/up";
    args.method = "POST";
    args.chunk_size = "512K";
    args.headers = {"X-Tenant: 2", "Authorization: Bearer t"};
    args.timeout = "30";
    args.verbose = true;
    std::string error;
    ASSERT_TRUE(apply_cli_overrides(args, config, error)) << error;
    EXPECT_EQ(config.method, "POST");
    EXPECT_EQ(config.chunk_size, 512 * 1024);
    EXPECT_EQ(config.headers.at("X-Tenant"), "2");
    EXPECT_EQ(config.headers.at("Authorization"), "Bearer t");
    EXPECT_EQ(config.timeout_seconds, 30);
    EXPECT_TRUE(config.verbose);
}

TEST(CliArgsTest, RejectsEmptyMethod) {
    upload_config config;
    cli_args args;
    args.url = "https://files.test/up";
    args.method = "";
    std::string error;
    EXPECT_FALSE(apply_cli_overrides(args, config, error));
    EXPECT_EQ(error, "method must not be empty");
}

TEST(CliArgsTest, RejectsInvalidTimeouts) {
    for (const char* timeout : {"-5", "12abc", "abc", ""}) {
        upload_config config;
        cli_args args;
        args.url = "https://files.test/up";
        args.timeout = timeout;
        std::string error;
        EXPECT_FALSE(apply_cli_overrides(args, config, error)) << "timeout " << timeout;
    }
}

TEST(CliArgsTest, RejectsInvalidChunkSizeAndHeader) {
    std::string error;
    {
        upload_config config;
        cli_args args;
        args.url = "https://files.test/up";
        args.chunk_size = "0";
        EXPECT_FALSE(apply_cli_overrides(args, config, error));
    }
    {
        upload_config config;
        cli_args args;
        args.url = "https://files.test/up";
        args.headers = {"no colon"};
        EXPECT_FALSE(apply_cli_overrides(args, config, error));
    }
}
