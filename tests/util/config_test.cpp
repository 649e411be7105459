#include "respcodec/util/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace respcodec::util::test {

class ConfigTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "respcodec_config_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
};

TEST_F(ConfigTest, DefaultValues) {
    Config config;
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 6379);
    EXPECT_EQ(config.timeout_seconds, 30);
    EXPECT_EQ(config.max_depth, 64u);
    EXPECT_EQ(config.max_bulk_length, 512u * 1024 * 1024);
    EXPECT_EQ(config.log_level, LogLevel::Warn);
}

TEST_F(ConfigTest, LoadFile) {
    auto path = test_dir_ / "test.conf";
    {
        std::ofstream f(path);
        f << "host = \"10.0.0.5\"\n";
        f << "port = 7000\n";
        f << "timeout_seconds = 5\n";
        f << "max_depth = 8\n";
        f << "max_bulk_length = 1024\n";
        f << "log_level = debug\n";
    }

    auto config = Config::load_file(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->host, "10.0.0.5");
    EXPECT_EQ(config->port, 7000);
    EXPECT_EQ(config->timeout_seconds, 5);
    EXPECT_EQ(config->max_depth, 8u);
    EXPECT_EQ(config->max_bulk_length, 1024u);
    EXPECT_EQ(config->log_level, LogLevel::Debug);
}

TEST_F(ConfigTest, LoadFileWithComments) {
    auto path = test_dir_ / "test.conf";
    {
        std::ofstream f(path);
        f << "# This is a comment\n";
        f << "port = 9000\n";
        f << "\n";
        f << "# Another comment\n";
        f << "host = \"localhost\"\n";
    }

    auto config = Config::load_file(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->port, 9000);
    EXPECT_EQ(config->host, "localhost");
}

TEST_F(ConfigTest, LoadFileNotFound) {
    auto config = Config::load_file("/nonexistent/path/config.conf");
    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, LoadFileBadLogLevel) {
    auto path = test_dir_ / "bad.conf";
    {
        std::ofstream f(path);
        f << "log_level = loud\n";
    }

    EXPECT_THROW((void)Config::load_file(path), std::invalid_argument);
}

TEST_F(ConfigTest, ParseArgs) {
    const char* argv[] = {"program", "-p", "8080", "-H", "0.0.0.0", "-l", "debug",
                          "--max-depth", "16"};
    int argc = 9;

    auto config = Config::parse_args(argc, const_cast<char**>(argv));
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->port, 8080);
    EXPECT_EQ(config->host, "0.0.0.0");
    EXPECT_EQ(config->log_level, LogLevel::Debug);
    EXPECT_EQ(config->max_depth, 16u);
}

TEST_F(ConfigTest, ParseArgsHelp) {
    const char* argv[] = {"program", "--help"};
    int argc = 2;

    auto config = Config::parse_args(argc, const_cast<char**>(argv));
    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, ParseArgsRejectsUnknownOption) {
    const char* argv[] = {"program", "--binary"};
    int argc = 2;

    EXPECT_THROW((void)Config::parse_args(argc, const_cast<char**>(argv)),
                 std::invalid_argument);
}

TEST_F(ConfigTest, ParseArgsRejectsBadPort) {
    const char* argv[] = {"program", "-p", "70000"};
    int argc = 3;

    EXPECT_THROW((void)Config::parse_args(argc, const_cast<char**>(argv)),
                 std::invalid_argument);
}

TEST_F(ConfigTest, ParseArgsRejectsPortWithTrailingText) {
    const char* argv[] = {"program", "-p", "70x"};
    int argc = 3;

    EXPECT_THROW((void)Config::parse_args(argc, const_cast<char**>(argv)),
                 std::invalid_argument);
}

TEST_F(ConfigTest, ParseArgsRejectsNegativeLimits) {
    {
        const char* argv[] = {"program", "--max-depth", "-1"};
        EXPECT_THROW((void)Config::parse_args(3, const_cast<char**>(argv)),
                     std::invalid_argument);
    }
    {
        const char* argv[] = {"program", "--max-bulk-length", "-1"};
        EXPECT_THROW((void)Config::parse_args(3, const_cast<char**>(argv)),
                     std::invalid_argument);
    }
    {
        const char* argv[] = {"program", "-t", "-5"};
        EXPECT_THROW((void)Config::parse_args(3, const_cast<char**>(argv)),
                     std::invalid_argument);
    }
}

TEST_F(ConfigTest, ParseArgsRejectsMalformedLimits) {
    for (const char* bad : {"", "abc", "12abc", "+8", " 8", "99999999999999999999999"}) {
        const char* argv[] = {"program", "--max-depth", bad};
        EXPECT_THROW((void)Config::parse_args(3, const_cast<char**>(argv)),
                     std::invalid_argument)
            << "value '" << bad << "'";
    }
}

TEST_F(ConfigTest, ParseArgsRejectsLimitsOutOfRange) {
    {
        const char* argv[] = {"program", "--max-depth", "0"};
        EXPECT_THROW((void)Config::parse_args(3, const_cast<char**>(argv)),
                     std::invalid_argument);
    }
    {
        const char* argv[] = {"program", "--max-depth", "1025"};
        EXPECT_THROW((void)Config::parse_args(3, const_cast<char**>(argv)),
                     std::invalid_argument);
    }
    {
        const char* argv[] = {"program", "--max-bulk-length", "18446744073709551615"};
        EXPECT_THROW((void)Config::parse_args(3, const_cast<char**>(argv)),
                     std::invalid_argument);
    }
    {
        const char* argv[] = {"program", "--max-depth", "1024", "--max-bulk-length", "0"};
        auto config = Config::parse_args(5, const_cast<char**>(argv));
        ASSERT_TRUE(config.has_value());
        EXPECT_EQ(config->max_depth, 1024u);
        EXPECT_EQ(config->max_bulk_length, 0u);
    }
}

TEST_F(ConfigTest, LoadFileRejectsNegativeLimits) {
    auto path = test_dir_ / "negative.conf";
    {
        std::ofstream f(path);
        f << "max_depth = -1\n";
    }
    EXPECT_THROW((void)Config::load_file(path), std::invalid_argument);

    {
        std::ofstream f(path);
        f << "max_bulk_length = -1\n";
    }
    EXPECT_THROW((void)Config::load_file(path), std::invalid_argument);

    {
        std::ofstream f(path);
        f << "port = 6379abc\n";
    }
    EXPECT_THROW((void)Config::load_file(path), std::invalid_argument);
}

TEST_F(ConfigTest, FindConfigPath) {
    const char* argv[] = {"program", "-p", "1234", "--config", "/etc/resp.conf"};
    int argc = 5;

    EXPECT_EQ(Config::find_config_path(argc, const_cast<char**>(argv)).string(), "/etc/resp.conf");
    EXPECT_TRUE(Config::find_config_path(1, const_cast<char**>(argv)).empty());
}

TEST_F(ConfigTest, MergeConfigs) {
    Config defaults;
    Config file_config = defaults;
    Config cli_config = defaults;

    file_config.port = 8080;
    file_config.host = "0.0.0.0";
    file_config.max_depth = 10;

    cli_config.port = 9000;  // CLI overrides file

    auto result = Config::merge(file_config, cli_config, defaults);

    EXPECT_EQ(result.port, 9000);       // CLI wins
    EXPECT_EQ(result.host, "0.0.0.0");  // File wins (CLI was default)
    EXPECT_EQ(result.max_depth, 10u);
}

TEST_F(ConfigTest, DecoderOptions) {
    Config config;
    config.max_depth = 4;
    config.max_bulk_length = 100;

    auto options = config.decoder_options();
    EXPECT_EQ(options.max_depth, 4u);
    EXPECT_EQ(options.max_bulk_length, 100u);
}

}  // namespace respcodec::util::test
