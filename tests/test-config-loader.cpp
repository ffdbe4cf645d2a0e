//
// Created by Aiziboy on 2025/12/12.
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

#include <routix/utils/config/ConfigLoader.hpp>

using routix::ConfigLoader;

class ConfigLoaderTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() / (std::string("routix-config-") + info->name());
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        const auto path = dir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
};

TEST_F(ConfigLoaderTest, EmptyDocumentUsesDefaults) {
    const auto config = ConfigLoader::parse("");
    EXPECT_EQ(config.app.name, "Routix");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.ip_v4, "0.0.0.0");
    EXPECT_EQ(config.server.keep_alive_ms, 180000u);
    EXPECT_EQ(config.server.initial_timeout_ms, 10000u);
    EXPECT_EQ(config.server.max_request_size_bytes, 1024u * 1024u);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.logging.output_type, "console");
}

TEST_F(ConfigLoaderTest, ParsesAllSections) {
    const auto config = ConfigLoader::parse(R"(
[app]
name = "orders"

[server]
port = 9090
ip_v4 = "127.0.0.1"
io_threads = 3
keep_alive_ms = 5000
initial_timeout_ms = 2000
max_request_size_bytes = 4096

[logging]
level = "debug"
output_type = "file"
file_path = "/tmp/orders.log"
max_size_mb = 20
max_files = 3
)");

    EXPECT_EQ(config.app.name, "orders");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.ip_v4, "127.0.0.1");
    EXPECT_EQ(config.server.io_threads, 3);
    EXPECT_EQ(config.server.keep_alive_ms, 5000u);
    EXPECT_EQ(config.server.initial_timeout_ms, 2000u);
    EXPECT_EQ(config.server.max_request_size_bytes, 4096u);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.output_type, "file");
    EXPECT_EQ(config.logging.file_path, "/tmp/orders.log");
    EXPECT_EQ(config.logging.max_size_mb, 20);
    EXPECT_EQ(config.logging.max_files, 3);
}

TEST_F(ConfigLoaderTest, ZeroIoThreadsIsDerivedFromHardware) {
    const auto config = ConfigLoader::parse("[server]\nio_threads = 0\n");
    const unsigned hc = std::thread::hardware_concurrency();
    const unsigned expected = hc > 1 ? hc - 1 : 1;
    EXPECT_EQ(config.server.io_threads, expected);
}

TEST_F(ConfigLoaderTest, RejectsInvalidValues) {
    EXPECT_THROW(ConfigLoader::parse("[server]\nport = 0\n"), std::runtime_error);
    EXPECT_THROW(ConfigLoader::parse("[server]\nmax_request_size_bytes = 0\n"), std::runtime_error);
    EXPECT_THROW(ConfigLoader::parse("[server]\nkeep_alive_ms = 0\n"), std::runtime_error);
}

TEST_F(ConfigLoaderTest, SyntaxErrorIsRuntimeError) {
    EXPECT_THROW(ConfigLoader::parse("[server\nport = 1"), std::runtime_error);
}

TEST_F(ConfigLoaderTest, LoadsFile) {
    const auto path = write("config.toml", "[server]\nport = 7001\n");
    EXPECT_EQ(ConfigLoader::load(path).server.port, 7001);
}

TEST_F(ConfigLoaderTest, MissingFileIsRuntimeError) {
    EXPECT_THROW(ConfigLoader::load((dir / "absent.toml").string()), std::runtime_error);
}

TEST_F(ConfigLoaderTest, ActiveProfileSwitchesFile) {
    const auto path = write("config.toml", "active_profile = \"dev\"\n[server]\nport = 7001\n");
    write("config-dev.toml", "[app]\nname = \"dev-app\"\n[server]\nport = 7002\n");

    const auto config = ConfigLoader::load(path);
    EXPECT_EQ(config.server.port, 7002);
    EXPECT_EQ(config.app.name, "dev-app");
}

TEST_F(ConfigLoaderTest, UnknownProfileIsRejected) {
    const auto path = write("config.toml", "active_profile = \"staging\"\n");
    EXPECT_THROW(ConfigLoader::load(path), std::runtime_error);
}
