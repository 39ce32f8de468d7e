#include <gtest/gtest.h>

#include <array>
#include <span>

#include "mycore/config.hpp"

using namespace ShelfHttpd;

namespace {

template <std::size_t N>
auto parse(const std::array<const char*, N>& args) {
    return Core::parse_server_config(std::span<const char* const> {args});
}

} // namespace

// NOLINTNEXTLINE
TEST(server_config, defaults) {
    auto config = parse(std::array {"shelfhttpd", "8080", "4"});

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->port, "8080");
    EXPECT_EQ(config->worker_count, 4U);
    EXPECT_EQ(config->uploads_root, std::filesystem::path {"uploads"});
    EXPECT_EQ(config->templates_root, std::filesystem::path {"templates"});
    EXPECT_EQ(config->backlog, 16);
}

// NOLINTNEXTLINE
TEST(server_config, custom_directories) {
    auto config = parse(std::array {"shelfhttpd", "9000", "1", "/srv/files", "/srv/pages"});

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->uploads_root, std::filesystem::path {"/srv/files"});
    EXPECT_EQ(config->templates_root, std::filesystem::path {"/srv/pages"});
}

// NOLINTNEXTLINE
TEST(server_config, rejects_bad_arguments) {
    EXPECT_FALSE(parse(std::array {"shelfhttpd"}).has_value());
    EXPECT_FALSE(parse(std::array {"shelfhttpd", "8080"}).has_value());
    EXPECT_FALSE(parse(std::array {"shelfhttpd", "http", "4"}).has_value());
    EXPECT_FALSE(parse(std::array {"shelfhttpd", "0", "4"}).has_value());
    EXPECT_FALSE(parse(std::array {"shelfhttpd", "70000", "4"}).has_value());
    EXPECT_FALSE(parse(std::array {"shelfhttpd", "8080", "0"}).has_value());
    EXPECT_FALSE(parse(std::array {"shelfhttpd", "8080", "4x"}).has_value());
    EXPECT_FALSE(parse(std::array {"shelfhttpd", "8080", "4", "a", "b", "c"}).has_value());
}

// NOLINTNEXTLINE
TEST(server_config, error_mentions_usage) {
    auto config = parse(std::array {"shelfhttpd", "8080", "-1"});

    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find(Core::usage_text), std::string::npos);
}
