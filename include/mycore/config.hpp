#ifndef SHELF_HTTPD_MYCORE_CONFIG_HPP
#define SHELF_HTTPD_MYCORE_CONFIG_HPP

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ShelfHttpd::Core {
    constexpr std::string_view usage_text = "usage: ./shelfhttpd <port> <workers> [uploads-dir] [templates-dir]";

    struct ServerConfig {
        std::filesystem::path uploads_root;
        std::filesystem::path templates_root;
        std::string port;
        std::size_t worker_count;
        int backlog;
    };

    /// NOTE: Expects the full `argv` (program name included). Errors are usage messages for the console.
    [[nodiscard]] auto parse_server_config(std::span<const char* const> args) -> std::expected<ServerConfig, std::string>;
}

#endif
