#include <charconv>
#include <format>

#include "mycore/config.hpp"

namespace ShelfHttpd::Core {
    constexpr auto default_backlog = 16;
    constexpr auto max_port_number = 65535;
    constexpr auto max_worker_count = 256UZ;

    [[nodiscard]] static auto parse_number(std::string_view text) noexcept -> std::optional<std::size_t> {
        std::size_t value = 0;
        const auto text_end = text.data() + text.length();

        if (auto [parse_end, parse_errc] = std::from_chars(text.data(), text_end, value); parse_errc != std::errc {} || parse_end != text_end) {
            return {};
        }

        return value;
    }

    auto parse_server_config(std::span<const char* const> args) -> std::expected<ServerConfig, std::string> {
        if (args.size() < 3 || args.size() > 5) {
            return std::unexpected {std::string {usage_text}};
        }

        std::string_view port_arg {args[1]};

        if (const auto port_n = parse_number(port_arg); !port_n || *port_n == 0 || *port_n > max_port_number) {
            return std::unexpected {std::format("Setup ERR: invalid port '{}'!\n{}", port_arg, usage_text)};
        }

        const auto worker_n = parse_number(args[2]);

        if (!worker_n || *worker_n < 1 || *worker_n > max_worker_count) {
            return std::unexpected {std::format("Setup ERR: worker count must be within 1..{}!\n{}", max_worker_count, usage_text)};
        }

        return ServerConfig {
            .uploads_root = (args.size() >= 4) ? std::filesystem::path {args[3]} : std::filesystem::path {"uploads"},
            .templates_root = (args.size() == 5) ? std::filesystem::path {args[4]} : std::filesystem::path {"templates"},
            .port = std::string {port_arg},
            .worker_count = *worker_n,
            .backlog = default_backlog,
        };
    }
}
