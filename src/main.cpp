#include <poll.h>

#include <cerrno>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <span>
#include <system_error>
#include <utility>

#include "mycore/config.hpp"
#include "mycore/logging.hpp"
#include "mynet/enums.hpp"
#include "mynet/handles.hpp"
#include "mynet/make_srvsock.hpp"
#include "myapp/exchange_service.hpp"
#include "myapp/state.hpp"


enum class ExitCode {
    ok = 0,
    failure = 1,
};

class MainReturn {
private:
    [[maybe_unused]]
    ExitCode code;

public:
    constexpr MainReturn(ExitCode e) noexcept
    : code {e} {}

    constexpr operator int() const noexcept {
        return static_cast<int>(code);
    }
};

std::atomic_flag is_running = ATOMIC_FLAG_INIT;

void handle_sigint([[maybe_unused]] int sig_id) {
    is_running.clear();
}


[[nodiscard]] auto ensure_uploads_dir(const std::filesystem::path& uploads_root) -> bool {
    using namespace ShelfHttpd;

    std::error_code fs_err;

    if (std::filesystem::is_directory(uploads_root, fs_err)) {
        return true;
    }

    Core::log_info("Uploads directory {} does not exist, and is being created", uploads_root.string());

    if (!std::filesystem::create_directories(uploads_root, fs_err) && fs_err) {
        Core::log_error("Startup ERR: failed to create uploads directory {}: {}", uploads_root.string(), fs_err.message());
        return false;
    }

    return true;
}


[[nodiscard]] auto run_server(const ShelfHttpd::Core::ServerConfig& config, ShelfHttpd::App::AppState& app_state) -> bool {
    using namespace ShelfHttpd;

    constexpr auto accept_poll_timeout_ms = 250;

    Net::CreateServerSocket listener_generator {config.port, config.backlog, Net::PollEvent::received};

    if (const auto& setup_error = listener_generator.setup_error(); !setup_error.empty()) {
        Core::log_error("Startup ERR: {}", setup_error);
        return false;
    }

    auto listener_pollfd = ([&listener_generator]() -> pollfd {
        while (true) {
            if (auto host_opt = listener_generator(); host_opt.has_value()) {
                if (auto temp_pollfd = *host_opt; temp_pollfd.fd != -1) {
                    return temp_pollfd;
                }
            } else {
                break;
            }
        }

        return { .fd = -1, .events = {}, .revents = {} };
    })();

    if (listener_pollfd.fd == -1) {
        Core::log_error("Startup ERR: failed to launch server- no address could be bound on port {}.", config.port);
        return false;
    }

    Net::ClientHandle listener_handle {listener_pollfd.fd};

    auto service_result = App::ExchangeService::create(app_state, config.worker_count);

    if (!service_result) {
        Core::log_error("Startup ERR: {}", service_result.error().message);
        return false;
    }

    auto& exchange_service = *service_result.value();

    Core::log_info("Server started on port {} with {} workers", config.port, exchange_service.worker_count());

    while (is_running.test()) {
        // Poll with a timeout so a SIGINT is noticed even when no client connects.
        if (const auto poll_n = poll(&listener_pollfd, 1, accept_poll_timeout_ms); poll_n == -1) {
            if (errno == EINTR) {
                continue;
            }

            Core::log_error("Event Loop ERR: failed to poll the listener.");
            break;
        } else if (poll_n == 0 || (listener_pollfd.revents & Net::poll_event_mask(Net::PollEvent::received)) == 0) {
            continue;
        }

        auto client_opt = Net::accept_client(listener_pollfd.fd);

        if (!client_opt) {
            Core::log_error("Encountered error accepting connection");
            continue;
        }

        exchange_service.serve(std::move(*client_opt));
    }

    Core::log_info("Event Loop LOG: Shutdown! Finishing queued connections...");

    // `exchange_service` drains its queue and joins the workers when `service_result` goes out of scope.
    return true;
}


int main(int argc, char* argv[]) {
    using namespace ShelfHttpd;

    auto config_result = Core::parse_server_config(std::span<const char* const> {argv, static_cast<std::size_t>(argc)});

    if (!config_result) {
        Core::log_error("{}", config_result.error());
        return MainReturn {ExitCode::failure};
    }

    const auto& config = config_result.value();

    if (!ensure_uploads_dir(config.uploads_root)) {
        return MainReturn {ExitCode::failure};
    }

    is_running.test_and_set();

    signal(SIGINT, handle_sigint);

    App::AppState app_state {config.uploads_root, config.templates_root};

    const auto serviced_ok = run_server(config, app_state);

    return MainReturn {
        (serviced_ok)
        ? ExitCode::ok
        : ExitCode::failure
    };
}
