#ifndef SHELF_HTTPD_MYNET_HANDLES_HPP
#define SHELF_HTTPD_MYNET_HANDLES_HPP

#include <optional>

namespace ShelfHttpd::Net {
    /// NOTE: Sole owner of one connected client socket, closing it on destruction. Moves transfer ownership.
    class ClientHandle {
    private:
        static constexpr auto dud_fd = -1;

        int m_fd;

    public:
        ClientHandle() noexcept;
        explicit ClientHandle(int fd) noexcept;
        ~ClientHandle();

        ClientHandle(const ClientHandle&) = delete;
        ClientHandle& operator=(const ClientHandle&) = delete;
        ClientHandle(ClientHandle&& other) noexcept;
        ClientHandle& operator=(ClientHandle&& other) noexcept;

        [[nodiscard]] auto fd() const noexcept -> int;

        [[nodiscard]] auto is_open() const noexcept -> bool;

        void reset() noexcept;
    };

    /// NOTE: Accepts one pending connection from a listening socket, if any.
    [[nodiscard]] auto accept_client(int listener_fd) noexcept -> std::optional<ClientHandle>;
}

#endif
