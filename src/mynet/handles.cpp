#include <sys/socket.h>
#include <unistd.h>

#include <utility>

#include "mynet/handles.hpp"

namespace ShelfHttpd::Net {
    ClientHandle::ClientHandle() noexcept
    : m_fd {dud_fd} {}

    ClientHandle::ClientHandle(int fd) noexcept
    : m_fd {fd} {}

    ClientHandle::~ClientHandle() {
        reset();
    }

    ClientHandle::ClientHandle(ClientHandle&& other) noexcept
    : m_fd {std::exchange(other.m_fd, dud_fd)} {}

    ClientHandle& ClientHandle::operator=(ClientHandle&& other) noexcept {
        if (this != &other) {
            reset();
            m_fd = std::exchange(other.m_fd, dud_fd);
        }

        return *this;
    }

    auto ClientHandle::fd() const noexcept -> int {
        return m_fd;
    }

    auto ClientHandle::is_open() const noexcept -> bool {
        return m_fd >= 0;
    }

    void ClientHandle::reset() noexcept {
        if (m_fd >= 0) {
            close(m_fd);
            m_fd = dud_fd;
        }
    }

    auto accept_client(int listener_fd) noexcept -> std::optional<ClientHandle> {
        if (auto incoming_fd = accept(listener_fd, nullptr, nullptr); incoming_fd != -1) {
            return ClientHandle {incoming_fd};
        }

        return {};
    }
}
