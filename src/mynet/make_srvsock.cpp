#include <sys/socket.h>
#include <unistd.h>
#include <netdb.h>

#include "mynet/make_srvsock.hpp"

namespace ShelfHttpd::Net {
    CreateServerSocket::~CreateServerSocket() noexcept {
        if (m_head_p != nullptr) {
            freeaddrinfo(m_head_p);
            m_head_p = nullptr;
        }
    }

    auto CreateServerSocket::setup_error() const noexcept -> const std::string& {
        return m_setup_error;
    }

    auto CreateServerSocket::operator()() noexcept -> std::optional<pollfd> {
        if (!m_next_p) {
            return {};
        }

        const auto candidate_p = m_next_p;
        m_next_p = m_next_p->ai_next;

        auto temp_fd = socket(candidate_p->ai_family, candidate_p->ai_socktype, candidate_p->ai_protocol);

        if (temp_fd == -1) {
            return {{.fd = -1, .events = 0, .revents = 0}};
        }

        // SO_REUSEADDR: rebinding succeeds while old connections still sit in TIME_WAIT.
        if (int reuse_flag = 1; setsockopt(temp_fd, SOL_SOCKET, SO_REUSEADDR, &reuse_flag, sizeof(reuse_flag)) == -1) {
            close(temp_fd);

            return {{.fd = -1, .events = 0, .revents = 0}};
        }

        if (bind(temp_fd, candidate_p->ai_addr, candidate_p->ai_addrlen) < 0) {
            close(temp_fd);

            return {{.fd = -1, .events = 0, .revents = 0}};
        }

        if (listen(temp_fd, m_backlog_n) == -1) {
            close(temp_fd);

            return {{.fd = -1, .events = 0, .revents = 0}};
        }

        return pollfd {
            .fd = temp_fd,
            .events = m_event_mask,
            .revents = 0,
        };
    }
}
