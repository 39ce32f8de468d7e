#ifndef SHELF_HTTPD_MYNET_MAKE_SRVSOCK_HPP
#define SHELF_HTTPD_MYNET_MAKE_SRVSOCK_HPP

#include <netdb.h>
#include <poll.h>

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include "mynet/enums.hpp"

namespace ShelfHttpd::Net {
    /**
     * @brief Walks the passive IPv4 addresses for a port, producing one listening socket per call until one binds.
     * @note Each call yields `{.fd = -1}` for a candidate that failed to bind, or an empty optional once all candidates are used up.
     */
    class CreateServerSocket {
    private:
        std::string m_setup_error;
        addrinfo* m_head_p;
        addrinfo* m_next_p;
        int m_backlog_n;
        short m_event_mask;

    public:
        template <std::same_as<PollEvent> FirstEv, std::same_as<PollEvent> ... Evs>
        CreateServerSocket(std::string_view port_sv, int backlog_n, FirstEv first_ev, Evs ... rest_evs)
        : m_setup_error {}, m_head_p {}, m_next_p {}, m_backlog_n {backlog_n}, m_event_mask {poll_event_mask(first_ev, rest_evs...)} {
            addrinfo host_hints {};
            host_hints.ai_family = AF_INET;
            host_hints.ai_socktype = SOCK_STREAM;
            host_hints.ai_flags = AI_PASSIVE;

            const std::string port_str {port_sv};

            if (const auto setup_status = getaddrinfo(nullptr, port_str.c_str(), &host_hints, &m_head_p); setup_status != 0) {
                m_setup_error = gai_strerror(setup_status);
                m_head_p = nullptr;
            } else {
                m_next_p = m_head_p;
            }
        }

        ~CreateServerSocket() noexcept;

        CreateServerSocket(const CreateServerSocket&) = delete;
        CreateServerSocket& operator=(const CreateServerSocket&) = delete;
        CreateServerSocket(CreateServerSocket&&) = delete;
        CreateServerSocket& operator=(CreateServerSocket&&) = delete;

        /// NOTE: Empty unless `getaddrinfo` failed during construction.
        [[nodiscard]] auto setup_error() const noexcept -> const std::string&;

        [[nodiscard]] auto operator()() noexcept -> std::optional<pollfd>;
    };
}

#endif
