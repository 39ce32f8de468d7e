#include <sys/socket.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include "mynet/io_funcs.hpp"

namespace ShelfHttpd::Net {
    constexpr auto recv_chunk_size = 4096UZ;

    auto socket_read_line(int fd, std::string& dest, std::size_t max_n) -> IOResult<LineStatus> {
        constexpr auto cr_v = '\r';
        constexpr auto lf_v = '\n';

        dest.clear();

        char temp_c = '\0';

        while (true) {
            if (const ssize_t temp_rc = recv(fd, &temp_c, 1, 0); temp_rc > 0) {
                if (temp_c == lf_v) {
                    return LineStatus::complete;
                } else if (temp_c == cr_v) {
                    continue;
                }

                if (dest.length() >= max_n) {
                    return LineStatus::too_long;
                }

                dest.push_back(temp_c);
            } else if (temp_rc == 0) {
                return LineStatus::peer_closed;
            } else if (errno == EINTR) {
                continue;
            } else {
                return std::unexpected {std::format("Invalid read with fd in io_funcs.cpp::socket_read_line(): {}", std::strerror(errno))};
            }
        }
    }

    auto socket_read_exact(int fd, std::size_t n, std::vector<char>& dest) -> IOResult<std::size_t> {
        std::array<char, recv_chunk_size> chunk_buffer {};
        std::size_t done_rc = 0;

        while (done_rc < n) {
            const auto pending_rc = std::min(n - done_rc, chunk_buffer.size());

            if (const ssize_t temp_rc = recv(fd, chunk_buffer.data(), pending_rc, 0); temp_rc > 0) {
                dest.insert(dest.end(), chunk_buffer.begin(), chunk_buffer.begin() + temp_rc);
                done_rc += static_cast<std::size_t>(temp_rc);
            } else if (temp_rc == 0) {
                break;
            } else if (errno == EINTR) {
                continue;
            } else {
                return std::unexpected {std::format("Invalid read with fd in io_funcs.cpp::socket_read_exact(): {}", std::strerror(errno))};
            }
        }

        return {done_rc};
    }

    auto socket_write_n(int fd, const char* src, std::size_t n) noexcept -> IOResult<std::size_t> {
        std::size_t done_wc = 0;

        while (done_wc < n) {
            // MSG_NOSIGNAL: writing to a hung-up client fails with EPIPE instead of raising SIGPIPE.
            if (const ssize_t temp_wc = send(fd, src + done_wc, n - done_wc, MSG_NOSIGNAL); temp_wc > 0) {
                done_wc += static_cast<std::size_t>(temp_wc);
            } else if (temp_wc < 0 && errno == EINTR) {
                continue;
            } else {
                return std::unexpected {"Bad write with fd in io_funcs.cpp::socket_write_n(): peer stopped accepting bytes"};
            }
        }

        return {done_wc};
    }
}
