#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <format>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "test_support.hpp"

namespace ShelfHttpd::Testing {
    constexpr std::string_view test_boundary = "----shelfhttpd-test-boundary";

    constexpr std::string_view index_template =
        "<html><body><ul>\n{{FILES_LIST}}\n</ul></body></html>\n";

    std::atomic<unsigned int> scratch_counter {0};

    ScratchDir::ScratchDir()
    : m_root {std::filesystem::temp_directory_path() / std::format("shelfhttpd-test-{}-{}", getpid(), scratch_counter.fetch_add(1))} {
        std::filesystem::remove_all(m_root);
        std::filesystem::create_directories(uploads());
        std::filesystem::create_directories(templates());

        write_file(templates() / "index.html", index_template);
        write_file(templates() / "upload.html", "<form action=\"/upload\" method=\"post\" enctype=\"multipart/form-data\"></form>\n");
        write_file(templates() / "page-not-found.html", "<h1>page not found</h1>\n");
        write_file(templates() / "bad-request.html", "<h1>bad request</h1>\n");
        write_file(templates() / "access-denied.html", "<h1>access denied</h1>\n");
        write_file(templates() / "server-error.html", "<h1>server error</h1>\n");
    }

    ScratchDir::~ScratchDir() {
        std::error_code fs_err;
        std::filesystem::remove_all(m_root, fs_err);
    }

    auto ScratchDir::root() const -> const std::filesystem::path& {
        return m_root;
    }

    auto ScratchDir::uploads() const -> std::filesystem::path {
        return m_root / "uploads";
    }

    auto ScratchDir::templates() const -> std::filesystem::path {
        return m_root / "templates";
    }

    void ScratchDir::write_file(const std::filesystem::path& path, std::string_view content) const {
        std::ofstream writer {path, std::ios::binary | std::ios::trunc};

        if (!writer.write(content.data(), static_cast<std::streamsize>(content.size()))) {
            throw std::runtime_error {std::format("cannot write test file {}", path.string())};
        }
    }

    auto read_text_file(const std::filesystem::path& path) -> std::string {
        std::ifstream reader {path, std::ios::binary};

        return {std::istreambuf_iterator<char> {reader}, std::istreambuf_iterator<char> {}};
    }


    SocketPair::SocketPair()
    : m_fds {-1, -1} {
        if (socketpair(AF_UNIX, SOCK_STREAM, 0, m_fds) == -1) {
            throw std::system_error {errno, std::generic_category(), "socketpair"};
        }
    }

    SocketPair::~SocketPair() {
        for (auto fd : m_fds) {
            if (fd != -1) {
                close(fd);
            }
        }
    }

    auto SocketPair::server_fd() const noexcept -> int {
        return m_fds[0];
    }

    auto SocketPair::client_fd() const noexcept -> int {
        return m_fds[1];
    }

    void SocketPair::send_from_client(std::string_view bytes) const {
        while (!bytes.empty()) {
            const auto sent_n = send(client_fd(), bytes.data(), bytes.size(), MSG_NOSIGNAL);

            if (sent_n <= 0) {
                throw std::system_error {errno, std::generic_category(), "send"};
            }

            bytes.remove_prefix(static_cast<std::size_t>(sent_n));
        }
    }

    void SocketPair::finish_client_writes() const {
        shutdown(client_fd(), SHUT_WR);
    }

    void SocketPair::close_server() {
        if (m_fds[0] != -1) {
            close(m_fds[0]);
            m_fds[0] = -1;
        }
    }

    auto SocketPair::release_server() noexcept -> int {
        return std::exchange(m_fds[0], -1);
    }

    void SocketPair::close_client() {
        if (m_fds[1] != -1) {
            close(m_fds[1]);
            m_fds[1] = -1;
        }
    }

    auto SocketPair::drain_client() const -> std::string {
        std::string received;
        char chunk[4096];

        while (true) {
            const auto got_n = recv(client_fd(), chunk, sizeof(chunk), 0);

            if (got_n <= 0) {
                break;
            }

            received.append(chunk, static_cast<std::size_t>(got_n));
        }

        return received;
    }


    auto make_multipart_body(std::string_view boundary, std::string_view file_name, std::string_view content) -> std::string {
        return std::format(
            "--{0}\r\n"
            "Content-Disposition: form-data; name=\"file\"; filename=\"{1}\"\r\n"
            "Content-Type: application/octet-stream\r\n"
            "\r\n"
            "{2}\r\n"
            "--{0}--\r\n",
            boundary, file_name, content
        );
    }

    auto make_upload_request(std::string_view file_name, std::string_view content) -> std::string {
        const auto body = make_multipart_body(test_boundary, file_name, content);

        return std::format(
            "POST /upload HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "Content-Type: multipart/form-data; boundary={}\r\n"
            "Content-Length: {}\r\n"
            "\r\n"
            "{}",
            test_boundary, body.size(), body
        );
    }
}
