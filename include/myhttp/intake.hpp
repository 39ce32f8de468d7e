#ifndef SHELF_HTTPD_MYHTTP_INTAKE_HPP
#define SHELF_HTTPD_MYHTTP_INTAKE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mycore/errors.hpp"
#include "myhttp/body_extract.hpp"
#include "myhttp/msgs.hpp"

namespace ShelfHttpd::Http {
    struct IntakeConfig {
        std::size_t max_line_length = 8192;
        std::size_t max_header_count = 100;
    };

    /**
     * @brief Parses one HTTP/1.1 request from a connected socket.
     * @note Parsing is all-or-nothing: on any failure, no part of the request is returned. Socket failures map to `Core::ErrorKind::io` and structural violations to `Core::ErrorKind::invalid`.
     */
    class HttpIntake {
    private:
        enum class State : unsigned int {
            httpin_state_request_line,
            httpin_state_header,
            httpin_state_body,
            httpin_state_error,
            httpin_state_done,
        };

        struct RawReqLine {
            std::string rel_uri;
            std::string version;
            Verb verb;
        };

        struct RawHeader {
            std::string key;
            std::string value;
        };

        std::vector<BodyExtractorPtr> m_extractors;
        std::string m_line;
        Request m_temp;
        std::optional<Core::AppError> m_error;
        State m_state;
        std::size_t m_max_line_length;
        std::size_t m_max_header_count;

        [[nodiscard]] auto fail(Core::AppError error) -> State;

        [[nodiscard]] auto handle_state_request_line(int fd) -> State;
        [[nodiscard]] auto handle_state_header(int fd) -> State;
        [[nodiscard]] auto handle_state_body(int fd) -> State;

    public:
        /// NOTE: Registers `MultipartExtractor` as the only body decoder.
        explicit HttpIntake(IntakeConfig config);

        HttpIntake(IntakeConfig config, std::vector<BodyExtractorPtr> extractors);

        [[nodiscard]] static auto parse_request_line(std::string_view sv) -> Core::Result<RawReqLine>;
        [[nodiscard]] static auto parse_request_header(std::string_view sv) -> Core::Result<RawHeader>;

        [[nodiscard]] auto operator()(int fd) -> Core::Result<Request>;
    };
}

#endif
