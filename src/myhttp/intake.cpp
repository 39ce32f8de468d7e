#include <charconv>
#include <format>
#include <utility>

#include "mycore/text.hpp"
#include "mynet/io_funcs.hpp"
#include "myhttp/headers.hpp"
#include "myhttp/intake.hpp"

namespace ShelfHttpd::Http {
    constexpr auto request_line_token_count = 3UZ;

    auto HttpIntake::parse_request_line(std::string_view sv) -> Core::Result<RawReqLine> {
        std::vector<std::string_view> lexemes;

        while (true) {
            sv = Core::trim_view(sv);

            if (sv.empty()) {
                break;
            }

            auto lexeme_end = 0UZ;

            while (lexeme_end < sv.length() && !Core::is_space(sv[lexeme_end])) {
                ++lexeme_end;
            }

            lexemes.emplace_back(sv.substr(0, lexeme_end));
            sv.remove_prefix(lexeme_end);
        }

        if (lexemes.size() != request_line_token_count) {
            return Core::make_error(Core::ErrorKind::invalid, std::format("Request line needs 3 tokens, found {}", lexemes.size()));
        }

        auto verb = verb_name_to_enum(lexemes[0]);

        if (!verb) {
            return std::unexpected {std::move(verb.error())};
        }

        return RawReqLine {
            .rel_uri = std::string {lexemes[1]},
            .version = std::string {lexemes[2]},
            .verb = verb.value(),
        };
    }

    auto HttpIntake::parse_request_header(std::string_view sv) -> Core::Result<RawHeader> {
        const auto colon_pos = sv.find(':');

        if (colon_pos == std::string_view::npos) {
            return Core::make_error(Core::ErrorKind::invalid, "Error parsing headers: missing ':'");
        }

        const auto key_sv = Core::trim_view(sv.substr(0, colon_pos));

        if (key_sv.empty()) {
            return Core::make_error(Core::ErrorKind::invalid, "Error parsing headers: empty header name");
        }

        return RawHeader {
            .key = to_header_case(key_sv),
            .value = std::string {Core::trim_view(sv.substr(colon_pos + 1))},
        };
    }

    auto HttpIntake::fail(Core::AppError error) -> State {
        m_error = std::move(error);

        return State::httpin_state_error;
    }

    auto HttpIntake::handle_state_request_line(int fd) -> State {
        auto io_result = Net::socket_read_line(fd, m_line, m_max_line_length);

        if (!io_result) {
            return fail({.message = std::format("Error reading request: {}", io_result.error()), .kind = Core::ErrorKind::io});
        } else if (const auto line_status = io_result.value(); line_status == Net::LineStatus::peer_closed) {
            return fail({.message = "Error reading request: connection closed before request line", .kind = Core::ErrorKind::io});
        } else if (line_status == Net::LineStatus::too_long) {
            return fail({.message = "Request line exceeds length limit", .kind = Core::ErrorKind::invalid});
        }

        auto request_line = parse_request_line(m_line);

        if (!request_line) {
            return fail(std::move(request_line.error()));
        }

        auto& [req_path, req_version, req_verb] = request_line.value();

        m_temp.path = std::move(req_path);
        m_temp.version = std::move(req_version);
        m_temp.http_verb = req_verb;

        return State::httpin_state_header;
    }

    auto HttpIntake::handle_state_header(int fd) -> State {
        auto io_result = Net::socket_read_line(fd, m_line, m_max_line_length);

        if (!io_result) {
            return fail({.message = std::format("Error reading headers: {}", io_result.error()), .kind = Core::ErrorKind::io});
        } else if (const auto line_status = io_result.value(); line_status == Net::LineStatus::peer_closed) {
            return fail({.message = "Error reading headers: request ended before blank line", .kind = Core::ErrorKind::invalid});
        } else if (line_status == Net::LineStatus::too_long) {
            return fail({.message = "Header line exceeds length limit", .kind = Core::ErrorKind::invalid});
        }

        // An empty line ends the header block.
        if (m_line.empty()) {
            return State::httpin_state_body;
        }

        if (m_temp.headers.size() >= m_max_header_count) {
            return fail({.message = "Too many request headers", .kind = Core::ErrorKind::invalid});
        }

        auto header = parse_request_header(m_line);

        if (!header) {
            return fail(std::move(header.error()));
        }

        auto& [key, value] = header.value();
        m_temp.headers.insert_or_assign(std::move(key), std::move(value));

        return State::httpin_state_header;
    }

    auto HttpIntake::handle_state_body(int fd) -> State {
        const auto content_length_p = m_temp.header(HeaderNames::content_length);
        const auto content_type_p = m_temp.header(HeaderNames::content_type);
        std::size_t content_length = 0;

        if (content_length_p != nullptr) {
            const auto length_sv = Core::trim_view(*content_length_p);
            const auto length_end = length_sv.data() + length_sv.length();

            if (auto [parse_end, parse_errc] = std::from_chars(length_sv.data(), length_end, content_length); parse_errc != std::errc {} || parse_end != length_end) {
                return fail({.message = std::format("{} request header is not a number", HeaderNames::content_length), .kind = Core::ErrorKind::invalid});
            }
        }

        // A body exists only with both a positive length and a content type, otherwise the request is bodiless by contract.
        if (content_length == 0 || content_type_p == nullptr) {
            m_temp.body = EmptyBody {};

            return State::httpin_state_done;
        }

        for (const auto& extractor : m_extractors) {
            if (!extractor->accepts(*content_type_p)) {
                continue;
            }

            auto body = extractor->extract(fd, *content_type_p, content_length);

            if (!body) {
                return fail(std::move(body.error()));
            }

            m_temp.body = std::move(body.value());

            return State::httpin_state_done;
        }

        return fail({.message = std::format("Unsupported content type: {}", *content_type_p), .kind = Core::ErrorKind::invalid});
    }

    HttpIntake::HttpIntake(IntakeConfig config)
    : HttpIntake {config, {std::make_shared<const MultipartExtractor>()}} {}

    HttpIntake::HttpIntake(IntakeConfig config, std::vector<BodyExtractorPtr> extractors)
    : m_extractors (std::move(extractors)), m_line {}, m_temp {}, m_error {}, m_state {State::httpin_state_request_line}, m_max_line_length {config.max_line_length}, m_max_header_count {config.max_header_count} {}

    auto HttpIntake::operator()(int fd) -> Core::Result<Request> {
        m_state = State::httpin_state_request_line;
        m_temp = {};
        m_error.reset();

        auto request_done = false;

        while (!request_done) {
            switch (m_state) {
                case State::httpin_state_request_line:
                    m_state = handle_state_request_line(fd);
                    break;
                case State::httpin_state_header:
                    m_state = handle_state_header(fd);
                    break;
                case State::httpin_state_body:
                    m_state = handle_state_body(fd);
                    break;
                case State::httpin_state_error:
                case State::httpin_state_done:
                default:
                    request_done = true;
                    break;
            }
        }

        if (m_state == State::httpin_state_error) {
            m_temp = {};

            return std::unexpected {std::exchange(m_error, {}).value_or(Core::AppError {.message = "Unknown intake failure", .kind = Core::ErrorKind::unknown})};
        }

        return {std::exchange(m_temp, {})};
    }
}
