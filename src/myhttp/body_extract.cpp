#include <format>
#include <string>

#include "mycore/text.hpp"
#include "mynet/io_funcs.hpp"
#include "myhttp/body_extract.hpp"

namespace ShelfHttpd::Http {
    constexpr std::string_view multipart_form_mime = "multipart/form-data";
    constexpr std::string_view boundary_marker = "boundary=";

    auto MultipartExtractor::accepts(std::string_view content_type) const noexcept -> bool {
        return content_type.starts_with(multipart_form_mime);
    }

    auto MultipartExtractor::extract(int fd, std::string_view content_type, std::size_t content_length) const -> Core::Result<RequestBody> {
        // 1. Refuse oversized uploads before reading a single body byte.
        if (content_length > max_file_size) {
            return Core::make_error(Core::ErrorKind::invalid, "File size exceeds 50MB limit");
        }

        auto boundary = find_boundary(content_type);

        if (!boundary) {
            return std::unexpected {std::move(boundary.error())};
        }

        // 2. The declared length is authoritative: read exactly that many bytes, never "until the boundary".
        Core::Blob raw_form;
        raw_form.reserve(content_length);

        if (auto read_res = Net::socket_read_exact(fd, content_length, raw_form); !read_res) {
            return Core::make_error(Core::ErrorKind::io, std::move(read_res.error()));
        } else if (read_res.value() < content_length) {
            return Core::make_error(Core::ErrorKind::invalid, "Failed to read form data");
        }

        auto decoded_file = decode(boundary.value(), raw_form);

        if (!decoded_file) {
            return std::unexpected {std::move(decoded_file.error())};
        }

        return RequestBody {std::move(decoded_file.value())};
    }

    auto MultipartExtractor::find_boundary(std::string_view content_type) -> Core::Result<std::string_view> {
        const auto marker_pos = content_type.find(boundary_marker);

        if (marker_pos == std::string_view::npos) {
            return Core::make_error(Core::ErrorKind::invalid, "Boundary missing in Content-Type header");
        }

        return Core::trim_view(content_type.substr(marker_pos + boundary_marker.length()));
    }

    auto MultipartExtractor::decode(std::string_view boundary, const Core::Blob& raw_form) -> Core::Result<Core::BufferedFile> {
        std::string_view form_sv {raw_form.data(), raw_form.size()};

        if (!Core::is_valid_utf8(form_sv)) {
            return Core::make_error(Core::ErrorKind::invalid, "Failed to parse form data");
        }

        // 1. Strip the opening `--{boundary}` and the closing `--{boundary}--` delimiters.
        const auto opening_delim = std::format("--{}", boundary);
        const auto closing_delim = std::format("--{}--", boundary);

        form_sv = Core::trim_view(form_sv);

        if (!form_sv.starts_with(opening_delim)) {
            return Core::make_error(Core::ErrorKind::invalid, "Form body not surrounded with boundary");
        }

        form_sv.remove_prefix(opening_delim.length());

        if (!form_sv.ends_with(closing_delim)) {
            return Core::make_error(Core::ErrorKind::invalid, "Form body not surrounded with boundary");
        }

        form_sv.remove_suffix(closing_delim.length());
        form_sv = Core::trim_view(form_sv);

        // 2. Split into the part's Content-Disposition line, its Content-Type line, and the raw file data.
        const auto first_lf_pos = form_sv.find('\n');
        const auto disposition_line = form_sv.substr(0, first_lf_pos);

        const auto disposition_delim_pos = disposition_line.rfind(';');

        if (disposition_delim_pos == std::string_view::npos) {
            return Core::make_error(Core::ErrorKind::invalid, "Invalid content disposition");
        }

        const auto filename_part = disposition_line.substr(disposition_delim_pos + 1);
        const auto assign_pos = filename_part.find('=');

        if (assign_pos == std::string_view::npos) {
            return Core::make_error(Core::ErrorKind::invalid, "Invalid content disposition");
        }

        auto filename_sv = Core::trim_view(filename_part.substr(assign_pos + 1));

        while (!filename_sv.empty() && filename_sv.front() == '"') {
            filename_sv.remove_prefix(1);
        }

        while (!filename_sv.empty() && filename_sv.back() == '"') {
            filename_sv.remove_suffix(1);
        }

        if (first_lf_pos == std::string_view::npos) {
            return Core::make_error(Core::ErrorKind::invalid, "Content type missing from form body");
        }

        // NOTE: The part's own Content-Type line is read past but not used.
        const auto second_lf_pos = form_sv.find('\n', first_lf_pos + 1);

        if (second_lf_pos == std::string_view::npos) {
            return Core::make_error(Core::ErrorKind::invalid, "File data missing from form body");
        }

        const auto file_data_sv = Core::trim_view(form_sv.substr(second_lf_pos + 1));

        return Core::BufferedFile {
            .name = std::string {filename_sv},
            .content = Core::Blob {file_data_sv.begin(), file_data_sv.end()},
        };
    }
}
