#ifndef SHELF_HTTPD_MYHTTP_BODY_EXTRACT_HPP
#define SHELF_HTTPD_MYHTTP_BODY_EXTRACT_HPP

#include <cstddef>
#include <memory>
#include <string_view>

#include "mycore/buffered_file.hpp"
#include "mycore/errors.hpp"
#include "myhttp/msgs.hpp"

namespace ShelfHttpd::Http {
    /// NOTE: One implementation per supported request `Content-Type`. `HttpIntake` asks each registered extractor in order and uses the first that accepts.
    class BodyExtractorBase {
    public:
        virtual ~BodyExtractorBase() = default;

        [[nodiscard]] virtual auto accepts(std::string_view content_type) const noexcept -> bool = 0;

        /// NOTE: `fd` is positioned right after the header block. Must consume exactly `content_length` bytes on success.
        [[nodiscard]] virtual auto extract(int fd, std::string_view content_type, std::size_t content_length) const -> Core::Result<RequestBody> = 0;
    };

    using BodyExtractorPtr = std::shared_ptr<const BodyExtractorBase>;

    /**
     * @brief Decodes a `multipart/form-data` body carrying exactly one file part.
     * @note Extra form fields or boundary-like text inside the file data are not supported and will mis-parse.
     */
    class MultipartExtractor : public BodyExtractorBase {
    public:
        static constexpr std::size_t max_file_size = 50UZ * 1024UZ * 1024UZ;

        [[nodiscard]] auto accepts(std::string_view content_type) const noexcept -> bool override;

        [[nodiscard]] auto extract(int fd, std::string_view content_type, std::size_t content_length) const -> Core::Result<RequestBody> override;

        /// NOTE: The boundary text is whatever follows `boundary=` in the content type, trimmed.
        [[nodiscard]] static auto find_boundary(std::string_view content_type) -> Core::Result<std::string_view>;

        /// NOTE: Decodes an already-read form body, see `MultipartExtractor::extract`.
        [[nodiscard]] static auto decode(std::string_view boundary, const Core::Blob& raw_form) -> Core::Result<Core::BufferedFile>;
    };
}

#endif
