#ifndef SHELF_HTTPD_MYAPP_PATHS_HPP
#define SHELF_HTTPD_MYAPP_PATHS_HPP

#include <array>
#include <filesystem>
#include <string_view>

#include "mycore/errors.hpp"

namespace ShelfHttpd::App {
    constexpr std::array<std::string_view, 4> allowed_extensions {"txt", "png", "jpg", "pdf"};

    /// NOTE: A valid name is non-empty UTF-8 whose extension is in `allowed_extensions`, otherwise `Core::ErrorKind::invalid`.
    [[nodiscard]] auto validate_file_name(std::string_view file_name) -> Core::Result<void>;

    /// NOTE: Component-wise prefix test, so `uploads2/a.txt` is not inside `uploads`.
    [[nodiscard]] auto path_starts_with(const std::filesystem::path& candidate, const std::filesystem::path& root) -> bool;

    /// NOTE: Folds `.` and `..` in `root / relative` without touching the disk, then requires the result to stay strictly below `root`.
    [[nodiscard]] auto is_lexically_contained(const std::filesystem::path& root, const std::filesystem::path& relative) -> bool;

    /**
     * @brief Resolves a client-supplied path for reading to a canonical path inside `uploads_root`.
     * @note Leading `/` and `uploads/` prefixes are dropped first. Nonexistent targets are `NotFound`, targets outside the root (after resolving symlinks and `..`) are `NotPermitted`.
     */
    [[nodiscard]] auto resolve_view_path(const std::filesystem::path& uploads_root, std::string_view requested) -> Core::Result<std::filesystem::path>;

    /**
     * @brief Resolves the target path for saving an upload named `file_name`.
     * @note The target may not exist yet, so containment is checked lexically only (see `is_lexically_contained`). This is weaker than `resolve_view_path`: a symlink planted inside the root still passes.
     */
    [[nodiscard]] auto resolve_upload_path(const std::filesystem::path& uploads_root, std::string_view file_name) -> Core::Result<std::filesystem::path>;
}

#endif
