#include <format>
#include <string>
#include <system_error>
#include <utility>

#include "mycore/text.hpp"
#include "myapp/paths.hpp"

namespace ShelfHttpd::App {
    constexpr std::string_view uploads_prefix = "uploads/";

    auto validate_file_name(std::string_view file_name) -> Core::Result<void> {
        if (file_name.empty()) {
            return Core::make_error(Core::ErrorKind::invalid, "File name is empty");
        }

        if (!Core::is_valid_utf8(file_name)) {
            return Core::make_error(Core::ErrorKind::invalid, "File name is not valid UTF-8");
        }

        const auto extension = std::filesystem::path {file_name}.extension().string();

        // `extension()` keeps the leading dot, e.g `.txt`.
        if (extension.length() > 1) {
            for (const auto allowed : allowed_extensions) {
                if (std::string_view {extension}.substr(1) == allowed) {
                    return {};
                }
            }
        }

        return Core::make_error(Core::ErrorKind::invalid, std::format("File type not allowed: {}", file_name));
    }

    auto path_starts_with(const std::filesystem::path& candidate, const std::filesystem::path& root) -> bool {
        auto candidate_it = candidate.begin();

        for (const auto& root_part : root) {
            // A trailing separator shows up as an empty final component.
            if (root_part.empty()) {
                continue;
            }

            if (candidate_it == candidate.end() || *candidate_it != root_part) {
                return false;
            }

            ++candidate_it;
        }

        return true;
    }

    auto is_lexically_contained(const std::filesystem::path& root, const std::filesystem::path& relative) -> bool {
        if (relative.is_absolute() || relative.has_root_name()) {
            return false;
        }

        const auto normal_root = root.lexically_normal();
        const auto normal_target = (root / relative).lexically_normal();

        if (!path_starts_with(normal_target, normal_root)) {
            return false;
        }

        // The root itself is not a valid file target.
        return normal_target.lexically_relative(normal_root) != std::filesystem::path {"."};
    }

    auto resolve_view_path(const std::filesystem::path& uploads_root, std::string_view requested) -> Core::Result<std::filesystem::path> {
        while (requested.starts_with('/')) {
            requested.remove_prefix(1);
        }

        while (requested.starts_with(uploads_prefix)) {
            requested.remove_prefix(uploads_prefix.length());
        }

        const auto requested_path = uploads_root / std::filesystem::path {requested};
        std::error_code fs_err;

        // 1. Resolve symlinks and `..` so the containment test sees the real target.
        const auto resolved_path = std::filesystem::canonical(requested_path, fs_err);

        if (fs_err) {
            return Core::make_error(Core::ErrorKind::not_found, std::format("Canonicalized file not found: {}", requested_path.string()));
        }

        const auto resolved_root = std::filesystem::canonical(uploads_root, fs_err);

        if (fs_err) {
            return Core::make_error(Core::ErrorKind::io, std::format("Uploads directory is unavailable: {} ({})", uploads_root.string(), fs_err.message()));
        }

        // 2. Assert that the path is still within the uploads directory.
        if (!path_starts_with(resolved_path, resolved_root)) {
            return Core::make_error(Core::ErrorKind::not_permitted, std::format("Access outside uploads denied: {}", requested));
        }

        // 3. Validate the name last: traversal attempts report `NotPermitted` or `NotFound`, never `Invalid`.
        if (auto name_check = validate_file_name(resolved_path.filename().string()); !name_check) {
            return std::unexpected {std::move(name_check.error())};
        }

        return resolved_path;
    }

    auto resolve_upload_path(const std::filesystem::path& uploads_root, std::string_view file_name) -> Core::Result<std::filesystem::path> {
        const std::filesystem::path name_path {file_name};

        // The upload must name a plain file: no directories, no `.` or `..`.
        if (name_path.filename().string() != file_name || file_name == "." || file_name == "..") {
            return Core::make_error(Core::ErrorKind::invalid, std::format("Invalid upload file name: {}", file_name));
        }

        if (auto name_check = validate_file_name(file_name); !name_check) {
            return std::unexpected {std::move(name_check.error())};
        }

        if (!is_lexically_contained(uploads_root, name_path)) {
            return Core::make_error(Core::ErrorKind::not_permitted, std::format("Upload target escapes uploads directory: {}", file_name));
        }

        return (uploads_root / name_path).lexically_normal();
    }
}
