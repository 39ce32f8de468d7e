#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

#include "mycore/buffered_file.hpp"

namespace ShelfHttpd::Core {
    auto read_buffered_file(const std::filesystem::path& path) -> Result<BufferedFile> {
        std::error_code fs_err;

        if (!std::filesystem::exists(path, fs_err)) {
            return make_error(ErrorKind::not_found, std::format("File does not exist: {}", path.string()));
        }

        if (std::filesystem::is_directory(path, fs_err)) {
            return make_error(ErrorKind::not_found, std::format("Path for file is a directory: {}", path.string()));
        }

        auto file_name = path.filename().string();

        if (file_name.empty()) {
            return make_error(ErrorKind::invalid, std::format("Invalid file name: {}", path.string()));
        }

        std::ifstream file_in {path, std::ios::in | std::ios::binary};

        if (!file_in.is_open()) {
            return make_error(ErrorKind::not_found, std::format("File failed to open: {}", file_name));
        }

        Blob content {std::istreambuf_iterator<char> {file_in}, std::istreambuf_iterator<char> {}};

        if (file_in.bad()) {
            return make_error(ErrorKind::io, std::format("Error reading file into buffer: {}", file_name));
        }

        return BufferedFile {
            .name = std::move(file_name),
            .content = std::move(content),
        };
    }

    auto save_buffered_file(const std::filesystem::path& target, const BufferedFile& file) -> Result<void> {
        std::ofstream file_out {target, std::ios::out | std::ios::binary | std::ios::trunc};

        if (!file_out.is_open()) {
            return make_error(ErrorKind::io, std::format("Failed to create file: {}", target.string()));
        }

        file_out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));
        file_out.flush();

        if (!file_out) {
            return make_error(ErrorKind::io, std::format("Failed to write file: {}", target.string()));
        }

        return {};
    }
}
