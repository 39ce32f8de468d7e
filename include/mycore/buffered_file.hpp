#ifndef SHELF_HTTPD_MYCORE_BUFFERED_FILE_HPP
#define SHELF_HTTPD_MYCORE_BUFFERED_FILE_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "mycore/errors.hpp"

namespace ShelfHttpd::Core {
    using Blob = std::vector<char>;

    /// NOTE: Any file-like payload held in memory: an upload, a file read for serving, or a synthesized text reply. Each one is produced once and consumed once.
    struct BufferedFile {
        std::string name;
        Blob content;
    };

    /**
     * @brief Loads a whole file from disk, naming the result after the path's last component.
     * @note Missing paths and directories are `NotFound`, open or read failures are `IO`.
     */
    [[nodiscard]] auto read_buffered_file(const std::filesystem::path& path) -> Result<BufferedFile>;

    /// NOTE: Creates or truncates `target` before writing all of `file.content` into it.
    [[nodiscard]] auto save_buffered_file(const std::filesystem::path& target, const BufferedFile& file) -> Result<void>;
}

#endif
