#ifndef SHELF_HTTPD_MYAPP_FILE_STORE_HPP
#define SHELF_HTTPD_MYAPP_FILE_STORE_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mycore/errors.hpp"

namespace ShelfHttpd::App {
    struct StoredFile {
        std::string name; // relative to the listed root, using '/' separators
        std::filesystem::path path;
    };

    /// NOTE: Recursively lists regular files under `root`, sorted by relative name.
    [[nodiscard]] auto list_files_with_paths(const std::filesystem::path& root) -> Core::Result<std::vector<StoredFile>>;

    /// NOTE: A held per-name lock. It shares ownership of its mutex, so the table may drop the slot while it is held.
    class FileLock {
    private:
        std::shared_ptr<std::mutex> m_mtx;
        std::unique_lock<std::mutex> m_lock;

    public:
        explicit FileLock(std::shared_ptr<std::mutex> mtx);

        [[nodiscard]] auto owns_lock() const noexcept -> bool;

        void unlock();
    };

    /**
     * @brief Hands out one mutex per file name so that concurrent saves of the same name never interleave their writes.
     * @note Slots nobody holds are evicted on the next `acquire`, so the table only grows with concurrent uploads.
     */
    class FileLocks {
    private:
        std::map<std::string, std::shared_ptr<std::mutex>> m_locks;
        mutable std::mutex m_table_mtx;

    public:
        FileLocks();

        FileLocks(const FileLocks&) = delete;
        FileLocks& operator=(const FileLocks&) = delete;

        [[nodiscard]] auto acquire(const std::string& file_key) -> FileLock;

        [[nodiscard]] auto slot_count() const -> std::size_t;
    };
}

#endif
