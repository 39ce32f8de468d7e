#include <algorithm>
#include <format>
#include <system_error>
#include <utility>

#include "myapp/file_store.hpp"

namespace ShelfHttpd::App {
    auto list_files_with_paths(const std::filesystem::path& root) -> Core::Result<std::vector<StoredFile>> {
        std::error_code fs_err;
        std::filesystem::recursive_directory_iterator dir_it {root, fs_err};

        if (fs_err) {
            return Core::make_error(Core::ErrorKind::io, std::format("Failed to read directory: {} ({})", root.string(), fs_err.message()));
        }

        std::vector<StoredFile> files;

        for (const std::filesystem::recursive_directory_iterator dir_end {}; dir_it != dir_end; dir_it.increment(fs_err)) {
            if (fs_err) {
                return Core::make_error(Core::ErrorKind::io, std::format("Failed to read entry under {} ({})", root.string(), fs_err.message()));
            }

            const auto& entry = *dir_it;

            if (entry.is_directory(fs_err)) {
                continue;
            }

            files.emplace_back(StoredFile {
                .name = entry.path().lexically_relative(root).generic_string(),
                .path = entry.path(),
            });
        }

        if (fs_err) {
            return Core::make_error(Core::ErrorKind::io, std::format("Failed to read entry under {} ({})", root.string(), fs_err.message()));
        }

        std::ranges::sort(files, {}, &StoredFile::name);

        return files;
    }


    FileLock::FileLock(std::shared_ptr<std::mutex> mtx)
    : m_mtx {std::move(mtx)}, m_lock {*m_mtx} {}

    auto FileLock::owns_lock() const noexcept -> bool {
        return m_lock.owns_lock();
    }

    void FileLock::unlock() {
        m_lock.unlock();
    }


    FileLocks::FileLocks()
    : m_locks {}, m_table_mtx {} {}

    auto FileLocks::acquire(const std::string& file_key) -> FileLock {
        std::shared_ptr<std::mutex> file_mtx;

        {
            std::lock_guard table_lock {m_table_mtx};

            // A use count of 1 means only the table refers to the slot: no holder and no waiter.
            std::erase_if(m_locks, [&file_key](const auto& slot_entry) {
                return slot_entry.first != file_key && slot_entry.second.use_count() == 1;
            });

            auto& slot = m_locks[file_key];

            if (!slot) {
                slot = std::make_shared<std::mutex>();
            }

            file_mtx = slot;
        }

        return FileLock {std::move(file_mtx)};
    }

    auto FileLocks::slot_count() const -> std::size_t {
        std::lock_guard table_lock {m_table_mtx};

        return m_locks.size();
    }
}
