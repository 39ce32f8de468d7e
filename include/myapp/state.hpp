#ifndef SHELF_HTTPD_MYAPP_STATE_HPP
#define SHELF_HTTPD_MYAPP_STATE_HPP

#include <filesystem>

#include "myapp/contents.hpp"
#include "myapp/file_store.hpp"

namespace ShelfHttpd::App {
    /// NOTE: Process-wide state created once at startup and shared by every worker for the server's lifetime.
    struct AppState {
        std::filesystem::path uploads_root;
        PageTemplates templates;
        FileLocks upload_locks;

        AppState(std::filesystem::path uploads_root_, std::filesystem::path templates_root_);
    };
}

#endif
