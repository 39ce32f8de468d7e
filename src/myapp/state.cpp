#include <utility>

#include "myapp/state.hpp"

namespace ShelfHttpd::App {
    AppState::AppState(std::filesystem::path uploads_root_, std::filesystem::path templates_root_)
    : uploads_root (std::move(uploads_root_)), templates {std::move(templates_root_)}, upload_locks {} {}
}
