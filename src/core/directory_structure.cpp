#include "directory_structure.hpp"
#include "constants.hpp"

Result<void> ensure_stencil_directory_structure(const fs::path& root) {
    std::error_code ec;
    fs::create_directories(root / TEMPLATES_DIR, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IO_FAILURE,
            "Failed to create " + (root / TEMPLATES_DIR).string() + ": " + ec.message(),
            root.string());
    }
    return Result<void>::Ok();
}
