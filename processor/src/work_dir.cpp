#include "stepflow/worker/work_dir.hpp"
#include "stepflow/worker/core.hpp"

#include <stdexcept>

namespace stepflow {
namespace worker {

TemporaryDirectory TemporaryDirectory::create(const std::filesystem::path& base, const std::string& prefix) {
    std::filesystem::path root = base.empty() ? std::filesystem::temp_directory_path() : base;
    std::filesystem::create_directories(root);

    // create_directory() returns false when the name is taken; try another one
    for (int attempt = 0; attempt < 16; ++attempt) {
        std::filesystem::path candidate = root / (prefix + generate_hex_id(8));
        if (std::filesystem::create_directory(candidate)) {
            return TemporaryDirectory(candidate);
        }
    }

    throw std::runtime_error("Failed to create a unique temporary directory in " + root.string());
}

TemporaryDirectory::TemporaryDirectory(TemporaryDirectory&& other) noexcept
    : path_(std::move(other.path_)), keep_(other.keep_) {
    other.path_.clear();
}

TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& other) noexcept {
    if (this != &other) {
        if (!path_.empty() && !keep_) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
        path_ = std::move(other.path_);
        keep_ = other.keep_;
        other.path_.clear();
    }
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    if (!path_.empty() && !keep_) {
        // Best effort; callers that care use remove() and check the error
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
}

bool TemporaryDirectory::remove(std::error_code& ec) {
    ec.clear();
    if (path_.empty()) {
        return true;
    }
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        return false;
    }
    path_.clear();
    return true;
}

} // namespace worker
} // namespace stepflow
