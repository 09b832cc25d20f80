#include "stepflow/worker/references.hpp"

#include <stdexcept>

namespace stepflow {
namespace worker {

WorkDirPath::WorkDirPath(std::vector<std::string> parts, bool mkdir)
    : parts_(std::move(parts)), mkdir_(mkdir) {
    if (parts_.empty()) {
        throw std::invalid_argument("WorkDirPath requires at least one path part");
    }

    for (const auto& part : parts_) {
        std::filesystem::path part_path(part);
        if (part.empty() || part_path.is_absolute() || part_path.has_root_name()) {
            throw std::invalid_argument("WorkDirPath part must be a non-empty relative path: \"" + part + "\"");
        }
        for (const auto& element : part_path) {
            if (element == "..") {
                throw std::invalid_argument("WorkDirPath part must not leave the work directory: \"" + part + "\"");
            }
        }
    }
}

std::filesystem::path WorkDirPath::eval(const std::filesystem::path& root) const {
    std::filesystem::path path = root;
    for (const auto& part : parts_) {
        path /= part;
    }

    if (mkdir_) {
        // No-op when the directory already exists
        std::filesystem::create_directories(path);
    }

    return path;
}

} // namespace worker
} // namespace stepflow
