#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace stepflow {
namespace worker {

// Freshly created, uniquely named directory owned by one workflow run.
// Removed on destruction unless keep() was called.
class TemporaryDirectory {
public:
    // Creates <base>/<prefix><random hex>; base defaults to the system temp directory.
    // Throws std::filesystem::filesystem_error or std::runtime_error on failure.
    static TemporaryDirectory create(const std::filesystem::path& base = {},
                                     const std::string& prefix = "stepflow-");

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&& other) noexcept;
    TemporaryDirectory& operator=(TemporaryDirectory&& other) noexcept;
    ~TemporaryDirectory();

    const std::filesystem::path& path() const { return path_; }

    void keep() { keep_ = true; }
    bool kept() const { return keep_; }

    // Removes the directory now; returns false and fills ec on failure
    bool remove(std::error_code& ec);

private:
    explicit TemporaryDirectory(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
    bool keep_ = false;
};

} // namespace worker
} // namespace stepflow
