#pragma once

#include "stepflow/worker/operation.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace stepflow {
namespace worker {

struct LocalFile {
    std::string name;                       // relative to the listed directory, '/' separated
    std::filesystem::path absolute_path;
    std::uintmax_t size = 0;
    std::string md5sum;
};

// Filesystem failures below throw std::filesystem::filesystem_error carrying
// the OS error, which classify_fs_error() maps to an ErrorCode.
ErrorCode classify_fs_error(const std::error_code& code);

// Lowercase hex MD5 of the file contents, read in 64 KiB blocks
std::string file_md5sum(const std::filesystem::path& path);

// Regular files below directory (recursive), sorted by name
std::vector<LocalFile> list_local_files(const std::filesystem::path& directory);

nlohmann::json files_to_json(const std::vector<LocalFile>& files);

// Plain-text table with "Name", "Size" and "MD5 Checksum" columns.
// Accepts the array produced by files_to_json().
std::string format_files_table(const nlohmann::json& files);

// Copies the content of source into destination, overwriting existing files.
// Returns the number of regular files copied.
std::size_t copy_directory_files(const std::filesystem::path& source, const std::filesystem::path& destination);

// Pretty-printed (indent 2) JSON; parent directories are created
void write_json_file(const std::filesystem::path& path, const nlohmann::json& content);

/**
 * copy_project_files(source_dir, destination_dir) -> number of copied files
 */
class CopyProjectFilesOperation : public BaseOperation {
public:
    CopyProjectFilesOperation();

protected:
    OperationResult invoke_impl(const ArgumentValues& args) override;
};

/**
 * list_local_files(directory) -> [{"name", "size", "md5sum"}, ...]
 */
class ListLocalFilesOperation : public BaseOperation {
public:
    ListLocalFilesOperation();

protected:
    OperationResult invoke_impl(const ArgumentValues& args) override;
};

// files_table(files) -> text table
class FilesTableOperation : public BaseOperation {
public:
    FilesTableOperation();

protected:
    OperationResult invoke_impl(const ArgumentValues& args) override;
};

// write_json_file(path, content) -> path
class WriteJsonFileOperation : public BaseOperation {
public:
    WriteJsonFileOperation();

protected:
    OperationResult invoke_impl(const ArgumentValues& args) override;
};

// file_md5sum(path) -> hex digest
class FileMd5sumOperation : public BaseOperation {
public:
    FileMd5sumOperation();

protected:
    OperationResult invoke_impl(const ArgumentValues& args) override;
};

} // namespace worker
} // namespace stepflow
