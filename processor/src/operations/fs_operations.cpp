#include "stepflow/worker/fs_operations.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace stepflow {
namespace worker {

using json = nlohmann::json;

namespace {

constexpr std::size_t md5_block_size = 65536;

// errno of the last failed stream open/read, io_error when the library left none
std::error_code last_io_error() {
    return errno != 0 ? std::error_code(errno, std::generic_category())
                      : std::make_error_code(std::errc::io_error);
}

[[noreturn]] void throw_missing_directory(const std::filesystem::path& directory) {
    std::error_code ec = std::filesystem::exists(directory)
        ? std::make_error_code(std::errc::not_a_directory)
        : std::make_error_code(std::errc::no_such_file_or_directory);
    throw std::filesystem::filesystem_error("Directory does not exist", directory, ec);
}

OperationResult fs_error_result(const std::string& context, const std::filesystem::filesystem_error& e) {
    return OperationResult::error_result(classify_fs_error(e.code()), context + ": " + e.what());
}

OperationResult fs_error_result(const std::string& context, const std::exception& e) {
    return OperationResult::error_result(ErrorCode::execution_failed, context + ": " + e.what());
}

std::filesystem::path path_argument(const ArgumentValues& args, const std::string& name) {
    return std::filesystem::path(require_argument(args, name).as_string());
}

std::string cell_text(const json& cell) {
    return cell.is_string() ? cell.get<std::string>() : cell.dump();
}

} // namespace

ErrorCode classify_fs_error(const std::error_code& code) {
    if (code == std::errc::permission_denied || code == std::errc::operation_not_permitted ||
        code == std::errc::read_only_file_system) {
        return ErrorCode::permission_denied;
    }
    if (code == std::errc::no_such_file_or_directory || code == std::errc::not_a_directory) {
        return ErrorCode::resource_unavailable;
    }
    return ErrorCode::execution_failed;
}

std::string file_md5sum(const std::filesystem::path& path) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::filesystem::filesystem_error("Failed to open file for reading", path, last_io_error());
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize MD5 digest");
    }

    std::vector<char> buffer(md5_block_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = file.gcount();
        if (count > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(count)) != 1) {
            throw std::runtime_error("Failed to update MD5 digest: " + path.string());
        }
    }
    if (file.bad()) {
        throw std::filesystem::filesystem_error("Failed to read file", path, last_io_error());
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_size = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_size) != 1) {
        throw std::runtime_error("Failed to finalize MD5 digest: " + path.string());
    }

    std::string hex;
    hex.reserve(digest_size * 2);
    char byte[3];
    for (unsigned int i = 0; i < digest_size; ++i) {
        std::snprintf(byte, sizeof(byte), "%02x", static_cast<unsigned int>(digest[i]));
        hex += byte;
    }
    return hex;
}

std::vector<LocalFile> list_local_files(const std::filesystem::path& directory) {
    if (!std::filesystem::is_directory(directory)) {
        throw_missing_directory(directory);
    }

    std::vector<LocalFile> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(directory)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        LocalFile file;
        file.name = std::filesystem::relative(entry.path(), directory).generic_string();
        file.absolute_path = std::filesystem::absolute(entry.path());
        file.size = entry.file_size();
        file.md5sum = file_md5sum(entry.path());
        files.push_back(std::move(file));
    }

    std::sort(files.begin(), files.end(), [](const LocalFile& a, const LocalFile& b) {
        return a.name < b.name;
    });
    return files;
}

json files_to_json(const std::vector<LocalFile>& files) {
    json array = json::array();
    for (const auto& file : files) {
        array.push_back({
            {"name", file.name},
            {"size", file.size},
            {"md5sum", file.md5sum}
        });
    }
    return array;
}

std::string format_files_table(const json& files) {
    if (!files.is_array()) {
        throw std::invalid_argument("Expected an array of files, got " + std::string(files.type_name()));
    }

    const std::vector<std::string> headers = {"Name", "Size", "MD5 Checksum"};
    const std::vector<std::string> keys = {"name", "size", "md5sum"};
    const std::vector<bool> right_aligned = {false, true, false};

    std::vector<std::vector<std::string>> rows;
    for (const auto& file : files) {
        std::vector<std::string> row;
        for (const auto& key : keys) {
            row.push_back(file.contains(key) ? cell_text(file.at(key)) : std::string());
        }
        rows.push_back(std::move(row));
    }

    std::vector<std::size_t> widths;
    for (std::size_t column = 0; column < headers.size(); ++column) {
        std::size_t width = headers[column].size();
        for (const auto& row : rows) {
            width = std::max(width, row[column].size());
        }
        widths.push_back(width);
    }

    std::ostringstream out;
    auto write_row = [&](const std::vector<std::string>& cells) {
        std::string line;
        for (std::size_t column = 0; column < cells.size(); ++column) {
            if (column > 0) {
                line += "  ";
            }
            const std::string padding(widths[column] - cells[column].size(), ' ');
            line += right_aligned[column] ? padding + cells[column] : cells[column] + padding;
        }
        // Trailing padding of the last column is noise
        line.erase(line.find_last_not_of(' ') + 1);
        out << line << '\n';
    };

    write_row(headers);
    std::vector<std::string> rule;
    for (std::size_t width : widths) {
        rule.push_back(std::string(width, '-'));
    }
    write_row(rule);
    for (const auto& row : rows) {
        write_row(row);
    }

    return out.str();
}

std::size_t copy_directory_files(const std::filesystem::path& source, const std::filesystem::path& destination) {
    if (!std::filesystem::is_directory(source)) {
        throw_missing_directory(source);
    }

    std::filesystem::create_directories(destination);
    std::filesystem::copy(source, destination,
                          std::filesystem::copy_options::recursive |
                          std::filesystem::copy_options::overwrite_existing);

    std::size_t count = 0;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(source)) {
        if (entry.is_regular_file()) {
            ++count;
        }
    }
    return count;
}

void write_json_file(const std::filesystem::path& path, const json& content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    errno = 0;
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::filesystem::filesystem_error("Failed to open file for writing", path, last_io_error());
    }
    file << content.dump(2, ' ', false, json::error_handler_t::replace) << '\n';
    if (!file) {
        throw std::filesystem::filesystem_error("Failed to write file", path, last_io_error());
    }
}

// CopyProjectFilesOperation

CopyProjectFilesOperation::CopyProjectFilesOperation()
    : BaseOperation("copy_project_files", OperationSignature::keywords({"source_dir", "destination_dir"})) {}

OperationResult CopyProjectFilesOperation::invoke_impl(const ArgumentValues& args) {
    auto source = path_argument(args, "source_dir");
    auto destination = path_argument(args, "destination_dir");

    try {
        std::size_t count = copy_directory_files(source, destination);
        return OperationResult::success(Value::of(count));
    } catch (const std::filesystem::filesystem_error& e) {
        return fs_error_result("Project files copy error", e);
    } catch (const std::exception& e) {
        return fs_error_result("Project files copy error", e);
    }
}

// ListLocalFilesOperation

ListLocalFilesOperation::ListLocalFilesOperation()
    : BaseOperation("list_local_files", OperationSignature::keywords({"directory"})) {}

OperationResult ListLocalFilesOperation::invoke_impl(const ArgumentValues& args) {
    auto directory = path_argument(args, "directory");

    try {
        return OperationResult::success(Value(files_to_json(list_local_files(directory))));
    } catch (const std::filesystem::filesystem_error& e) {
        return fs_error_result("File listing error", e);
    } catch (const std::exception& e) {
        return fs_error_result("File listing error", e);
    }
}

// FilesTableOperation

FilesTableOperation::FilesTableOperation()
    : BaseOperation("files_table", OperationSignature::keywords({"files"})) {}

OperationResult FilesTableOperation::invoke_impl(const ArgumentValues& args) {
    const Value& files = require_argument(args, "files");
    return OperationResult::success(Value::of(format_files_table(files.to_json())));
}

// WriteJsonFileOperation

WriteJsonFileOperation::WriteJsonFileOperation()
    : BaseOperation("write_json_file", OperationSignature::keywords({"path", "content"})) {}

OperationResult WriteJsonFileOperation::invoke_impl(const ArgumentValues& args) {
    auto path = path_argument(args, "path");
    const Value& content = require_argument(args, "content");

    try {
        write_json_file(path, content.to_json());
        return OperationResult::success(Value::of(path.string()));
    } catch (const std::filesystem::filesystem_error& e) {
        return fs_error_result("File write error", e);
    } catch (const std::exception& e) {
        return fs_error_result("File write error", e);
    }
}

// FileMd5sumOperation

FileMd5sumOperation::FileMd5sumOperation()
    : BaseOperation("file_md5sum", OperationSignature::keywords({"path"})) {}

OperationResult FileMd5sumOperation::invoke_impl(const ArgumentValues& args) {
    auto path = path_argument(args, "path");

    try {
        return OperationResult::success(Value::of(file_md5sum(path)));
    } catch (const std::filesystem::filesystem_error& e) {
        return fs_error_result("Checksum error", e);
    } catch (const std::exception& e) {
        return fs_error_result("Checksum error", e);
    }
}

} // namespace worker
} // namespace stepflow
