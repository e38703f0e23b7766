#ifndef TRMCPS_PLATFORM_ABI_HPP
#define TRMCPS_PLATFORM_ABI_HPP

// Platform abstraction interface for the filesystem side effects of tools and
// resources. Each OS-specific implementation lives under platform/<os>/ and
// provides definitions for the functions declared here.
//
// None of these functions throw: failures are reported through the result
// structs so callers can turn them into handled error content.

#include <cstddef>
#include <string>
#include <vector>

namespace platform {

// Why a read failed. NotFound is reported separately so that resource reads
// can answer "File not found" instead of a generic error.
enum class FileError {
    None,
    NotFound,
    Other,
};

// Result of reading a whole file.
struct FileReadResult {
    bool success = false;
    FileError error = FileError::None;
    std::string contents;
    std::string error_message;
};

// Result of writing a whole file.
struct FileWriteResult {
    bool success = false;
    std::size_t bytes_written = 0;
    std::string error_message;
};

// One entry of a directory listing.
struct DirectoryEntry {
    std::string name;
    bool is_directory = false;
};

// Result of listing a directory (non-recursive, enumeration order).
struct DirectoryListResult {
    bool success = false;
    std::vector<DirectoryEntry> entries;
    std::string error_message;
};

// Read the entire contents of a file in binary mode.
FileReadResult read_file_contents(const std::string &file_path);

// Create or truncate file_path and write contents to it.
FileWriteResult write_file_contents(const std::string &file_path, const std::string &contents);

// List the entries of a directory in the order the OS yields them.
DirectoryListResult list_directory(const std::string &directory_path);

} // namespace platform

#endif // TRMCPS_PLATFORM_ABI_HPP
