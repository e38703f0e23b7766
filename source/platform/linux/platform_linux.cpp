#include "platform/platform_abi.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace platform {

namespace fs = std::filesystem;

FileReadResult read_file_contents(const std::string &file_path) {
    FileReadResult result;

    std::error_code status_error;
    fs::file_status status = fs::status(file_path, status_error);
    if (status_error) {
        // Only a missing entry counts as not found; ELOOP, EACCES, ENAMETOOLONG etc. are real errors.
        bool missing = status_error == std::errc::no_such_file_or_directory ||
                       status_error == std::errc::not_a_directory;
        result.error = missing ? FileError::NotFound : FileError::Other;
        result.error_message = status_error.message() + ": " + file_path;
        return result;
    }
    if (!fs::exists(status)) {
        result.error = FileError::NotFound;
        result.error_message = "No such file or directory: " + file_path;
        return result;
    }
    if (fs::is_directory(status)) {
        result.error = FileError::Other;
        result.error_message = "Is a directory: " + file_path;
        return result;
    }

    std::ifstream file_stream(file_path, std::ios::in | std::ios::binary);
    if (!file_stream.is_open()) {
        int saved_errno = errno;
        result.error = (saved_errno == ENOENT) ? FileError::NotFound : FileError::Other;
        result.error_message = std::string(std::strerror(saved_errno)) + ": " + file_path;
        return result;
    }

    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    if (file_stream.bad()) {
        result.error = FileError::Other;
        result.error_message = "I/O error while reading " + file_path;
        return result;
    }

    result.success = true;
    result.contents = string_stream.str();
    return result;
}

FileWriteResult write_file_contents(const std::string &file_path, const std::string &contents) {
    FileWriteResult result;

    std::ofstream file_stream(file_path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file_stream.is_open()) {
        result.error_message = std::string(std::strerror(errno)) + ": " + file_path;
        return result;
    }

    file_stream.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file_stream.flush();
    if (!file_stream) {
        result.error_message = "I/O error while writing " + file_path;
        return result;
    }

    result.success = true;
    result.bytes_written = contents.size();
    return result;
}

DirectoryListResult list_directory(const std::string &directory_path) {
    DirectoryListResult result;

    std::error_code iteration_error;
    fs::directory_iterator iterator(directory_path, iteration_error);
    if (iteration_error) {
        result.error_message = iteration_error.message() + ": " + directory_path;
        return result;
    }

    const fs::directory_iterator end;
    while (iterator != end) {
        DirectoryEntry listed;
        listed.name = iterator->path().filename().string();
        std::error_code type_error;
        listed.is_directory = iterator->is_directory(type_error);
        result.entries.push_back(listed);

        iterator.increment(iteration_error);
        if (iteration_error) {
            result.error_message = iteration_error.message() + ": " + directory_path;
            return result;
        }
    }

    result.success = true;
    return result;
}

} // namespace platform
