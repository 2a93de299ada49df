#include <stylebind/io/file_system.h>

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace stylebind::io {

namespace fs = std::filesystem;

namespace {

// Returns 0 on success, otherwise the errno of the failure.
int read_all(const std::string& path, std::string& content) {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) return errno;

    char buffer[16384];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
        content.append(buffer, n);
    }
    // fopen succeeds on directories; the read reports EISDIR.
    int error = std::ferror(file) ? (errno ? errno : EIO) : 0;
    std::fclose(file);
    return error;
}

} // namespace

std::string DiskFileSystem::read_file(const std::string& path) const {
    std::string content;
    if (int error = read_all(path, content); error != 0) {
        throw std::system_error(error, std::generic_category(), "cannot read " + path);
    }
    return content;
}

bool DiskFileSystem::is_file(const std::string& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool DiskFileSystem::is_directory(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool write_file_if_changed(const std::string& path, std::string_view content) {
    std::string existing;
    if (read_all(path, existing) == 0 && existing == content) {
        return false;
    }

    fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::system_error(ec, "cannot create directory " + target.parent_path().string());
        }
    }

    std::FILE* file = std::fopen(path.c_str(), "wb");
    if (!file) {
        throw std::system_error(errno, std::generic_category(), "cannot write " + path);
    }
    size_t written = std::fwrite(content.data(), 1, content.size(), file);
    int error = errno;
    bool close_failed = std::fclose(file) != 0;
    if (written != content.size() || close_failed) {
        throw std::system_error(error ? error : EIO, std::generic_category(), "cannot write " + path);
    }
    return true;
}

} // namespace stylebind::io
