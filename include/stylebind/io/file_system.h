#pragma once
#include <string>
#include <string_view>

namespace stylebind::io {

// File access used by the loader and the resolver. Tests substitute
// counting or in-memory variants.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Throws std::system_error carrying the errno of the failure.
    virtual std::string read_file(const std::string& path) const = 0;

    virtual bool is_file(const std::string& path) const = 0;
    virtual bool is_directory(const std::string& path) const = 0;
    bool exists(const std::string& path) const { return is_file(path) || is_directory(path); }
};

class DiskFileSystem : public FileSystem {
public:
    std::string read_file(const std::string& path) const override;
    bool is_file(const std::string& path) const override;
    bool is_directory(const std::string& path) const override;
};

// Writes `content` unless the file already holds exactly that. Parent
// directories are created. Returns true when the file was written.
// Throws std::system_error on failure.
bool write_file_if_changed(const std::string& path, std::string_view content);

} // namespace stylebind::io
