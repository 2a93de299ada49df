#pragma once
#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace stylebind::core {

// Canonical name of a style sheet. Two identities are the same file when their
// canonical strings are equal. The ignored identity stands for a specifier the
// host asked us to skip (remote URLs and the like); it never touches the disk.
class FileIdentity {
public:
    FileIdentity() = default;

    // Absolute, lexically normalized, '/'-separated. Relative input is
    // resolved against the current working directory. file:// URLs are
    // accepted and converted to their path.
    static FileIdentity from_path(std::string_view path);
    static FileIdentity ignored(std::string_view specifier);

    const std::string& str() const { return canonical_; }
    bool is_ignored() const { return ignored_; }
    bool empty() const { return canonical_.empty(); }

    // Directory containing the file ("/" for files at the root).
    std::string directory() const;
    // Lower-cased extension including the dot, e.g. ".scss". Empty if none.
    std::string extension() const;

    bool operator==(const FileIdentity& other) const {
        return ignored_ == other.ignored_ && canonical_ == other.canonical_;
    }
    std::strong_ordering operator<=>(const FileIdentity& other) const {
        if (auto cmp = ignored_ <=> other.ignored_; cmp != 0) return cmp;
        return canonical_ <=> other.canonical_;
    }

private:
    std::string canonical_;
    bool ignored_ = false;
};

} // namespace stylebind::core

template <>
struct std::hash<stylebind::core::FileIdentity> {
    size_t operator()(const stylebind::core::FileIdentity& id) const noexcept {
        return std::hash<std::string>{}(id.str()) ^ (id.is_ignored() ? 0x9e3779b9u : 0u);
    }
};
