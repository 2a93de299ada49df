#include <stylebind/core/file_identity.h>
#include <stylebind/url/file_url.h>
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace stylebind::core {

FileIdentity FileIdentity::from_path(std::string_view path) {
    std::string raw(path);
    if (url::is_file_url(raw)) {
        if (auto converted = url::file_url_to_path(raw)) {
            raw = std::move(*converted);
        }
    }

    std::filesystem::path p(raw);
    if (!p.is_absolute()) {
        p = std::filesystem::absolute(p);
    }

    FileIdentity id;
    id.canonical_ = p.lexically_normal().generic_string();
    // "/a/b/" and "/a/b" name the same thing.
    while (id.canonical_.size() > 1 && id.canonical_.back() == '/') {
        id.canonical_.pop_back();
    }
    return id;
}

FileIdentity FileIdentity::ignored(std::string_view specifier) {
    FileIdentity id;
    id.canonical_ = std::string(specifier);
    id.ignored_ = true;
    return id;
}

std::string FileIdentity::directory() const {
    if (ignored_) return {};
    size_t slash = canonical_.rfind('/');
    if (slash == std::string::npos) return {};
    if (slash == 0) return "/";
    return canonical_.substr(0, slash);
}

std::string FileIdentity::extension() const {
    if (ignored_) return {};
    size_t slash = canonical_.rfind('/');
    size_t dot = canonical_.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash) ||
        dot == slash + 1) {
        return {};
    }
    std::string ext = canonical_.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace stylebind::core
