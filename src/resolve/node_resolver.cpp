#include <stylebind/resolve/node_resolver.h>
#include <stylebind/json/json.h>
#include <stylebind/url/file_url.h>

#include <filesystem>
#include <system_error>

namespace stylebind::resolve {

namespace fs = std::filesystem;

ResolveError::ResolveError(std::string specifier, const core::FileIdentity& requesting_file,
                           const std::string& reason)
    : std::runtime_error("cannot resolve '" + specifier + "' from " + requesting_file.str() +
                         ": " + reason),
      specifier_(std::move(specifier)),
      reason_(reason),
      requesting_file_(requesting_file) {}

namespace {

constexpr int kMaxAliasDepth = 8;

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string join(const std::string& base, const std::string& relative) {
    return (fs::path(base) / relative).lexically_normal().generic_string();
}

std::string parent_of(const std::string& dir) {
    fs::path p(dir);
    return p.has_parent_path() ? p.parent_path().generic_string() : dir;
}

bool is_relative_specifier(std::string_view specifier) {
    return specifier == "." || specifier == ".." || starts_with(specifier, "./") || starts_with(specifier, "../");
}

bool is_style_path(std::string_view path) {
    return ends_with(path, ".css") || ends_with(path, ".scss") || ends_with(path, ".sass") ||
           ends_with(path, ".less");
}

// Condition objects in "imports" pick the first matching key.
std::optional<std::string> pick_target(const json::Value& target) {
    if (target.is_string()) return target.as_string();
    if (target.is_array()) {
        for (const auto& item : target.items()) {
            if (auto picked = pick_target(item)) return picked;
        }
        return std::nullopt;
    }
    if (target.is_object()) {
        for (const char* condition : {"style", "import", "require", "default"}) {
            if (const json::Value* value = target.find(condition)) {
                if (auto picked = pick_target(*value)) return picked;
            }
        }
    }
    return std::nullopt;
}

} // namespace

NodeResolver::NodeResolver(const io::FileSystem& fs, NodeResolverOptions options)
    : fs_(fs), options_(std::move(options)) {}

bool NodeResolver::is_ignored(std::string_view specifier) const {
    if (options_.is_ignored) return options_.is_ignored(specifier);
    return url::is_remote_url(specifier);
}

core::FileIdentity NodeResolver::resolve(std::string_view specifier,
                                         const ResolveContext& context) const {
    if (is_ignored(specifier)) {
        return core::FileIdentity::ignored(specifier);
    }
    if (specifier.empty()) {
        throw ResolveError(std::string(specifier), context.requesting_file, "empty specifier");
    }

    std::optional<std::string> resolved;
    try {
        resolved = resolve_path(std::string(specifier), context.requesting_file.directory(),
                                context.requesting_file.extension(), 0);
    } catch (const json::JsonError& e) {
        throw ResolveError(std::string(specifier), context.requesting_file,
                           std::string("invalid package.json: ") + e.what());
    } catch (const std::system_error& e) {
        throw ResolveError(std::string(specifier), context.requesting_file, e.what());
    }
    if (!resolved) {
        throw ResolveError(std::string(specifier), context.requesting_file, "no such file");
    }
    return core::FileIdentity::from_path(*resolved);
}

std::optional<std::string> NodeResolver::resolve_path(const std::string& specifier,
                                                      const std::string& base_dir,
                                                      const std::string& style_ext,
                                                      int alias_depth) const {
    if (url::is_file_url(specifier)) {
        auto path = url::file_url_to_path(specifier);
        if (!path) return std::nullopt;
        return resolve_file(*path, style_ext);
    }

    if (alias_depth < kMaxAliasDepth) {
        for (const auto& [name, replacement] : options_.aliases) {
            if (specifier == name || starts_with(specifier, name + "/")) {
                return resolve_path(replacement + specifier.substr(name.size()), base_dir,
                                    style_ext, alias_depth + 1);
            }
        }
    }

    if (specifier.empty()) return std::nullopt;
    if (specifier.front() == '/') {
        return resolve_file(specifier, style_ext);
    }
    if (is_relative_specifier(specifier)) {
        return resolve_file(join(base_dir, specifier), style_ext);
    }
    if (specifier.front() == '#') {
        return resolve_subpath_import(specifier, base_dir, style_ext);
    }

    // css-loader treats "foo.css" as a sibling before looking in node_modules.
    if (specifier.front() != '~') {
        if (auto sibling = resolve_file(join(base_dir, specifier), style_ext)) return sibling;
    }
    if (auto module = resolve_node_module(specifier, base_dir, style_ext)) {
        return module;
    }
    for (const auto& dir : options_.lookup_directories) {
        if (auto found = resolve_file(join(dir, specifier), style_ext)) return found;
    }
    return std::nullopt;
}

// Exact file, then the extension of the requesting file, sass partials and
// directory index files.
std::optional<std::string> NodeResolver::resolve_file(const std::string& path,
                                                      const std::string& style_ext) const {
    if (fs_.is_file(path)) return path;

    fs::path p(path);
    if (!p.has_extension() && !style_ext.empty()) {
        std::vector<std::string> candidates{path + style_ext};
        if (style_ext == ".scss" || style_ext == ".sass") {
            candidates.push_back(
                (p.parent_path() / ("_" + p.filename().string() + style_ext)).generic_string());
            candidates.push_back(path + ".css");
        }
        candidates.push_back(join(path, "index" + style_ext));
        if (style_ext == ".scss" || style_ext == ".sass") {
            candidates.push_back(join(path, "_index" + style_ext));
        }
        for (const auto& candidate : candidates) {
            if (fs_.is_file(candidate)) return candidate;
        }
    }
    return std::nullopt;
}

// "#name" and "#prefix/*" entries of the nearest package.json "imports".
std::optional<std::string> NodeResolver::resolve_subpath_import(const std::string& specifier,
                                                                const std::string& base_dir,
                                                                const std::string& style_ext) const {
    std::string dir = base_dir;
    while (true) {
        std::string manifest = join(dir, "package.json");
        if (fs_.is_file(manifest)) break;
        std::string parent = parent_of(dir);
        if (parent == dir) return std::nullopt;
        dir = parent;
    }

    std::string manifest = join(dir, "package.json");
    json::Value package = json::parse(fs_.read_file(manifest), manifest);
    const json::Value* imports = package.find("imports");
    if (!imports || !imports->is_object()) return std::nullopt;

    for (const auto& [key, target] : imports->members()) {
        std::optional<std::string> mapped;
        size_t star = key.find('*');
        if (star == std::string::npos) {
            if (key == specifier) mapped = pick_target(target);
        } else {
            std::string prefix = key.substr(0, star);
            std::string suffix = key.substr(star + 1);
            if (specifier.size() >= prefix.size() + suffix.size() &&
                starts_with(specifier, prefix) && ends_with(specifier, suffix)) {
                std::string match =
                    specifier.substr(prefix.size(), specifier.size() - prefix.size() - suffix.size());
                if (auto pattern = pick_target(target)) {
                    std::string expanded = *pattern;
                    for (size_t pos = expanded.find('*'); pos != std::string::npos;
                         pos = expanded.find('*', pos + match.size())) {
                        expanded.replace(pos, 1, match);
                    }
                    mapped = expanded;
                }
            }
        }
        if (mapped) {
            if (is_relative_specifier(*mapped)) {
                return resolve_file(join(dir, *mapped), style_ext);
            }
            return resolve_node_module(*mapped, dir, style_ext);
        }
    }
    return std::nullopt;
}

std::optional<std::string> NodeResolver::resolve_node_module(const std::string& specifier,
                                                             const std::string& base_dir,
                                                             const std::string& style_ext) const {
    std::string request = specifier;
    if (!request.empty() && request.front() == '~') request.erase(0, 1);
    if (request.empty()) return std::nullopt;

    // "@scope/name/sub/path" -> package "@scope/name", subpath "sub/path".
    size_t name_end = request.find('/');
    if (request.front() == '@' && name_end != std::string::npos) {
        name_end = request.find('/', name_end + 1);
    }
    std::string package = request.substr(0, name_end);
    std::string subpath = name_end == std::string::npos ? "" : request.substr(name_end + 1);

    std::string dir = base_dir;
    while (true) {
        if (fs::path(dir).filename() != "node_modules") {
            std::string package_dir = join(join(dir, "node_modules"), package);
            if (fs_.is_directory(package_dir)) {
                auto found = subpath.empty() ? resolve_package_root(package_dir, style_ext)
                                             : resolve_file(join(package_dir, subpath), style_ext);
                if (found) return found;
            }
        }
        std::string parent = parent_of(dir);
        if (parent == dir) return std::nullopt;
        dir = parent;
    }
}

// package.json "sass" or "less" for the requesting dialect, then "style",
// then a style sheet "main", then index files.
std::optional<std::string> NodeResolver::resolve_package_root(const std::string& package_dir,
                                                              const std::string& style_ext) const {
    std::string manifest = join(package_dir, "package.json");
    if (fs_.is_file(manifest)) {
        json::Value package = json::parse(fs_.read_file(manifest), manifest);
        const char* dialect_field = style_ext == ".scss" || style_ext == ".sass" ? "sass"
                                    : style_ext == ".less"                      ? "less"
                                                                                : nullptr;
        if (dialect_field) {
            if (auto entry = package.string_at(dialect_field)) {
                if (auto found = resolve_file(join(package_dir, *entry), style_ext)) return found;
            }
        }
        if (auto style = package.string_at("style")) {
            if (auto found = resolve_file(join(package_dir, *style), style_ext)) return found;
        }
        if (auto main = package.string_at("main"); main && is_style_path(*main)) {
            if (auto found = resolve_file(join(package_dir, *main), style_ext)) return found;
        }
    }
    for (const std::string& ext : {style_ext, std::string(".css")}) {
        if (ext.empty()) continue;
        std::string index = join(package_dir, "index" + ext);
        if (fs_.is_file(index)) return index;
    }
    return std::nullopt;
}

} // namespace stylebind::resolve
