#include <stylebind/runner/glob.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <system_error>

namespace stylebind::runner {

namespace fs = std::filesystem;

namespace {

std::vector<std::string_view> split_segments(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        if (end > start) segments.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    return segments;
}

// Matches "[...]" at pattern[p]; advances p past the class.
bool match_class(std::string_view pattern, size_t& p, char c) {
    size_t i = p + 1;
    bool negate = i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^');
    if (negate) ++i;
    bool matched = false;
    bool first = true;
    while (i < pattern.size() && (pattern[i] != ']' || first)) {
        first = false;
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            if (c >= pattern[i] && c <= pattern[i + 2]) matched = true;
            i += 3;
        } else {
            if (c == pattern[i]) matched = true;
            ++i;
        }
    }
    p = i < pattern.size() ? i + 1 : i;
    return matched != negate;
}

bool match_segment(std::string_view pattern, std::string_view name) {
    size_t p = 0;
    size_t n = 0;
    size_t star_p = std::string_view::npos;
    size_t star_n = 0;
    while (n < name.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star_p = p++;
            star_n = n;
            continue;
        }
        if (p < pattern.size() && pattern[p] == '[' &&
            pattern.find(']', p + 2) != std::string_view::npos) {
            size_t next = p;
            if (match_class(pattern, next, name[n])) {
                p = next;
                ++n;
                continue;
            }
        } else if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
            continue;
        }
        if (star_p == std::string_view::npos) return false;
        p = star_p + 1;
        n = ++star_n;
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

bool match_segments(const std::vector<std::string_view>& pattern, size_t pi,
                    const std::vector<std::string_view>& path, size_t si) {
    while (pi < pattern.size()) {
        if (pattern[pi] == "**") {
            // Collapse runs of "**".
            while (pi + 1 < pattern.size() && pattern[pi + 1] == "**") ++pi;
            if (pi + 1 == pattern.size()) return true;
            for (size_t k = si; k <= path.size(); ++k) {
                if (match_segments(pattern, pi + 1, path, k)) return true;
            }
            return false;
        }
        if (si >= path.size() || !match_segment(pattern[pi], path[si])) return false;
        ++pi;
        ++si;
    }
    return si == path.size();
}

bool has_magic(std::string_view segment) {
    return segment.find_first_of("*?[{") != std::string_view::npos;
}

} // namespace

std::vector<std::string> expand_braces(std::string_view pattern) {
    size_t open = pattern.find('{');
    if (open == std::string_view::npos) return {std::string(pattern)};

    int depth = 0;
    size_t close = std::string_view::npos;
    std::vector<size_t> commas;
    for (size_t i = open; i < pattern.size(); ++i) {
        if (pattern[i] == '{') {
            ++depth;
        } else if (pattern[i] == '}') {
            if (--depth == 0) {
                close = i;
                break;
            }
        } else if (pattern[i] == ',' && depth == 1) {
            commas.push_back(i);
        }
    }
    if (close == std::string_view::npos) return {std::string(pattern)};

    std::string prefix(pattern.substr(0, open));
    std::string_view suffix = pattern.substr(close + 1);
    std::vector<std::string> out;
    size_t start = open + 1;
    commas.push_back(close);
    for (size_t comma : commas) {
        std::string alternative = prefix + std::string(pattern.substr(start, comma - start)) +
                                  std::string(suffix);
        for (auto& expanded : expand_braces(alternative)) {
            out.push_back(std::move(expanded));
        }
        start = comma + 1;
    }
    return out;
}

bool glob_match(std::string_view pattern, std::string_view path) {
    auto path_segments = split_segments(path);
    for (const auto& alternative : expand_braces(pattern)) {
        if (match_segments(split_segments(alternative), 0, path_segments, 0)) return true;
    }
    return false;
}

std::vector<std::string> expand_glob(const std::string& pattern, const std::string& cwd) {
    std::set<std::string> found;
    for (const auto& alternative : expand_braces(pattern)) {
        fs::path absolute = fs::path(alternative).is_absolute()
                                ? fs::path(alternative)
                                : fs::path(cwd) / alternative;
        std::string full = absolute.lexically_normal().generic_string();

        // Walk from the deepest directory without wildcards.
        auto segments = split_segments(full);
        std::string base = "/";
        size_t literal = 0;
        while (literal < segments.size() && !has_magic(segments[literal])) {
            ++literal;
        }
        if (literal == segments.size()) {
            std::error_code ec;
            if (fs::is_regular_file(full, ec)) found.insert(full);
            continue;
        }
        for (size_t i = 0; i < literal; ++i) {
            base += std::string(segments[i]);
            if (i + 1 < literal) base += "/";
        }

        std::error_code ec;
        if (!fs::is_directory(base, ec)) continue;
        fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code status_ec;
            if (!it->is_regular_file(status_ec)) continue;
            std::string candidate = it->path().lexically_normal().generic_string();
            if (glob_match(full, candidate)) found.insert(candidate);
        }
    }
    return {found.begin(), found.end()};
}

} // namespace stylebind::runner
