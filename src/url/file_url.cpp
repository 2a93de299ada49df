#include <stylebind/url/file_url.h>
#include <cctype>
#include <cstdint>

namespace stylebind::url {

namespace {

constexpr char hex_digits[] = "0123456789ABCDEF";

// Characters that are unreserved and never percent-encoded
bool is_unreserved(char c) {
    return (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

// Characters that appear in path components but should not normally be encoded
// when encoding a full path (but should be when encoding a path segment)
bool is_path_char(char c) {
    return c == '/' || c == ':' || c == '@' ||
           c == '!' || c == '$' || c == '&' || c == '\'' ||
           c == '(' || c == ')' || c == '*' || c == '+' ||
           c == ',' || c == ';' || c == '=';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool starts_with_ci(std::string_view value, std::string_view prefix) {
    if (value.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::string percent_encode(std::string_view input, bool encode_path_chars) {
    std::string result;
    result.reserve(input.size());

    for (unsigned char c : input) {
        if (is_unreserved(static_cast<char>(c))) {
            result += static_cast<char>(c);
        } else if (!encode_path_chars && is_path_char(static_cast<char>(c))) {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex_digits[(c >> 4) & 0xF];
            result += hex_digits[c & 0xF];
        }
    }

    return result;
}

std::string percent_decode(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += input[i];
    }

    return result;
}

std::string path_to_file_url(std::string_view absolute_path) {
    std::string result = "file://";
    if (absolute_path.empty() || absolute_path.front() != '/') {
        result += '/';
    }
    result += percent_encode(absolute_path);
    return result;
}

std::optional<std::string> file_url_to_path(std::string_view url) {
    if (!is_file_url(url)) return std::nullopt;
    std::string_view rest = url.substr(5);  // after "file:"

    if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        size_t slash = rest.find('/');
        std::string_view host = rest.substr(0, slash);
        if (!host.empty() && host != "localhost") {
            return std::nullopt;
        }
        rest = slash == std::string_view::npos ? std::string_view("/") : rest.substr(slash);
    }

    // Query and fragment never name part of a file.
    size_t cut = rest.find_first_of("?#");
    if (cut != std::string_view::npos) rest = rest.substr(0, cut);
    if (rest.empty()) return std::nullopt;

    return percent_decode(rest);
}

bool is_file_url(std::string_view input) {
    return starts_with_ci(input, "file:");
}

bool is_remote_url(std::string_view input) {
    return starts_with_ci(input, "http://") || starts_with_ci(input, "https://") ||
           input.substr(0, 2) == "//";
}

std::optional<std::string_view> base64_data_url_payload(std::string_view input) {
    if (!starts_with_ci(input, "data:")) return std::nullopt;
    size_t comma = input.find(',');
    if (comma == std::string_view::npos) return std::nullopt;
    std::string_view header = input.substr(5, comma - 5);
    constexpr std::string_view kBase64 = ";base64";
    if (header.size() < kBase64.size() ||
        header.substr(header.size() - kBase64.size()) != kBase64) {
        return std::nullopt;
    }
    return input.substr(comma + 1);
}

} // namespace stylebind::url
