#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace stylebind::url {

std::string percent_encode(std::string_view input, bool encode_path_chars = false);
std::string percent_decode(std::string_view input);

// "/a/b c.css" -> "file:///a/b%20c.css"
std::string path_to_file_url(std::string_view absolute_path);
// Returns nullopt unless input is a file: URL with an empty or "localhost" host.
std::optional<std::string> file_url_to_path(std::string_view url);

bool is_file_url(std::string_view input);
// http:, https: and protocol-relative "//host/..." specifiers.
bool is_remote_url(std::string_view input);
// data:...;base64,PAYLOAD -> PAYLOAD (still encoded). nullopt if not base64 data.
std::optional<std::string_view> base64_data_url_payload(std::string_view input);

} // namespace stylebind::url
