#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylebind::sourcemap {

// Base64 VLQ as used by the "mappings" field of source map v3.
void encode_vlq(int value, std::string& out);

// Decodes every value of one segment ("AAgBC" -> {0, 0, 16, 1}).
// Returns nullopt on a character outside the alphabet or a truncated value.
std::optional<std::vector<int>> decode_vlq_segment(std::string_view segment);

} // namespace stylebind::sourcemap
