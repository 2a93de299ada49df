#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace stylebind::sourcemap {

class SourceMapError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Lines and columns in this module are 1-based, matching css::TextPosition.
struct Mapping {
    size_t generated_line = 1;
    size_t generated_column = 1;
    std::optional<size_t> source_index;
    size_t original_line = 1;
    size_t original_column = 1;
};

struct OriginalPosition {
    size_t source_index = 0;
    size_t line = 1;
    size_t column = 1;
};

// Decoded source map v3 (no index maps).
class SourceMap {
public:
    // Throws SourceMapError on bad JSON, a wrong version or broken mappings.
    // "sourceRoot" is already joined onto every source.
    static SourceMap parse(std::string_view json_text);

    const std::vector<std::string>& sources() const { return sources_; }
    // Hosts rewrite the raw names into file identities after parsing.
    std::vector<std::string>& sources() { return sources_; }
    const std::vector<Mapping>& mappings() const { return mappings_; }

    // Greatest mapping at or before (line, column) on the same generated
    // line that has a source.
    std::optional<OriginalPosition> original_position_for(size_t line, size_t column) const;

private:
    std::vector<std::string> sources_;
    std::vector<Mapping> mappings_;  // sorted by generated position
};

// The decoded JSON of a trailing "sourceMappingURL=data:...;base64," comment,
// or nullopt if the CSS carries none.
std::optional<std::string> extract_inline_source_map(std::string_view css);

// Decodes standard base64. Throws SourceMapError on malformed input.
std::string decode_base64(std::string_view encoded);

class SourceMapGenerator {
public:
    explicit SourceMapGenerator(std::string file);

    void add_mapping(size_t generated_line, size_t generated_column,
                     const std::string& source, size_t original_line, size_t original_column);

    std::string to_json() const;

private:
    std::string file_;
    std::vector<std::string> sources_;
    std::vector<Mapping> mappings_;
};

} // namespace stylebind::sourcemap
