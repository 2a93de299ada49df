#include <stylebind/sourcemap/source_map.h>
#include <stylebind/json/json.h>
#include <stylebind/sourcemap/vlq.h>
#include <stylebind/url/file_url.h>

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace stylebind::sourcemap {

// ---------------------------------------------------------------------------
// SourceMap
// ---------------------------------------------------------------------------

namespace {

std::vector<Mapping> decode_mappings(std::string_view encoded, size_t source_count) {
    std::vector<Mapping> mappings;
    long long source = 0;
    long long original_line = 0;
    long long original_column = 0;
    size_t line = 1;

    size_t pos = 0;
    while (pos <= encoded.size()) {
        size_t line_end = encoded.find(';', pos);
        if (line_end == std::string_view::npos) line_end = encoded.size();
        std::string_view line_text = encoded.substr(pos, line_end - pos);

        long long column = 0;
        size_t seg_pos = 0;
        while (seg_pos < line_text.size()) {
            size_t seg_end = line_text.find(',', seg_pos);
            if (seg_end == std::string_view::npos) seg_end = line_text.size();
            std::string_view segment = line_text.substr(seg_pos, seg_end - seg_pos);
            seg_pos = seg_end + 1;
            if (segment.empty()) continue;

            auto values = decode_vlq_segment(segment);
            if (!values || (values->size() != 1 && values->size() != 4 && values->size() != 5)) {
                throw SourceMapError("invalid mapping segment '" + std::string(segment) + "'");
            }
            column += (*values)[0];
            if (column < 0) throw SourceMapError("negative generated column in mappings");

            Mapping mapping;
            mapping.generated_line = line;
            mapping.generated_column = static_cast<size_t>(column) + 1;
            if (values->size() >= 4) {
                source += (*values)[1];
                original_line += (*values)[2];
                original_column += (*values)[3];
                if (source < 0 || static_cast<size_t>(source) >= source_count ||
                    original_line < 0 || original_column < 0) {
                    throw SourceMapError("mapping refers outside the source map");
                }
                mapping.source_index = static_cast<size_t>(source);
                mapping.original_line = static_cast<size_t>(original_line) + 1;
                mapping.original_column = static_cast<size_t>(original_column) + 1;
            }
            mappings.push_back(mapping);
        }

        if (line_end == encoded.size()) break;
        pos = line_end + 1;
        ++line;
    }

    std::stable_sort(mappings.begin(), mappings.end(), [](const Mapping& a, const Mapping& b) {
        if (a.generated_line != b.generated_line) return a.generated_line < b.generated_line;
        return a.generated_column < b.generated_column;
    });
    return mappings;
}

} // namespace

SourceMap SourceMap::parse(std::string_view json_text) {
    json::Value root;
    try {
        root = json::parse(json_text, "source map");
    } catch (const json::JsonError& e) {
        throw SourceMapError(e.what());
    }
    if (!root.is_object()) {
        throw SourceMapError("source map is not a JSON object");
    }

    const json::Value* version = root.find("version");
    if (!version || !version->is_number() || version->as_number() != 3) {
        throw SourceMapError("unsupported source map version");
    }
    if (root.find("sections")) {
        throw SourceMapError("indexed source maps are not supported");
    }

    std::string source_root = root.string_at("sourceRoot").value_or("");
    if (!source_root.empty() && source_root.back() != '/') {
        source_root += '/';
    }

    SourceMap map;
    if (const json::Value* sources = root.find("sources"); sources && sources->is_array()) {
        for (const auto& source : sources->items()) {
            std::string name = source.is_string() ? source.as_string() : std::string();
            // Absolute sources and URLs ignore sourceRoot.
            bool absolute = !name.empty() &&
                            (name.front() == '/' || name.find("://") != std::string::npos ||
                             url::is_file_url(name));
            map.sources_.push_back(absolute ? name : source_root + name);
        }
    }

    std::string encoded = root.string_at("mappings").value_or("");
    map.mappings_ = decode_mappings(encoded, map.sources_.size());
    return map;
}

std::optional<OriginalPosition> SourceMap::original_position_for(size_t line, size_t column) const {
    // First mapping strictly after (line, column).
    auto it = std::upper_bound(
        mappings_.begin(), mappings_.end(), std::make_pair(line, column),
        [](const std::pair<size_t, size_t>& pos, const Mapping& m) {
            if (pos.first != m.generated_line) return pos.first < m.generated_line;
            return pos.second < m.generated_column;
        });

    if (it == mappings_.begin()) return std::nullopt;
    --it;
    // A segment without a source ends the previous mapping.
    if (it->generated_line != line || !it->source_index) return std::nullopt;
    return OriginalPosition{*it->source_index, it->original_line, it->original_column};
}

// ---------------------------------------------------------------------------
// Inline maps
// ---------------------------------------------------------------------------

std::string decode_base64(std::string_view encoded) {
    std::string input;
    input.reserve(encoded.size() + 3);
    for (char c : encoded) {
        if (!std::isspace(static_cast<unsigned char>(c))) input += c;
    }
    while (input.size() % 4 != 0) input += '=';
    if (input.empty()) return {};

    size_t padding = 0;
    if (input.back() == '=') ++padding;
    if (input.size() > 1 && input[input.size() - 2] == '=') ++padding;

    std::string output(input.size() / 4 * 3, '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    if (written < 0) {
        throw SourceMapError("malformed base64 data");
    }
    output.resize(static_cast<size_t>(written) - padding);
    return output;
}

std::optional<std::string> extract_inline_source_map(std::string_view css) {
    constexpr std::string_view kMarker = "sourceMappingURL=";
    size_t marker = css.rfind(kMarker);
    if (marker == std::string_view::npos) return std::nullopt;

    size_t start = marker + kMarker.size();
    size_t end = start;
    while (end < css.size() && !std::isspace(static_cast<unsigned char>(css[end])) &&
           css[end] != '*') {
        ++end;
    }
    auto payload = url::base64_data_url_payload(css.substr(start, end - start));
    if (!payload) return std::nullopt;
    return decode_base64(*payload);
}

// ---------------------------------------------------------------------------
// SourceMapGenerator
// ---------------------------------------------------------------------------

SourceMapGenerator::SourceMapGenerator(std::string file) : file_(std::move(file)) {}

void SourceMapGenerator::add_mapping(size_t generated_line, size_t generated_column,
                                     const std::string& source, size_t original_line,
                                     size_t original_column) {
    auto it = std::find(sources_.begin(), sources_.end(), source);
    size_t index = static_cast<size_t>(it - sources_.begin());
    if (it == sources_.end()) {
        sources_.push_back(source);
    }
    Mapping mapping;
    mapping.generated_line = generated_line;
    mapping.generated_column = generated_column;
    mapping.source_index = index;
    mapping.original_line = original_line;
    mapping.original_column = original_column;
    mappings_.push_back(mapping);
}

std::string SourceMapGenerator::to_json() const {
    std::vector<Mapping> sorted = mappings_;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Mapping& a, const Mapping& b) {
        if (a.generated_line != b.generated_line) return a.generated_line < b.generated_line;
        return a.generated_column < b.generated_column;
    });

    std::string encoded;
    size_t line = 1;
    int prev_column = 0;
    int prev_source = 0;
    int prev_original_line = 0;
    int prev_original_column = 0;
    bool first_in_line = true;

    for (const auto& m : sorted) {
        while (line < m.generated_line) {
            encoded += ';';
            ++line;
            prev_column = 0;
            first_in_line = true;
        }
        if (!first_in_line) encoded += ',';
        first_in_line = false;

        int column = static_cast<int>(m.generated_column) - 1;
        int source = static_cast<int>(m.source_index.value_or(0));
        int original_line = static_cast<int>(m.original_line) - 1;
        int original_column = static_cast<int>(m.original_column) - 1;

        encode_vlq(column - prev_column, encoded);
        encode_vlq(source - prev_source, encoded);
        encode_vlq(original_line - prev_original_line, encoded);
        encode_vlq(original_column - prev_original_column, encoded);

        prev_column = column;
        prev_source = source;
        prev_original_line = original_line;
        prev_original_column = original_column;
    }

    std::string out = "{\"version\":3,\"file\":" + json::quote(file_) + ",\"sources\":[";
    for (size_t i = 0; i < sources_.size(); ++i) {
        if (i > 0) out += ',';
        out += json::quote(sources_[i]);
    }
    out += "],\"names\":[],\"mappings\":" + json::quote(encoded) + "}";
    return out;
}

} // namespace stylebind::sourcemap
