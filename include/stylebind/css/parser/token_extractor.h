#pragma once
#include <stylebind/css/parser/tokenizer.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace stylebind::css {

// Position range inside the extracted CSS, end exclusive.
struct TextRange {
    TextPosition start;
    TextPosition end;

    bool operator==(const TextRange& other) const = default;
};

// One exported class. Repeated declarations collapse into one entry whose
// ranges keep document order.
struct LocalToken {
    std::string name;
    std::vector<TextRange> ranges;
};

struct ComposesReference {
    std::vector<std::string> token_names;     // as written
    std::optional<std::string> specifier;     // nullopt: composes from this file
    std::vector<std::string> owners;          // classes of the enclosing rule
    TextRange range;                          // the declaration
};

struct ImportReference {
    std::string specifier;
    TextRange range;
};

struct ExtractedTokens {
    std::vector<LocalToken> local_tokens;            // first-declaration order
    std::vector<ComposesReference> composes_refs;    // document order
    std::vector<ImportReference> import_refs;        // document order
};

class ExtractError : public std::runtime_error {
public:
    ExtractError(const std::string& message, TextPosition position);
    const TextPosition& position() const { return position_; }

private:
    TextPosition position_;
};

// Pulls exported class tokens and composition edges out of normalized CSS.
// Throws ExtractError on structurally malformed input.
ExtractedTokens extract_tokens(std::string_view css);

} // namespace stylebind::css
