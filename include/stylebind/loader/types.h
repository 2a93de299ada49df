#pragma once
#include <stylebind/core/file_identity.h>
#include <stylebind/css/parser/tokenizer.h>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace stylebind::loader {

// 1-based, end exclusive.
struct SourceLocation {
    core::FileIdentity file;
    css::TextPosition start;
    css::TextPosition end;

    bool operator==(const SourceLocation& other) const = default;
};

struct Token {
    std::string name;
    std::vector<SourceLocation> original_locations;  // never empty, no duplicates
};

struct LoadResult {
    std::vector<Token> tokens;                  // unique names
    std::set<core::FileIdentity> dependencies;  // transitive, without the file itself

    const Token* find(std::string_view name) const {
        for (const auto& token : tokens) {
            if (token.name == name) return &token;
        }
        return nullptr;
    }
};

} // namespace stylebind::loader
