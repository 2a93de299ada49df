#include <stylebind/css/parser/token_extractor.h>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace stylebind::css {

namespace {

std::string ascii_lower(std::string value) {
    std::transform(
        value.begin(),
        value.end(),
        value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// At-rules whose block holds ordinary rules.
bool is_grouping_at_rule(const std::string& keyword) {
    return keyword == "media" || keyword == "supports" || keyword == "layer" ||
           keyword == "container" || keyword == "scope" || keyword == "document" ||
           keyword == "-moz-document" || keyword == "starting-style";
}

// One element of a selector after '&' resolution.
struct SelectorPiece {
    enum Kind { Class, Nest, Word, Combinator, Other };
    Kind kind = Other;
    std::string text;
    TextRange range;
    size_t offset = 0;       // byte range in the CSS, used for adjacency
    size_t end_offset = 0;
    bool inherited = false;  // copied in from the parent selector
    bool global = false;     // inside :global
};

using ComplexSelectorPieces = std::vector<SelectorPiece>;
using SelectorPieceList = std::vector<ComplexSelectorPieces>;

} // namespace

ExtractError::ExtractError(const std::string& message, TextPosition position)
    : std::runtime_error(message + " at " + std::to_string(position.line) + ":" +
                         std::to_string(position.column)),
      position_(position) {}

// ---------------------------------------------------------------------------
// Internal extraction parser
// ---------------------------------------------------------------------------

class TokenExtractParser {
public:
    TokenExtractParser(std::string_view css, std::vector<CSSToken> tokens)
        : lines_(css), tokens_(std::move(tokens)), pos_(0) {}

    ExtractedTokens parse();

private:
    LineIndex lines_;
    std::vector<CSSToken> tokens_;
    size_t pos_;
    ExtractedTokens result_;
    std::unordered_map<std::string, size_t> token_index_;

    const CSSToken& current() const;
    bool at_end() const;
    void advance();
    void skip_whitespace();
    [[noreturn]] void fail(const std::string& message) const;
    [[noreturn]] void fail_at(const std::string& message, size_t offset) const;
    TextRange range_of(size_t begin, size_t end) const;

    void reject_bad_tokens() const;

    // Rules
    void parse_rule_list(const SelectorPieceList* parents, bool inside_block);
    void parse_at_rule(const SelectorPieceList* parents, bool inside_style_rule);
    void parse_import_rule(size_t at_offset);
    void parse_style_rule(const SelectorPieceList* parents);
    void parse_rule_body(const SelectorPieceList& selectors);
    bool block_follows() const;
    void skip_block();
    void skip_statement();

    // Selectors
    SelectorPieceList consume_selector_list();
    SelectorPieceList resolve_nesting(const SelectorPieceList& nested,
                                      const SelectorPieceList* parents) const;
    void record_classes(const SelectorPieceList& selectors);
    std::vector<std::string> owner_classes(const SelectorPieceList& selectors) const;

    // Declarations
    void parse_declaration(const SelectorPieceList& selectors);
    void parse_composes(const SelectorPieceList& selectors, size_t decl_offset);
};

const CSSToken& TokenExtractParser::current() const {
    if (pos_ < tokens_.size()) {
        return tokens_[pos_];
    }
    static const CSSToken eof{};
    return eof;
}

bool TokenExtractParser::at_end() const {
    return pos_ >= tokens_.size() || tokens_[pos_].type == CSSToken::EndOfFile;
}

void TokenExtractParser::advance() {
    if (pos_ < tokens_.size()) {
        ++pos_;
    }
}

void TokenExtractParser::skip_whitespace() {
    while (!at_end() && current().type == CSSToken::Whitespace) {
        advance();
    }
}

void TokenExtractParser::fail(const std::string& message) const {
    fail_at(message, current().offset);
}

void TokenExtractParser::fail_at(const std::string& message, size_t offset) const {
    throw ExtractError(message, lines_.position_of(offset));
}

TextRange TokenExtractParser::range_of(size_t begin, size_t end) const {
    return TextRange{lines_.position_of(begin), lines_.position_of(end)};
}

void TokenExtractParser::reject_bad_tokens() const {
    for (const auto& token : tokens_) {
        if (token.type == CSSToken::BadString) {
            fail_at("unterminated string", token.offset);
        }
        if (token.type == CSSToken::BadComment) {
            fail_at("unterminated comment", token.offset);
        }
    }
}

ExtractedTokens TokenExtractParser::parse() {
    reject_bad_tokens();
    parse_rule_list(nullptr, false);
    return std::move(result_);
}

// Walks rules until EOF (top level) or the '}' closing the enclosing block.
// The closing '}' is left for the caller.
void TokenExtractParser::parse_rule_list(const SelectorPieceList* parents, bool inside_block) {
    while (true) {
        skip_whitespace();
        if (at_end()) {
            if (inside_block) fail("unclosed block");
            return;
        }

        switch (current().type) {
            case CSSToken::RightBrace:
                if (inside_block) return;
                fail("unexpected '}'");
            case CSSToken::CDO:
            case CSSToken::CDC:
            case CSSToken::Semicolon:
                advance();
                break;
            case CSSToken::AtKeyword:
                parse_at_rule(parents, false);
                break;
            default:
                parse_style_rule(parents);
                break;
        }
    }
}

void TokenExtractParser::parse_at_rule(const SelectorPieceList* parents, bool inside_style_rule) {
    size_t at_offset = current().offset;
    std::string keyword = ascii_lower(current().value);
    advance(); // skip at-keyword

    if (keyword == "import" && parents == nullptr) {
        parse_import_rule(at_offset);
        return;
    }

    if (!is_grouping_at_rule(keyword)) {
        skip_statement();
        return;
    }

    // Prelude up to the block; "@layer a, b;" has none.
    while (!at_end() && current().type != CSSToken::LeftBrace &&
           current().type != CSSToken::Semicolon) {
        if (current().type == CSSToken::RightBrace) {
            if (parents != nullptr) return;  // enclosing block ends
            fail("unexpected '}'");
        }
        advance();
    }
    if (at_end()) {
        fail_at("expected '{' after @" + keyword, at_offset);
    }
    if (current().type == CSSToken::Semicolon) {
        advance();
        return;
    }

    advance(); // '{'
    if (inside_style_rule && parents != nullptr) {
        parse_rule_body(*parents);
    } else {
        parse_rule_list(parents, true);
    }
    advance(); // '}'
}

void TokenExtractParser::parse_import_rule(size_t at_offset) {
    ImportReference ref;
    skip_whitespace();

    // @import can be:
    //   url("...") / url('...') / url(bare.css)
    //   "..." / '...'
    if (!at_end() && current().type == CSSToken::Function && ascii_lower(current().value) == "url") {
        advance(); // skip 'url('
        skip_whitespace();
        if (!at_end() && current().type == CSSToken::String) {
            ref.specifier = current().value;
            advance();
            skip_whitespace();
        } else {
            // Bare URLs arrive as several tokens ('/', ':', '.' are delims).
            std::string bare;
            while (!at_end() &&
                   current().type != CSSToken::RightParen &&
                   current().type != CSSToken::Semicolon &&
                   current().type != CSSToken::Whitespace) {
                bare += current().type == CSSToken::Hash ? "#" + current().value
                                                          : current().value;
                advance();
            }
            ref.specifier = bare;
            skip_whitespace();
        }
        if (!at_end() && current().type == CSSToken::RightParen) {
            advance();
        }
    } else if (!at_end() && current().type == CSSToken::String) {
        ref.specifier = current().value;
        advance();
    } else {
        fail("expected a string or url() after @import");
    }

    // Media and supports conditions do not change what is imported.
    while (!at_end() && current().type != CSSToken::Semicolon) {
        if (current().type == CSSToken::LeftBrace || current().type == CSSToken::RightBrace) {
            fail("expected ';' after @import");
        }
        advance();
    }
    size_t end = at_end() ? current().offset : current().end_offset;
    if (!at_end()) advance(); // ';'

    if (ref.specifier.empty()) {
        fail_at("empty @import specifier", at_offset);
    }
    ref.range = range_of(at_offset, end);
    result_.import_refs.push_back(std::move(ref));
}

void TokenExtractParser::parse_style_rule(const SelectorPieceList* parents) {
    size_t rule_offset = current().offset;
    SelectorPieceList nested = consume_selector_list();
    if (at_end() || current().type != CSSToken::LeftBrace) {
        fail_at("expected '{' after selector", rule_offset);
    }
    advance(); // '{'

    SelectorPieceList selectors = resolve_nesting(nested, parents);
    record_classes(selectors);
    parse_rule_body(selectors);

    if (at_end()) {
        fail_at("unclosed block", rule_offset);
    }
    advance(); // '}'
}

// Contents of a style rule: declarations, nested rules and nested
// grouping at-rules. Stops at (without consuming) the closing '}'.
void TokenExtractParser::parse_rule_body(const SelectorPieceList& selectors) {
    while (true) {
        skip_whitespace();
        if (at_end()) {
            fail("unclosed block");
        }
        const CSSToken& tok = current();
        if (tok.type == CSSToken::RightBrace) {
            return;
        }
        if (tok.type == CSSToken::Semicolon) {
            advance();
            continue;
        }
        if (tok.type == CSSToken::AtKeyword) {
            parse_at_rule(&selectors, true);
            continue;
        }
        if (block_follows()) {
            parse_style_rule(&selectors);
        } else {
            parse_declaration(selectors);
        }
    }
}

// True when a '{' arrives before the next ';' or '}' at this nesting depth,
// i.e. the statement at the cursor is a nested rule, not a declaration.
bool TokenExtractParser::block_follows() const {
    int depth = 0;
    for (size_t i = pos_; i < tokens_.size(); ++i) {
        switch (tokens_[i].type) {
            case CSSToken::Function:
            case CSSToken::LeftParen:
            case CSSToken::LeftBracket:
                ++depth;
                break;
            case CSSToken::RightParen:
            case CSSToken::RightBracket:
                if (depth > 0) --depth;
                break;
            case CSSToken::LeftBrace:
                return depth == 0;
            case CSSToken::Semicolon:
                if (depth == 0) return false;
                break;
            case CSSToken::RightBrace:
            case CSSToken::EndOfFile:
                return false;
            default:
                break;
        }
    }
    return false;
}

void TokenExtractParser::skip_block() {
    size_t open_offset = current().offset;
    advance(); // '{'
    int depth = 1;
    while (!at_end() && depth > 0) {
        if (current().type == CSSToken::LeftBrace) depth++;
        else if (current().type == CSSToken::RightBrace) depth--;
        advance();
    }
    if (depth > 0) {
        fail_at("unclosed block", open_offset);
    }
}

// Unknown at-rule: up to ';' or past its block. A '}' ends the statement
// without being consumed.
void TokenExtractParser::skip_statement() {
    while (!at_end()) {
        if (current().type == CSSToken::Semicolon) {
            advance();
            return;
        }
        if (current().type == CSSToken::LeftBrace) {
            skip_block();
            return;
        }
        if (current().type == CSSToken::RightBrace) {
            return;
        }
        advance();
    }
}

// ---------------------------------------------------------------------------
// Selectors
// ---------------------------------------------------------------------------

// Consumes selector tokens up to (not including) '{' and splits them into
// complex selectors at top-level commas.
SelectorPieceList TokenExtractParser::consume_selector_list() {
    SelectorPieceList list(1);
    int paren_depth = 0;
    int global_depth = -1;     // paren depth at which :global( opened
    bool global_mode = false;  // bare ":global" switches the rest of the selector

    auto push_piece = [&](SelectorPiece::Kind kind, std::string text, size_t begin, size_t end) {
        SelectorPiece piece;
        piece.kind = kind;
        piece.text = std::move(text);
        piece.offset = begin;
        piece.end_offset = end;
        piece.range = range_of(begin, end);
        piece.global = global_mode || global_depth >= 0;
        list.back().push_back(std::move(piece));
    };

    while (!at_end()) {
        const CSSToken& tok = current();
        if (tok.type == CSSToken::LeftBrace && paren_depth == 0) break;
        if (tok.type == CSSToken::RightBrace || tok.type == CSSToken::Semicolon) break;

        if (tok.type == CSSToken::Comma && paren_depth == 0) {
            list.emplace_back();
            global_mode = false;
            advance();
            continue;
        }

        if (tok.type == CSSToken::Delim && tok.value == "." && pos_ + 1 < tokens_.size() &&
            tokens_[pos_ + 1].type == CSSToken::Ident &&
            tokens_[pos_ + 1].offset == tok.end_offset) {
            const CSSToken& name = tokens_[pos_ + 1];
            push_piece(SelectorPiece::Class, name.value, tok.offset, name.end_offset);
            advance();
            advance();
            continue;
        }

        if (tok.type == CSSToken::Colon && pos_ + 1 < tokens_.size()) {
            const CSSToken& next = tokens_[pos_ + 1];
            std::string name = ascii_lower(next.value);
            if (next.type == CSSToken::Function && (name == "global" || name == "local")) {
                push_piece(SelectorPiece::Other, ":" + next.value + "(", tok.offset, next.end_offset);
                advance();
                advance();
                ++paren_depth;
                if (name == "global" && global_depth < 0) global_depth = paren_depth;
                continue;
            }
            if (next.type == CSSToken::Ident && (name == "global" || name == "local")) {
                global_mode = name == "global";
                advance();
                advance();
                continue;
            }
        }

        switch (tok.type) {
            case CSSToken::Whitespace:
                push_piece(SelectorPiece::Combinator, " ", tok.offset, tok.end_offset);
                break;
            case CSSToken::Delim:
                if (tok.value == "&") {
                    push_piece(SelectorPiece::Nest, "&", tok.offset, tok.end_offset);
                } else if (tok.value == ">" || tok.value == "+" || tok.value == "~") {
                    push_piece(SelectorPiece::Combinator, tok.value, tok.offset, tok.end_offset);
                } else {
                    push_piece(SelectorPiece::Other, tok.value, tok.offset, tok.end_offset);
                }
                break;
            case CSSToken::Ident:
            case CSSToken::Number:
            case CSSToken::Dimension:
                push_piece(SelectorPiece::Word, tok.value, tok.offset, tok.end_offset);
                break;
            case CSSToken::Hash:
                push_piece(SelectorPiece::Other, "#" + tok.value, tok.offset, tok.end_offset);
                break;
            case CSSToken::Function:
                ++paren_depth;
                push_piece(SelectorPiece::Other, tok.value + "(", tok.offset, tok.end_offset);
                break;
            case CSSToken::LeftParen:
            case CSSToken::LeftBracket:
                ++paren_depth;
                push_piece(SelectorPiece::Other, tok.value, tok.offset, tok.end_offset);
                break;
            case CSSToken::RightParen:
            case CSSToken::RightBracket:
                if (paren_depth == global_depth) global_depth = -1;
                if (paren_depth > 0) --paren_depth;
                push_piece(SelectorPiece::Other, tok.value, tok.offset, tok.end_offset);
                break;
            case CSSToken::String:
                push_piece(SelectorPiece::Other, "\"" + tok.value + "\"", tok.offset, tok.end_offset);
                break;
            default:
                push_piece(SelectorPiece::Other, tok.value, tok.offset, tok.end_offset);
                break;
        }
        advance();
    }

    for (auto& complex : list) {
        while (!complex.empty() && complex.back().kind == SelectorPiece::Combinator &&
               complex.back().text == " ") {
            complex.pop_back();
        }
        while (!complex.empty() && complex.front().kind == SelectorPiece::Combinator &&
               complex.front().text == " ") {
            complex.erase(complex.begin());
        }
    }
    return list;
}

// '&' takes the place of each parent selector. "&suffix" right after a parent
// ending in a class forms a new class (".a { &_b {} }" defines "a_b").
// Without '&' the nested selector is a descendant of every parent.
SelectorPieceList TokenExtractParser::resolve_nesting(const SelectorPieceList& nested,
                                                      const SelectorPieceList* parents) const {
    if (parents == nullptr || parents->empty()) {
        return nested;
    }

    SelectorPieceList resolved;
    for (const auto& parent : *parents) {
        ComplexSelectorPieces inherited = parent;
        for (auto& piece : inherited) piece.inherited = true;

        for (const auto& complex : nested) {
            bool has_nest = std::any_of(complex.begin(), complex.end(), [](const SelectorPiece& p) {
                return p.kind == SelectorPiece::Nest;
            });

            ComplexSelectorPieces out;
            if (!has_nest) {
                out = inherited;
                SelectorPiece space;
                space.kind = SelectorPiece::Combinator;
                space.text = " ";
                space.inherited = true;
                out.push_back(space);
                out.insert(out.end(), complex.begin(), complex.end());
                resolved.push_back(std::move(out));
                continue;
            }

            for (size_t i = 0; i < complex.size(); ++i) {
                const SelectorPiece& piece = complex[i];
                if (piece.kind != SelectorPiece::Nest) {
                    out.push_back(piece);
                    continue;
                }
                bool has_suffix = i + 1 < complex.size() &&
                                  complex[i + 1].kind == SelectorPiece::Word &&
                                  complex[i + 1].offset == piece.end_offset;
                if (has_suffix && !inherited.empty() &&
                    inherited.back().kind == SelectorPiece::Class) {
                    const SelectorPiece& suffix = complex[i + 1];
                    out.insert(out.end(), inherited.begin(), inherited.end() - 1);
                    SelectorPiece joined;
                    joined.kind = SelectorPiece::Class;
                    joined.text = inherited.back().text + suffix.text;
                    joined.offset = piece.offset;
                    joined.end_offset = suffix.end_offset;
                    joined.range = TextRange{piece.range.start, suffix.range.end};
                    joined.global = inherited.back().global;
                    out.push_back(std::move(joined));
                    ++i;
                } else {
                    out.insert(out.end(), inherited.begin(), inherited.end());
                }
            }
            resolved.push_back(std::move(out));
        }
    }
    return resolved;
}

void TokenExtractParser::record_classes(const SelectorPieceList& selectors) {
    std::vector<std::pair<std::string, size_t>> seen;  // name, offset within this rule
    for (const auto& complex : selectors) {
        for (const auto& piece : complex) {
            if (piece.kind != SelectorPiece::Class || piece.inherited || piece.global) continue;
            auto key = std::make_pair(piece.text, piece.offset);
            if (std::find(seen.begin(), seen.end(), key) != seen.end()) continue;
            seen.push_back(key);

            auto it = token_index_.find(piece.text);
            if (it == token_index_.end()) {
                token_index_.emplace(piece.text, result_.local_tokens.size());
                result_.local_tokens.push_back(LocalToken{piece.text, {piece.range}});
            } else {
                result_.local_tokens[it->second].ranges.push_back(piece.range);
            }
        }
    }
}

// Classes of the last compound selector of each complex selector: the
// elements a declaration in this rule actually applies to.
std::vector<std::string> TokenExtractParser::owner_classes(const SelectorPieceList& selectors) const {
    std::vector<std::string> owners;
    for (const auto& complex : selectors) {
        std::vector<std::string> compound;
        for (const auto& piece : complex) {
            if (piece.kind == SelectorPiece::Combinator) {
                compound.clear();
            } else if (piece.kind == SelectorPiece::Class && !piece.global) {
                compound.push_back(piece.text);
            }
        }
        for (auto& name : compound) {
            if (std::find(owners.begin(), owners.end(), name) == owners.end()) {
                owners.push_back(std::move(name));
            }
        }
    }
    return owners;
}

// ---------------------------------------------------------------------------
// Declarations
// ---------------------------------------------------------------------------

void TokenExtractParser::parse_declaration(const SelectorPieceList& selectors) {
    size_t decl_offset = current().offset;
    if (current().type == CSSToken::Ident) {
        std::string property = ascii_lower(current().value);
        if (property == "composes" || property == "compose-with") {
            advance();
            skip_whitespace();
            if (!at_end() && current().type == CSSToken::Colon) {
                advance();
                parse_composes(selectors, decl_offset);
                return;
            }
        }
    }

    // Anything else is skipped up to ';' or the closing '}'.
    int depth = 0;
    while (!at_end()) {
        auto type = current().type;
        if (depth == 0 && (type == CSSToken::Semicolon || type == CSSToken::RightBrace)) break;
        if (type == CSSToken::Function || type == CSSToken::LeftParen ||
            type == CSSToken::LeftBracket || type == CSSToken::LeftBrace) {
            ++depth;
        } else if ((type == CSSToken::RightParen || type == CSSToken::RightBracket ||
                    type == CSSToken::RightBrace) && depth > 0) {
            --depth;
        }
        advance();
    }
    if (!at_end() && current().type == CSSToken::Semicolon) {
        advance();
    }
}

// composes: a b [from 'file' | from global];
void TokenExtractParser::parse_composes(const SelectorPieceList& selectors, size_t decl_offset) {
    ComposesReference ref;
    bool from_global = false;
    bool saw_from = false;

    while (!at_end() && current().type != CSSToken::Semicolon &&
           current().type != CSSToken::RightBrace) {
        const CSSToken& tok = current();
        if (tok.type == CSSToken::Whitespace || tok.type == CSSToken::Comma) {
            advance();
            continue;
        }
        if (saw_from) {
            fail("unexpected token after composes source");
        }
        if (tok.type == CSSToken::Ident && tok.value == "from") {
            advance();
            skip_whitespace();
            if (!at_end() && current().type == CSSToken::String) {
                ref.specifier = current().value;
            } else if (!at_end() && current().type == CSSToken::Ident &&
                       current().value == "global") {
                from_global = true;
            } else {
                fail("expected a quoted file or 'global' after 'from'");
            }
            saw_from = true;
            advance();
            continue;
        }
        if (tok.type != CSSToken::Ident) {
            fail("expected a class name in composes");
        }
        ref.token_names.push_back(tok.value);
        advance();
    }

    size_t end = current().offset;
    if (!at_end() && current().type == CSSToken::Semicolon) {
        end = current().end_offset;
        advance();
    }

    if (from_global || ref.token_names.empty()) {
        return;
    }
    ref.owners = owner_classes(selectors);
    ref.range = range_of(decl_offset, end);
    result_.composes_refs.push_back(std::move(ref));
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

ExtractedTokens extract_tokens(std::string_view css) {
    auto tokens = CSSTokenizer::tokenize_all(css);
    TokenExtractParser parser(css, std::move(tokens));
    return parser.parse();
}

} // namespace stylebind::css
