#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace stylebind::css {

// 1-based line and column. Columns count bytes.
struct TextPosition {
    size_t line = 1;
    size_t column = 1;

    bool operator==(const TextPosition& other) const = default;
};

struct CSSToken {
    enum Type {
        Ident, Function, AtKeyword, Hash, String, BadString, Number, Percentage,
        Dimension, Whitespace, Colon, Semicolon, Comma,
        LeftBrace, RightBrace, LeftParen, RightParen, LeftBracket, RightBracket,
        Delim, CDC, CDO, BadComment, EndOfFile
    };
    Type type = EndOfFile;
    std::string value;
    double numeric_value = 0;
    std::string unit;
    bool is_integer = false;  // for Number tokens

    // Byte range in the input, end exclusive.
    size_t offset = 0;
    size_t end_offset = 0;

    bool operator==(const CSSToken& other) const;
};

// Maps byte offsets of one input to line/column positions.
class LineIndex {
public:
    explicit LineIndex(std::string_view input);
    TextPosition position_of(size_t offset) const;

private:
    std::vector<size_t> line_starts_;
};

class CSSTokenizer {
public:
    explicit CSSTokenizer(std::string_view input);
    CSSToken next_token();

    // Tokenize all at once
    static std::vector<CSSToken> tokenize_all(std::string_view input);

private:
    std::string_view input_;
    size_t pos_ = 0;

    char consume();
    char peek() const;
    char peek(size_t offset) const;
    bool at_end() const;
    void reconsume();

    CSSToken make(CSSToken::Type type, std::string value, size_t start) const;
    void consume_whitespace();
    bool consume_comment();
    CSSToken consume_string(char ending, size_t start);
    CSSToken consume_numeric(size_t start);
    CSSToken consume_ident_like(size_t start);
    CSSToken consume_hash(size_t start);
    double consume_number_value();
    std::string consume_name();
    bool starts_identifier() const;
    bool starts_number() const;
    bool is_name_start_char(char c) const;
    bool is_name_char(char c) const;
};

} // namespace stylebind::css
