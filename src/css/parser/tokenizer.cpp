#include <stylebind/css/parser/tokenizer.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace stylebind::css {

namespace {

void append_utf8(std::string& out, unsigned long code) {
    if (code == 0 || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
        code = 0xFFFD;
    }
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else if (code < 0x10000) {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code >> 18));
        out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

bool is_css_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

} // namespace

// ---------------------------------------------------------------------------
// CSSToken
// ---------------------------------------------------------------------------

bool CSSToken::operator==(const CSSToken& other) const {
    return type == other.type && value == other.value &&
           numeric_value == other.numeric_value && unit == other.unit &&
           is_integer == other.is_integer;
}

// ---------------------------------------------------------------------------
// LineIndex
// ---------------------------------------------------------------------------

LineIndex::LineIndex(std::string_view input) {
    line_starts_.push_back(0);
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '\n') {
            line_starts_.push_back(i + 1);
        }
    }
}

TextPosition LineIndex::position_of(size_t offset) const {
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    size_t line = static_cast<size_t>(it - line_starts_.begin());
    return TextPosition{line, offset - line_starts_[line - 1] + 1};
}

// ---------------------------------------------------------------------------
// CSSTokenizer
// ---------------------------------------------------------------------------

CSSTokenizer::CSSTokenizer(std::string_view input) : input_(input), pos_(0) {}

char CSSTokenizer::consume() {
    if (pos_ < input_.size()) {
        return input_[pos_++];
    }
    return '\0';
}

char CSSTokenizer::peek() const {
    if (pos_ < input_.size()) {
        return input_[pos_];
    }
    return '\0';
}

char CSSTokenizer::peek(size_t offset) const {
    size_t idx = pos_ + offset;
    if (idx < input_.size()) {
        return input_[idx];
    }
    return '\0';
}

bool CSSTokenizer::at_end() const {
    return pos_ >= input_.size();
}

void CSSTokenizer::reconsume() {
    if (pos_ > 0) {
        --pos_;
    }
}

CSSToken CSSTokenizer::make(CSSToken::Type type, std::string value, size_t start) const {
    CSSToken token;
    token.type = type;
    token.value = std::move(value);
    token.offset = start;
    token.end_offset = pos_;
    return token;
}

void CSSTokenizer::consume_whitespace() {
    while (!at_end() && is_css_whitespace(peek())) {
        consume();
    }
}

bool CSSTokenizer::consume_comment() {
    // We've already consumed '/' and '*'
    while (!at_end()) {
        char c = consume();
        if (c == '*' && peek() == '/') {
            consume(); // consume '/'
            return true;
        }
    }
    return false;
}

bool CSSTokenizer::is_name_start_char(char c) const {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           (static_cast<unsigned char>(c) >= 0x80);
}

bool CSSTokenizer::is_name_char(char c) const {
    return is_name_start_char(c) || std::isdigit(static_cast<unsigned char>(c)) ||
           c == '-';
}

bool CSSTokenizer::starts_identifier() const {
    char c = peek();
    if (is_name_start_char(c)) return true;
    if (c == '-') {
        char next = peek(1);
        return is_name_start_char(next) || next == '-' ||
               (next == '\\' && peek(2) != '\n' && peek(2) != '\0');
    }
    if (c == '\\') {
        // Valid escape: backslash not followed by newline
        char next = peek(1);
        return next != '\n' && next != '\0';
    }
    return false;
}

bool CSSTokenizer::starts_number() const {
    char c = peek();
    if (std::isdigit(static_cast<unsigned char>(c))) return true;
    if (c == '.') {
        return std::isdigit(static_cast<unsigned char>(peek(1)));
    }
    if (c == '+' || c == '-') {
        char next = peek(1);
        if (std::isdigit(static_cast<unsigned char>(next))) return true;
        if (next == '.' && std::isdigit(static_cast<unsigned char>(peek(2))))
            return true;
    }
    return false;
}

std::string CSSTokenizer::consume_name() {
    std::string result;
    while (!at_end()) {
        char c = peek();
        if (is_name_char(c)) {
            result += consume();
        } else if (c == '\\' && peek(1) != '\n' && peek(1) != '\0') {
            consume(); // backslash
            char escaped = consume();
            if (std::isxdigit(static_cast<unsigned char>(escaped))) {
                // Hex escape - up to 6 hex digits and one optional whitespace
                std::string hex(1, escaped);
                while (hex.size() < 6 && !at_end() &&
                       std::isxdigit(static_cast<unsigned char>(peek()))) {
                    hex += consume();
                }
                if (!at_end() && is_css_whitespace(peek())) {
                    consume();
                }
                append_utf8(result, std::strtoul(hex.c_str(), nullptr, 16));
            } else {
                result += escaped;
            }
        } else {
            break;
        }
    }
    return result;
}

double CSSTokenizer::consume_number_value() {
    std::string repr;

    if (peek() == '+' || peek() == '-') {
        repr += consume();
    }
    while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
        repr += consume();
    }
    if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1)))) {
        repr += consume(); // '.'
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            repr += consume();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        char after_e = peek(1);
        bool signed_exp = (after_e == '+' || after_e == '-') &&
                          std::isdigit(static_cast<unsigned char>(peek(2)));
        if (std::isdigit(static_cast<unsigned char>(after_e)) || signed_exp) {
            repr += consume(); // 'e' or 'E'
            if (peek() == '+' || peek() == '-') {
                repr += consume();
            }
            while (!at_end() &&
                   std::isdigit(static_cast<unsigned char>(peek()))) {
                repr += consume();
            }
        }
    }

    return std::strtod(repr.c_str(), nullptr);
}

CSSToken CSSTokenizer::consume_string(char ending, size_t start) {
    std::string result;

    while (!at_end()) {
        char c = consume();
        if (c == ending) {
            return make(CSSToken::String, std::move(result), start);
        }
        if (c == '\\') {
            if (at_end()) {
                break;
            }
            if (peek() == '\n') {
                // Escaped newline: line continuation
                consume();
            } else {
                result += consume();
            }
        } else if (c == '\n') {
            // Unescaped newline ends the string as a bad-string token
            reconsume();
            return make(CSSToken::BadString, std::move(result), start);
        } else {
            result += c;
        }
    }

    return make(CSSToken::BadString, std::move(result), start);
}

CSSToken CSSTokenizer::consume_numeric(size_t start) {
    size_t num_start = pos_;
    double value = consume_number_value();
    std::string num_str(input_.substr(num_start, pos_ - num_start));

    bool is_int = num_str.find_first_of(".eE") == std::string::npos;

    CSSToken token;
    if (starts_identifier()) {
        std::string unit = consume_name();
        token = make(CSSToken::Dimension, num_str + unit, start);
        token.unit = std::move(unit);
    } else if (peek() == '%') {
        consume();
        token = make(CSSToken::Percentage, num_str + "%", start);
    } else {
        token = make(CSSToken::Number, num_str, start);
    }
    token.numeric_value = value;
    token.is_integer = is_int;
    return token;
}

CSSToken CSSTokenizer::consume_ident_like(size_t start) {
    std::string name = consume_name();

    // Function token: name followed by '('
    if (peek() == '(') {
        consume();
        return make(CSSToken::Function, std::move(name), start);
    }
    return make(CSSToken::Ident, std::move(name), start);
}

CSSToken CSSTokenizer::consume_hash(size_t start) {
    // '#' has already been consumed
    if (!at_end() && (is_name_char(peek()) || peek() == '\\')) {
        std::string name = consume_name();
        return make(CSSToken::Hash, std::move(name), start);
    }
    return make(CSSToken::Delim, "#", start);
}

CSSToken CSSTokenizer::next_token() {
    // Comments produce no token unless they never end.
    while (peek() == '/' && peek(1) == '*') {
        size_t comment_start = pos_;
        consume();
        consume();
        if (!consume_comment()) {
            return make(CSSToken::BadComment, "", comment_start);
        }
    }

    size_t start = pos_;
    if (at_end()) {
        return make(CSSToken::EndOfFile, "", start);
    }

    char c = consume();

    if (is_css_whitespace(c)) {
        consume_whitespace();
        return make(CSSToken::Whitespace, " ", start);
    }

    switch (c) {
        case '"':
        case '\'':
            return consume_string(c, start);
        case '#':
            return consume_hash(start);
        case '(': return make(CSSToken::LeftParen, "(", start);
        case ')': return make(CSSToken::RightParen, ")", start);
        case ',': return make(CSSToken::Comma, ",", start);
        case ':': return make(CSSToken::Colon, ":", start);
        case ';': return make(CSSToken::Semicolon, ";", start);
        case '[': return make(CSSToken::LeftBracket, "[", start);
        case ']': return make(CSSToken::RightBracket, "]", start);
        case '{': return make(CSSToken::LeftBrace, "{", start);
        case '}': return make(CSSToken::RightBrace, "}", start);
        default:
            break;
    }

    if (c == '+') {
        reconsume();
        if (starts_number()) {
            return consume_numeric(start);
        }
        consume();
        return make(CSSToken::Delim, "+", start);
    }

    // Hyphen-minus: number, ident, or CDC
    if (c == '-') {
        if (peek() == '-' && peek(1) == '>') {
            consume();
            consume();
            return make(CSSToken::CDC, "-->", start);
        }
        reconsume();
        if (starts_number()) {
            return consume_numeric(start);
        }
        if (starts_identifier()) {
            return consume_ident_like(start);
        }
        consume();
        return make(CSSToken::Delim, "-", start);
    }

    if (c == '.') {
        reconsume();
        if (starts_number()) {
            return consume_numeric(start);
        }
        consume();
        return make(CSSToken::Delim, ".", start);
    }

    if (c == '<') {
        if (peek() == '!' && peek(1) == '-' && peek(2) == '-') {
            pos_ += 3;
            return make(CSSToken::CDO, "<!--", start);
        }
        return make(CSSToken::Delim, "<", start);
    }

    if (c == '@') {
        if (starts_identifier()) {
            std::string name = consume_name();
            return make(CSSToken::AtKeyword, std::move(name), start);
        }
        return make(CSSToken::Delim, "@", start);
    }

    if (c == '\\') {
        if (!at_end() && peek() != '\n') {
            reconsume();
            return consume_ident_like(start);
        }
        return make(CSSToken::Delim, "\\", start);
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        reconsume();
        return consume_numeric(start);
    }

    if (is_name_start_char(c)) {
        reconsume();
        return consume_ident_like(start);
    }

    return make(CSSToken::Delim, std::string(1, c), start);
}

std::vector<CSSToken> CSSTokenizer::tokenize_all(std::string_view input) {
    CSSTokenizer tokenizer(input);
    std::vector<CSSToken> tokens;

    while (true) {
        CSSToken token = tokenizer.next_token();
        bool done = token.type == CSSToken::EndOfFile;
        tokens.push_back(std::move(token));
        if (done) {
            break;
        }
    }

    return tokens;
}

} // namespace stylebind::css
