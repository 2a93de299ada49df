#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stylebind::json {

class JsonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Immutable JSON document node. Object members keep their source order.
class Value {
public:
    enum class Type { Null, Bool, Number, String, Array, Object };

    Value() = default;
    static Value make_bool(bool value);
    static Value make_number(double value);
    static Value make_string(std::string value);
    static Value make_array(std::vector<Value> items);
    static Value make_object(std::vector<std::pair<std::string, Value>> members);

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    // Throw JsonError on a type mismatch.
    bool as_bool() const;
    double as_number() const;
    const std::string& as_string() const;
    const std::vector<Value>& items() const;
    const std::vector<std::pair<std::string, Value>>& members() const;

    // Object lookup; nullptr when absent or not an object.
    const Value* find(std::string_view key) const;
    std::optional<std::string> string_at(std::string_view key) const;

private:
    Type type_ = Type::Null;
    bool bool_ = false;
    double number_ = 0;
    std::string string_;
    std::vector<Value> array_;
    std::vector<std::pair<std::string, Value>> object_;
};

// Parses a complete JSON text. `filename` only labels error messages.
Value parse(std::string_view text, const std::string& filename = "<json>");

// JSON string literal for `text`, quotes included.
std::string quote(std::string_view text);

} // namespace stylebind::json
