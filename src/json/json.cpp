#include <stylebind/json/json.h>

extern "C" {
#include <quickjs.h>
}

#include <cstdint>
#include <cstdio>

namespace stylebind::json {

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

Value Value::make_bool(bool value) {
    Value v;
    v.type_ = Type::Bool;
    v.bool_ = value;
    return v;
}

Value Value::make_number(double value) {
    Value v;
    v.type_ = Type::Number;
    v.number_ = value;
    return v;
}

Value Value::make_string(std::string value) {
    Value v;
    v.type_ = Type::String;
    v.string_ = std::move(value);
    return v;
}

Value Value::make_array(std::vector<Value> items) {
    Value v;
    v.type_ = Type::Array;
    v.array_ = std::move(items);
    return v;
}

Value Value::make_object(std::vector<std::pair<std::string, Value>> members) {
    Value v;
    v.type_ = Type::Object;
    v.object_ = std::move(members);
    return v;
}

bool Value::as_bool() const {
    if (type_ != Type::Bool) throw JsonError("expected a boolean");
    return bool_;
}

double Value::as_number() const {
    if (type_ != Type::Number) throw JsonError("expected a number");
    return number_;
}

const std::string& Value::as_string() const {
    if (type_ != Type::String) throw JsonError("expected a string");
    return string_;
}

const std::vector<Value>& Value::items() const {
    if (type_ != Type::Array) throw JsonError("expected an array");
    return array_;
}

const std::vector<std::pair<std::string, Value>>& Value::members() const {
    if (type_ != Type::Object) throw JsonError("expected an object");
    return object_;
}

const Value* Value::find(std::string_view key) const {
    if (type_ != Type::Object) return nullptr;
    for (const auto& [name, value] : object_) {
        if (name == key) return &value;
    }
    return nullptr;
}

std::optional<std::string> Value::string_at(std::string_view key) const {
    const Value* value = find(key);
    if (!value || !value->is_string()) return std::nullopt;
    return value->string_;
}

// ---------------------------------------------------------------------------
// QuickJS conversion
// ---------------------------------------------------------------------------

namespace {

// One runtime per parse; QuickJS runtimes must not be shared across threads.
class ParseContext {
public:
    ParseContext() {
        rt_ = JS_NewRuntime();
        if (!rt_) throw JsonError("failed to create JS runtime");
        ctx_ = JS_NewContext(rt_);
        if (!ctx_) {
            JS_FreeRuntime(rt_);
            throw JsonError("failed to create JS context");
        }
    }
    ~ParseContext() {
        JS_FreeContext(ctx_);
        JS_FreeRuntime(rt_);
    }
    ParseContext(const ParseContext&) = delete;
    ParseContext& operator=(const ParseContext&) = delete;

    JSContext* ctx() const { return ctx_; }

    std::string take_exception_message() {
        JSValue exception = JS_GetException(ctx_);
        std::string message = "invalid JSON";
        const char* str = JS_ToCString(ctx_, exception);
        if (str) {
            message = str;
            JS_FreeCString(ctx_, str);
        }
        JS_FreeValue(ctx_, exception);
        return message;
    }

private:
    JSRuntime* rt_ = nullptr;
    JSContext* ctx_ = nullptr;
};

std::string to_std_string(JSContext* ctx, JSValueConst value) {
    size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, value);
    if (!str) throw JsonError("failed to read JSON string");
    std::string result(str, len);
    JS_FreeCString(ctx, str);
    return result;
}

Value convert(JSContext* ctx, JSValueConst value, int depth);

Value convert_array(JSContext* ctx, JSValueConst value, int depth) {
    JSValue length_value = JS_GetPropertyStr(ctx, value, "length");
    uint32_t length = 0;
    int rc = JS_ToUint32(ctx, &length, length_value);
    JS_FreeValue(ctx, length_value);
    if (rc < 0) throw JsonError("failed to read JSON array length");

    std::vector<Value> items;
    items.reserve(length);
    for (uint32_t i = 0; i < length; ++i) {
        JSValue element = JS_GetPropertyUint32(ctx, value, i);
        try {
            items.push_back(convert(ctx, element, depth + 1));
        } catch (...) {
            JS_FreeValue(ctx, element);
            throw;
        }
        JS_FreeValue(ctx, element);
    }
    return Value::make_array(std::move(items));
}

Value convert_object(JSContext* ctx, JSValueConst value, int depth) {
    JSPropertyEnum* props = nullptr;
    uint32_t count = 0;
    if (JS_GetOwnPropertyNames(ctx, &props, &count, value,
                               JS_GPN_STRING_MASK | JS_GPN_ENUM_ONLY) < 0) {
        throw JsonError("failed to enumerate JSON object");
    }

    std::vector<std::pair<std::string, Value>> members;
    members.reserve(count);
    std::string error;
    for (uint32_t i = 0; i < count && error.empty(); ++i) {
        const char* key = JS_AtomToCString(ctx, props[i].atom);
        if (!key) {
            error = "failed to read JSON key";
            break;
        }
        std::string name(key);
        JS_FreeCString(ctx, key);

        JSValue member = JS_GetProperty(ctx, value, props[i].atom);
        try {
            members.emplace_back(std::move(name), convert(ctx, member, depth + 1));
        } catch (const JsonError& e) {
            error = e.what();
        }
        JS_FreeValue(ctx, member);
    }

    for (uint32_t i = 0; i < count; ++i) {
        JS_FreeAtom(ctx, props[i].atom);
    }
    js_free(ctx, props);

    if (!error.empty()) throw JsonError(error);
    return Value::make_object(std::move(members));
}

Value convert(JSContext* ctx, JSValueConst value, int depth) {
    if (depth > 512) {
        throw JsonError("JSON nesting too deep");
    }
    if (JS_IsNull(value) || JS_IsUndefined(value)) {
        return Value();
    }
    if (JS_IsBool(value)) {
        return Value::make_bool(JS_ToBool(ctx, value) != 0);
    }
    if (JS_IsNumber(value)) {
        double number = 0;
        if (JS_ToFloat64(ctx, &number, value) < 0) {
            throw JsonError("failed to read JSON number");
        }
        return Value::make_number(number);
    }
    if (JS_IsString(value)) {
        return Value::make_string(to_std_string(ctx, value));
    }
    if (JS_IsArray(ctx, value)) {
        return convert_array(ctx, value, depth);
    }
    if (JS_IsObject(value)) {
        return convert_object(ctx, value, depth);
    }
    throw JsonError("unsupported JSON value");
}

} // namespace

Value parse(std::string_view text, const std::string& filename) {
    ParseContext context;
    // JS_ParseJSON needs a NUL-terminated buffer.
    std::string buffer(text);
    JSValue parsed = JS_ParseJSON(context.ctx(), buffer.c_str(), buffer.size(), filename.c_str());
    if (JS_IsException(parsed)) {
        throw JsonError(filename + ": " + context.take_exception_message());
    }

    try {
        Value result = convert(context.ctx(), parsed, 0);
        JS_FreeValue(context.ctx(), parsed);
        return result;
    } catch (const JsonError& e) {
        JS_FreeValue(context.ctx(), parsed);
        throw JsonError(filename + ": " + e.what());
    }
}

std::string quote(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += ch;
                }
                break;
        }
    }
    out += '"';
    return out;
}

} // namespace stylebind::json
