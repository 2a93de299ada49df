#include <stylebind/json/json.h>

#include <gtest/gtest.h>

#include <string>

using namespace stylebind::json;

// ---------------------------------------------------------------------------
// 1. Scalars
// ---------------------------------------------------------------------------
TEST(JsonTest, ParseScalars) {
    EXPECT_TRUE(parse("null").is_null());
    EXPECT_TRUE(parse("true").as_bool());
    EXPECT_DOUBLE_EQ(parse("-2.5e1").as_number(), -25.0);
    EXPECT_EQ(parse("\"a\\u00e9\\n\"").as_string(), "a\xc3\xa9\n");
}

// ---------------------------------------------------------------------------
// 2. Objects keep member order
// ---------------------------------------------------------------------------
TEST(JsonTest, ObjectMemberOrder) {
    Value root = parse(R"({"style": "a.css", "main": "b.js", "imports": {"#x": "./x.css"}})");
    ASSERT_TRUE(root.is_object());
    ASSERT_EQ(root.members().size(), 3u);
    EXPECT_EQ(root.members()[0].first, "style");
    EXPECT_EQ(root.members()[1].first, "main");
    EXPECT_EQ(root.members()[2].first, "imports");
    EXPECT_EQ(root.string_at("style"), "a.css");
    EXPECT_FALSE(root.string_at("imports").has_value());
    EXPECT_FALSE(root.string_at("missing").has_value());

    const Value* imports = root.find("imports");
    ASSERT_NE(imports, nullptr);
    EXPECT_EQ(imports->string_at("#x"), "./x.css");
}

// ---------------------------------------------------------------------------
// 3. Arrays
// ---------------------------------------------------------------------------
TEST(JsonTest, Arrays) {
    Value root = parse(R"([1, "two", [3], {"four": 4}, false])");
    ASSERT_TRUE(root.is_array());
    const auto& items = root.items();
    ASSERT_EQ(items.size(), 5u);
    EXPECT_DOUBLE_EQ(items[0].as_number(), 1.0);
    EXPECT_EQ(items[1].as_string(), "two");
    EXPECT_EQ(items[2].items().size(), 1u);
    EXPECT_DOUBLE_EQ(items[3].find("four")->as_number(), 4.0);
    EXPECT_FALSE(items[4].as_bool());
}

// ---------------------------------------------------------------------------
// 4. Invalid text and type mismatches throw JsonError
// ---------------------------------------------------------------------------
TEST(JsonTest, Errors) {
    EXPECT_THROW(parse("{ not json", "package.json"), JsonError);
    EXPECT_THROW(parse(""), JsonError);
    EXPECT_THROW(parse("[1, 2,]"), JsonError);
    try {
        parse("{", "broken.json");
        FAIL() << "expected JsonError";
    } catch (const JsonError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("broken.json: ", 0), 0u);
    }

    Value number = parse("1");
    EXPECT_THROW(number.as_string(), JsonError);
    EXPECT_THROW(number.items(), JsonError);
    EXPECT_EQ(number.find("x"), nullptr);
}

// ---------------------------------------------------------------------------
// 5. Quoting escapes what JSON requires
// ---------------------------------------------------------------------------
TEST(JsonTest, Quote) {
    EXPECT_EQ(quote("plain"), "\"plain\"");
    EXPECT_EQ(quote("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(quote("line\nbreak\t"), "\"line\\nbreak\\t\"");
    EXPECT_EQ(quote(std::string("\x01", 1)), "\"\\u0001\"");
    EXPECT_EQ(parse(quote("round \"trip\"\n")).as_string(), "round \"trip\"\n");
}
