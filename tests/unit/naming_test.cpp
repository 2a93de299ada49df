#include <stylebind/emit/naming.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace stylebind::emit;

// ---------------------------------------------------------------------------
// 1. camelCase folds dashes and underscores
// ---------------------------------------------------------------------------
TEST(NamingTest, CamelCase) {
    EXPECT_EQ(camel_case("foo-bar_baz"), "fooBarBaz");
    EXPECT_EQ(camel_case("Foo-bar"), "fooBar");
    EXPECT_EQ(camel_case("--leading"), "leading");
    EXPECT_EQ(camel_case("plain"), "plain");
}

// ---------------------------------------------------------------------------
// 2. dashes only folds dashes
// ---------------------------------------------------------------------------
TEST(NamingTest, DashesCamelCase) {
    EXPECT_EQ(dashes_camel_case("foo-bar_baz"), "fooBar_baz");
    EXPECT_EQ(dashes_camel_case("block__elem--mod"), "block__elemMod");
}

// ---------------------------------------------------------------------------
// 3. Conventions decide which names are exported
// ---------------------------------------------------------------------------
TEST(NamingTest, ExportedNames) {
    using Names = std::vector<std::string>;
    EXPECT_EQ(exported_names("foo-bar", LocalsConvention::AsIs), (Names{"foo-bar"}));
    EXPECT_EQ(exported_names("foo-bar", LocalsConvention::CamelCase), (Names{"foo-bar", "fooBar"}));
    EXPECT_EQ(exported_names("foo-bar", LocalsConvention::CamelCaseOnly), (Names{"fooBar"}));
    EXPECT_EQ(exported_names("a_b", LocalsConvention::Dashes), (Names{"a_b"}));
    EXPECT_EQ(exported_names("a-b", LocalsConvention::DashesOnly), (Names{"aB"}));
    // No duplicate when the name is already camelCase.
    EXPECT_EQ(exported_names("fooBar", LocalsConvention::CamelCase), (Names{"fooBar"}));
}

// ---------------------------------------------------------------------------
// 4. Convention names parse and print
// ---------------------------------------------------------------------------
TEST(NamingTest, ParseConvention) {
    EXPECT_EQ(parse_locals_convention("camelCaseOnly"), LocalsConvention::CamelCaseOnly);
    EXPECT_EQ(parse_locals_convention("dashes"), LocalsConvention::Dashes);
    EXPECT_FALSE(parse_locals_convention("snake").has_value());
    EXPECT_STREQ(locals_convention_name(LocalsConvention::DashesOnly), "dashesOnly");
    EXPECT_STREQ(locals_convention_name(LocalsConvention::AsIs), "asIs");
}
