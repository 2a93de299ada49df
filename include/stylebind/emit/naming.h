#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stylebind::emit {

// How class names appear as property names, as in css-loader.
enum class LocalsConvention {
    AsIs,
    CamelCase,      // original and camelCased
    CamelCaseOnly,  // camelCased only
    Dashes,         // original and dashes camelCased
    DashesOnly,     // dashes camelCased only
};

std::optional<LocalsConvention> parse_locals_convention(std::string_view name);
const char* locals_convention_name(LocalsConvention convention);

// "foo-bar_baz" -> "fooBarBaz"
std::string camel_case(std::string_view name);
// "foo-bar_baz" -> "fooBar_baz"
std::string dashes_camel_case(std::string_view name);

// Property names exported for one class, without duplicates.
std::vector<std::string> exported_names(std::string_view name, LocalsConvention convention);

} // namespace stylebind::emit
