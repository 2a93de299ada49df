#include <stylebind/emit/naming.h>

#include <cctype>

namespace stylebind::emit {

std::optional<LocalsConvention> parse_locals_convention(std::string_view name) {
    if (name == "camelCase") return LocalsConvention::CamelCase;
    if (name == "camelCaseOnly") return LocalsConvention::CamelCaseOnly;
    if (name == "dashes") return LocalsConvention::Dashes;
    if (name == "dashesOnly") return LocalsConvention::DashesOnly;
    return std::nullopt;
}

const char* locals_convention_name(LocalsConvention convention) {
    switch (convention) {
        case LocalsConvention::AsIs: return "asIs";
        case LocalsConvention::CamelCase: return "camelCase";
        case LocalsConvention::CamelCaseOnly: return "camelCaseOnly";
        case LocalsConvention::Dashes: return "dashes";
        case LocalsConvention::DashesOnly: return "dashesOnly";
    }
    return "asIs";
}

namespace {

std::string convert(std::string_view name, bool underscores) {
    std::string out;
    out.reserve(name.size());
    bool upper_next = false;
    for (char c : name) {
        if (c == '-' || (underscores && c == '_')) {
            upper_next = !out.empty();
            continue;
        }
        if (upper_next) {
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            upper_next = false;
        } else {
            out += c;
        }
    }
    if (!out.empty() && underscores) {
        out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
    }
    return out;
}

} // namespace

std::string camel_case(std::string_view name) {
    return convert(name, true);
}

std::string dashes_camel_case(std::string_view name) {
    return convert(name, false);
}

std::vector<std::string> exported_names(std::string_view name, LocalsConvention convention) {
    std::vector<std::string> names;
    auto add = [&names](std::string value) {
        if (value.empty()) return;
        for (const auto& existing : names) {
            if (existing == value) return;
        }
        names.push_back(std::move(value));
    };

    switch (convention) {
        case LocalsConvention::AsIs:
            add(std::string(name));
            break;
        case LocalsConvention::CamelCase:
            add(std::string(name));
            add(camel_case(name));
            break;
        case LocalsConvention::CamelCaseOnly:
            add(camel_case(name));
            break;
        case LocalsConvention::Dashes:
            add(std::string(name));
            add(dashes_camel_case(name));
            break;
        case LocalsConvention::DashesOnly:
            add(dashes_camel_case(name));
            break;
    }
    return names;
}

} // namespace stylebind::emit
