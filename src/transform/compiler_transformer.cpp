#include <stylebind/transform/compiler_transformer.h>
#include <stylebind/core/config.h>
#include <stylebind/transform/process.h>

#include <cctype>
#include <regex>

namespace stylebind::transform {

namespace {

std::string first_lines(const std::string& text, size_t max_lines) {
    std::string out;
    size_t start = 0;
    for (size_t line = 0; line < max_lines && start < text.size(); ++line) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        if (!out.empty()) out += '\n';
        out.append(text, start, end - start);
        start = end + 1;
    }
    while (!out.empty() && (out.back() == '\n' || out.back() == ' ' || out.back() == '\r')) {
        out.pop_back();
    }
    return out;
}

const char* dialect_name(Dialect dialect) {
    switch (dialect) {
        case Dialect::Scss: return "scss";
        case Dialect::Sass: return "sass";
        case Dialect::Less: return "less";
    }
    return "css";
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_comment(std::string_view s, size_t i) {
    return s[i] == '/' && i + 1 < s.size() && (s[i + 1] == '*' || s[i + 1] == '/');
}

// Offset just past the comment starting at `start`. Line comments stop
// before their newline.
size_t skip_comment(std::string_view s, size_t start) {
    if (s[start + 1] == '*') {
        size_t end = s.find("*/", start + 2);
        return end == std::string_view::npos ? s.size() : end + 2;
    }
    size_t end = s.find('\n', start);
    return end == std::string_view::npos ? s.size() : end;
}

// Offset just past the string literal opening at `start`.
size_t skip_string(std::string_view s, size_t start) {
    char quote = s[start];
    size_t i = start + 1;
    while (i < s.size() && s[i] != quote && s[i] != '\n') {
        if (s[i] == '\\' && i + 1 < s.size()) ++i;
        ++i;
    }
    if (i < s.size() && s[i] == quote) ++i;
    return i;
}

bool is_url_function(std::string_view s, size_t i) {
    if (i + 4 > s.size() || (i > 0 && is_ident_char(s[i - 1]))) return false;
    return std::tolower(static_cast<unsigned char>(s[i])) == 'u' &&
           std::tolower(static_cast<unsigned char>(s[i + 1])) == 'r' &&
           std::tolower(static_cast<unsigned char>(s[i + 2])) == 'l' && s[i + 3] == '(';
}

// Offset just past the url( ... ) starting at `start`.
size_t skip_url(std::string_view s, size_t start) {
    size_t i = start + 4;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i < s.size() && (s[i] == '"' || s[i] == '\'')) i = skip_string(s, i);
    size_t close = s.find(')', i);
    return close == std::string_view::npos ? s.size() : close + 1;
}

// Offset of the terminator of the statement whose body starts at `start`:
// the first top-level ';' (a newline in the indented syntax), or a brace.
size_t statement_end(std::string_view s, size_t start, Dialect dialect) {
    int depth = 0;
    size_t i = start;
    while (i < s.size()) {
        char c = s[i];
        if (c == '"' || c == '\'') {
            i = skip_string(s, i);
            continue;
        }
        if (starts_comment(s, i)) {
            i = skip_comment(s, i);
            continue;
        }
        if (c == '(') ++depth;
        if (c == ')' && depth > 0) --depth;
        if (depth == 0) {
            if (dialect == Dialect::Sass ? c == '\n' : c == ';') return i;
            if (c == '{' || c == '}') return i;
        }
        ++i;
    }
    return s.size();
}

// Splits at top-level commas.
std::vector<std::string_view> split_items(std::string_view body) {
    std::vector<std::string_view> items;
    int depth = 0;
    size_t begin = 0;
    size_t i = 0;
    while (i < body.size()) {
        char c = body[i];
        if (c == '"' || c == '\'') {
            i = skip_string(body, i);
            continue;
        }
        if (c == '(') ++depth;
        if (c == ')' && depth > 0) --depth;
        if (c == ',' && depth == 0) {
            items.push_back(body.substr(begin, i - begin));
            begin = i + 1;
        }
        ++i;
    }
    items.push_back(body.substr(begin));
    return items;
}

// Offset of the first top-level quote, and the parenthesized less options
// that precede it.
size_t find_specifier(std::string_view item, std::string& options) {
    int depth = 0;
    for (size_t i = 0; i < item.size(); ++i) {
        char c = item[i];
        if (is_url_function(item, i)) return std::string_view::npos;
        if (c == '(') {
            ++depth;
            continue;
        }
        if (c == ')' && depth > 0) {
            --depth;
            continue;
        }
        if (depth > 0) {
            options += c;
            continue;
        }
        if (c == '"' || c == '\'') return i;
    }
    return std::string_view::npos;
}

bool has_option(const std::string& options, std::string_view name) {
    size_t i = 0;
    while (i < options.size()) {
        while (i < options.size() && !is_ident_char(options[i])) ++i;
        size_t start = i;
        while (i < options.size() && is_ident_char(options[i])) ++i;
        if (std::string_view(options).substr(start, i - start) == name) return true;
    }
    return false;
}

// Imports the compilers pass through as plain CSS @import rules.
bool is_plain_css_import(std::string_view specifier, Dialect dialect, const std::string& options) {
    if (dialect == Dialect::Less) {
        if (has_option(options, "css")) return true;
        return ends_with(specifier, ".css") && !has_option(options, "less") &&
               !has_option(options, "inline");
    }
    return ends_with(specifier, ".css");
}

std::string quote_path(const std::string& path, char quote) {
    std::string out(1, quote);
    for (char c : path) {
        if (c == quote || c == '\\') out += '\\';
        out += c;
    }
    out += quote;
    return out;
}

enum class Directive { Import, Use, Forward };

std::optional<Directive> directive_at(std::string_view s, size_t at, size_t& keyword_end) {
    static const std::pair<std::string_view, Directive> kDirectives[] = {
        {"@import", Directive::Import}, {"@use", Directive::Use}, {"@forward", Directive::Forward}};
    for (const auto& [keyword, directive] : kDirectives) {
        if (s.compare(at, keyword.size(), keyword) != 0) continue;
        size_t end = at + keyword.size();
        if (end < s.size() && is_ident_char(s[end])) continue;
        keyword_end = end;
        return directive;
    }
    return std::nullopt;
}

} // namespace

CompilerTransformer::CompilerTransformer(Dialect dialect, std::vector<std::string> search_paths,
                                         std::string command)
    : dialect_(dialect), search_paths_(std::move(search_paths)), command_(std::move(command)) {
    if (command_.empty()) {
        command_ = dialect_ == Dialect::Less ? core::config::kLessCommand
                                             : core::config::kSassCommand;
    }
}

std::vector<std::string> CompilerTransformer::command_line(const core::FileIdentity& file) const {
    std::vector<std::string> argv{command_};
    if (dialect_ == Dialect::Less) {
        argv.push_back("--source-map-map-inline");
        std::string include = "--include-path=" + file.directory();
        for (const auto& path : search_paths_) include += ":" + path;
        argv.push_back(include);
        argv.push_back("-");
        return argv;
    }

    argv.push_back("--stdin");
    argv.push_back("--embed-source-map");
    argv.push_back("--source-map-urls=absolute");
    argv.push_back("--no-error-css");
    if (dialect_ == Dialect::Sass) argv.push_back("--indented");
    argv.push_back("--load-path=" + file.directory());
    for (const auto& path : search_paths_) argv.push_back("--load-path=" + path);
    return argv;
}

ImportRewrite rewrite_imports(std::string_view source, Dialect dialect,
                              const TransformContext& context) {
    ImportRewrite rewrite;
    std::optional<css::LineIndex> lines;
    size_t copied = 0;
    size_t i = 0;

    auto record = [&](const core::FileIdentity& file) {
        for (const auto& existing : rewrite.files) {
            if (existing == file) return;
        }
        rewrite.files.push_back(file);
    };

    while (i < source.size()) {
        char c = source[i];
        if (c == '"' || c == '\'') {
            i = skip_string(source, i);
            continue;
        }
        if (starts_comment(source, i)) {
            i = skip_comment(source, i);
            continue;
        }
        if (is_url_function(source, i)) {
            i = skip_url(source, i);
            continue;
        }
        size_t keyword_end = 0;
        std::optional<Directive> directive;
        if (c == '@') directive = directive_at(source, i, keyword_end);
        if (!directive) {
            ++i;
            continue;
        }

        size_t end = statement_end(source, keyword_end, dialect);
        std::string_view body = source.substr(keyword_end, end - keyword_end);
        std::vector<std::string_view> items;
        if (*directive == Directive::Import) {
            items = split_items(body);
        } else {
            items.push_back(body);
        }

        bool changed = false;
        std::vector<std::string> kept;
        for (std::string_view item : items) {
            std::string options;
            size_t quote = find_specifier(item, options);
            if (quote == std::string_view::npos) {
                kept.emplace_back(item);
                continue;
            }
            size_t close = skip_string(item, quote);
            std::string_view literal = item.substr(quote, close - quote);
            std::string specifier(literal.substr(1, literal.size() >= 2 ? literal.size() - 2 : 0));

            bool builtin = *directive != Directive::Import && specifier.rfind("sass:", 0) == 0;
            bool interpolated = specifier.find("@{") != std::string::npos ||
                                specifier.find("#{") != std::string::npos;
            bool plain = *directive == Directive::Import &&
                         is_plain_css_import(specifier, dialect, options);
            if (builtin || interpolated) {
                kept.emplace_back(item);
                continue;
            }
            if (context.is_ignored_specifier && context.is_ignored_specifier(specifier)) {
                changed = true;
                continue;
            }
            if (plain) {
                kept.emplace_back(item);
                continue;
            }
            changed = true;

            core::FileIdentity file;
            try {
                file = context.resolver.resolve(
                    specifier, resolve::ResolveContext{context.original_location});
            } catch (const resolve::ResolveError& e) {
                if (dialect == Dialect::Less && has_option(options, "optional")) {
                    continue;
                }
                if (!lines) lines.emplace(source);
                throw TransformFailure(e.what(), lines->position_of(i));
            }
            if (file.is_ignored()) continue;
            record(file);
            std::string item_text(item.substr(0, quote));
            item_text += quote_path(file.str(), literal.front());
            item_text += item.substr(close);
            kept.push_back(std::move(item_text));
        }

        if (changed) {
            rewrite.source.append(source.substr(copied, i - copied));
            if (kept.empty()) {
                // Keep the line count; drop the terminator with the statement.
                for (char ch : source.substr(i, end - i)) {
                    if (ch == '\n') rewrite.source += '\n';
                }
                if (end < source.size() && source[end] == ';') ++end;
            } else {
                rewrite.source.append(source.substr(i, keyword_end - i));
                for (size_t k = 0; k < kept.size(); ++k) {
                    if (k > 0) rewrite.source += ',';
                    rewrite.source += kept[k];
                }
            }
            copied = end;
        }
        i = end;
    }
    rewrite.source.append(source.substr(copied));
    return rewrite;
}

TransformResult CompilerTransformer::transform(std::string_view source,
                                               const TransformContext& context) const {
    ImportRewrite imports = rewrite_imports(source, dialect_, context);

    proc::ProcessResult process;
    if (!proc::run_capture(command_line(context.original_location), imports.source, process)) {
        throw TransformFailure("could not run '" + command_ + "' to compile " +
                               dialect_name(dialect_) + "; is it installed?");
    }
    if (process.exit_code != 0) {
        std::string message = first_lines(process.err.empty() ? process.out : process.err, 8);
        if (message.empty()) {
            message = command_ + " exited with status " + std::to_string(process.exit_code);
        }
        throw TransformFailure(message, parse_diagnostic_position(message));
    }

    TransformResult result;
    result.css = std::move(process.out);
    if (auto inline_map = sourcemap::extract_inline_source_map(result.css)) {
        try {
            sourcemap::SourceMap map = sourcemap::SourceMap::parse(*inline_map);
            canonicalize_sources(map, context.original_location);
            result.pre_bundled_dependencies = bundled_sources(map, context.original_location);
            result.source_map = std::move(map);
        } catch (const sourcemap::SourceMapError& e) {
            throw TransformFailure(command_ + " produced an unreadable source map: " + e.what());
        }
    }
    for (auto& file : imports.files) {
        bool seen = false;
        for (const auto& existing : result.pre_bundled_dependencies) {
            if (existing == file) seen = true;
        }
        if (!seen) result.pre_bundled_dependencies.push_back(std::move(file));
    }
    return result;
}

std::optional<css::TextPosition> parse_diagnostic_position(std::string_view message) {
    std::string text(message);
    std::smatch match;
    // less: "... on line 3, column 5:"
    static const std::regex less_pattern(R"(line (\d+), column (\d+))");
    // sass: "  - 3:5  root stylesheet"
    static const std::regex sass_pattern(R"((\d+):(\d+)\s+root stylesheet)");
    if (std::regex_search(text, match, less_pattern) ||
        std::regex_search(text, match, sass_pattern)) {
        return css::TextPosition{std::stoul(match[1].str()), std::stoul(match[2].str())};
    }
    return std::nullopt;
}

TransformerRegistry make_default_registry(const std::vector<std::string>& sass_load_paths,
                                          const std::vector<std::string>& less_include_paths) {
    TransformerRegistry registry;
    registry.register_transformer(".scss",
                                  std::make_shared<CompilerTransformer>(Dialect::Scss, sass_load_paths));
    registry.register_transformer(".sass",
                                  std::make_shared<CompilerTransformer>(Dialect::Sass, sass_load_paths));
    registry.register_transformer(".less",
                                  std::make_shared<CompilerTransformer>(Dialect::Less, less_include_paths));
    return registry;
}

} // namespace stylebind::transform
