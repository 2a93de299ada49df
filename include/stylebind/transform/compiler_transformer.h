#pragma once
#include <stylebind/transform/transformer.h>
#include <string>
#include <vector>

namespace stylebind::transform {

enum class Dialect { Scss, Sass, Less };

// Compiles a dialect by running its reference compiler on stdin and reading
// CSS with an inline source map from stdout.
class CompilerTransformer : public SourceTransformer {
public:
    CompilerTransformer(Dialect dialect, std::vector<std::string> search_paths,
                        std::string command = {});

    TransformResult transform(std::string_view source,
                              const TransformContext& context) const override;

    // Exposed for tests.
    std::vector<std::string> command_line(const core::FileIdentity& file) const;

private:
    Dialect dialect_;
    std::vector<std::string> search_paths_;
    std::string command_;
};

// Source with its import directives pointed at resolved files.
struct ImportRewrite {
    std::string source;
    std::vector<core::FileIdentity> files;
};

// Resolves the specifiers of @import, @use and @forward through the context's
// resolver before the compiler sees them. Resolved specifiers become absolute
// paths and ignored ones are dropped. Plain CSS imports, url() imports and
// sass built-in modules are left alone. Line numbers are preserved.
// Throws TransformFailure when a specifier cannot be resolved.
ImportRewrite rewrite_imports(std::string_view source, Dialect dialect,
                              const TransformContext& context);

// Line and column named in a compiler error message, if any.
std::optional<css::TextPosition> parse_diagnostic_position(std::string_view message);

// Registry with .css, .scss, .sass and .less wired up.
TransformerRegistry make_default_registry(const std::vector<std::string>& sass_load_paths,
                                          const std::vector<std::string>& less_include_paths);

} // namespace stylebind::transform
