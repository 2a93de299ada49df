#pragma once
#include <stylebind/core/file_identity.h>
#include <stylebind/css/parser/tokenizer.h>
#include <stylebind/resolve/resolver.h>
#include <stylebind/sourcemap/source_map.h>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace stylebind::transform {

struct TransformContext {
    core::FileIdentity original_location;
    const resolve::SpecifierResolver& resolver;
    resolve::IgnoredPredicate is_ignored_specifier;
};

struct TransformResult {
    std::string css;
    // Sources are canonical file identity strings.
    std::optional<sourcemap::SourceMap> source_map;
    std::vector<core::FileIdentity> pre_bundled_dependencies;
};

// A diagnostic from a dialect compiler.
class TransformFailure : public std::runtime_error {
public:
    explicit TransformFailure(const std::string& message,
                              std::optional<css::TextPosition> position = std::nullopt)
        : std::runtime_error(message), position_(position) {}

    const std::optional<css::TextPosition>& position() const { return position_; }

private:
    std::optional<css::TextPosition> position_;
};

// Turns one dialect into plain CSS. Directives that inline other files must
// be resolved by the transformer itself; the inlined files are reported as
// pre-bundled dependencies.
class SourceTransformer {
public:
    virtual ~SourceTransformer() = default;
    virtual TransformResult transform(std::string_view source,
                                      const TransformContext& context) const = 0;
};

// Passes CSS through. A trailing inline source map is honoured.
class CssTransformer : public SourceTransformer {
public:
    TransformResult transform(std::string_view source,
                              const TransformContext& context) const override;
};

// Extension -> transformer. Extensions are lower-case and include the dot.
class TransformerRegistry {
public:
    TransformerRegistry();

    void register_transformer(const std::string& extension,
                              std::shared_ptr<const SourceTransformer> transformer);
    // Falls back to the CSS pass-through for unknown extensions.
    const SourceTransformer& transformer_for(std::string_view extension) const;
    bool has_transformer(std::string_view extension) const;

private:
    std::map<std::string, std::shared_ptr<const SourceTransformer>, std::less<>> transformers_;
    std::shared_ptr<const SourceTransformer> fallback_;
};

// Rewrites raw source map sources into file identity strings: relative names
// against the file's directory, file: URLs to paths, and the compilers'
// placeholder names for stdin to the file itself.
void canonicalize_sources(sourcemap::SourceMap& map, const core::FileIdentity& file);

// Sources of the map other than the file itself, in map order.
std::vector<core::FileIdentity> bundled_sources(const sourcemap::SourceMap& map,
                                                const core::FileIdentity& file);

} // namespace stylebind::transform
