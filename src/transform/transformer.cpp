#include <stylebind/transform/transformer.h>
#include <stylebind/url/file_url.h>

#include <filesystem>

namespace stylebind::transform {

TransformResult CssTransformer::transform(std::string_view source,
                                          const TransformContext& context) const {
    TransformResult result;
    result.css = std::string(source);
    if (auto inline_map = sourcemap::extract_inline_source_map(source)) {
        try {
            sourcemap::SourceMap map = sourcemap::SourceMap::parse(*inline_map);
            canonicalize_sources(map, context.original_location);
            result.pre_bundled_dependencies = bundled_sources(map, context.original_location);
            result.source_map = std::move(map);
        } catch (const sourcemap::SourceMapError& e) {
            throw TransformFailure(std::string("invalid inline source map: ") + e.what());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// TransformerRegistry
// ---------------------------------------------------------------------------

TransformerRegistry::TransformerRegistry()
    : fallback_(std::make_shared<CssTransformer>()) {
    transformers_[".css"] = fallback_;
}

void TransformerRegistry::register_transformer(const std::string& extension,
                                               std::shared_ptr<const SourceTransformer> transformer) {
    transformers_[extension] = std::move(transformer);
}

const SourceTransformer& TransformerRegistry::transformer_for(std::string_view extension) const {
    auto it = transformers_.find(extension);
    return it != transformers_.end() ? *it->second : *fallback_;
}

bool TransformerRegistry::has_transformer(std::string_view extension) const {
    return transformers_.find(extension) != transformers_.end();
}

// ---------------------------------------------------------------------------
// Source map sources
// ---------------------------------------------------------------------------

void canonicalize_sources(sourcemap::SourceMap& map, const core::FileIdentity& file) {
    for (auto& source : map.sources()) {
        if (source.empty() || source == "stdin" || source == "-" || source == "input" ||
            source == "<stdin>" || source == "data:;charset=utf-8,") {
            source = file.str();
            continue;
        }
        if (url::is_file_url(source)) {
            if (auto path = url::file_url_to_path(source)) {
                source = core::FileIdentity::from_path(*path).str();
            }
            continue;
        }
        if (source.front() == '/') {
            source = core::FileIdentity::from_path(source).str();
            continue;
        }
        if (source.find("://") != std::string::npos) {
            continue;
        }
        source = core::FileIdentity::from_path(
                     (std::filesystem::path(file.directory()) / source).generic_string())
                     .str();
    }
}

std::vector<core::FileIdentity> bundled_sources(const sourcemap::SourceMap& map,
                                                const core::FileIdentity& file) {
    std::vector<core::FileIdentity> deps;
    for (const auto& source : map.sources()) {
        if (source == file.str() || source.empty() || source.front() != '/') continue;
        auto id = core::FileIdentity::from_path(source);
        bool seen = false;
        for (const auto& existing : deps) {
            if (existing == id) seen = true;
        }
        if (!seen) deps.push_back(std::move(id));
    }
    return deps;
}

} // namespace stylebind::transform
