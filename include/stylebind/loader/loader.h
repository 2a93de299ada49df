#pragma once
#include <stylebind/core/diagnostics.h>
#include <stylebind/io/file_system.h>
#include <stylebind/loader/errors.h>
#include <stylebind/loader/load_cache.h>
#include <stylebind/loader/types.h>
#include <stylebind/resolve/resolver.h>
#include <stylebind/transform/transformer.h>
#include <vector>

namespace stylebind::loader {

// Loads a style sheet and everything it composes from, merging token
// provenance across the graph. Safe to call from several threads at once;
// all of them share the cache.
class DependencyGraphLoader {
public:
    DependencyGraphLoader(LoadCache& cache, const io::FileSystem& fs,
                          const resolve::SpecifierResolver& resolver,
                          const transform::TransformerRegistry& transformers,
                          core::DiagnosticEmitter* diagnostics = nullptr);

    // Throws LoadError.
    LoadResult load(const core::FileIdentity& file);

    LoadCache& cache() { return cache_; }

private:
    using CallChain = std::vector<core::FileIdentity>;

    LoadResult load_in_chain(const core::FileIdentity& file, const CallChain& chain);
    LoadResult load_uncached(const core::FileIdentity& file, const CallChain& chain);
    void debug(const std::string& stage, const std::string& message) const;

    LoadCache& cache_;
    const io::FileSystem& fs_;
    const resolve::SpecifierResolver& resolver_;
    const transform::TransformerRegistry& transformers_;
    core::DiagnosticEmitter* diagnostics_;
};

} // namespace stylebind::loader
