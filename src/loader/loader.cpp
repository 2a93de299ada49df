#include <stylebind/loader/loader.h>
#include <stylebind/css/parser/token_extractor.h>

#include <algorithm>
#include <cerrno>
#include <future>
#include <iterator>
#include <map>
#include <set>
#include <system_error>

namespace stylebind::loader {

namespace {

using Locations = std::vector<SourceLocation>;

void append_unique(Locations& into, const Locations& from) {
    for (const auto& location : from) {
        if (std::find(into.begin(), into.end(), location) == into.end()) {
            into.push_back(location);
        }
    }
}

// Generated CSS position -> original file position. Without a usable map
// the position stays in `file`.
SourceLocation map_range(const core::FileIdentity& file, const css::TextRange& range,
                         const std::optional<sourcemap::SourceMap>& map) {
    SourceLocation location{file, range.start, range.end};
    if (!map) return location;

    auto original = map->original_position_for(range.start.line, range.start.column);
    if (!original) return location;
    const std::string& source = map->sources()[original->source_index];
    if (source.empty() || source.front() != '/') return location;

    location.file = core::FileIdentity::from_path(source);
    location.start = css::TextPosition{original->line, original->column};
    if (range.end.line == range.start.line) {
        location.end = css::TextPosition{original->line,
                                         original->column + (range.end.column - range.start.column)};
    } else {
        location.end = css::TextPosition{original->line + (range.end.line - range.start.line),
                                         range.end.column};
    }
    return location;
}

class TokenMerger {
public:
    void merge(const Token& token) {
        auto it = index_.find(token.name);
        if (it == index_.end()) {
            index_.emplace(token.name, tokens_.size());
            Token copy{token.name, {}};
            append_unique(copy.original_locations, token.original_locations);
            tokens_.push_back(std::move(copy));
            return;
        }
        append_unique(tokens_[it->second].original_locations, token.original_locations);
    }

    std::vector<Token> take() { return std::move(tokens_); }

private:
    std::vector<Token> tokens_;
    std::map<std::string, size_t> index_;
};

// Locations a local token picks up through composition, in reference order.
class CompositionWalker {
public:
    CompositionWalker(const css::ExtractedTokens& extracted,
                      const std::map<std::string, Locations>& own,
                      const std::map<std::string, const LoadResult*>& targets)
        : extracted_(extracted), own_(own), targets_(targets) {}

    Locations composed_into(const std::string& name) {
        Locations out;
        visiting_.insert(name);
        for (const auto& ref : extracted_.composes_refs) {
            if (std::find(ref.owners.begin(), ref.owners.end(), name) == ref.owners.end()) continue;
            for (const auto& composed : ref.token_names) {
                if (ref.specifier) {
                    // A name the target does not export is skipped.
                    auto target = targets_.find(*ref.specifier);
                    if (target == targets_.end() || !target->second) continue;
                    if (const Token* token = target->second->find(composed)) {
                        append_unique(out, token->original_locations);
                    }
                    continue;
                }
                auto local = own_.find(composed);
                if (local == own_.end()) continue;
                // A local cycle contributes the token itself and stops.
                if (!visiting_.count(composed)) {
                    append_unique(out, composed_into(composed));
                }
                append_unique(out, local->second);
            }
        }
        visiting_.erase(name);
        return out;
    }

private:
    const css::ExtractedTokens& extracted_;
    const std::map<std::string, Locations>& own_;
    const std::map<std::string, const LoadResult*>& targets_;
    std::set<std::string> visiting_;
};

struct PendingTarget {
    std::string specifier;
    core::FileIdentity target;
    std::future<LoadResult> result;
};

} // namespace

DependencyGraphLoader::DependencyGraphLoader(LoadCache& cache, const io::FileSystem& fs,
                                             const resolve::SpecifierResolver& resolver,
                                             const transform::TransformerRegistry& transformers,
                                             core::DiagnosticEmitter* diagnostics)
    : cache_(cache),
      fs_(fs),
      resolver_(resolver),
      transformers_(transformers),
      diagnostics_(diagnostics) {}

LoadResult DependencyGraphLoader::load(const core::FileIdentity& file) {
    cache_.discard_failed();
    return load_in_chain(file, {});
}

void DependencyGraphLoader::debug(const std::string& stage, const std::string& message) const {
    if (diagnostics_ && diagnostics_->enabled(core::Severity::Debug)) {
        diagnostics_->emit(core::Severity::Debug, "loader", stage, message);
    }
}

LoadResult DependencyGraphLoader::load_in_chain(const core::FileIdentity& file,
                                                const CallChain& chain) {
    if (file.is_ignored()) {
        return {};
    }
    if (std::find(chain.begin(), chain.end(), file) != chain.end()) {
        CallChain cycle = chain;
        cycle.push_back(file);
        throw LoadError::cyclic_composition(file, std::move(cycle));
    }

    std::optional<core::FileIdentity> requester;
    if (!chain.empty()) requester = chain.back();

    LoadCache::Claim claim = cache_.begin_load(file, requester);
    switch (claim.kind) {
        case LoadCache::Claim::Kind::Cycle: {
            CallChain cycle = chain;
            cycle.push_back(file);
            throw LoadError::cyclic_composition(file, std::move(cycle));
        }
        case LoadCache::Claim::Kind::Waiter:
            debug("wait", file.str());
            return claim.result.get();
        case LoadCache::Claim::Kind::Owner:
            break;
    }

    debug("claim", file.str());
    CallChain inner = chain;
    inner.push_back(file);
    try {
        LoadResult result = load_uncached(file, inner);
        cache_.complete(file, result);
        return result;
    } catch (...) {
        // Every waiter sees the same failure; the entry must not stay in flight.
        cache_.fail(file, std::current_exception());
        throw;
    }
}

LoadResult DependencyGraphLoader::load_uncached(const core::FileIdentity& file,
                                                const CallChain& chain) {
    // -----------------------------------------------------------------------
    // Read
    // -----------------------------------------------------------------------
    std::string source;
    try {
        source = fs_.read_file(file.str());
    } catch (const std::system_error& e) {
        int code = e.code().value();
        if (code == EACCES || code == EPERM) {
            throw LoadError::permission_denied(file, e.code().message());
        }
        throw LoadError::not_found(file, e.code().message());
    }

    // -----------------------------------------------------------------------
    // Transform
    // -----------------------------------------------------------------------
    debug("transform", file.str());
    transform::TransformContext context{
        file, resolver_, [this](std::string_view specifier) { return resolver_.is_ignored(specifier); }};
    transform::TransformResult transformed;
    try {
        transformed = transformers_.transformer_for(file.extension()).transform(source, context);
    } catch (const transform::TransformFailure& e) {
        std::optional<SourceLocation> location;
        if (e.position()) location = SourceLocation{file, *e.position(), *e.position()};
        throw LoadError::transform_error(file, e.what(), std::move(location));
    } catch (const resolve::ResolveError& e) {
        throw LoadError::transform_error(file, e.what(), std::nullopt);
    } catch (const std::system_error& e) {
        throw LoadError::transform_error(file, e.what(), std::nullopt);
    }

    // -----------------------------------------------------------------------
    // Extract
    // -----------------------------------------------------------------------
    debug("extract", file.str());
    css::ExtractedTokens extracted;
    try {
        extracted = css::extract_tokens(transformed.css);
    } catch (const css::ExtractError& e) {
        css::TextRange at{e.position(), e.position()};
        throw LoadError::extraction_error(file, e.what(),
                                          map_range(file, at, transformed.source_map));
    }

    // -----------------------------------------------------------------------
    // Resolve and load targets (imports first, then compositions)
    // -----------------------------------------------------------------------
    std::vector<std::string> specifiers;
    auto note_specifier = [&specifiers](const std::string& specifier) {
        if (std::find(specifiers.begin(), specifiers.end(), specifier) == specifiers.end()) {
            specifiers.push_back(specifier);
        }
    };
    for (const auto& ref : extracted.import_refs) note_specifier(ref.specifier);
    for (const auto& ref : extracted.composes_refs) {
        if (ref.specifier) note_specifier(*ref.specifier);
    }

    std::map<std::string, core::FileIdentity> resolved;
    for (const auto& specifier : specifiers) {
        debug("resolve", specifier + " from " + file.str());
        try {
            resolved.emplace(specifier, resolver_.resolve(specifier, resolve::ResolveContext{file}));
        } catch (const resolve::ResolveError& e) {
            throw LoadError::unresolved_composes_target(specifier, file, e.reason());
        }
    }

    // One task per distinct target; joined in declaration order below.
    std::vector<PendingTarget> pending;
    for (const auto& specifier : specifiers) {
        const core::FileIdentity& target = resolved.at(specifier);
        if (target.is_ignored()) continue;
        bool spawned = std::any_of(pending.begin(), pending.end(),
                                   [&](const PendingTarget& p) { return p.target == target; });
        if (spawned) continue;
        pending.push_back(PendingTarget{
            specifier, target,
            std::async(std::launch::async,
                       [this, target, chain] { return load_in_chain(target, chain); })});
    }

    std::map<core::FileIdentity, LoadResult> loaded;
    for (auto& task : pending) {
        try {
            loaded.emplace(task.target, task.result.get());
        } catch (const LoadError& e) {
            if (e.kind() == LoadErrorKind::NotFound && e.file() == task.target && e.trail().empty()) {
                throw LoadError::unresolved_composes_target(task.specifier, file, e.what());
            }
            LoadError error = e;
            error.add_trail(file);
            throw error;
        }
    }

    std::map<std::string, const LoadResult*> targets;
    for (const auto& [specifier, target] : resolved) {
        auto it = loaded.find(target);
        targets.emplace(specifier, it == loaded.end() ? nullptr : &it->second);
    }

    // -----------------------------------------------------------------------
    // Merge
    // -----------------------------------------------------------------------
    std::map<std::string, Locations> own;
    for (const auto& token : extracted.local_tokens) {
        Locations& locations = own[token.name];
        for (const auto& range : token.ranges) {
            append_unique(locations, {map_range(file, range, transformed.source_map)});
        }
    }

    TokenMerger merger;
    for (const auto& ref : extracted.import_refs) {
        if (const LoadResult* target = targets.at(ref.specifier)) {
            for (const auto& token : target->tokens) merger.merge(token);
        }
    }

    CompositionWalker walker(extracted, own, targets);
    for (const auto& token : extracted.local_tokens) {
        Locations locations = walker.composed_into(token.name);
        append_unique(locations, own.at(token.name));
        merger.merge(Token{token.name, std::move(locations)});
    }

    for (const auto& ref : extracted.composes_refs) {
        if (!ref.specifier) continue;
        const LoadResult* target = targets.at(*ref.specifier);
        if (!target) continue;
        for (const auto& name : ref.token_names) {
            if (own.count(name)) continue;
            if (const Token* token = target->find(name)) merger.merge(*token);
        }
    }

    // -----------------------------------------------------------------------
    // Dependencies
    // -----------------------------------------------------------------------
    LoadResult result;
    result.tokens = merger.take();
    for (const auto& dependency : transformed.pre_bundled_dependencies) {
        result.dependencies.insert(dependency);
    }
    for (const auto& [target, target_result] : loaded) {
        result.dependencies.insert(target);
        result.dependencies.insert(target_result.dependencies.begin(),
                                   target_result.dependencies.end());
    }
    result.dependencies.erase(file);
    for (auto it = result.dependencies.begin(); it != result.dependencies.end();) {
        it = it->is_ignored() ? result.dependencies.erase(it) : std::next(it);
    }
    return result;
}

} // namespace stylebind::loader
