#pragma once
#include <stylebind/core/diagnostics.h>
#include <stylebind/emit/naming.h>
#include <stylebind/runner/file_cache.h>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stylebind::runner {

struct RunnerOptions {
    std::string pattern;
    std::string cwd;  // empty: the process working directory
    std::optional<std::string> out_dir;
    emit::LocalsConvention locals_convention = emit::LocalsConvention::AsIs;
    bool declaration_map = false;
    bool arbitrary_extensions = false;
    std::vector<std::string> sass_load_paths;
    std::vector<std::string> less_include_paths;
    std::vector<std::pair<std::string, std::string>> aliases;
    bool cache = true;
    CacheStrategy cache_strategy = CacheStrategy::Content;
    std::string cache_file;  // empty: config::kDefaultCacheFile under cwd
    bool silent = false;
    size_t jobs = 0;  // 0: one per hardware thread
};

// Stable text of every option that changes generated output; part of the
// persistent cache key.
std::string options_fingerprint(const RunnerOptions& options);

struct RunSummary {
    size_t matched = 0;
    size_t generated = 0;
    size_t skipped = 0;
    size_t failed = 0;
};

// Generates declarations for every file matching the pattern. A failing
// file is reported and does not stop the others.
class Runner {
public:
    explicit Runner(core::DiagnosticEmitter& diagnostics);

    // Throws std::system_error if the cache state cannot be written.
    RunSummary run(const RunnerOptions& options);

private:
    core::DiagnosticEmitter& diagnostics_;
};

} // namespace stylebind::runner
