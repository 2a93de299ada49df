#include <stylebind/runner/runner.h>
#include <stylebind/core/config.h>
#include <stylebind/emit/dts_emitter.h>
#include <stylebind/io/file_system.h>
#include <stylebind/loader/loader.h>
#include <stylebind/platform/thread_pool.h>
#include <stylebind/resolve/node_resolver.h>
#include <stylebind/runner/glob.h>
#include <stylebind/transform/compiler_transformer.h>

#include <atomic>
#include <filesystem>
#include <system_error>

namespace stylebind::runner {

namespace fs = std::filesystem;

namespace {

std::string absolute_from(const std::string& cwd, const std::string& path) {
    fs::path p(path);
    if (!p.is_absolute()) p = fs::path(cwd) / p;
    return p.lexically_normal().generic_string();
}

std::string display_path(const std::string& cwd, const std::string& file) {
    std::string relative = fs::path(file).lexically_relative(cwd).generic_string();
    return relative.empty() ? file : relative;
}

} // namespace

std::string options_fingerprint(const RunnerOptions& options) {
    std::string out = "pattern=" + options.pattern;
    out += ";outDir=" + options.out_dir.value_or("");
    out += ";localsConvention=";
    out += emit::locals_convention_name(options.locals_convention);
    out += ";declarationMap=" + std::string(options.declaration_map ? "1" : "0");
    out += ";arbitraryExtensions=" + std::string(options.arbitrary_extensions ? "1" : "0");
    for (const auto& path : options.sass_load_paths) out += ";sassLoadPath=" + path;
    for (const auto& path : options.less_include_paths) out += ";lessIncludePath=" + path;
    for (const auto& [name, path] : options.aliases) out += ";alias=" + name + "=" + path;
    out += ";cacheStrategy=";
    out += options.cache_strategy == CacheStrategy::Content ? "content" : "metadata";
    return out;
}

Runner::Runner(core::DiagnosticEmitter& diagnostics) : diagnostics_(diagnostics) {}

RunSummary Runner::run(const RunnerOptions& options) {
    const std::string cwd = options.cwd.empty()
                                ? fs::current_path().generic_string()
                                : absolute_from(fs::current_path().generic_string(), options.cwd);

    // -----------------------------------------------------------------------
    // Collaborators
    // -----------------------------------------------------------------------
    std::vector<std::string> sass_paths;
    for (const auto& path : options.sass_load_paths) sass_paths.push_back(absolute_from(cwd, path));
    std::vector<std::string> less_paths;
    for (const auto& path : options.less_include_paths) less_paths.push_back(absolute_from(cwd, path));

    resolve::NodeResolverOptions resolver_options;
    for (const auto& [name, path] : options.aliases) {
        resolver_options.aliases.emplace_back(name, absolute_from(cwd, path));
    }
    resolver_options.lookup_directories = sass_paths;
    resolver_options.lookup_directories.insert(resolver_options.lookup_directories.end(),
                                               less_paths.begin(), less_paths.end());

    io::DiskFileSystem disk;
    resolve::NodeResolver resolver(disk, resolver_options);
    transform::TransformerRegistry transformers = transform::make_default_registry(sass_paths, less_paths);
    loader::LoadCache load_cache;
    loader::DependencyGraphLoader graph_loader(load_cache, disk, resolver, transformers, &diagnostics_);

    emit::DtsOptions dts_options;
    dts_options.locals_convention = options.locals_convention;
    dts_options.declaration_map = options.declaration_map;
    dts_options.arbitrary_extensions = options.arbitrary_extensions;
    dts_options.root_dir = cwd;
    if (options.out_dir) dts_options.out_dir = absolute_from(cwd, *options.out_dir);

    std::string cache_file = absolute_from(
        cwd, options.cache_file.empty() ? core::config::kDefaultCacheFile : options.cache_file);
    std::string cache_key = sha256_hex(std::string(core::config::kVersion) + "\n" +
                                       options_fingerprint(options));
    FileCache file_cache(cache_file, options.cache_strategy, cache_key, options.cache);
    file_cache.load();

    // Files outside the pattern get no declarations of their own.
    const std::string absolute_pattern = absolute_from(cwd, options.pattern);
    auto is_external = [&absolute_pattern](const core::FileIdentity& file) {
        return !glob_match(absolute_pattern, file.str());
    };

    // -----------------------------------------------------------------------
    // Files
    // -----------------------------------------------------------------------
    std::vector<std::string> files = expand_glob(options.pattern, cwd);
    RunSummary summary;
    summary.matched = files.size();
    if (files.empty()) {
        diagnostics_.emit(core::Severity::Warning, "runner", "glob",
                          "no files match '" + options.pattern + "'");
        return summary;
    }

    std::atomic<size_t> generated{0};
    std::atomic<size_t> skipped{0};
    std::atomic<size_t> failed{0};

    auto report_failure = [&](const std::string& file, core::FailureTrace trace) {
        file_cache.forget(file);
        ++failed;
        diagnostics_.emit(core::Severity::Error, "runner", "process", trace.format());
    };

    auto process_file = [&](const std::string& file) {
        const std::string shown = display_path(cwd, file);
        try {
            bool outputs_exist = emit::generated_files_exist(file, dts_options);
            bool changed = file_cache.is_changed(file);
            // Missing outputs are always regenerated.
            if (outputs_exist && !changed) {
                ++skipped;
                if (!options.silent) {
                    diagnostics_.emit(core::Severity::Info, "runner", "skip", shown + " (skipped)");
                }
                return;
            }

            core::FileIdentity identity = core::FileIdentity::from_path(file);
            loader::LoadResult result = graph_loader.load(identity);
            emit::DtsOutput output = emit::generate_dts(identity, result, dts_options, is_external);
            emit::emit_generated_files(output, dts_options);
            ++generated;
            if (!options.silent) {
                diagnostics_.emit(core::Severity::Info, "runner", "generate", shown + " (generated)");
            }
        } catch (const loader::LoadError& e) {
            core::FailureTrace trace{shown, loader::load_error_kind_name(e.kind()), e.what(), {}};
            trace.causal_chain.push_back(display_path(cwd, e.file().str()));
            for (const auto& link : e.trail()) {
                trace.causal_chain.push_back(display_path(cwd, link.str()));
            }
            report_failure(file, std::move(trace));
        } catch (const std::system_error& e) {
            report_failure(file, core::FailureTrace{shown, "IoError", e.what(), {}});
        } catch (const std::exception& e) {
            report_failure(file, core::FailureTrace{shown, "InternalError", e.what(), {}});
        }
    };

    {
        platform::ThreadPool pool(options.jobs == 0 ? platform::default_thread_count() : options.jobs);
        for (const auto& file : files) {
            pool.post([&process_file, file]() { process_file(file); });
        }
        pool.wait_idle();
    }

    file_cache.reconcile();

    summary.generated = generated.load();
    summary.skipped = skipped.load();
    summary.failed = failed.load();
    if (summary.failed > 0) {
        diagnostics_.emit(core::Severity::Error, "runner", "summary",
                          "failed to process " + std::to_string(summary.failed) + " of " +
                              std::to_string(summary.matched) + " files");
    }
    return summary;
}

} // namespace stylebind::runner
