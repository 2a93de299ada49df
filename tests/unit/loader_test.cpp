#include <stylebind/loader/loader.h>
#include <stylebind/resolve/node_resolver.h>
#include <stylebind/sourcemap/source_map.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace stylebind;
using namespace stylebind::loader;
using core::FileIdentity;
using css::TextPosition;
using namespace std::chrono_literals;

namespace {

// In-memory files with a read counter per path.
class MemoryFileSystem : public io::FileSystem {
public:
    void add(const std::string& path, std::string content) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] = std::move(content);
    }
    // is_file() stays true but reads fail with `error`.
    void fail_reads(const std::string& path, int error) {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_[path] = error;
    }
    void delay_reads(const std::string& path, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_[path] = delay;
    }
    int reads(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = reads_.find(path);
        return it == reads_.end() ? 0 : it->second;
    }

    std::string read_file(const std::string& path) const override {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++reads_[path];
            if (auto it = errors_.find(path); it != errors_.end()) {
                throw std::system_error(it->second, std::generic_category(), path);
            }
            if (auto it = delays_.find(path); it != delays_.end()) delay = it->second;
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        if (it == files_.end()) {
            throw std::system_error(ENOENT, std::generic_category(), path);
        }
        return it->second;
    }

    bool is_file(const std::string& path) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_.count(path) > 0 || errors_.count(path) > 0;
    }

    bool is_directory(const std::string& path) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string prefix = path + "/";
        for (const auto& [name, content] : files_) {
            if (name.compare(0, prefix.size(), prefix) == 0) return true;
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::map<std::string, int> errors_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    mutable std::map<std::string, int> reads_;
};

class FailingTransformer : public transform::SourceTransformer {
public:
    transform::TransformResult transform(std::string_view,
                                         const transform::TransformContext&) const override {
        throw transform::TransformFailure("Undefined variable.", TextPosition{2, 3});
    }
};

// Reports the files it claims to have inlined.
class BundlingTransformer : public transform::SourceTransformer {
public:
    transform::TransformResult transform(std::string_view source,
                                         const transform::TransformContext&) const override {
        transform::TransformResult result;
        result.css = std::string(source);
        result.pre_bundled_dependencies.push_back(FileIdentity::from_path("/p/_vars.scss"));
        return result;
    }
};

// Emits ".a{}" mapped back to line 3, column 5 of /p/src/button.scss.
class MappingTransformer : public transform::SourceTransformer {
public:
    transform::TransformResult transform(std::string_view,
                                         const transform::TransformContext&) const override {
        sourcemap::SourceMapGenerator generator("out.css");
        generator.add_mapping(1, 1, "/p/src/button.scss", 3, 5);
        transform::TransformResult result;
        result.css = ".a{}";
        result.source_map = sourcemap::SourceMap::parse(generator.to_json());
        return result;
    }
};

SourceLocation at(const std::string& file, size_t line, size_t col, size_t end_line, size_t end_col) {
    return SourceLocation{FileIdentity::from_path(file), TextPosition{line, col},
                          TextPosition{end_line, end_col}};
}

std::vector<std::string> names_of(const LoadResult& result) {
    std::vector<std::string> names;
    for (const auto& token : result.tokens) names.push_back(token.name);
    return names;
}

} // namespace

class LoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        transformers_.register_transformer(".fail", std::make_shared<FailingTransformer>());
        transformers_.register_transformer(".bundle", std::make_shared<BundlingTransformer>());
        transformers_.register_transformer(".mapped", std::make_shared<MappingTransformer>());
    }

    LoadResult load(const std::string& path) {
        return loader_.load(FileIdentity::from_path(path));
    }

    LoadError load_error(const std::string& path) {
        try {
            load(path);
        } catch (const LoadError& e) {
            return e;
        }
        ADD_FAILURE() << "expected " << path << " to fail";
        return LoadError::not_found(FileIdentity::from_path(path), "did not fail");
    }

    MemoryFileSystem fs_;
    resolve::NodeResolver resolver_{fs_};
    transform::TransformerRegistry transformers_;
    LoadCache cache_;
    DependencyGraphLoader loader_{cache_, fs_, resolver_, transformers_};
};

// ---------------------------------------------------------------------------
// 1. Without composition tokens follow declaration order, one location each
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, PlainFileKeepsDeclarationOrder) {
    fs_.add("/p/plain.css", ".b {}\n.a {}\n.c {}\n");
    LoadResult result = load("/p/plain.css");

    EXPECT_EQ(names_of(result), (std::vector<std::string>{"b", "a", "c"}));
    for (const auto& token : result.tokens) {
        EXPECT_EQ(token.original_locations.size(), 1u);
    }
    EXPECT_EQ(result.tokens[1].original_locations[0], at("/p/plain.css", 2, 1, 2, 3));
    EXPECT_TRUE(result.dependencies.empty());
}

// ---------------------------------------------------------------------------
// 2. Repeated declarations give one token with every location
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, RepeatedDeclarationsMerge) {
    fs_.add("/p/1.css", ".a{} .a{}");
    LoadResult result = load("/p/1.css");

    ASSERT_EQ(result.tokens.size(), 1u);
    EXPECT_EQ(result.tokens[0].name, "a");
    EXPECT_EQ(result.tokens[0].original_locations,
              (std::vector<SourceLocation>{at("/p/1.css", 1, 1, 1, 3), at("/p/1.css", 1, 6, 1, 8)}));
}

// ---------------------------------------------------------------------------
// 3. Composed locations come before the token's own
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, ComposeFromFile) {
    fs_.add("/p/1.css", ".a{composes:b from './2';}");
    fs_.add("/p/2.css", ".b{}");
    LoadResult result = load("/p/1.css");

    const Token* a = result.find("a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->original_locations,
              (std::vector<SourceLocation>{at("/p/2.css", 1, 1, 1, 3), at("/p/1.css", 1, 1, 1, 3)}));
    EXPECT_EQ(result.tokens[0].name, "a");
    EXPECT_EQ(result.dependencies, (std::set<FileIdentity>{FileIdentity::from_path("/p/2.css")}));
}

// ---------------------------------------------------------------------------
// 4. A composed name the target lacks is skipped
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, MissingComposedNameIsSkipped) {
    fs_.add("/p/1.css", ".a{composes: b missing from './2.css';}");
    fs_.add("/p/2.css", ".b{}");
    LoadResult result = load("/p/1.css");

    EXPECT_EQ(result.find("missing"), nullptr);
    ASSERT_NE(result.find("a"), nullptr);
    EXPECT_EQ(result.find("a")->original_locations.size(), 2u);
}

// ---------------------------------------------------------------------------
// 5. A missing target file fails the whole load
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, MissingTargetIsUnresolved) {
    fs_.add("/p/1.css", ".a{composes: b from './nope.css';}");
    LoadError error = load_error("/p/1.css");

    EXPECT_EQ(error.kind(), LoadErrorKind::UnresolvedComposesTarget);
    EXPECT_EQ(error.specifier(), "./nope.css");
    EXPECT_EQ(error.file(), FileIdentity::from_path("/p/1.css"));
}

// ---------------------------------------------------------------------------
// 6. A target that resolves but cannot be read is also unresolved
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, VanishedTargetIsUnresolved) {
    fs_.add("/p/1.css", ".a{composes: b from './2.css';}");
    fs_.fail_reads("/p/2.css", ENOENT);
    LoadError error = load_error("/p/1.css");

    EXPECT_EQ(error.kind(), LoadErrorKind::UnresolvedComposesTarget);
    EXPECT_EQ(error.specifier(), "./2.css");
}

// ---------------------------------------------------------------------------
// 7. Local composition, chained and with missing names
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, LocalCompositionChains) {
    fs_.add("/p/local.css", ".a{composes: b ghost;}\n.b{composes: c;}\n.c{}");
    LoadResult result = load("/p/local.css");

    EXPECT_EQ(names_of(result), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(result.find("a")->original_locations,
              (std::vector<SourceLocation>{at("/p/local.css", 3, 1, 3, 3),
                                           at("/p/local.css", 2, 1, 2, 3),
                                           at("/p/local.css", 1, 1, 1, 3)}));
    EXPECT_EQ(result.find("ghost"), nullptr);
}

// ---------------------------------------------------------------------------
// 8. Chains through files propagate transitively
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, TransitiveFileComposition) {
    fs_.add("/p/a.css", ".a{composes: b from './b.css';}");
    fs_.add("/p/b.css", ".b{composes: c from './c.css';}");
    fs_.add("/p/c.css", ".c{}");
    LoadResult result = load("/p/a.css");

    EXPECT_EQ(result.find("a")->original_locations,
              (std::vector<SourceLocation>{at("/p/c.css", 1, 1, 1, 3), at("/p/b.css", 1, 1, 1, 3),
                                           at("/p/a.css", 1, 1, 1, 3)}));
    EXPECT_EQ(result.dependencies,
              (std::set<FileIdentity>{FileIdentity::from_path("/p/b.css"),
                                      FileIdentity::from_path("/p/c.css")}));
}

// ---------------------------------------------------------------------------
// 9. Merge order follows declaration order, not completion order
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, MergeOrderIgnoresTiming) {
    fs_.add("/p/top.css", ".t{composes: s from './slow.css'; composes: f from './fast.css';}");
    fs_.add("/p/slow.css", ".s{}");
    fs_.add("/p/fast.css", ".f{}");
    fs_.delay_reads("/p/slow.css", 50ms);
    LoadResult result = load("/p/top.css");

    EXPECT_EQ(result.find("t")->original_locations,
              (std::vector<SourceLocation>{at("/p/slow.css", 1, 1, 1, 3), at("/p/fast.css", 1, 1, 1, 3),
                                           at("/p/top.css", 1, 1, 1, 3)}));
    EXPECT_EQ(names_of(result), (std::vector<std::string>{"t", "s", "f"}));
}

// ---------------------------------------------------------------------------
// 10. Loading the same file twice reads it once
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, RepeatedLoadReadsOnce) {
    fs_.add("/p/once.css", ".x{}");
    load("/p/once.css");
    load("/p/once.css");
    EXPECT_EQ(fs_.reads("/p/once.css"), 1);
    EXPECT_EQ(cache_.state(FileIdentity::from_path("/p/once.css")), EntryState::Resolved);
}

// ---------------------------------------------------------------------------
// 11. Diamond dependencies share one load of the common file
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, DiamondLoadsSharedFileOnce) {
    fs_.add("/p/top.css", ".t{composes: l from './left.css'; composes: r from './right.css';}");
    fs_.add("/p/left.css", ".l{composes: base from './base.css';}");
    fs_.add("/p/right.css", ".r{composes: base from './base.css';}");
    fs_.add("/p/base.css", ".base{composes: deep from './deep.css';}");
    fs_.add("/p/deep.css", ".deep{}");
    fs_.delay_reads("/p/base.css", 20ms);

    LoadResult top = load("/p/top.css");
    LoadResult left = load("/p/left.css");
    LoadResult right = load("/p/right.css");

    EXPECT_EQ(fs_.reads("/p/base.css"), 1);
    EXPECT_EQ(fs_.reads("/p/deep.css"), 1);
    EXPECT_EQ(fs_.reads("/p/left.css"), 1);

    FileIdentity base = FileIdentity::from_path("/p/base.css");
    FileIdentity deep = FileIdentity::from_path("/p/deep.css");
    EXPECT_TRUE(left.dependencies.count(base));
    EXPECT_TRUE(left.dependencies.count(deep));
    EXPECT_TRUE(right.dependencies.count(base));
    EXPECT_TRUE(right.dependencies.count(deep));
    EXPECT_EQ(top.dependencies.size(), 4u);

    // Locations reached twice are kept once.
    const auto& t = top.find("t")->original_locations;
    EXPECT_EQ(std::count(t.begin(), t.end(), at("/p/deep.css", 1, 1, 1, 6)), 1);
}

// ---------------------------------------------------------------------------
// 12. Concurrent top-level loads of a diamond still read the base once
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, ConcurrentTopLevelLoads) {
    fs_.add("/p/a.css", ".a{composes: c from './c.css';}");
    fs_.add("/p/b.css", ".b{composes: c from './c.css';}");
    fs_.add("/p/c.css", ".c{}");
    fs_.delay_reads("/p/c.css", 30ms);

    LoadResult a_result;
    LoadResult b_result;
    std::thread first([&] { a_result = load("/p/a.css"); });
    std::thread second([&] { b_result = load("/p/b.css"); });
    first.join();
    second.join();

    EXPECT_EQ(fs_.reads("/p/c.css"), 1);
    EXPECT_EQ(a_result.find("a")->original_locations.front(), at("/p/c.css", 1, 1, 1, 3));
    EXPECT_EQ(b_result.find("b")->original_locations.front(), at("/p/c.css", 1, 1, 1, 3));
}

// ---------------------------------------------------------------------------
// 13. Direct cycles fail instead of hanging
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, DirectCycle) {
    fs_.add("/p/a.css", ".a{composes: b from './b.css';}");
    fs_.add("/p/b.css", ".b{composes: a from './a.css';}");
    LoadError error = load_error("/p/a.css");

    EXPECT_EQ(error.kind(), LoadErrorKind::CyclicComposition);
    EXPECT_EQ(error.chain(),
              (std::vector<FileIdentity>{FileIdentity::from_path("/p/a.css"),
                                         FileIdentity::from_path("/p/b.css"),
                                         FileIdentity::from_path("/p/a.css")}));
    EXPECT_NE(std::string(error.what()).find("/p/a.css -> /p/b.css -> /p/a.css"), std::string::npos);
}

// ---------------------------------------------------------------------------
// 14. Transitive cycles fail too
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, TransitiveCycle) {
    fs_.add("/p/a.css", ".a{composes: b from './b.css';}");
    fs_.add("/p/b.css", ".b{composes: c from './c.css';}");
    fs_.add("/p/c.css", ".c{composes: a from './a.css';}");
    LoadError error = load_error("/p/a.css");

    EXPECT_EQ(error.kind(), LoadErrorKind::CyclicComposition);
    EXPECT_EQ(error.chain().size(), 4u);
    // Failures are not kept for the next top-level request.
    EXPECT_EQ(load_error("/p/b.css").kind(), LoadErrorKind::CyclicComposition);
}

// ---------------------------------------------------------------------------
// 15. A file composing from itself is a cycle
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, SelfComposition) {
    fs_.add("/p/self.css", ".a{composes: b from './self.css';} .b{}");
    EXPECT_EQ(load_error("/p/self.css").kind(), LoadErrorKind::CyclicComposition);
}

// ---------------------------------------------------------------------------
// 16. Cycles entered from two threads at once fail on both
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, ConcurrentCycle) {
    fs_.add("/p/a.css", ".a{composes: b from './b.css';}");
    fs_.add("/p/b.css", ".b{composes: a from './a.css';}");
    fs_.delay_reads("/p/a.css", 10ms);
    fs_.delay_reads("/p/b.css", 10ms);

    LoadErrorKind first_kind = LoadErrorKind::NotFound;
    LoadErrorKind second_kind = LoadErrorKind::NotFound;
    std::thread first([&] { first_kind = load_error("/p/a.css").kind(); });
    std::thread second([&] { second_kind = load_error("/p/b.css").kind(); });
    first.join();
    second.join();

    EXPECT_EQ(first_kind, LoadErrorKind::CyclicComposition);
    EXPECT_EQ(second_kind, LoadErrorKind::CyclicComposition);
}

// ---------------------------------------------------------------------------
// 17. Local composition cycles are not errors
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, LocalCycleTerminates) {
    fs_.add("/p/loop.css", ".a{composes: b;} .b{composes: a;}");
    LoadResult result = load("/p/loop.css");
    ASSERT_EQ(result.tokens.size(), 2u);
    EXPECT_EQ(result.find("a")->original_locations.size(), 2u);
    EXPECT_EQ(result.find("b")->original_locations.size(), 2u);
}

// ---------------------------------------------------------------------------
// 18. Read failures map to NotFound and PermissionDenied
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, ReadErrors) {
    EXPECT_EQ(load_error("/p/absent.css").kind(), LoadErrorKind::NotFound);

    fs_.fail_reads("/p/secret.css", EACCES);
    LoadError denied = load_error("/p/secret.css");
    EXPECT_EQ(denied.kind(), LoadErrorKind::PermissionDenied);
    EXPECT_EQ(denied.file(), FileIdentity::from_path("/p/secret.css"));
}

// ---------------------------------------------------------------------------
// 19. Errors deeper in the graph carry the loading trail
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, NestedErrorTrail) {
    fs_.add("/p/a.css", ".a{composes: b from './b.css';}");
    fs_.add("/p/b.css", ".b{composes: c from './c.css';}");
    fs_.add("/p/c.css", ".c{ color: red;");
    LoadError error = load_error("/p/a.css");

    EXPECT_EQ(error.kind(), LoadErrorKind::ExtractionError);
    EXPECT_EQ(error.file(), FileIdentity::from_path("/p/c.css"));
    EXPECT_EQ(error.trail(),
              (std::vector<FileIdentity>{FileIdentity::from_path("/p/b.css"),
                                         FileIdentity::from_path("/p/a.css")}));
    ASSERT_TRUE(error.location().has_value());
    EXPECT_EQ(error.location()->file, FileIdentity::from_path("/p/c.css"));
}

// ---------------------------------------------------------------------------
// 20. A failed load is retried by the next top-level request
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, FailureIsNotCached) {
    fs_.add("/p/flaky.css", ".a {");
    EXPECT_EQ(load_error("/p/flaky.css").kind(), LoadErrorKind::ExtractionError);

    fs_.add("/p/flaky.css", ".a {}");
    LoadResult result = load("/p/flaky.css");
    EXPECT_EQ(names_of(result), (std::vector<std::string>{"a"}));
    EXPECT_EQ(fs_.reads("/p/flaky.css"), 2);
}

// ---------------------------------------------------------------------------
// 21. Transformer diagnostics become TransformError with a location
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, TransformFailure) {
    fs_.add("/p/broken.fail", "$x: ;");
    LoadError error = load_error("/p/broken.fail");

    EXPECT_EQ(error.kind(), LoadErrorKind::TransformError);
    ASSERT_TRUE(error.location().has_value());
    EXPECT_EQ(error.location()->start, (TextPosition{2, 3}));
    EXPECT_NE(std::string(error.what()).find("Undefined variable."), std::string::npos);
}

// ---------------------------------------------------------------------------
// 22. Pre-bundled files count as dependencies
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, PreBundledDependencies) {
    fs_.add("/p/theme.bundle", ".theme{}");
    LoadResult result = load("/p/theme.bundle");
    EXPECT_EQ(result.dependencies, (std::set<FileIdentity>{FileIdentity::from_path("/p/_vars.scss")}));
    EXPECT_EQ(fs_.reads("/p/_vars.scss"), 0);
}

// ---------------------------------------------------------------------------
// 23. Source maps move locations back to the original file
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, SourceMappedLocations) {
    fs_.add("/p/src/button.mapped", "anything");
    LoadResult result = load("/p/src/button.mapped");

    ASSERT_EQ(result.tokens.size(), 1u);
    EXPECT_EQ(result.tokens[0].original_locations,
              (std::vector<SourceLocation>{at("/p/src/button.scss", 3, 5, 3, 7)}));
}

// ---------------------------------------------------------------------------
// 24. @import brings the imported tokens in first
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, ImportedTokens) {
    fs_.add("/p/main.css", "@import './base.css';\n.a{}");
    fs_.add("/p/base.css", ".x{} .a{}");
    LoadResult result = load("/p/main.css");

    EXPECT_EQ(names_of(result), (std::vector<std::string>{"x", "a"}));
    EXPECT_EQ(result.find("a")->original_locations,
              (std::vector<SourceLocation>{at("/p/base.css", 1, 6, 1, 8), at("/p/main.css", 2, 1, 2, 3)}));
    EXPECT_EQ(result.dependencies, (std::set<FileIdentity>{FileIdentity::from_path("/p/base.css")}));
}

// ---------------------------------------------------------------------------
// 25. Ignored specifiers load as empty files
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, IgnoredSpecifiers) {
    fs_.add("/p/remote.css",
            "@import 'https://cdn.example/reset.css';\n"
            ".a{composes: b from '//cdn.example/b.css';}");
    LoadResult result = load("/p/remote.css");

    EXPECT_EQ(names_of(result), (std::vector<std::string>{"a"}));
    EXPECT_EQ(result.find("a")->original_locations.size(), 1u);
    EXPECT_TRUE(result.dependencies.empty());
}

// ---------------------------------------------------------------------------
// 26. Returned results are snapshots
// ---------------------------------------------------------------------------
TEST_F(LoaderTest, ResultsAreSnapshots) {
    fs_.add("/p/snap.css", ".a{}");
    LoadResult first = load("/p/snap.css");
    first.tokens.clear();

    LoadResult second = load("/p/snap.css");
    EXPECT_EQ(second.tokens.size(), 1u);
    ASSERT_TRUE(cache_.get(FileIdentity::from_path("/p/snap.css")).has_value());
    EXPECT_EQ(cache_.get(FileIdentity::from_path("/p/snap.css"))->tokens.size(), 1u);
}

// ---------------------------------------------------------------------------
// 27. Debug events trace the load
// ---------------------------------------------------------------------------
TEST(LoaderDiagnosticsTest, EmitsDebugEvents) {
    MemoryFileSystem fs;
    fs.add("/p/a.css", ".a{}");
    resolve::NodeResolver resolver(fs);
    transform::TransformerRegistry transformers;
    LoadCache cache;
    core::DiagnosticEmitter diagnostics;
    diagnostics.set_retain_events(true);
    diagnostics.set_min_severity(core::Severity::Debug);
    DependencyGraphLoader loader(cache, fs, resolver, transformers, &diagnostics);

    loader.load(FileIdentity::from_path("/p/a.css"));

    auto events = diagnostics.events_by_module("loader");
    ASSERT_GE(events.size(), 3u);
    EXPECT_EQ(events[0].stage, "claim");
    EXPECT_EQ(events[1].stage, "transform");
    EXPECT_EQ(events[2].stage, "extract");
}
