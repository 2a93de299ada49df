#include <stylebind/emit/dts_emitter.h>
#include <stylebind/json/json.h>
#include <stylebind/sourcemap/source_map.h>

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <string>
#include <unistd.h>

using namespace stylebind;
using namespace stylebind::emit;
using core::FileIdentity;
using css::TextPosition;

namespace fs = std::filesystem;

namespace {

loader::SourceLocation at(const std::string& file, size_t line, size_t col) {
    return loader::SourceLocation{FileIdentity::from_path(file), TextPosition{line, col},
                                  TextPosition{line, col + 2}};
}

bool never_external(const FileIdentity&) { return false; }

} // namespace

// ---------------------------------------------------------------------------
// 1. Output paths
// ---------------------------------------------------------------------------
TEST(DtsPathTest, OutputPaths) {
    DtsOptions options;
    EXPECT_EQ(dts_file_path("/w/src/a.css", options), "/w/src/a.css.d.ts");
    EXPECT_EQ(source_map_file_path("/w/src/a.css", options), "/w/src/a.css.d.ts.map");

    options.arbitrary_extensions = true;
    EXPECT_EQ(dts_file_path("/w/src/a.module.scss", options), "/w/src/a.module.d.scss.ts");

    options.arbitrary_extensions = false;
    options.out_dir = "/w/generated";
    options.root_dir = "/w";
    EXPECT_EQ(dts_file_path("/w/src/a.css", options), "/w/generated/src/a.css.d.ts");
}

// ---------------------------------------------------------------------------
// 2. Relative import paths
// ---------------------------------------------------------------------------
TEST(DtsPathTest, RelativePath) {
    EXPECT_EQ(relative_path("/w/src/a.css", "/w/src/b.css"), "./b.css");
    EXPECT_EQ(relative_path("/w/src/a.css", "/w/lib/b.css"), "../lib/b.css");
    EXPECT_EQ(relative_path("/w/src/a.css", "/w/src/sub/b.css"), "./sub/b.css");
}

// ---------------------------------------------------------------------------
// 3. Empty results declare an empty object
// ---------------------------------------------------------------------------
TEST(DtsEmitterTest, EmptyResult) {
    DtsOptions options;
    DtsOutput output = generate_dts(FileIdentity::from_path("/w/a.css"), loader::LoadResult{},
                                    options, never_external);
    EXPECT_EQ(output.dts_content, "declare const styles: {};\nexport default styles;\n");
    EXPECT_TRUE(output.map_content.empty());
}

// ---------------------------------------------------------------------------
// 4. One declaration per location; tokens from other files are picked
// ---------------------------------------------------------------------------
TEST(DtsEmitterTest, DeclarationsPerLocation) {
    loader::LoadResult result;
    result.tokens.push_back(loader::Token{"a", {at("/w/b.css", 1, 1), at("/w/a.css", 1, 1)}});
    result.tokens.push_back(loader::Token{"b", {at("/w/b.css", 1, 1)}});

    DtsOptions options;
    DtsOutput output = generate_dts(FileIdentity::from_path("/w/a.css"), result, options, never_external);
    EXPECT_EQ(output.dts_path, "/w/a.css.d.ts");
    EXPECT_EQ(output.dts_content,
              "declare const styles:\n"
              "  & Readonly<{ \"a\": string }>\n"
              "  & Readonly<{ \"a\": string }>\n"
              "  & Readonly<Pick<(typeof import(\"./b.css\"))[\"default\"], \"b\">>;\n"
              "export default styles;\n");
}

// ---------------------------------------------------------------------------
// 5. Tokens from external files are declared inline
// ---------------------------------------------------------------------------
TEST(DtsEmitterTest, ExternalTokensInlined) {
    loader::LoadResult result;
    result.tokens.push_back(loader::Token{"btn", {at("/w/node_modules/ui/ui.css", 4, 1)}});

    DtsOptions options;
    auto in_node_modules = [](const FileIdentity& file) {
        return file.str().find("/node_modules/") != std::string::npos;
    };
    DtsOutput output = generate_dts(FileIdentity::from_path("/w/a.css"), result, options, in_node_modules);
    EXPECT_EQ(output.dts_content,
              "declare const styles:\n"
              "  & Readonly<{ \"btn\": string }>;\n"
              "export default styles;\n");
}

// ---------------------------------------------------------------------------
// 6. Locals convention applies to every exported name
// ---------------------------------------------------------------------------
TEST(DtsEmitterTest, LocalsConvention) {
    loader::LoadResult result;
    result.tokens.push_back(loader::Token{"foo-bar", {at("/w/a.css", 1, 1)}});

    DtsOptions options;
    options.locals_convention = LocalsConvention::CamelCase;
    DtsOutput output = generate_dts(FileIdentity::from_path("/w/a.css"), result, options, never_external);
    EXPECT_EQ(output.dts_content,
              "declare const styles:\n"
              "  & Readonly<{ \"foo-bar\": string }>\n"
              "  & Readonly<{ \"fooBar\": string }>;\n"
              "export default styles;\n");
}

// ---------------------------------------------------------------------------
// 7. Declaration maps point each name at its origin
// ---------------------------------------------------------------------------
TEST(DtsEmitterTest, DeclarationMap) {
    loader::LoadResult result;
    result.tokens.push_back(loader::Token{"a", {at("/w/src/a.css", 3, 5)}});

    DtsOptions options;
    options.declaration_map = true;
    DtsOutput output = generate_dts(FileIdentity::from_path("/w/src/a.css"), result, options, never_external);

    EXPECT_EQ(output.map_path, "/w/src/a.css.d.ts.map");
    EXPECT_NE(output.dts_content.find("//# sourceMappingURL=./a.css.d.ts.map\n"), std::string::npos);

    auto map = sourcemap::SourceMap::parse(output.map_content);
    ASSERT_EQ(map.sources().size(), 1u);
    EXPECT_EQ(map.sources()[0], "./a.css");
    auto original = map.original_position_for(2, 16);
    ASSERT_TRUE(original.has_value());
    EXPECT_EQ(original->line, 3u);
    EXPECT_EQ(original->column, 5u);

    json::Value root = json::parse(output.map_content);
    EXPECT_EQ(root.string_at("file"), "a.css.d.ts");
}

// ---------------------------------------------------------------------------
// 8. Writing skips unchanged files
// ---------------------------------------------------------------------------
TEST(DtsEmitterTest, EmitWritesOnlyChanges) {
    static std::atomic<int> counter{0};
    fs::path root = fs::temp_directory_path() /
                    ("stylebind_emit_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    fs::create_directories(root);
    std::string css = (root / "a.css").generic_string();

    loader::LoadResult result;
    result.tokens.push_back(loader::Token{"a", {at(css, 1, 1)}});
    DtsOptions options;
    options.declaration_map = true;
    options.out_dir = (root / "types").generic_string();
    options.root_dir = root.generic_string();

    EXPECT_FALSE(generated_files_exist(css, options));
    DtsOutput output = generate_dts(FileIdentity::from_path(css), result, options, never_external);
    EXPECT_TRUE(emit_generated_files(output, options));
    EXPECT_TRUE(generated_files_exist(css, options));
    EXPECT_TRUE(fs::exists(root / "types" / "a.css.d.ts"));
    EXPECT_FALSE(emit_generated_files(output, options));

    std::error_code ec;
    fs::remove_all(root, ec);
}

// ---------------------------------------------------------------------------
// 9. Re-exports name the file that declares the token, not what it composes
// ---------------------------------------------------------------------------
TEST(DtsEmitterTest, PickFromDeclaringFile) {
    // 1.css: @import './2.css';
    // 2.css: .x { composes: y from './3.css'; }
    // 3.css: .y {}
    loader::LoadResult result;
    result.tokens.push_back(loader::Token{"x", {at("/w/3.css", 1, 1), at("/w/2.css", 1, 1)}});
    result.tokens.push_back(loader::Token{"y", {at("/w/3.css", 1, 1)}});

    DtsOptions options;
    DtsOutput output = generate_dts(FileIdentity::from_path("/w/1.css"), result, options, never_external);
    EXPECT_EQ(output.dts_content,
              "declare const styles:\n"
              "  & Readonly<Pick<(typeof import(\"./2.css\"))[\"default\"], \"x\">>\n"
              "  & Readonly<Pick<(typeof import(\"./3.css\"))[\"default\"], \"y\">>;\n"
              "export default styles;\n");
}
