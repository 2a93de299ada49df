#include <stylebind/emit/dts_emitter.h>
#include <stylebind/core/config.h>
#include <stylebind/io/file_system.h>
#include <stylebind/json/json.h>
#include <stylebind/sourcemap/source_map.h>

#include <filesystem>
#include <set>
#include <utility>
#include <vector>

namespace stylebind::emit {

namespace fs = std::filesystem;

std::string dts_file_path(const std::string& file, const DtsOptions& options) {
    fs::path path(file);
    if (options.out_dir) {
        fs::path relative = path.lexically_relative(options.root_dir);
        path = fs::path(*options.out_dir) / relative;
    }
    if (options.arbitrary_extensions) {
        // "a/b.css" -> "a/b.d.css.ts"
        std::string extension = path.extension().string();
        path.replace_extension();
        return path.lexically_normal().generic_string() + ".d" + extension + ".ts";
    }
    return path.lexically_normal().generic_string() + core::config::kDeclarationSuffix;
}

std::string source_map_file_path(const std::string& file, const DtsOptions& options) {
    return dts_file_path(file, options) + core::config::kDeclarationMapSuffix;
}

std::string relative_path(const std::string& from_file, const std::string& to_file) {
    fs::path from_dir = fs::path(from_file).parent_path();
    std::string relative = fs::path(to_file).lexically_relative(from_dir).generic_string();
    if (relative.rfind("..", 0) == 0) {
        return relative;
    }
    return "./" + relative;
}

namespace {

struct DeclarationLine {
    std::string text;
    // Column (1-based) of the property name and where it came from.
    size_t name_column = 0;
    std::optional<loader::SourceLocation> origin;
};

} // namespace

DtsOutput generate_dts(const core::FileIdentity& file, const loader::LoadResult& result,
                       const DtsOptions& options, const ExternalFilePredicate& is_external) {
    DtsOutput output;
    output.dts_path = dts_file_path(file.str(), options);
    output.map_path = source_map_file_path(file.str(), options);

    std::vector<DeclarationLine> lines;
    std::set<std::pair<std::string, std::string>> picked;  // (file, name)

    for (const auto& token : result.tokens) {
        bool has_own_location = false;
        for (const auto& location : token.original_locations) {
            if (location.file == file) has_own_location = true;
        }

        for (const auto& name : exported_names(token.name, options.locals_convention)) {
            // Composed locations come first; the defining file's own
            // declaration is always last.
            const loader::SourceLocation& declaration = token.original_locations.back();
            // Tokens that only live in another generated file are re-exported
            // from that file's declarations.
            if (!has_own_location && !is_external(declaration.file)) {
                if (!picked.insert({declaration.file.str(), name}).second) continue;
                std::string line = "  & Readonly<Pick<(typeof import(" +
                                   json::quote(relative_path(file.str(), declaration.file.str())) +
                                   "))[\"default\"], ";
                size_t column = line.size() + 1;
                line += json::quote(name) + ">>";
                lines.push_back(DeclarationLine{line, column, declaration});
                continue;
            }

            // One declaration per location, so "go to definition" offers each.
            for (const auto& location : token.original_locations) {
                std::string line = "  & Readonly<{ ";
                size_t column = line.size() + 1;
                line += json::quote(name) + ": string }>";
                lines.push_back(DeclarationLine{line, column, location});
            }
        }
    }

    std::string content;
    sourcemap::SourceMapGenerator map(fs::path(output.dts_path).filename().string());
    if (lines.empty()) {
        content = "declare const styles: {};\n";
    } else {
        content = "declare const styles:\n";
        size_t line_number = 2;
        for (size_t i = 0; i < lines.size(); ++i) {
            content += lines[i].text;
            content += i + 1 == lines.size() ? ";\n" : "\n";
            if (lines[i].origin) {
                const auto& origin = *lines[i].origin;
                map.add_mapping(line_number, lines[i].name_column,
                                relative_path(output.map_path, origin.file.str()),
                                origin.start.line, origin.start.column);
            }
            ++line_number;
        }
    }
    content += "export default styles;\n";

    if (options.declaration_map) {
        content += "//# sourceMappingURL=" + relative_path(output.dts_path, output.map_path) + "\n";
        output.map_content = map.to_json();
    }
    output.dts_content = std::move(content);
    return output;
}

bool emit_generated_files(const DtsOutput& output, const DtsOptions& options) {
    bool written = io::write_file_if_changed(output.dts_path, output.dts_content);
    if (options.declaration_map) {
        written = io::write_file_if_changed(output.map_path, output.map_content) || written;
    }
    return written;
}

bool generated_files_exist(const std::string& file, const DtsOptions& options) {
    io::DiskFileSystem disk;
    if (options.declaration_map && !disk.is_file(source_map_file_path(file, options))) {
        return false;
    }
    return disk.is_file(dts_file_path(file, options));
}

} // namespace stylebind::emit
