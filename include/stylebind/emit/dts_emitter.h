#pragma once
#include <stylebind/emit/naming.h>
#include <stylebind/loader/types.h>
#include <functional>
#include <optional>
#include <string>

namespace stylebind::emit {

struct DtsOptions {
    LocalsConvention locals_convention = LocalsConvention::AsIs;
    bool declaration_map = false;
    // "x.d.css.ts" instead of "x.css.d.ts".
    bool arbitrary_extensions = false;
    // When set, outputs mirror their path relative to root_dir under out_dir.
    std::optional<std::string> out_dir;
    std::string root_dir;
};

struct DtsOutput {
    std::string dts_path;
    std::string map_path;
    std::string dts_content;   // includes the sourceMappingURL comment when maps are on
    std::string map_content;   // empty when maps are off
};

// Files whose declarations are not generated by this run (node_modules etc.)
// are inlined rather than imported.
using ExternalFilePredicate = std::function<bool(const core::FileIdentity&)>;

std::string dts_file_path(const std::string& file, const DtsOptions& options);
std::string source_map_file_path(const std::string& file, const DtsOptions& options);

// "./x" / "../x" path of `to_file` as seen from the directory of `from_file`.
std::string relative_path(const std::string& from_file, const std::string& to_file);

DtsOutput generate_dts(const core::FileIdentity& file, const loader::LoadResult& result,
                       const DtsOptions& options, const ExternalFilePredicate& is_external);

// Writes the outputs of generate_dts, skipping unchanged files. Returns true
// if anything was written. Throws std::system_error.
bool emit_generated_files(const DtsOutput& output, const DtsOptions& options);

bool generated_files_exist(const std::string& file, const DtsOptions& options);

} // namespace stylebind::emit
