#pragma once
#include <stylebind/io/file_system.h>
#include <stylebind/resolve/resolver.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stylebind::resolve {

struct NodeResolverOptions {
    // name -> replacement path, checked in order ("@styles" -> "/src/styles").
    std::vector<std::pair<std::string, std::string>> aliases;
    // Searched last, in order (sass load paths, less include paths).
    std::vector<std::string> lookup_directories;
    IgnoredPredicate is_ignored;  // empty: url::is_remote_url
};

// Resolves the way bundlers do for style sheets:
//   ignored -> file: URL -> alias -> absolute -> relative -> "#" subpath
//   import -> bare (sibling file, "~" prefix, node_modules) -> lookup dirs.
class NodeResolver : public SpecifierResolver {
public:
    NodeResolver(const io::FileSystem& fs, NodeResolverOptions options = {});

    core::FileIdentity resolve(std::string_view specifier,
                               const ResolveContext& context) const override;
    bool is_ignored(std::string_view specifier) const override;

private:
    const io::FileSystem& fs_;
    NodeResolverOptions options_;

    std::optional<std::string> resolve_path(const std::string& specifier,
                                            const std::string& base_dir,
                                            const std::string& style_ext,
                                            int alias_depth) const;
    std::optional<std::string> resolve_file(const std::string& path,
                                            const std::string& style_ext) const;
    std::optional<std::string> resolve_subpath_import(const std::string& specifier,
                                                      const std::string& base_dir,
                                                      const std::string& style_ext) const;
    std::optional<std::string> resolve_node_module(const std::string& specifier,
                                                   const std::string& base_dir,
                                                   const std::string& style_ext) const;
    std::optional<std::string> resolve_package_root(const std::string& package_dir,
                                                    const std::string& style_ext) const;
};

} // namespace stylebind::resolve
