#pragma once
#include <stylebind/loader/types.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace stylebind::loader {

enum class LoadErrorKind {
    NotFound,
    PermissionDenied,
    TransformError,
    ExtractionError,
    UnresolvedComposesTarget,
    CyclicComposition,
};

const char* load_error_kind_name(LoadErrorKind kind);

// Every failure of DependencyGraphLoader::load. One class for all kinds so
// the error survives being copied between tasks.
class LoadError : public std::runtime_error {
public:
    static LoadError not_found(const core::FileIdentity& file, const std::string& detail);
    static LoadError permission_denied(const core::FileIdentity& file, const std::string& detail);
    static LoadError transform_error(const core::FileIdentity& file, const std::string& message,
                                     std::optional<SourceLocation> location);
    static LoadError extraction_error(const core::FileIdentity& file, const std::string& message,
                                      std::optional<SourceLocation> location);
    static LoadError unresolved_composes_target(const std::string& specifier,
                                                const core::FileIdentity& referring_file,
                                                const std::string& detail);
    // `chain` runs from the outermost file to the repeated one.
    static LoadError cyclic_composition(const core::FileIdentity& file,
                                        std::vector<core::FileIdentity> chain);

    LoadErrorKind kind() const { return kind_; }
    // The file whose load failed (the referring file for unresolved targets).
    const core::FileIdentity& file() const { return file_; }
    const std::string& specifier() const { return specifier_; }
    const std::vector<core::FileIdentity>& chain() const { return chain_; }
    const std::optional<SourceLocation>& location() const { return location_; }

    // Files that were loading the failed one, innermost first.
    const std::vector<core::FileIdentity>& trail() const { return trail_; }
    void add_trail(const core::FileIdentity& file) { trail_.push_back(file); }

private:
    LoadError(LoadErrorKind kind, core::FileIdentity file, const std::string& message);

    LoadErrorKind kind_;
    core::FileIdentity file_;
    std::string specifier_;
    std::vector<core::FileIdentity> chain_;
    std::optional<SourceLocation> location_;
    std::vector<core::FileIdentity> trail_;
};

} // namespace stylebind::loader
