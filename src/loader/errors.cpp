#include <stylebind/loader/errors.h>

namespace stylebind::loader {

namespace {

std::string describe(const std::optional<SourceLocation>& location) {
    if (!location) return {};
    return " (" + location->file.str() + ":" + std::to_string(location->start.line) + ":" +
           std::to_string(location->start.column) + ")";
}

} // namespace

const char* load_error_kind_name(LoadErrorKind kind) {
    switch (kind) {
        case LoadErrorKind::NotFound: return "NotFound";
        case LoadErrorKind::PermissionDenied: return "PermissionDenied";
        case LoadErrorKind::TransformError: return "TransformError";
        case LoadErrorKind::ExtractionError: return "ExtractionError";
        case LoadErrorKind::UnresolvedComposesTarget: return "UnresolvedComposesTarget";
        case LoadErrorKind::CyclicComposition: return "CyclicComposition";
    }
    return "Unknown";
}

LoadError::LoadError(LoadErrorKind kind, core::FileIdentity file, const std::string& message)
    : std::runtime_error(message), kind_(kind), file_(std::move(file)) {}

LoadError LoadError::not_found(const core::FileIdentity& file, const std::string& detail) {
    return LoadError(LoadErrorKind::NotFound, file, "cannot read " + file.str() + ": " + detail);
}

LoadError LoadError::permission_denied(const core::FileIdentity& file, const std::string& detail) {
    return LoadError(LoadErrorKind::PermissionDenied, file,
                     "permission denied reading " + file.str() + ": " + detail);
}

LoadError LoadError::transform_error(const core::FileIdentity& file, const std::string& message,
                                     std::optional<SourceLocation> location) {
    LoadError error(LoadErrorKind::TransformError, file,
                    "failed to transform " + file.str() + describe(location) + ": " + message);
    error.location_ = std::move(location);
    return error;
}

LoadError LoadError::extraction_error(const core::FileIdentity& file, const std::string& message,
                                      std::optional<SourceLocation> location) {
    LoadError error(LoadErrorKind::ExtractionError, file,
                    "malformed CSS in " + file.str() + describe(location) + ": " + message);
    error.location_ = std::move(location);
    return error;
}

LoadError LoadError::unresolved_composes_target(const std::string& specifier,
                                                const core::FileIdentity& referring_file,
                                                const std::string& detail) {
    LoadError error(LoadErrorKind::UnresolvedComposesTarget, referring_file,
                    "cannot resolve '" + specifier + "' referenced from " + referring_file.str() +
                        ": " + detail);
    error.specifier_ = specifier;
    return error;
}

LoadError LoadError::cyclic_composition(const core::FileIdentity& file,
                                        std::vector<core::FileIdentity> chain) {
    std::string path;
    for (const auto& link : chain) {
        if (!path.empty()) path += " -> ";
        path += link.str();
    }
    LoadError error(LoadErrorKind::CyclicComposition, file,
                    "cyclic composition involving " + file.str() + ": " + path);
    error.chain_ = std::move(chain);
    return error;
}

} // namespace stylebind::loader
