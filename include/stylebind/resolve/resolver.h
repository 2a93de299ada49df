#pragma once
#include <stylebind/core/file_identity.h>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace stylebind::resolve {

struct ResolveContext {
    core::FileIdentity requesting_file;
};

class ResolveError : public std::runtime_error {
public:
    ResolveError(std::string specifier, const core::FileIdentity& requesting_file,
                 const std::string& reason);

    const std::string& specifier() const { return specifier_; }
    const core::FileIdentity& requesting_file() const { return requesting_file_; }
    const std::string& reason() const { return reason_; }

private:
    std::string specifier_;
    std::string reason_;
    core::FileIdentity requesting_file_;
};

// Matches specifiers the host wants skipped entirely (remote URLs by default).
using IgnoredPredicate = std::function<bool(std::string_view)>;

// Specifier + requesting file -> file identity. A specifier matching the
// ignored predicate yields FileIdentity::ignored() without touching the disk.
// Anything else that cannot be mapped to an existing file throws ResolveError.
class SpecifierResolver {
public:
    virtual ~SpecifierResolver() = default;

    virtual core::FileIdentity resolve(std::string_view specifier,
                                       const ResolveContext& context) const = 0;
    virtual bool is_ignored(std::string_view specifier) const = 0;
};

} // namespace stylebind::resolve
