#ifndef STYLEBIND_CORE_CONFIG_H
#define STYLEBIND_CORE_CONFIG_H

namespace stylebind::core::config {

inline constexpr const char kProgramName[] = "stylebind";
inline constexpr const char kVersion[] = "0.4.0";

// Relative to the working directory of the run.
inline constexpr const char kDefaultCacheFile[] = "node_modules/.cache/stylebind/cache";

inline constexpr const char kDeclarationSuffix[] = ".d.ts";
inline constexpr const char kDeclarationMapSuffix[] = ".map";

// External compilers used for the non-CSS dialects.
inline constexpr const char kSassCommand[] = "sass";
inline constexpr const char kLessCommand[] = "lessc";

}  // namespace stylebind::core::config

#endif  // STYLEBIND_CORE_CONFIG_H
