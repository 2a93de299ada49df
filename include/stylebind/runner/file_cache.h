#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace stylebind::runner {

enum class CacheStrategy { Content, Metadata };

std::optional<CacheStrategy> parse_cache_strategy(std::string_view name);

// Lower-case hex SHA-256 of `data`.
std::string sha256_hex(std::string_view data);

// Remembers a fingerprint of every top-level file between runs so unchanged
// files can be skipped. The state file starts with a key; a different key
// (new version or different options) discards the stored fingerprints.
class FileCache {
public:
    FileCache(std::string state_file, CacheStrategy strategy, std::string key, bool enabled = true);

    // Reads the state file. Missing, unreadable or stale state starts empty.
    void load();

    // True when the file differs from the last reconciled run, or when
    // caching is disabled. Throws std::system_error if the file cannot be
    // read or stat'ed.
    bool is_changed(const std::string& file);
    // Keeps the previous fingerprint of a file that failed this run.
    void forget(const std::string& file);

    // Persists the fingerprints seen this run. Throws std::system_error.
    void reconcile();

    static std::string fingerprint(const std::string& file, CacheStrategy strategy);

    const std::string& state_file() const { return state_file_; }
    bool enabled() const { return enabled_; }

private:
    std::string state_file_;
    CacheStrategy strategy_;
    std::string key_;
    bool enabled_;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> stored_;
    std::map<std::string, std::string> seen_;
};

} // namespace stylebind::runner
