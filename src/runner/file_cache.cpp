#include <stylebind/runner/file_cache.h>
#include <stylebind/io/file_system.h>

#include <openssl/evp.h>

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace stylebind::runner {

namespace fs = std::filesystem;

std::optional<CacheStrategy> parse_cache_strategy(std::string_view name) {
    if (name == "content") return CacheStrategy::Content;
    if (name == "metadata") return CacheStrategy::Metadata;
    return std::nullopt;
}

std::string sha256_hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    static const char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += kHex[digest[i] >> 4];
        hex += kHex[digest[i] & 0x0f];
    }
    return hex;
}

FileCache::FileCache(std::string state_file, CacheStrategy strategy, std::string key, bool enabled)
    : state_file_(std::move(state_file)), strategy_(strategy), key_(std::move(key)),
      enabled_(enabled) {}

void FileCache::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    stored_.clear();
    if (!enabled_) return;

    io::DiskFileSystem disk;
    if (!disk.is_file(state_file_)) return;
    std::string content;
    try {
        content = disk.read_file(state_file_);
    } catch (const std::system_error&) {
        // Unreadable state counts as empty.
        return;
    }

    std::istringstream in(content);
    std::string line;
    if (!std::getline(in, line) || line != key_) return;
    while (std::getline(in, line)) {
        size_t tab = line.find('\t');
        if (tab == std::string::npos) continue;
        stored_[line.substr(tab + 1)] = line.substr(0, tab);
    }
}

bool FileCache::is_changed(const std::string& file) {
    if (!enabled_) return true;
    std::string current = fingerprint(file, strategy_);
    std::lock_guard<std::mutex> lock(mutex_);
    seen_[file] = current;
    auto it = stored_.find(file);
    return it == stored_.end() || it->second != current;
}

void FileCache::forget(const std::string& file) {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_.erase(file);
}

void FileCache::reconcile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) return;
    for (auto& [file, value] : seen_) {
        stored_[file] = value;
    }
    seen_.clear();

    std::string content = key_ + "\n";
    for (const auto& [file, value] : stored_) {
        content += value + "\t" + file + "\n";
    }
    io::write_file_if_changed(state_file_, content);
}

std::string FileCache::fingerprint(const std::string& file, CacheStrategy strategy) {
    if (strategy == CacheStrategy::Content) {
        io::DiskFileSystem disk;
        return sha256_hex(disk.read_file(file));
    }
    std::error_code ec;
    auto mtime = fs::last_write_time(file, ec);
    if (ec) throw std::system_error(ec, "cannot stat " + file);
    auto size = fs::file_size(file, ec);
    if (ec) throw std::system_error(ec, "cannot stat " + file);
    return std::to_string(mtime.time_since_epoch().count()) + ":" + std::to_string(size);
}

} // namespace stylebind::runner
