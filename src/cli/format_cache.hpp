//! # Format Cache Interface
//!
//! Remembers which files are already formatted so `cmscript fmt` can skip
//! them without parsing.
//!
//! ## Cache Keys
//!
//! Each entry maps a path (relative to the cache root) to
//! `sha256(options fingerprint + content)`. Changing the file or the
//! formatter options changes the key, so stale entries never match.
//!
//! ## File Format
//!
//! `.cmscript-cache` holds one `<hash>\t<path>` line per entry. Lines that
//! do not parse are ignored.

#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fs = std::filesystem;

namespace cmscript::cli {

/// Name of the cache file written into the formatted root.
constexpr const char* FORMAT_CACHE_FILE = ".cmscript-cache";

/// Returns "sha256:" followed by the hex digest of `data`.
std::string sha256_hex(std::string_view data);

class FormatCache {
public:
    FormatCache(fs::path root, std::string fingerprint);

    /// Reads the cache file. A missing file leaves the cache empty.
    void load();

    /// Writes the cache file if entries changed. Returns false on I/O error.
    bool save();

    /// True if `content` of `path` was recorded as formatted.
    bool is_clean(const fs::path& path, std::string_view content) const;

    /// Records `content` (already formatted) for `path`.
    void mark_clean(const fs::path& path, std::string_view content);

    size_t size() const;

    const fs::path& cache_file() const {
        return cache_file_;
    }

private:
    fs::path root_;
    fs::path cache_file_;
    std::string fingerprint_;
    std::unordered_map<std::string, std::string> entries_; // relative path -> hash
    bool dirty_ = false;
    mutable std::mutex mutex_;

    std::string key_for(const fs::path& path) const;
    std::string hash_for(std::string_view content) const;
};

} // namespace cmscript::cli
