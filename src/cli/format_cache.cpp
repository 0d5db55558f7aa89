#include "format_cache.hpp"

#include "log/log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>
#include <vector>

namespace cmscript::cli {

std::string sha256_hex(std::string_view data) {
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &sha256);

    std::ostringstream oss;
    oss << "sha256:";
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return oss.str();
}

FormatCache::FormatCache(fs::path root, std::string fingerprint)
    : root_(std::move(root)), cache_file_(root_ / FORMAT_CACHE_FILE),
      fingerprint_(std::move(fingerprint)) {}

void FormatCache::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    dirty_ = false;

    std::ifstream file(cache_file_);
    if (!file) {
        CMSCRIPT_LOG_DEBUG("cache", "No cache at " << cache_file_.string());
        return;
    }

    std::string line;
    size_t skipped = 0;
    while (std::getline(file, line)) {
        auto tab = line.find('\t');
        if (tab == std::string::npos || line.compare(0, 7, "sha256:") != 0) {
            skipped++;
            continue;
        }
        entries_[line.substr(tab + 1)] = line.substr(0, tab);
    }

    if (skipped > 0) {
        CMSCRIPT_LOG_WARN("cache", "Ignored " << skipped << " malformed lines in "
                                              << cache_file_.string());
    }
    CMSCRIPT_LOG_DEBUG("cache", "Loaded " << entries_.size() << " entries");
}

bool FormatCache::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!dirty_) {
        return true;
    }

    // Sorted output keeps the file stable between runs.
    std::vector<std::pair<std::string, std::string>> sorted(entries_.begin(), entries_.end());
    std::sort(sorted.begin(), sorted.end());

    std::ostringstream out;
    for (const auto& [path, hash] : sorted) {
        out << hash << '\t' << path << '\n';
    }

    if (!write_file(cache_file_.string(), out.str())) {
        return false;
    }
    dirty_ = false;
    return true;
}

std::string FormatCache::key_for(const fs::path& path) const {
    std::error_code ec;
    auto relative = fs::relative(path, root_, ec);
    if (ec || relative.empty()) {
        return to_forward_slashes(path.lexically_normal().string());
    }
    return to_forward_slashes(relative.string());
}

std::string FormatCache::hash_for(std::string_view content) const {
    std::string data = fingerprint_;
    data += '\n';
    data += content;
    return sha256_hex(data);
}

bool FormatCache::is_clean(const fs::path& path, std::string_view content) const {
    auto key = key_for(path);
    auto hash = hash_for(content);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && it->second == hash;
}

void FormatCache::mark_clean(const fs::path& path, std::string_view content) {
    auto key = key_for(path);
    auto hash = hash_for(content);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[key];
    if (entry != hash) {
        entry = std::move(hash);
        dirty_ = true;
    }
}

size_t FormatCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace cmscript::cli
