//! # Parallel Formatting
//!
//! Formats many scripts with a pool of worker threads. Scripts are
//! independent, so every job is listed up front and workers claim the next
//! unclaimed one through a shared cursor until the list is exhausted.
//!
//! ## Components
//!
//! | Class               | Description                        |
//! |---------------------|------------------------------------|
//! | `FormatJob`         | One file and its outcome           |
//! | `FormatStats`       | Per-outcome counters               |
//! | `ParallelFormatter` | Owns the jobs and the worker pool  |
//!
//! ## Per-File Pipeline
//!
//! ```text
//! read → cache lookup → parse → format → compare → write (or report)
//! ```

#pragma once

#include "format/formatter.hpp"
#include "format_cache.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace cmscript::cli {

enum class FormatOutcome {
    Pending,
    Unchanged,       // Already formatted
    Cached,          // Skipped, cache says formatted
    Reformatted,     // Written back
    NeedsFormatting, // --check found a difference
    Failed,          // Read, parse or write error
};

const char* format_outcome_to_string(FormatOutcome outcome);

struct FormatFileOptions {
    format::FormatOptions format;
    bool check_only = false;
    bool verbose = false;
};

/// Formats one file in place (or checks it).
///
/// Parse errors are emitted through the global diagnostic emitter. `cache`
/// may be null.
FormatOutcome format_file(const fs::path& path, const FormatFileOptions& options,
                          FormatCache* cache);

/**
 * A single file to format
 */
struct FormatJob {
    fs::path file;
    FormatOutcome outcome = FormatOutcome::Pending;
};

/**
 * Formatting statistics for reporting
 */
struct FormatStats {
    std::atomic<int> total_files{0};
    std::atomic<int> unchanged{0};
    std::atomic<int> cached{0};
    std::atomic<int> reformatted{0};
    std::atomic<int> needs_formatting{0};
    std::atomic<int> failed{0};
    std::chrono::high_resolution_clock::time_point start_time;

    void reset() {
        total_files = 0;
        unchanged = 0;
        cached = 0;
        reformatted = 0;
        needs_formatting = 0;
        failed = 0;
        start_time = std::chrono::high_resolution_clock::now();
    }

    void record(FormatOutcome outcome);

    int finished() const {
        return unchanged + cached + reformatted + needs_formatting + failed;
    }

    int64_t elapsed_ms() const {
        auto now = std::chrono::high_resolution_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time).count();
    }
};

/**
 * Formats a set of files using a thread pool
 */
class ParallelFormatter {
public:
    /// `num_threads` of 0 uses the hardware concurrency.
    ParallelFormatter(unsigned num_threads, FormatFileOptions options,
                      FormatCache* cache = nullptr);

    void add_file(const fs::path& file);

    /// Formats every added file. Returns true if no file failed and, under
    /// `check_only`, no file needs formatting.
    bool run();

    const FormatStats& get_stats() const {
        return stats;
    }

    const std::vector<std::shared_ptr<FormatJob>>& get_jobs() const {
        return jobs;
    }

    unsigned thread_count() const {
        return num_threads;
    }

private:
    unsigned num_threads;
    FormatFileOptions options;
    FormatCache* cache;
    std::vector<std::shared_ptr<FormatJob>> jobs;
    std::atomic<size_t> next_job{0};
    FormatStats stats;

    /// The next job no worker has taken yet, or nullptr when all are taken.
    std::shared_ptr<FormatJob> claim_job();
    void worker_thread();
};

} // namespace cmscript::cli
