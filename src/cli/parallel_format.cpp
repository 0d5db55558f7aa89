//! # Parallel Formatting Implementation
//!
//! ## Architecture
//!
//! ```text
//! ParallelFormatter::run()
//!   ├─ rewind the job cursor
//!   ├─ start min(jobs, threads) workers
//!   │    └─ worker_thread(): claim_job() → format_file() → stats.record()
//!   └─ join workers
//! ```
//!
//! Workers share the `FormatCache` (internally locked) and the global
//! diagnostic emitter (serialized per diagnostic).

#include "parallel_format.hpp"

#include "diagnostic.hpp"
#include "lexer/source.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"
#include "utils.hpp"

#include <algorithm>
#include <thread>

namespace cmscript::cli {

const char* format_outcome_to_string(FormatOutcome outcome) {
    switch (outcome) {
    case FormatOutcome::Pending:
        return "pending";
    case FormatOutcome::Unchanged:
        return "unchanged";
    case FormatOutcome::Cached:
        return "cached";
    case FormatOutcome::Reformatted:
        return "reformatted";
    case FormatOutcome::NeedsFormatting:
        return "needs formatting";
    case FormatOutcome::Failed:
        return "failed";
    }
    return "unknown";
}

// ============================================================================
// Single File
// ============================================================================

FormatOutcome format_file(const fs::path& path, const FormatFileOptions& options,
                          FormatCache* cache) {
    auto& diag = get_diagnostic_emitter();
    auto display = to_forward_slashes(path.string());

    auto loaded = lexer::Source::from_file(path.string());
    if (is_err(loaded)) {
        diag.error(ErrorCodes::FILE_NOT_FOUND, unwrap_err(loaded));
        return FormatOutcome::Failed;
    }
    const auto& source = unwrap(loaded);
    std::string content(source.content());

    if (cache && cache->is_clean(path, content)) {
        CMSCRIPT_LOG_DEBUG("fmt", display << " is cached as formatted");
        return FormatOutcome::Cached;
    }

    auto formatted = format::format_source(content, options.format);
    if (is_err(formatted)) {
        diag.syntax_error(display, content, unwrap_err(formatted));
        return FormatOutcome::Failed;
    }
    const auto& result = unwrap(formatted);

    if (result == content) {
        if (cache) {
            cache->mark_clean(path, content);
        }
        if (options.verbose) {
            CMSCRIPT_LOG_INFO("fmt", display << " is correctly formatted");
        }
        return FormatOutcome::Unchanged;
    }

    if (options.check_only) {
        CMSCRIPT_LOG_WARN("fmt", display << " would be reformatted");
        return FormatOutcome::NeedsFormatting;
    }

    if (!write_file(path.string(), result)) {
        diag.error(ErrorCodes::IO_ERROR, "Cannot write to " + display);
        return FormatOutcome::Failed;
    }
    if (cache) {
        cache->mark_clean(path, result);
    }

    CMSCRIPT_LOG_INFO("fmt", "Formatted " << display);
    return FormatOutcome::Reformatted;
}

// ============================================================================
// FormatStats
// ============================================================================

void FormatStats::record(FormatOutcome outcome) {
    switch (outcome) {
    case FormatOutcome::Unchanged:
        unchanged++;
        break;
    case FormatOutcome::Cached:
        cached++;
        break;
    case FormatOutcome::Reformatted:
        reformatted++;
        break;
    case FormatOutcome::NeedsFormatting:
        needs_formatting++;
        break;
    case FormatOutcome::Pending:
    case FormatOutcome::Failed:
        failed++;
        break;
    }
}

// ============================================================================
// ParallelFormatter
// ============================================================================

ParallelFormatter::ParallelFormatter(unsigned num_threads, FormatFileOptions options,
                                     FormatCache* cache)
    : num_threads(num_threads), options(std::move(options)), cache(cache) {
    if (this->num_threads == 0) {
        this->num_threads = std::max(1u, std::thread::hardware_concurrency());
    }
}

void ParallelFormatter::add_file(const fs::path& file) {
    auto job = std::make_shared<FormatJob>();
    job->file = file;
    jobs.push_back(std::move(job));
}

bool ParallelFormatter::run() {
    stats.reset();
    stats.total_files = static_cast<int>(jobs.size());
    if (jobs.empty()) {
        return true;
    }

    next_job = 0;

    auto actual_threads = std::min(static_cast<unsigned>(jobs.size()), num_threads);
    CMSCRIPT_LOG_DEBUG("fmt", "Formatting " << jobs.size() << " files with " << actual_threads
                                            << " threads");

    std::vector<std::thread> workers;
    for (unsigned i = 0; i < actual_threads; ++i) {
        workers.emplace_back(&ParallelFormatter::worker_thread, this);
    }
    for (auto& worker : workers) {
        worker.join();
    }

    CMSCRIPT_LOG_DEBUG("fmt", "Finished " << stats.finished() << " files in "
                                          << stats.elapsed_ms() << " ms");

    return stats.failed == 0 && stats.needs_formatting == 0;
}

std::shared_ptr<FormatJob> ParallelFormatter::claim_job() {
    auto index = next_job.fetch_add(1);
    if (index >= jobs.size()) {
        return nullptr;
    }
    return jobs[index];
}

void ParallelFormatter::worker_thread() {
    while (auto job = claim_job()) {
        job->outcome = format_file(job->file, options, cache);
        stats.record(job->outcome);
    }
}

} // namespace cmscript::cli
