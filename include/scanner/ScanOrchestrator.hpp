#pragma once

#include "scanner/IncrementalScanner.hpp"
#include <filesystem>
#include <stop_token>

namespace debtscan::scanner {

struct ScanOptions {
    size_t workers = 0;  // 0 = hardware concurrency
    size_t mmap_threshold = util::LargeFileReader::DEFAULT_MMAP_THRESHOLD;
    uint64_t max_file_size = 0;  // 0 = unlimited
};

struct ScanReport {
    // Sorted by file path, then line and column
    std::vector<model::FindingRecord> findings;
    model::ScanStatistics statistics;
    std::vector<model::ScanError> errors;
    // Non-fatal conditions (AST fallbacks)
    std::vector<model::ScanError> diagnostics;
    bool cancelled = false;
};

/**
 * ScanOrchestrator: parallel map over a file list.
 *
 * A bounded pool of workers pulls file indices from a shared counter. Each
 * worker keeps its own findings, statistics and errors; they are merged
 * once all workers have joined. A failing file contributes one error and
 * no findings and never stops the batch.
 *
 * Cancellation is checked between files. Files finished before the stop
 * keep their findings and cache entries.
 */
class ScanOrchestrator {
public:
    explicit ScanOrchestrator(ScanOptions options = ScanOptions(),
                              cache::FingerprintCache* cache = nullptr);

    ScanReport scan(const std::vector<std::filesystem::path>& files,
                    const ExtractionStrategy& strategy,
                    std::stop_token external_stop = {});

    // Stops the running scan (and any later one) at the next file boundary
    void request_stop() { stop_source_.request_stop(); }
    bool stop_requested() const { return stop_source_.stop_requested(); }

    static size_t effective_workers(size_t requested, size_t file_count);

    const ScanOptions& options() const { return options_; }

private:
    ScanOptions options_;
    cache::FingerprintCache* cache_;
    std::stop_source stop_source_;
};

}  // namespace debtscan::scanner
