#include "scanner/ScanOrchestrator.hpp"
#include "scanner/LanguageRegistry.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

namespace debtscan::scanner {

namespace {

// Everything one worker produced; merged after join
struct WorkerResult {
    std::vector<model::FindingRecord> findings;
    model::ScanStatistics statistics;
    std::vector<model::ScanError> errors;
    std::vector<model::ScanError> diagnostics;
};

bool report_order(const model::FindingRecord& a, const model::FindingRecord& b) {
    if (a.file != b.file) return a.file < b.file;
    return model::finding_position_less(a, b);
}

}  // namespace

ScanOrchestrator::ScanOrchestrator(ScanOptions options, cache::FingerprintCache* cache)
    : options_(options), cache_(cache) {}

size_t ScanOrchestrator::effective_workers(size_t requested, size_t file_count) {
    size_t workers = requested;
    if (workers == 0) {
        workers = std::thread::hardware_concurrency();
        if (workers == 0) workers = 1;
    }
    return std::max<size_t>(1, std::min(workers, file_count));
}

ScanReport ScanOrchestrator::scan(const std::vector<std::filesystem::path>& files,
                                  const ExtractionStrategy& strategy,
                                  std::stop_token external_stop) {
    const auto start = std::chrono::steady_clock::now();
    ScanReport report;

    if (files.empty()) {
        return report;
    }

    const size_t num_files = files.size();
    const size_t num_threads = effective_workers(options_.workers, num_files);

    util::Logger::info("ScanOrchestrator: Scanning " + std::to_string(num_files) +
                       " files with " + std::to_string(num_threads) + " workers (" +
                       strategy.name() + (cache_ ? ", cached" : "") + ")");

    IncrementalScanner scanner(strategy, cache_, util::LargeFileReader(options_.mmap_threshold),
                               options_.max_file_size);
    const auto& registry = LanguageRegistry::instance();
    const std::stop_token own_stop = stop_source_.get_token();

    std::atomic<size_t> work_index{0};
    std::atomic<bool> cancelled{false};
    std::vector<WorkerResult> results(num_threads);

    {
        std::vector<std::jthread> workers;
        workers.reserve(num_threads);

        for (size_t t = 0; t < num_threads; ++t) {
            workers.emplace_back([&, t](std::stop_token worker_stop) {
                WorkerResult& local = results[t];

                while (true) {
                    if (own_stop.stop_requested() || external_stop.stop_requested() ||
                        worker_stop.stop_requested()) {
                        if (work_index.load() < num_files) cancelled = true;
                        break;
                    }

                    size_t idx = work_index.fetch_add(1);
                    if (idx >= num_files) break;

                    const std::filesystem::path& path = files[idx];

                    auto syntax = registry.lookup_path(path);
                    if (!syntax) {
                        local.statistics.files_skipped++;
                        continue;
                    }

                    try {
                        FileScanResult file_result = scanner.scan_file(path, *syntax);

                        if (file_result.skipped) {
                            local.statistics.files_skipped++;
                            continue;
                        }
                        if (file_result.error) {
                            local.statistics.files_failed++;
                            local.errors.push_back(std::move(*file_result.error));
                            continue;
                        }
                        if (file_result.diagnostic) {
                            local.statistics.parse_fallbacks++;
                            local.diagnostics.push_back(std::move(*file_result.diagnostic));
                        }
                        if (file_result.from_cache) {
                            local.statistics.files_from_cache++;
                        }

                        local.statistics.record_file(file_result.findings);
                        local.findings.insert(local.findings.end(),
                                              std::make_move_iterator(file_result.findings.begin()),
                                              std::make_move_iterator(file_result.findings.end()));
                    } catch (const std::exception& e) {
                        util::Logger::error("ScanOrchestrator: Exception scanning " + path.string() +
                                            ": " + e.what());
                        local.statistics.files_failed++;
                        local.errors.push_back(model::ScanError{path.string(),
                                                                model::ErrorKind::IoError, e.what()});
                    }
                }
            });
        }

        for (auto& worker : workers) {
            worker.join();
        }
    }

    // Merge results
    for (auto& local : results) {
        report.statistics.merge(local.statistics);
        report.findings.insert(report.findings.end(),
                               std::make_move_iterator(local.findings.begin()),
                               std::make_move_iterator(local.findings.end()));
        report.errors.insert(report.errors.end(),
                             std::make_move_iterator(local.errors.begin()),
                             std::make_move_iterator(local.errors.end()));
        report.diagnostics.insert(report.diagnostics.end(),
                                  std::make_move_iterator(local.diagnostics.begin()),
                                  std::make_move_iterator(local.diagnostics.end()));
    }

    std::stable_sort(report.findings.begin(), report.findings.end(), report_order);
    auto by_file = [](const model::ScanError& a, const model::ScanError& b) { return a.file < b.file; };
    std::stable_sort(report.errors.begin(), report.errors.end(), by_file);
    std::stable_sort(report.diagnostics.begin(), report.diagnostics.end(), by_file);

    report.cancelled = cancelled.load();
    report.statistics.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    util::Logger::info("ScanOrchestrator: " + std::to_string(report.statistics.files_scanned) +
                       " scanned (" + std::to_string(report.statistics.files_from_cache) +
                       " from cache), " + std::to_string(report.statistics.files_failed) +
                       " failed, " + std::to_string(report.statistics.total_findings) +
                       " findings in " + std::to_string(report.statistics.elapsed.count()) + "ms" +
                       (report.cancelled ? " [cancelled]" : ""));
    return report;
}

}  // namespace debtscan::scanner
