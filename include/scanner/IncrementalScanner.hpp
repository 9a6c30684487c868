#pragma once

#include "cache/FingerprintCache.hpp"
#include "scanner/ExtractionStrategy.hpp"
#include "util/LargeFileReader.hpp"
#include <filesystem>

namespace debtscan::scanner {

struct FileScanResult {
    std::string path;
    std::vector<model::FindingRecord> findings;
    std::optional<model::ScanError> error;
    std::optional<model::ScanError> diagnostic;
    bool from_cache = false;
    bool skipped = false;  // larger than max_file_size
};

/**
 * IncrementalScanner: per-file scan backed by the fingerprint cache.
 *
 * A file whose (mtime, size) and schema version match its cache entry is
 * answered from the cache without reading content. Anything else is read,
 * extracted and written back. The cache is optional; without one every
 * file is scanned. Cache write failures are logged and never fail a file.
 */
class IncrementalScanner {
public:
    IncrementalScanner(const ExtractionStrategy& strategy,
                       cache::FingerprintCache* cache,
                       util::LargeFileReader reader = util::LargeFileReader(),
                       uint64_t max_file_size = 0);

    [[nodiscard]] FileScanResult scan_file(const std::filesystem::path& path,
                                           const LanguageSyntax& syntax) const;

    // (mtime in ns, size) from stat(2); empty when the file cannot be stat'ed
    static std::optional<model::FileFingerprint> fingerprint_of(const std::filesystem::path& path,
                                                                std::string* error = nullptr);

    // Store-level schema version for a cache shared with `strategy`
    static std::string cache_schema_version(const ExtractionStrategy& strategy);

    // Cache key: absolute, lexically normalized path
    static std::string cache_key(const std::filesystem::path& path);

    const ExtractionStrategy& strategy() const { return strategy_; }
    cache::FingerprintCache* cache() const { return cache_; }

private:
    const ExtractionStrategy& strategy_;
    cache::FingerprintCache* cache_;
    util::LargeFileReader reader_;
    uint64_t max_file_size_;  // 0 = unlimited
};

}  // namespace debtscan::scanner
