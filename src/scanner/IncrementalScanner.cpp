#include "scanner/IncrementalScanner.hpp"
#include "util/Logger.hpp"
#include <sys/stat.h>
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace debtscan::scanner {

IncrementalScanner::IncrementalScanner(const ExtractionStrategy& strategy,
                                       cache::FingerprintCache* cache,
                                       util::LargeFileReader reader,
                                       uint64_t max_file_size)
    : strategy_(strategy), cache_(cache), reader_(reader), max_file_size_(max_file_size) {}

std::optional<model::FileFingerprint> IncrementalScanner::fingerprint_of(const fs::path& path,
                                                                         std::string* error) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        if (error) *error = "stat failed: " + std::string(std::strerror(errno));
        return std::nullopt;
    }
    if (!S_ISREG(st.st_mode)) {
        if (error) *error = "not a regular file";
        return std::nullopt;
    }

    model::FileFingerprint fp;
    fp.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
                  static_cast<int64_t>(st.st_mtim.tv_nsec);
    fp.size = static_cast<uint64_t>(st.st_size);
    return fp;
}

std::string IncrementalScanner::cache_schema_version(const ExtractionStrategy& strategy) {
    return std::string(cache::FingerprintCache::CURRENT_SCHEMA_VERSION) + "/" + strategy.signature();
}

std::string IncrementalScanner::cache_key(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        return path.lexically_normal().string();
    }
    return absolute.lexically_normal().string();
}

FileScanResult IncrementalScanner::scan_file(const fs::path& path,
                                             const LanguageSyntax& syntax) const {
    FileScanResult result;
    result.path = path.string();

    std::string stat_error;
    auto fingerprint = fingerprint_of(path, &stat_error);
    if (!fingerprint) {
        result.error = model::ScanError{result.path, model::ErrorKind::IoError, stat_error};
        return result;
    }

    if (max_file_size_ > 0 && fingerprint->size > max_file_size_) {
        util::Logger::debug("IncrementalScanner: Skipping " + result.path + " (" +
                            std::to_string(fingerprint->size) + " bytes)");
        result.skipped = true;
        return result;
    }

    const bool use_cache = cache_ && cache_->is_open();
    const std::string key = use_cache ? cache_key(path) : std::string();

    if (use_cache && cache_->is_fresh(key, *fingerprint)) {
        auto entry = cache_->get(key);
        if (entry && entry->fingerprint == *fingerprint) {
            result.findings = std::move(entry->findings);
            // Entry may have been written under a different spelling of the path
            for (auto& finding : result.findings) {
                finding.file = result.path;
            }
            result.from_cache = true;
            return result;
        }
    }

    util::FileContent content = reader_.read(path);
    if (!content.is_valid) {
        result.error = model::ScanError{result.path, model::ErrorKind::IoError, content.error_message};
        return result;
    }

    ExtractionResult extracted = strategy_.extract(result.path, content.view(), syntax);
    if (extracted.error) {
        result.error = std::move(extracted.error);
        return result;
    }
    result.findings = std::move(extracted.findings);
    result.diagnostic = std::move(extracted.diagnostic);

    if (use_cache) {
        // Content changed while we read it: the findings belong to neither fingerprint
        auto after = fingerprint_of(path);
        if (!after || !(*after == *fingerprint)) {
            util::Logger::debug("IncrementalScanner: " + result.path +
                                " changed during scan, not caching");
        } else if (!cache_->put(key, *fingerprint, result.findings)) {
            util::Logger::warn("IncrementalScanner: Could not cache findings for " + result.path);
        }
    }

    return result;
}

}  // namespace debtscan::scanner
