#include "model/Finding.hpp"
#include <algorithm>
#include <cctype>

namespace debtscan::model {

Tag Tag::from_name(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "TODO") return {TagKind::Todo, "TODO"};
    if (upper == "FIXME") return {TagKind::Fixme, "FIXME"};
    if (upper == "HACK") return {TagKind::Hack, "HACK"};
    if (upper == "BUG") return {TagKind::Bug, "BUG"};
    if (upper == "XXX") return {TagKind::Xxx, "XXX"};
    return {TagKind::Custom, name};
}

std::optional<Priority> priority_from_string(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower.starts_with("p:")) {
        lower = lower.substr(2);
    }

    if (lower == "low" || lower == "p3") return Priority::Low;
    if (lower == "medium" || lower == "med" || lower == "p2") return Priority::Medium;
    if (lower == "high" || lower == "p1") return Priority::High;
    if (lower == "critical" || lower == "crit" || lower == "p0") return Priority::Critical;
    return std::nullopt;
}

const char* priority_to_string(Priority priority) {
    switch (priority) {
        case Priority::Low: return "low";
        case Priority::Medium: return "medium";
        case Priority::High: return "high";
        case Priority::Critical: return "critical";
    }
    return "low";
}

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IoError: return "io";
        case ErrorKind::EncodingError: return "encoding";
        case ErrorKind::ParseError: return "parse";
        case ErrorKind::CacheError: return "cache";
    }
    return "io";
}

bool finding_position_less(const FindingRecord& a, const FindingRecord& b) {
    if (a.line != b.line) return a.line < b.line;
    return a.column < b.column;
}

void ScanStatistics::merge(const ScanStatistics& other) {
    files_scanned += other.files_scanned;
    files_with_findings += other.files_with_findings;
    files_from_cache += other.files_from_cache;
    files_skipped += other.files_skipped;
    files_failed += other.files_failed;
    parse_fallbacks += other.parse_fallbacks;
    total_findings += other.total_findings;
    for (const auto& [tag, count] : other.by_tag) {
        by_tag[tag] += count;
    }
}

void ScanStatistics::record_file(const std::vector<FindingRecord>& findings) {
    files_scanned++;
    if (!findings.empty()) {
        files_with_findings++;
    }
    total_findings += findings.size();
    for (const auto& finding : findings) {
        by_tag[finding.tag.as_str()]++;
    }
}

bool ScanStatistics::same_counts(const ScanStatistics& other) const {
    return files_scanned == other.files_scanned &&
           files_with_findings == other.files_with_findings &&
           files_skipped == other.files_skipped &&
           files_failed == other.files_failed &&
           total_findings == other.total_findings &&
           by_tag == other.by_tag;
}

}  // namespace debtscan::model
