#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <cstdint>
#include <optional>

namespace debtscan::model {

enum class Priority {
    Low,
    Medium,
    High,
    Critical,
};

enum class TagKind {
    Todo,
    Fixme,
    Hack,
    Bug,
    Xxx,
    Custom,
};

// Tag as it appeared in source. Custom tags keep their spelling in `name`;
// built-in kinds carry their canonical uppercase name.
struct Tag {
    TagKind kind = TagKind::Todo;
    std::string name = "TODO";

    static Tag from_name(const std::string& name);
    const std::string& as_str() const { return name; }

    bool operator==(const Tag&) const = default;
};

enum class SpanKind {
    Line,
    Block,
};

// Contiguous range of comment text found by the baseline scanner.
// Lines are 1-based, columns and offsets 0-based, end is exclusive.
struct CommentSpan {
    SpanKind kind = SpanKind::Line;
    size_t start_line = 1;
    size_t start_column = 0;
    size_t end_line = 1;
    size_t end_column = 0;
    size_t start_offset = 0;
    size_t end_offset = 0;

    bool operator==(const CommentSpan&) const = default;
};

struct FindingRecord {
    Tag tag;
    std::string message;
    std::string file;
    size_t line = 1;     // 1-based
    size_t column = 0;   // 0-based byte offset within the line
    std::optional<std::string> author;
    std::optional<std::string> issue;
    std::optional<Priority> priority;
    std::string context_line;

    bool operator==(const FindingRecord&) const = default;
};

struct FileFingerprint {
    int64_t mtime_ns = 0;
    uint64_t size = 0;

    bool operator==(const FileFingerprint&) const = default;
};

enum class ErrorKind {
    IoError,
    EncodingError,
    ParseError,
    CacheError,
};

struct ScanError {
    std::string file;
    ErrorKind kind = ErrorKind::IoError;
    std::string message;
};

struct ScanStatistics {
    size_t files_scanned = 0;
    size_t files_with_findings = 0;
    size_t files_from_cache = 0;
    size_t files_skipped = 0;
    size_t files_failed = 0;
    size_t parse_fallbacks = 0;  // AST layer kept baseline candidates
    size_t total_findings = 0;
    std::map<std::string, size_t> by_tag;
    std::chrono::milliseconds elapsed{0};

    // Associative, order-independent merge
    void merge(const ScanStatistics& other);
    void record_file(const std::vector<FindingRecord>& findings);

    bool same_counts(const ScanStatistics& other) const;
};

// Conversions shared by the extractor, the cache codec and the driver
std::optional<Priority> priority_from_string(const std::string& text);
const char* priority_to_string(Priority priority);
const char* error_kind_to_string(ErrorKind kind);

// Orders by line, then column
bool finding_position_less(const FindingRecord& a, const FindingRecord& b);

}  // namespace debtscan::model
