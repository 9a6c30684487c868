#pragma once

#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <filesystem>

namespace debtscan::scanner {

struct BlockDelimiters {
    std::string open;
    std::string close;

    bool operator==(const BlockDelimiters&) const = default;
};

// Comment syntax of one language. Block comments never nest: the first
// close delimiter terminates the comment.
struct LanguageSyntax {
    std::string name;
    std::vector<std::string> extensions;
    std::optional<std::string> line_marker;
    std::optional<BlockDelimiters> block;

    bool operator==(const LanguageSyntax&) const = default;
};

/**
 * Static extension -> comment syntax table.
 *
 * Built once on first use and never mutated afterwards, so concurrent
 * lookups from scan workers need no synchronization.
 */
class LanguageRegistry {
public:
    static const LanguageRegistry& instance();

    // Case-insensitive, leading dot optional ("RS", ".rs" and "rs" are equal)
    [[nodiscard]] std::optional<LanguageSyntax> lookup(const std::string& extension) const;
    [[nodiscard]] std::optional<LanguageSyntax> lookup_path(const std::filesystem::path& path) const;

    const std::vector<LanguageSyntax>& languages() const { return languages_; }

private:
    LanguageRegistry();
    LanguageRegistry(const LanguageRegistry&) = delete;
    LanguageRegistry& operator=(const LanguageRegistry&) = delete;

    std::vector<LanguageSyntax> languages_;
    std::unordered_map<std::string, size_t> by_extension_;  // extension -> index into languages_
};

}  // namespace debtscan::scanner
