#pragma once

#include "model/Finding.hpp"
#include "scanner/LanguageRegistry.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace debtscan::scanner {

struct ExtractionResult {
    // Ordered by line, then column
    std::vector<model::FindingRecord> findings;

    // Set when the file could not be scanned at all; findings is then empty
    std::optional<model::ScanError> error;

    // Non-fatal condition worth reporting (e.g. AST parse fallback)
    std::optional<model::ScanError> diagnostic;
};

/**
 * Capability shared by the baseline scanner and the AST-verified scanner:
 * produce findings for one file's content. Implementations are stateless
 * with respect to files and are called concurrently from scan workers.
 */
class ExtractionStrategy {
public:
    virtual ~ExtractionStrategy() = default;

    virtual ExtractionResult extract(const std::string& file,
                                     std::string_view content,
                                     const LanguageSyntax& syntax) const = 0;

    virtual std::string name() const = 0;

    // Identifies everything that affects the output; cached findings are
    // only reused under the same signature
    virtual std::string signature() const { return name(); }
};

}  // namespace debtscan::scanner
