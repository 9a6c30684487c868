#include "scanner/LanguageRegistry.hpp"
#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace debtscan::scanner {

namespace {

LanguageSyntax c_family(std::string name, std::vector<std::string> extensions) {
    return {std::move(name), std::move(extensions), "//", BlockDelimiters{"/*", "*/"}};
}

LanguageSyntax hash_only(std::string name, std::vector<std::string> extensions) {
    return {std::move(name), std::move(extensions), "#", std::nullopt};
}

}  // namespace

const LanguageRegistry& LanguageRegistry::instance() {
    static LanguageRegistry registry;
    return registry;
}

LanguageRegistry::LanguageRegistry() {
    languages_ = {
        c_family("Rust", {"rs"}),
        c_family("Go", {"go"}),
        hash_only("Python", {"py", "pyi"}),
        c_family("JavaScript", {"js", "jsx", "mjs", "cjs"}),
        c_family("TypeScript", {"ts", "tsx", "mts", "cts"}),
        c_family("Java", {"java"}),
        c_family("C", {"c", "h"}),
        c_family("C++", {"cpp", "cxx", "cc", "hpp", "hxx", "hh", "ipp"}),
        c_family("C#", {"cs"}),
        hash_only("Ruby", {"rb", "rake"}),
        c_family("Kotlin", {"kt", "kts"}),
        c_family("Swift", {"swift"}),
        c_family("Scala", {"scala", "sc"}),
        c_family("PHP", {"php"}),
        hash_only("Shell", {"sh", "bash", "zsh"}),
        {"Lua", {"lua"}, "--", BlockDelimiters{"--[[", "]]"}},
        {"SQL", {"sql"}, "--", BlockDelimiters{"/*", "*/"}},
        {"Haskell", {"hs"}, "--", BlockDelimiters{"{-", "-}"}},
        hash_only("YAML", {"yaml", "yml"}),
        hash_only("TOML", {"toml"}),
        {"CSS", {"css"}, std::nullopt, BlockDelimiters{"/*", "*/"}},
        {"HTML", {"html", "htm", "xml"}, std::nullopt, BlockDelimiters{"<!--", "-->"}},
    };

    for (size_t i = 0; i < languages_.size(); ++i) {
        for (const auto& ext : languages_[i].extensions) {
            auto [it, inserted] = by_extension_.emplace(ext, i);
            if (!inserted) {
                util::Logger::warn("LanguageRegistry: Extension ." + ext + " claimed by both " +
                                   languages_[it->second].name + " and " + languages_[i].name);
            }
        }
    }

    util::Logger::debug("LanguageRegistry: " + std::to_string(languages_.size()) + " languages, " +
                        std::to_string(by_extension_.size()) + " extensions");
}

std::optional<LanguageSyntax> LanguageRegistry::lookup(const std::string& extension) const {
    std::string key = extension;
    if (!key.empty() && key[0] == '.') {
        key = key.substr(1);
    }
    std::transform(key.begin(), key.end(), key.begin(), ::tolower);

    auto it = by_extension_.find(key);
    if (it == by_extension_.end()) {
        return std::nullopt;
    }
    return languages_[it->second];
}

std::optional<LanguageSyntax> LanguageRegistry::lookup_path(const std::filesystem::path& path) const {
    auto ext = util::Platform::get_extension(path);
    if (ext.empty()) {
        return std::nullopt;
    }
    return lookup(ext);
}

}  // namespace debtscan::scanner
