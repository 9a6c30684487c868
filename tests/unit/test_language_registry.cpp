#include "../framework/SimpleTest.hpp"
#include "scanner/LanguageRegistry.hpp"
#include <set>

using namespace debtscan::scanner;

TEST_CASE(test_registry_rust_syntax) {
    auto rust = LanguageRegistry::instance().lookup("rs");
    ASSERT_TRUE(rust.has_value());
    ASSERT_EQ(rust->name, std::string("Rust"));
    ASSERT_EQ(*rust->line_marker, std::string("//"));
    ASSERT_EQ(rust->block->open, std::string("/*"));
    ASSERT_EQ(rust->block->close, std::string("*/"));
}

TEST_CASE(test_registry_lookup_normalizes_extension) {
    const auto& registry = LanguageRegistry::instance();
    auto plain = registry.lookup("py");
    auto dotted = registry.lookup(".py");
    auto upper = registry.lookup("PY");

    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(plain == dotted);
    ASSERT_TRUE(plain == upper);
    ASSERT_EQ(*plain->line_marker, std::string("#"));
    ASSERT_FALSE(plain->block.has_value());
}

TEST_CASE(test_registry_unknown_extension) {
    const auto& registry = LanguageRegistry::instance();
    ASSERT_FALSE(registry.lookup("unknownext").has_value());
    ASSERT_FALSE(registry.lookup("").has_value());
    ASSERT_FALSE(registry.lookup_path("Makefile").has_value());
}

TEST_CASE(test_registry_lookup_path) {
    const auto& registry = LanguageRegistry::instance();
    auto cpp = registry.lookup_path("/src/project/Engine.HPP");
    ASSERT_TRUE(cpp.has_value());
    ASSERT_EQ(cpp->name, std::string("C++"));

    auto lua = registry.lookup_path("init.lua");
    ASSERT_TRUE(lua.has_value());
    ASSERT_EQ(*lua->line_marker, std::string("--"));
    ASSERT_EQ(lua->block->open, std::string("--[["));
}

TEST_CASE(test_registry_block_only_languages) {
    auto css = LanguageRegistry::instance().lookup("css");
    ASSERT_TRUE(css.has_value());
    ASSERT_FALSE(css->line_marker.has_value());
    ASSERT_TRUE(css->block.has_value());

    auto html = LanguageRegistry::instance().lookup("html");
    ASSERT_EQ(html->block->open, std::string("<!--"));
    ASSERT_EQ(html->block->close, std::string("-->"));
}

TEST_CASE(test_registry_covers_common_languages) {
    const auto& registry = LanguageRegistry::instance();
    for (const char* ext : {"rs", "go", "py", "js", "ts", "java", "c", "cpp", "rb", "sh", "sql", "hs"}) {
        ASSERT_TRUE(registry.lookup(ext).has_value());
    }
}

TEST_CASE(test_registry_extensions_unique) {
    std::set<std::string> seen;
    for (const auto& language : LanguageRegistry::instance().languages()) {
        ASSERT_FALSE(language.extensions.empty());
        for (const auto& ext : language.extensions) {
            ASSERT_TRUE(seen.insert(ext).second);
        }
    }
}

int main() {
    return debtscan::test::TestRunner::instance().run_all();
}
