#include "../framework/SimpleTest.hpp"
#include "util/BoyerMoore.hpp"
#include "util/UnicodeUtils.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "model/Finding.hpp"
#include "scanner/TagVocabulary.hpp"
#include <string>

using namespace debtscan;
using namespace debtscan::util;

TEST_CASE(test_boyer_moore_search) {
    BoyerMooreSearch bms("needle");

    std::string text = "haystack needle haystack";
    ASSERT_EQ(bms.search(text), 9u);
}

TEST_CASE(test_boyer_moore_search_not_found) {
    BoyerMooreSearch bms("gold");
    ASSERT_EQ(bms.search("haystack needle haystack"), BoyerMooreSearch::npos);
    ASSERT_EQ(bms.search(""), BoyerMooreSearch::npos);
}

TEST_CASE(test_boyer_moore_start_position) {
    BoyerMooreSearch bms("TODO");
    std::string text = "TODO and TODO";
    ASSERT_EQ(bms.search(text, 0), 0u);
    ASSERT_EQ(bms.search(text, 1), 9u);
    ASSERT_EQ(bms.search(text, 10), BoyerMooreSearch::npos);
    ASSERT_EQ(bms.search(text, 100), BoyerMooreSearch::npos);
}

TEST_CASE(test_boyer_moore_case_sensitivity) {
    BoyerMooreSearch exact("TODO");
    BoyerMooreSearch folded("TODO", false);

    ASSERT_EQ(exact.search("a todo here"), BoyerMooreSearch::npos);
    ASSERT_EQ(folded.search("a todo here"), 2u);
    ASSERT_TRUE(exact.case_sensitive());
    ASSERT_FALSE(folded.case_sensitive());
}

TEST_CASE(test_check_text) {
    size_t offset = 0;
    ASSERT_TRUE(check_text("plain ascii") == TextCheck::Ok);
    ASSERT_TRUE(check_text("caf\xC3\xA9 \xE2\x9C\x93") == TextCheck::Ok);

    ASSERT_TRUE(check_text("ab\xFF" "cd", &offset) == TextCheck::InvalidUtf8);
    ASSERT_EQ(offset, 2u);

    // Overlong encoding of '/'
    ASSERT_TRUE(check_text("\xC0\xAF") == TextCheck::InvalidUtf8);

    std::string with_nul("abc\0def", 7);
    ASSERT_TRUE(check_text(with_nul, &offset) == TextCheck::ContainsNul);
    ASSERT_EQ(offset, 3u);
}

TEST_CASE(test_unicode_case_helpers) {
    ASSERT_EQ(to_upper("todo"), std::string("TODO"));
    ASSERT_EQ(to_upper("straße"), std::string("STRASSE"));
    ASSERT_TRUE(equals_ignore_case("FixMe", "FIXME"));
    ASSERT_FALSE(equals_ignore_case("FIX", "FIXME"));
}

TEST_CASE(test_platform_extension) {
    ASSERT_EQ(Platform::get_extension("src/Main.RS"), std::string("rs"));
    ASSERT_EQ(Platform::get_extension("archive.tar.gz"), std::string("gz"));
    ASSERT_EQ(Platform::get_extension("Makefile"), std::string(""));
}

TEST_CASE(test_logger_parse_level) {
    ASSERT_TRUE(Logger::parse_level("debug") == Logger::Level::Debug);
    ASSERT_TRUE(Logger::parse_level("WARNING") == Logger::Level::Warn);
    ASSERT_TRUE(Logger::parse_level("error") == Logger::Level::Error);
    ASSERT_TRUE(Logger::parse_level("bogus") == Logger::Level::Info);
}

TEST_CASE(test_priority_strings) {
    ASSERT_TRUE(*model::priority_from_string("p:critical") == model::Priority::Critical);
    ASSERT_TRUE(*model::priority_from_string("HIGH") == model::Priority::High);
    ASSERT_TRUE(*model::priority_from_string("med") == model::Priority::Medium);
    ASSERT_TRUE(*model::priority_from_string("p3") == model::Priority::Low);
    ASSERT_FALSE(model::priority_from_string("urgent-ish").has_value());
    ASSERT_EQ(std::string(model::priority_to_string(model::Priority::Medium)), std::string("medium"));
}

TEST_CASE(test_tag_from_name) {
    ASSERT_TRUE(model::Tag::from_name("FIXME").kind == model::TagKind::Fixme);
    ASSERT_TRUE(model::Tag::from_name("xxx").kind == model::TagKind::Xxx);
    auto custom = model::Tag::from_name("Review");
    ASSERT_TRUE(custom.kind == model::TagKind::Custom);
    ASSERT_EQ(custom.as_str(), std::string("Review"));
}

TEST_CASE(test_statistics_merge_is_order_independent) {
    model::FindingRecord todo;
    todo.tag = model::Tag::from_name("TODO");
    model::FindingRecord hack;
    hack.tag = model::Tag::from_name("HACK");

    model::ScanStatistics a, b, c;
    a.record_file({todo, todo});
    b.record_file({});
    b.files_failed = 1;
    c.record_file({hack});
    c.files_skipped = 2;

    model::ScanStatistics left = a;
    left.merge(b);
    left.merge(c);

    model::ScanStatistics right = c;
    model::ScanStatistics bc = b;
    bc.merge(a);
    right.merge(bc);

    ASSERT_TRUE(left.same_counts(right));
    ASSERT_EQ(left.files_scanned, 3u);
    ASSERT_EQ(left.files_with_findings, 2u);
    ASSERT_EQ(left.total_findings, 3u);
    ASSERT_EQ(left.by_tag["TODO"], 2u);
    ASSERT_EQ(left.files_skipped, 2u);
}

TEST_CASE(test_vocabulary_normalization) {
    scanner::TagVocabulary vocabulary({"todo", "TODO", "fix", "FIXME", ""}, false);
    ASSERT_EQ(vocabulary.tags().size(), 3u);
    ASSERT_EQ(vocabulary.tags()[0], std::string("FIXME"));
    ASSERT_EQ(vocabulary.signature(), std::string("ci:FIX,FIXME,TODO"));

    scanner::TagVocabulary exact;
    ASSERT_TRUE(exact.case_sensitive());
    ASSERT_EQ(exact.tags().size(), 5u);
}

int main() {
    return debtscan::test::TestRunner::instance().run_all();
}
