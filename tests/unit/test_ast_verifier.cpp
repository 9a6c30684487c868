#include "../framework/SimpleTest.hpp"
#include "scanner/AstCommentVerifier.hpp"
#include "scanner/LanguageRegistry.hpp"

using namespace debtscan;
using namespace debtscan::scanner;

namespace {

LanguageSyntax syntax_for(const std::string& ext) {
    return *LanguageRegistry::instance().lookup(ext);
}

}  // namespace

TEST_CASE(test_ast_filters_string_literal_candidates) {
    std::string content =
        "fn main() {\n"
        "    let s = \"// TODO not a comment\";\n"
        "    // TODO: real one\n"
        "}\n";

    AstCommentVerifier verifier;
    auto baseline = CommentExtractor().extract("main.rs", content, syntax_for("rs"));
    ASSERT_EQ(baseline.findings.size(), 2u);

    auto result = verifier.extract("main.rs", content, syntax_for("rs"));
    ASSERT_FALSE(result.error.has_value());
    ASSERT_FALSE(result.diagnostic.has_value());
    ASSERT_EQ(result.findings.size(), 1u);
    ASSERT_EQ(result.findings[0].line, 3u);
    ASSERT_EQ(result.findings[0].message, std::string("real one"));
}

TEST_CASE(test_ast_findings_are_subset_of_baseline) {
    std::string content =
        "# TODO: comment\n"
        "x = \"# FIXME inside string\"\n"
        "def f():\n"
        "    pass  # HACK: trailing\n";

    auto baseline = CommentExtractor().extract("a.py", content, syntax_for("py"));
    auto verified = AstCommentVerifier().extract("a.py", content, syntax_for("py"));

    ASSERT_EQ(baseline.findings.size(), 3u);
    ASSERT_EQ(verified.findings.size(), 2u);
    for (const auto& f : verified.findings) {
        bool found = false;
        for (const auto& b : baseline.findings) {
            if (b == f) found = true;
        }
        ASSERT_TRUE(found);
    }
}

TEST_CASE(test_ast_fails_open_without_grammar) {
    std::string content = "var s = \"// TODO in string\"; // FIXME: real\n";
    ASSERT_FALSE(AstCommentVerifier::has_grammar("C#"));

    auto baseline = CommentExtractor().extract("a.cs", content, syntax_for("cs"));
    auto result = AstCommentVerifier().extract("a.cs", content, syntax_for("cs"));

    ASSERT_TRUE(result.findings == baseline.findings);
    ASSERT_TRUE(result.diagnostic.has_value());
    ASSERT_TRUE(result.diagnostic->kind == model::ErrorKind::ParseError);
    ASSERT_FALSE(result.error.has_value());
}

TEST_CASE(test_ast_filters_despite_syntax_errors) {
    std::string content =
        "fn broken( {\n"
        "    let s = \"// TODO in string\";\n"
        "    // FIXME: comment\n";

    auto baseline = CommentExtractor().extract("b.rs", content, syntax_for("rs"));
    ASSERT_EQ(baseline.findings.size(), 2u);

    AstCommentVerifier verifier;
    auto result = verifier.extract("b.rs", content, syntax_for("rs"));

    ASSERT_EQ(result.findings.size(), 1u);
    ASSERT_TRUE(result.findings[0].tag.kind == model::TagKind::Fixme);
    ASSERT_EQ(result.findings[0].line, 3u);
    ASSERT_FALSE(result.diagnostic.has_value());
    ASSERT_EQ(verifier.totals().fallbacks, 0u);
    ASSERT_EQ(verifier.totals().filtered, 1u);
}

TEST_CASE(test_ast_comment_ranges) {
    std::string content = "int x; // one\n/* two */ int y;\n";
    std::string failure;
    auto ranges = AstCommentVerifier::comment_ranges(content, "C", &failure);
    ASSERT_TRUE(ranges.has_value());
    ASSERT_EQ(ranges->size(), 2u);
    ASSERT_EQ((*ranges)[0].first, 7u);
    ASSERT_EQ((*ranges)[1].first, 14u);
    ASSERT_EQ((*ranges)[1].second, 23u);
}

TEST_CASE(test_ast_verification_stats) {
    std::string content =
        "const a = \"// TODO x\";\n"
        "// TODO: y\n";
    AstCommentVerifier verifier;
    auto baseline = CommentExtractor().extract("c.js", content, syntax_for("js"));
    auto result = verifier.verify(content, syntax_for("js"), baseline.findings);

    ASSERT_FALSE(result.fell_back);
    ASSERT_EQ(result.stats.total_candidates, 2u);
    ASSERT_EQ(result.stats.verified, 1u);
    ASSERT_EQ(result.stats.filtered, 1u);
    ASSERT_NEAR(result.stats.accuracy_percentage(), 50.0, 0.001);
}

TEST_CASE(test_ast_no_candidates_skips_parse) {
    AstCommentVerifier verifier;
    auto result = verifier.extract("d.rs", "fn main() {}\n", syntax_for("rs"));
    ASSERT_TRUE(result.findings.empty());
    ASSERT_FALSE(result.diagnostic.has_value());
    ASSERT_EQ(verifier.totals().fallbacks, 0u);
}

int main() {
    return debtscan::test::TestRunner::instance().run_all();
}
