/**
 * @file test_extract.cpp
 * @brief Tests for safe literal extraction using Google Test
 *
 * Validates rules X1-X6.
 */

#include <gtest/gtest.h>
#include "recon/Errors.hpp"
#include "recon/Extract.hpp"
#include "recon/Typed.hpp"

using namespace recon;

namespace {

std::string rejected_shape(const std::string& text) {
    try {
        extract_arguments(text);
    } catch (const UnsupportedArgumentShape& e) {
        return e.shape();
    }
    return "";
}

} // namespace

// ============================================================================
// X1: list arguments
// ============================================================================

TEST(ExtractArguments, CommaListYieldsElements) {
    auto args = extract_arguments("'a', 'b'");
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "a");
    EXPECT_EQ(args[1], "b");
}

TEST(ExtractArguments, ListWithoutSpaces) {
    auto args = extract_arguments("'a','b','c'");
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[2], "c");
}

TEST(ExtractArguments, ArrayLiteralArgument) {
    auto args = extract_arguments("@('x'\n'y')");
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "x");
    EXPECT_EQ(args[1], "y");
}

TEST(ExtractArguments, EmptyText) {
    EXPECT_TRUE(extract_arguments("").empty());
    EXPECT_TRUE(extract_arguments("   \n  ").empty());
}

// ============================================================================
// X2: maps and code blocks
// ============================================================================

TEST(ExtractArguments, BareWordAndMap) {
    auto args = extract_arguments("web01 @{ Port = 80 }");
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "web01");
    EXPECT_EQ(args[1], (Value{{"Port", 80}}));
}

TEST(ExtractArguments, MapKeepsKeyOrder) {
    auto args = extract_arguments("@{\n  'Zeta' = 1\n  Alpha = 'two'; \"Mid\" = 3\n}");
    ASSERT_EQ(args.size(), 1u);
    std::vector<std::string> keys;
    for (auto it = args[0].begin(); it != args[0].end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"Zeta", "Alpha", "Mid"}));
    EXPECT_EQ(args[0]["Alpha"], "two");
}

TEST(ExtractArguments, CodeBlockInMap) {
    auto args = extract_arguments("@{ Run = { Get-Item . } }");
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0]["Run"], typed::script(" Get-Item . "));
}

TEST(ExtractArguments, CodeBlockWithTrailingComment) {
    auto args = extract_arguments("@{ Run = { Get-Item . # note\n} }");
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0]["Run"], typed::script(" Get-Item . # note"));
}

TEST(ExtractArguments, CodeBlockWithNestedBraces) {
    auto args = extract_arguments("@{ Run = { if ($x) { '}' } } }");
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0]["Run"], typed::script(" if ($x) { '}' } "));
}

TEST(ExtractArguments, NestedMapsAndLists) {
    auto args = extract_arguments("@{ Db = @{ Host = 'a'; Ports = 1, 2 }; Tags = @('x') }");
    ASSERT_EQ(args.size(), 1u);
    const Value expected = {
        {"Db", {{"Host", "a"}, {"Ports", {1, 2}}}},
        {"Tags", Value::array({"x"})},
    };
    EXPECT_EQ(args[0], expected);
}

TEST(ExtractArguments, DuplicateKeyIsMalformed) {
    EXPECT_THROW(extract_arguments("@{ a = 1; a = 2 }"), MalformedLiteral);
}

// ============================================================================
// X3, X4: literal shapes
// ============================================================================

TEST(ExtractArguments, Numbers) {
    auto args = extract_arguments("42 -7 3.5 1e3 +5");
    ASSERT_EQ(args.size(), 5u);
    EXPECT_EQ(args[0], 42);
    EXPECT_TRUE(args[0].is_number_integer());
    EXPECT_EQ(args[1], -7);
    EXPECT_DOUBLE_EQ(args[2].get<double>(), 3.5);
    EXPECT_DOUBLE_EQ(args[3].get<double>(), 1000.0);
    EXPECT_EQ(args[4], 5);
}

TEST(ExtractArguments, WordLookingLikeNumber) {
    auto args = extract_arguments("1.2.3 10px");
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "1.2.3");
    EXPECT_EQ(args[1], "10px");
}

TEST(ExtractArguments, Keywords) {
    auto args = extract_arguments("true False NULL");
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], true);
    EXPECT_EQ(args[1], false);
    EXPECT_TRUE(args[2].is_null());
}

TEST(ExtractArguments, Strings) {
    auto args = extract_arguments("'it''s' \"plain\" \"say \"\"hi\"\"\"");
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], "it's");
    EXPECT_EQ(args[1], "plain");
    EXPECT_EQ(args[2], "say \"hi\"");
}

TEST(ExtractArguments, RawString) {
    auto args = extract_arguments("@'\nline1\nline2\n'@");
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0], "line1\nline2");
}

TEST(ExtractArguments, RawStringCrLf) {
    auto args = extract_arguments("@'\r\nline1\r\nline2\r\n'@");
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0], "line1\r\nline2");
}

TEST(ExtractArguments, SecureAndCredential) {
    auto args = extract_arguments("secure('pw') credential('alice', secure('s3'))");
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], typed::secure("pw"));
    EXPECT_EQ(args[1], typed::credential("alice", "s3"));
}

TEST(ExtractArguments, CredentialWithPlainSecret) {
    auto args = extract_arguments("credential('alice', 's3')");
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0], typed::credential("alice", "s3"));
}

TEST(ExtractArguments, BadSecureArguments) {
    EXPECT_THROW(extract_arguments("secure(42)"), MalformedLiteral);
    EXPECT_THROW(extract_arguments("credential('alice')"), MalformedLiteral);
}

TEST(ExtractArguments, Casts) {
    auto args = extract_arguments(
        "[datetime]'2024-05-01T10:00:00' [int]'42' [Version]'1.2.3' [ordered]@{ b = 1; a = 2 }");
    ASSERT_EQ(args.size(), 4u);
    EXPECT_EQ(args[0], typed::datetime("2024-05-01T10:00:00"));
    EXPECT_EQ(args[1], 42);
    EXPECT_EQ(args[2], typed::scalar("Version", "1.2.3"));
    EXPECT_EQ(args[3], typed::ordered({{"b", 1}, {"a", 2}}));
}

TEST(ExtractArguments, ClassCastOnMap) {
    auto args = extract_arguments("[Service]@{ Name = 'x' }");
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0], typed::object("Service", {{"Name", "x"}}));
}

TEST(ExtractArguments, ArrayCastWrapsScalar) {
    const Value val = extract_value("[array]'a'");
    EXPECT_EQ(val, Value::array({"a"}));
}

TEST(ExtractArguments, XmlCast) {
    const Value val = extract_value("[xml]'<a/>'");
    EXPECT_EQ(val, typed::markup("<a/>"));
}

TEST(ExtractArguments, CommentsAreSkipped) {
    auto args = extract_arguments("@{\n  # leading comment\n  a = 1 # trailing\n}");
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0], (Value{{"a", 1}}));
}

// ============================================================================
// X5: unsupported shapes
// ============================================================================

TEST(ExtractArguments, RejectsNonLiterals) {
    EXPECT_EQ(rejected_shape("$name"), "variable");
    EXPECT_EQ(rejected_shape("$(Get-Date)"), "sub-expression");
    EXPECT_EQ(rejected_shape("\"hello $name\""), "expandable-string");
    EXPECT_EQ(rejected_shape("Get-Thing('x')"), "call");
    EXPECT_EQ(rejected_shape("{ Get-Item }"), "code-block");
    EXPECT_EQ(rejected_shape("@{ a = $env:PATH }"), "variable");
    EXPECT_EQ(rejected_shape("'a', { b }"), "code-block");
    EXPECT_EQ(rejected_shape("foo$bar"), "variable");
    EXPECT_EQ(rejected_shape("@params"), "variable");
    EXPECT_EQ(rejected_shape("@{ a = foo$env:PATH }"), "variable");
    EXPECT_EQ(rejected_shape("@{ a = 1; b = @params }"), "variable");
}

TEST(ExtractArguments, RejectedShapeReportsOffset) {
    try {
        extract_arguments("'ok' $bad");
        FAIL() << "expected UnsupportedArgumentShape";
    } catch (const UnsupportedArgumentShape& e) {
        EXPECT_EQ(e.offset(), 5u);
    }
}

// ============================================================================
// X6: malformed text
// ============================================================================

TEST(ExtractArguments, MalformedText) {
    EXPECT_THROW(extract_arguments("@{ a = 'x'"), MalformedLiteral);
    EXPECT_THROW(extract_arguments("'unterminated"), MalformedLiteral);
    EXPECT_THROW(extract_arguments("@('a'"), MalformedLiteral);
    EXPECT_THROW(extract_arguments("[]'x'"), MalformedLiteral);
    EXPECT_THROW(extract_arguments("@'no newline'@"), MalformedLiteral);
    EXPECT_THROW(extract_arguments("()"), MalformedLiteral);
}

TEST(ExtractArguments, ArgumentsNeedWhitespace) {
    EXPECT_THROW(extract_arguments("'a'@{}"), MalformedLiteral);
}

TEST(ExtractArguments, MalformedReportsOffset) {
    try {
        extract_value("@{ a = }");
        FAIL() << "expected MalformedLiteral";
    } catch (const MalformedLiteral& e) {
        EXPECT_EQ(e.offset(), 7u);
    }
}

// ============================================================================
// extract_value
// ============================================================================

TEST(ExtractValue, ListsAreNotFlattened) {
    EXPECT_EQ(extract_value("'a', 'b'"), (Value{"a", "b"}));
    EXPECT_EQ(extract_value(",1"), Value::array({1}));
    EXPECT_EQ(extract_value("(,1)"), Value::array({1}));
    EXPECT_EQ(extract_value(",(,1)"), Value::array({Value::array({1})}));
    EXPECT_EQ(extract_value("@()"), Value::array());
    EXPECT_EQ(extract_value("@(,'a')"), Value::array({"a"}));
}

TEST(ExtractValue, ArrayLiteralOfLists) {
    const Value val = extract_value("@(\n    (,1)\n    (2, 3)\n)");
    EXPECT_EQ(val, Value::array({Value::array({1}), Value{2, 3}}));
}

TEST(ExtractValue, RequiresExactlyOneExpression) {
    EXPECT_THROW(extract_value(""), MalformedLiteral);
    EXPECT_THROW(extract_value("1 2"), MalformedLiteral);
}

TEST(ExtractValue, TopLevelCodeBlockRejected) {
    EXPECT_THROW(extract_value("{ x }"), UnsupportedArgumentShape);
}

// ============================================================================
// Block text helpers
// ============================================================================

TEST(BlockText, NormalizeStripsOneBracePair) {
    EXPECT_EQ(normalize_block_text("{ x }"), " x ");
    EXPECT_EQ(normalize_block_text("{{ x }}"), "{ x }");
    EXPECT_EQ(normalize_block_text("{a}{b}"), "{a}{b}");
    EXPECT_EQ(normalize_block_text(" x "), " x ");
}

TEST(BlockText, NormalizeDropsNewlineAfterComment) {
    EXPECT_EQ(normalize_block_text("{x # c\n}"), "x # c");
    EXPECT_EQ(normalize_block_text("{x\n}"), "x\n");
}

TEST(BlockText, CommentDetection) {
    EXPECT_TRUE(block_has_comment("# all"));
    EXPECT_TRUE(block_has_comment("a #b"));
    EXPECT_TRUE(block_has_comment("a;#b"));
    EXPECT_FALSE(block_has_comment("a#b"));
    EXPECT_FALSE(block_has_comment("'#' \"#\""));
}
