//! # Declaration Scanner Tests

#include "doc/scanner.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace odindoc;
using namespace odindoc::doc;
namespace fs = std::filesystem;

class ScannerTest : public ::testing::Test {
protected:
    auto scan(const std::string& code) -> std::vector<DocEntry> {
        return scan_source(code, "test.odin");
    }

    auto scan_one(const std::string& code) -> DocEntry {
        auto entries = scan(code);
        EXPECT_EQ(entries.size(), 1u);
        return entries.empty() ? DocEntry{} : entries.front();
    }
};

// ============================================================================
// Basic Declarations
// ============================================================================

TEST_F(ScannerTest, ProcedureWithDocComment) {
    auto entry = scan_one(R"(// Adds two numbers.
Add :: proc(a, b: int) -> int { return a + b }
)");
    EXPECT_EQ(entry.name, "Add");
    EXPECT_EQ(entry.kind, DeclKind::Procedure);
    EXPECT_EQ(entry.signature, "proc(a, b: int) -> int");
    EXPECT_EQ(entry.doc, "Adds two numbers.");
    EXPECT_EQ(entry.source_file, "test.odin");
    EXPECT_EQ(entry.source_line, 2u);
    EXPECT_FALSE(entry.is_private);
}

TEST_F(ScannerTest, EmptyInput) {
    EXPECT_TRUE(scan("").empty());
    EXPECT_TRUE(scan("\n\n   \n").empty());
}

TEST_F(ScannerTest, NoCommentGivesEmptyDoc) {
    auto entry = scan_one("Version :: \"1.0\"\n");
    EXPECT_EQ(entry.kind, DeclKind::Constant);
    EXPECT_EQ(entry.signature, "\"1.0\"");
    EXPECT_EQ(entry.doc, "");
}

TEST_F(ScannerTest, LastLineWithoutNewline) {
    auto entry = scan_one("package demo\n\nMax :: 64");
    EXPECT_EQ(entry.name, "Max");
    EXPECT_EQ(entry.source_line, 3u);
}

TEST_F(ScannerTest, CrlfLineEndings) {
    auto entry = scan_one("// Doc.\r\nPoint :: struct {\r\n\tx, y: f32,\r\n}\r\n");
    EXPECT_EQ(entry.doc, "Doc.");
    EXPECT_EQ(entry.signature, "struct");
}

TEST_F(ScannerTest, OneEntryPerDeclarationLine) {
    auto entries = scan(R"(package shapes

import "core:math"

Pi :: 3.14159
Color :: enum { Red, Green, Blue }
Shape :: union { Circle, Square }
Flags :: bit_set[Color]
Circle :: struct {
	radius: f32,
}
area :: proc(c: Circle) -> f32 {
	return Pi * c.radius * c.radius
}
)");
    ASSERT_EQ(entries.size(), 6u);
    EXPECT_EQ(entries[0].name, "Pi");
    EXPECT_EQ(entries[1].name, "Color");
    EXPECT_EQ(entries[2].name, "Shape");
    EXPECT_EQ(entries[3].name, "Flags");
    EXPECT_EQ(entries[4].name, "Circle");
    EXPECT_EQ(entries[5].name, "area");
    EXPECT_EQ(entries[5].source_line, 12u);
}

// ============================================================================
// Kind Classification
// ============================================================================

TEST(ClassifyKindTest, LeadingTokens) {
    EXPECT_EQ(classify_kind("proc(x: int)"), DeclKind::Procedure);
    EXPECT_EQ(classify_kind("proc \"c\" (x: int)"), DeclKind::Procedure);
    EXPECT_EQ(classify_kind("struct"), DeclKind::Struct);
    EXPECT_EQ(classify_kind("struct($T: typeid)"), DeclKind::Struct);
    EXPECT_EQ(classify_kind("enum u8"), DeclKind::Enum);
    EXPECT_EQ(classify_kind("union #no_nil"), DeclKind::Union);
    EXPECT_EQ(classify_kind("bit_set[Flag; u32]"), DeclKind::BitSet);
    EXPECT_EQ(classify_kind("42"), DeclKind::Constant);
    EXPECT_EQ(classify_kind(""), DeclKind::Constant);
}

TEST(ClassifyKindTest, RequiresWordBoundary) {
    EXPECT_EQ(classify_kind("processor_count()"), DeclKind::Constant);
    EXPECT_EQ(classify_kind("structure"), DeclKind::Constant);
    EXPECT_EQ(classify_kind("enumerate"), DeclKind::Constant);
}

TEST(ClassifyKindTest, InlineDirectives) {
    EXPECT_EQ(classify_kind("#force_inline proc(x: int) -> int"), DeclKind::Procedure);
    EXPECT_EQ(classify_kind("#force_no_inline proc()"), DeclKind::Procedure);
    EXPECT_EQ(classify_kind("distinct int"), DeclKind::Constant);
}

TEST_F(ScannerTest, ProcedureGroupIsProcedure) {
    auto entry = scan_one("to_string :: proc{int_to_string, float_to_string}\n");
    EXPECT_EQ(entry.kind, DeclKind::Procedure);
    EXPECT_EQ(entry.signature, "proc");
}

// ============================================================================
// Signatures
// ============================================================================

TEST_F(ScannerTest, NestedBindingOperatorIsRejoined) {
    auto entry = scan_one("Handler :: distinct proc(ctx: Ctx :: nil)\n");
    EXPECT_EQ(entry.name, "Handler");
    EXPECT_EQ(entry.signature, "distinct proc(ctx: Ctx :: nil)");
    EXPECT_EQ(entry.kind, DeclKind::Constant);
}

TEST_F(ScannerTest, BodyIsStripped) {
    auto entry = scan_one("Vec2 :: [2]f32{0, 0}\n");
    EXPECT_EQ(entry.signature, "[2]f32");
}

TEST_F(ScannerTest, BraceInsideStringIsNotABody) {
    auto entry = scan_one("Template :: \"{name}\"\n");
    EXPECT_EQ(entry.signature, "\"{name}\"");
}

TEST_F(ScannerTest, TrailingCommentOnDeclarationLineIsDropped) {
    auto entry = scan_one("Max_Items :: 10 // upper bound\n");
    EXPECT_EQ(entry.signature, "10");
}

TEST_F(ScannerTest, CommentMarkerInsideStringIsKept) {
    auto entry = scan_one("Url :: \"http://odin-lang.org\"\n");
    EXPECT_EQ(entry.signature, "\"http://odin-lang.org\"");
}

TEST_F(ScannerTest, MultiNameBinding) {
    auto entry = scan_one("// Pair of limits.\nMin_Size ,Max_Size :: 1, 64\n");
    EXPECT_EQ(entry.name, "Min_Size, Max_Size");
    EXPECT_EQ(entry.signature, "1, 64");
    EXPECT_EQ(entry.kind, DeclKind::Constant);
    EXPECT_EQ(entry.doc, "Pair of limits.");
    EXPECT_FALSE(entry.is_private);
}

TEST_F(ScannerTest, BindingsInsideBodyAreLocal) {
    auto entries = scan(R"(Foo :: proc() {
	Local :: 5
	if true {
		Nested :: 6
	}
}
After :: 7
)");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "Foo");
    EXPECT_EQ(entries[1].name, "After");
    EXPECT_EQ(entries[1].source_line, 7u);
}

TEST_F(ScannerTest, BracesInStringsAndCommentsDoNotOpenBodies) {
    auto entries = scan(R"(Open :: "{"
Brace :: '{' // {
Next :: 1
)");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[2].name, "Next");
}

TEST_F(ScannerTest, WhenBlocksAreNotBodies) {
    auto entries = scan(R"(when ODIN_OS == .Linux {
	Handle :: distinct i32
	// Invalid handle value.
	INVALID_HANDLE :: Handle(-1)
}
)");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "Handle");
    EXPECT_EQ(entries[1].doc, "Invalid handle value.");
}

TEST_F(ScannerTest, CommentAfterBodyIsTrailing) {
    auto entries = scan("Run :: proc() {\n\twork()\n}\n// after the body\nNext :: 1\n");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].doc, "");
}

TEST(StripLineCommentTest, QuoteAware) {
    EXPECT_EQ(strip_line_comment("x := 1 // one"), "x := 1 ");
    EXPECT_EQ(strip_line_comment("s := \"a//b\""), "s := \"a//b\"");
    EXPECT_EQ(strip_line_comment("r := `c:\\\\dir//x` // raw"), "r := `c:\\\\dir//x` ");
    EXPECT_EQ(strip_line_comment("q := a / b"), "q := a / b");
    EXPECT_EQ(strip_line_comment("// all comment"), "");
}

// ============================================================================
// Doc Comments
// ============================================================================

TEST_F(ScannerTest, MultiLineCommentKeepsParagraphs) {
    auto entry = scan_one(R"(// First paragraph,
// still first.
//
// Second paragraph.

// Third after blank line.
Thing :: struct {}
)");
    EXPECT_EQ(entry.doc,
              "First paragraph,\nstill first.\n\nSecond paragraph.\n\nThird after blank line.");
}

TEST_F(ScannerTest, TrailingBlankLinesAreTrimmed) {
    auto entry = scan_one("// Doc.\n\n\nValue :: 1\n");
    EXPECT_EQ(entry.doc, "Doc.");
}

TEST_F(ScannerTest, OnlyOneLeadingSpaceIsStripped) {
    auto entry = scan_one("// Example:\n//     x := add(1, 2)\nadd :: proc() {}\n");
    EXPECT_EQ(entry.doc, "Example:\n    x := add(1, 2)");
}

TEST_F(ScannerTest, CommentWithoutSpace) {
    auto entry = scan_one("//Compact.\nCompact :: 1\n");
    EXPECT_EQ(entry.doc, "Compact.");
}

TEST_F(ScannerTest, CommentResetAfterDeclaration) {
    auto entries = scan("// For A.\nA :: 1\nB :: 2\n");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].doc, "For A.");
    EXPECT_EQ(entries[1].doc, "");
}

TEST_F(ScannerTest, OrphanedCommentIsDropped) {
    auto entries = scan(R"(// This documents nothing.

import "core:fmt"

Later :: proc() {}
)");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].doc, "");
}

TEST_F(ScannerTest, OrphanedByDirectlyFollowingCode) {
    auto entries = scan("// Orphan.\nx := 5\nY :: 1\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].doc, "");
}

TEST_F(ScannerTest, TrailingCommentDoesNotBleedIntoNextDeclaration) {
    auto entries = scan(R"(Config :: struct {
	verbose: bool,
}
// trailing note about the closing brace
Next :: proc() {}
)");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].name, "Next");
    EXPECT_EQ(entries[1].doc, "");
}

TEST_F(ScannerTest, CommentAfterBlankFollowingCodeIsDoc) {
    auto entries = scan(R"(x := 1

// Documented.
Documented :: 2
)");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].doc, "Documented.");
}

TEST_F(ScannerTest, CommentDirectlyAfterDeclarationIsDoc) {
    auto entries = scan("A :: 1\n// For B.\nB :: 2\n");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1].doc, "For B.");
}

TEST_F(ScannerTest, CommentBlankCodeDeclaration) {
    auto entries = scan(R"(// Some heading comment.

when ODIN_OS == .Linux {
}
Undocumented :: 3
)");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].doc, "");
}

// ============================================================================
// Visibility
// ============================================================================

TEST_F(ScannerTest, PrivateAttribute) {
    auto entry = scan_one("@(private)\nhelper :: proc() {}\n");
    EXPECT_EQ(entry.kind, DeclKind::Procedure);
    EXPECT_TRUE(entry.is_private);
}

TEST_F(ScannerTest, PrivateAttributeOnUppercaseName) {
    auto entry = scan_one("@(private=\"file\")\nHidden :: 1\n");
    EXPECT_TRUE(entry.is_private);
}

TEST_F(ScannerTest, PrivateAttributeKeepsDocComment) {
    auto entry = scan_one("// Internal helper.\n@(private)\nHelper :: proc() {}\n");
    EXPECT_EQ(entry.doc, "Internal helper.");
    EXPECT_TRUE(entry.is_private);
}

TEST_F(ScannerTest, PrivateFlagResetByCode) {
    auto entries = scan("@(private)\nx := 1\nPublic :: 1\n");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_FALSE(entries[0].is_private);
}

TEST_F(ScannerTest, PrivateFlagAppliesToOneDeclaration) {
    auto entries = scan("@(private)\nA :: 1\nB :: 2\n");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(entries[0].is_private);
    EXPECT_FALSE(entries[1].is_private);
}

TEST_F(ScannerTest, PrivateByNamingConvention) {
    auto entries = scan("_internal :: 1\nlower :: 2\nUpper :: 3\n");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_TRUE(entries[0].is_private);
    EXPECT_TRUE(entries[1].is_private);
    EXPECT_FALSE(entries[2].is_private);
}

TEST_F(ScannerTest, PrivateMentionInCommentIsDoc) {
    auto entry = scan_one("// Not @(private) at all.\nOpen :: 1\n");
    EXPECT_FALSE(entry.is_private);
    EXPECT_EQ(entry.doc, "Not @(private) at all.");
}

TEST_F(ScannerTest, FilePrivateTag) {
    auto entries = scan("#+private\npackage demo\n\nA :: 1\nB :: 2\n");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_TRUE(entries[0].is_private);
    EXPECT_TRUE(entries[1].is_private);
}

TEST_F(ScannerTest, LegacyFilePrivateTag) {
    auto entry = scan_one("//+private\npackage demo\nA :: 1\n");
    EXPECT_TRUE(entry.is_private);
    EXPECT_EQ(entry.doc, "");
}

TEST_F(ScannerTest, PrivateAttributeOnDeclarationLine) {
    auto entries = scan("@(private) Foo :: 1\nBar :: 2\n");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "Foo");
    EXPECT_EQ(entries[0].signature, "1");
    EXPECT_TRUE(entries[0].is_private);
    EXPECT_EQ(entries[1].name, "Bar");
    EXPECT_FALSE(entries[1].is_private);
}

TEST_F(ScannerTest, AttributeListContainingPrivate) {
    auto entries = scan(R"(// Runs at startup.
@(init, private)
Setup :: proc() {}
@(require_results, private="file")
Compute :: proc() -> int { return 1 }
@( link_name = "x" , private )
Linked :: proc() ---
)");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_TRUE(entries[0].is_private);
    EXPECT_EQ(entries[0].doc, "Runs at startup.");
    EXPECT_TRUE(entries[1].is_private);
    EXPECT_TRUE(entries[2].is_private);
}

TEST_F(ScannerTest, OtherAttributesKeepDocAndVisibility) {
    auto entries = scan(R"(// Sums the values.
@(require_results)
Sum :: proc(xs: []int) -> int { return 0 }
@(link_name="privateer") @(cold)
Cold :: proc() {}
)");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].doc, "Sums the values.");
    EXPECT_FALSE(entries[0].is_private);
    EXPECT_FALSE(entries[1].is_private);
}

TEST_F(ScannerTest, StackedAttributeLines) {
    auto entry = scan_one("// Doc.\n@(private)\n@(require_results)\nHidden :: proc() -> int {}\n");
    EXPECT_TRUE(entry.is_private);
    EXPECT_EQ(entry.doc, "Doc.");
}

// ============================================================================
// Line Classification
// ============================================================================

TEST(ClassifyLineTest, Categories) {
    EXPECT_EQ(classify_line("@(private)"), LineCategory::PrivateAttribute);
    EXPECT_EQ(classify_line("#+private"), LineCategory::FilePrivate);
    EXPECT_EQ(classify_line("   // note"), LineCategory::Comment);
    EXPECT_EQ(classify_line(" \t "), LineCategory::Blank);
    EXPECT_EQ(classify_line("Foo :: 1"), LineCategory::Declaration);
    EXPECT_EQ(classify_line("x := 1"), LineCategory::Code);
}

TEST(ClassifyLineTest, Attributes) {
    EXPECT_EQ(classify_line("@private"), LineCategory::PrivateAttribute);
    EXPECT_EQ(classify_line("@(init, private)"), LineCategory::PrivateAttribute);
    EXPECT_EQ(classify_line("@(require_results)"), LineCategory::Attribute);
    EXPECT_EQ(classify_line("@(privileged)"), LineCategory::Attribute);
    EXPECT_EQ(classify_line("@(private) Foo :: 1"), LineCategory::Declaration);
    EXPECT_EQ(classify_line("@(private) x := 1"), LineCategory::Code);
    EXPECT_EQ(classify_line("A, B :: 1, 2"), LineCategory::Declaration);
}

TEST(ClassifyLineTest, MalformedBindingIsCode) {
    EXPECT_EQ(classify_line("fmt.println(\"a::b\")"), LineCategory::Code);
    EXPECT_EQ(classify_line("A, :: 1"), LineCategory::Code);
    EXPECT_EQ(classify_line(":: 5"), LineCategory::Code);
    EXPECT_EQ(classify_line("x := 1 // a :: b"), LineCategory::Code);
}

// ============================================================================
// Properties
// ============================================================================

TEST(DocEntryTest, DefaultEntriesCompareEqual) {
    DocEntry a;
    DocEntry b;
    EXPECT_EQ(a.kind, DeclKind::Constant);
    EXPECT_EQ(a, b);
}

TEST_F(ScannerTest, ScanningIsIdempotent) {
    const std::string code = R"(// Doc A.
A :: proc() {}
@(private)
b :: 2
// orphan
x := 1
C :: struct {}
)";
    EXPECT_EQ(scan(code), scan(code));
}

// ============================================================================
// scan_file
// ============================================================================

TEST(ScanFileTest, ReadsFile) {
    auto path = fs::temp_directory_path() / "odindoc_scan_file_test.odin";
    {
        std::ofstream out(path);
        out << "// Greeting.\nHello :: \"hi\"\n";
    }

    auto result = scan_file(path.string());
    ASSERT_TRUE(is_ok(result));
    ASSERT_EQ(unwrap(result).size(), 1u);
    EXPECT_EQ(unwrap(result)[0].source_file, path.string());
    EXPECT_EQ(unwrap(result)[0].doc, "Greeting.");

    fs::remove(path);
}

TEST(ScanFileTest, MissingFileIsError) {
    auto result = scan_file("/nonexistent/odindoc/missing.odin");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("missing.odin"), std::string::npos);
}
