#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "BlockContext.h"

using namespace mdbt_impl;
namespace md = md_blocktree;
using kind_e = Continuation::kind_e;

namespace {
	SourceLine plain(std::string text) { return { std::move(text), false }; }
	SourceLine lazy(std::string text) { return { std::move(text), true }; }
}

TEST(MDBTContinuationTest, ParagraphAcceptsText) {
	ctx::Paragraph para{ { plain("foo") } };
	EXPECT_EQ(continueParagraph(para, plain("bar")).kind, kind_e::Continued);
	EXPECT_EQ(continueParagraph(para, plain("    indented")).kind, kind_e::Continued);
	EXPECT_EQ(continueParagraph(para, plain("2. not a list")).kind, kind_e::Continued);
	EXPECT_EQ(continueParagraph(para, plain("1.")).kind, kind_e::Continued);
	EXPECT_EQ(para.lines.size(), 5u);
}

TEST(MDBTContinuationTest, ParagraphClosers) {
	ctx::Paragraph para{ { plain("foo") } };
	EXPECT_EQ(continueParagraph(para, plain("")).kind, kind_e::Closed);
	EXPECT_EQ(continueParagraph(para, plain("# head")).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueParagraph(para, plain("- item")).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueParagraph(para, plain("1. item")).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueParagraph(para, plain("> quote")).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueParagraph(para, plain("~~~")).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueParagraph(para, plain("***")).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(para.lines.size(), 1u);
}

TEST(MDBTContinuationTest, ParagraphSetextUnderline) {
	ctx::Paragraph para{ { plain("foo") } };
	auto one = continueParagraph(para, plain("==="));
	EXPECT_EQ(one.kind, kind_e::Closed);
	EXPECT_EQ(one.setextLevel, 1);

	auto two = continueParagraph(para, plain("---"));
	EXPECT_EQ(two.kind, kind_e::Closed);
	EXPECT_EQ(two.setextLevel, 2);

	EXPECT_EQ(continueParagraph(para, plain("-")).setextLevel, 2);
}

TEST(MDBTContinuationTest, ParagraphTakesLazyLinesVerbatim) {
	ctx::Paragraph para{ { plain("foo") } };
	EXPECT_EQ(continueParagraph(para, lazy("# not a heading")).kind, kind_e::Continued);
	ASSERT_EQ(para.lines.size(), 2u);
	EXPECT_TRUE(para.lines.back().textOnly);
}

TEST(MDBTContinuationTest, FencedCodeStripsOpenerIndent) {
	auto opener = tryFencedCodeOpener("  ```");
	ASSERT_TRUE(opener);
	ctx::FencedCode code{ std::move(opener).take(), {} };

	EXPECT_EQ(continueFencedCode(code, plain("    a")).kind, kind_e::Continued);
	EXPECT_EQ(continueFencedCode(code, plain(" b")).kind, kind_e::Continued);
	EXPECT_EQ(continueFencedCode(code, plain("~~~")).kind, kind_e::Continued);
	EXPECT_EQ(continueFencedCode(code, plain("")).kind, kind_e::Continued);
	EXPECT_EQ(continueFencedCode(code, plain("```")).kind, kind_e::Closed);

	const std::vector<std::string> expected{ "  a", "b", "~~~", "" };
	EXPECT_EQ(code.content, expected);
}

TEST(MDBTContinuationTest, IndentedCodeDefersBlanks) {
	ctx::IndentedCode code{ { "a" }, {} };
	EXPECT_EQ(continueIndentedCode(code, plain("")).kind, kind_e::Deferred);
	EXPECT_EQ(continueIndentedCode(code, plain("  ")).kind, kind_e::Deferred);
	EXPECT_EQ(continueIndentedCode(code, plain("      ")).kind, kind_e::Deferred);
	EXPECT_EQ(code.pendingBlanks.size(), 3u);
	EXPECT_EQ(code.content.size(), 1u);

	EXPECT_EQ(continueIndentedCode(code, plain("      b")).kind, kind_e::Continued);
	const std::vector<std::string> expected{ "a", "", "", "  ", "  b" };
	EXPECT_EQ(code.content, expected);
	EXPECT_TRUE(code.pendingBlanks.empty());

	EXPECT_EQ(continueIndentedCode(code, plain("   c")).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueIndentedCode(code, lazy("    d")).kind, kind_e::ClosedReprocess);
}

TEST(MDBTContinuationTest, BlockquoteMarkersAndLaziness) {
	const md::ParseOptions options{};
	ctx::Blockquote quote{ { plain("foo") }, std::nullopt };

	EXPECT_EQ(continueBlockquote(quote, plain("> bar"), options, 0).kind, kind_e::Continued);
	EXPECT_EQ(continueBlockquote(quote, plain("baz"), options, 0).kind, kind_e::Continued);
	ASSERT_EQ(quote.lines.size(), 3u);
	EXPECT_EQ(quote.lines[1].text, "bar");
	EXPECT_FALSE(quote.lines[1].textOnly);
	EXPECT_EQ(quote.lines[2].text, "baz");
	EXPECT_TRUE(quote.lines[2].textOnly);

	EXPECT_EQ(continueBlockquote(quote, plain("- item"), options, 0).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueBlockquote(quote, plain("---"), options, 0).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueBlockquote(quote, plain(""), options, 0).kind, kind_e::Closed);
}

TEST(MDBTContinuationTest, BlockquoteWithoutOpenParagraph) {
	const md::ParseOptions options{};
	ctx::Blockquote fenced{ { plain("```") }, std::nullopt };
	EXPECT_FALSE(blockquoteHasLazyTarget(fenced, options, 0));
	EXPECT_EQ(continueBlockquote(fenced, plain("foo"), options, 0).kind, kind_e::ClosedReprocess);

	ctx::Blockquote closed{ { plain("foo"), plain("") }, std::nullopt };
	EXPECT_EQ(continueBlockquote(closed, plain("bar"), options, 0).kind, kind_e::ClosedReprocess);
}

TEST(MDBTContinuationTest, ListItemsAndBlanks) {
	const md::ParseOptions options{};
	auto list = makeList(*tryListItem("- a"));
	ASSERT_EQ(list.items.size(), 1u);
	EXPECT_TRUE(list.info.isTight);

	EXPECT_EQ(continueList(list, plain("  b"), options, 0).kind, kind_e::Continued);
	EXPECT_EQ(continueList(list, plain(""), options, 0).kind, kind_e::Deferred);
	EXPECT_EQ(list.pendingBlanks.size(), 1u);

	EXPECT_EQ(continueList(list, plain("- c"), options, 0).kind, kind_e::Continued);
	ASSERT_EQ(list.items.size(), 2u);
	EXPECT_FALSE(list.items[0].separated);
	EXPECT_TRUE(list.items[1].separated);
	EXPECT_TRUE(list.pendingBlanks.empty());
	ASSERT_EQ(list.items[0].lines.size(), 2u);
	EXPECT_EQ(list.items[0].lines[1].text, "b");

	EXPECT_EQ(continueList(list, plain("lazy"), options, 0).kind, kind_e::Continued);
	ASSERT_EQ(list.items[1].lines.size(), 2u);
	EXPECT_TRUE(list.items[1].lines[1].textOnly);

	EXPECT_EQ(continueList(list, plain("* * *"), options, 0).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueList(list, plain("+ other"), options, 0).kind, kind_e::ClosedReprocess);
}

TEST(MDBTContinuationTest, ListFlushesBlanksIntoItem) {
	const md::ParseOptions options{};
	auto list = makeList(*tryListItem("1. a"));
	EXPECT_EQ(continueList(list, plain(""), options, 0).kind, kind_e::Deferred);
	EXPECT_EQ(continueList(list, plain(""), options, 0).kind, kind_e::Deferred);
	EXPECT_EQ(continueList(list, plain("   b"), options, 0).kind, kind_e::Continued);

	const auto& lines = list.items.back().lines;
	ASSERT_EQ(lines.size(), 4u);
	EXPECT_EQ(lines[1].text, "");
	EXPECT_EQ(lines[2].text, "");
	EXPECT_EQ(lines[3].text, "b");
}

TEST(MDBTContinuationTest, ListKeepsWhitespaceBeyondContentIndent) {
	const md::ParseOptions options{};
	auto list = makeList(*tryListItem("- a"));
	EXPECT_EQ(continueList(list, plain(""), options, 0).kind, kind_e::Deferred);
	EXPECT_EQ(continueList(list, plain("      x"), options, 0).kind, kind_e::Continued);
	EXPECT_EQ(continueList(list, plain("        "), options, 0).kind, kind_e::Deferred);
	EXPECT_EQ(continueList(list, plain(" "), options, 0).kind, kind_e::Deferred);
	EXPECT_EQ(continueList(list, plain("      y"), options, 0).kind, kind_e::Continued);

	const auto& lines = list.items.back().lines;
	ASSERT_EQ(lines.size(), 6u);
	EXPECT_EQ(lines[1].text, "");
	EXPECT_EQ(lines[2].text, "    x");
	EXPECT_EQ(lines[3].text, "      ");
	EXPECT_EQ(lines[4].text, "");
	EXPECT_EQ(lines[5].text, "    y");
}

TEST(MDBTContinuationTest, ListClosesAfterBlankWithoutIndent) {
	const md::ParseOptions options{};
	auto list = makeList(*tryListItem("- a"));
	EXPECT_EQ(continueList(list, plain(""), options, 0).kind, kind_e::Deferred);
	EXPECT_FALSE(listHasLazyTarget(list, options, 0));
	EXPECT_EQ(continueList(list, plain(" b"), options, 0).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueList(list, lazy("b"), options, 0).kind, kind_e::ClosedReprocess);
}

TEST(MDBTContinuationTest, EmptyItemTakesOnlyOneBlank) {
	const md::ParseOptions options{};
	auto list = makeList(*tryListItem("-"));
	EXPECT_TRUE(list.items.back().startedBlank);
	EXPECT_TRUE(list.items.back().lines.empty());

	EXPECT_EQ(continueList(list, plain(""), options, 0).kind, kind_e::Deferred);
	EXPECT_EQ(continueList(list, plain("  foo"), options, 0).kind, kind_e::ClosedReprocess);
}

TEST(MDBTContinuationTest, EmptyItemTakesIndentedLineWithoutBlank) {
	const md::ParseOptions options{};
	auto list = makeList(*tryListItem("-"));
	EXPECT_EQ(continueList(list, plain("  foo"), options, 0).kind, kind_e::Continued);
	EXPECT_TRUE(list.items.back().startedBlank);
	EXPECT_EQ(continueList(list, plain(""), options, 0).kind, kind_e::Deferred);
	EXPECT_EQ(continueList(list, plain("  bar"), options, 0).kind, kind_e::Continued);
	EXPECT_EQ(list.items.back().lines.size(), 3u);
}

TEST(MDBTContinuationTest, LazyTargetFollowsAppendedLines) {
	const md::ParseOptions options{};
	auto list = makeList(*tryListItem("- a"));
	EXPECT_TRUE(listHasLazyTarget(list, options, 0));
	ASSERT_TRUE(list.tracker);

	EXPECT_EQ(continueList(list, plain("  ```"), options, 0).kind, kind_e::Continued);
	EXPECT_FALSE(listHasLazyTarget(list, options, 0));
	EXPECT_EQ(continueList(list, plain("  ```"), options, 0).kind, kind_e::Continued);
	EXPECT_EQ(continueList(list, plain("  b"), options, 0).kind, kind_e::Continued);
	EXPECT_TRUE(listHasLazyTarget(list, options, 0));

	EXPECT_EQ(continueList(list, plain("- c"), options, 0).kind, kind_e::Continued);
	EXPECT_FALSE(list.tracker);
	EXPECT_TRUE(listHasLazyTarget(list, options, 0));
}

TEST(MDBTContinuationTest, BlockquoteLazyTargetFollowsMarkers) {
	const md::ParseOptions options{};
	ctx::Blockquote quote{ { plain("foo") }, std::nullopt };
	EXPECT_TRUE(blockquoteHasLazyTarget(quote, options, 0));
	EXPECT_EQ(continueBlockquote(quote, plain("> # head"), options, 0).kind, kind_e::Continued);
	EXPECT_FALSE(blockquoteHasLazyTarget(quote, options, 0));
	EXPECT_EQ(continueBlockquote(quote, plain("bar"), options, 0).kind, kind_e::ClosedReprocess);
	EXPECT_EQ(continueBlockquote(quote, plain("> baz"), options, 0).kind, kind_e::Continued);
	EXPECT_EQ(continueBlockquote(quote, plain("qux"), options, 0).kind, kind_e::Continued);
	EXPECT_EQ(quote.lines.size(), 4u);
}

TEST(MDBTContinuationTest, ListLazyOnlyIntoParagraph) {
	const md::ParseOptions options{};
	auto list = makeList(*tryListItem("- ```"));
	EXPECT_FALSE(listHasLazyTarget(list, options, 0));
	EXPECT_EQ(continueList(list, plain("foo"), options, 0).kind, kind_e::ClosedReprocess);
}

TEST(MDBTContinuationTest, ItemDraftFromHeader) {
	auto draft = makeItemDraft(*tryListItem("10. ten"), true);
	EXPECT_EQ(draft.contentIndent, 4u);
	EXPECT_TRUE(draft.separated);
	EXPECT_FALSE(draft.startedBlank);
	ASSERT_EQ(draft.lines.size(), 1u);
	EXPECT_EQ(draft.lines[0].text, "ten");
}
