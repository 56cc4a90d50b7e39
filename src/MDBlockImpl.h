/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef MD_BLOCK_IMPL_H
#define MD_BLOCK_IMPL_H
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include "md_blocktree/BlockInfoTags.h"
#include "md_blocktree/IntegralTypes.h"

namespace mdbt_impl {
	using md_blocktree::UTinyInt;
	using md_blocktree::UInt;
	using md_blocktree::Int;
	using md_blocktree::Columns;

	constexpr Columns TAB_STOP = 4;
	constexpr Columns MAX_MARKER_INDENT = 3;
	constexpr Columns CODE_INDENT = 4;
	constexpr UInt MIN_FENCE_SIZE = 3;
	constexpr UTinyInt MAX_ATX_LEVEL = 6;

	struct IndentInformation {
		Columns      columns;
		std::size_t    bytes;
		bool      isNonblank;
	};

	auto countWhitespaces(std::string_view line, Columns startColumn = 0) noexcept -> IndentInformation;

	// Removes up to `columns` columns of leading whitespace. A tab crossing the
	// cut leaves its remaining columns as spaces; the rest is kept verbatim.
	auto stripColumns(std::string_view line, Columns columns, Columns startColumn = 0) -> std::string;

	bool isBlankLine(std::string_view line) noexcept;
	auto trimLeading(std::string_view s) noexcept -> std::string_view;
	auto trimTrailing(std::string_view s) noexcept -> std::string_view;
	auto trimWhitespace(std::string_view s) noexcept -> std::string_view;

	enum class reason_e : UTinyInt {
		None,
		Empty,
		InsufficientIndent,
		ExcessIndent,
		WrongMarkerChar,
		TooFewMarkers,
		TooManyMarkers,
		MissingSpace,
		TrailingText,
		BacktickInInfo,
		NoOpenParagraph,
		InterruptsParagraph
	};
	auto reasonName(reason_e reason) noexcept -> const char*;

	/*
	 Outcome of one line classifier: either the parsed header of the block
	 the line starts, or the reason the classifier does not apply.
	*/
	template <typename Header>
	class LineMatch {
	public:
		LineMatch(Header header) : _res{ std::move(header) } {}
		LineMatch(reason_e reason) : _res{ reason } {}

		explicit operator bool() const noexcept { return std::holds_alternative<Header>(_res); }

		const Header& operator*() const { return std::get<Header>(_res); }
		const Header* operator->() const { return &std::get<Header>(_res); }
		auto take() && -> Header { return std::get<Header>(std::move(_res)); }

		reason_e reason() const noexcept {
			return std::holds_alternative<reason_e>(_res) ? std::get<reason_e>(_res) : reason_e::None;
		}
	private:
		std::variant<Header, reason_e> _res;
	};

	struct ThematicBreakHeader {
		char symbol;
	};

	struct ATXHeader {
		UTinyInt               level;
		std::string_view     content;
	};

	struct SetextHeader {
		UTinyInt level;
	};

	struct FenceHeader {
		md_blocktree::FencedCodeInfo::symbol_e type;
		UInt                                 length;
		Columns                              indent;
		std::optional<std::string>             info;
	};

	struct FenceCloser {
		UInt length;
	};

	struct IndentedCodeHeader {
		std::string content;
	};

	struct BlockQuoteHeader {
		std::string content;
	};

	struct ListItemHeader {
		md_blocktree::ListInfo::symbol_e symbol;
		bool                          isOrdered;
		Int                               start;
		Columns                    markerIndent;
		Columns                   contentIndent;
		std::string                     content;
		bool                            isEmpty;
	};

	auto tryThematicBreak(std::string_view line) noexcept -> LineMatch<ThematicBreakHeader>;
	auto tryATXHeading(std::string_view line) noexcept -> LineMatch<ATXHeader>;
	auto trySetextUnderline(std::string_view line, bool paragraphOpen) noexcept -> LineMatch<SetextHeader>;
	auto tryFencedCodeOpener(std::string_view line) -> LineMatch<FenceHeader>;
	auto tryFencedCodeCloser(std::string_view line, const FenceHeader& opener) noexcept -> LineMatch<FenceCloser>;
	auto tryIndentedCode(std::string_view line, bool paragraphOpen) -> LineMatch<IndentedCodeHeader>;
	auto tryBlockQuote(std::string_view line) -> LineMatch<BlockQuoteHeader>;
	auto tryListItem(std::string_view line) -> LineMatch<ListItemHeader>;

	bool sameListKind(const ListItemHeader& item, const md_blocktree::ListInfo& list) noexcept;
	bool canInterruptParagraph(const ListItemHeader& item) noexcept;

	struct ParagraphLine {};

	using LineClass = std::variant<
		FenceHeader,
		SetextHeader,
		ThematicBreakHeader,
		BlockQuoteHeader,
		ATXHeader,
		ListItemHeader,
		IndentedCodeHeader,
		ParagraphLine>;

	/*
	 Runs the classifiers in precedence order and returns the first that applies:
	 fence, setext underline (only while a paragraph is open), thematic break,
	 blockquote, ATX heading, list item, indented code (never while a paragraph
	 is open), paragraph text.
	*/
	auto classifyLine(std::string_view line, bool paragraphOpen) -> LineClass;

	// True when line opens a block of its own outside any paragraph. A line for
	// which this is false may lazily continue a paragraph nested in a container.
	bool startsNewBlock(std::string_view line);
}
#endif
