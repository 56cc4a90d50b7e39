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

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <type_traits>
#include "MDBlockImpl.h"

#include "tao/pegtl.hpp"

namespace mdbt_impl {
	namespace peggi = TAO_PEGTL_NAMESPACE;
	namespace md = md_blocktree;
	using line_input = peggi::memory_input<peggi::tracking_mode::eager>;
}

namespace {
	template <typename T>
	inline T tabFillSpace(const T logicalSpacesOffset) noexcept {
		static_assert(std::is_integral_v<T> and not std::is_floating_point_v<T>);
		return static_cast<T>(mdbt_impl::TAB_STOP - (logicalSpacesOffset % mdbt_impl::TAB_STOP));
	}

	inline auto lineInput(std::string_view s) -> mdbt_impl::line_input {
		return mdbt_impl::line_input(s.data(), s.data() + s.size(), "line");
	}

	inline auto leadingRun(std::string_view s, const char c) noexcept -> std::size_t {
		const auto pos = s.find_first_not_of(c);
		return pos == std::string_view::npos ? s.size() : pos;
	}
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct whitespace0 : one<' ', '\t'> {};
	struct indent_run : star<whitespace0> {};

	template <typename Rule>
	struct indent_action : nothing<Rule> {};

	template <>
	struct indent_action<whitespace0> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, mdbt_impl::IndentInformation& info, const md_blocktree::Columns& startColumn) noexcept {
			info.columns += (*in.begin() == '\t') ? tabFillSpace(startColumn + info.columns) : 1;
			++info.bytes;
		}
	};
}

auto mdbt_impl::countWhitespaces(std::string_view line, const Columns startColumn) noexcept -> IndentInformation {
	IndentInformation info{ 0, 0, false };
	auto in = lineInput(line);
	peggi::parse<mdlang::indent_run, mdlang::indent_action>(in, info, startColumn);
	info.isNonblank = info.bytes < line.size();
	return info;
}

auto mdbt_impl::stripColumns(std::string_view line, const Columns columns, const Columns startColumn) -> std::string {
	Columns consumed = 0;
	std::size_t i = 0;
	while (consumed < columns and i < line.size()) {
		if (line[i] == ' ') {
			++consumed;
		}
		else if (line[i] == '\t') {
			const Columns width = tabFillSpace(startColumn + consumed);
			if (consumed + width > columns) {
				const Columns leftover = consumed + width - columns;
				return std::string(leftover, ' ').append(line.substr(i + 1));
			}
			consumed += width;
		}
		else {
			break;
		}
		++i;
	}
	return std::string(line.substr(i));
}

bool mdbt_impl::isBlankLine(std::string_view line) noexcept {
	return not countWhitespaces(line).isNonblank;
}

auto mdbt_impl::trimLeading(std::string_view s) noexcept -> std::string_view {
	const auto pos = s.find_first_not_of(" \t");
	return pos == std::string_view::npos ? std::string_view{} : s.substr(pos);
}

auto mdbt_impl::trimTrailing(std::string_view s) noexcept -> std::string_view {
	const auto pos = s.find_last_not_of(" \t");
	return pos == std::string_view::npos ? std::string_view{} : s.substr(0, pos + 1);
}

auto mdbt_impl::trimWhitespace(std::string_view s) noexcept -> std::string_view {
	return trimTrailing(trimLeading(s));
}

auto mdbt_impl::reasonName(const reason_e reason) noexcept -> const char* {
	switch (reason) {
	case reason_e::None: return "None";
	case reason_e::Empty: return "Empty";
	case reason_e::InsufficientIndent: return "InsufficientIndent";
	case reason_e::ExcessIndent: return "ExcessIndent";
	case reason_e::WrongMarkerChar: return "WrongMarkerChar";
	case reason_e::TooFewMarkers: return "TooFewMarkers";
	case reason_e::TooManyMarkers: return "TooManyMarkers";
	case reason_e::MissingSpace: return "MissingSpace";
	case reason_e::TrailingText: return "TrailingText";
	case reason_e::BacktickInInfo: return "BacktickInInfo";
	case reason_e::NoOpenParagraph: return "NoOpenParagraph";
	case reason_e::InterruptsParagraph: return "InterruptsParagraph";
	}
	return "Unknown";
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	template <char C>
	struct thematic_run : seq<one<C>, star<whitespace0>, one<C>, star<whitespace0>, one<C>, star<sor<one<C>, whitespace0>>, eof> {};
	struct thematic_break_rule : sor<thematic_run<'-'>, thematic_run<'_'>, thematic_run<'*'>> {};

	template <typename Rule>
	struct thematic_break_action : nothing<Rule> {};

	template <char C>
	struct thematic_break_action<thematic_run<C>> {
		template <typename ActionInput>
		static void apply(const ActionInput&, char& symbol) noexcept {
			symbol = C;
		}
	};
}

auto mdbt_impl::tryThematicBreak(std::string_view line) noexcept -> LineMatch<ThematicBreakHeader> {
	const auto indent = countWhitespaces(line);
	if (not indent.isNonblank) {
		return reason_e::Empty;
	}
	if (indent.columns > MAX_MARKER_INDENT) {
		return reason_e::ExcessIndent;
	}
	const auto body = line.substr(indent.bytes);
	const char first = body.front();
	if (first != '-' and first != '_' and first != '*') {
		return reason_e::WrongMarkerChar;
	}

	char symbol = '\0';
	auto in = lineInput(body);
	if (peggi::parse<mdlang::thematic_break_rule, mdlang::thematic_break_action>(in, symbol)) {
		return ThematicBreakHeader{ symbol };
	}
	const auto count = std::count(body.begin(), body.end(), first);
	return count < 3 ? reason_e::TooFewMarkers : reason_e::TrailingText;
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct atx_grammar_prefix : rep_min_max<1, mdbt_impl::MAX_ATX_LEVEL, one<'#'>> {};
	struct atx_line : seq<atx_grammar_prefix, sor<whitespace0, eof>> {};

	template <typename Rule>
	struct atx_header_action : nothing<Rule> {};

	template <>
	struct atx_header_action<atx_grammar_prefix> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, md_blocktree::UTinyInt& lvl) noexcept {
			lvl = static_cast<md_blocktree::UTinyInt>(in.size());
		}
	};
}

namespace {
	// content arrives trimmed on both sides
	auto stripClosingSequence(std::string_view content) noexcept -> std::string_view {
		auto hashes = content.size();
		while (hashes > 0 and content[hashes - 1] == '#') {
			--hashes;
		}
		if (hashes == content.size()) {
			return content;
		}
		if (hashes == 0) {
			return {};
		}
		if (content[hashes - 1] == ' ' or content[hashes - 1] == '\t') {
			return mdbt_impl::trimTrailing(content.substr(0, hashes));
		}
		return content;
	}
}

auto mdbt_impl::tryATXHeading(std::string_view line) noexcept -> LineMatch<ATXHeader> {
	const auto indent = countWhitespaces(line);
	if (not indent.isNonblank) {
		return reason_e::Empty;
	}
	if (indent.columns > MAX_MARKER_INDENT) {
		return reason_e::ExcessIndent;
	}
	const auto body = line.substr(indent.bytes);
	if (body.front() != '#') {
		return reason_e::WrongMarkerChar;
	}

	UTinyInt level = 0;
	auto in = lineInput(body);
	if (not peggi::parse<mdlang::atx_line, mdlang::atx_header_action>(in, level)) {
		return leadingRun(body, '#') > MAX_ATX_LEVEL ? reason_e::TooManyMarkers : reason_e::MissingSpace;
	}
	return ATXHeader{ level, stripClosingSequence(trimWhitespace(body.substr(level))) };
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct setex_lvl_1_marker : plus<one<'='>> {};
	struct setex_lvl_2_marker : plus<one<'-'>> {};
	struct setex_rule : seq<sor<setex_lvl_1_marker, setex_lvl_2_marker>, star<whitespace0>, eof> {};

	template <typename Rule>
	struct setex_action : nothing<Rule> {};

	template <>
	struct setex_action<setex_lvl_1_marker> {
		template <typename ActionInput>
		static void apply(const ActionInput&, md_blocktree::UTinyInt& lvl) noexcept {
			lvl = 1;
		}
	};
	template <>
	struct setex_action<setex_lvl_2_marker> {
		template <typename ActionInput>
		static void apply(const ActionInput&, md_blocktree::UTinyInt& lvl) noexcept {
			lvl = 2;
		}
	};
}

auto mdbt_impl::trySetextUnderline(std::string_view line, const bool paragraphOpen) noexcept -> LineMatch<SetextHeader> {
	if (not paragraphOpen) {
		return reason_e::NoOpenParagraph;
	}
	const auto indent = countWhitespaces(line);
	if (not indent.isNonblank) {
		return reason_e::Empty;
	}
	if (indent.columns > MAX_MARKER_INDENT) {
		return reason_e::ExcessIndent;
	}
	const auto body = line.substr(indent.bytes);
	if (body.front() != '=' and body.front() != '-') {
		return reason_e::WrongMarkerChar;
	}

	UTinyInt level = 0;
	auto in = lineInput(body);
	if (not peggi::parse<mdlang::setex_rule, mdlang::setex_action>(in, level)) {
		return reason_e::TrailingText;
	}
	return SetextHeader{ level };
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	template <char C>
	struct fence_run : rep_min<mdbt_impl::MIN_FENCE_SIZE, one<C>> {};
	struct backtick_info : star<not_one<'`'>> {};
	struct code_fence : sor<seq<fence_run<'`'>, backtick_info, eof>, seq<fence_run<'~'>, star<any>, eof>> {};

	template <char C>
	struct closing_fence : seq<fence_run<C>, star<whitespace0>, eof> {};

	template <typename Rule>
	struct fenced_code_action : nothing<Rule> {};

	template <char C>
	struct fenced_code_action<fence_run<C>> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, md_blocktree::UInt& length) noexcept {
			length = static_cast<md_blocktree::UInt>(in.size());
		}
	};
}

auto mdbt_impl::tryFencedCodeOpener(std::string_view line) -> LineMatch<FenceHeader> {
	using symbol_e = md::FencedCodeInfo::symbol_e;

	const auto indent = countWhitespaces(line);
	if (not indent.isNonblank) {
		return reason_e::Empty;
	}
	if (indent.columns > MAX_MARKER_INDENT) {
		return reason_e::ExcessIndent;
	}
	const auto body = line.substr(indent.bytes);
	const char first = body.front();
	if (first != '`' and first != '~') {
		return reason_e::WrongMarkerChar;
	}

	UInt length = 0;
	auto in = lineInput(body);
	if (not peggi::parse<mdlang::code_fence, mdlang::fenced_code_action>(in, length)) {
		return leadingRun(body, first) < MIN_FENCE_SIZE ? reason_e::TooFewMarkers : reason_e::BacktickInInfo;
	}

	const auto infoText = trimWhitespace(body.substr(length));
	FenceHeader header{ static_cast<symbol_e>(first), length, indent.columns, std::nullopt };
	if (not infoText.empty()) {
		header.info.emplace(infoText);
	}
	return header;
}

auto mdbt_impl::tryFencedCodeCloser(std::string_view line, const FenceHeader& opener) noexcept -> LineMatch<FenceCloser> {
	using symbol_e = md::FencedCodeInfo::symbol_e;

	const auto indent = countWhitespaces(line);
	if (not indent.isNonblank) {
		return reason_e::Empty;
	}
	if (indent.columns > MAX_MARKER_INDENT) {
		return reason_e::ExcessIndent;
	}
	const auto body = line.substr(indent.bytes);
	if (body.front() != static_cast<char>(opener.type)) {
		return reason_e::WrongMarkerChar;
	}

	UInt length = 0;
	auto in = lineInput(body);
	const bool matched = opener.type == symbol_e::BackTick ?
		peggi::parse<mdlang::closing_fence<'`'>, mdlang::fenced_code_action>(in, length) :
		peggi::parse<mdlang::closing_fence<'~'>, mdlang::fenced_code_action>(in, length);
	if (not matched) {
		return leadingRun(body, body.front()) < MIN_FENCE_SIZE ? reason_e::TooFewMarkers : reason_e::TrailingText;
	}
	if (length < opener.length) {
		return reason_e::TooFewMarkers;
	}
	return FenceCloser{ length };
}

auto mdbt_impl::tryIndentedCode(std::string_view line, const bool paragraphOpen) -> LineMatch<IndentedCodeHeader> {
	if (paragraphOpen) {
		return reason_e::InterruptsParagraph;
	}
	const auto indent = countWhitespaces(line);
	if (not indent.isNonblank) {
		return reason_e::Empty;
	}
	if (indent.columns < CODE_INDENT) {
		return reason_e::InsufficientIndent;
	}
	return IndentedCodeHeader{ stripColumns(line, CODE_INDENT) };
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct block_quote_marker : one<'>'> {};
}

auto mdbt_impl::tryBlockQuote(std::string_view line) -> LineMatch<BlockQuoteHeader> {
	const auto indent = countWhitespaces(line);
	if (not indent.isNonblank) {
		return reason_e::Empty;
	}
	if (indent.columns > MAX_MARKER_INDENT) {
		return reason_e::ExcessIndent;
	}
	const auto body = line.substr(indent.bytes);
	auto in = lineInput(body);
	if (not peggi::parse<mdlang::block_quote_marker>(in)) {
		return reason_e::WrongMarkerChar;
	}
	// the marker may take one following column of whitespace with it
	return BlockQuoteHeader{ stripColumns(body.substr(1), 1, indent.columns + 1) };
}

namespace mdlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct ul_marker : one<'*', '-', '+'> {};
	struct ol_marker : one<'.', ')'> {};
	struct natural_number : rep_min_max<1, 9, digit> {};
	struct list_marker : sor<seq<natural_number, ol_marker>, ul_marker> {};
	struct list_item_prefix : seq<list_marker, sor<whitespace0, eof>> {};

	template <typename Rule>
	struct list_item_action : nothing<Rule> {};

	template <>
	struct list_item_action<natural_number> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, mdbt_impl::ListItemHeader& header, md_blocktree::UInt& markerWidth) noexcept {
			md_blocktree::Int value = 0;
			const auto res = std::from_chars(in.begin(), in.end(), value);
			if (res.ec == std::errc{}) {
				header.start = value;
			}
			header.isOrdered = true;
			markerWidth = static_cast<md_blocktree::UInt>(in.size()) + 1;
		}
	};
	template <>
	struct list_item_action<ol_marker> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, mdbt_impl::ListItemHeader& header, md_blocktree::UInt&) noexcept {
			header.symbol = static_cast<md_blocktree::ListInfo::symbol_e>(*in.begin());
		}
	};
	template <>
	struct list_item_action<ul_marker> {
		template <typename ActionInput>
		static void apply(const ActionInput& in, mdbt_impl::ListItemHeader& header, md_blocktree::UInt& markerWidth) noexcept {
			header.symbol = static_cast<md_blocktree::ListInfo::symbol_e>(*in.begin());
			header.isOrdered = false;
			header.start = 1;
			markerWidth = 1;
		}
	};
}

auto mdbt_impl::tryListItem(std::string_view line) -> LineMatch<ListItemHeader> {
	const auto indent = countWhitespaces(line);
	if (not indent.isNonblank) {
		return reason_e::Empty;
	}
	if (indent.columns > MAX_MARKER_INDENT) {
		return reason_e::ExcessIndent;
	}
	const auto body = line.substr(indent.bytes);

	ListItemHeader header{ md::ListInfo::symbol_e::dash, false, 1, indent.columns, 0, {}, false };
	UInt markerWidth = 0;
	auto in = lineInput(body);
	if (not peggi::parse<mdlang::list_item_prefix, mdlang::list_item_action>(in, header, markerWidth)) {
		auto markerInput = lineInput(body);
		if (peggi::parse<mdlang::list_marker>(markerInput)) {
			return reason_e::MissingSpace;
		}
		const auto digits = body.find_first_not_of("0123456789");
		if (digits != std::string_view::npos and digits > 9 and (body[digits] == '.' or body[digits] == ')')) {
			return reason_e::TooManyMarkers;
		}
		return reason_e::WrongMarkerChar;
	}

	const Columns markerEnd = indent.columns + markerWidth;
	const auto after = body.substr(markerWidth);
	const auto post = countWhitespaces(after, markerEnd);
	if (not post.isNonblank) {
		header.isEmpty = true;
		header.contentIndent = markerEnd + 1;
	}
	else if (post.columns > CODE_INDENT) {
		// content opens with indented code; the marker takes a single column
		header.contentIndent = markerEnd + 1;
		header.content = stripColumns(after, 1, markerEnd);
	}
	else {
		header.contentIndent = markerEnd + post.columns;
		header.content = std::string(after.substr(post.bytes));
	}
	return header;
}

bool mdbt_impl::sameListKind(const ListItemHeader& item, const md::ListInfo& list) noexcept {
	return item.isOrdered == list.isOrdered and item.symbol == list.symbolUsed;
}

bool mdbt_impl::canInterruptParagraph(const ListItemHeader& item) noexcept {
	return not item.isEmpty and (not item.isOrdered or item.start == 1);
}

auto mdbt_impl::classifyLine(std::string_view line, const bool paragraphOpen) -> LineClass {
	if (auto m = tryFencedCodeOpener(line)) {
		return std::move(m).take();
	}
	if (paragraphOpen) {
		if (auto m = trySetextUnderline(line, true)) {
			return std::move(m).take();
		}
	}
	if (auto m = tryThematicBreak(line)) {
		return std::move(m).take();
	}
	if (auto m = tryBlockQuote(line)) {
		return std::move(m).take();
	}
	if (auto m = tryATXHeading(line)) {
		return std::move(m).take();
	}
	if (auto m = tryListItem(line)) {
		return std::move(m).take();
	}
	if (auto m = tryIndentedCode(line, paragraphOpen)) {
		return std::move(m).take();
	}
	return ParagraphLine{};
}

bool mdbt_impl::startsNewBlock(std::string_view line) {
	const auto cls = classifyLine(line, false);
	return not std::holds_alternative<ParagraphLine>(cls) and not std::holds_alternative<IndentedCodeHeader>(cls);
}
