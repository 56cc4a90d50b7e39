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

#include <memory>
#include <type_traits>
#include <utility>
#include "BlockContext.h"
#include "BlockDispatch.h"

namespace md = md_blocktree;
using mdbt_impl::Continuation;
using kind_e = mdbt_impl::Continuation::kind_e;

auto mdbt_impl::contextName(const ParsingContext& context) noexcept -> const char* {
	switch (context.index()) {
	case 0: return "Top";
	case 1: return "Paragraph";
	case 2: return "Blockquote";
	case 3: return "List";
	case 4: return "FencedCode";
	case 5: return "IndentedCode";
	default: return "Unknown";
	}
}

mdbt_impl::LazyTargetTracker::LazyTargetTracker(const md::ParseOptions& options, const UInt depth, const LineBuffer& seed)
	: _dispatcher{ std::make_unique<BlockDispatcher>(options, depth) } {
	for (const auto& line : seed) {
		_dispatcher->feed(line);
	}
}

mdbt_impl::LazyTargetTracker::LazyTargetTracker(LazyTargetTracker&& o) noexcept = default;
auto mdbt_impl::LazyTargetTracker::operator=(LazyTargetTracker&& o) noexcept -> LazyTargetTracker& = default;
mdbt_impl::LazyTargetTracker::~LazyTargetTracker() = default;

void mdbt_impl::LazyTargetTracker::feed(const SourceLine& line) {
	_dispatcher->feed(line);
}

bool mdbt_impl::LazyTargetTracker::endsInOpenParagraph() {
	return _dispatcher->endsInOpenParagraph();
}

void mdbt_impl::appendLine(LineBuffer& lines, std::optional<LazyTargetTracker>& tracker, SourceLine line) {
	if (tracker) {
		tracker->feed(line);
	}
	lines.push_back(std::move(line));
}

auto mdbt_impl::makeItemDraft(const ListItemHeader& header, const bool separated) -> ctx::ItemDraft {
	ctx::ItemDraft draft{ {}, header.contentIndent, header.isEmpty, separated };
	if (not header.isEmpty) {
		draft.lines.push_back({ header.content, false });
	}
	return draft;
}

auto mdbt_impl::makeList(const ListItemHeader& header) -> ctx::List {
	ctx::List list{ md::ListInfo{ header.symbol, header.isOrdered, header.start, true }, {}, {}, std::nullopt };
	list.items.push_back(makeItemDraft(header, false));
	return list;
}

auto mdbt_impl::continueParagraph(ctx::Paragraph& paragraph, const SourceLine& line) -> Continuation {
	if (line.textOnly) {
		paragraph.lines.push_back(line);
		return { kind_e::Continued };
	}
	if (isBlankLine(line.text)) {
		return { kind_e::Closed };
	}

	return std::visit([&](const auto& header) -> Continuation {
		using T = std::decay_t<decltype(header)>;
		if constexpr (std::is_same_v<T, SetextHeader>) {
			return { kind_e::Closed, header.level };
		}
		else if constexpr (std::is_same_v<T, ListItemHeader>) {
			if (canInterruptParagraph(header)) {
				return { kind_e::ClosedReprocess };
			}
			paragraph.lines.push_back(line);
			return { kind_e::Continued };
		}
		else if constexpr (std::is_same_v<T, ParagraphLine> or std::is_same_v<T, IndentedCodeHeader>) {
			paragraph.lines.push_back(line);
			return { kind_e::Continued };
		}
		else {
			return { kind_e::ClosedReprocess };
		}
	}, classifyLine(line.text, true));
}

bool mdbt_impl::blockquoteHasLazyTarget(ctx::Blockquote& quote, const md::ParseOptions& options, const UInt depth) {
	if (not quote.tracker) {
		quote.tracker.emplace(options, depth + 1, quote.lines);
	}
	return quote.tracker->endsInOpenParagraph();
}

auto mdbt_impl::continueBlockquote(ctx::Blockquote& quote, const SourceLine& line,
	const md::ParseOptions& options, const UInt depth) -> Continuation {
	if (line.textOnly) {
		appendLine(quote.lines, quote.tracker, line);
		return { kind_e::Continued };
	}
	if (auto marker = tryBlockQuote(line.text)) {
		appendLine(quote.lines, quote.tracker, { std::move(marker).take().content, false });
		return { kind_e::Continued };
	}
	if (isBlankLine(line.text)) {
		return { kind_e::Closed };
	}
	if (not startsNewBlock(line.text) and blockquoteHasLazyTarget(quote, options, depth)) {
		appendLine(quote.lines, quote.tracker, { line.text, true });
		return { kind_e::Continued };
	}
	return { kind_e::ClosedReprocess };
}

bool mdbt_impl::listHasLazyTarget(ctx::List& list, const md::ParseOptions& options, const UInt depth) {
	const auto& item = list.items.back();
	if (not list.pendingBlanks.empty() or item.lines.empty()) {
		return false;
	}
	if (not list.tracker) {
		list.tracker.emplace(options, depth + 1, item.lines);
	}
	return list.tracker->endsInOpenParagraph();
}

auto mdbt_impl::continueList(ctx::List& list, const SourceLine& line,
	const md::ParseOptions& options, const UInt depth) -> Continuation {
	auto& item = list.items.back();

	if (isBlankLine(line.text)) {
		list.pendingBlanks.push_back(line.text);
		return { kind_e::Deferred };
	}
	if (line.textOnly) {
		if (not list.pendingBlanks.empty()) {
			return { kind_e::ClosedReprocess };
		}
		appendLine(item.lines, list.tracker, line);
		return { kind_e::Continued };
	}

	const auto indent = countWhitespaces(line.text);
	// an item may open with at most one blank line
	const bool emptyItemClosed = item.startedBlank and item.lines.empty() and not list.pendingBlanks.empty();
	if (indent.columns >= item.contentIndent and not emptyItemClosed) {
		for (const auto& blank : list.pendingBlanks) {
			appendLine(item.lines, list.tracker, { stripColumns(blank, item.contentIndent), false });
		}
		list.pendingBlanks.clear();
		appendLine(item.lines, list.tracker, { stripColumns(line.text, item.contentIndent), false });
		return { kind_e::Continued };
	}

	if (indent.columns <= MAX_MARKER_INDENT) {
		if (tryThematicBreak(line.text)) {
			return { kind_e::ClosedReprocess };
		}
		auto marker = tryListItem(line.text);
		if (marker and sameListKind(*marker, list.info)) {
			list.items.push_back(makeItemDraft(*marker, not list.pendingBlanks.empty()));
			list.pendingBlanks.clear();
			list.tracker.reset();
			return { kind_e::Continued };
		}
	}

	if (not startsNewBlock(line.text) and listHasLazyTarget(list, options, depth)) {
		appendLine(item.lines, list.tracker, { std::string(trimLeading(line.text)), true });
		return { kind_e::Continued };
	}
	return { kind_e::ClosedReprocess };
}

auto mdbt_impl::continueFencedCode(ctx::FencedCode& code, const SourceLine& line) -> Continuation {
	if (tryFencedCodeCloser(line.text, code.fence)) {
		return { kind_e::Closed };
	}
	code.content.push_back(stripColumns(line.text, code.fence.indent));
	return { kind_e::Continued };
}

auto mdbt_impl::continueIndentedCode(ctx::IndentedCode& code, const SourceLine& line) -> Continuation {
	if (isBlankLine(line.text)) {
		code.pendingBlanks.push_back(line.text);
		return { kind_e::Deferred };
	}
	if (line.textOnly) {
		return { kind_e::ClosedReprocess };
	}
	if (auto body = tryIndentedCode(line.text, false)) {
		for (const auto& blank : code.pendingBlanks) {
			code.content.push_back(stripColumns(blank, CODE_INDENT));
		}
		code.pendingBlanks.clear();
		code.content.push_back(std::move(body).take().content);
		return { kind_e::Continued };
	}
	return { kind_e::ClosedReprocess };
}
