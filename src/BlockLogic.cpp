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

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <plog/Log.h>
#include "BlockDispatch.h"

namespace md = md_blocktree;
using kind_e = mdbt_impl::Continuation::kind_e;

namespace {
	auto joinLines(const std::vector<std::string>& lines) -> std::string {
		std::string out;
		for (std::size_t i = 0; i < lines.size(); ++i) {
			if (i != 0) {
				out.push_back('\n');
			}
			out.append(lines[i]);
		}
		return out;
	}
}

mdbt_impl::BlockDispatcher::BlockDispatcher(const md::ParseOptions& options, const UInt depth)
	: _options{ options }, _depth{ depth }, _context{ ctx::Top{} }, _output{}, _blankSeen{ false } {
	if (depth > options.maxNestingDepth) {
		PLOGW << "block nesting depth " << depth << " exceeds ceiling " << options.maxNestingDepth;
		throw md::NestingTooDeep(options.maxNestingDepth, depth);
	}
}

void mdbt_impl::BlockDispatcher::feed(const SourceLine& line) {
	if (std::holds_alternative<ctx::Top>(_context)) {
		openFrom(line);
		return;
	}

	const Continuation verdict = std::visit([&](auto& c) -> Continuation {
		using T = std::decay_t<decltype(c)>;
		if constexpr (std::is_same_v<T, ctx::Paragraph>) {
			return continueParagraph(c, line);
		}
		else if constexpr (std::is_same_v<T, ctx::Blockquote>) {
			return continueBlockquote(c, line, _options, _depth);
		}
		else if constexpr (std::is_same_v<T, ctx::List>) {
			return continueList(c, line, _options, _depth);
		}
		else if constexpr (std::is_same_v<T, ctx::FencedCode>) {
			return continueFencedCode(c, line);
		}
		else if constexpr (std::is_same_v<T, ctx::IndentedCode>) {
			return continueIndentedCode(c, line);
		}
		else {
			return { kind_e::ClosedReprocess };
		}
	}, _context);

	switch (verdict.kind) {
	case kind_e::Continued:
	case kind_e::Deferred:
		break;
	case kind_e::Closed:
		closeContext(verdict.setextLevel);
		if (isBlankLine(line.text)) {
			_blankSeen = true;
		}
		break;
	case kind_e::ClosedReprocess:
		closeContext();
		openFrom(line);
		break;
	}
}

void mdbt_impl::BlockDispatcher::openFrom(const SourceLine& line) {
	if (isBlankLine(line.text)) {
		_blankSeen = true;
		return;
	}
	if (line.textOnly) {
		_context = ctx::Paragraph{ { line } };
		return;
	}

	std::visit([&](auto&& header) {
		using T = std::decay_t<decltype(header)>;
		if constexpr (std::is_same_v<T, FenceHeader>) {
			_context = ctx::FencedCode{ std::move(header), {} };
		}
		else if constexpr (std::is_same_v<T, ThematicBreakHeader>) {
			emit(md::Node::thematicBreak());
		}
		else if constexpr (std::is_same_v<T, BlockQuoteHeader>) {
			_context = ctx::Blockquote{ { SourceLine{ std::move(header.content), false } }, std::nullopt };
		}
		else if constexpr (std::is_same_v<T, ATXHeader>) {
			emit(md::Node::heading(header.level, std::string(header.content), false));
		}
		else if constexpr (std::is_same_v<T, ListItemHeader>) {
			_context = makeList(header);
		}
		else if constexpr (std::is_same_v<T, IndentedCodeHeader>) {
			_context = ctx::IndentedCode{ { std::move(header.content) }, {} };
		}
		else {
			// a setext underline never classifies without an open paragraph
			_context = ctx::Paragraph{ { line } };
		}
	}, classifyLine(line.text, false));

	PLOGV_IF(not std::holds_alternative<ctx::Top>(_context)) << "open " << contextName(_context) << " at depth " << _depth;
}

void mdbt_impl::BlockDispatcher::closeContext(const UTinyInt setextLevel) {
	ParsingContext closing = std::exchange(_context, ctx::Top{});
	if (std::holds_alternative<ctx::Top>(closing)) {
		return;
	}
	PLOGV << "close " << contextName(closing) << " at depth " << _depth;

	bool trailingBlanks = false;
	std::visit([&](auto& c) {
		using T = std::decay_t<decltype(c)>;
		if constexpr (std::is_same_v<T, ctx::Paragraph>) {
			auto text = joinParagraphLines(c.lines);
			if (setextLevel != 0) {
				emit(md::Node::heading(setextLevel, std::move(text), true));
			}
			else {
				emit(md::Node::paragraph(std::move(text)));
			}
		}
		else if constexpr (std::is_same_v<T, ctx::Blockquote>) {
			emit(md::Node::blockquote(extractBlockquote(c, _options, _depth).nodes));
		}
		else if constexpr (std::is_same_v<T, ctx::List>) {
			trailingBlanks = not c.pendingBlanks.empty();
			emit(assembleList(c, _options, _depth));
		}
		else if constexpr (std::is_same_v<T, ctx::FencedCode>) {
			md::FencedCodeInfo info{ c.fence.type, c.fence.length, std::move(c.fence.info) };
			emit(md::Node::fencedCode(std::move(info), joinLines(c.content)));
		}
		else if constexpr (std::is_same_v<T, ctx::IndentedCode>) {
			// trailing blank lines were never committed
			trailingBlanks = not c.pendingBlanks.empty();
			emit(md::Node::indentedCode(joinLines(c.content)));
		}
	}, closing);

	if (trailingBlanks) {
		_blankSeen = true;
	}
}

void mdbt_impl::BlockDispatcher::emit(md::Node node) {
	_output.gapBefore.push_back(_blankSeen and not _output.nodes.empty());
	_output.nodes.push_back(std::move(node));
	_blankSeen = false;
}

bool mdbt_impl::BlockDispatcher::endsInOpenParagraph() {
	if (std::holds_alternative<ctx::Paragraph>(_context)) {
		return true;
	}
	if (auto* quote = std::get_if<ctx::Blockquote>(&_context)) {
		return blockquoteHasLazyTarget(*quote, _options, _depth);
	}
	if (auto* list = std::get_if<ctx::List>(&_context)) {
		return listHasLazyTarget(*list, _options, _depth);
	}
	return false;
}

auto mdbt_impl::BlockDispatcher::finish() -> BlockSequence {
	closeContext();
	return std::move(_output);
}

auto mdbt_impl::dispatchLines(const LineBuffer& lines, const md::ParseOptions& options, const UInt depth) -> BlockSequence {
	BlockDispatcher dispatcher{ options, depth };
	for (const auto& line : lines) {
		dispatcher.feed(line);
	}
	return dispatcher.finish();
}

bool mdbt_impl::endsInOpenParagraph(const LineBuffer& lines, const md::ParseOptions& options, const UInt depth) {
	BlockDispatcher dispatcher{ options, depth };
	for (const auto& line : lines) {
		dispatcher.feed(line);
	}
	return dispatcher.endsInOpenParagraph();
}

auto mdbt_impl::splitLines(std::string_view text) -> LineBuffer {
	LineBuffer lines;
	std::size_t begin = 0;
	while (begin < text.size()) {
		const auto end = text.find_first_of("\r\n", begin);
		if (end == std::string_view::npos) {
			lines.push_back({ std::string(text.substr(begin)), false });
			break;
		}
		lines.push_back({ std::string(text.substr(begin, end - begin)), false });
		begin = end + 1;
		if (text[end] == '\r' and begin < text.size() and text[begin] == '\n') {
			++begin;
		}
	}
	return lines;
}

auto mdbt_impl::joinParagraphLines(const LineBuffer& lines) -> std::string {
	std::string out;
	for (std::size_t i = 0; i < lines.size(); ++i) {
		if (i != 0) {
			out.push_back('\n');
		}
		const auto stripped = trimLeading(lines[i].text);
		out.append(i + 1 == lines.size() ? trimTrailing(stripped) : stripped);
	}
	return out;
}
