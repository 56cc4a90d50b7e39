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
#include <optional>
#include <utility>
#include <plog/Log.h>
#include "BlockDispatch.h"

namespace md = md_blocktree;

auto mdbt_impl::policyName(const ReparsePolicy policy) noexcept -> const char* {
	switch (policy) {
	case ReparsePolicy::JoinedBlock: return "JoinedBlock";
	case ReparsePolicy::BlankDelimitedChunks: return "BlankDelimitedChunks";
	}
	return "Unknown";
}

auto mdbt_impl::reparsePolicyFor(const ctx::Blockquote&) noexcept -> ReparsePolicy {
	return ReparsePolicy::JoinedBlock;
}

auto mdbt_impl::reparsePolicyFor(const ctx::ItemDraft& item) noexcept -> ReparsePolicy {
	const bool hasTextOnly = std::any_of(item.lines.begin(), item.lines.end(),
		[](const SourceLine& l) { return l.textOnly; });
	return hasTextOnly ? ReparsePolicy::BlankDelimitedChunks : ReparsePolicy::JoinedBlock;
}

namespace {
	// A chunk may only start on an unindented line that cannot continue the
	// blocks of the chunk before it.
	bool startsChunk(const mdbt_impl::SourceLine& line) {
		return not line.textOnly
			and mdbt_impl::countWhitespaces(line.text).columns == 0
			and not mdbt_impl::tryListItem(line.text);
	}
}

auto mdbt_impl::splitIntoChunks(const LineBuffer& lines) -> std::vector<LineBuffer> {
	std::vector<LineBuffer> chunks(1);
	std::optional<FenceHeader> openFence;

	std::size_t i = 0;
	while (i < lines.size()) {
		const auto& line = lines[i];
		if (not openFence and isBlankLine(line.text)) {
			std::size_t next = i;
			while (next < lines.size() and isBlankLine(lines[next].text)) {
				++next;
			}
			if (next < lines.size() and not chunks.back().empty() and startsChunk(lines[next])) {
				chunks.emplace_back();
				i = next;
				continue;
			}
			for (; i < next; ++i) {
				chunks.back().push_back(lines[i]);
			}
			continue;
		}

		if (not line.textOnly) {
			if (openFence) {
				if (tryFencedCodeCloser(line.text, *openFence)) {
					openFence.reset();
				}
			}
			else if (auto fence = tryFencedCodeOpener(line.text)) {
				openFence = std::move(fence).take();
			}
		}
		chunks.back().push_back(line);
		++i;
	}
	return chunks;
}

auto mdbt_impl::extractBlockquote(const ctx::Blockquote& quote, const md::ParseOptions& options, const UInt depth) -> BlockSequence {
	PLOGD << "blockquote of " << quote.lines.size() << " lines, policy " << policyName(reparsePolicyFor(quote));
	return dispatchLines(quote.lines, options, depth + 1);
}

auto mdbt_impl::extractListItem(const ctx::ItemDraft& item, const md::ParseOptions& options, const UInt depth) -> BlockSequence {
	const auto policy = reparsePolicyFor(item);
	PLOGD << "list item of " << item.lines.size() << " lines, policy " << policyName(policy);

	if (policy == ReparsePolicy::JoinedBlock) {
		return dispatchLines(item.lines, options, depth + 1);
	}

	BlockSequence merged;
	for (const auto& chunk : splitIntoChunks(item.lines)) {
		auto part = dispatchLines(chunk, options, depth + 1);
		for (std::size_t i = 0; i < part.nodes.size(); ++i) {
			const bool gap = i == 0 ? not merged.nodes.empty() : part.gapBefore[i];
			merged.gapBefore.push_back(gap);
			merged.nodes.push_back(std::move(part.nodes[i]));
		}
	}
	return merged;
}

auto mdbt_impl::assembleList(const ctx::List& list, const md::ParseOptions& options, const UInt depth) -> md::Node {
	std::vector<md::Node> items;
	std::vector<ItemGapSummary> gaps;
	items.reserve(list.items.size());
	gaps.reserve(list.items.size());

	for (const auto& draft : list.items) {
		auto children = extractListItem(draft, options, depth);
		gaps.push_back(summarizeItem(draft, children));
		items.push_back(md::Node::listItem(std::move(children.nodes)));
	}

	md::ListInfo info = list.info;
	info.isTight = isTightList(gaps);
	return md::Node::list(info, std::move(items));
}
