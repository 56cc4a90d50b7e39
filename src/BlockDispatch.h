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

#ifndef MD_BLOCK_DISPATCH_H
#define MD_BLOCK_DISPATCH_H
#include <string>
#include <vector>
#include "md_blocktree/MDBlockTree.h"
#include "BlockContext.h"

namespace mdbt_impl {

	/*
	 Blocks produced by one dispatcher run. gapBefore[i] is set when at least
	 one blank line separated nodes[i] from nodes[i - 1] at this nesting level.
	*/
	struct BlockSequence {
		std::vector<md_blocktree::Node> nodes;
		std::vector<bool>           gapBefore;
	};

	class BlockDispatcher {
	public:
		BlockDispatcher(const md_blocktree::ParseOptions& options, UInt depth);

		void feed(const SourceLine& line);
		bool endsInOpenParagraph();
		auto finish() -> BlockSequence;

		UInt depth() const noexcept { return _depth; }
		const ParsingContext& context() const noexcept { return _context; }

	private:
		void openFrom(const SourceLine& line);
		void closeContext(UTinyInt setextLevel = 0);
		void emit(md_blocktree::Node node);

		const md_blocktree::ParseOptions& _options;
		UInt                                _depth;
		ParsingContext                    _context;
		BlockSequence                      _output;
		bool                            _blankSeen;
	};

	auto dispatchLines(const LineBuffer& lines, const md_blocktree::ParseOptions& options, UInt depth) -> BlockSequence;
	bool endsInOpenParagraph(const LineBuffer& lines, const md_blocktree::ParseOptions& options, UInt depth);

	auto splitLines(std::string_view text) -> LineBuffer;
	auto joinParagraphLines(const LineBuffer& lines) -> std::string;

	// Container content extraction

	enum class ReparsePolicy : UTinyInt {
		JoinedBlock,
		BlankDelimitedChunks
	};
	auto policyName(ReparsePolicy policy) noexcept -> const char*;

	auto reparsePolicyFor(const ctx::Blockquote& quote) noexcept -> ReparsePolicy;
	auto reparsePolicyFor(const ctx::ItemDraft& item) noexcept -> ReparsePolicy;

	auto splitIntoChunks(const LineBuffer& lines) -> std::vector<LineBuffer>;

	auto extractBlockquote(const ctx::Blockquote& quote, const md_blocktree::ParseOptions& options, UInt depth) -> BlockSequence;
	auto extractListItem(const ctx::ItemDraft& item, const md_blocktree::ParseOptions& options, UInt depth) -> BlockSequence;
	auto assembleList(const ctx::List& list, const md_blocktree::ParseOptions& options, UInt depth) -> md_blocktree::Node;

	// List tightness

	struct ItemGapSummary {
		bool         separated;
		bool internallyGapped;
	};
	auto summarizeItem(const ctx::ItemDraft& item, const BlockSequence& children) noexcept -> ItemGapSummary;
	bool isTightList(const std::vector<ItemGapSummary>& items) noexcept;
}
#endif
