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

#ifndef MD_BLOCK_CONTEXT_H
#define MD_BLOCK_CONTEXT_H
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "md_blocktree/MDBlockTree.h"
#include "MDBlockImpl.h"

namespace mdbt_impl {

	/*
	 One input line as seen by a dispatcher run. textOnly marks a lazy
	 continuation line: its indentation was stripped away without the line
	 being classified, and the run that receives it must treat it as
	 paragraph text whatever it looks like.
	*/
	struct SourceLine {
		std::string text;
		bool    textOnly = false;
	};
	using LineBuffer = std::vector<SourceLine>;

	class BlockDispatcher;

	/*
	 Answers whether a container's content currently ends in an open
	 paragraph. The dispatcher behind it is fed each line once, as the
	 container takes it, so repeated questions cost nothing extra.
	*/
	class LazyTargetTracker {
	public:
		LazyTargetTracker(const md_blocktree::ParseOptions& options, UInt depth, const LineBuffer& seed);
		LazyTargetTracker(LazyTargetTracker&& o) noexcept;
		LazyTargetTracker& operator=(LazyTargetTracker&& o) noexcept;
		~LazyTargetTracker();

		void feed(const SourceLine& line);
		bool endsInOpenParagraph();
	private:
		std::unique_ptr<BlockDispatcher> _dispatcher;
	};

	namespace ctx {
		struct Top {};

		struct Paragraph {
			LineBuffer lines;
		};

		struct Blockquote {
			LineBuffer                  lines;
			std::optional<LazyTargetTracker>    tracker;
		};

		struct ItemDraft {
			LineBuffer        lines;
			Columns   contentIndent;
			bool       startedBlank;
			bool          separated;
		};

		// items.back() is the item currently receiving lines. pendingBlanks
		// holds the raw blank lines not yet committed to it.
		struct List {
			md_blocktree::ListInfo          info;
			std::vector<ItemDraft>         items;
			std::vector<std::string> pendingBlanks;
			std::optional<LazyTargetTracker>       tracker;
		};

		struct FencedCode {
			FenceHeader                  fence;
			std::vector<std::string>   content;
		};

		struct IndentedCode {
			std::vector<std::string>        content;
			std::vector<std::string>  pendingBlanks;
		};
	}

	using ParsingContext = std::variant<
		ctx::Top,
		ctx::Paragraph,
		ctx::Blockquote,
		ctx::List,
		ctx::FencedCode,
		ctx::IndentedCode>;

	auto contextName(const ParsingContext& context) noexcept -> const char*;

	struct Continuation {
		enum class kind_e : UTinyInt {
			Continued,
			Deferred,
			Closed,
			ClosedReprocess
		};
		kind_e          kind;
		UTinyInt setextLevel = 0;
	};

	auto continueParagraph(ctx::Paragraph& paragraph, const SourceLine& line) -> Continuation;
	auto continueBlockquote(ctx::Blockquote& quote, const SourceLine& line,
		const md_blocktree::ParseOptions& options, UInt depth) -> Continuation;
	auto continueList(ctx::List& list, const SourceLine& line,
		const md_blocktree::ParseOptions& options, UInt depth) -> Continuation;
	auto continueFencedCode(ctx::FencedCode& code, const SourceLine& line) -> Continuation;
	auto continueIndentedCode(ctx::IndentedCode& code, const SourceLine& line) -> Continuation;

	// Whether the innermost open block inside the container is a paragraph.
	bool blockquoteHasLazyTarget(ctx::Blockquote& quote, const md_blocktree::ParseOptions& options, UInt depth);
	bool listHasLazyTarget(ctx::List& list, const md_blocktree::ParseOptions& options, UInt depth);

	// Appends to a container's lines, keeping its tracker in step.
	void appendLine(LineBuffer& lines, std::optional<LazyTargetTracker>& tracker, SourceLine line);

	auto makeItemDraft(const ListItemHeader& header, bool separated) -> ctx::ItemDraft;
	auto makeList(const ListItemHeader& header) -> ctx::List;
}
#endif
