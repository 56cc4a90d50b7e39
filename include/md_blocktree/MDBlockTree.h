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

// MDBlockTree.h : block structure of a CommonMark document.
#ifndef MD_BLOCK_TREE_H
#define MD_BLOCK_TREE_H
#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include "BlockInfoTags.h"
#include "IntegralTypes.h"
#include "mdblocktree_export.h"

namespace md_blocktree {

	/*
	 Block node of the parsed document. Nodes are built bottom-up by the parser
	 and never change afterwards; children are kept in document order.

	 Paragraph and Heading nodes hold exactly one Text child with the raw inline
	 source. Code blocks keep their content in text(). A List's children are
	 its ListItems.
	*/
	class Node {
	public:
		enum class type_e : uint8_t {
			Document,
			Paragraph,
			Heading,
			Blockquote,
			List,
			ListItem,
			FencedCode,
			IndentedCode,
			ThematicBreak,
			Text
		};
		using crtrstc_t = std::variant<std::monostate, HeadingInfo, ListInfo, FencedCodeInfo>;

		MDBLOCKTREE_EXPORT static auto document(std::vector<Node> children) -> Node;
		MDBLOCKTREE_EXPORT static auto paragraph(std::string text) -> Node;
		MDBLOCKTREE_EXPORT static auto heading(UTinyInt level, std::string text, bool isSetext) -> Node;
		MDBLOCKTREE_EXPORT static auto blockquote(std::vector<Node> children) -> Node;
		MDBLOCKTREE_EXPORT static auto list(ListInfo info, std::vector<Node> items) -> Node;
		MDBLOCKTREE_EXPORT static auto listItem(std::vector<Node> children) -> Node;
		MDBLOCKTREE_EXPORT static auto fencedCode(FencedCodeInfo info, std::string content) -> Node;
		MDBLOCKTREE_EXPORT static auto indentedCode(std::string content) -> Node;
		MDBLOCKTREE_EXPORT static auto thematicBreak() -> Node;
		MDBLOCKTREE_EXPORT static auto textLiteral(std::string raw) -> Node;

		type_e flavor() const noexcept { return _flavor; }
		const std::vector<Node>& children() const noexcept { return _children; }
		const crtrstc_t& crtrstc() const noexcept { return _crtrstc; }

		inline bool isLeaf() const noexcept {
			return (
				_flavor == type_e::IndentedCode or
				_flavor == type_e::FencedCode or
				_flavor == type_e::Paragraph or
				_flavor == type_e::Heading);
		}

		// Text literal for Text nodes, content for code blocks, empty otherwise.
		const std::string& text() const noexcept { return _text; }

		// 1..6 for headings, 0 for every other node.
		MDBLOCKTREE_EXPORT UTinyInt level() const noexcept;
		MDBLOCKTREE_EXPORT bool isSetext() const noexcept;

		// Fence info string; no value when absent or when this is not a fenced block.
		MDBLOCKTREE_EXPORT const std::optional<std::string>& info() const noexcept;

		// nullptr unless flavor() is List.
		MDBLOCKTREE_EXPORT const ListInfo* listInfo() const noexcept;
		// nullptr unless flavor() is FencedCode.
		MDBLOCKTREE_EXPORT const FencedCodeInfo* fenceInfo() const noexcept;

		/*
		 Pre-order walk over a node and all of its descendants.
		 The node the walk started from is visited first.
		*/
		class public_iterator {
		public:
			using self_type = Node::public_iterator;
			using iterator_category = std::forward_iterator_tag;
			using value_type = Node;
			using difference_type = std::ptrdiff_t;
			using pointer = const Node*;
			using reference = const Node&;

			public_iterator() = default;
			explicit public_iterator(pointer root) : _valPtr{ root } {}

			reference operator*() const { return *_valPtr; }
			pointer operator->() const { return _valPtr; }

			MDBLOCKTREE_EXPORT self_type& operator++();
			MDBLOCKTREE_EXPORT self_type operator++(int);

			// Distance from the node the walk started at.
			std::size_t depth() const noexcept { return _parents.size(); }

			bool operator==(const self_type& rhs) const { return this->_valPtr == rhs._valPtr; }
			bool operator!=(const self_type& rhs) const { return !operator==(rhs); }

		private:
			pointer _valPtr{ nullptr };
			std::vector<std::pair<pointer, std::size_t>> _parents;
		};

		public_iterator begin() const { return public_iterator{ this }; }
		public_iterator end() const { return public_iterator{}; }

	private:
		Node(type_e flavor, std::vector<Node> children, std::string text, crtrstc_t crtrstc);

		type_e              _flavor;
		std::vector<Node> _children;
		std::string           _text;
		crtrstc_t          _crtrstc;
	};

	MDBLOCKTREE_EXPORT bool operator==(const Node& lhs, const Node& rhs);
	inline bool operator!=(const Node& lhs, const Node& rhs) { return !(lhs == rhs); }

	struct ParseOptions {
		// Deepest container nesting accepted; the document itself is depth 0.
		UInt maxNestingDepth = 100;
	};

	class MDBLOCKTREE_EXPORT NestingTooDeep : public std::runtime_error {
	public:
		NestingTooDeep(UInt ceiling, UInt depth);

		UInt ceiling() const noexcept { return _ceiling; }
		UInt depth() const noexcept { return _depth; }
	private:
		UInt _ceiling;
		UInt   _depth;
	};

	/*
	 Parses the block structure of text and returns the Document node.
	 Any input yields a tree; NestingTooDeep is thrown only when containers
	 nest deeper than options.maxNestingDepth.
	*/
	MDBLOCKTREE_EXPORT auto parse(std::string_view text, const ParseOptions& options = {}) -> Node;

	MDBLOCKTREE_EXPORT auto nodeTypeName(Node::type_e flavor) noexcept -> const char*;
}

#endif
