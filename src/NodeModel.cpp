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

#include <utility>
#include "md_blocktree/MDBlockTree.h"

namespace md = md_blocktree;
using md::Node;

Node::Node(type_e flavor, std::vector<Node> children, std::string text, crtrstc_t crtrstc)
	: _flavor{ flavor }, _children{ std::move(children) }, _text{ std::move(text) }, _crtrstc{ std::move(crtrstc) } {}

auto Node::document(std::vector<Node> children) -> Node {
	return Node{ type_e::Document, std::move(children), {}, {} };
}

auto Node::paragraph(std::string text) -> Node {
	std::vector<Node> children;
	children.push_back(textLiteral(std::move(text)));
	return Node{ type_e::Paragraph, std::move(children), {}, {} };
}

auto Node::heading(const UTinyInt level, std::string text, const bool isSetext) -> Node {
	std::vector<Node> children;
	children.push_back(textLiteral(std::move(text)));
	return Node{ type_e::Heading, std::move(children), {}, HeadingInfo{ level, isSetext } };
}

auto Node::blockquote(std::vector<Node> children) -> Node {
	return Node{ type_e::Blockquote, std::move(children), {}, {} };
}

auto Node::list(ListInfo info, std::vector<Node> items) -> Node {
	return Node{ type_e::List, std::move(items), {}, info };
}

auto Node::listItem(std::vector<Node> children) -> Node {
	return Node{ type_e::ListItem, std::move(children), {}, {} };
}

auto Node::fencedCode(FencedCodeInfo info, std::string content) -> Node {
	return Node{ type_e::FencedCode, {}, std::move(content), std::move(info) };
}

auto Node::indentedCode(std::string content) -> Node {
	return Node{ type_e::IndentedCode, {}, std::move(content), {} };
}

auto Node::thematicBreak() -> Node {
	return Node{ type_e::ThematicBreak, {}, {}, {} };
}

auto Node::textLiteral(std::string raw) -> Node {
	return Node{ type_e::Text, {}, std::move(raw), {} };
}

md::UTinyInt Node::level() const noexcept {
	const auto* h = std::get_if<HeadingInfo>(&_crtrstc);
	return h ? h->lvl : 0;
}

bool Node::isSetext() const noexcept {
	const auto* h = std::get_if<HeadingInfo>(&_crtrstc);
	return h and h->isSetext;
}

const std::optional<std::string>& Node::info() const noexcept {
	static const std::optional<std::string> noInfo{};
	const auto* f = std::get_if<FencedCodeInfo>(&_crtrstc);
	return f ? f->infoStr : noInfo;
}

const md::ListInfo* Node::listInfo() const noexcept {
	return std::get_if<ListInfo>(&_crtrstc);
}

const md::FencedCodeInfo* Node::fenceInfo() const noexcept {
	return std::get_if<FencedCodeInfo>(&_crtrstc);
}

namespace {
	bool sameTags(const Node::crtrstc_t& lhs, const Node::crtrstc_t& rhs) {
		if (lhs.index() != rhs.index()) {
			return false;
		}
		if (const auto* h = std::get_if<md::HeadingInfo>(&lhs)) {
			const auto& o = std::get<md::HeadingInfo>(rhs);
			return h->lvl == o.lvl and h->isSetext == o.isSetext;
		}
		if (const auto* l = std::get_if<md::ListInfo>(&lhs)) {
			const auto& o = std::get<md::ListInfo>(rhs);
			return l->symbolUsed == o.symbolUsed and l->isOrdered == o.isOrdered
				and l->orderedStart == o.orderedStart and l->isTight == o.isTight;
		}
		if (const auto* f = std::get_if<md::FencedCodeInfo>(&lhs)) {
			const auto& o = std::get<md::FencedCodeInfo>(rhs);
			return f->type == o.type and f->length == o.length and f->infoStr == o.infoStr;
		}
		return true;
	}
}

bool md::operator==(const Node& lhs, const Node& rhs) {
	return lhs.flavor() == rhs.flavor()
		and lhs.text() == rhs.text()
		and sameTags(lhs.crtrstc(), rhs.crtrstc())
		and lhs.children() == rhs.children();
}

auto md::nodeTypeName(const Node::type_e flavor) noexcept -> const char* {
	switch (flavor) {
	case Node::type_e::Document: return "document";
	case Node::type_e::Paragraph: return "paragraph";
	case Node::type_e::Heading: return "heading";
	case Node::type_e::Blockquote: return "blockquote";
	case Node::type_e::List: return "list";
	case Node::type_e::ListItem: return "list_item";
	case Node::type_e::FencedCode: return "fenced_code";
	case Node::type_e::IndentedCode: return "indented_code";
	case Node::type_e::ThematicBreak: return "thematic_break";
	case Node::type_e::Text: return "text";
	}
	return "unknown";
}
