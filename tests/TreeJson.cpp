#include <iterator>
#include <fmt/format.h>
#include "TreeJson.h"

namespace md = md_blocktree;
using json = nlohmann::json;

namespace {
	auto blocksOf(const md::Node& node) -> json {
		auto arr = json::array();
		for (const auto& child : node.children()) {
			arr.push_back(mdbt_test::toJson(child));
		}
		return arr;
	}

	auto inlineText(const md::Node& node) -> const std::string& {
		return node.children().front().text();
	}

	auto escaped(const std::string& s) -> std::string {
		std::string out;
		for (const char c : s) {
			switch (c) {
			case '\n': out.append("\\n"); break;
			case '\t': out.append("\\t"); break;
			default: out.push_back(c);
			}
		}
		return out;
	}
}

auto mdbt_test::toJson(const md::Node& node) -> json {
	using type_e = md::Node::type_e;
	switch (node.flavor()) {
	case type_e::Document:
		return blocksOf(node);
	case type_e::Paragraph:
		return json{ {"type", "paragraph"}, {"text", inlineText(node)} };
	case type_e::Heading:
		return json{ {"type", "heading"}, {"level", static_cast<int>(node.level())}, {"text", inlineText(node)} };
	case type_e::Blockquote:
		return json{ {"type", "blockquote"}, {"children", blocksOf(node)} };
	case type_e::List: {
		const auto* info = node.listInfo();
		auto items = json::array();
		for (const auto& item : node.children()) {
			items.push_back(blocksOf(item));
		}
		return json{
			{"type", "list"},
			{"ordered", info->isOrdered},
			{"start", info->orderedStart},
			{"tight", info->isTight},
			{"items", items} };
	}
	case type_e::ListItem:
		return blocksOf(node);
	case type_e::FencedCode: {
		json info = nullptr;
		if (node.info()) {
			info = *node.info();
		}
		return json{ {"type", "fenced_code"}, {"info", info}, {"content", node.text()} };
	}
	case type_e::IndentedCode:
		return json{ {"type", "indented_code"}, {"content", node.text()} };
	case type_e::ThematicBreak:
		return json{ {"type", "thematic_break"} };
	case type_e::Text:
		return json(node.text());
	}
	return nullptr;
}

auto mdbt_test::describe(const md::Node& root) -> std::string {
	std::string out;
	for (auto it = root.begin(); it != root.end(); ++it) {
		fmt::format_to(std::back_inserter(out), "{:{}}{}", "", it.depth() * 2, md::nodeTypeName(it->flavor()));
		if (it->flavor() == md::Node::type_e::Heading) {
			fmt::format_to(std::back_inserter(out), " h{}", static_cast<int>(it->level()));
		}
		if (const auto* list = it->listInfo()) {
			fmt::format_to(std::back_inserter(out), " {}{}", list->isOrdered ? "ordered" : "bullet", list->isTight ? " tight" : " loose");
		}
		if (not it->text().empty()) {
			fmt::format_to(std::back_inserter(out), " \"{}\"", escaped(it->text()));
		}
		out.push_back('\n');
	}
	return out;
}
