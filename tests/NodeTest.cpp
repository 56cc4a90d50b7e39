#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "md_blocktree/MDBlockTree.h"

namespace md = md_blocktree;
using md::Node;
using type_e = Node::type_e;

namespace {
	template <typename... Ts>
	auto nodes(Ts&&... ts) -> std::vector<Node> {
		std::vector<Node> out;
		(out.push_back(std::forward<Ts>(ts)), ...);
		return out;
	}

	auto sampleDocument() -> Node {
		const md::ListInfo info{ md::ListInfo::symbol_e::star, false, 1, true };
		return Node::document(nodes(
			Node::heading(1, "Title", false),
			Node::blockquote(nodes(Node::paragraph("quoted"))),
			Node::list(info, nodes(Node::listItem(nodes(Node::paragraph("item")))))));
	}
}

TEST(MDBTNodeTest, ParagraphAndHeading) {
	auto para = Node::paragraph("some *text*");
	EXPECT_EQ(para.flavor(), type_e::Paragraph);
	EXPECT_TRUE(para.isLeaf());
	ASSERT_EQ(para.children().size(), 1u);
	EXPECT_EQ(para.children()[0].flavor(), type_e::Text);
	EXPECT_EQ(para.children()[0].text(), "some *text*");
	EXPECT_EQ(para.level(), 0);
	EXPECT_EQ(para.listInfo(), nullptr);
	EXPECT_FALSE(para.info().has_value());

	auto heading = Node::heading(2, "Sub", true);
	EXPECT_EQ(heading.level(), 2);
	EXPECT_TRUE(heading.isSetext());
	EXPECT_TRUE(heading.isLeaf());
	EXPECT_EQ(heading.children()[0].text(), "Sub");
}

TEST(MDBTNodeTest, CodeBlocks) {
	auto fenced = Node::fencedCode({ md::FencedCodeInfo::symbol_e::BackTick, 3, std::string("js") }, "let x;");
	EXPECT_EQ(fenced.flavor(), type_e::FencedCode);
	EXPECT_TRUE(fenced.children().empty());
	EXPECT_EQ(fenced.text(), "let x;");
	ASSERT_TRUE(fenced.info().has_value());
	EXPECT_EQ(*fenced.info(), "js");
	ASSERT_NE(fenced.fenceInfo(), nullptr);
	EXPECT_EQ(fenced.fenceInfo()->length, 3u);

	auto indented = Node::indentedCode("x = 1");
	EXPECT_EQ(indented.text(), "x = 1");
	EXPECT_EQ(indented.fenceInfo(), nullptr);
	EXPECT_FALSE(indented.info().has_value());

	auto rule = Node::thematicBreak();
	EXPECT_TRUE(rule.children().empty());
	EXPECT_TRUE(rule.text().empty());
}

TEST(MDBTNodeTest, PreOrderWalk) {
	const auto doc = sampleDocument();
	std::vector<type_e> order;
	std::vector<std::size_t> depths;
	for (auto it = doc.begin(); it != doc.end(); ++it) {
		order.push_back(it->flavor());
		depths.push_back(it.depth());
	}

	const std::vector<type_e> expectedOrder{
		type_e::Document,
		type_e::Heading, type_e::Text,
		type_e::Blockquote, type_e::Paragraph, type_e::Text,
		type_e::List, type_e::ListItem, type_e::Paragraph, type_e::Text };
	const std::vector<std::size_t> expectedDepths{ 0, 1, 2, 1, 2, 3, 1, 2, 3, 4 };
	EXPECT_EQ(order, expectedOrder);
	EXPECT_EQ(depths, expectedDepths);
}

TEST(MDBTNodeTest, WalkFromSubtree) {
	const auto doc = sampleDocument();
	const auto& quote = doc.children()[1];

	std::size_t visited = 0;
	for (const auto& node : quote) {
		(void)node;
		++visited;
	}
	EXPECT_EQ(visited, 3u);

	auto it = quote.begin();
	auto old = it++;
	EXPECT_EQ(old->flavor(), type_e::Blockquote);
	EXPECT_EQ(it->flavor(), type_e::Paragraph);
	EXPECT_NE(old, it);

	auto leaf = Node::textLiteral("t");
	auto single = leaf.begin();
	EXPECT_EQ(&*single, &leaf);
	EXPECT_EQ(++single, leaf.end());
	EXPECT_EQ(++single, leaf.end());
}

TEST(MDBTNodeTest, StructuralEquality) {
	EXPECT_EQ(sampleDocument(), sampleDocument());
	EXPECT_NE(Node::paragraph("a"), Node::paragraph("b"));
	EXPECT_NE(Node::heading(1, "a", false), Node::heading(1, "a", true));
	EXPECT_NE(Node::paragraph("a"), Node::heading(1, "a", false));

	const md::ListInfo tightInfo{ md::ListInfo::symbol_e::dash, false, 1, true };
	md::ListInfo looseInfo = tightInfo;
	looseInfo.isTight = false;
	EXPECT_NE(Node::list(tightInfo, {}), Node::list(looseInfo, {}));

	auto a = Node::fencedCode({ md::FencedCodeInfo::symbol_e::Tilde, 3, std::nullopt }, "x");
	auto b = Node::fencedCode({ md::FencedCodeInfo::symbol_e::Tilde, 3, std::string("sh") }, "x");
	EXPECT_NE(a, b);
}

TEST(MDBTNodeTest, TypeNames) {
	EXPECT_STREQ(md::nodeTypeName(type_e::Document), "document");
	EXPECT_STREQ(md::nodeTypeName(type_e::FencedCode), "fenced_code");
	EXPECT_STREQ(md::nodeTypeName(type_e::ThematicBreak), "thematic_break");
	EXPECT_STREQ(md::nodeTypeName(type_e::ListItem), "list_item");
}
