#include <gtest/gtest.h>
#include <template.hpp>
#include <types/BlockNode.hpp>
#include <types/TextNode.hpp>
#include <types/VariableNode.hpp>
#include <types/ForLoop.hpp>
#include <types/IfStatement.hpp>


static std::string textOf(Node* node) {
    TextNode* text = dynamic_cast<TextNode*>(node);
    return text == NULL ? "<not text>" : text -> data;
}

static std::string markerOf(Node* node) {
    MarkerNode* marker = dynamic_cast<MarkerNode*>(node);
    return marker == NULL ? "<not a marker>" : marker -> message;
}


TEST(test_treebuilder, flat_template) {
    auto tpl = parseTemplate(std::string("Hi {{ name }}."));
    ASSERT_EQ(tpl -> nodes.size(), 3u);
    EXPECT_EQ(tpl -> nodes[0] -> type, Node::TEXT);
    EXPECT_EQ(tpl -> nodes[1] -> type, Node::VARIABLE);
    EXPECT_EQ(textOf(tpl -> nodes[2]), ".");
}

TEST(test_treebuilder, if_with_else) {
    auto tpl = parseTemplate(std::string("{% if x %}A{% else %}B{% endif %}"));
    ASSERT_EQ(tpl -> nodes.size(), 1u);
    IfStatement* block = dynamic_cast<IfStatement*>(tpl -> nodes[0]);
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block -> kind, BlockNode::If);
    ASSERT_EQ(block -> children.size(), 1u);
    EXPECT_EQ(textOf(block -> children[0]), "A");
    ASSERT_NE(block -> elseChildren, nullptr);
    ASSERT_EQ(block -> elseChildren -> size(), 1u);
    EXPECT_EQ(textOf((*block -> elseChildren)[0]), "B");
}

TEST(test_treebuilder, else_is_absent_until_seen) {
    auto tpl = parseTemplate(std::string("{% if x %}{% endif %}"));
    BlockNode* block = dynamic_cast<BlockNode*>(tpl -> nodes[0]);
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block -> children.size(), 0u);
    EXPECT_EQ(block -> elseChildren, nullptr);
}

TEST(test_treebuilder, nesting) {
    auto tpl = parseTemplate(std::string("{% if a %}<ul>{% for x in xs %}<li>{{ x }}</li>{% endfor %}</ul>{% endif %}tail"));
    ASSERT_EQ(tpl -> nodes.size(), 2u);
    BlockNode* outer = dynamic_cast<BlockNode*>(tpl -> nodes[0]);
    ASSERT_NE(outer, nullptr);
    ASSERT_EQ(outer -> children.size(), 3u);
    ForLoop* loop = dynamic_cast<ForLoop*>(outer -> children[1]);
    ASSERT_NE(loop, nullptr);
    EXPECT_TRUE(loop -> valid);
    EXPECT_EQ(loop -> iteratorName, "x");
    EXPECT_EQ(loop -> children.size(), 3u);
    EXPECT_EQ(textOf(tpl -> nodes[1]), "tail");
}

TEST(test_treebuilder, include_takes_no_body) {
    auto tpl = parseTemplate(std::string("{% if a %}{% include \"x\" %}after{% endif %}"));
    ASSERT_EQ(tpl -> nodes.size(), 1u);
    BlockNode* block = dynamic_cast<BlockNode*>(tpl -> nodes[0]);
    ASSERT_EQ(block -> children.size(), 2u);
    BlockNode* include = dynamic_cast<BlockNode*>(block -> children[0]);
    ASSERT_NE(include, nullptr);
    EXPECT_EQ(include -> kind, BlockNode::Include);
    EXPECT_EQ(textOf(block -> children[1]), "after");
}

TEST(test_treebuilder, unmatched_closing_tag) {
    auto tpl = parseTemplate(std::string("a{% endif %}b"));
    ASSERT_EQ(tpl -> nodes.size(), 3u);
    EXPECT_EQ(textOf(tpl -> nodes[0]), "a");
    EXPECT_EQ(markerOf(tpl -> nodes[1]), "Unmatched closing tag: endif");
    EXPECT_EQ(textOf(tpl -> nodes[2]), "b");
}

TEST(test_treebuilder, unclosed_block) {
    auto tpl = parseTemplate(std::string("{% if x %}content"));
    ASSERT_EQ(tpl -> nodes.size(), 1u);
    BlockNode* block = dynamic_cast<BlockNode*>(tpl -> nodes[0]);
    ASSERT_NE(block, nullptr);
    ASSERT_EQ(block -> children.size(), 2u);
    EXPECT_EQ(textOf(block -> children[0]), "content");
    EXPECT_EQ(markerOf(block -> children[1]), "Unclosed block: if");
}

TEST(test_treebuilder, unclosed_blocks_close_innermost_first) {
    auto tpl = parseTemplate(std::string("{% for x in xs %}{% if x %}y"));
    BlockNode* loop = dynamic_cast<BlockNode*>(tpl -> nodes[0]);
    ASSERT_NE(loop, nullptr);
    ASSERT_EQ(loop -> children.size(), 2u);
    BlockNode* cond = dynamic_cast<BlockNode*>(loop -> children[0]);
    ASSERT_NE(cond, nullptr);
    EXPECT_EQ(markerOf(cond -> children.back()), "Unclosed block: if");
    EXPECT_EQ(markerOf(loop -> children[1]), "Unclosed block: for");
}

TEST(test_treebuilder, else_outside_block) {
    auto tpl = parseTemplate(std::string("x{% else %}y"));
    ASSERT_EQ(tpl -> nodes.size(), 3u);
    EXPECT_EQ(markerOf(tpl -> nodes[1]), "Unexpected else tag outside of a block");
}

TEST(test_treebuilder, unknown_tags_become_blocks) {
    auto tpl = parseTemplate(std::string("{% spoiler %}hidden{% endspoiler %}"));
    ASSERT_EQ(tpl -> nodes.size(), 1u);
    BlockNode* block = dynamic_cast<BlockNode*>(tpl -> nodes[0]);
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block -> kind, BlockNode::Unknown);
    EXPECT_EQ(block -> name, "spoiler");
    EXPECT_EQ(block -> children.size(), 1u);
}
