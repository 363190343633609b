#include <treebuilder.hpp>
#include <types/TextNode.hpp>
#include <types/VariableNode.hpp>


std::vector<Node*>& TreeFrame::target() {
    if (inElse) {
        return block -> startElse();
    }
    return block -> children;
}

std::vector<Node*>& TreeBuilder::target() {
    if (stack.size() == 0) {
        return nodes;
    }
    return stack.back().target();
}

void TreeBuilder::feed(const Token& token) {
    switch (token.kind) {
        case Token::Text:
            target().push_back(new TextNode(token.value));
            break;
        case Token::Variable:
            target().push_back(new VariableNode(token.value));
            break;
        case Token::Block:
            target().push_back(makeBlock(token.tagName, token.args));
            break;
        case Token::BlockStart: {
            BlockNode* block = makeBlock(token.tagName, token.args);
            target().push_back(block);
            stack.push_back(TreeFrame{ block });
            break;
        }
        case Token::Else:
            if (stack.size() == 0) {
                fprintf(stderr, WARNING "else tag outside of any block.\n");
                target().push_back(new MarkerNode("Unexpected else tag outside of a block"));
            }
            else {
                stack.back().inElse = true;
                stack.back().block -> startElse();
            }
            break;
        case Token::BlockEnd:
            if (stack.size() == 0) {
                fprintf(stderr, WARNING "Unmatched closing tag %s.\n", token.value.c_str());
                target().push_back(new MarkerNode("Unmatched closing tag: " + token.value));
            }
            else {
                if (token.tagName.size() > 0 && token.tagName != stack.back().block -> name) {
                    fprintf(stderr, WARNING "%s closes a %s block.\n", token.value.c_str(), stack.back().block -> name.c_str());
                }
                stack.pop_back();
            }
            break;
    }
}

void TreeBuilder::finish() {
    while (stack.size() > 0) {
        BlockNode* block = stack.back().block;
        fprintf(stderr, WARNING "Unclosed block %s; it runs to the end of the template.\n", block -> name.c_str());
        stack.back().target().push_back(new MarkerNode("Unclosed block: " + block -> name));
        stack.pop_back();
    }
}

std::shared_ptr<Template> TreeBuilder::build(const std::vector<Token>& tokens) {
    for (const Token& token : tokens) {
        feed(token);
    }
    finish();
    std::shared_ptr<Template> ret = std::make_shared<Template>();
    ret -> nodes = std::move(nodes);
    nodes.clear();
    return ret;
}


std::shared_ptr<Template> buildTree(const std::vector<Token>& tokens) {
    TreeBuilder builder;
    return builder.build(tokens);
}
