// the tree builder nests a flat token stream into if/for/include blocks.
// it never fails: unmatched and unclosed tags become visible markers in the output instead of errors,
// because templates are usually hand-edited and a page with a marker in it beats no page at all.
#pragma once
#include <vector>
#include <lexer.hpp>
#include <template.hpp>
#include <types/BlockNode.hpp>


struct TreeFrame { // one open block
    BlockNode* block;
    bool inElse = false;

    std::vector<Node*>& target(); // where new nodes go right now
};


struct TreeBuilder {
    std::vector<Node*> nodes; // top level
    std::vector<TreeFrame> stack;

    std::vector<Node*>& target();

    void feed(const Token& token);

    void finish(); // closes anything still open

    std::shared_ptr<Template> build(const std::vector<Token>& tokens);
};
