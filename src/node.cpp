#include <node.hpp>


Node::~Node() {}

void renderNodes(const std::vector<Node*>& nodes, StencilWriter* out, const Context& scope, RenderState& state) {
    if (state.depth >= state.maxNesting) { // deeply nested if/for trees are bounded here, includes have their own limit
        out -> diagnostic("Error: Maximum nesting depth exceeded");
        return;
    }
    state.depth ++;
    for (Node* node : nodes) {
        node -> render(out, scope, state);
    }
    state.depth --;
}

void deleteNodes(std::vector<Node*>& nodes) {
    for (Node* node : nodes) {
        delete node;
    }
    nodes.clear();
}

void pTabs(int tabLevel) {
    for (int x = 0; x < tabLevel; x ++) {printf("\t");}
}
