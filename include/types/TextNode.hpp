#pragma once
#include <string>
#include <node.hpp>


struct TextNode : Node {
    std::string data;

    TextNode(std::string d);

    void render(StencilWriter* out, const Context& scope, RenderState& state);

    void pTree(int tabLevel = 0);
};


struct MarkerNode : Node { // a problem found while building the tree (unclosed block etc.), rendered as a diagnostic
    std::string message;

    MarkerNode(std::string m);

    void render(StencilWriter* out, const Context& scope, RenderState& state);

    void pTree(int tabLevel = 0);
};
