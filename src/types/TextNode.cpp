#include <types/TextNode.hpp>


TextNode::TextNode(std::string d) : Node(TEXT), data(std::move(d)) {}

void TextNode::render(StencilWriter* out, const Context& scope, RenderState& state) {
    out -> write(data);
}

void TextNode::pTree(int tabLevel) { // replacing debugPrint because it's much more usefulicious
    pTabs(tabLevel);
    printf("Text content (%zu bytes)\n", data.size());
}


MarkerNode::MarkerNode(std::string m) : Node(TEXT), message(std::move(m)) {}

void MarkerNode::render(StencilWriter* out, const Context& scope, RenderState& state) {
    out -> diagnostic(message);
}

void MarkerNode::pTree(int tabLevel) {
    pTabs(tabLevel);
    printf("Marker: %s\n", message.c_str());
}
