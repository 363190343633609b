#include <types/UnknownBlock.hpp>


UnknownBlock::UnknownBlock(std::string n, std::string a) : BlockNode(Unknown, std::move(n), std::move(a)) {}

void UnknownBlock::render(StencilWriter* out, const Context& scope, RenderState& state) {
    if (children.size() > 0) {
        renderNodes(children, out, scope, state);
    }
    else {
        out -> diagnostic("Unknown block type: " + name);
    }
}
