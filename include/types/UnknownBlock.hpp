#pragma once
#include <node.hpp>
#include <types/BlockNode.hpp>


struct UnknownBlock : BlockNode { // a tag we don't know. its body still renders, so newer templates degrade gracefully
    UnknownBlock(std::string name, std::string args);

    void render(StencilWriter* out, const Context& scope, RenderState& state);
};
