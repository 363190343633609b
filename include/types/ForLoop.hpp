#pragma once
#include <string>
#include <node.hpp>
#include <types/BlockNode.hpp>
#include <evals/expression.hpp>


struct ForLoop : BlockNode {
    std::string iteratorName; // the name each element is bound to inside the body
    Expression collection; // what we're iterating over
    bool valid;

    ForLoop(std::string args); // "<var> in <expr>"

    void render(StencilWriter* out, const Context& scope, RenderState& state);
};
