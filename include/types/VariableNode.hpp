#pragma once
#include <string>
#include <node.hpp>
#include <evals/expression.hpp>


struct VariableNode : Node { // {{ expr }}. the expression is parsed once, when the tree is built
    std::string source;
    Expression expr;
    bool valid;
    std::string error;

    VariableNode(std::string src);

    void render(StencilWriter* out, const Context& scope, RenderState& state);

    void pTree(int tabLevel = 0);
};
