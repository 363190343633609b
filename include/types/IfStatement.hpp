#pragma once
#include <node.hpp>
#include <types/BlockNode.hpp>
#include <evals/expression.hpp>


struct IfStatement : BlockNode {
    Condition condition;
    bool valid;
    std::string error;

    IfStatement(std::string args);

    void render(StencilWriter* out, const Context& scope, RenderState& state);
};
