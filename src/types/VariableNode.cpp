#include <types/VariableNode.hpp>
#include <evals/evals.hpp>
#include <session.hpp>
#include <exception>


VariableNode::VariableNode(std::string src) : Node(VARIABLE), source(std::move(src)) {
    valid = source.size() == 0 || parseExpression(source, expr, error);
}

void VariableNode::render(StencilWriter* out, const Context& scope, RenderState& state) {
    if (source.size() == 0) { // {{ }} renders as nothing
        return;
    }
    if (!valid) {
        out -> diagnostic("Error processing variable: " + error);
        return;
    }
    EvalsSession evals{ scope, state.session -> filters() };
    try {
        out -> write(evals.evaluate(expr).toString());
    }
    catch (const std::exception& e) { // a custom filter threw; only this variable is lost
        out -> diagnostic("Error processing variable: " + std::string(e.what()));
    }
}

void VariableNode::pTree(int tabLevel) {
    pTabs(tabLevel);
    printf("Variable %s%s\n", source.c_str(), valid ? "" : " (malformed)");
}
