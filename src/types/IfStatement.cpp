#include <types/IfStatement.hpp>
#include <evals/evals.hpp>
#include <session.hpp>
#include <util.hpp>
#include <exception>


IfStatement::IfStatement(std::string a) : BlockNode(If, "if", trim(a)) {
    valid = args.size() == 0 || parseCondition(args, condition, error);
}

void IfStatement::render(StencilWriter* out, const Context& scope, RenderState& state) {
    if (!valid) {
        out -> diagnostic("Error in if condition: " + error);
        return;
    }
    EvalsSession evals{ scope, state.session -> filters() };
    bool cond;
    try {
        cond = args.size() > 0 && evals.test(condition); // an empty condition is false
    }
    catch (const std::exception& e) {
        out -> diagnostic("Error in if condition: " + std::string(e.what()));
        return;
    }
    if (cond) {
        renderNodes(children, out, scope, state);
    }
    else if (elseChildren != NULL) {
        renderNodes(*elseChildren, out, scope, state);
    }
}
