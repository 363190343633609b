#include <types/ForLoop.hpp>
#include <evals/evals.hpp>
#include <session.hpp>
#include <util.hpp>
#include <exception>


static bool isName(const std::string& s) {
    if (s.size() == 0 || (s[0] >= '0' && s[0] <= '9')) {
        return false;
    }
    for (char c : s) {
        if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_')) {
            return false;
        }
    }
    return true;
}


ForLoop::ForLoop(std::string a) : BlockNode(For, "for", trim(a)) {
    valid = false;
    size_t i = 0;
    while (i < args.size() && !isWhitespace(args[i])) { i ++; }
    iteratorName = args.substr(0, i);
    std::string rest = trim(args.substr(i));
    if (!isName(iteratorName) || !startsWith(rest, "in") || rest.size() < 3 || !isWhitespace(rest[2])) {
        return;
    }
    std::string error;
    valid = parseExpression(trim(rest.substr(2)), collection, error);
}

void ForLoop::render(StencilWriter* out, const Context& scope, RenderState& state) {
    if (!valid) {
        out -> diagnostic("Invalid for loop syntax: " + args);
        return;
    }
    EvalsSession evals{ scope, state.session -> filters() };
    Value array;
    try {
        array = evals.evaluate(collection);
    }
    catch (const std::exception& e) {
        out -> diagnostic("Error in for loop: " + std::string(e.what()));
        return;
    }
    if (!array.isSequence() || array.size() == 0) { // missing, empty, or not a sequence (mappings don't iterate)
        if (elseChildren != NULL) {
            renderNodes(*elseChildren, out, scope, state);
        }
        return;
    }
    long long length = array.size();
    for (long long i = 0; i < length; i ++) {
        Context iteration = scope; // shallow: containers are shared with the parent, which never sees our additions
        iteration[iteratorName] = (*array.sequence)[i];
        iteration["loop"] = Value(ValueMap{
            { "index", Value(i + 1) },
            { "index0", Value(i) },
            { "first", Value(i == 0) },
            { "last", Value(i == length - 1) },
            { "length", Value(length) }
        });
        renderNodes(children, out, iteration, state);
    }
}
