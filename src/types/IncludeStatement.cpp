#include <types/IncludeStatement.hpp>
#include <evals/evals.hpp>
#include <session.hpp>
#include <template.hpp>
#include <util.hpp>
#include <exception>


std::string withTemplateExtension(const std::string& name) {
    if (endsWith(name, ".html") || endsWith(name, ".tpl")) {
        return name;
    }
    return name + ".html";
}


IncludeStatement::IncludeStatement(std::string a) : BlockNode(Include, "include", trim(a)) {}

std::string IncludeStatement::targetName(const Context& scope, RenderState& state) {
    if (startsWith(args, "{{") && endsWith(args, "}}") && args.size() >= 4) { // {{ var }} shorthand
        Expression expr;
        std::string error;
        if (!parseExpression(trim(args.substr(2, args.size() - 4)), expr, error)) {
            return "";
        }
        EvalsSession evals{ scope, state.session -> filters() };
        return evals.evaluate(expr).toString();
    }
    if (isQuoted(args)) {
        return args.substr(1, args.size() - 2);
    }
    if (args.find('.') == std::string::npos && args.find('/') == std::string::npos) { // a bare name might be a variable
        auto it = scope.find(args);
        if (it != scope.end() && it -> second.isString() && it -> second.string.size() > 0) {
            return it -> second.string;
        }
    }
    return args;
}

void IncludeStatement::render(StencilWriter* out, const Context& scope, RenderState& state) {
    int depth = state.depth;
    size_t stackSize = state.includeStack.size();
    try {
        include(out, scope, state);
    }
    catch (const std::exception& e) { // the includer keeps rendering; put the state back the way the throw found it
        state.depth = depth;
        state.includeStack.resize(stackSize);
        out -> diagnostic("Error including template: " + std::string(e.what()));
    }
}

void IncludeStatement::include(StencilWriter* out, const Context& scope, RenderState& state) {
    std::string name = targetName(scope, state);
    if (name.size() == 0) {
        out -> diagnostic("Include failed: no template name in '" + args + "'");
        return;
    }
    if (state.templateDir.size() == 0) {
        out -> diagnostic("Include failed: template directory not set");
        return;
    }
    std::string path = fconcat(state.templateDir, withTemplateExtension(name));
    std::string resolved = canonicalPath(path); // ./a.html and a.html are the same template
    if (resolved == state.rootPath) {
        out -> diagnostic("Error: Circular include detected for '" + name + "'");
        return;
    }
    for (const std::string& including : state.includeStack) {
        if (including == resolved) {
            out -> diagnostic("Error: Circular include detected for '" + name + "'");
            return;
        }
    }
    if (state.includeStack.size() >= STENCIL_MAX_INCLUDE_DEPTH) {
        out -> diagnostic("Error: Maximum include depth exceeded. Possible circular includes.");
        return;
    }
    if (state.session -> debug()) {
        fprintf(stderr, INFO "Including %s\n", path.c_str());
    }
    std::string error;
    std::shared_ptr<Template> target = state.session -> load(path, error);
    if (!target) {
        fprintf(stderr, WARNING "Include of %s failed: %s\n", path.c_str(), error.c_str());
        out -> diagnostic("Include failed: " + path + " (" + error + ")");
        return;
    }
    state.includeStack.push_back(resolved);
    renderNodes(target -> nodes, out, scope, state);
    state.includeStack.pop_back();
}
