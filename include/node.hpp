#pragma once
#include <string>
#include <vector>
#include <defs.h>
#include <value.hpp>
#include <stencilwriter.hpp>


struct RenderState { // everything one top-level render call needs that isn't the context. never shared between renders
    Session* session;
    std::string templateDir; // where includes are resolved from
    std::string rootPath; // canonical path of the file being rendered, empty for template strings
    std::vector<std::string> includeStack; // canonical paths of the includes currently being rendered
    int depth = 0; // block nesting depth
    int maxNesting = STENCIL_DEFAULT_MAX_NESTING;
};


struct Node { // superclass
    virtual ~Node();

    enum Type {
        TEXT,
        VARIABLE,
        BLOCK
    } type;

    Node(Type t) : type(t) {}

    virtual void render(StencilWriter* out, const Context& scope, RenderState& state) = 0; // true virtual function
    // nodes never fail; problems are written into the output as diagnostics

    virtual void pTree(int tabLevel = 0) = 0; // print the tree, for debugging
};


void renderNodes(const std::vector<Node*>& nodes, StencilWriter* out, const Context& scope, RenderState& state);

void deleteNodes(std::vector<Node*>& nodes);

void pTabs(int tabLevel);
