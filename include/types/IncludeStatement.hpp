#pragma once
#include <string>
#include <node.hpp>
#include <types/BlockNode.hpp>


struct IncludeStatement : BlockNode { // {% include "name" %}, {% include name %} or {% include {{ name }} %}
    IncludeStatement(std::string args);

    std::string targetName(const Context& scope, RenderState& state); // the template name this include refers to right now

    void render(StencilWriter* out, const Context& scope, RenderState& state);

    void include(StencilWriter* out, const Context& scope, RenderState& state); // render() minus the exception guard
};


std::string withTemplateExtension(const std::string& name); // .html and .tpl stay, anything else gets .html
