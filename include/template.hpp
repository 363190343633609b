// a Template is a parsed (not rendered) template: the top-level nodes of its block tree.
// templates are immutable once built, so one can be rendered by many threads at once, and the cache hands them out by shared pointer.
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <defs.h>
#include <node.hpp>
#include <lexer.hpp>


struct Template {
    std::vector<Node*> nodes;
    std::string path; // where it was loaded from, empty for template strings

    Template() = default;

    Template(const Template&) = delete;

    ~Template();

    void pTree();
};


std::shared_ptr<Template> buildTree(const std::vector<Token>& tokens); // never fails. see treebuilder.cpp

std::shared_ptr<Template> parseTemplate(const std::string& source);

std::shared_ptr<Template> parseTemplate(MapView source);
