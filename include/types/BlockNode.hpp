#pragma once
#include <string>
#include <vector>
#include <node.hpp>


struct BlockNode : Node { // superclass for {% %} tags. if and for have a body; include doesn't
    enum Kind {
        If,
        For,
        Include,
        Unknown
    } kind;

    std::string name;
    std::string args;
    std::vector<Node*> children;
    std::vector<Node*>* elseChildren = NULL; // only non-NULL once an else tag has been seen inside this block

    BlockNode(Kind k, std::string n, std::string a);

    ~BlockNode();

    std::vector<Node*>& startElse();

    void pTree(int tabLevel = 0);
};


BlockNode* makeBlock(const std::string& name, const std::string& args); // picks the right subclass for a tag name
