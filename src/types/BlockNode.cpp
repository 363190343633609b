#include <types/BlockNode.hpp>
#include <types/IfStatement.hpp>
#include <types/ForLoop.hpp>
#include <types/IncludeStatement.hpp>
#include <types/UnknownBlock.hpp>


BlockNode::BlockNode(Kind k, std::string n, std::string a) : Node(BLOCK), kind(k), name(std::move(n)), args(std::move(a)) {}

BlockNode::~BlockNode() {
    deleteNodes(children);
    if (elseChildren != NULL) {
        deleteNodes(*elseChildren);
        delete elseChildren;
    }
}

std::vector<Node*>& BlockNode::startElse() {
    if (elseChildren == NULL) {
        elseChildren = new std::vector<Node*>;
    }
    return *elseChildren;
}

void BlockNode::pTree(int tabLevel) {
    pTabs(tabLevel);
    printf("Block %s %s\n", name.c_str(), args.c_str());
    for (Node* child : children) {
        child -> pTree(tabLevel + 1);
    }
    if (elseChildren != NULL) {
        pTabs(tabLevel);
        printf("Else\n");
        for (Node* child : *elseChildren) {
            child -> pTree(tabLevel + 1);
        }
    }
}

BlockNode* makeBlock(const std::string& name, const std::string& args) {
    if (name == "if") {
        return new IfStatement(args);
    }
    else if (name == "for") {
        return new ForLoop(args);
    }
    else if (name == "include") {
        return new IncludeStatement(args);
    }
    return new UnknownBlock(name, args);
}
