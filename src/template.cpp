#include <template.hpp>


Template::~Template() {
    deleteNodes(nodes);
}

void Template::pTree() {
    printf("Template %s\n", path.size() > 0 ? path.c_str() : "(string)");
    for (Node* node : nodes) {
        node -> pTree(1);
    }
}

std::shared_ptr<Template> parseTemplate(const std::string& source) {
    return buildTree(tokenize(source));
}

std::shared_ptr<Template> parseTemplate(MapView source) {
    return buildTree(tokenize(source));
}
