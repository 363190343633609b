// the lexer splits raw template text into text, variable and block tokens.
// it never fails: anything it can't make sense of comes out as text.
#pragma once
#include <string>
#include <vector>
#include <defs.h>
#include <mapview.hpp>


struct Token {
    enum Kind {
        Text,       // literal text, passed through untouched
        Variable,   // {{ expr }}; value is the trimmed expression
        BlockStart, // {% tag args %} that opens a body
        Block,      // {% tag args %} that doesn't (include)
        BlockEnd,   // {% endtag %}; tagName is the tag being closed ("if" for endif)
        Else        // {% else %}
    } kind;

    std::string value; // the literal text, or the trimmed tag content
    std::string tagName;
    std::string args;
};


bool isSelfClosingTag(const std::string& name);

std::vector<Token> tokenize(MapView map);

std::vector<Token> tokenize(const std::string& source);
