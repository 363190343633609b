// tokens for the expression language used inside {{ }} and {% if %}
#pragma once
#include <string>
#include <vector>


struct ExprToken {
    enum Kind {
        Identifier, // name, user_id, not
        Number,     // 42, 2.5, -3
        String,     // "text" or 'text', unescaped
        Dot,
        LBracket,
        RBracket,
        LParen,
        RParen,
        Comma,
        Pipe,
        Operator,   // == != >= <= > <
        End,
        Invalid     // text is the reason
    } kind;

    std::string text;
    double number = 0;
    size_t pos = 0; // offset into the source, for error messages
};


std::vector<ExprToken> lexExpression(const std::string& source); // always ends with an End or Invalid token
