// parsed forms of the expression language.
//   expression := operand ( "|" filter )*
//   operand    := path | "string" | number
//   path       := name ( "." name | "." index | "[" index "]" )*
//   filter     := name [ "(" arg ( "," arg )* ")" ]       arg := "string" | number | bareword
//                 | "default" "(" operand ( "|" filter )+ ")"      the fallback is an expression, one level deep
//   condition  := "not" condition | expression [ op expression ]      op := == != >= <= > <
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <value.hpp>


struct PathSegment {
    enum Kind {
        Key,
        Index
    } kind;
    std::string key;
    size_t index = 0;
};


struct Operand {
    enum Kind {
        Path,
        Literal
    } kind = Path;
    std::vector<PathSegment> path;
    Value literal;
};


struct Expression;


struct FilterCall {
    std::string name;
    std::vector<Value> args;
    std::shared_ptr<Expression> fallback; // default(subtitle|default("x")): evaluated against the scope in place of args
};


struct Expression {
    Operand operand;
    std::vector<FilterCall> filters;
};


struct Condition {
    bool negate = false;
    bool compare = false; // false means plain truthiness of left
    Expression left;
    std::string op;
    Expression right;
};


bool parsePath(const std::string& source, std::vector<PathSegment>& out, std::string& error);

bool parseFilterChain(const std::string& source, std::vector<FilterCall>& out, std::string& error); // "upper|truncate(3)", leading | optional

bool parseExpression(const std::string& source, Expression& out, std::string& error);

bool parseCondition(const std::string& source, Condition& out, std::string& error);
