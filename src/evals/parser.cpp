// recursive-descent parser for the expression language. see evals/expression.hpp for the grammar.
#include <evals/expression.hpp>
#include <evals/tokens.hpp>
#include <cstdint>


static size_t toIndex(double number) { // huge indices can't be in range anyway; keep the cast defined
    if (!(number < 1e18)) {
        return SIZE_MAX;
    }
    return (size_t)number;
}


struct ExprParser {
    std::vector<ExprToken> tokens;
    size_t pos = 0;
    std::string error;
    int nesting = 0; // how many default(...) fallbacks we're inside

    ExprParser(const std::string& source) : tokens(lexExpression(source)) {}

    const ExprToken& peek(size_t ahead = 0) {
        size_t at = pos + ahead;
        if (at >= tokens.size()) {
            return tokens.back();
        }
        return tokens[at];
    }

    const ExprToken& next() {
        const ExprToken& t = peek();
        pos ++; // peek() clamps, so running off the end is harmless
        return t;
    }

    bool fail(const std::string& message) {
        if (error.size() == 0) {
            const ExprToken& t = peek();
            if (t.kind == ExprToken::Invalid) {
                error = t.text + " at offset " + std::to_string(t.pos);
            }
            else {
                error = message + " at offset " + std::to_string(t.pos);
            }
        }
        return false;
    }

    bool atEnd() {
        return peek().kind == ExprToken::End;
    }

    bool path(std::vector<PathSegment>& out) {
        const ExprToken& head = next();
        if (head.kind != ExprToken::Identifier) {
            pos --;
            return fail("expected a name");
        }
        out.push_back(PathSegment{ PathSegment::Key, head.text, 0 });
        while (true) {
            if (peek().kind == ExprToken::Dot) {
                next();
                const ExprToken& seg = next();
                if (seg.kind == ExprToken::Identifier) {
                    out.push_back(PathSegment{ PathSegment::Key, seg.text, 0 });
                }
                else if (seg.kind == ExprToken::Number && seg.number >= 0 && seg.text.find('.') == std::string::npos) {
                    out.push_back(PathSegment{ PathSegment::Index, seg.text, toIndex(seg.number) });
                }
                else {
                    pos --;
                    return fail("expected a name after '.'");
                }
            }
            else if (peek().kind == ExprToken::LBracket) {
                next();
                const ExprToken& idx = next();
                if (idx.kind == ExprToken::Number && idx.number >= 0 && idx.text.find('.') == std::string::npos) {
                    out.push_back(PathSegment{ PathSegment::Index, idx.text, toIndex(idx.number) });
                }
                else if (idx.kind == ExprToken::String) {
                    out.push_back(PathSegment{ PathSegment::Key, idx.text, 0 });
                }
                else {
                    pos --;
                    return fail("expected a non-negative integer index");
                }
                if (next().kind != ExprToken::RBracket) {
                    pos --;
                    return fail("expected ']'");
                }
            }
            else {
                return true;
            }
        }
    }

    bool operand(Operand& out) {
        const ExprToken& t = peek();
        if (t.kind == ExprToken::String) {
            out.kind = Operand::Literal;
            out.literal = Value(t.text);
            next();
            return true;
        }
        if (t.kind == ExprToken::Number) {
            out.kind = Operand::Literal;
            out.literal = Value(t.number);
            next();
            return true;
        }
        out.kind = Operand::Path;
        return path(out.path);
    }

    bool argument(std::vector<Value>& args) {
        const ExprToken& t = next();
        switch (t.kind) {
            case ExprToken::String:
                args.push_back(Value(t.text));
                return true;
            case ExprToken::Number:
                args.push_back(Value(t.number));
                return true;
            case ExprToken::Identifier: { // barewords are strings; dotted barewords stay dotted
                std::string word = t.text;
                while (peek().kind == ExprToken::Dot && (peek(1).kind == ExprToken::Identifier || peek(1).kind == ExprToken::Number)) {
                    next();
                    word += "." + next().text;
                }
                args.push_back(Value(word));
                return true;
            }
            default:
                pos --;
                return fail("expected a filter argument");
        }
    }

    bool filter(std::vector<FilterCall>& out) {
        const ExprToken& name = next();
        if (name.kind != ExprToken::Identifier) {
            pos --;
            return fail("expected a filter name");
        }
        FilterCall call;
        call.name = name.text;
        if (peek().kind == ExprToken::LParen) {
            next();
            if (call.name == "default" && nesting == 0 && fallback(call)) {
                out.push_back(call);
                return true;
            }
            if (peek().kind == ExprToken::RParen) {
                next();
            }
            else {
                while (true) {
                    if (!argument(call.args)) {
                        return false;
                    }
                    const ExprToken& sep = next();
                    if (sep.kind == ExprToken::RParen) {
                        break;
                    }
                    if (sep.kind != ExprToken::Comma) {
                        pos --;
                        return fail("expected ',' or ')'");
                    }
                }
            }
        }
        out.push_back(call);
        return true;
    }

    bool fallback(FilterCall& call) { // the arguments of default(...), if they're a filtered expression. rewinds if not
        size_t start = pos;
        std::string saved = error;
        std::shared_ptr<Expression> inner = std::make_shared<Expression>();
        nesting ++;
        bool ok = expression(*inner) && inner -> filters.size() > 0 && peek().kind == ExprToken::RParen;
        nesting --;
        if (!ok) {
            pos = start;
            error = saved;
            return false;
        }
        next();
        call.fallback = inner;
        return true;
    }

    bool filters(std::vector<FilterCall>& out) {
        while (peek().kind == ExprToken::Pipe) {
            next();
            if (!filter(out)) {
                return false;
            }
        }
        return true;
    }

    bool expression(Expression& out) {
        return operand(out.operand) && filters(out.filters);
    }

    bool condition(Condition& out) {
        while (peek().kind == ExprToken::Identifier && peek().text == "not" && startsOperand(peek(1))) {
            next();
            out.negate = !out.negate;
        }
        if (!expression(out.left)) {
            return false;
        }
        if (peek().kind == ExprToken::Operator) {
            out.compare = true;
            out.op = next().text;
            if (!expression(out.right)) {
                return false;
            }
        }
        return true;
    }

    static bool startsOperand(const ExprToken& t) {
        return t.kind == ExprToken::Identifier || t.kind == ExprToken::Number || t.kind == ExprToken::String;
    }

    bool finish() {
        if (!atEnd()) {
            return fail("unexpected '" + peek().text + "'");
        }
        return true;
    }
};


bool parsePath(const std::string& source, std::vector<PathSegment>& out, std::string& error) {
    ExprParser p(source);
    out.clear();
    if (p.path(out) && p.finish()) {
        return true;
    }
    error = p.error;
    return false;
}

bool parseFilterChain(const std::string& source, std::vector<FilterCall>& out, std::string& error) {
    ExprParser p(source);
    out.clear();
    if (p.atEnd()) {
        return true;
    }
    if (p.peek().kind != ExprToken::Pipe) {
        if (!p.filter(out)) {
            error = p.error;
            return false;
        }
    }
    if (p.filters(out) && p.finish()) {
        return true;
    }
    error = p.error;
    return false;
}

bool parseExpression(const std::string& source, Expression& out, std::string& error) {
    ExprParser p(source);
    out = Expression();
    if (p.expression(out) && p.finish()) {
        return true;
    }
    error = p.error;
    return false;
}

bool parseCondition(const std::string& source, Condition& out, std::string& error) {
    ExprParser p(source);
    out = Condition();
    if (p.atEnd()) {
        error = "empty condition";
        return false;
    }
    if (p.condition(out) && p.finish()) {
        return true;
    }
    error = p.error;
    return false;
}
