#include <evals/evals.hpp>
#include <util.hpp>


static const Value* step(const Value* current, const PathSegment& seg) {
    if (seg.kind == PathSegment::Index) {
        if (current -> isSequence()) {
            return current -> at(seg.index);
        }
        return current -> get(seg.key); // mappings can have numeric-looking keys
    }
    return current -> get(seg.key);
}

Value lookupPath(const Context& scope, const std::vector<PathSegment>& path) {
    if (path.size() == 0 || path[0].kind != PathSegment::Key) {
        return Value();
    }
    auto root = scope.find(path[0].key);
    if (root == scope.end()) {
        return Value();
    }
    const Value* current = &root -> second;
    for (size_t i = 1; i < path.size(); i ++) {
        current = step(current, path[i]);
        if (current == NULL) {
            return Value();
        }
    }
    return *current;
}

Value EvalsSession::lookup(const std::vector<PathSegment>& path) const {
    return lookupPath(scope, path);
}

Value EvalsSession::applyFilters(Value value, const std::vector<FilterCall>& chain) const {
    for (const FilterCall& call : chain) {
        if (call.fallback) {
            value = filters.apply(call.name, value, { evaluate(*call.fallback) });
        }
        else {
            value = filters.apply(call.name, value, call.args);
        }
    }
    return value;
}

Value EvalsSession::evaluate(const Expression& expr) const {
    Value base = expr.operand.kind == Operand::Literal ? expr.operand.literal : lookup(expr.operand.path);
    return applyFilters(base, expr.filters);
}

bool EvalsSession::test(const Condition& cond) const {
    bool result;
    if (cond.compare) {
        result = compareValues(evaluate(cond.left), cond.op, evaluate(cond.right));
    }
    else {
        result = evaluate(cond.left).truthyness();
    }
    return cond.negate ? !result : result;
}


template <typename T>
static bool ordered(const T& left, const std::string& op, const T& right) {
    if (op == "==") return left == right;
    if (op == "!=") return left != right;
    if (op == ">=") return left >= right;
    if (op == "<=") return left <= right;
    if (op == ">") return left > right;
    if (op == "<") return left < right;
    return false;
}

bool compareValues(const Value& left, const std::string& op, const Value& right) {
    double l, r;
    if (left.toNumber(l) && right.toNumber(r)) {
        return ordered(l, op, r);
    }
    return ordered(left.toString(), op, right.toString());
}


static Value resolve(const Context& context, const Expression& expr) {
    Value ret = expr.operand.kind == Operand::Literal ? expr.operand.literal : lookupPath(context, expr.operand.path);
    for (const FilterCall& call : expr.filters) { // resolution only understands |default(...); real filtering happens in EvalsSession
        if (call.name == "default") {
            if (call.fallback) {
                ret = filterDefault(ret, { resolve(context, *call.fallback) });
            }
            else {
                ret = filterDefault(ret, call.args);
            }
        }
    }
    return ret;
}

Value get(const Context& context, const std::string& path) {
    Expression expr;
    std::string error;
    if (!parseExpression(path, expr, error)) {
        return Value();
    }
    return resolve(context, expr);
}

Value applyFilters(const Value& value, const std::string& chain, const FilterRegistry& filters) {
    std::vector<FilterCall> calls;
    std::string error;
    if (!parseFilterChain(chain, calls, error)) {
        fprintf(stderr, WARNING "Ignoring malformed filter chain '%s': %s\n", chain.c_str(), error.c_str());
        return value;
    }
    Context empty;
    EvalsSession session{ empty, filters };
    return session.applyFilters(value, calls);
}

bool truthy(const Context& context, const std::string& condition, const FilterRegistry& filters, std::string* error) {
    if (trim(condition).size() == 0) {
        return false;
    }
    Condition cond;
    std::string reason;
    if (!parseCondition(condition, cond, reason)) {
        if (error != NULL) {
            *error = reason;
        }
        return false;
    }
    EvalsSession session{ context, filters };
    return session.test(cond);
}
