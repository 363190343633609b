// Evals evaluates the expression language against a render context: dotted/indexed lookups, filter pipelines, and the
// comparisons {% if %} needs. Nothing in here fails loudly; a lookup that goes nowhere is just null.
#pragma once
#include <defs.h>
#include <evals/expression.hpp>
#include <filters.hpp>


struct EvalsSession {
    const Context& scope;
    const FilterRegistry& filters;

    Value lookup(const std::vector<PathSegment>& path) const; // null the moment a segment is missing or not traversable

    Value evaluate(const Expression& expr) const;

    Value applyFilters(Value value, const std::vector<FilterCall>& chain) const;

    bool test(const Condition& cond) const;
};


Value lookupPath(const Context& scope, const std::vector<PathSegment>& path);


bool compareValues(const Value& left, const std::string& op, const Value& right);
// numeric comparison if both sides coerce to numbers, otherwise string comparison


// convenience forms that take source strings

Value get(const Context& context, const std::string& path); // "a.b[2].c", optionally with |default("x"); null on a malformed path

Value applyFilters(const Value& value, const std::string& chain, const FilterRegistry& filters); // "upper|truncate(3)"; a malformed chain is a no-op

bool truthy(const Context& context, const std::string& condition, const FilterRegistry& filters, std::string* error = NULL);
// empty conditions are false. a malformed condition is false, and its reason goes to *error if that's given
