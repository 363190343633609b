// the filter registry maps filter names to functions of (value, args...).
// a session owns one; built-ins are installed by the constructor and can be replaced.
#pragma once
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <value.hpp>


typedef std::function<Value(const Value& value, const std::vector<Value>& args)> FilterFunction;


class FilterRegistry {
    std::map<std::string, FilterFunction> filters;

public:
    FilterRegistry(); // with the built-ins

    void add(const std::string& name, FilterFunction filter); // re-adding a name silently replaces it

    bool has(const std::string& name) const;

    Value apply(const std::string& name, const Value& value, const std::vector<Value>& args) const;
    // unknown names pass the value through unchanged

    std::vector<std::string> names() const;
};


// the built-ins, exposed so they can be tested (and reused by custom filters) directly
Value filterUpper(const Value& value, const std::vector<Value>& args);
Value filterLower(const Value& value, const std::vector<Value>& args);
Value filterLength(const Value& value, const std::vector<Value>& args);
Value filterTruncate(const Value& value, const std::vector<Value>& args);
Value filterEscape(const Value& value, const std::vector<Value>& args);
Value filterDefault(const Value& value, const std::vector<Value>& args);
Value filterNumberFormat(const Value& value, const std::vector<Value>& args);
Value filterDateFormat(const Value& value, const std::vector<Value>& args);

std::string htmlEscape(const std::string& data);
