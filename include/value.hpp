// Value is the data model templates render against. It's a tagged union (null, boolean, number, string, sequence, mapping), and
// every piece of resolution and comparison logic switches on the tag explicitly.
// Sequences and mappings are held by shared pointer, so copying a Value is shallow; mutating a shared container copies it first.
#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <defs.h>


typedef std::vector<Value> ValueList;
typedef std::map<std::string, Value> ValueMap;
typedef ValueMap Context; // a render context is just a mapping from names to values


struct Value {
    enum Type : int {
        Null,
        Boolean,
        Number,
        String,
        Sequence,
        Mapping
    } type = Null;

    bool boolean = false;
    double number = 0;
    std::string string;
    std::shared_ptr<ValueList> sequence;
    std::shared_ptr<ValueMap> mapping;

    Value();

    Value(bool b);

    Value(int n);

    Value(long n);

    Value(long long n);

    Value(double n);

    Value(const char* s); // NULL becomes a null value

    Value(std::string s);

    Value(ValueList list);

    Value(ValueMap map);

    static Value list();

    static Value map();

    bool isNull() const { return type == Null; }
    bool isString() const { return type == String; }
    bool isNumber() const { return type == Number; }
    bool isSequence() const { return type == Sequence; }
    bool isMapping() const { return type == Mapping; }

    size_t size() const; // element count for sequences/mappings, 0 otherwise

    const Value* at(size_t index) const; // NULL if this isn't a sequence or the index is out of range

    const Value* get(const std::string& key) const; // NULL if this isn't a mapping or the key is missing

    Value& push(Value item); // appends to a sequence (turning a null into an empty sequence first)

    Value& set(const std::string& key, Value item); // sets a key on a mapping (turning a null into an empty mapping first)

    std::string toString() const; // canonical string form; null is ""

    bool truthyness() const; // false for null, false, 0 and ""; everything else is truthy

    bool toNumber(double& out) const; // numbers, and strings that parse entirely as numbers

    std::string typeName() const;

    bool operator==(const Value& other) const;

    bool operator!=(const Value& other) const { return !(*this == other); }
};
