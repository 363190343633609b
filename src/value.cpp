#include <value.hpp>
#include <util.hpp>


Value::Value() {}

Value::Value(bool b) : type(Boolean), boolean(b) {}

Value::Value(int n) : type(Number), number(n) {}

Value::Value(long n) : type(Number), number(n) {}

Value::Value(long long n) : type(Number), number(n) {}

Value::Value(double n) : type(Number), number(n) {}

Value::Value(const char* s) {
    if (s != NULL) {
        type = String;
        string = s;
    }
}

Value::Value(std::string s) : type(String), string(std::move(s)) {}

Value::Value(ValueList list) : type(Sequence), sequence(std::make_shared<ValueList>(std::move(list))) {}

Value::Value(ValueMap map) : type(Mapping), mapping(std::make_shared<ValueMap>(std::move(map))) {}

Value Value::list() {
    return Value(ValueList{});
}

Value Value::map() {
    return Value(ValueMap{});
}

size_t Value::size() const {
    if (type == Sequence) {
        return sequence -> size();
    }
    if (type == Mapping) {
        return mapping -> size();
    }
    return 0;
}

const Value* Value::at(size_t index) const {
    if (type != Sequence || index >= sequence -> size()) {
        return NULL;
    }
    return &(*sequence)[index];
}

const Value* Value::get(const std::string& key) const {
    if (type != Mapping) {
        return NULL;
    }
    auto it = mapping -> find(key);
    if (it == mapping -> end()) {
        return NULL;
    }
    return &it -> second;
}

Value& Value::push(Value item) {
    if (type == Null) {
        *this = list();
    }
    if (type == Sequence) {
        if (sequence.use_count() > 1) { // someone else can see this list; copy before writing
            sequence = std::make_shared<ValueList>(*sequence);
        }
        sequence -> push_back(std::move(item));
    }
    return *this;
}

Value& Value::set(const std::string& key, Value item) {
    if (type == Null) {
        *this = map();
    }
    if (type == Mapping) {
        if (mapping.use_count() > 1) {
            mapping = std::make_shared<ValueMap>(*mapping);
        }
        (*mapping)[key] = std::move(item);
    }
    return *this;
}

std::string Value::toString() const {
    switch (type) {
        case Null:
            return "";
        case Boolean:
            return boolean ? "true" : "false";
        case Number:
            return formatNumber(number);
        case String:
            return string;
        case Sequence: {
            std::string ret = "[";
            for (size_t i = 0; i < sequence -> size(); i ++) {
                if (i > 0) {
                    ret += ", ";
                }
                ret += (*sequence)[i].toString();
            }
            return ret + "]";
        }
        case Mapping: {
            std::string ret = "{";
            bool first = true;
            for (auto& entry : *mapping) {
                if (!first) {
                    ret += ", ";
                }
                first = false;
                ret += entry.first + ": " + entry.second.toString();
            }
            return ret + "}";
        }
    }
    return "";
}

bool Value::truthyness() const {
    switch (type) {
        case Null:
            return false;
        case Boolean:
            return boolean;
        case Number:
            return number != 0;
        case String:
            return string.size() > 0;
        default:
            return true; // containers are truthy even when empty
    }
}

bool Value::toNumber(double& out) const {
    if (type == Number) {
        out = number;
        return true;
    }
    if (type == String) {
        return parseNumber(string, out);
    }
    return false;
}

std::string Value::typeName() const {
    switch (type) {
        case Null: return "null";
        case Boolean: return "boolean";
        case Number: return "number";
        case String: return "string";
        case Sequence: return "sequence";
        case Mapping: return "mapping";
    }
    return "unknown";
}

bool Value::operator==(const Value& other) const {
    if (type != other.type) {
        return false;
    }
    switch (type) {
        case Null: return true;
        case Boolean: return boolean == other.boolean;
        case Number: return number == other.number;
        case String: return string == other.string;
        case Sequence: return sequence == other.sequence || *sequence == *other.sequence;
        case Mapping: return mapping == other.mapping || *mapping == *other.mapping;
    }
    return false;
}
