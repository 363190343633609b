#include <filters.hpp>
#include <util.hpp>
#include <ctime>
#include <cmath>


static double numberArg(const std::vector<Value>& args, size_t i, double fallback) {
    double ret;
    if (i < args.size() && args[i].toNumber(ret)) {
        return ret;
    }
    return fallback;
}

static std::string stringArg(const std::vector<Value>& args, size_t i, const std::string& fallback) {
    if (i < args.size() && !args[i].isNull()) {
        return args[i].toString();
    }
    return fallback;
}


Value filterUpper(const Value& value, const std::vector<Value>& args) {
    std::string s = value.toString();
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') {
            c -= 'a' - 'A';
        }
    }
    return Value(s);
}

Value filterLower(const Value& value, const std::vector<Value>& args) {
    std::string s = value.toString();
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') {
            c += 'a' - 'A';
        }
    }
    return Value(s);
}

Value filterLength(const Value& value, const std::vector<Value>& args) {
    switch (value.type) {
        case Value::Sequence:
        case Value::Mapping:
            return Value((double)value.size());
        case Value::String:
            return Value((double)value.string.size());
        default:
            return Value(0);
    }
}

Value filterTruncate(const Value& value, const std::vector<Value>& args) { // truncate(max_len = 30, suffix = "...")
    std::string s = value.toString();
    double max = numberArg(args, 0, 30);
    std::string suffix = stringArg(args, 1, "...");
    if (!(max >= 0)) { // negative or nan
        max = 0;
    }
    if ((double)s.size() <= max) {
        return Value(s);
    }
    size_t limit = (size_t)max; // below s.size() here, so the cast is in range
    size_t keep = limit > suffix.size() ? limit - suffix.size() : 0;
    return Value(s.substr(0, keep) + suffix);
}

std::string htmlEscape(const std::string& data) {
    std::string buffer;
    buffer.reserve(data.size());
    for (char c : data) {
        switch (c) {
            case '&':  buffer += "&amp;"; break;
            case '<':  buffer += "&lt;"; break;
            case '>':  buffer += "&gt;"; break;
            case '"':  buffer += "&quot;"; break;
            case '\'': buffer += "&#39;"; break;
            default:   buffer += c; break;
        }
    }
    return buffer;
}

Value filterEscape(const Value& value, const std::vector<Value>& args) {
    return Value(htmlEscape(value.toString()));
}

Value filterDefault(const Value& value, const std::vector<Value>& args) {
    if (value.isNull() || (value.isString() && value.string.size() == 0)) {
        return args.size() > 0 ? args[0] : Value("");
    }
    return value;
}

Value filterNumberFormat(const Value& value, const std::vector<Value>& args) { // number_format(decimals = 0)
    double number = 0;
    value.toNumber(number); // anything that isn't a number formats as 0
    double wanted = numberArg(args, 0, 0);
    int decimals = 0;
    if (wanted > 20) {
        decimals = 20;
    }
    else if (wanted > 0) {
        decimals = (int)wanted;
    }
    char buffer[512];
    snprintf(buffer, sizeof(buffer), "%.*f", decimals, number);
    std::string str = buffer;
    size_t digitsStart = (str.size() > 0 && str[0] == '-') ? 1 : 0;
    size_t digitsEnd = str.find('.');
    if (digitsEnd == std::string::npos) {
        digitsEnd = str.size();
    }
    std::string ret = str.substr(0, digitsStart);
    size_t count = digitsEnd - digitsStart;
    for (size_t i = 0; i < count; i ++) {
        if (i > 0 && (count - i) % 3 == 0) {
            ret += ',';
        }
        ret += str[digitsStart + i];
    }
    return Value(ret + str.substr(digitsEnd));
}

Value filterDateFormat(const Value& value, const std::vector<Value>& args) { // date_format(format = "%Y-%m-%d"), local time
    if (!value.isNumber()) {
        return value;
    }
    std::string format = stringArg(args, 0, "%Y-%m-%d");
    if (!(std::fabs(value.number) < 1e17)) { // past any calendar localtime can represent
        return Value("");
    }
    time_t when = (time_t)value.number;
    struct tm parts;
    if (localtime_r(&when, &parts) == NULL || format.size() == 0) {
        return Value("");
    }
    char buffer[256];
    size_t written = strftime(buffer, sizeof(buffer), format.c_str(), &parts);
    return Value(std::string(buffer, written));
}


FilterRegistry::FilterRegistry() {
    add("upper", filterUpper);
    add("lower", filterLower);
    add("length", filterLength);
    add("truncate", filterTruncate);
    add("escape", filterEscape);
    add("default", filterDefault);
    add("number_format", filterNumberFormat);
    add("date_format", filterDateFormat);
}

void FilterRegistry::add(const std::string& name, FilterFunction filter) {
    filters[name] = filter;
}

bool FilterRegistry::has(const std::string& name) const {
    return filters.contains(name);
}

Value FilterRegistry::apply(const std::string& name, const Value& value, const std::vector<Value>& args) const {
    auto it = filters.find(name);
    if (it == filters.end() || !it -> second) {
        return value;
    }
    return it -> second(value, args);
}

std::vector<std::string> FilterRegistry::names() const {
    std::vector<std::string> ret;
    for (auto& entry : filters) {
        ret.push_back(entry.first);
    }
    return ret;
}
