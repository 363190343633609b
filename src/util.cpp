#include <util.hpp>
#include <cstdlib>
#include <cmath>
// definitions for util functions

bool isWhitespace(char thing) {
    return thing == ' ' || thing == '\t' || thing == '\n' || thing == '\r';
}

std::string trim(const std::string& thing) {
    size_t start = 0;
    size_t end = thing.size();
    while (start < end && isWhitespace(thing[start])) { start ++; }
    while (end > start && isWhitespace(thing[end - 1])) { end --; }
    return thing.substr(start, end - start);
}

bool startsWith(const std::string& thing, const std::string& prefix, size_t at) {
    if (at > thing.size() || thing.size() - at < prefix.size()) {
        return false;
    }
    return thing.compare(at, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& thing, const std::string& suffix) {
    if (thing.size() < suffix.size()) {
        return false;
    }
    return thing.compare(thing.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isQuoted(const std::string& thing) {
    if (thing.size() < 2) {
        return false;
    }
    char q = thing[0];
    return (q == '"' || q == '\'') && thing[thing.size() - 1] == q;
}

std::string unquote(const std::string& thing) {
    if (isQuoted(thing)) {
        return thing.substr(1, thing.size() - 2);
    }
    return thing;
}

bool parseNumber(const std::string& thing, double& out) {
    std::string t = trim(thing);
    if (t.size() == 0) {
        return false;
    }
    // strtod also eats "inf", "nan" and hex; those aren't numbers as far as templates are concerned
    for (char c : t) {
        if (!((c >= '0' && c <= '9') || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E')) {
            return false;
        }
    }
    char* end = NULL;
    double value = strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) {
        return false;
    }
    out = value;
    return true;
}

std::string formatNumber(double number) {
    if (std::isnan(number)) {
        return "nan";
    }
    if (std::isinf(number)) {
        return number < 0 ? "-inf" : "inf";
    }
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%.14g", number);
    return buffer;
}

std::string fconcat(std::string one, std::string two) {
    if (one.size() == 0) {
        return two;
    }
    if (two.size() == 0) {
        return one;
    }
    if (one[one.size() - 1] == '/' && two[0] == '/') {
        return one.substr(0, one.size() - 1) + two;
    }
    else if (one[one.size() - 1] == '/' || two[0] == '/') {
        return one + two;
    }
    else {
        return one + '/' + two;
    }
}

std::string trim2dir(std::string file) {
    size_t slash = file.rfind('/');
    if (slash == std::string::npos) {
        return ".";
    }
    if (slash == 0) {
        return "/";
    }
    return file.substr(0, slash);
}

std::string canonicalPath(const std::string& path) {
    char* resolved = realpath(path.c_str(), NULL);
    if (resolved == NULL) {
        return path;
    }
    std::string ret = resolved;
    free(resolved);
    return ret;
}
