#include <evals/tokens.hpp>
#include <util.hpp>


static bool isIdentStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

static bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

static bool isKeyChar(char c) { // context keys come from JSON and can hold almost anything: first-name, 2fa, @id
    if (isWhitespace(c)) {
        return false;
    }
    switch (c) {
        case '.': case '[': case ']': case '|': case '(': case ')': case ',':
        case '=': case '!': case '<': case '>': case '"': case '\'':
            return false;
        default:
            return true;
    }
}

static bool allDigits(const std::string& s) {
    for (char c : s) {
        if (!isDigit(c)) {
            return false;
        }
    }
    return s.size() > 0;
}


std::vector<ExprToken> lexExpression(const std::string& s) {
    std::vector<ExprToken> tokens;
    size_t i = 0;
    while (true) {
        while (i < s.size() && isWhitespace(s[i])) { i ++; }
        if (i >= s.size()) {
            tokens.push_back(ExprToken{ ExprToken::End, "", 0, i });
            return tokens;
        }
        size_t at = i;
        char c = s[i];
        bool afterDot = tokens.size() > 0 && tokens.back().kind == ExprToken::Dot;
        if (afterDot && isKeyChar(c) && c != '-') { // a path segment: items.0 is an index, data.2fa is a key
            while (i < s.size() && isKeyChar(s[i])) { i ++; }
            std::string text = s.substr(at, i - at);
            if (allDigits(text)) {
                double value = 0;
                parseNumber(text, value);
                tokens.push_back(ExprToken{ ExprToken::Number, text, value, at });
            }
            else {
                tokens.push_back(ExprToken{ ExprToken::Identifier, text, 0, at });
            }
        }
        else if (isIdentStart(c) || (isKeyChar(c) && !isDigit(c) && c != '-' && c != '+')) {
            while (i < s.size() && isKeyChar(s[i])) { i ++; }
            tokens.push_back(ExprToken{ ExprToken::Identifier, s.substr(at, i - at), 0, at });
        }
        else if (isDigit(c) || (c == '-' && i + 1 < s.size() && isDigit(s[i + 1]) && !afterDot)) {
            i ++;
            while (i < s.size() && isDigit(s[i])) { i ++; }
            if (i + 1 < s.size() && s[i] == '.' && isDigit(s[i + 1])) {
                i ++;
                while (i < s.size() && isDigit(s[i])) { i ++; }
            }
            std::string text = s.substr(at, i - at);
            double value = 0;
            parseNumber(text, value);
            tokens.push_back(ExprToken{ ExprToken::Number, text, value, at });
        }
        else if (c == '"' || c == '\'') {
            std::string content;
            i ++;
            bool closed = false;
            while (i < s.size()) {
                if (s[i] == '\\' && i + 1 < s.size()) {
                    char e = s[i + 1];
                    content += e == 'n' ? '\n' : (e == 't' ? '\t' : e);
                    i += 2;
                    continue;
                }
                if (s[i] == c) {
                    closed = true;
                    i ++;
                    break;
                }
                content += s[i];
                i ++;
            }
            if (!closed) {
                tokens.push_back(ExprToken{ ExprToken::Invalid, "unterminated string literal", 0, at });
                return tokens;
            }
            tokens.push_back(ExprToken{ ExprToken::String, content, 0, at });
        }
        else if (c == '=' || c == '!' || c == '<' || c == '>') {
            if (i + 1 < s.size() && s[i + 1] == '=') { // longest match first, so >= is never read as >
                tokens.push_back(ExprToken{ ExprToken::Operator, s.substr(i, 2), 0, at });
                i += 2;
            }
            else if (c == '<' || c == '>') {
                tokens.push_back(ExprToken{ ExprToken::Operator, s.substr(i, 1), 0, at });
                i ++;
            }
            else {
                tokens.push_back(ExprToken{ ExprToken::Invalid, std::string("unexpected '") + c + "'", 0, at });
                return tokens;
            }
        }
        else {
            ExprToken::Kind kind;
            switch (c) {
                case '.': kind = ExprToken::Dot; break;
                case '[': kind = ExprToken::LBracket; break;
                case ']': kind = ExprToken::RBracket; break;
                case '(': kind = ExprToken::LParen; break;
                case ')': kind = ExprToken::RParen; break;
                case ',': kind = ExprToken::Comma; break;
                case '|': kind = ExprToken::Pipe; break;
                default:
                    tokens.push_back(ExprToken{ ExprToken::Invalid, std::string("unexpected '") + c + "'", 0, at });
                    return tokens;
            }
            tokens.push_back(ExprToken{ kind, std::string(1, c), 0, at });
            i ++;
        }
    }
}
