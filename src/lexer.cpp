#include <lexer.hpp>
#include <util.hpp>


static const char* selfClosingTags[] = { "include", NULL };


bool isSelfClosingTag(const std::string& name) {
    for (size_t i = 0; selfClosingTags[i] != NULL; i ++) {
        if (name == selfClosingTags[i]) {
            return true;
        }
    }
    return false;
}


static void pushText(std::vector<Token>& tokens, const std::string& text) { // adjacent text is merged into one token
    if (text.size() == 0) {
        return;
    }
    if (tokens.size() > 0 && tokens.back().kind == Token::Text) {
        tokens.back().value += text;
        return;
    }
    tokens.push_back(Token{ Token::Text, text, "", "" });
}


static bool atPreOpen(MapView& map) { // "<pre>" or "<pre attr=...>", but not "<prefix>"
    if (!map.cmp("<pre")) {
        return false;
    }
    char after = map[4];
    return after == '>' || isWhitespace(after);
}


static Token blockToken(const std::string& inner) {
    Token token;
    token.value = inner;
    size_t split = 0;
    while (split < inner.size() && !isWhitespace(inner[split])) {
        split ++;
    }
    std::string name = inner.substr(0, split);
    token.args = trim(inner.substr(split));
    if (name == "else") {
        token.kind = Token::Else;
        token.tagName = name;
    }
    else if (startsWith(name, "end")) {
        token.kind = Token::BlockEnd;
        token.tagName = name.substr(3);
    }
    else if (isSelfClosingTag(name)) {
        token.kind = Token::Block;
        token.tagName = name;
    }
    else {
        token.kind = Token::BlockStart;
        token.tagName = name;
    }
    return token;
}


std::vector<Token> tokenize(MapView map) {
    std::vector<Token> tokens;
    while (map.len() > 0) {
        if (map.cmp("{{") || map.cmp("{%") || map.cmp("{#")) {
            char op = map[1];
            const char* closer = op == '{' ? "}}" : (op == '%' ? "%}" : "#}");
            int64_t close = map.find(closer, 2);
            if (close == -1) { // unterminated tag: the delimiter is just text, keep lexing right after it
                fprintf(stderr, WARNING "Unterminated tag '{%c' has no matching '%s'; it will be rendered as text.\n", op, closer);
                pushText(tokens, map.slice(0, 2).toString());
                map += 2;
                continue;
            }
            std::string inner = trim(map.slice(2, close - 2).toString());
            std::string raw = map.slice(0, close + 2).toString();
            map += close + 2;
            if (op == '#') { // comments vanish
                continue;
            }
            if (op == '{') {
                tokens.push_back(Token{ Token::Variable, inner, "", "" });
                continue;
            }
            if (inner.size() == 0) {
                fprintf(stderr, WARNING "Empty block tag '%s' will be rendered as text.\n", raw.c_str());
                pushText(tokens, raw);
                continue;
            }
            tokens.push_back(blockToken(inner));
        }
        else if (atPreOpen(map)) { // <pre> regions are literal: documentation pages show template syntax in them
            int64_t close = map.find("</pre>", 4);
            size_t length = close == -1 ? map.len() : close + 6;
            pushText(tokens, map.slice(0, length).toString());
            map += length;
        }
        else {
            size_t i = 1;
            while (i < (size_t)map.len() && map[i] != '{' && map[i] != '<') {
                i ++;
            }
            pushText(tokens, map.slice(0, i).toString());
            map += i;
        }
    }
    return tokens;
}

std::vector<Token> tokenize(const std::string& source) {
    return tokenize(MapView::fromString(source));
}
