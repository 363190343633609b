#include <gtest/gtest.h>
#include <lexer.hpp>


TEST(test_lexer, plain_text_is_one_token) {
    std::vector<Token> tokens = tokenize(std::string("<h1>Hello, world</h1>\n<p>no tags here</p>"));
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, Token::Text);
    EXPECT_EQ(tokens[0].value, "<h1>Hello, world</h1>\n<p>no tags here</p>");
}

TEST(test_lexer, empty_input) {
    EXPECT_EQ(tokenize(std::string("")).size(), 0u);
}

TEST(test_lexer, variables_are_trimmed) {
    std::vector<Token> tokens = tokenize(std::string("Hello {{   user.name|upper  }}!"));
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, Token::Text);
    EXPECT_EQ(tokens[0].value, "Hello ");
    EXPECT_EQ(tokens[1].kind, Token::Variable);
    EXPECT_EQ(tokens[1].value, "user.name|upper");
    EXPECT_EQ(tokens[2].value, "!");
}

TEST(test_lexer, block_tags) {
    std::vector<Token> tokens = tokenize(std::string("{% if x > 1 %}a{% else %}b{% endif %}"));
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].kind, Token::BlockStart);
    EXPECT_EQ(tokens[0].tagName, "if");
    EXPECT_EQ(tokens[0].args, "x > 1");
    EXPECT_EQ(tokens[1].kind, Token::Text);
    EXPECT_EQ(tokens[2].kind, Token::Else);
    EXPECT_EQ(tokens[3].value, "b");
    EXPECT_EQ(tokens[4].kind, Token::BlockEnd);
    EXPECT_EQ(tokens[4].tagName, "if");
    EXPECT_EQ(tokens[4].value, "endif");
}

TEST(test_lexer, include_is_self_closing) {
    std::vector<Token> tokens = tokenize(std::string("{% include \"header\" %}"));
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, Token::Block);
    EXPECT_EQ(tokens[0].tagName, "include");
    EXPECT_EQ(tokens[0].args, "\"header\"");
    EXPECT_TRUE(isSelfClosingTag("include"));
    EXPECT_FALSE(isSelfClosingTag("for"));
}

TEST(test_lexer, comments_vanish) {
    std::vector<Token> tokens = tokenize(std::string("a{# a {{ comment }} #}b"));
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].value, "ab");
}

TEST(test_lexer, pre_regions_are_literal) {
    std::vector<Token> tokens = tokenize(std::string("<pre class=\"code\">{{ x }}{% if %}</pre>{{ y }}"));
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, Token::Text);
    EXPECT_EQ(tokens[0].value, "<pre class=\"code\">{{ x }}{% if %}</pre>");
    EXPECT_EQ(tokens[1].kind, Token::Variable);
    EXPECT_EQ(tokens[1].value, "y");
}

TEST(test_lexer, unclosed_pre_runs_to_the_end) {
    std::vector<Token> tokens = tokenize(std::string("x<pre>{{ a }}"));
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].value, "x<pre>{{ a }}");
}

TEST(test_lexer, prefix_is_not_pre) {
    std::vector<Token> tokens = tokenize(std::string("<prefix>{{ a }}"));
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].value, "<prefix>");
    EXPECT_EQ(tokens[1].kind, Token::Variable);
}

TEST(test_lexer, unterminated_tag_is_text) {
    std::vector<Token> tokens = tokenize(std::string("a {{ b"));
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].kind, Token::Text);
    EXPECT_EQ(tokens[0].value, "a {{ b");
}

TEST(test_lexer, lexing_resumes_after_unterminated_block) {
    std::vector<Token> tokens = tokenize(std::string("{% oops {{ name }}"));
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].value, "{% oops ");
    EXPECT_EQ(tokens[1].kind, Token::Variable);
    EXPECT_EQ(tokens[1].value, "name");
}

TEST(test_lexer, empty_block_tag_is_text) {
    std::vector<Token> tokens = tokenize(std::string("a{%  %}b"));
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].value, "a{%  %}b");
}

TEST(test_lexer, single_braces_are_text) {
    std::vector<Token> tokens = tokenize(std::string("body { color: red; }"));
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].value, "body { color: red; }");
}
