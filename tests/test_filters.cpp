#include <gtest/gtest.h>
#include <filters.hpp>
#include <cstdlib>
#include <cmath>
#include <ctime>


static std::string run(FilterFunction f, Value value, std::vector<Value> args = {}) {
    return f(value, args).toString();
}


TEST(test_filters, case_conversion) {
    EXPECT_EQ(run(filterUpper, "Hello, World"), "HELLO, WORLD");
    EXPECT_EQ(run(filterLower, "Hello, World"), "hello, world");
    EXPECT_EQ(run(filterUpper, 25), "25");
    EXPECT_EQ(run(filterUpper, Value()), "");
}

TEST(test_filters, length) {
    EXPECT_EQ(filterLength(ValueList{ 1, 2, 3 }, {}).number, 3);
    EXPECT_EQ(filterLength(ValueMap{ { "a", 1 }, { "b", 2 } }, {}).number, 2);
    EXPECT_EQ(filterLength(Value("hello"), {}).number, 5);
    EXPECT_EQ(filterLength(Value(), {}).number, 0);
    EXPECT_EQ(filterLength(Value(12345), {}).number, 0);
}

TEST(test_filters, truncate) {
    EXPECT_EQ(run(filterTruncate, "hello", { 10 }), "hello");
    EXPECT_EQ(run(filterTruncate, "hello", { 5 }), "hello");
    EXPECT_EQ(run(filterTruncate, "hello world", { 8 }), "hello...");
    EXPECT_EQ(run(filterTruncate, "hello world", { 7, "~" }), "hello ~");
    EXPECT_EQ(run(filterTruncate, "hello world", { 2 }), "..."); // the suffix never gets cut
    EXPECT_EQ(run(filterTruncate, std::string(40, 'x')), std::string(27, 'x') + "...");
    EXPECT_EQ(run(filterTruncate, std::string(30, 'x')), std::string(30, 'x'));
}

TEST(test_filters, escape) {
    EXPECT_EQ(run(filterEscape, "<a href=\"x\">Tom & 'Jerry'</a>"), "&lt;a href=&quot;x&quot;&gt;Tom &amp; &#39;Jerry&#39;&lt;/a&gt;");
    EXPECT_EQ(run(filterEscape, "plain"), "plain");
    EXPECT_EQ(htmlEscape("&amp;"), "&amp;amp;");
}

TEST(test_filters, default_value) {
    EXPECT_EQ(run(filterDefault, Value(), { "fallback" }), "fallback");
    EXPECT_EQ(run(filterDefault, "", { "fallback" }), "fallback");
    EXPECT_EQ(run(filterDefault, "x", { "fallback" }), "x");
    EXPECT_EQ(run(filterDefault, 0, { "fallback" }), "0");
    EXPECT_EQ(run(filterDefault, false, { "fallback" }), "false");
    EXPECT_EQ(run(filterDefault, Value()), "");
}

TEST(test_filters, number_format) {
    EXPECT_EQ(run(filterNumberFormat, 1234567), "1,234,567");
    EXPECT_EQ(run(filterNumberFormat, 1234.5, { 2 }), "1,234.50");
    EXPECT_EQ(run(filterNumberFormat, -1234567.891, { 2 }), "-1,234,567.89");
    EXPECT_EQ(run(filterNumberFormat, 999), "999");
    EXPECT_EQ(run(filterNumberFormat, 1000), "1,000");
    EXPECT_EQ(run(filterNumberFormat, 12345.6789), "12,346");
    EXPECT_EQ(run(filterNumberFormat, "1000000"), "1,000,000");
    EXPECT_EQ(run(filterNumberFormat, Value()), "0");
    EXPECT_EQ(run(filterNumberFormat, "words"), "0");
}

TEST(test_filters, date_format) {
    setenv("TZ", "UTC", 1);
    tzset();
    EXPECT_EQ(run(filterDateFormat, 1700049600), "2023-11-15");
    EXPECT_EQ(run(filterDateFormat, 1700049600, { "%d/%m/%Y %H:%M" }), "15/11/2023 12:00");
    EXPECT_EQ(run(filterDateFormat, "yesterday", { "%Y" }), "yesterday");
    EXPECT_TRUE(filterDateFormat(Value(), {}).isNull());
}

TEST(test_filters, registry) {
    FilterRegistry registry;
    for (const char* name : { "upper", "lower", "length", "truncate", "escape", "default", "number_format", "date_format" }) {
        EXPECT_TRUE(registry.has(name)) << name;
    }
    EXPECT_FALSE(registry.has("shout"));
    EXPECT_EQ(registry.apply("shout", Value("x"), {}).toString(), "x"); // unknown filters pass through

    registry.add("shout", [](const Value& v, const std::vector<Value>& args) {
        return Value(v.toString() + "!");
    });
    EXPECT_TRUE(registry.has("shout"));
    EXPECT_EQ(registry.apply("shout", Value("x"), {}).toString(), "x!");

    registry.add("upper", [](const Value& v, const std::vector<Value>& args) {
        return Value("replaced");
    });
    EXPECT_EQ(registry.apply("upper", Value("x"), {}).toString(), "replaced");
}

TEST(test_filters, registries_are_independent) {
    FilterRegistry one;
    FilterRegistry two;
    one.add("only_here", filterUpper);
    EXPECT_TRUE(one.has("only_here"));
    EXPECT_FALSE(two.has("only_here"));
}

TEST(test_filters, out_of_range_numeric_arguments) {
    EXPECT_EQ(run(filterTruncate, "hello", { 1e30 }), "hello");
    EXPECT_EQ(run(filterTruncate, "hello", { -1e30 }), "...");
    EXPECT_EQ(run(filterTruncate, "hello", { NAN }), "...");
    EXPECT_EQ(run(filterNumberFormat, 1.5, { 1e30 }), "1.50000000000000000000"); // 20 decimals at most
    EXPECT_EQ(run(filterNumberFormat, 1.5, { -1e30 }), "2");
    EXPECT_EQ(run(filterNumberFormat, 1.5, { NAN }), "2");
    EXPECT_EQ(run(filterDateFormat, 1e300), "");
    EXPECT_EQ(run(filterDateFormat, -1e300), "");
    EXPECT_EQ(run(filterDateFormat, NAN), "");
}
