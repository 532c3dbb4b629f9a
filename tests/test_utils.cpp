#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <cluster/resources.hpp>

TEST(Utils, Base64) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("user:pass"), "dXNlcjpwYXNz");
    EXPECT_EQ(base64_decode("dXNlcjpwYXNz"), "user:pass");
    EXPECT_EQ(base64_decode("YWxp\nY2U6cHc="), "alice:pw");
}

TEST(Utils, ShellQuote) {
    EXPECT_EQ(shell_quote("abc"), "'abc'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Utils, SanitizeName) {
    EXPECT_EQ(sanitize_name("Hello World!!", 63), "hello-world");
    EXPECT_EQ(sanitize_name("--a--b--", 63), "a-b");
    EXPECT_EQ(sanitize_name("abcdef", 3), "abc");
    EXPECT_EQ(sanitize_name("ab-cd", 3), "ab");
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("4x", -1), -1);
    EXPECT_EQ(safe_stoi("", 7), 7);
}

TEST(Utils, ParseInt) {
    EXPECT_EQ(parse_int("30").value(), 30);
    EXPECT_EQ(parse_int("-2").value(), -2);
    // Values equal to a would-be fallback still parse
    EXPECT_EQ(parse_int("0").value(), 0);
    EXPECT_FALSE(parse_int("").has_value());
    EXPECT_FALSE(parse_int("ten").has_value());
    EXPECT_FALSE(parse_int("5s").has_value());
    EXPECT_FALSE(parse_int("99999999999").has_value());
}

TEST(Utils, Trim) {
    std::string s = "  value \r\n";
    trim(s);
    EXPECT_EQ(s, "value");
}

TEST(Utils, NowCompactShape) {
    std::string ts = now_compact();
    ASSERT_EQ(ts.size(), 15u);
    EXPECT_EQ(ts[8], '-');
}

TEST(Resources, LabelSelector) {
    EXPECT_EQ(label_selector({}), "");
    EXPECT_EQ(label_selector({{"b", "2"}, {"a", "1"}}), "a=1,b=2");
}
