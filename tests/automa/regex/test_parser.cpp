//
// Created by aowei on 2025 10月 14.
//

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <automa/alphabet.hpp>
#include <automa/error.hpp>
#include <automa/regex/parser.hpp>

using namespace automa;
using namespace automa::regex;

// 辅助函数：期望抛出指定类型的 AutomatonError，并返回错误信息
template<typename F>
std::string expect_error(F &&f, const ErrorType expected) {
    try {
        f();
    } catch (const AutomatonError &e) {
        EXPECT_EQ(error_type_to_string(e.type()), error_type_to_string(expected));
        return e.what();
    }
    ADD_FAILURE() << "expected " << error_type_to_string(expected);
    return "";
}

std::string postfix_of(const std::string &regex, const Alphabet &alphabet = Alphabet()) {
    return postfix_to_string(parse_regex(regex, alphabet));
}

// 测试字母表校验
TEST(AlphabetTest, Validation) {
    const Alphabet ab;
    EXPECT_EQ(ab.str(), "ab");
    EXPECT_EQ(ab.index_of('b'), 1u);
    EXPECT_EQ(ab.index_of('c'), Alphabet::NPOS);
    EXPECT_EQ(Alphabet("01").symbol(0), '0');

    expect_error([] { Alphabet("a"); }, ErrorType::INVALID_ALPHABET);
    expect_error([] { Alphabet("abc"); }, ErrorType::INVALID_ALPHABET);
    expect_error([] { Alphabet("aa"); }, ErrorType::INVALID_ALPHABET);
    expect_error([] { Alphabet("a*"); }, ErrorType::INVALID_ALPHABET);
    expect_error([] { Alphabet("a "); }, ErrorType::INVALID_ALPHABET);
}

// 测试预处理：锚点、非捕获分组、空白
TEST(ParserTest, Sanitize) {
    const Alphabet ab;
    EXPECT_EQ(sanitize_regex("^(a|b)*$", ab), "(a|b)*");
    EXPECT_EQ(sanitize_regex("(?:ab)+", ab), "(ab)+");
    EXPECT_EQ(sanitize_regex("  a ( a | b ) * a ", ab), "a(a|b)*a");
    EXPECT_EQ(sanitize_regex(" ^ (?: a | b ) $ ", ab), "(a|b)");
}

// 测试字母表以外的字母
TEST(ParserTest, AlphabetViolation) {
    const Alphabet ab;
    const auto message = expect_error([&] { sanitize_regex("a(c|d)*", ab); }, ErrorType::ALPHABET_VIOLATION);
    EXPECT_NE(message.find("c, d"), std::string::npos);
    expect_error([&] { parse_regex("ab|xy", ab); }, ErrorType::ALPHABET_VIOLATION);
    // 字母表 {0,1} 下出现字母同样报错
    expect_error([] { parse_regex("0a", Alphabet("01")); }, ErrorType::ALPHABET_VIOLATION);
}

// 测试不支持的字符
TEST(ParserTest, UnsupportedToken) {
    const Alphabet ab;
    const auto message = expect_error([&] { parse_regex("a.b", ab); }, ErrorType::UNSUPPORTED_TOKEN);
    EXPECT_NE(message.find("'.'"), std::string::npos);
    expect_error([&] { parse_regex("a[b]", ab); }, ErrorType::UNSUPPORTED_TOKEN);
    expect_error([&] { parse_regex("a1", ab); }, ErrorType::UNSUPPORTED_TOKEN);
    expect_error([&] { parse_regex("a$b", ab); }, ErrorType::UNSUPPORTED_TOKEN);
}

// 测试显式连接符的插入
TEST(ParserTest, ConcatInsertion) {
    const Alphabet ab;
    const auto tokens = tokenize("a(b)*a", ab);
    const std::vector<TokenType> expected = {
        TokenType::CHAR, TokenType::CONCAT, TokenType::LPAREN, TokenType::CHAR, TokenType::RPAREN,
        TokenType::STAR, TokenType::CONCAT, TokenType::CHAR,
    };
    ASSERT_EQ(tokens.size(), expected.size());
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        EXPECT_EQ(tokens[i].type, expected[i]) << "token " << i;
    }
    // 二元运算符两侧不插入连接符
    EXPECT_EQ(tokenize("a|b", ab).size(), 3u);
    EXPECT_EQ(tokenize("(a)(b)", ab).size(), 7u);
}

// 测试调度场算法的优先级
TEST(ParserTest, Postfix) {
    EXPECT_EQ(postfix_of("ab"), "ab.");
    EXPECT_EQ(postfix_of("a|b"), "ab|");
    EXPECT_EQ(postfix_of("ab*"), "ab*.");
    EXPECT_EQ(postfix_of("a|b*"), "ab*|");
    EXPECT_EQ(postfix_of("a|bb"), "abb.|");
    EXPECT_EQ(postfix_of("a(a|b)*a"), "aab|*.a.");
    // 连续的后缀运算符从左到右依次生效
    EXPECT_EQ(postfix_of("a*+?"), "a*+?");
    EXPECT_EQ(postfix_of("(?:ab)+"), "ab.+");
    EXPECT_EQ(postfix_of("1(0|1)?", Alphabet("01")), "101|?.");
}

// 测试括号不匹配
TEST(ParserTest, MismatchedParenthesis) {
    const Alphabet ab;
    expect_error([&] { parse_regex("(a|", ab); }, ErrorType::MISMATCHED_PARENTHESIS);
    expect_error([&] { parse_regex("a)", ab); }, ErrorType::MISMATCHED_PARENTHESIS);
    expect_error([&] { parse_regex("((a)", ab); }, ErrorType::MISMATCHED_PARENTHESIS);
    expect_error([&] { parse_regex("(a))(", ab); }, ErrorType::MISMATCHED_PARENTHESIS);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
