//
// Created by aowei on 2025 10月 14.
//

#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <automa/alphabet.hpp>
#include <automa/error.hpp>
#include <automa/nfa/nfa.hpp>
#include <automa/nfa/thompson.hpp>
#include "../test_utils.hpp"

using namespace automa;
using namespace automa::nfa;

// 辅助函数：期望抛出 INVALID_POSTFIX
void expect_invalid_postfix(const std::string &regex) {
    try {
        build_nfa(regex, Alphabet());
        ADD_FAILURE() << "expected INVALID_POSTFIX for \"" << regex << "\"";
    } catch (const AutomatonError &e) {
        EXPECT_EQ(e.type(), ErrorType::INVALID_POSTFIX) << regex << ": " << e.what();
    }
}

// 测试单个字符的 NFA 结构
TEST(ThompsonTest, SingleLiteral) {
    const auto nfa = build_nfa("a", Alphabet());
    ASSERT_EQ(nfa.size(), 2u);
    ASSERT_EQ(nfa.accepts.size(), 1u);
    const auto accept = *nfa.accepts.begin();
    EXPECT_NE(nfa.start, accept);
    EXPECT_EQ(automa::nfa::move(nfa, {nfa.start}, 'a'), std::set<StateId>{accept});
    EXPECT_TRUE(automa::nfa::move(nfa, {nfa.start}, 'b').empty());
    EXPECT_TRUE(match(nfa, "a"));
    EXPECT_FALSE(match(nfa, ""));
    EXPECT_FALSE(match(nfa, "aa"));
}

// 测试每个运算符新增的状态数
TEST(ThompsonTest, StateCount) {
    const Alphabet ab;
    EXPECT_EQ(build_nfa("ab", ab).size(), 4u);
    EXPECT_EQ(build_nfa("a|b", ab).size(), 6u);
    EXPECT_EQ(build_nfa("a*", ab).size(), 4u);
    EXPECT_EQ(build_nfa("a(a|b)*a", ab).size(), 12u);
}

// 测试 ε 闭包
TEST(ThompsonTest, EpsilonClosure) {
    const auto nfa = build_nfa("a*", Alphabet());
    const auto closure = epsilon_closure(nfa, {nfa.start});
    EXPECT_TRUE(closure.count(nfa.start));
    // a* 的起始闭包直接包含接受状态
    for (const auto acc: nfa.accepts) EXPECT_TRUE(closure.count(acc));
    EXPECT_TRUE(epsilon_closure(nfa, {}).empty());
}

// 测试闭包运算符的语义差异
TEST(ThompsonTest, ClosureOperators) {
    const Alphabet ab;
    const auto star = build_nfa("a*", ab);
    const auto plus = build_nfa("a+", ab);
    const auto optional = build_nfa("a?", ab);

    EXPECT_TRUE(match(star, ""));
    EXPECT_TRUE(match(star, "aaa"));
    // + 至少一次
    EXPECT_FALSE(match(plus, ""));
    EXPECT_TRUE(match(plus, "a"));
    EXPECT_TRUE(match(plus, "aaaa"));
    // ? 至多一次
    EXPECT_TRUE(match(optional, ""));
    EXPECT_TRUE(match(optional, "a"));
    EXPECT_FALSE(match(optional, "aa"));
    EXPECT_FALSE(match(optional, "b"));
}

// 测试字母表外的输入直接拒绝
TEST(ThompsonTest, RejectsForeignInput) {
    const auto nfa = build_nfa("(a|b)*", Alphabet());
    EXPECT_TRUE(match(nfa, "abba"));
    EXPECT_FALSE(match(nfa, "abca"));
    EXPECT_FALSE(match(nfa, "x"));
}

// 测试非法后缀表达式
TEST(ThompsonTest, InvalidPostfix) {
    expect_invalid_postfix("a|");
    expect_invalid_postfix("|a");
    expect_invalid_postfix("*a");
    expect_invalid_postfix("");
    expect_invalid_postfix("()");
    expect_invalid_postfix("(|)");

    // 手工构造：两个操作数但没有运算符
    const std::vector<regex::Token> dangling = {
        {regex::TokenType::CHAR, 'a'}, {regex::TokenType::CHAR, 'b'},
    };
    EXPECT_THROW(build_nfa(dangling, Alphabet()), AutomatonError);
}

// 测试 NFA 与 std::regex 在所有短字符串上的结果一致
TEST(ThompsonTest, AgreesWithStdRegex) {
    const Alphabet ab;
    const auto inputs = automa::test_util::all_strings(ab, 6);
    for (const auto &regex: automa::test_util::sample_regexes) {
        const auto nfa = build_nfa(regex, ab);
        for (const auto &input: inputs) {
            EXPECT_EQ(match(nfa, input), automa::test_util::oracle_match(regex, input))
                << "regex=" << regex << " input=\"" << input << "\"";
        }
    }
}

// 测试其他字母表
TEST(ThompsonTest, BinaryAlphabet) {
    const auto nfa = build_nfa("1(0|1)*0", Alphabet("01"));
    EXPECT_TRUE(match(nfa, "10"));
    EXPECT_TRUE(match(nfa, "1110"));
    EXPECT_FALSE(match(nfa, "01"));
    EXPECT_FALSE(match(nfa, "1"));
}

// 测试调试打印
TEST(ThompsonTest, Print) {
    const auto nfa = build_nfa("a*", Alphabet());
    std::ostringstream out;
    nfa.print(out, "a*");
    const auto text = out.str();
    EXPECT_NE(text.find("=== a* Structure ==="), std::string::npos);
    EXPECT_NE(text.find("Start State: " + std::to_string(nfa.start)), std::string::npos);
    EXPECT_NE(text.find("--a-->"), std::string::npos);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
