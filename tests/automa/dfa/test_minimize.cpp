//
// Created by aowei on 2025 10月 14.
//

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <automa/alphabet.hpp>
#include <automa/compiler.hpp>
#include <automa/dfa/dfa.hpp>
#include <automa/dfa/minimize.hpp>
#include "../test_utils.hpp"

using namespace automa;
using namespace automa::dfa;

DFA minimal_of(const std::string &regex) {
    return compile_regex(regex, Alphabet()).minimal;
}

// 辅助函数：手工构造完全 DFA，transitions[s] = {a 目标, b 目标}
DFA make_dfa(const std::vector<std::pair<StateId, StateId> > &transitions, const std::vector<bool> &accepts) {
    DFA d{Alphabet()};
    for (const bool acc: accepts) d.add_state(acc);
    for (StateId s = 0; s < transitions.size(); ++s) {
        d.add_transition(s, 'a', transitions[s].first);
        d.add_transition(s, 'b', transitions[s].second);
    }
    return d;
}

// 测试补全：缺失的转移都指向新加入的死状态
TEST(MinimizeTest, CompleteAddsSink) {
    const auto raw = compile_regex("a", Alphabet()).dfa;
    const auto completed = complete_dfa(raw);
    ASSERT_EQ(completed.size(), raw.size() + 1);
    const StateId sink = completed.size() - 1;
    EXPECT_TRUE(completed.is_complete());
    EXPECT_FALSE(completed.is_accept(sink));
    EXPECT_EQ(completed.next(sink, 'a'), std::optional<StateId>(sink));
    EXPECT_EQ(completed.next(sink, 'b'), std::optional<StateId>(sink));
    // 已有的转移不变
    EXPECT_EQ(completed.next(0, 'a'), raw.next(0, 'a'));
    EXPECT_EQ(completed.next(0, 'b'), std::optional<StateId>(sink));
}

// 测试划分细化：等价状态落在同一块
TEST(MinimizeTest, RefinePartition) {
    // 0 -a-> 1, 0 -b-> 2，1 和 2 都是接受自环
    const auto d = make_dfa({{1, 2}, {1, 1}, {2, 2}}, {false, true, true});
    const auto partition = refine_partition(d);
    EXPECT_EQ(partition.blocks.size(), 2u);
    EXPECT_EQ(partition.block_of[1], partition.block_of[2]);
    EXPECT_NE(partition.block_of[0], partition.block_of[1]);

    // 不完全的 DFA 不能直接细化
    EXPECT_THROW(refine_partition(compile_regex("a", Alphabet()).dfa), std::invalid_argument);
}

// 测试 a* 的最小 DFA 结构
TEST(MinimizeTest, KleeneStarOfA) {
    const auto m = minimal_of("a*");
    ASSERT_EQ(m.size(), 2u);
    EXPECT_EQ(m.start, 0u);
    EXPECT_TRUE(m.is_accept(0));
    EXPECT_FALSE(m.is_accept(1));
    EXPECT_EQ(m.next(0, 'a'), std::optional<StateId>(0));
    EXPECT_EQ(m.next(0, 'b'), std::optional<StateId>(1));
    EXPECT_EQ(m.next(1, 'a'), std::optional<StateId>(1));
    EXPECT_EQ(m.next(1, 'b'), std::optional<StateId>(1));
}

// 测试已知语言的最小状态数
TEST(MinimizeTest, KnownSizes) {
    EXPECT_EQ(minimal_of("(a|b)*").size(), 1u);
    EXPECT_EQ(minimal_of("a*(ba*)*").size(), 1u);
    EXPECT_EQ(minimal_of("a").size(), 3u);
    EXPECT_EQ(minimal_of("a(a|b)*a").size(), 4u);
    EXPECT_EQ(minimal_of("(a|b)*abb").size(), 4u);
    // 倒数第三个字符是 a
    EXPECT_EQ(minimal_of("(a|b)*a(a|b)(a|b)").size(), 8u);
}

// 测试 a(a|b)*a 最小化后的接受与拒绝
TEST(MinimizeTest, StartsAndEndsWithA) {
    const auto m = minimal_of("a(a|b)*a");
    EXPECT_EQ(m.accept_count(), 1u);
    for (const auto *input: {"aa", "aba", "abba"}) EXPECT_TRUE(match(m, input)) << input;
    for (const auto *input: {"", "a", "b", "ab", "ba"}) EXPECT_FALSE(match(m, input)) << input;
}

// 测试丢弃不可达状态
TEST(MinimizeTest, DropsUnreachableStates) {
    // 状态 2 不可达
    const auto d = make_dfa({{0, 1}, {1, 1}, {0, 2}}, {false, true, true});
    const auto m = minimize_dfa(d);
    EXPECT_EQ(m.size(), 2u);
    EXPECT_TRUE(match(m, "aab"));
    EXPECT_FALSE(match(m, "aa"));
}

// 测试最小化的一般性质：完全、起始为 0、不大于补全后的原 DFA、幂等、语言不变
TEST(MinimizeTest, Properties) {
    const Alphabet ab;
    const auto inputs = automa::test_util::all_strings(ab, 7);
    for (const auto &regex: automa::test_util::sample_regexes) {
        const auto result = compile_regex(regex, ab);
        const auto &m = result.minimal;
        EXPECT_TRUE(m.is_complete()) << regex;
        EXPECT_EQ(m.start, 0u) << regex;
        EXPECT_LE(m.size(), complete_dfa(result.dfa).size()) << regex;
        EXPECT_EQ(minimize_dfa(m).size(), m.size()) << regex;
        for (const auto &input: inputs) {
            EXPECT_EQ(match(m, input), match(result.dfa, input))
                << "regex=" << regex << " input=\"" << input << "\"";
        }
    }
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
