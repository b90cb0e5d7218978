//
// Created by aowei on 2025 10月 12.
//

#ifndef AUTOMA_NFA_HPP
#define AUTOMA_NFA_HPP

#include <map>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <automa/alphabet.hpp>

namespace automa::nfa {
    struct NFAState {
        std::map<char, std::set<StateId> > transitions; // 普通转移：字符 -> 目标状态集合
        std::set<StateId> eps_transitions;              // ε 转移：目标状态集合
    };

    // 所有状态存放在 states 中，状态之间只用 ID 互相引用，环也能安全存储
    class NFA {
    public:
        Alphabet alphabet;
        std::vector<NFAState> states;
        StateId start = 0;
        std::set<StateId> accepts;

    public:
        explicit NFA(const Alphabet &alphabet) : alphabet(alphabet) {}
        NFA(const NFA &) = delete;
        NFA &operator=(const NFA &) = delete;
        NFA(NFA &&) = default;
        NFA &operator=(NFA &&) = default;

        // 添加状态并返回其 ID
        StateId add_state();
        void add_transition(StateId from, char c, StateId to);
        void add_epsilon(StateId from, StateId to);
        [[nodiscard]] std::size_t size() const { return this->states.size(); }
        // 调试用：打印 NFA 结构
        void print(std::ostream &out, const std::string &name = "NFA") const;
    };

    // 计算状态集合的 ε 闭包
    std::set<StateId> epsilon_closure(const NFA &nfa, const std::set<StateId> &states);
    // 计算字符转移 move(S, c)
    std::set<StateId> move(const NFA &nfa, const std::set<StateId> &states, char c);
    // 匹配：NFA 模拟 + 输入字符串 -> 是否完全匹配
    bool match(const NFA &nfa, std::string_view input);
}

#endif //AUTOMA_NFA_HPP
