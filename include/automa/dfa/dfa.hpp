//
// Created by aowei on 2025 10月 12.
//

#ifndef AUTOMA_DFA_HPP
#define AUTOMA_DFA_HPP

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>
#include <automa/alphabet.hpp>

namespace automa::dfa {
    struct DFAState {
        bool is_accept = false;
        std::map<char, StateId> transitions; // 确定性转移，缺少某个字符表示隐式拒绝
    };

    class DFA {
    public:
        Alphabet alphabet;
        StateId start = 0;
        std::vector<DFAState> states;

    public:
        explicit DFA(const Alphabet &alphabet) : alphabet(alphabet) {}

        // 添加状态并返回其 ID
        StateId add_state(bool is_accept = false);
        void add_transition(StateId from, char c, StateId to);
        [[nodiscard]] std::optional<StateId> next(StateId state, char c) const;
        [[nodiscard]] bool is_accept(const StateId state) const { return this->states.at(state).is_accept; }
        [[nodiscard]] std::size_t size() const { return this->states.size(); }
        [[nodiscard]] std::size_t accept_count() const;
        // 每个状态在每个字符上都恰好有一个转移
        [[nodiscard]] bool is_complete() const;
        // 调试用：打印 DFA 结构
        void print(std::ostream &out, const std::string &name = "DFA") const;
    };

    // 匹配：DFA + 输入字符串 -> 是否完全匹配。字母表外的字符或缺失的转移都直接拒绝
    bool match(const DFA &dfa, std::string_view input);
}

#endif //AUTOMA_DFA_HPP
