//
// Created by aowei on 2025 10月 13.
//

#ifndef AUTOMA_EQUIVALENCE_HPP
#define AUTOMA_EQUIVALENCE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <automa/dfa/dfa.hpp>

namespace automa::check {
    struct EquivalenceResult {
        bool equivalent = true;
        std::optional<std::string> counterexample; // 最短的区分串，只有一边接受
        std::size_t pairs_explored = 0;
    };

    // 乘积自动机上的广度优先搜索，最多访问 |Q1|×|Q2| 个状态对
    EquivalenceResult check_equivalence(const dfa::DFA &lhs, const dfa::DFA &rhs);
    // 与正则比较：正则在 lhs 的字母表上重新编译（不做最小化）
    EquivalenceResult check_equivalence(const dfa::DFA &lhs, std::string_view regex);
}

#endif //AUTOMA_EQUIVALENCE_HPP
