//
// Created by aowei on 2025 10月 12.
//

#ifndef AUTOMA_MINIMIZE_HPP
#define AUTOMA_MINIMIZE_HPP

#include <cstddef>
#include <vector>
#include <automa/dfa/dfa.hpp>

namespace automa::dfa {
    // 状态划分：块句柄 -> 成员，状态 -> 所在块句柄
    struct Partition {
        std::vector<std::vector<StateId> > blocks;
        std::vector<std::size_t> block_of;
    };

    // 补全：加入一个不接受、在所有字符上自环的死状态，缺失的转移全部指向它
    DFA complete_dfa(const DFA &dfa);
    // Hopcroft 划分细化，输入必须是完全 DFA
    Partition refine_partition(const DFA &completed);
    // DFA 最小化：原始 DFA -> 最小完全 DFA，起始状态编号为 0
    DFA minimize_dfa(const DFA &dfa);
}

#endif //AUTOMA_MINIMIZE_HPP
