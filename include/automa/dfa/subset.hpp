//
// Created by aowei on 2025 10月 12.
//

#ifndef AUTOMA_SUBSET_HPP
#define AUTOMA_SUBSET_HPP

#include <automa/dfa/dfa.hpp>
#include <automa/nfa/nfa.hpp>

namespace automa::dfa {
    // DFA 构建：NFA -> DFA（子集构造）。结果是确定的，但可能不完全
    DFA build_dfa(const nfa::NFA &nfa);
}

#endif //AUTOMA_SUBSET_HPP
