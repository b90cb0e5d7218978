//
// Created by aowei on 2025 10月 12.
//

#ifndef AUTOMA_THOMPSON_HPP
#define AUTOMA_THOMPSON_HPP

#include <string_view>
#include <vector>
#include <automa/nfa/nfa.hpp>
#include <automa/regex/parser.hpp>

namespace automa::nfa {
    // NFA 构建：后缀表达式 -> NFA（Thompson 构造）
    NFA build_nfa(const std::vector<regex::Token> &postfix, const Alphabet &alphabet);
    // 正则 -> NFA
    NFA build_nfa(std::string_view raw_regex, const Alphabet &alphabet);
}

#endif //AUTOMA_THOMPSON_HPP
