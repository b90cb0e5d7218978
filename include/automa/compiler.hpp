//
// Created by aowei on 2025 10月 13.
//

#ifndef AUTOMA_COMPILER_HPP
#define AUTOMA_COMPILER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <automa/alphabet.hpp>
#include <automa/dfa/dfa.hpp>
#include <automa/regex/parser.hpp>

namespace automa {
    // 一次编译的全部产物
    struct Compilation {
        std::string body;                   // 预处理后的正则
        std::vector<regex::Token> postfix;  // 后缀表达式
        dfa::DFA dfa;                       // 子集构造得到的 DFA，可能不完全
        dfa::DFA minimal;                   // 最小完全 DFA
    };

    // 正则 -> 后缀 -> NFA -> DFA -> 最小 DFA，任何一步失败都抛出 AutomatonError，不返回部分结果
    Compilation compile_regex(std::string_view raw_regex, const Alphabet &alphabet);
}

#endif //AUTOMA_COMPILER_HPP
