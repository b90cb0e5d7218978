//
// Created by aowei on 2025 10月 13.
//

#ifndef AUTOMA_REPORT_HPP
#define AUTOMA_REPORT_HPP

#include <ostream>
#include <string>
#include <automa/dfa/dfa.hpp>

namespace automa::io {
    // Graphviz DOT：接受状态画双圈，__start 点指向起始状态，每条转移一条带标签的边
    void write_dot(std::ostream &out, const dfa::DFA &dfa, const std::string &title);
    // 计数汇总：原始 DFA 和最小 DFA 的状态数/接受状态数
    void write_summary(std::ostream &out, const std::string &regex_body, const dfa::DFA &dfa,
                       const dfa::DFA &minimal);
}

#endif //AUTOMA_REPORT_HPP
