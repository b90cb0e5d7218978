//
// Created by aowei on 2025 10月 13.
//

#ifndef AUTOMA_TABLE_HPP
#define AUTOMA_TABLE_HPP

#include <array>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <automa/alphabet.hpp>
#include <automa/dfa/dfa.hpp>

namespace automa::io {
    // 转移表的一行：状态 ID、每个字符的目标（空表示没有转移）、是否接受
    struct TableRow {
        StateId id;
        std::array<std::optional<StateId>, Alphabet::SIZE> targets;
        bool accepting;
    };

    // 加载/导出用的转移表，保留文件中的原始状态 ID，第一行是起始状态
    struct TransitionTable {
        Alphabet alphabet;
        std::vector<TableRow> rows;

        [[nodiscard]] StateId start() const { return this->rows.at(0).id; }
    };

    // 读取 CSV：state,<sym0>,<sym1>,accepting。格式错误抛出 MALFORMED_TABLE
    TransitionTable read_table(std::istream &in, const Alphabet &alphabet);
    void write_table(std::ostream &out, const TransitionTable &table);
    // DFA -> 转移表，起始状态总在第一行
    TransitionTable to_table(const dfa::DFA &dfa);
    // 转移表 -> DFA，按行序重新编号（起始状态为 0）。目标未声明时抛出 UNKNOWN_STATE_REFERENCE
    dfa::DFA to_dfa(const TransitionTable &table);
    // 读取样例文件：每行一个字符串，跳过空行
    std::vector<std::string> read_lines(std::istream &in);
}

#endif //AUTOMA_TABLE_HPP
