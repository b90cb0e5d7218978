//
// Created by aowei on 2025 10月 13.
//

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <automa/error.hpp>
#include <automa/io/table.hpp>

namespace automa::io {
    namespace {
        constexpr std::size_t COLUMN_COUNT = Alphabet::SIZE + 2;

        std::string trim(const std::string &s) {
            const auto begin = s.find_first_not_of(" \t\r");
            if (begin == std::string::npos) return "";
            const auto end = s.find_last_not_of(" \t\r");
            return s.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_cells(const std::string &line) {
            std::vector<std::string> cells;
            std::stringstream ss(line);
            std::string cell;
            while (std::getline(ss, cell, ',')) cells.push_back(trim(cell));
            // getline 不会产生末尾的空单元格，例如 "3,1,,"
            if (!line.empty() && line.back() == ',') cells.emplace_back();
            return cells;
        }

        [[noreturn]] void malformed(const std::size_t line_no, const std::string &message) {
            throw AutomatonError(ErrorType::MALFORMED_TABLE, "line " + std::to_string(line_no) + ": " + message);
        }

        StateId parse_state_id(const std::string &cell, const std::size_t line_no, const std::string &column) {
            const bool digits = !cell.empty() && std::all_of(cell.begin(), cell.end(), [](const char c) {
                return std::isdigit(static_cast<unsigned char>(c));
            });
            if (!digits) {
                malformed(line_no, "column '" + column + "' value \"" + cell + "\" is not a non-negative integer");
            }
            try {
                return static_cast<StateId>(std::stoull(cell));
            } catch (const std::out_of_range &) {
                malformed(line_no, "column '" + column + "' value \"" + cell + "\" is out of range");
            }
        }

        void check_header(const std::vector<std::string> &header, const Alphabet &alphabet, const std::size_t line_no) {
            if (header.size() < 2 || header.front() != "state" || header.back() != "accepting") {
                malformed(line_no, "bad header, expected: state,<alphabet...>,accepting");
            }
            std::vector<std::string> expected;
            for (const char c: alphabet.symbols()) expected.emplace_back(1, c);
            const std::vector<std::string> actual(header.begin() + 1, header.end() - 1);
            if (actual != expected) {
                std::string got;
                for (const auto &col: actual) got += (got.empty() ? "" : ",") + col;
                malformed(line_no, "alphabet mismatch, table has [" + got + "], expected [" +
                                   std::string(1, alphabet.symbol(0)) + "," + alphabet.symbol(1) + "]");
            }
        }
    }
}

namespace automa::io {
    TransitionTable read_table(std::istream &in, const Alphabet &alphabet) {
        TransitionTable table{alphabet, {}};
        std::unordered_set<StateId> declared;
        std::string line;
        std::size_t line_no = 0;
        bool header_seen = false;
        while (std::getline(in, line)) {
            ++line_no;
            if (trim(line).empty()) continue;
            const auto cells = split_cells(line);
            if (!header_seen) {
                check_header(cells, alphabet, line_no);
                header_seen = true;
                continue;
            }
            if (cells.size() != COLUMN_COUNT) {
                malformed(line_no, "expected " + std::to_string(COLUMN_COUNT) + " cells, got " +
                                   std::to_string(cells.size()));
            }
            TableRow row{parse_state_id(cells[0], line_no, "state"), {}, false};
            if (!declared.insert(row.id).second) {
                malformed(line_no, "state " + std::to_string(row.id) + " is declared twice");
            }
            for (std::size_t i = 0; i < Alphabet::SIZE; ++i) {
                // 空单元格表示没有转移，即显式拒绝
                if (!cells[i + 1].empty()) {
                    row.targets[i] = parse_state_id(cells[i + 1], line_no, std::string(1, alphabet.symbol(i)));
                }
            }
            const auto &flag = cells.back();
            if (flag != "0" && flag != "1") {
                malformed(line_no, "column 'accepting' value \"" + flag + "\" must be 0 or 1");
            }
            row.accepting = flag == "1";
            table.rows.push_back(row);
        }
        if (!header_seen) {
            throw AutomatonError(ErrorType::MALFORMED_TABLE, "empty table: missing header");
        }
        if (table.rows.empty()) {
            throw AutomatonError(ErrorType::MALFORMED_TABLE, "empty table: no states declared");
        }
        return table;
    }

    void write_table(std::ostream &out, const TransitionTable &table) {
        out << "state";
        for (const char c: table.alphabet.symbols()) out << ',' << c;
        out << ",accepting\n";
        for (const auto &[id, targets, accepting]: table.rows) {
            out << id;
            for (const auto &target: targets) {
                out << ',';
                if (target) out << *target;
            }
            out << ',' << (accepting ? 1 : 0) << '\n';
        }
    }

    TransitionTable to_table(const dfa::DFA &dfa) {
        TransitionTable table{dfa.alphabet, {}};
        auto append = [&](const StateId s) {
            TableRow row{s, {}, dfa.is_accept(s)};
            for (std::size_t i = 0; i < Alphabet::SIZE; ++i) {
                row.targets[i] = dfa.next(s, dfa.alphabet.symbol(i));
            }
            table.rows.push_back(row);
        };
        if (dfa.states.empty()) return table;
        append(dfa.start);
        for (StateId s = 0; s < dfa.size(); ++s) {
            if (s != dfa.start) append(s);
        }
        return table;
    }

    dfa::DFA to_dfa(const TransitionTable &table) {
        dfa::DFA dfa(table.alphabet);
        std::unordered_map<StateId, StateId> id_map;
        for (const auto &row: table.rows) {
            id_map.emplace(row.id, dfa.add_state(row.accepting));
        }
        for (const auto &row: table.rows) {
            for (std::size_t i = 0; i < Alphabet::SIZE; ++i) {
                if (!row.targets[i]) continue;
                const auto it = id_map.find(*row.targets[i]);
                if (it == id_map.end()) {
                    throw AutomatonError(ErrorType::UNKNOWN_STATE_REFERENCE,
                                         "transition (" + std::to_string(row.id) + ", " + table.alphabet.symbol(i) +
                                         ") targets undeclared state " + std::to_string(*row.targets[i]));
                }
                dfa.add_transition(id_map.at(row.id), table.alphabet.symbol(i), it->second);
            }
        }
        dfa.start = 0;
        return dfa;
    }

    std::vector<std::string> read_lines(std::istream &in) {
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (trim(line).empty()) continue;
            lines.push_back(line);
        }
        return lines;
    }
}
