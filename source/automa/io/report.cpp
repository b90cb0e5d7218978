//
// Created by aowei on 2025 10月 13.
//

#include <automa/io/report.hpp>

namespace automa::io {
    namespace {
        std::string escape_label(const std::string &text) {
            std::string escaped;
            for (const char c: text) {
                if (c == '"' || c == '\\') escaped += '\\';
                escaped += c;
            }
            return escaped;
        }
    }

    void write_dot(std::ostream &out, const dfa::DFA &dfa, const std::string &title) {
        out << "digraph DFA {\n";
        out << "  rankdir=LR;\n";
        out << "  node [shape=circle];\n";
        out << "  __start [shape=point];\n";
        if (!dfa.states.empty()) {
            out << "  __start -> " << dfa.start << ";\n";
        }
        for (StateId s = 0; s < dfa.size(); ++s) {
            if (dfa.is_accept(s)) out << "  " << s << " [shape=doublecircle];\n";
        }
        for (StateId s = 0; s < dfa.size(); ++s) {
            for (const auto &[c, target]: dfa.states[s].transitions) {
                out << "  " << s << " -> " << target << " [label=\"" << c << "\"];\n";
            }
        }
        out << "  label=\"" << escape_label(title) << "\"; labelloc=\"t\";\n";
        out << "}\n";
    }

    void write_summary(std::ostream &out, const std::string &regex_body, const dfa::DFA &dfa,
                       const dfa::DFA &minimal) {
        out << "Regex to DFA Report\n";
        out << "===================\n\n";
        out << "Regex (body): " << regex_body << "\n";
        out << "Alphabet    : " << dfa.alphabet.str() << "\n\n";
        out << "DFA states         : " << dfa.size() << "\n";
        out << "DFA accepting      : " << dfa.accept_count() << "\n";
        out << "Min DFA states     : " << minimal.size() << "\n";
        out << "Min DFA accepting  : " << minimal.accept_count() << "\n";
    }
}
