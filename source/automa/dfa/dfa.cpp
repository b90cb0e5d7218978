//
// Created by aowei on 2025 10月 12.
//

#include <algorithm>
#include <automa/dfa/dfa.hpp>

// DFA 的实现
namespace automa::dfa {
    StateId DFA::add_state(const bool is_accept) {
        this->states.push_back(DFAState{is_accept, {}});
        return this->states.size() - 1;
    }

    void DFA::add_transition(const StateId from, const char c, const StateId to) {
        this->states.at(from).transitions[c] = to;
    }

    std::optional<StateId> DFA::next(const StateId state, const char c) const {
        const auto &transitions = this->states.at(state).transitions;
        const auto it = transitions.find(c);
        if (it == transitions.end()) return std::nullopt;
        return it->second;
    }

    std::size_t DFA::accept_count() const {
        return std::count_if(this->states.begin(), this->states.end(),
                             [](const DFAState &s) { return s.is_accept; });
    }

    bool DFA::is_complete() const {
        for (const auto &s: this->states) {
            for (const char c: this->alphabet.symbols()) {
                if (!s.transitions.count(c)) return false;
            }
        }
        return true;
    }

    // DFA 调试用打印函数
    void DFA::print(std::ostream &out, const std::string &name) const {
        out << "=== " << name << " Structure ===" << std::endl;
        out << "Start State: " << this->start << std::endl;
        out << "Accept States: ";
        for (StateId s = 0; s < this->states.size(); ++s) {
            if (this->states[s].is_accept) out << s << " ";
        }
        out << "\nTransitions:\n";
        for (StateId s = 0; s < this->states.size(); ++s) {
            for (const auto &[c, target]: this->states[s].transitions) {
                out << "  State " << s << " --" << c << "--> State " << target << std::endl;
            }
        }
        out << "===========================\n" << std::endl;
    }

    bool match(const DFA &dfa, const std::string_view input) {
        if (dfa.states.empty()) return false;
        StateId current = dfa.start;
        for (const char c: input) {
            if (!dfa.alphabet.contains(c)) return false;
            const auto next = dfa.next(current, c);
            if (!next) {
                // 无匹配，转移失败
                return false;
            }
            current = *next;
        }
        return dfa.is_accept(current);
    }
}
