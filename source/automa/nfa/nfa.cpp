//
// Created by aowei on 2025 10月 12.
//

#include <queue>
#include <automa/nfa/nfa.hpp>

// NFA 的实现
namespace automa::nfa {
    StateId NFA::add_state() {
        this->states.emplace_back();
        return this->states.size() - 1;
    }

    void NFA::add_transition(const StateId from, const char c, const StateId to) {
        this->states.at(from).transitions[c].insert(to);
    }

    void NFA::add_epsilon(const StateId from, const StateId to) {
        this->states.at(from).eps_transitions.insert(to);
    }

    // 调试用打印函数
    void NFA::print(std::ostream &out, const std::string &name) const {
        out << "=== " << name << " Structure ===" << std::endl;
        out << "Start State: " << this->start << std::endl;
        out << "Accept States: ";
        for (const auto s: this->accepts) out << s << " ";
        out << "\nTransitions:\n";
        for (StateId s = 0; s < this->states.size(); ++s) {
            for (const auto t: this->states[s].eps_transitions) {
                out << "  State " << s << " --ε--> State " << t << std::endl;
            }
            for (const auto &[c, targets]: this->states[s].transitions) {
                for (const auto t: targets) {
                    out << "  State " << s << " --" << c << "--> State " << t << std::endl;
                }
            }
        }
        out << "===========================\n" << std::endl;
    }
}

namespace automa::nfa {
    // ε 闭包：工作队列求不动点
    std::set<StateId> epsilon_closure(const NFA &nfa, const std::set<StateId> &states) {
        std::set<StateId> closure = states;
        std::queue<StateId> q;
        for (const auto s: states) q.push(s);
        while (!q.empty()) {
            const auto current = q.front();
            q.pop();
            for (const auto next: nfa.states[current].eps_transitions) {
                if (closure.insert(next).second) {
                    q.push(next);
                }
            }
        }
        return closure;
    }

    std::set<StateId> move(const NFA &nfa, const std::set<StateId> &states, const char c) {
        std::set<StateId> result;
        for (const auto s: states) {
            const auto &transitions = nfa.states[s].transitions;
            const auto it = transitions.find(c);
            if (it != transitions.end()) {
                result.insert(it->second.begin(), it->second.end());
            }
        }
        return result;
    }

    bool match(const NFA &nfa, const std::string_view input) {
        auto current = epsilon_closure(nfa, {nfa.start});
        for (const char c: input) {
            if (!nfa.alphabet.contains(c)) return false;
            current = epsilon_closure(nfa, move(nfa, current, c));
            if (current.empty()) return false;
        }
        for (const auto s: current) {
            if (nfa.accepts.count(s)) return true;
        }
        return false;
    }
}
