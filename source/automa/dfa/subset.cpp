//
// Created by aowei on 2025 10月 12.
//

#include <map>
#include <queue>
#include <automa/dfa/subset.hpp>

namespace automa::dfa {
    namespace {
        // 子集的规范键：有序的 NFA 状态 ID 序列
        using SubsetKey = std::vector<StateId>;

        bool contains_accept(const nfa::NFA &nfa, const std::set<StateId> &states) {
            for (const auto s: states) {
                if (nfa.accepts.count(s)) return true;
            }
            return false;
        }
    }

    DFA build_dfa(const nfa::NFA &nfa) {
        DFA dfa(nfa.alphabet);
        std::map<SubsetKey, StateId> state_map;
        std::vector<std::set<StateId> > subsets;
        // 1. 初始状态：NFA 起始状态的 ε 闭包，编号为 0
        auto initial = nfa::epsilon_closure(nfa, {nfa.start});
        dfa.start = dfa.add_state(contains_accept(nfa, initial));
        state_map.emplace(SubsetKey(initial.begin(), initial.end()), dfa.start);
        subsets.push_back(std::move(initial));
        // 2. 广度优先处理所有的 DFA 状态
        std::queue<StateId> state_queue;
        state_queue.push(dfa.start);
        while (!state_queue.empty()) {
            const auto current = state_queue.front();
            state_queue.pop();
            for (const char c: nfa.alphabet.symbols()) {
                auto next = nfa::epsilon_closure(nfa, nfa::move(nfa, subsets[current], c));
                // 空集不记录转移，留给补全阶段处理
                if (next.empty()) continue;
                SubsetKey key(next.begin(), next.end());
                auto it = state_map.find(key);
                if (it == state_map.end()) {
                    const auto id = dfa.add_state(contains_accept(nfa, next));
                    it = state_map.emplace(std::move(key), id).first;
                    subsets.push_back(std::move(next));
                    state_queue.push(id);
                }
                dfa.add_transition(current, c, it->second);
            }
        }
        return dfa;
    }
}
