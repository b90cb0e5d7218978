//
// Created by aowei on 2025 10月 13.
//

#include <algorithm>
#include <queue>
#include <automa/check/equivalence.hpp>
#include <automa/dfa/minimize.hpp>
#include <automa/dfa/subset.hpp>
#include <automa/error.hpp>
#include <automa/nfa/thompson.hpp>

namespace automa::check {
    namespace {
        // 乘积自动机的一个结点，parent/symbol 用于回溯反例
        struct PairNode {
            StateId lhs;
            StateId rhs;
            std::size_t parent;
            char symbol;
        };

        constexpr std::size_t NO_PARENT = static_cast<std::size_t>(-1);

        std::string rebuild_word(const std::vector<PairNode> &nodes, std::size_t index) {
            std::string word;
            while (nodes[index].parent != NO_PARENT) {
                word += nodes[index].symbol;
                index = nodes[index].parent;
            }
            std::reverse(word.begin(), word.end());
            return word;
        }
    }

    EquivalenceResult check_equivalence(const dfa::DFA &lhs, const dfa::DFA &rhs) {
        if (lhs.alphabet != rhs.alphabet) {
            throw AutomatonError(ErrorType::INVALID_ALPHABET,
                                 "Cannot compare automata over different alphabets {" + lhs.alphabet.str() + "} and {" +
                                 rhs.alphabet.str() + "}");
        }
        // 两边各自补全，死状态也参与比较
        const auto a = dfa::complete_dfa(lhs);
        const auto b = dfa::complete_dfa(rhs);
        const std::size_t width = b.size();
        std::vector<bool> visited(a.size() * width, false);
        std::vector<PairNode> nodes;
        std::queue<std::size_t> q;
        nodes.push_back({a.start, b.start, NO_PARENT, '\0'});
        visited[a.start * width + b.start] = true;
        q.push(0);

        EquivalenceResult result;
        while (!q.empty()) {
            const auto index = q.front();
            q.pop();
            ++result.pairs_explored;
            const auto [u, v, parent, symbol] = nodes[index];
            // 恰好一边接受：对称差非空
            if (a.is_accept(u) != b.is_accept(v)) {
                result.equivalent = false;
                result.counterexample = rebuild_word(nodes, index);
                return result;
            }
            for (const char c: a.alphabet.symbols()) {
                const StateId nu = a.states[u].transitions.at(c);
                const StateId nv = b.states[v].transitions.at(c);
                if (visited[nu * width + nv]) continue;
                visited[nu * width + nv] = true;
                nodes.push_back({nu, nv, index, c});
                q.push(nodes.size() - 1);
            }
        }
        return result;
    }

    EquivalenceResult check_equivalence(const dfa::DFA &lhs, const std::string_view regex) {
        return check_equivalence(lhs, dfa::build_dfa(nfa::build_nfa(regex, lhs.alphabet)));
    }
}
