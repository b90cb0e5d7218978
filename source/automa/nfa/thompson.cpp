//
// Created by aowei on 2025 10月 12.
//

#include <set>
#include <stack>
#include <automa/error.hpp>
#include <automa/nfa/thompson.hpp>

// NFA 构建辅助函数
namespace automa::nfa {
    namespace {
        // 片段：一个入口状态 + 一组接受状态
        struct Fragment {
            StateId start;
            std::set<StateId> accepts;
        };

        Fragment pop_fragment(std::stack<Fragment> &stack, const char *op) {
            if (stack.empty()) {
                throw AutomatonError(ErrorType::INVALID_POSTFIX,
                                     std::string("Invalid postfix: '") + op + "' is missing an operand");
            }
            Fragment top = std::move(stack.top());
            stack.pop();
            return top;
        }

        // 单个字符的构建：c
        Fragment create_char_fragment(NFA &nfa, const char c) {
            const auto start = nfa.add_state();
            const auto end = nfa.add_state();
            nfa.add_transition(start, c, end);
            return {start, {end}};
        }

        // 连接的构建：ab，a 的每个接受状态 ->ε-> b 的起始状态
        Fragment create_concatenate_fragment(NFA &nfa, Fragment &&a, Fragment &&b) {
            for (const auto acc: a.accepts) nfa.add_epsilon(acc, b.start);
            return {a.start, std::move(b.accepts)};
        }

        // 选择的构建：a|b
        Fragment create_alternative_fragment(NFA &nfa, const Fragment &a, const Fragment &b) {
            const auto start = nfa.add_state();
            const auto end = nfa.add_state();
            nfa.add_epsilon(start, a.start);
            nfa.add_epsilon(start, b.start);
            for (const auto acc: a.accepts) nfa.add_epsilon(acc, end);
            for (const auto acc: b.accepts) nfa.add_epsilon(acc, end);
            return {start, {end}};
        }

        // 闭包的构建：a*，a+，a?
        // skip_body: 新起始可以直接到新接受；loop_back: a 的接受状态可以回到 a 的起始
        Fragment create_closure_fragment(NFA &nfa, const Fragment &a, const bool skip_body, const bool loop_back) {
            const auto start = nfa.add_state();
            const auto end = nfa.add_state();
            nfa.add_epsilon(start, a.start);
            if (skip_body) nfa.add_epsilon(start, end);
            for (const auto acc: a.accepts) {
                if (loop_back) nfa.add_epsilon(acc, a.start);
                nfa.add_epsilon(acc, end);
            }
            return {start, {end}};
        }
    }
}

namespace automa::nfa {
    NFA build_nfa(const std::vector<regex::Token> &postfix, const Alphabet &alphabet) {
        using regex::TokenType;
        NFA nfa(alphabet);
        std::stack<Fragment> frag_stack;
        for (const auto &[type, value]: postfix) {
            switch (type) {
                case TokenType::CHAR: {
                    if (!alphabet.contains(value)) {
                        throw AutomatonError(ErrorType::ALPHABET_VIOLATION,
                                             std::string("Literal '") + value + "' is outside alphabet {" +
                                             alphabet.symbol(0) + "," + alphabet.symbol(1) + "}");
                    }
                    frag_stack.push(create_char_fragment(nfa, value));
                    break;
                }
                case TokenType::CONCAT: {
                    auto b = pop_fragment(frag_stack, ".");
                    auto a = pop_fragment(frag_stack, ".");
                    frag_stack.push(create_concatenate_fragment(nfa, std::move(a), std::move(b)));
                    break;
                }
                case TokenType::OR: {
                    const auto b = pop_fragment(frag_stack, "|");
                    const auto a = pop_fragment(frag_stack, "|");
                    frag_stack.push(create_alternative_fragment(nfa, a, b));
                    break;
                }
                case TokenType::STAR: {
                    const auto a = pop_fragment(frag_stack, "*");
                    frag_stack.push(create_closure_fragment(nfa, a, true, true));
                    break;
                }
                case TokenType::PLUS: {
                    const auto a = pop_fragment(frag_stack, "+");
                    frag_stack.push(create_closure_fragment(nfa, a, false, true));
                    break;
                }
                case TokenType::OPTIONAL: {
                    const auto a = pop_fragment(frag_stack, "?");
                    frag_stack.push(create_closure_fragment(nfa, a, true, false));
                    break;
                }
                case TokenType::LPAREN:
                case TokenType::RPAREN:
                    throw AutomatonError(ErrorType::INVALID_POSTFIX, "Invalid postfix: parenthesis in postfix sequence");
            }
        }
        if (frag_stack.size() != 1) {
            throw AutomatonError(ErrorType::INVALID_POSTFIX,
                                 "Invalid postfix: expected exactly one fragment at end, got " +
                                 std::to_string(frag_stack.size()));
        }
        nfa.start = frag_stack.top().start;
        nfa.accepts = std::move(frag_stack.top().accepts);
        return nfa;
    }

    NFA build_nfa(const std::string_view raw_regex, const Alphabet &alphabet) {
        return build_nfa(regex::parse_regex(raw_regex, alphabet), alphabet);
    }
}
