//
// Created by aowei on 2025 10月 13.
//

#include <automa/compiler.hpp>
#include <automa/dfa/minimize.hpp>
#include <automa/dfa/subset.hpp>
#include <automa/nfa/thompson.hpp>

namespace automa {
    Compilation compile_regex(const std::string_view raw_regex, const Alphabet &alphabet) {
        auto body = regex::sanitize_regex(raw_regex, alphabet);
        auto postfix = regex::infix_to_postfix(regex::tokenize(body, alphabet));
        // NFA 只在这里存活，子集构造完成后丢弃
        auto raw = dfa::build_dfa(nfa::build_nfa(postfix, alphabet));
        auto minimal = dfa::minimize_dfa(raw);
        return Compilation{std::move(body), std::move(postfix), std::move(raw), std::move(minimal)};
    }
}
