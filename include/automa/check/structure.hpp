//
// Created by aowei on 2025 10月 13.
//

#ifndef AUTOMA_STRUCTURE_HPP
#define AUTOMA_STRUCTURE_HPP

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <automa/dfa/dfa.hpp>
#include <automa/io/table.hpp>

namespace automa::check {
    // 诊断类型：都不是致命错误
    enum class DiagnosticType {
        MISSING_TRANSITION, // 某个 (状态, 字符) 没有转移
        UNREACHABLE_STATE,  // 从起始状态不可达
        NOT_MINIMAL,        // 状态数多于等价的最小 DFA
    };

    struct Diagnostic {
        DiagnosticType type;
        std::string message;
        StateId state;
        std::optional<char> symbol; // 仅 MISSING_TRANSITION 有效

        Diagnostic() = delete;

        explicit Diagnostic(const DiagnosticType type, std::string message, const StateId state,
                            const std::optional<char> symbol = std::nullopt) : type(type),
                                                                               message(std::move(message)),
                                                                               state(state), symbol(symbol) {}
    };

    // 结构检查结果：诊断列表 + 可达状态集合（使用表中的原始 ID）
    struct StructureReport {
        std::vector<Diagnostic> diagnostics;
        std::set<StateId> reachable;

        [[nodiscard]] std::size_t count(DiagnosticType type) const;
        [[nodiscard]] bool is_total() const { return count(DiagnosticType::MISSING_TRANSITION) == 0; }
        [[nodiscard]] bool all_reachable() const { return count(DiagnosticType::UNREACHABLE_STATE) == 0; }
    };

    // 结构检查：缺失转移和不可达状态记为诊断，转移目标未声明时抛出 UNKNOWN_STATE_REFERENCE
    StructureReport check_structure(const io::TransitionTable &table);
    StructureReport check_structure(const dfa::DFA &dfa);
    // 最小性提示：与最小化后的状态数比较
    std::optional<Diagnostic> check_minimality(const dfa::DFA &dfa);

    std::string diagnostic_type_to_string(DiagnosticType type);
}

#endif //AUTOMA_STRUCTURE_HPP
