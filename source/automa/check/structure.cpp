//
// Created by aowei on 2025 10月 13.
//

#include <algorithm>
#include <queue>
#include <unordered_map>
#include <automa/check/structure.hpp>
#include <automa/dfa/minimize.hpp>
#include <automa/error.hpp>

namespace automa::check {
    namespace {
        std::unordered_map<DiagnosticType, std::string> diagnostic_type_string_map{
            {DiagnosticType::MISSING_TRANSITION, "MISSING_TRANSITION"},
            {DiagnosticType::UNREACHABLE_STATE, "UNREACHABLE_STATE"},
            {DiagnosticType::NOT_MINIMAL, "NOT_MINIMAL"},
        };
    }

    std::string diagnostic_type_to_string(const DiagnosticType type) {
        const auto it = diagnostic_type_string_map.find(type);
        return it == diagnostic_type_string_map.end() ? "UNKNOWN" : it->second;
    }

    std::size_t StructureReport::count(const DiagnosticType type) const {
        return std::count_if(this->diagnostics.begin(), this->diagnostics.end(),
                             [type](const Diagnostic &d) { return d.type == type; });
    }
}

namespace automa::check {
    StructureReport check_structure(const io::TransitionTable &table) {
        StructureReport report;
        if (table.rows.empty()) return report;
        const Alphabet &alphabet = table.alphabet;
        std::unordered_map<StateId, const io::TableRow *> declared;
        for (const auto &row: table.rows) declared.emplace(row.id, &row);
        // 1. 转移目标必须是已声明的状态
        std::set<StateId> unknown;
        std::string first_reference;
        for (const auto &row: table.rows) {
            for (std::size_t i = 0; i < Alphabet::SIZE; ++i) {
                const auto &target = row.targets[i];
                if (target && !declared.count(*target)) {
                    if (unknown.empty()) {
                        first_reference = "(" + std::to_string(row.id) + ", " + alphabet.symbol(i) + ")";
                    }
                    unknown.insert(*target);
                }
            }
        }
        if (!unknown.empty()) {
            std::string ids;
            for (const auto id: unknown) ids += (ids.empty() ? "" : ", ") + std::to_string(id);
            throw AutomatonError(ErrorType::UNKNOWN_STATE_REFERENCE,
                                 "Transitions to unknown states: [" + ids + "], first at " + first_reference);
        }
        // 2. 缺失的转移：转移前的 DFA 本来就可能不完全，只记为诊断
        for (const auto &row: table.rows) {
            for (std::size_t i = 0; i < Alphabet::SIZE; ++i) {
                if (row.targets[i]) continue;
                const char c = alphabet.symbol(i);
                report.diagnostics.emplace_back(DiagnosticType::MISSING_TRANSITION,
                                                "Missing transition: delta(" + std::to_string(row.id) + "," + c + ")",
                                                row.id, c);
            }
        }
        // 3. 从起始状态广度优先求可达集合
        std::queue<StateId> q;
        q.push(table.start());
        report.reachable.insert(table.start());
        while (!q.empty()) {
            const auto current = q.front();
            q.pop();
            for (const auto &target: declared.at(current)->targets) {
                if (target && report.reachable.insert(*target).second) q.push(*target);
            }
        }
        for (const auto &row: table.rows) {
            if (!report.reachable.count(row.id)) {
                report.diagnostics.emplace_back(DiagnosticType::UNREACHABLE_STATE,
                                                "Unreachable state: " + std::to_string(row.id), row.id);
            }
        }
        return report;
    }

    StructureReport check_structure(const dfa::DFA &dfa) {
        return check_structure(io::to_table(dfa));
    }

    std::optional<Diagnostic> check_minimality(const dfa::DFA &dfa) {
        const auto minimal = dfa::minimize_dfa(dfa);
        if (dfa.size() <= minimal.size()) return std::nullopt;
        return Diagnostic(DiagnosticType::NOT_MINIMAL,
                          "DFA has " + std::to_string(dfa.size()) + " states, minimal equivalent has " +
                          std::to_string(minimal.size()), dfa.start);
    }
}
