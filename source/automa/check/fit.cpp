//
// Created by aowei on 2025 10月 13.
//

#include <algorithm>
#include <automa/check/fit.hpp>

namespace automa::check {
    FitMetrics evaluate_fit(const dfa::DFA &dfa, const std::vector<std::string> &positives,
                            const std::vector<std::string> &negatives) {
        FitMetrics m;
        for (const auto &s: positives) {
            (dfa::match(dfa, s) ? m.true_positive : m.false_negative)++;
        }
        for (const auto &s: negatives) {
            (dfa::match(dfa, s) ? m.false_positive : m.true_negative)++;
        }
        const auto ratio = [](const std::size_t num, const std::size_t den) {
            return den == 0 ? 0.0 : static_cast<double>(num) / static_cast<double>(den);
        };
        m.precision = ratio(m.true_positive, m.true_positive + m.false_positive);
        m.recall = ratio(m.true_positive, m.true_positive + m.false_negative);
        m.f1 = m.precision + m.recall > 0.0 ? 2.0 * m.precision * m.recall / (m.precision + m.recall) : 0.0;
        const std::size_t total = m.true_positive + m.false_positive + m.false_negative + m.true_negative;
        m.accuracy = ratio(m.true_positive + m.true_negative, std::max<std::size_t>(1, total));
        return m;
    }
}
