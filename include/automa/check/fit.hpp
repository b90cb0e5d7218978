//
// Created by aowei on 2025 10月 13.
//

#ifndef AUTOMA_FIT_HPP
#define AUTOMA_FIT_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <automa/dfa/dfa.hpp>

namespace automa::check {
    // 混淆矩阵以及由它导出的指标
    struct FitMetrics {
        std::size_t true_positive = 0;
        std::size_t false_positive = 0;
        std::size_t false_negative = 0;
        std::size_t true_negative = 0;
        double precision = 0.0;
        double recall = 0.0;
        double f1 = 0.0;
        double accuracy = 0.0;
    };

    // 用正/负样例评估 DFA，只读，不修改自动机
    FitMetrics evaluate_fit(const dfa::DFA &dfa, const std::vector<std::string> &positives,
                            const std::vector<std::string> &negatives);
}

#endif //AUTOMA_FIT_HPP
