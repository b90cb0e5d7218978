//
// Created by aowei on 2025/10/14.
//

#include <getopt.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <automa/alphabet.hpp>
#include <automa/check/equivalence.hpp>
#include <automa/check/fit.hpp>
#include <automa/check/structure.hpp>
#include <automa/compiler.hpp>
#include <automa/error.hpp>
#include <automa/io/report.hpp>
#include <automa/io/table.hpp>

namespace {
    const char *usage =
            "Usage:\n"
            "  automa build    [--regex R | --best-file F] [--alphabet ab] [--dfa-csv F] [--min-dfa-csv F]\n"
            "                  [--dfa-dot F] [--min-dfa-dot F] [--summary F]\n"
            "  automa validate [--dfa-csv F] [--alphabet ab] [--good F] [--bad F] [--regex R]\n"
            "                  [--other-dfa-csv F]\n";

    struct BuildOptions {
        std::string regex;
        std::string alphabet = "ab";
        std::string best_file = "best_regex.txt";
        std::string dfa_csv = "dfa_transition_table.csv";
        std::string min_dfa_csv = "min_dfa_transition_table.csv";
        std::string dfa_dot = "dfa.dot";
        std::string min_dfa_dot = "min_dfa.dot";
        std::string summary = "dfa_summary.txt";
    };

    struct ValidateOptions {
        std::string dfa_csv = "min_dfa_transition_table.csv";
        std::string alphabet = "ab";
        std::string good = "good.txt";
        std::string bad = "bad.txt";
        std::string regex;
        std::string other_dfa_csv;
    };

    std::ifstream open_input(const std::string &filename) {
        std::ifstream file(filename, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open file: " + filename);
        }
        return file;
    }

    std::ofstream open_output(const std::string &filename) {
        std::ofstream file(filename, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("cannot write file: " + filename);
        }
        return file;
    }

    // 样例文件不存在时视为没有样例
    std::vector<std::string> load_examples(const std::string &filename) {
        if (filename.empty()) return {};
        std::ifstream file(filename, std::ios::binary);
        if (!file.is_open()) return {};
        return automa::io::read_lines(file);
    }

    automa::io::TransitionTable load_table(const std::string &filename, const automa::Alphabet &alphabet) {
        auto file = open_input(filename);
        return automa::io::read_table(file, alphabet);
    }

    BuildOptions parse_build_options(const int argc, char **argv) {
        static const option long_options[] = {
            {"regex", required_argument, nullptr, 'r'},
            {"alphabet", required_argument, nullptr, 'a'},
            {"best-file", required_argument, nullptr, 'f'},
            {"dfa-csv", required_argument, nullptr, 'c'},
            {"min-dfa-csv", required_argument, nullptr, 'C'},
            {"dfa-dot", required_argument, nullptr, 'd'},
            {"min-dfa-dot", required_argument, nullptr, 'D'},
            {"summary", required_argument, nullptr, 's'},
            {nullptr, 0, nullptr, 0},
        };
        BuildOptions options;
        int opt;
        while ((opt = getopt_long(argc, argv, "r:a:f:c:C:d:D:s:", long_options, nullptr)) != -1) {
            switch (opt) {
                case 'r': options.regex = optarg;
                    break;
                case 'a': options.alphabet = optarg;
                    break;
                case 'f': options.best_file = optarg;
                    break;
                case 'c': options.dfa_csv = optarg;
                    break;
                case 'C': options.min_dfa_csv = optarg;
                    break;
                case 'd': options.dfa_dot = optarg;
                    break;
                case 'D': options.min_dfa_dot = optarg;
                    break;
                case 's': options.summary = optarg;
                    break;
                default:
                    throw std::invalid_argument(std::string("bad option\n") + usage);
            }
        }
        return options;
    }

    ValidateOptions parse_validate_options(const int argc, char **argv) {
        static const option long_options[] = {
            {"dfa-csv", required_argument, nullptr, 'c'},
            {"alphabet", required_argument, nullptr, 'a'},
            {"good", required_argument, nullptr, 'g'},
            {"bad", required_argument, nullptr, 'b'},
            {"regex", required_argument, nullptr, 'r'},
            {"other-dfa-csv", required_argument, nullptr, 'o'},
            {nullptr, 0, nullptr, 0},
        };
        ValidateOptions options;
        int opt;
        while ((opt = getopt_long(argc, argv, "c:a:g:b:r:o:", long_options, nullptr)) != -1) {
            switch (opt) {
                case 'c': options.dfa_csv = optarg;
                    break;
                case 'a': options.alphabet = optarg;
                    break;
                case 'g': options.good = optarg;
                    break;
                case 'b': options.bad = optarg;
                    break;
                case 'r': options.regex = optarg;
                    break;
                case 'o': options.other_dfa_csv = optarg;
                    break;
                default:
                    throw std::invalid_argument(std::string("bad option\n") + usage);
            }
        }
        return options;
    }

    int run_build(const BuildOptions &options) {
        const automa::Alphabet alphabet(options.alphabet);
        std::string regex = options.regex;
        if (regex.empty()) {
            auto file = open_input(options.best_file);
            std::getline(file, regex);
        }
        if (regex.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw std::invalid_argument("provide --regex or a non-empty " + options.best_file);
        }
        const auto result = automa::compile_regex(regex, alphabet);

        auto dfa_csv = open_output(options.dfa_csv);
        automa::io::write_table(dfa_csv, automa::io::to_table(result.dfa));
        auto min_dfa_csv = open_output(options.min_dfa_csv);
        automa::io::write_table(min_dfa_csv, automa::io::to_table(result.minimal));
        auto dfa_dot = open_output(options.dfa_dot);
        automa::io::write_dot(dfa_dot, result.dfa, "DFA");
        auto min_dfa_dot = open_output(options.min_dfa_dot);
        automa::io::write_dot(min_dfa_dot, result.minimal, "Minimized DFA");
        auto summary = open_output(options.summary);
        automa::io::write_summary(summary, result.body, result.dfa, result.minimal);

        std::cout << "Built DFA (" << result.dfa.size() << " states) and minimized DFA ("
                << result.minimal.size() << " states) for " << result.body << std::endl;
        for (const auto *path: {&options.dfa_csv, &options.min_dfa_csv, &options.dfa_dot, &options.min_dfa_dot,
                                &options.summary}) {
            std::cout << "  " << *path << std::endl;
        }
        return 0;
    }

    int run_validate(const ValidateOptions &options) {
        const automa::Alphabet alphabet(options.alphabet);
        const auto table = load_table(options.dfa_csv, alphabet);

        std::cout << "== Structural checks ==" << std::endl;
        const auto report = automa::check::check_structure(table);
        std::cout << "Deterministic & total transitions: " << (report.is_total() ? "OK" : "PROBLEMS") << std::endl;
        for (const auto &d: report.diagnostics) {
            std::cout << " - " << d.message << std::endl;
        }
        const auto dfa = automa::io::to_dfa(table);
        if (const auto hint = automa::check::check_minimality(dfa)) {
            std::cout << " - " << hint->message << std::endl;
        }

        std::cout << "\n== Data fit ==" << std::endl;
        const auto positives = load_examples(options.good);
        const auto negatives = load_examples(options.bad);
        if (positives.empty() && negatives.empty()) {
            std::cout << "(no data provided)" << std::endl;
        } else {
            const auto m = automa::check::evaluate_fit(dfa, positives, negatives);
            std::cout << "TP=" << m.true_positive << " FP=" << m.false_positive << " FN=" << m.false_negative
                    << " TN=" << m.true_negative << std::endl;
            std::cout << std::fixed << std::setprecision(4) << "Precision=" << m.precision << " Recall=" << m.recall
                    << " F1=" << m.f1 << " Acc=" << m.accuracy << std::endl;
        }

        if (!options.regex.empty()) {
            const auto eq = automa::check::check_equivalence(dfa, options.regex);
            std::cout << "\n== Equivalence to regex ==" << std::endl;
            std::cout << "Equivalent to '" << options.regex << "'? " << (eq.equivalent ? "YES" : "NO") << std::endl;
            if (eq.counterexample) std::cout << "Counterexample: \"" << *eq.counterexample << "\"" << std::endl;
        }
        if (!options.other_dfa_csv.empty()) {
            const auto other = automa::io::to_dfa(load_table(options.other_dfa_csv, alphabet));
            const auto eq = automa::check::check_equivalence(dfa, other);
            std::cout << "\n== Equivalence to other DFA ==" << std::endl;
            std::cout << "Equivalent to " << options.other_dfa_csv << "? " << (eq.equivalent ? "YES" : "NO")
                    << std::endl;
            if (eq.counterexample) std::cout << "Counterexample: \"" << *eq.counterexample << "\"" << std::endl;
        }
        return 0;
    }
}

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << usage;
        return 2;
    }
    const std::string command = argv[1];
    try {
        // 子命令之后的参数交给 getopt_long，argv[1] 充当程序名
        if (command == "build") return run_build(parse_build_options(argc - 1, argv + 1));
        if (command == "validate") return run_validate(parse_validate_options(argc - 1, argv + 1));
        std::cerr << "unknown command: " << command << "\n" << usage;
        return 2;
    } catch (const automa::AutomatonError &e) {
        std::cerr << "error: " << automa::error_type_to_string(e.type()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
