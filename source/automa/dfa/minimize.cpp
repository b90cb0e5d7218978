//
// Created by aowei on 2025 10月 12.
//

#include <map>
#include <queue>
#include <stdexcept>
#include <automa/dfa/minimize.hpp>

// 最小化辅助函数
namespace automa::dfa {
    namespace {
        // 反向转移：inverse[字符下标][目标] = 所有源状态
        using InverseTransitions = std::vector<std::vector<std::vector<StateId> > >;

        InverseTransitions build_inverse(const DFA &completed) {
            InverseTransitions inverse(Alphabet::SIZE, std::vector<std::vector<StateId> >(completed.size()));
            for (StateId s = 0; s < completed.size(); ++s) {
                for (std::size_t i = 0; i < Alphabet::SIZE; ++i) {
                    const StateId t = completed.states[s].transitions.at(completed.alphabet.symbol(i));
                    inverse[i][t].push_back(s);
                }
            }
            return inverse;
        }

        // 把每个可达的块变成一个新状态，按广度优先顺序编号，不可达的块（通常是死状态）被丢弃
        DFA build_quotient(const DFA &completed, const Partition &partition) {
            DFA minimal(completed.alphabet);
            std::vector<StateId> new_id(partition.blocks.size(), Alphabet::NPOS);
            std::queue<std::size_t> q;
            const auto start_block = partition.block_of[completed.start];
            new_id[start_block] = minimal.add_state(completed.is_accept(partition.blocks[start_block].front()));
            minimal.start = new_id[start_block];
            q.push(start_block);
            while (!q.empty()) {
                const auto block = q.front();
                q.pop();
                // 同一块内的状态接受性和转移目标块都一致，取第一个作为代表
                const StateId rep = partition.blocks[block].front();
                for (const char c: completed.alphabet.symbols()) {
                    const auto target_block = partition.block_of[completed.states[rep].transitions.at(c)];
                    if (new_id[target_block] == Alphabet::NPOS) {
                        new_id[target_block] = minimal.add_state(
                            completed.is_accept(partition.blocks[target_block].front()));
                        q.push(target_block);
                    }
                    minimal.add_transition(new_id[block], c, new_id[target_block]);
                }
            }
            return minimal;
        }
    }
}

namespace automa::dfa {
    DFA complete_dfa(const DFA &dfa) {
        DFA completed = dfa;
        const auto sink = completed.add_state(false);
        for (auto &state: completed.states) {
            for (const char c: completed.alphabet.symbols()) {
                // 已有的转移保持不变
                state.transitions.emplace(c, sink);
            }
        }
        return completed;
    }

    // Hopcroft 算法
    Partition refine_partition(const DFA &completed) {
        if (!completed.is_complete()) {
            throw std::invalid_argument("refine_partition requires a complete DFA");
        }
        const std::size_t n = completed.size();
        Partition partition;
        partition.block_of.assign(n, 0);
        // 1. 初始划分：接受/非接受，空块省略
        std::vector<StateId> accept_part, non_accept_part;
        for (StateId s = 0; s < n; ++s) {
            (completed.is_accept(s) ? accept_part : non_accept_part).push_back(s);
        }
        for (auto *part: {&accept_part, &non_accept_part}) {
            if (part->empty()) continue;
            for (const auto s: *part) partition.block_of[s] = partition.blocks.size();
            partition.blocks.push_back(std::move(*part));
        }
        // 2. 两个初始块都放进工作表
        std::vector<std::size_t> worklist;
        std::vector<bool> pending(partition.blocks.size(), true);
        for (std::size_t b = 0; b < partition.blocks.size(); ++b) worklist.push_back(b);

        const auto inverse = build_inverse(completed);
        std::vector<bool> in_x(n, false);
        while (!worklist.empty()) {
            const auto splitter_handle = worklist.back();
            worklist.pop_back();
            pending[splitter_handle] = false;
            // 分割过程中块会变化，先拷贝一份分割器
            const std::vector<StateId> splitter = partition.blocks[splitter_handle];
            for (std::size_t i = 0; i < Alphabet::SIZE; ++i) {
                // X = 在字符 i 上转移进分割器的所有状态
                std::vector<StateId> x;
                for (const auto t: splitter) {
                    for (const auto s: inverse[i][t]) {
                        if (!in_x[s]) {
                            in_x[s] = true;
                            x.push_back(s);
                        }
                    }
                }
                // 按所在块分组，只有被 X 触及的块才可能分裂
                std::map<std::size_t, std::vector<StateId> > touched;
                for (const auto s: x) touched[partition.block_of[s]].push_back(s);
                for (auto &[y, inter]: touched) {
                    if (inter.size() == partition.blocks[y].size()) continue;
                    std::vector<StateId> rest;
                    for (const auto s: partition.blocks[y]) {
                        if (!in_x[s]) rest.push_back(s);
                    }
                    // Y 保留 Y\X，Y∩X 得到新的块句柄
                    const std::size_t created = partition.blocks.size();
                    for (const auto s: inter) partition.block_of[s] = created;
                    const bool inter_smaller = inter.size() <= rest.size();
                    partition.blocks[y] = std::move(rest);
                    partition.blocks.push_back(std::move(inter));
                    pending.push_back(false);
                    if (pending[y]) {
                        pending[created] = true;
                        worklist.push_back(created);
                    } else {
                        const std::size_t smaller = inter_smaller ? created : y;
                        pending[smaller] = true;
                        worklist.push_back(smaller);
                    }
                }
                for (const auto s: x) in_x[s] = false;
            }
        }
        return partition;
    }

    DFA minimize_dfa(const DFA &dfa) {
        const DFA completed = complete_dfa(dfa);
        return build_quotient(completed, refine_partition(completed));
    }
}
