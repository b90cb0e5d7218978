//
// Created by aowei on 2025 10月 12.
//

#ifndef AUTOMA_ALPHABET_HPP
#define AUTOMA_ALPHABET_HPP

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace automa {
    // 状态 ID：NFA/DFA 的状态都存放在数组里，用下标作为 ID
    using StateId = std::size_t;

    // 有序的两字符字母表，只在输入边界校验一次
    class Alphabet {
    public:
        static constexpr std::size_t SIZE = 2;
        // 表示"不在字母表中"的下标
        static constexpr std::size_t NPOS = static_cast<std::size_t>(-1);

        // 默认字母表 {a, b}
        Alphabet();
        // 必须恰好是两个不同的字符，且不能是空白或正则元字符
        explicit Alphabet(std::string_view symbols);

        [[nodiscard]] char symbol(std::size_t index) const { return this->chars.at(index); }
        [[nodiscard]] const std::array<char, SIZE> &symbols() const { return this->chars; }
        [[nodiscard]] std::size_t index_of(char c) const;
        [[nodiscard]] bool contains(const char c) const { return index_of(c) != NPOS; }
        [[nodiscard]] std::string str() const;

        bool operator==(const Alphabet &other) const { return this->chars == other.chars; }
        bool operator!=(const Alphabet &other) const { return !(*this == other); }

    private:
        std::array<char, SIZE> chars;
    };
}

#endif //AUTOMA_ALPHABET_HPP
