//
// Created by aowei on 2025 10月 12.
//

#include <cctype>
#include <unordered_map>
#include <automa/alphabet.hpp>
#include <automa/error.hpp>

// 匿名数据
namespace automa {
    namespace {
        // 不能作为字母表符号的正则元字符
        constexpr std::string_view reserved_chars = "|*+?()^$:";

        std::unordered_map<ErrorType, std::string> error_type_string_map{
            {ErrorType::INVALID_ALPHABET, "INVALID_ALPHABET"},
            {ErrorType::ALPHABET_VIOLATION, "ALPHABET_VIOLATION"},
            {ErrorType::UNSUPPORTED_TOKEN, "UNSUPPORTED_TOKEN"},
            {ErrorType::MISMATCHED_PARENTHESIS, "MISMATCHED_PARENTHESIS"},
            {ErrorType::INVALID_POSTFIX, "INVALID_POSTFIX"},
            {ErrorType::MALFORMED_TABLE, "MALFORMED_TABLE"},
            {ErrorType::UNKNOWN_STATE_REFERENCE, "UNKNOWN_STATE_REFERENCE"},
        };
    }
}

// AutomatonError
namespace automa {
    AutomatonError::AutomatonError(const ErrorType type, const std::string &message)
        : std::invalid_argument(message), error_type(type) {}

    std::string error_type_to_string(const ErrorType type) {
        const auto it = error_type_string_map.find(type);
        return it == error_type_string_map.end() ? "UNKNOWN" : it->second;
    }
}

// Alphabet
namespace automa {
    Alphabet::Alphabet() : chars{'a', 'b'} {}

    Alphabet::Alphabet(const std::string_view symbols) : chars{} {
        if (symbols.size() != SIZE) {
            throw AutomatonError(ErrorType::INVALID_ALPHABET,
                                 "Alphabet must be exactly two symbols, got \"" + std::string(symbols) + "\"");
        }
        if (symbols[0] == symbols[1]) {
            throw AutomatonError(ErrorType::INVALID_ALPHABET,
                                 "Alphabet symbols must be distinct, got \"" + std::string(symbols) + "\"");
        }
        for (std::size_t i = 0; i < SIZE; ++i) {
            const char c = symbols[i];
            if (std::isspace(static_cast<unsigned char>(c)) || reserved_chars.find(c) != std::string_view::npos) {
                throw AutomatonError(ErrorType::INVALID_ALPHABET,
                                     std::string("Alphabet symbol '") + c + "' is whitespace or a regex operator");
            }
            this->chars[i] = c;
        }
    }

    std::size_t Alphabet::index_of(const char c) const {
        for (std::size_t i = 0; i < SIZE; ++i) {
            if (this->chars[i] == c) return i;
        }
        return NPOS;
    }

    std::string Alphabet::str() const {
        return std::string(this->chars.begin(), this->chars.end());
    }
}
