//
// Created by aowei on 2025 10月 12.
//

#ifndef AUTOMA_ERROR_HPP
#define AUTOMA_ERROR_HPP

#include <stdexcept>
#include <string>

namespace automa {
    // 错误类型枚举
    enum class ErrorType {
        INVALID_ALPHABET,        // 字母表不是两个合法且不同的字符
        ALPHABET_VIOLATION,      // 正则中出现字母表以外的字母
        UNSUPPORTED_TOKEN,       // 语法以外的字符
        MISMATCHED_PARENTHESIS,  // 括号不匹配
        INVALID_POSTFIX,         // 后缀表达式操作数个数不对
        MALFORMED_TABLE,         // 转移表格式错误
        UNKNOWN_STATE_REFERENCE, // 转移目标不是已声明的状态
    };

    // 构建/加载失败时抛出的异常，携带错误类型
    class AutomatonError : public std::invalid_argument {
    public:
        AutomatonError(ErrorType type, const std::string &message);

        [[nodiscard]] ErrorType type() const noexcept { return this->error_type; }

    private:
        ErrorType error_type;
    };

    std::string error_type_to_string(ErrorType type);
}

#endif //AUTOMA_ERROR_HPP
