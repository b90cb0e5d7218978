//
// Created by aowei on 2025 10月 12.
//

#ifndef AUTOMA_REGEX_PARSER_HPP
#define AUTOMA_REGEX_PARSER_HPP

#include <string>
#include <string_view>
#include <vector>
#include <automa/alphabet.hpp>

// 1. 词法单元定义
namespace automa::regex {
    enum class TokenType {
        CHAR,     // 字母表中的字符
        STAR,     // * 闭包
        PLUS,     // + 正闭包
        OPTIONAL, // ? 可选
        OR,       // | 选择
        CONCAT,   // 显式连接符，由 tokenize 插入
        LPAREN,   // ( 左括号
        RPAREN,   // ) 右括号
    };

    struct Token {
        TokenType type;
        char value; // 仅 CHAR 类型有效

        bool operator==(const Token &other) const { return type == other.type && value == other.value; }
        bool operator!=(const Token &other) const { return !(*this == other); }
    };

    [[nodiscard]] bool is_unary(TokenType type);
    [[nodiscard]] bool is_binary(TokenType type);
}

// 2. 解析函数声明
namespace automa::regex {
    // 预处理：去掉 ^/$ 锚点和空白，把 (?: 规整为 (，并检查字母是否都在字母表内
    std::string sanitize_regex(std::string_view raw_regex, const Alphabet &alphabet);
    // 词法分析：预处理后的正则 -> Token 列表（已插入显式连接符）
    std::vector<Token> tokenize(std::string_view sanitized, const Alphabet &alphabet);
    // 语法分析：Token 列表 -> 后缀表达式，调度场算法
    std::vector<Token> infix_to_postfix(const std::vector<Token> &tokens);
    // 上面三步合在一起
    std::vector<Token> parse_regex(std::string_view raw_regex, const Alphabet &alphabet);
    // 调试用：后缀表达式转字符串，连接符打印为 '.'
    std::string postfix_to_string(const std::vector<Token> &postfix);
}

#endif //AUTOMA_REGEX_PARSER_HPP
