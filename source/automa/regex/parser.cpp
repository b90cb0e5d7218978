//
// Created by aowei on 2025 10月 12.
//

#include <cctype>
#include <set>
#include <stack>
#include <unordered_map>
#include <automa/error.hpp>
#include <automa/regex/parser.hpp>

namespace automa::regex {
    namespace {
        // 运算符优先级：STAR/PLUS/OPTIONAL(3) > CONCAT(2) > OR(1)
        const std::unordered_map<TokenType, int> precedence = {
            {TokenType::STAR, 3},
            {TokenType::PLUS, 3},
            {TokenType::OPTIONAL, 3},
            {TokenType::CONCAT, 2},
            {TokenType::OR, 1},
        };

        // 左边的 Token 能结束一个操作数：字符、右括号、一元运算符
        bool ends_operand(const TokenType type) {
            return type == TokenType::CHAR || type == TokenType::RPAREN || is_unary(type);
        }

        // 右边的 Token 能开始一个操作数：字符、左括号
        bool starts_operand(const TokenType type) {
            return type == TokenType::CHAR || type == TokenType::LPAREN;
        }

        void replace_all(std::string &text, const std::string_view from, const std::string_view to) {
            std::size_t pos = 0;
            while ((pos = text.find(from, pos)) != std::string::npos) {
                text.replace(pos, from.size(), to);
                pos += to.size();
            }
        }
    }

    bool is_unary(const TokenType type) {
        return type == TokenType::STAR || type == TokenType::PLUS || type == TokenType::OPTIONAL;
    }

    bool is_binary(const TokenType type) {
        return type == TokenType::OR || type == TokenType::CONCAT;
    }
}

namespace automa::regex {
    // 预处理
    std::string sanitize_regex(const std::string_view raw_regex, const Alphabet &alphabet) {
        // 空白只是排版，直接去掉
        std::string processed;
        for (const char c: raw_regex) {
            if (!std::isspace(static_cast<unsigned char>(c))) processed += c;
        }
        // 匹配总是整串匹配，锚点没有意义
        if (!processed.empty() && processed.front() == '^') processed.erase(0, 1);
        if (!processed.empty() && processed.back() == '$') processed.pop_back();
        // 非捕获分组按普通分组处理
        replace_all(processed, "(?:", "(");
        // 所有字母必须属于字母表
        std::set<char> outside;
        for (const char c: processed) {
            if (std::isalpha(static_cast<unsigned char>(c)) && !alphabet.contains(c)) {
                outside.insert(c);
            }
        }
        if (!outside.empty()) {
            std::string names;
            for (const char c: outside) {
                if (!names.empty()) names += ", ";
                names += c;
            }
            throw AutomatonError(ErrorType::ALPHABET_VIOLATION,
                                 "Regex contains literals outside alphabet {" + std::string(1, alphabet.symbol(0)) +
                                 "," + alphabet.symbol(1) + "}: " + names);
        }
        return processed;
    }

    // 词法分析
    std::vector<Token> tokenize(const std::string_view sanitized, const Alphabet &alphabet) {
        std::vector<Token> tokens;
        for (std::size_t i = 0; i < sanitized.size(); ++i) {
            const char c = sanitized[i];
            Token token{TokenType::CHAR, '\0'};
            switch (c) {
                case '*':
                    token.type = TokenType::STAR;
                    break;
                case '+':
                    token.type = TokenType::PLUS;
                    break;
                case '?':
                    token.type = TokenType::OPTIONAL;
                    break;
                case '|':
                    token.type = TokenType::OR;
                    break;
                case '(':
                    token.type = TokenType::LPAREN;
                    break;
                case ')':
                    token.type = TokenType::RPAREN;
                    break;
                default:
                    if (!alphabet.contains(c)) {
                        throw AutomatonError(ErrorType::UNSUPPORTED_TOKEN,
                                             std::string("Unsupported char '") + c + "' at position " +
                                             std::to_string(i) + "; only alphabet symbols and |*+?() are allowed");
                    }
                    token.value = c;
                    break;
            }
            // 两个操作数相邻且中间没有二元运算符时，插入显式连接符
            if (!tokens.empty() && ends_operand(tokens.back().type) && starts_operand(token.type)) {
                tokens.push_back({TokenType::CONCAT, '\0'});
            }
            tokens.push_back(token);
        }
        return tokens;
    }

    // 语法分析：调度场算法
    std::vector<Token> infix_to_postfix(const std::vector<Token> &tokens) {
        std::vector<Token> postfix;
        std::stack<Token> op_stack;
        for (const auto &token: tokens) {
            switch (token.type) {
                // 1. 普通字符：直接输出
                case TokenType::CHAR: {
                    postfix.push_back(token);
                    break;
                }
                // 2. 左括号：直接入栈
                case TokenType::LPAREN: {
                    op_stack.push(token);
                    break;
                }
                // 3. 右括号：弹出直到左括号，两个括号都丢弃
                case TokenType::RPAREN: {
                    while (!op_stack.empty() && op_stack.top().type != TokenType::LPAREN) {
                        postfix.push_back(op_stack.top());
                        op_stack.pop();
                    }
                    if (op_stack.empty()) {
                        throw AutomatonError(ErrorType::MISMATCHED_PARENTHESIS,
                                             "Mismatched parenthesis: ')' has no matching '('");
                    }
                    op_stack.pop();
                    break;
                }
                // 4. 一元运算符：只弹出栈顶同为一元且优先级不低的运算符，后缀运算立即生效
                case TokenType::STAR:
                case TokenType::PLUS:
                case TokenType::OPTIONAL: {
                    while (!op_stack.empty() && is_unary(op_stack.top().type) &&
                           precedence.at(op_stack.top().type) >= precedence.at(token.type)) {
                        postfix.push_back(op_stack.top());
                        op_stack.pop();
                    }
                    op_stack.push(token);
                    break;
                }
                // 5. 二元运算符：按优先级弹出
                case TokenType::CONCAT:
                case TokenType::OR: {
                    while (!op_stack.empty() && op_stack.top().type != TokenType::LPAREN &&
                           precedence.at(op_stack.top().type) >= precedence.at(token.type)) {
                        postfix.push_back(op_stack.top());
                        op_stack.pop();
                    }
                    op_stack.push(token);
                    break;
                }
            }
        }
        // 弹出剩余运算符
        while (!op_stack.empty()) {
            if (op_stack.top().type == TokenType::LPAREN) {
                throw AutomatonError(ErrorType::MISMATCHED_PARENTHESIS,
                                     "Mismatched parenthesis: '(' is never closed");
            }
            postfix.push_back(op_stack.top());
            op_stack.pop();
        }
        return postfix;
    }

    std::vector<Token> parse_regex(const std::string_view raw_regex, const Alphabet &alphabet) {
        return infix_to_postfix(tokenize(sanitize_regex(raw_regex, alphabet), alphabet));
    }

    std::string postfix_to_string(const std::vector<Token> &postfix) {
        std::string out;
        for (const auto &[type, value]: postfix) {
            switch (type) {
                case TokenType::CHAR: out += value;
                    break;
                case TokenType::STAR: out += '*';
                    break;
                case TokenType::PLUS: out += '+';
                    break;
                case TokenType::OPTIONAL: out += '?';
                    break;
                case TokenType::OR: out += '|';
                    break;
                case TokenType::CONCAT: out += '.';
                    break;
                case TokenType::LPAREN: out += '(';
                    break;
                case TokenType::RPAREN: out += ')';
                    break;
            }
        }
        return out;
    }
}
