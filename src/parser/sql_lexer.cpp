#include "parser/sql_lexer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace {

constexpr std::string_view kOperatorChars = "+-*/<>=~!@#%^&|`?";
// 이 문자들 중 하나라도 포함된 다중 문자 연산자만 +/- 로 끝날 수 있다
constexpr std::string_view kOperatorTailChars = "~!@#%^&|`?";

bool is_ident_start(unsigned char c) {
    return std::isalpha(c) != 0 || c == '_' || c >= 0x80;
}

bool is_ident_char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c == '$' || c >= 0x80;
}

bool is_operator_char(char c) {
    return kOperatorChars.find(c) != std::string_view::npos;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

GatewayError lex_error(std::string_view what, std::size_t offset) {
    return make_error(ErrorCode::kSyntaxError,
                      fmt::format("{} at position {}", what, offset));
}

class Lexer {
public:
    explicit Lexer(std::string_view sql) : sql_{sql} {}

    std::expected<std::vector<Token>, GatewayError> run() {
        std::vector<Token> tokens;
        while (true) {
            if (auto skipped = skip_space_and_comments(); !skipped) {
                return std::unexpected(skipped.error());
            }
            if (pos_ >= sql_.size()) {
                break;
            }
            auto token = next_token();
            if (!token) {
                return std::unexpected(token.error());
            }
            tokens.push_back(std::move(*token));
        }
        tokens.push_back(Token{TokenKind::kEnd, {}, sql_.size(), 0});
        return tokens;
    }

private:
    char at(std::size_t i) const { return i < sql_.size() ? sql_[i] : '\0'; }

    std::expected<void, GatewayError> skip_space_and_comments() {
        while (pos_ < sql_.size()) {
            const char c = sql_[pos_];
            if (std::isspace(static_cast<unsigned char>(c)) != 0) {
                ++pos_;
                continue;
            }
            if (c == '-' && at(pos_ + 1) == '-') {
                while (pos_ < sql_.size() && sql_[pos_] != '\n') {
                    ++pos_;
                }
                continue;
            }
            if (c == '/' && at(pos_ + 1) == '*') {
                const std::size_t start = pos_;
                int depth = 0;
                while (pos_ < sql_.size()) {
                    if (sql_[pos_] == '/' && at(pos_ + 1) == '*') {
                        ++depth;
                        pos_ += 2;
                    } else if (sql_[pos_] == '*' && at(pos_ + 1) == '/') {
                        --depth;
                        pos_ += 2;
                        if (depth == 0) {
                            break;
                        }
                    } else {
                        ++pos_;
                    }
                }
                if (depth != 0) {
                    return std::unexpected(lex_error("unterminated block comment", start));
                }
                continue;
            }
            break;
        }
        return {};
    }

    Token make(TokenKind kind, std::string value, std::size_t start) const {
        return Token{kind, std::move(value), start, pos_ - start};
    }

    std::expected<Token, GatewayError> next_token() {
        const std::size_t start = pos_;
        const char c = sql_[pos_];

        switch (c) {
            case '(': ++pos_; return make(TokenKind::kLeftParen, "(", start);
            case ')': ++pos_; return make(TokenKind::kRightParen, ")", start);
            case '[': ++pos_; return make(TokenKind::kLeftBracket, "[", start);
            case ']': ++pos_; return make(TokenKind::kRightBracket, "]", start);
            case ',': ++pos_; return make(TokenKind::kComma, ",", start);
            case ';': ++pos_; return make(TokenKind::kSemicolon, ";", start);
            case ':':
                if (at(pos_ + 1) == ':') {
                    pos_ += 2;
                    return make(TokenKind::kDoubleColon, "::", start);
                }
                ++pos_;
                return make(TokenKind::kColon, ":", start);
            default:
                break;
        }

        if (c == '.' && std::isdigit(static_cast<unsigned char>(at(pos_ + 1))) == 0) {
            ++pos_;
            return make(TokenKind::kDot, ".", start);
        }
        if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.') {
            return lex_number(start);
        }
        if (c == '\'') {
            return lex_string(start, false);
        }
        if (c == '"') {
            return lex_quoted_identifier(start);
        }
        if (c == '$') {
            return lex_dollar(start);
        }
        if (is_ident_start(static_cast<unsigned char>(c))) {
            // E'..' / B'..' / X'..' / N'..' 접두 문자열
            if (at(pos_ + 1) == '\'') {
                const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                if (lower == 'e' || lower == 'b' || lower == 'x' || lower == 'n') {
                    ++pos_;
                    return lex_string(start, lower == 'e');
                }
            }
            while (pos_ < sql_.size() && is_ident_char(static_cast<unsigned char>(sql_[pos_]))) {
                ++pos_;
            }
            return make(TokenKind::kIdentifier, to_lower(sql_.substr(start, pos_ - start)), start);
        }
        if (is_operator_char(c)) {
            return lex_operator(start);
        }
        return std::unexpected(lex_error(fmt::format("unexpected character '{}'", c), start));
    }

    std::expected<Token, GatewayError> lex_number(std::size_t start) {
        bool seen_dot = false;
        while (pos_ < sql_.size()) {
            const char c = sql_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '_') {
                ++pos_;
            } else if (c == '.' && !seen_dot && at(pos_ + 1) != '.') {
                seen_dot = true;
                ++pos_;
            } else {
                break;
            }
        }
        if ((at(pos_) == 'e' || at(pos_) == 'E') &&
            (std::isdigit(static_cast<unsigned char>(at(pos_ + 1))) != 0 ||
             ((at(pos_ + 1) == '+' || at(pos_ + 1) == '-') &&
              std::isdigit(static_cast<unsigned char>(at(pos_ + 2))) != 0))) {
            pos_ += 2;
            while (std::isdigit(static_cast<unsigned char>(at(pos_))) != 0) {
                ++pos_;
            }
        }
        return make(TokenKind::kNumber, std::string(sql_.substr(start, pos_ - start)), start);
    }

    // pos_ 는 여는 따옴표를 가리킨다
    std::expected<Token, GatewayError> lex_string(std::size_t start, bool backslash_escapes) {
        ++pos_;
        std::string value;
        while (pos_ < sql_.size()) {
            const char c = sql_[pos_];
            if (backslash_escapes && c == '\\' && pos_ + 1 < sql_.size()) {
                value.push_back(sql_[pos_ + 1]);
                pos_ += 2;
                continue;
            }
            if (c == '\'') {
                if (at(pos_ + 1) == '\'') {
                    value.push_back('\'');
                    pos_ += 2;
                    continue;
                }
                ++pos_;
                return make(TokenKind::kString, std::move(value), start);
            }
            value.push_back(c);
            ++pos_;
        }
        return std::unexpected(lex_error("unterminated string literal", start));
    }

    std::expected<Token, GatewayError> lex_quoted_identifier(std::size_t start) {
        ++pos_;
        std::string value;
        while (pos_ < sql_.size()) {
            const char c = sql_[pos_];
            if (c == '"') {
                if (at(pos_ + 1) == '"') {
                    value.push_back('"');
                    pos_ += 2;
                    continue;
                }
                ++pos_;
                if (value.empty()) {
                    return std::unexpected(lex_error("zero-length delimited identifier", start));
                }
                return make(TokenKind::kQuotedIdentifier, std::move(value), start);
            }
            value.push_back(c);
            ++pos_;
        }
        return std::unexpected(lex_error("unterminated quoted identifier", start));
    }

    // $1 파라미터 또는 $tag$ ... $tag$ dollar-quoted 문자열
    std::expected<Token, GatewayError> lex_dollar(std::size_t start) {
        if (std::isdigit(static_cast<unsigned char>(at(pos_ + 1))) != 0) {
            ++pos_;
            while (std::isdigit(static_cast<unsigned char>(at(pos_))) != 0) {
                ++pos_;
            }
            return make(TokenKind::kParameter, std::string(sql_.substr(start, pos_ - start)), start);
        }

        std::size_t tag_end = pos_ + 1;
        if (is_ident_start(static_cast<unsigned char>(at(tag_end))) && at(tag_end) != '$') {
            while (tag_end < sql_.size() && sql_[tag_end] != '$' &&
                   is_ident_char(static_cast<unsigned char>(sql_[tag_end]))) {
                ++tag_end;
            }
        }
        if (at(tag_end) != '$') {
            return std::unexpected(lex_error("unexpected character '$'", start));
        }
        const std::string_view tag = sql_.substr(pos_, tag_end - pos_ + 1);
        const std::size_t body_start = tag_end + 1;
        const std::size_t close = sql_.find(tag, body_start);
        if (close == std::string_view::npos) {
            return std::unexpected(lex_error("unterminated dollar-quoted string", start));
        }
        pos_ = close + tag.size();
        return make(TokenKind::kString, std::string(sql_.substr(body_start, close - body_start)), start);
    }

    std::expected<Token, GatewayError> lex_operator(std::size_t start) {
        std::size_t end = pos_;
        while (end < sql_.size() && is_operator_char(sql_[end])) {
            // 연산자 중간의 -- 또는 /* 는 주석 시작
            if (end > pos_ &&
                ((sql_[end] == '-' && at(end + 1) == '-') ||
                 (sql_[end] == '/' && at(end + 1) == '*'))) {
                break;
            }
            ++end;
        }
        std::string_view op = sql_.substr(pos_, end - pos_);
        if (op.size() > 1 && op.find_first_of(kOperatorTailChars) == std::string_view::npos) {
            while (op.size() > 1 && (op.back() == '+' || op.back() == '-')) {
                op.remove_suffix(1);
            }
        }
        pos_ += op.size();
        return make(TokenKind::kOperator, std::string(op), start);
    }

    std::string_view sql_;
    std::size_t      pos_{0};
};

}  // namespace

std::expected<std::vector<Token>, GatewayError> tokenize(std::string_view sql) {
    return Lexer{sql}.run();
}
