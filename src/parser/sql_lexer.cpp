// ---------------------------------------------------------------------------
// sql_lexer.cpp
//
// 바이트 단위 상태 머신 토크나이저 구현.
//
// [상태 전이]
//   일반 → 문자열('...' / "...")   : 닫는 따옴표 또는 입력 끝까지
//   일반 → 블록 주석(/* ... */)    : */ 또는 입력 끝까지
//   일반 → 라인 주석(-- / #)       : 개행 또는 입력 끝까지
//   그 외는 단어/숫자/연산자/구두점 토큰으로 즉시 방출
//
// [우회 주의]
// - 블록 주석은 토큰으로 남긴다 (제거하지 않음). 따라서 UN/**/ION 은
//   UN, 주석, ION 세 토큰이 되며, 인접성 판정은 SqlAnalyzer 가 수행한다.
// - 0x80 이상 바이트는 식별자 문자로 취급한다 (UTF-8 식별자 허용).
// ---------------------------------------------------------------------------

#include "parser/sql_lexer.hpp"

#include "common/types.hpp"

#include <array>
#include <cctype>

namespace {

bool is_word_start(unsigned char c) {
    return std::isalpha(c) != 0 || c == '_' || c >= 0x80;
}

bool is_word_char(unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c == '$' || c >= 0x80;
}

bool is_digit(unsigned char c) {
    return std::isdigit(c) != 0;
}

// 2~3 바이트 연산자. 긴 것부터 검사한다.
constexpr std::array<std::string_view, 11> kMultiCharOperators = {
    "<=>", "||", "&&", "<=", ">=", "<>", "!=", "==", ":=", "::", "->",
};

}  // namespace

LexResult SqlLexer::tokenize(std::string_view sql) {
    LexResult result;
    result.tokens.reserve(sql.size() / 3 + 1);

    const std::size_t len = sql.size();
    std::size_t       i   = 0;

    auto emit = [&result](TokenType type, std::size_t begin, std::size_t end, std::string value) {
        result.tokens.push_back(Token{type, begin, end - begin, std::move(value)});
    };

    while (i < len) {
        const auto c    = static_cast<unsigned char>(sql[i]);
        const auto next = (i + 1 < len) ? static_cast<unsigned char>(sql[i + 1]) : '\0';

        if (c == '\0') {
            result.embedded_nul = true;
            ++i;
            continue;
        }

        if (std::isspace(c) != 0) {
            ++i;
            continue;
        }

        // 블록 주석 /* ... */
        if (c == '/' && next == '*') {
            const std::size_t begin = i;
            i += 2;
            bool closed = false;
            while (i + 1 < len) {
                if (sql[i] == '*' && sql[i + 1] == '/') {
                    i += 2;
                    closed = true;
                    break;
                }
                ++i;
            }
            if (!closed) {
                i = len;
                result.unterminated_comment = true;
            }
            emit(TokenType::kBlockComment, begin, i, std::string(sql.substr(begin, i - begin)));
            continue;
        }

        // 라인 주석 -- / 해시 주석 #
        if ((c == '-' && next == '-') || c == '#') {
            const std::size_t begin = i;
            while (i < len && sql[i] != '\n') {
                ++i;
            }
            emit(c == '#' ? TokenType::kHashComment : TokenType::kLineComment,
                 begin, i, std::string(sql.substr(begin, i - begin)));
            continue;
        }

        // 문자열 리터럴 '...' / "..."
        if (c == '\'' || c == '"') {
            const char        quote = static_cast<char>(c);
            const std::size_t begin = i;
            std::string       content;
            ++i;
            bool closed = false;
            while (i < len) {
                const char ch = sql[i];
                if (ch == '\\' && i + 1 < len) {
                    content.push_back(sql[i + 1]);
                    i += 2;
                    continue;
                }
                if (ch == quote) {
                    if (i + 1 < len && sql[i + 1] == quote) {
                        content.push_back(quote);  // '' 이스케이프
                        i += 2;
                        continue;
                    }
                    ++i;
                    closed = true;
                    break;
                }
                content.push_back(ch);
                ++i;
            }
            if (!closed) {
                result.unterminated_string = true;
            }
            emit(TokenType::kString, begin, i, std::move(content));
            continue;
        }

        // 백틱 인용 식별자 `name`
        if (c == '`') {
            const std::size_t begin = i;
            ++i;
            while (i < len && sql[i] != '`') {
                ++i;
            }
            std::string name(sql.substr(begin + 1, i - begin - 1));
            if (i < len) {
                ++i;
            } else {
                result.unterminated_string = true;
            }
            emit(TokenType::kQuotedIdentifier, begin, i, std::move(name));
            continue;
        }

        // 16진 리터럴 0x...
        if (c == '0' && (next == 'x' || next == 'X') && i + 2 < len &&
            std::isxdigit(static_cast<unsigned char>(sql[i + 2])) != 0) {
            const std::size_t begin = i;
            i += 2;
            while (i < len && std::isxdigit(static_cast<unsigned char>(sql[i])) != 0) {
                ++i;
            }
            emit(TokenType::kHexNumber, begin, i, std::string(sql.substr(begin, i - begin)));
            continue;
        }

        // 숫자: 123, 1.5, .5, 1e10
        if (is_digit(c) || (c == '.' && is_digit(next))) {
            const std::size_t begin = i;
            while (i < len && is_digit(static_cast<unsigned char>(sql[i]))) {
                ++i;
            }
            if (i < len && sql[i] == '.') {
                ++i;
                while (i < len && is_digit(static_cast<unsigned char>(sql[i]))) {
                    ++i;
                }
            }
            if (i < len && (sql[i] == 'e' || sql[i] == 'E')) {
                std::size_t j = i + 1;
                if (j < len && (sql[j] == '+' || sql[j] == '-')) {
                    ++j;
                }
                if (j < len && is_digit(static_cast<unsigned char>(sql[j]))) {
                    i = j;
                    while (i < len && is_digit(static_cast<unsigned char>(sql[i]))) {
                        ++i;
                    }
                }
            }
            // 123abc 처럼 숫자로 시작하는 식별자 (MySQL 허용)
            if (i < len && is_word_start(static_cast<unsigned char>(sql[i]))) {
                while (i < len && is_word_char(static_cast<unsigned char>(sql[i]))) {
                    ++i;
                }
                emit(TokenType::kWord, begin, i, to_upper_ascii(sql.substr(begin, i - begin)));
                continue;
            }
            emit(TokenType::kNumber, begin, i, std::string(sql.substr(begin, i - begin)));
            continue;
        }

        // 단어 (키워드/식별자)
        if (is_word_start(c)) {
            const std::size_t begin = i;
            while (i < len && is_word_char(static_cast<unsigned char>(sql[i]))) {
                ++i;
            }
            emit(TokenType::kWord, begin, i, to_upper_ascii(sql.substr(begin, i - begin)));
            continue;
        }

        // 변수: @v, @@global.v, $ne, $1
        if (c == '@' || c == '$') {
            const std::size_t begin = i;
            ++i;
            if (c == '@' && i < len && sql[i] == '@') {
                ++i;
            }
            while (i < len && (is_word_char(static_cast<unsigned char>(sql[i])) || sql[i] == '.')) {
                ++i;
            }
            emit(TokenType::kVariable, begin, i, std::string(sql.substr(begin, i - begin)));
            continue;
        }

        switch (c) {
            case '(':
                emit(TokenType::kLeftParen, i, i + 1, "(");
                ++i;
                continue;
            case ')':
                emit(TokenType::kRightParen, i, i + 1, ")");
                ++i;
                continue;
            case ',':
                emit(TokenType::kComma, i, i + 1, ",");
                ++i;
                continue;
            case ';':
                emit(TokenType::kSemicolon, i, i + 1, ";");
                ++i;
                continue;
            default:
                break;
        }

        // 연산자
        bool matched = false;
        for (const auto op : kMultiCharOperators) {
            if (sql.substr(i, op.size()) == op) {
                emit(TokenType::kOperator, i, i + op.size(), std::string(op));
                i += op.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            emit(TokenType::kOperator, i, i + 1, std::string(1, static_cast<char>(c)));
            ++i;
        }
    }

    return result;
}
