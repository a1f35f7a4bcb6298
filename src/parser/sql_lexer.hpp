#pragma once

// ---------------------------------------------------------------------------
// sql_lexer.hpp
//
// SQL 문자열을 토큰열로 분해하는 단일 패스 상태 머신.
// SqlAnalyzer 가 문자열 리터럴/주석 내부를 구문으로 오인하지 않도록
// 하는 것이 목적이며, 문법 검증은 하지 않는다.
//
// [설계 원칙]
// - 실패하지 않는다: 닫히지 않은 문자열/주석도 입력 끝까지 하나의 토큰으로
//   만들고 플래그만 세운다 (비정상 입력 자체가 위험 신호).
// - 모든 토큰은 원문 기준 바이트 offset/length 를 가진다. LIMIT 값 교체
//   같은 재작성은 이 구간을 그대로 사용한다.
//
// [방언 처리 / 알려진 한계]
// - "..." 는 문자열 리터럴로 취급한다 (MySQL 기본 모드). ANSI 모드의
//   인용 식별자와 구분하지 않는다.
// - 문자열 내 백슬래시 이스케이프와 '' 이스케이프를 모두 허용한다.
// - -- 뒤 공백 요구(MySQL)는 적용하지 않는다. 보수적으로 모두 주석 처리.
// - 달러 인용 문자열($tag$...$tag$, PostgreSQL)은 지원하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class TokenType : std::uint8_t {
    kWord             = 0,   // 키워드/식별자 (value 는 대문자 정규화)
    kQuotedIdentifier = 1,   // `name`
    kNumber           = 2,   // 10, 3.14, 1e5
    kHexNumber        = 3,   // 0x414243
    kString           = 4,   // 'abc' / "abc" (value 는 이스케이프 해제된 내용)
    kOperator         = 5,   // = <> || 등
    kLeftParen        = 6,
    kRightParen       = 7,
    kComma            = 8,
    kSemicolon        = 9,
    kLineComment      = 10,  // -- ...
    kBlockComment     = 11,  // /* ... */ (/*! ... */ 포함)
    kHashComment      = 12,  // # ...
    kVariable         = 13,  // @v, @@version, $ne, $1
};

struct Token {
    TokenType   type{TokenType::kWord};
    std::size_t offset{0};   // 원문 기준 시작 바이트
    std::size_t length{0};   // 원문 기준 길이 (따옴표/주석 기호 포함)
    std::string value{};     // 정규화 값 (kWord: 대문자, kString: 내용)

    [[nodiscard]] bool is_comment() const noexcept {
        return type == TokenType::kLineComment
            || type == TokenType::kBlockComment
            || type == TokenType::kHashComment;
    }

    [[nodiscard]] bool is_literal() const noexcept {
        return type == TokenType::kNumber
            || type == TokenType::kHexNumber
            || type == TokenType::kString;
    }

    [[nodiscard]] bool is_word(std::string_view upper) const noexcept {
        return type == TokenType::kWord && value == upper;
    }

    [[nodiscard]] bool is_operator(std::string_view op) const noexcept {
        return type == TokenType::kOperator && value == op;
    }

    [[nodiscard]] std::size_t end() const noexcept { return offset + length; }
};

// ---------------------------------------------------------------------------
// LexResult
//   unterminated_* 플래그는 SqlAnalyzer 에서 degraded 사유로 전환된다.
// ---------------------------------------------------------------------------
struct LexResult {
    std::vector<Token> tokens{};
    bool               unterminated_string{false};
    bool               unterminated_comment{false};
    bool               embedded_nul{false};  // 원문에 NUL 바이트 포함
};

class SqlLexer {
public:
    // tokenize
    //   sql 전체를 토큰으로 분해한다. 공백은 토큰을 만들지 않는다.
    [[nodiscard]] static LexResult tokenize(std::string_view sql);
};
