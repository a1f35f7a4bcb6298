#pragma once

// ---------------------------------------------------------------------------
// sql_analyzer.hpp
//
// 토큰열 위에서 동작하는 경량 구조 분석기.
// SqlLexer 결과를 한 번 훑어 규칙 매칭에 필요한 사실(StructuralFacts)만
// 추출한다. 완전한 SQL 문법 파서가 아니다.
//
// [설계 원칙]
// - analyze() 는 실패하지 않는다. 비정상 입력(닫히지 않은 문자열, 괄호
//   불균형 등)은 오류가 아니라 degraded 플래그와 사유로 보고되며,
//   RiskClassifier 가 이를 위험 가산점으로 사용한다.
// - too_long 이어도 나머지 분석은 수행한다 (분석은 fail-open,
//   정책은 fail-close).
// - 상태를 갖지 않으므로 여러 스레드에서 동시에 호출해도 안전하다.
//
// [알려진 한계]
// 1. 방언 차이: MySQL 기준으로 토큰화한다. PostgreSQL 달러 인용 문자열,
//    T-SQL 대괄호 식별자는 인식하지 않는다.
// 2. 상수 조건 평가: <리터럴> <비교연산자> <리터럴> 형태만 평가한다.
//    1+1=2 처럼 산술식이 섞이면 평가하지 않는다 (false negative).
// 3. 함수 호출 판정: "이름 + (" 형태로 판정하므로 INSERT INTO t(a) 같은
//    컬럼 목록은 직전 키워드로 걸러낸다. 걸러지지 않는 방언 구문은
//    함수 호출로 오인될 수 있다 (false positive).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// LimitSyntax / LimitClause
//   첫 번째 구문의 최상위(괄호 깊이 0)에서 발견된 행 수 제한 절.
//   value 가 nullopt 이면 비리터럴(LIMIT ?, LIMIT @n) 이다.
//   value_offset/value_length 는 원문 기준 숫자 리터럴 구간이며,
//   PolicyEnforcer 가 값 교체(clamp)에 사용한다.
// ---------------------------------------------------------------------------
enum class LimitSyntax : std::uint8_t {
    kLimit       = 0,  // LIMIT n
    kLimitComma  = 1,  // LIMIT offset, n
    kLimitOffset = 2,  // LIMIT n OFFSET m
    kTop         = 3,  // SELECT TOP n
    kFetchFirst  = 4,  // FETCH FIRST|NEXT n ROWS ONLY
};

struct LimitClause {
    std::optional<std::uint64_t> value{};   // 오버플로 시 UINT64_MAX
    std::size_t                  value_offset{0};
    std::size_t                  value_length{0};
    LimitSyntax                  syntax{LimitSyntax::kLimit};

    bool operator==(const LimitClause&) const = default;
};

// ---------------------------------------------------------------------------
// DegradedReason
//   분석이 완전하지 않았던 이유 (AnalysisDegraded).
// ---------------------------------------------------------------------------
enum class DegradedReason : std::uint8_t {
    kUnterminatedString    = 0,
    kUnterminatedComment   = 1,
    kUnbalancedParentheses = 2,
    kEmbeddedNul           = 3,
};

[[nodiscard]] std::string_view to_string(DegradedReason reason) noexcept;

// ---------------------------------------------------------------------------
// StructuralFacts
//   analyze() 의 결과. 검증 호출마다 생성되며 분류/정책 단계에서 읽기 전용.
// ---------------------------------------------------------------------------
struct StructuralFacts {
    // 분류
    StatementType              statement_type{StatementType::kUnknown};
    std::size_t                length{0};          // 바이트 길이
    bool                       too_long{false};
    std::optional<LimitClause> limit{};
    std::size_t                statement_end{0};   // 첫 구문의 마지막 코드 토큰 끝 (LIMIT 추가 위치)

    // 구조
    std::size_t union_count{0};
    std::size_t statement_count{0};     // 비어 있지 않은 구문 수
    std::size_t subquery_count{0};      // ( 뒤에 SELECT/WITH 가 오는 횟수
    std::size_t max_paren_depth{0};
    std::size_t join_count{0};

    // 주석 / 인코딩
    bool has_comment{false};
    bool has_line_comment{false};       // --
    bool has_block_comment{false};      // /* */
    bool has_hash_comment{false};       // #
    bool comment_splits_word{false};    // UN/**/ION
    bool versioned_comment{false};      // /*! ... */
    bool has_hex_literal{false};        // 0x..., X'...'

    // 따옴표 탈출: 문자열 리터럴 바로 뒤의 OR/AND 또는 UNION 이면서,
    // 원래 닫는 따옴표가 끝 주석에 묻혔거나 닫히지 않은 문자열이 남은 경우.
    // 정상적인 'x' UNION ... / LIKE '%a%' OR ... 에서는 false.
    bool quote_break_before_logic{false};  // ' OR / ' AND
    bool quote_break_before_union{false};  // ' UNION

    // 이름
    std::vector<std::string> function_calls{};  // 대문자, 중복 없음, 등장 순서
    std::vector<std::string> keywords{};        // 대문자, 중복 없음, 정렬됨

    // 문자열 결합
    std::size_t adjacent_literals{0};        // 'a' 'b'
    std::size_t concat_operator_count{0};    // || 및 CONCAT(...)
    std::size_t suspicious_concat_count{0};  // 문자열 리터럴을 피연산자로 갖는 결합

    // 상수 조건
    bool        tautology{false};
    bool        constant_false{false};
    std::size_t constant_condition_count{0};

    // 분석 품질
    bool                        degraded{false};
    std::vector<DegradedReason> degraded_reasons{};

    [[nodiscard]] bool multi_statement() const noexcept { return statement_count > 1; }

    // upper: 대문자 키워드
    [[nodiscard]] bool has_keyword(std::string_view upper) const;
    [[nodiscard]] bool calls_function(std::string_view upper) const;

    bool operator==(const StructuralFacts&) const = default;
};

struct AnalyzerOptions {
    std::size_t max_query_length{5000};
};

// ---------------------------------------------------------------------------
// SqlAnalyzer
//   옵션만 보관하는 무상태 분석기. 복사/이동 자유.
// ---------------------------------------------------------------------------
class SqlAnalyzer {
public:
    SqlAnalyzer() = default;
    explicit SqlAnalyzer(AnalyzerOptions options);
    ~SqlAnalyzer() = default;

    SqlAnalyzer(const SqlAnalyzer&)            = default;
    SqlAnalyzer& operator=(const SqlAnalyzer&) = default;
    SqlAnalyzer(SqlAnalyzer&&)                 = default;
    SqlAnalyzer& operator=(SqlAnalyzer&&)      = default;

    // analyze
    //   sql 전체를 분석한다. 어떤 입력에도 예외를 던지지 않는다
    //   (메모리 부족 제외).
    [[nodiscard]] StructuralFacts analyze(std::string_view sql) const;

    [[nodiscard]] const AnalyzerOptions& options() const noexcept { return options_; }

private:
    AnalyzerOptions options_{};
};
