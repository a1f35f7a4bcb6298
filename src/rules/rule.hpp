#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 공격 시그니처 규칙 정의. 문자열 변환 구현은 pattern_library.cpp.
// 규칙은 기동 시 한 번 로드되어 PatternLibrary 안에서 불변으로 공유된다.
//
// [설계 원칙]
// - 매처는 닫힌 variant 이다: 정규식(PatternMatcher) 또는
//   StructuralFacts 에 대한 술어(StructuralMatcher). 새 규칙은 데이터로
//   추가하며 RiskClassifier 코드는 바뀌지 않는다.
// - tautology, 중첩 서브쿼리처럼 정규식으로는 오탐/미탐이 큰 신호는
//   StructuralMatcher 로만 표현한다.
// - 정규식은 shared_ptr 로 보관하여 규칙 복사(라이브러리 확장) 시
//   재컴파일하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// StructuralCheck
//   StructuralMatcher 가 평가하는 사실의 종류. threshold 의미는 항목별로 다르다.
// ---------------------------------------------------------------------------
enum class StructuralCheck : std::uint8_t {
    kTautology         = 0,   // facts.tautology
    kConstantFalse     = 1,   // facts.constant_false
    kMultiStatement    = 2,   // statement_count > 1
    kUnionCount        = 3,   // union_count >= threshold
    kCommentPresent    = 4,   // has_comment
    kCommentSplitsWord = 5,   // UN/**/ION
    kVersionedComment  = 6,   // /*! ... */
    kStringConcat      = 7,   // suspicious_concat_count >= threshold
    kNestedSubqueries  = 8,   // subquery_count > threshold
    kJoinCount         = 9,   // join_count > threshold
    kFunctionCall      = 10,  // functions 중 하나라도 호출
    kDegraded          = 11,  // 분석 불완전
    kHexLiteral        = 12,  // 0x.. / X'..'
    kQuoteBreakLogic   = 13,  // 탈출한 따옴표 뒤 OR/AND
    kQuoteBreakUnion   = 14,  // 탈출한 따옴표 뒤 UNION
};

[[nodiscard]] std::string_view to_string(StructuralCheck check) noexcept;
[[nodiscard]] std::optional<StructuralCheck> structural_check_from_string(std::string_view name);

// ---------------------------------------------------------------------------
// PatternMatcher
//   원문 SQL 에 대한 대소문자 무관 ECMAScript 정규식.
//   source 는 감사/디버그 용도이며 사용자 응답에는 노출하지 않는다.
// ---------------------------------------------------------------------------
struct PatternMatcher {
    std::string                       source{};
    std::shared_ptr<const std::regex> compiled{};
};

struct StructuralMatcher {
    StructuralCheck          check{StructuralCheck::kTautology};
    std::uint32_t            threshold{1};
    std::vector<std::string> functions{};  // kFunctionCall 전용, 대문자
};

using RuleMatcher = std::variant<PatternMatcher, StructuralMatcher>;

// ---------------------------------------------------------------------------
// Rule
//   severity 는 1..100. RiskClassifier 가 발화한 규칙의 severity 를 합산한다.
//   id 는 라이브러리 안에서 유일해야 하며, 감사 로그에만 기록된다.
// ---------------------------------------------------------------------------
struct Rule {
    std::string    id{};
    AttackCategory category{AttackCategory::kOther};
    std::uint32_t  severity{1};
    std::string    description{};
    RuleMatcher    matcher{};
};
