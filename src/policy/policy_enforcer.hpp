#pragma once

// ---------------------------------------------------------------------------
// policy_enforcer.hpp
//
// 분석 사실 + 위험 평가 + 정책 설정으로부터 ALLOW / REWRITE_SUGGESTED /
// REJECT 판정을 내린다.
//
// [fail-close 원칙]
// 1. policy == nullptr → REJECT
// 2. 허용 목록에 없는 구문 유형(UNKNOWN 포함) → REJECT
// 3. ALLOW 는 "허용 유형 + 길이 이내 + reject_severity 이상 규칙 미발화"
//    일 때만 반환된다.
//
// [판정 순서]
//   1. 구문 유형          → statement_type_not_allowed
//   2. 차단 키워드/함수   → blocked_keyword
//   3. 길이 초과          → query_too_long
//   4. 위험 판정          → high_risk_pattern (critical, reject_severity,
//                            reject 카테고리, high + reject 정책)
//                            elevated_risk_warning (high + warn 정책)
//   5. LIMIT 재작성       → limit_added / limit_clamped
//   6. ALLOW
// 위험 판정을 재작성보다 먼저 수행하여 LIMIT 보정이 위험 쿼리를
// 가리지 못하게 한다. 경고부 완화 판정에도 LIMIT 재작성은 포함된다.
//
// [스레드 안전성]
// 상태가 없으므로 concurrent 호출 안전.
// ---------------------------------------------------------------------------

#include <memory>
#include <string>
#include <string_view>

#include "classifier/risk_classifier.hpp"
#include "parser/sql_analyzer.hpp"
#include "policy/decision.hpp"
#include "policy/policy_config.hpp"

class PolicyEnforcer {
public:
    PolicyEnforcer()  = default;
    ~PolicyEnforcer() = default;

    PolicyEnforcer(const PolicyEnforcer&)            = default;
    PolicyEnforcer& operator=(const PolicyEnforcer&) = default;
    PolicyEnforcer(PolicyEnforcer&&)                 = default;
    PolicyEnforcer& operator=(PolicyEnforcer&&)      = default;

    // enforce
    //   query 는 facts/assessment 를 만든 원문과 같아야 한다
    //   (LIMIT 재작성이 facts 의 바이트 구간을 그대로 사용한다).
    //   예외를 던지지 않는다.
    [[nodiscard]] Decision enforce(std::string_view                     query,
                                   const StructuralFacts&               facts,
                                   const RiskAssessment&                assessment,
                                   const std::shared_ptr<const PolicyConfig>& policy) const;

    // 재작성 헬퍼 (테스트에서 직접 사용)
    [[nodiscard]] static std::string append_limit(std::string_view query,
                                                  const StructuralFacts& facts,
                                                  std::uint64_t limit);
    [[nodiscard]] static std::string clamp_limit(std::string_view query,
                                                 const LimitClause& clause,
                                                 std::uint64_t max_value);
};
