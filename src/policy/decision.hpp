#pragma once

// ---------------------------------------------------------------------------
// decision.hpp
//
// 검증 한 건의 최종 결과.
// REJECT 도 예외가 아닌 정상 반환값이다 (ValidationRejected).
//
// [노출 원칙]
// - message / warnings 는 카테고리 수준의 설명만 담는다. 규칙 id, 정규식,
//   내부 점수 산정 근거는 감사 로그(AuditRecord)에만 남긴다.
//   규칙 집합 지문 채취(fingerprinting)를 어렵게 하기 위함.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"

struct Decision {
    Verdict                     verdict{Verdict::kReject};  // 기본값 REJECT (fail-close)
    std::vector<ReasonCode>     reasons{};
    std::optional<std::string>  suggested_query{};
    std::vector<AttackCategory> categories{};
    std::uint32_t               risk_score{0};
    RiskTier                    tier{RiskTier::kNone};
    StatementType               statement_type{StatementType::kUnknown};
    std::vector<std::string>    warnings{};
    std::string                 message{};

    [[nodiscard]] bool has_reason(ReasonCode reason) const;

    bool operator==(const Decision&) const = default;
};

// to_json
//   한 줄 JSON 객체. querygate 실행 파일의 stdout 출력 형식.
//   {"verdict":"REWRITE_SUGGESTED","reasons":["limit_added"],
//    "suggested_query":"...","categories":[],"risk_score":0,"risk_tier":"none",
//    "statement_type":"SELECT","warnings":[],"message":"..."}
[[nodiscard]] std::string to_json(const Decision& decision);
