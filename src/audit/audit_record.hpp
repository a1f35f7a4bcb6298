#pragma once

// ---------------------------------------------------------------------------
// audit_record.hpp
//
// 보안 이벤트 로그용 감사 레코드와 보안 경보 타입.
//
// [민감정보 취급]
// - 원문 쿼리는 저장하지 않는다. query_hash (FNV-1a 64bit) 로 동일 쿼리를
//   식별하고, query_preview 는 제어 문자를 공백으로 바꾼 앞부분만 담는다.
// - rule_ids 는 감사 로그 전용이다. Decision 에는 들어가지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "classifier/risk_classifier.hpp"
#include "common/types.hpp"
#include "policy/decision.hpp"

struct AuditRecord {
    std::chrono::system_clock::time_point timestamp{};
    std::string                 query_hash{};      // 16 hex
    std::string                 query_preview{};
    std::size_t                 query_length{0};
    Verdict                     verdict{Verdict::kReject};
    std::vector<ReasonCode>     reasons{};
    std::vector<AttackCategory> categories{};
    std::vector<std::string>    rule_ids{};
    std::uint32_t               risk_score{0};
    RiskTier                    tier{RiskTier::kNone};
    StatementType               statement_type{StatementType::kUnknown};
    std::chrono::microseconds   evaluation_time{0};
    bool                        bypassed{false};
    std::string                 rules_version{};
};

// ---------------------------------------------------------------------------
// SecurityAlert
//   AlertMonitor 가 window 안의 이벤트 수가 임계값을 넘었을 때 생성한다.
// ---------------------------------------------------------------------------
enum class AlertType : std::uint8_t {
    kHighBlockRate = 0,  // REJECT 다발
    kHighRiskRate  = 1,  // high/critical 평가 다발
};

[[nodiscard]] std::string_view to_string(AlertType type) noexcept;

struct SecurityAlert {
    AlertType                             type{AlertType::kHighBlockRate};
    std::chrono::system_clock::time_point timestamp{};
    std::uint32_t                         count{0};      // window 안의 이벤트 수
    std::uint32_t                         threshold{0};
    std::chrono::seconds                  window{0};
    std::string                           message{};
};

// query_hash
//   FNV-1a 64bit, 소문자 16자리 hex.
[[nodiscard]] std::string query_hash(std::string_view query);

// sanitize_preview
//   제어 문자(0x00-0x1F, 0x7F)를 공백으로 바꾸고 max_length 바이트로 자른다.
//   잘린 경우 "..." 를 붙인다.
[[nodiscard]] std::string sanitize_preview(std::string_view query, std::size_t max_length = 100);

[[nodiscard]] AuditRecord make_audit_record(std::string_view          query,
                                            const Decision&           decision,
                                            const RiskAssessment&     assessment,
                                            std::chrono::microseconds evaluation_time,
                                            bool                      bypassed,
                                            std::size_t               preview_length,
                                            std::string_view          rules_version);

// 한 줄 JSON 직렬화 (감사 로그 / 경보 로그)
[[nodiscard]] std::string to_json(const AuditRecord& record);
[[nodiscard]] std::string to_json(const SecurityAlert& alert);
