#pragma once

// ---------------------------------------------------------------------------
// query_gate.hpp
//
// 검증 파이프라인 진입점.
//   validate(text) = Analyzer → Classifier → Enforcer → 감사 레코드 1건 → Decision
//
// [스레드 안전성]
// - 정책/규칙/분석 옵션은 불변 GateSnapshot 하나로 묶어
//   std::atomic<std::shared_ptr<const GateSnapshot>> 에 보관한다.
// - validate() 는 호출마다 스냅샷을 한 번만 load 하므로, reload() 와
//   경합해도 한 호출 안에서 정책과 규칙이 섞이지 않는다.
// - reload() 는 새 스냅샷 전체를 교체한다. 기존 스냅샷은 진행 중인
//   validate() 가 끝나면 해제된다.
//
// [검증 비활성]
// policy.enabled == false 이면 분석 없이 ALLOW + validation_disabled 를
// 반환한다. 스냅샷 생성 시 warn 로그를 남기고 감사 레코드는 bypassed 로 표시.
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstddef>
#include <memory>
#include <string_view>

#include "audit/audit_emitter.hpp"
#include "classifier/risk_classifier.hpp"
#include "parser/sql_analyzer.hpp"
#include "policy/decision.hpp"
#include "policy/policy_config.hpp"
#include "policy/policy_enforcer.hpp"
#include "rules/pattern_library.hpp"
#include "stats/gate_stats.hpp"

// ---------------------------------------------------------------------------
// GateSnapshot
//   한 시점의 정책 + 규칙 집합. 생성 후 변경하지 않는다.
// ---------------------------------------------------------------------------
struct GateSnapshot {
    std::shared_ptr<const PolicyConfig>   policy;
    std::shared_ptr<const PatternLibrary> library;
    SqlAnalyzer                           analyzer;
    RiskClassifier                        classifier;
    std::size_t                           preview_length{100};
};

// make_snapshot
//   analyzer 의 max_query_length 는 policy.max_length 를 따른다.
//   library 가 nullptr 이면 빈 라이브러리.
[[nodiscard]] std::shared_ptr<const GateSnapshot>
make_snapshot(const GateConfig& config, std::shared_ptr<const PatternLibrary> library);

class QueryGate {
public:
    // emitter 가 nullptr 이면 감사 출력 없이 동작한다 (audit.enabled = false).
    explicit QueryGate(std::shared_ptr<const GateSnapshot> snapshot,
                       std::shared_ptr<AuditEmitter>       emitter = nullptr);
    ~QueryGate() = default;

    // 복사/이동 금지 (atomic 스냅샷, 통계 소유)
    QueryGate(const QueryGate&)            = delete;
    QueryGate& operator=(const QueryGate&) = delete;
    QueryGate(QueryGate&&)                 = delete;
    QueryGate& operator=(QueryGate&&)      = delete;

    // validate
    //   예외를 던지지 않는다. REJECT 도 정상 반환값이다.
    //   같은 스냅샷에서 같은 쿼리는 같은 Decision 을 낸다.
    [[nodiscard]] Decision validate(std::string_view query) const;

    // reload
    //   스냅샷 전체 교체. nullptr 은 무시하고 false 반환.
    bool reload(std::shared_ptr<const GateSnapshot> snapshot);

    [[nodiscard]] std::shared_ptr<const GateSnapshot> snapshot() const;
    [[nodiscard]] GateStatsSnapshot                   stats() const noexcept { return stats_.snapshot(); }
    [[nodiscard]] const std::shared_ptr<AuditEmitter>& emitter() const noexcept { return emitter_; }

private:
    std::atomic<std::shared_ptr<const GateSnapshot>> snapshot_;
    std::shared_ptr<AuditEmitter>                    emitter_;
    PolicyEnforcer                                   enforcer_{};
    mutable GateStats                                stats_{};
};
