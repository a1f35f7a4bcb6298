#pragma once

// ---------------------------------------------------------------------------
// alert_monitor.hpp
//
// 감사 레코드 흐름에서 공격 징후(차단 다발, 고위험 다발)를 감지한다.
//
// [판정 규칙]
// - window 안의 REJECT 수가 reject_count 를 "초과"하면 high_block_rate.
// - window 안의 tier >= high 평가 수가 high_risk_count 를 초과하면
//   high_risk_rate.
// - 같은 유형의 경보는 window 한 구간 동안 다시 발생하지 않는다 (cooldown).
// - 시각은 레코드의 timestamp 를 사용한다 (재현 가능한 테스트).
//
// [스레드 안전성]
// 잠금이 없다. AuditEmitter 의 strand 안에서만 observe() 를 호출한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

#include "audit/audit_record.hpp"
#include "policy/policy_config.hpp"  // AlertThresholds

class AlertMonitor {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    AlertMonitor() = default;
    explicit AlertMonitor(AlertThresholds thresholds);
    ~AlertMonitor() = default;

    AlertMonitor(const AlertMonitor&)            = default;
    AlertMonitor& operator=(const AlertMonitor&) = default;
    AlertMonitor(AlertMonitor&&)                 = default;
    AlertMonitor& operator=(AlertMonitor&&)      = default;

    // observe
    //   레코드 1건을 반영하고 새로 발생한 경보를 반환한다 (대개 비어 있음).
    [[nodiscard]] std::vector<SecurityAlert> observe(const AuditRecord& record);

    [[nodiscard]] std::uint64_t alerts_raised() const noexcept { return alerts_raised_; }
    [[nodiscard]] const AlertThresholds& thresholds() const noexcept { return thresholds_; }

private:
    // events 에 now 를 넣고 window 밖을 버린 뒤, 경보 조건이면 alert 반환
    [[nodiscard]] std::optional<SecurityAlert> track(std::deque<TimePoint>&   events,
                                                     std::optional<TimePoint>& last_alert,
                                                     TimePoint                 now,
                                                     std::uint32_t             threshold,
                                                     AlertType                 type);

    AlertThresholds          thresholds_{};
    std::deque<TimePoint>    rejects_{};
    std::deque<TimePoint>    high_risk_{};
    std::optional<TimePoint> last_block_alert_{};
    std::optional<TimePoint> last_risk_alert_{};
    std::uint64_t            alerts_raised_{0};
};
