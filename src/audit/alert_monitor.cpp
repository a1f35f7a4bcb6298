// ---------------------------------------------------------------------------
// alert_monitor.cpp
// ---------------------------------------------------------------------------

#include "audit/alert_monitor.hpp"

#include <fmt/format.h>

AlertMonitor::AlertMonitor(AlertThresholds thresholds)
    : thresholds_(thresholds)
{}

std::optional<SecurityAlert> AlertMonitor::track(std::deque<TimePoint>&    events,
                                                 std::optional<TimePoint>& last_alert,
                                                 TimePoint                 now,
                                                 std::uint32_t             threshold,
                                                 AlertType                 type) {
    events.push_back(now);
    const auto window_start = now - thresholds_.window;
    while (!events.empty() && events.front() <= window_start) {
        events.pop_front();
    }

    if (events.size() <= threshold) {
        return std::nullopt;
    }
    if (last_alert && now - *last_alert < thresholds_.window) {
        return std::nullopt;  // cooldown
    }
    last_alert = now;
    ++alerts_raised_;

    SecurityAlert alert;
    alert.type      = type;
    alert.timestamp = now;
    alert.count     = static_cast<std::uint32_t>(events.size());
    alert.threshold = threshold;
    alert.window    = thresholds_.window;
    alert.message   = type == AlertType::kHighBlockRate
        ? fmt::format("High rate of rejected queries: {} in last {}s", events.size(), thresholds_.window.count())
        : fmt::format("High rate of risky queries: {} in last {}s", events.size(), thresholds_.window.count());
    return alert;
}

std::vector<SecurityAlert> AlertMonitor::observe(const AuditRecord& record) {
    std::vector<SecurityAlert> alerts;

    if (record.verdict == Verdict::kReject) {
        if (auto alert = track(rejects_, last_block_alert_, record.timestamp,
                               thresholds_.reject_count, AlertType::kHighBlockRate)) {
            alerts.push_back(std::move(*alert));
        }
    }
    if (record.tier >= RiskTier::kHigh) {
        if (auto alert = track(high_risk_, last_risk_alert_, record.timestamp,
                               thresholds_.high_risk_count, AlertType::kHighRiskRate)) {
            alerts.push_back(std::move(*alert));
        }
    }
    return alerts;
}
