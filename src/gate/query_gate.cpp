// ---------------------------------------------------------------------------
// query_gate.cpp
// ---------------------------------------------------------------------------

#include "gate/query_gate.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "audit/audit_record.hpp"

namespace {

// [Fail-close] 스냅샷이 없으면 정책 없이 판정하지 않는다
std::shared_ptr<const GateSnapshot> empty_snapshot() {
    return std::make_shared<const GateSnapshot>(GateSnapshot{
        .policy         = nullptr,
        .library        = std::make_shared<const PatternLibrary>(),
        .analyzer       = SqlAnalyzer{},
        .classifier     = RiskClassifier(nullptr),
        .preview_length = 100,
    });
}

void report_snapshot(const GateSnapshot& snapshot) {
    if (snapshot.policy && !snapshot.policy->enabled) {
        spdlog::warn("query_gate: query validation is DISABLED, every query will be allowed unchecked");
    }
    if (snapshot.library->empty()) {
        spdlog::warn("query_gate: no detection rules loaded");
    }
    spdlog::info("query_gate: snapshot active, rules={} version={}",
                 snapshot.library->size(), snapshot.library->version());
}

}  // namespace

std::shared_ptr<const GateSnapshot>
make_snapshot(const GateConfig& config, std::shared_ptr<const PatternLibrary> library) {
    if (!library) {
        library = std::make_shared<const PatternLibrary>();
    }
    return std::make_shared<const GateSnapshot>(GateSnapshot{
        .policy         = std::make_shared<const PolicyConfig>(config.policy),
        .library        = library,
        .analyzer       = SqlAnalyzer(AnalyzerOptions{.max_query_length = config.policy.max_length}),
        .classifier     = RiskClassifier(library, config.classifier),
        .preview_length = config.audit.preview_length,
    });
}

QueryGate::QueryGate(std::shared_ptr<const GateSnapshot> snapshot, std::shared_ptr<AuditEmitter> emitter)
    : snapshot_(snapshot ? std::move(snapshot) : empty_snapshot())
    , emitter_(std::move(emitter))
{
    report_snapshot(*snapshot_.load());
}

bool QueryGate::reload(std::shared_ptr<const GateSnapshot> snapshot) {
    if (!snapshot) {
        spdlog::error("query_gate: reload with empty snapshot ignored, keeping current policy");
        return false;
    }
    report_snapshot(*snapshot);
    snapshot_.store(std::move(snapshot));
    return true;
}

std::shared_ptr<const GateSnapshot> QueryGate::snapshot() const {
    return snapshot_.load();
}

Decision QueryGate::validate(std::string_view query) const {
    const auto started = std::chrono::steady_clock::now();
    // 호출당 한 번만 load (reload 와 경합해도 일관된 스냅샷)
    const auto snap = snapshot_.load();

    Decision       decision;
    RiskAssessment assessment;
    bool           bypassed = false;

    if (snap->policy && !snap->policy->enabled) {
        bypassed = true;
        decision.verdict = Verdict::kAllow;
        decision.reasons.push_back(ReasonCode::kValidationDisabled);
        decision.message = "Query validation is disabled; query was not checked";
        spdlog::debug("query_gate: validation disabled, query passed through");
    } else {
        const auto facts = snap->analyzer.analyze(query);
        assessment       = snap->classifier.classify(query, facts);
        decision         = enforcer_.enforce(query, facts, assessment, snap->policy);
    }

    stats_.on_decision(decision.verdict, decision.tier, decision.categories, bypassed);

    if (emitter_) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        emitter_->emit(make_audit_record(query, decision, assessment, elapsed, bypassed,
                                         snap->preview_length, snap->library->version()));
    }
    return decision;
}
