// ---------------------------------------------------------------------------
// risk_classifier.cpp
// ---------------------------------------------------------------------------

#include "classifier/risk_classifier.hpp"

#include <algorithm>

namespace {

// pattern_scan_limit 초과 시 추가되는 합성 매치
constexpr std::string_view kScanLimitRuleId   = "scan-limit";
constexpr std::uint32_t    kScanLimitSeverity = 30;

}  // namespace

bool RiskAssessment::has_category(AttackCategory category) const noexcept {
    return std::find(categories.begin(), categories.end(), category) != categories.end();
}

RiskClassifier::RiskClassifier(std::shared_ptr<const PatternLibrary> library,
                               ClassifierOptions options)
    : library_(library ? std::move(library) : std::make_shared<const PatternLibrary>())
    , options_(options)
{}

MatchResult RiskClassifier::match(std::string_view text, const StructuralFacts& facts) const {
    MatchResult result;

    std::string_view scanned = text;
    if (options_.pattern_scan_limit > 0 && text.size() > options_.pattern_scan_limit) {
        scanned          = text.substr(0, options_.pattern_scan_limit);
        result.truncated = true;
    }

    for (const auto& rule : library_->rules()) {
        if (match_rule(rule, scanned, facts)) {
            result.matches.push_back(RuleMatch{rule.id, rule.category, rule.severity});
        }
    }

    if (result.truncated) {
        result.matches.push_back(
            RuleMatch{std::string(kScanLimitRuleId), AttackCategory::kOther, kScanLimitSeverity});
    }
    return result;
}

RiskAssessment RiskClassifier::classify(std::string_view text, const StructuralFacts& facts) const {
    const MatchResult matched = match(text, facts);

    RiskAssessment assessment;
    assessment.degraded = facts.degraded || matched.truncated;

    std::uint64_t total = 0;  // 규칙 수 * 100 도 uint64 범위 안
    for (const auto& m : matched.matches) {
        total += m.severity;
        assessment.max_severity = std::max(assessment.max_severity, m.severity);
        assessment.categories.push_back(m.category);
    }
    assessment.score = static_cast<std::uint32_t>(
        std::min<std::uint64_t>(total, options_.score_cap));
    assessment.tier    = tier_for(assessment.score);
    assessment.matches = matched.matches;

    std::sort(assessment.categories.begin(), assessment.categories.end());
    assessment.categories.erase(
        std::unique(assessment.categories.begin(), assessment.categories.end()),
        assessment.categories.end());

    return assessment;
}

RiskTier RiskClassifier::tier_for(std::uint32_t score) const noexcept {
    if (score >= options_.critical_threshold) return RiskTier::kCritical;
    if (score >= options_.high_threshold)     return RiskTier::kHigh;
    if (score >= options_.medium_threshold)   return RiskTier::kMedium;
    if (score >= options_.low_threshold)      return RiskTier::kLow;
    return RiskTier::kNone;
}
