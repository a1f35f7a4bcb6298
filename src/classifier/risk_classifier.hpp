#pragma once

// ---------------------------------------------------------------------------
// risk_classifier.hpp
//
// PatternLibrary 의 모든 규칙을 한 쿼리에 적용하여 위험 점수와 등급을 산출한다.
//
// [점수 규칙]
// - score = 발화한 규칙 severity 의 합, score_cap 에서 포화.
// - 같은 텍스트 구간에 여러 규칙이 겹쳐도 모두 합산한다 (중복 제거 없음).
//   다중 벡터 공격을 과소평가하지 않기 위함.
// - 등급: 0 → none, 1..19 → low, 20..49 → medium, 50..89 → high,
//   90 이상 → critical (경계값은 ClassifierOptions 로 조정).
// - 규칙 추가는 점수를 낮추지 않는다 (합산 + 포화는 단조 증가).
//
// [성능 고려사항]
// - 정규식 규칙은 pattern_scan_limit 바이트까지만 검사한다. 초과분이 있으면
//   합성 규칙 "scan-limit" 을 발화시켜 degraded 로 취급한다.
// - 상태가 없으므로 여러 스레드에서 동시에 classify() 를 호출해도 안전하다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "parser/sql_analyzer.hpp"
#include "rules/pattern_library.hpp"

// ---------------------------------------------------------------------------
// RuleMatch / MatchResult
//   rule_id 는 감사 로그 전용. 사용자 응답에는 카테고리만 노출한다.
// ---------------------------------------------------------------------------
struct RuleMatch {
    std::string    rule_id{};
    AttackCategory category{AttackCategory::kOther};
    std::uint32_t  severity{0};

    bool operator==(const RuleMatch&) const = default;
};

struct MatchResult {
    std::vector<RuleMatch> matches{};
    bool                   truncated{false};  // pattern_scan_limit 초과

    bool operator==(const MatchResult&) const = default;
};

// ---------------------------------------------------------------------------
// RiskAssessment
//   categories 는 정렬된 중복 없는 목록.
// ---------------------------------------------------------------------------
struct RiskAssessment {
    std::uint32_t               score{0};
    RiskTier                    tier{RiskTier::kNone};
    std::vector<AttackCategory> categories{};
    std::vector<RuleMatch>      matches{};
    std::uint32_t               max_severity{0};
    bool                        degraded{false};

    [[nodiscard]] bool has_category(AttackCategory category) const noexcept;

    bool operator==(const RiskAssessment&) const = default;
};

struct ClassifierOptions {
    std::uint32_t score_cap{100};
    std::uint32_t low_threshold{1};
    std::uint32_t medium_threshold{20};
    std::uint32_t high_threshold{50};
    std::uint32_t critical_threshold{90};
    std::size_t   pattern_scan_limit{8192};
};

class RiskClassifier {
public:
    // library 가 nullptr 이면 빈 라이브러리로 동작한다 (모든 쿼리 score 0).
    // 호출자(QueryGate)는 기동 시 빈 라이브러리를 경고로 보고한다.
    explicit RiskClassifier(std::shared_ptr<const PatternLibrary> library,
                            ClassifierOptions options = {});
    ~RiskClassifier() = default;

    RiskClassifier(const RiskClassifier&)            = default;
    RiskClassifier& operator=(const RiskClassifier&) = default;
    RiskClassifier(RiskClassifier&&)                 = default;
    RiskClassifier& operator=(RiskClassifier&&)      = default;

    // match
    //   발화한 규칙 목록만 반환한다 (점수 계산 전 단계).
    [[nodiscard]] MatchResult match(std::string_view text, const StructuralFacts& facts) const;

    // classify
    //   match() 결과를 점수/등급/카테고리로 집계한다.
    [[nodiscard]] RiskAssessment classify(std::string_view text, const StructuralFacts& facts) const;

    [[nodiscard]] RiskTier tier_for(std::uint32_t score) const noexcept;

    [[nodiscard]] const ClassifierOptions& options() const noexcept { return options_; }
    [[nodiscard]] const PatternLibrary&    library() const noexcept { return *library_; }

private:
    std::shared_ptr<const PatternLibrary> library_;
    ClassifierOptions                     options_;
};
