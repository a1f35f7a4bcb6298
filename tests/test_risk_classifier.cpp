// ---------------------------------------------------------------------------
// test_risk_classifier.cpp
//
// RiskClassifier 단위 테스트.
//
// [테스트 범위]
// - 점수 = 발화 규칙 severity 합 (score_cap 포화)
// - 점수 → 등급 경계값
// - 카테고리 중복 제거 / 정렬
// - 규칙 추가 시 점수 단조 증가
// - pattern_scan_limit 초과 시 degraded + scan-limit 매치
// ---------------------------------------------------------------------------

#include "classifier/risk_classifier.hpp"

#include "parser/sql_analyzer.hpp"
#include "rules/pattern_library.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>

namespace {

std::shared_ptr<const PatternLibrary> builtin_library() {
    static const auto library = std::make_shared<const PatternLibrary>(*PatternLibrary::builtin());
    return library;
}

std::shared_ptr<const PatternLibrary> library_of(std::vector<Rule> rules) {
    auto library = PatternLibrary::from_rules("test", std::move(rules));
    EXPECT_TRUE(library.has_value());
    return std::make_shared<const PatternLibrary>(std::move(*library));
}

Rule comment_rule(std::string id, AttackCategory category, std::uint32_t severity) {
    return make_structural_rule(std::move(id), category, severity, "",
                                {StructuralCheck::kCommentPresent, 1, {}});
}

RiskAssessment classify(const RiskClassifier& classifier, std::string_view sql) {
    return classifier.classify(sql, SqlAnalyzer{}.analyze(sql));
}

}  // namespace

// ---------------------------------------------------------------------------
// 점수
// ---------------------------------------------------------------------------

TEST(RiskClassifier, NoMatches_ScoreZeroTierNone) {
    const RiskClassifier classifier(builtin_library());
    const auto           a = classify(classifier, "SELECT id FROM customers WHERE id = 42");
    EXPECT_EQ(a.score, 0u);
    EXPECT_EQ(a.tier, RiskTier::kNone);
    EXPECT_TRUE(a.categories.empty());
    EXPECT_TRUE(a.matches.empty());
    EXPECT_FALSE(a.degraded);
}

TEST(RiskClassifier, Score_IsSumOfSeverities) {
    const RiskClassifier classifier(library_of({
        comment_rule("a", AttackCategory::kObfuscation, 10),
        comment_rule("b", AttackCategory::kOther, 15),
    }));
    const auto a = classify(classifier, "SELECT 1 -- x");
    EXPECT_EQ(a.score, 25u);
    EXPECT_EQ(a.max_severity, 15u);
    EXPECT_EQ(a.matches.size(), 2u);
}

TEST(RiskClassifier, Score_SaturatesAtCap) {
    const RiskClassifier classifier(library_of({
        comment_rule("a", AttackCategory::kObfuscation, 80),
        comment_rule("b", AttackCategory::kOther, 80),
    }));
    const auto a = classify(classifier, "SELECT 1 -- x");
    EXPECT_EQ(a.score, 100u);
    EXPECT_EQ(a.tier, RiskTier::kCritical);
}

TEST(RiskClassifier, Categories_DeduplicatedAndSorted) {
    const RiskClassifier classifier(library_of({
        comment_rule("a", AttackCategory::kOther, 5),
        comment_rule("b", AttackCategory::kTautology, 5),
        comment_rule("c", AttackCategory::kOther, 5),
    }));
    const auto a = classify(classifier, "SELECT 1 /* x */");
    ASSERT_EQ(a.categories.size(), 2u);
    EXPECT_EQ(a.categories[0], AttackCategory::kTautology);
    EXPECT_EQ(a.categories[1], AttackCategory::kOther);
    EXPECT_TRUE(a.has_category(AttackCategory::kOther));
    EXPECT_FALSE(a.has_category(AttackCategory::kNoSql));
}

// ---------------------------------------------------------------------------
// 등급
// ---------------------------------------------------------------------------

TEST(RiskClassifier, TierBoundaries_Default) {
    const RiskClassifier classifier(nullptr);
    EXPECT_EQ(classifier.tier_for(0), RiskTier::kNone);
    EXPECT_EQ(classifier.tier_for(1), RiskTier::kLow);
    EXPECT_EQ(classifier.tier_for(19), RiskTier::kLow);
    EXPECT_EQ(classifier.tier_for(20), RiskTier::kMedium);
    EXPECT_EQ(classifier.tier_for(49), RiskTier::kMedium);
    EXPECT_EQ(classifier.tier_for(50), RiskTier::kHigh);
    EXPECT_EQ(classifier.tier_for(89), RiskTier::kHigh);
    EXPECT_EQ(classifier.tier_for(90), RiskTier::kCritical);
    EXPECT_EQ(classifier.tier_for(100), RiskTier::kCritical);
}

TEST(RiskClassifier, TierBoundaries_Configured) {
    const RiskClassifier classifier(nullptr, ClassifierOptions{
        .score_cap = 200, .low_threshold = 10, .medium_threshold = 40,
        .high_threshold = 80, .critical_threshold = 150, .pattern_scan_limit = 8192});
    EXPECT_EQ(classifier.tier_for(9), RiskTier::kNone);
    EXPECT_EQ(classifier.tier_for(79), RiskTier::kMedium);
    EXPECT_EQ(classifier.tier_for(149), RiskTier::kHigh);
    EXPECT_EQ(classifier.tier_for(150), RiskTier::kCritical);
}

TEST(RiskClassifier, NullLibrary_ClassifiesAsNone) {
    const RiskClassifier classifier(nullptr);
    EXPECT_TRUE(classifier.library().empty());
    EXPECT_EQ(classify(classifier, "SELECT 1 OR 1=1").score, 0u);
}

// ---------------------------------------------------------------------------
// 내장 규칙과의 통합
// ---------------------------------------------------------------------------

TEST(RiskClassifier, Builtin_TautologyIsHighRisk) {
    const RiskClassifier classifier(builtin_library());
    const auto a = classify(classifier, "SELECT * FROM users WHERE id = 1 OR 1=1");
    EXPECT_GE(a.tier, RiskTier::kHigh);
    EXPECT_TRUE(a.has_category(AttackCategory::kTautology));
}

TEST(RiskClassifier, Builtin_StackedDropIsCritical) {
    const RiskClassifier classifier(builtin_library());
    const auto a = classify(classifier, "SELECT name FROM customers WHERE id=1; DROP TABLE customers;");
    EXPECT_EQ(a.tier, RiskTier::kCritical);
    EXPECT_TRUE(a.has_category(AttackCategory::kCodeExecution));
    EXPECT_GE(a.max_severity, 90u);
}

TEST(RiskClassifier, AddingRule_NeverLowersScore) {
    const std::string sql = "SELECT name FROM users WHERE id=1 UNION SELECT NULL, @@version -- x";
    const auto        facts = SqlAnalyzer{}.analyze(sql);

    const auto base     = PatternLibrary::builtin();
    const auto extended = base->with_rule(comment_rule("extra-comment", AttackCategory::kOther, 5));
    ASSERT_TRUE(extended.has_value());

    const RiskClassifier before(std::make_shared<const PatternLibrary>(*base));
    const RiskClassifier after(std::make_shared<const PatternLibrary>(*extended));
    const auto           a = before.classify(sql, facts);
    const auto           b = after.classify(sql, facts);
    EXPECT_GE(b.score, a.score);
    EXPECT_GE(b.tier, a.tier);
}

TEST(RiskClassifier, SameInput_SameAssessment) {
    const RiskClassifier classifier(builtin_library());
    const std::string    sql = "SELECT * FROM t WHERE a = 1 AND SLEEP(5) -- x";
    EXPECT_EQ(classify(classifier, sql), classify(classifier, sql));
}

// ---------------------------------------------------------------------------
// 스캔 한도
// ---------------------------------------------------------------------------

TEST(RiskClassifier, ScanLimit_MarksDegradedAndAddsMatch) {
    const RiskClassifier classifier(builtin_library(), ClassifierOptions{.pattern_scan_limit = 32});
    const std::string    sql = "SELECT id FROM customers WHERE name = '" + std::string(64, 'a') + "'";

    const auto a = classify(classifier, sql);
    EXPECT_TRUE(a.degraded);
    EXPECT_TRUE(std::any_of(a.matches.begin(), a.matches.end(),
                            [](const RuleMatch& m) { return m.rule_id == "scan-limit"; }));
    EXPECT_TRUE(a.has_category(AttackCategory::kOther));
}

TEST(RiskClassifier, ScanLimit_PatternBeyondLimitNotSeen) {
    const RiskClassifier classifier(builtin_library(), ClassifierOptions{.pattern_scan_limit = 16});
    const std::string    sql = "SELECT id FROM t WHERE x = 'padding' AND LOAD_FILE('/etc/passwd')";

    const auto result = classifier.match(sql, SqlAnalyzer{}.analyze(sql));
    EXPECT_TRUE(result.truncated);
    EXPECT_TRUE(std::none_of(result.matches.begin(), result.matches.end(),
                             [](const RuleMatch& m) { return m.rule_id == "file-read-write"; }));
}
