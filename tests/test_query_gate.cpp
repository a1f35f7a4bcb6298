// ---------------------------------------------------------------------------
// test_query_gate.cpp
//
// QueryGate 통합 테스트 (Analyzer → Classifier → Enforcer → 감사).
//
// [테스트 범위]
// - 대표 시나리오: LIMIT 추가/축소, tautology, 다중 구문 DROP, 금지 구문
// - 검증 비활성 시 통과 + bypassed 감사 레코드
// - Fail-close: 스냅샷 없음
// - reload(): 스냅샷 교체, nullptr 무시
// - 호출당 감사 레코드 1건, 통계 반영
// - 같은 입력 같은 판정, 규칙 추가 시 판정이 느슨해지지 않음
// - 멀티스레드 validate() 와 reload() 경합
// ---------------------------------------------------------------------------

#include "gate/query_gate.hpp"

#include "audit/audit_emitter.hpp"
#include "audit/audit_sink.hpp"
#include "policy/policy_loader.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

class CollectingSink final : public AuditSink {
public:
    [[nodiscard]] bool write(const AuditRecord& record) override {
        std::lock_guard lock(mutex_);
        records_.push_back(record);
        return true;
    }
    [[nodiscard]] bool write_alert(const SecurityAlert&) override { return true; }
    void flush() override {}
    [[nodiscard]] std::string name() const override { return "collecting"; }

    std::vector<AuditRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

private:
    mutable std::mutex       mutex_;
    std::vector<AuditRecord> records_;
};

std::shared_ptr<const PatternLibrary> builtin_library() {
    static const auto library = std::make_shared<const PatternLibrary>(*PatternLibrary::builtin());
    return library;
}

std::shared_ptr<const GateSnapshot> snapshot_for(GateConfig cfg = PolicyLoader::defaults(),
                                                 std::shared_ptr<const PatternLibrary> library = builtin_library()) {
    return make_snapshot(cfg, std::move(library));
}

int strictness(Verdict v) {
    switch (v) {
        case Verdict::kAllow:            return 0;
        case Verdict::kRewriteSuggested: return 1;
        case Verdict::kReject:           return 2;
    }
    return 2;
}

}  // namespace

// ---------------------------------------------------------------------------
// 대표 시나리오
// ---------------------------------------------------------------------------

TEST(QueryGate, SelectWithoutLimit_RewriteSuggested) {
    const QueryGate gate(snapshot_for());
    const auto      d = gate.validate("SELECT * FROM users");
    EXPECT_EQ(d.verdict, Verdict::kRewriteSuggested);
    ASSERT_TRUE(d.suggested_query.has_value());
    EXPECT_EQ(*d.suggested_query, "SELECT * FROM users LIMIT 100");
    EXPECT_EQ(d.tier, RiskTier::kNone);
}

TEST(QueryGate, Tautology_Rejected) {
    const QueryGate gate(snapshot_for());
    const auto      d = gate.validate("SELECT * FROM users WHERE 1=1 OR '1'='1'");
    EXPECT_EQ(d.verdict, Verdict::kReject);
    EXPECT_TRUE(d.has_reason(ReasonCode::kHighRiskPattern));
    EXPECT_NE(std::find(d.categories.begin(), d.categories.end(), AttackCategory::kTautology),
              d.categories.end());
    EXPECT_GE(d.tier, RiskTier::kHigh);
}

TEST(QueryGate, StackedDrop_Rejected) {
    const QueryGate gate(snapshot_for());
    const auto d = gate.validate("SELECT name FROM customers WHERE id=1; DROP TABLE customers;");
    EXPECT_EQ(d.verdict, Verdict::kReject);
    EXPECT_TRUE(d.has_reason(ReasonCode::kBlockedKeyword));
    EXPECT_NE(std::find(d.categories.begin(), d.categories.end(), AttackCategory::kCodeExecution),
              d.categories.end());
}

TEST(QueryGate, LimitAboveMaximum_Clamped) {
    const QueryGate gate(snapshot_for());
    const auto      d = gate.validate("SELECT * FROM orders LIMIT 5000");
    EXPECT_EQ(d.verdict, Verdict::kRewriteSuggested);
    EXPECT_TRUE(d.has_reason(ReasonCode::kLimitClamped));
    EXPECT_EQ(*d.suggested_query, "SELECT * FROM orders LIMIT 1000");
}

TEST(QueryGate, ParenthesizedSelect_LimitClamped) {
    const QueryGate gate(snapshot_for());
    const auto      d = gate.validate("(SELECT a FROM t) LIMIT 5000");
    EXPECT_EQ(d.verdict, Verdict::kRewriteSuggested);
    EXPECT_EQ(d.reasons, (std::vector<ReasonCode>{ReasonCode::kLimitClamped}));
    EXPECT_EQ(*d.suggested_query, "(SELECT a FROM t) LIMIT 1000");
}

TEST(QueryGate, LegitimateStringPredicates_NotRejected) {
    const QueryGate gate(snapshot_for());

    const auto like = gate.validate("SELECT * FROM customers WHERE email LIKE '%a%' OR email LIKE '%b%' LIMIT 10");
    EXPECT_EQ(like.verdict, Verdict::kAllow);
    EXPECT_TRUE(like.categories.empty());
    EXPECT_EQ(like.risk_score, 0u);

    const auto uni = gate.validate("SELECT * FROM t WHERE name = 'x' UNION SELECT b FROM u");
    EXPECT_NE(uni.verdict, Verdict::kReject);
    EXPECT_EQ(uni.risk_score, 25u);
    EXPECT_EQ(uni.tier, RiskTier::kMedium);
}

TEST(QueryGate, QuoteBreakUnion_Rejected) {
    const QueryGate gate(snapshot_for());
    const auto d = gate.validate("SELECT * FROM t WHERE name = 'x' UNION SELECT password FROM admins -- '");
    EXPECT_EQ(d.verdict, Verdict::kReject);
    EXPECT_NE(std::find(d.categories.begin(), d.categories.end(), AttackCategory::kUnionBased),
              d.categories.end());
}

TEST(QueryGate, DropStatement_TypeNotAllowed) {
    const QueryGate gate(snapshot_for());
    const auto      d = gate.validate("DROP TABLE users");
    EXPECT_EQ(d.verdict, Verdict::kReject);
    EXPECT_TRUE(d.has_reason(ReasonCode::kStatementTypeNotAllowed));
    EXPECT_EQ(d.statement_type, StatementType::kDrop);
}

TEST(QueryGate, CleanSelectWithLimit_Allowed) {
    const QueryGate gate(snapshot_for());
    const auto      d = gate.validate("SELECT id, name FROM customers WHERE id = 42 LIMIT 10");
    EXPECT_EQ(d.verdict, Verdict::kAllow);
    EXPECT_TRUE(d.reasons.empty());
    EXPECT_EQ(d.risk_score, 0u);
}

TEST(QueryGate, TooLong_Rejected) {
    GateConfig cfg        = PolicyLoader::defaults();
    cfg.policy.max_length = 30;
    const QueryGate gate(snapshot_for(cfg));
    const auto d = gate.validate("SELECT id, name, email, phone FROM customers LIMIT 1");
    EXPECT_EQ(d.verdict, Verdict::kReject);
    EXPECT_TRUE(d.has_reason(ReasonCode::kQueryTooLong));
}

TEST(QueryGate, EmptyQuery_Rejected) {
    const QueryGate gate(snapshot_for());
    const auto      d = gate.validate("");
    EXPECT_EQ(d.verdict, Verdict::kReject);
    EXPECT_EQ(d.statement_type, StatementType::kUnknown);
}

TEST(QueryGate, UnterminatedString_MarkedDegraded) {
    const QueryGate gate(snapshot_for());
    const auto      d = gate.validate("SELECT * FROM t WHERE name = 'abc LIMIT 5");
    EXPECT_TRUE(d.has_reason(ReasonCode::kAnalysisDegraded));
}

// ---------------------------------------------------------------------------
// 검증 비활성 / fail-close
// ---------------------------------------------------------------------------

TEST(QueryGate, ValidationDisabled_AllowsWithReason) {
    GateConfig cfg     = PolicyLoader::defaults();
    cfg.policy.enabled = false;
    auto       sink    = std::make_shared<CollectingSink>();
    auto       emitter = std::make_shared<AuditEmitter>(sink, cfg.audit);
    QueryGate  gate(snapshot_for(cfg), emitter);

    const auto d = gate.validate("DROP TABLE users");
    EXPECT_EQ(d.verdict, Verdict::kAllow);
    EXPECT_TRUE(d.has_reason(ReasonCode::kValidationDisabled));
    EXPECT_EQ(d.message, "Query validation is disabled; query was not checked");
    EXPECT_EQ(gate.stats().bypassed, 1u);

    emitter->shutdown();
    const auto records = sink->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].bypassed);
}

TEST(QueryGate, NullSnapshot_FailsClosed) {
    const QueryGate gate(nullptr);
    const auto      d = gate.validate("SELECT 1 LIMIT 1");
    EXPECT_EQ(d.verdict, Verdict::kReject);
    EXPECT_EQ(d.message, "Query rejected: validation policy is not available");
}

// ---------------------------------------------------------------------------
// reload
// ---------------------------------------------------------------------------

TEST(QueryGate, Reload_SwapsPolicy) {
    QueryGate gate(snapshot_for());
    EXPECT_EQ(gate.validate("SELECT * FROM t LIMIT 50").verdict, Verdict::kAllow);

    GateConfig strict              = PolicyLoader::defaults();
    strict.policy.max_limit_value  = 10;
    strict.policy.default_limit    = 10;
    EXPECT_TRUE(gate.reload(snapshot_for(strict)));

    const auto d = gate.validate("SELECT * FROM t LIMIT 50");
    EXPECT_EQ(d.verdict, Verdict::kRewriteSuggested);
    EXPECT_EQ(*d.suggested_query, "SELECT * FROM t LIMIT 10");
    EXPECT_EQ(gate.snapshot()->policy->max_limit_value, 10u);
}

TEST(QueryGate, Reload_NullIgnored) {
    QueryGate  gate(snapshot_for());
    const auto before = gate.snapshot();
    EXPECT_FALSE(gate.reload(nullptr));
    EXPECT_EQ(gate.snapshot(), before);
}

// ---------------------------------------------------------------------------
// 감사 / 통계
// ---------------------------------------------------------------------------

TEST(QueryGate, EachValidation_EmitsOneAuditRecord) {
    GateConfig cfg            = PolicyLoader::defaults();
    cfg.audit.preview_length  = 10;
    auto       sink           = std::make_shared<CollectingSink>();
    auto       emitter        = std::make_shared<AuditEmitter>(sink, cfg.audit);
    QueryGate  gate(snapshot_for(cfg), emitter);

    const std::vector<std::string> queries = {
        "SELECT * FROM users",
        "DROP TABLE users",
        "SELECT * FROM users WHERE 1=1 OR '1'='1'",
    };
    for (const auto& q : queries) {
        (void)gate.validate(q);
    }
    emitter->shutdown();

    const auto records = sink->records();
    ASSERT_EQ(records.size(), queries.size());
    EXPECT_EQ(records[0].verdict, Verdict::kRewriteSuggested);
    EXPECT_EQ(records[0].query_preview, "SELECT * F...");
    EXPECT_EQ(records[0].query_hash, query_hash(queries[0]));
    EXPECT_EQ(records[0].rules_version, "builtin-1");
    EXPECT_EQ(records[1].verdict, Verdict::kReject);
    EXPECT_FALSE(records[2].rule_ids.empty());

    const auto stats = gate.stats();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.rejected, 2u);
    EXPECT_EQ(stats.rewritten, 1u);
    EXPECT_GE(stats.hits(AttackCategory::kTautology), 1u);
}

TEST(QueryGate, WithoutEmitter_StillCountsStats) {
    const QueryGate gate(snapshot_for());
    EXPECT_EQ(gate.emitter(), nullptr);
    (void)gate.validate("SELECT 1 LIMIT 1");
    EXPECT_EQ(gate.stats().total, 1u);
}

// ---------------------------------------------------------------------------
// 결정성 / 단조성
// ---------------------------------------------------------------------------

TEST(QueryGate, SameQuery_SameDecision) {
    const QueryGate gate(snapshot_for());
    for (const char* q : {"SELECT * FROM users", "SELECT * FROM t WHERE a = 1 AND SLEEP(5)",
                          "SELECT a FROM t UN/**/ION SELECT b FROM u"}) {
        EXPECT_EQ(gate.validate(q), gate.validate(q)) << q;
    }
}

TEST(QueryGate, AddingRule_NeverLoosensVerdict) {
    const auto extended = builtin_library()->with_rule(make_structural_rule(
        "site-comment", AttackCategory::kObfuscation, 60, "", {StructuralCheck::kCommentPresent, 1, {}}));
    ASSERT_TRUE(extended.has_value());

    const QueryGate base(snapshot_for());
    const QueryGate strict(snapshot_for(PolicyLoader::defaults(),
                                        std::make_shared<const PatternLibrary>(*extended)));

    for (const char* q : {"SELECT * FROM t LIMIT 5 -- note", "SELECT * FROM users",
                          "SELECT * FROM users WHERE 1=1 OR '1'='1'"}) {
        const auto a = base.validate(q);
        const auto b = strict.validate(q);
        EXPECT_GE(b.risk_score, a.risk_score) << q;
        EXPECT_GE(strictness(b.verdict), strictness(a.verdict)) << q;
    }
    EXPECT_EQ(strict.validate("SELECT * FROM t LIMIT 5 -- note").verdict, Verdict::kReject);
}

// ---------------------------------------------------------------------------
// 동시성
// ---------------------------------------------------------------------------

TEST(QueryGate, ConcurrentValidate_MatchesSequential) {
    QueryGate gate(snapshot_for());
    const std::vector<std::string> queries = {
        "SELECT * FROM users",
        "SELECT * FROM orders LIMIT 5000",
        "SELECT * FROM users WHERE 1=1 OR '1'='1'",
        "DROP TABLE users",
    };
    std::vector<Decision> expected;
    for (const auto& q : queries) {
        expected.push_back(gate.validate(q));
    }

    std::atomic<int>         mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 200; ++i) {
                const auto idx = static_cast<std::size_t>(i) % queries.size();
                if (!(gate.validate(queries[idx]) == expected[idx])) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(gate.stats().total, 4u + 4u * 200u);
}

TEST(QueryGate, ConcurrentReload_EachCallSeesOneSnapshot) {
    GateConfig loose             = PolicyLoader::defaults();
    GateConfig tight             = PolicyLoader::defaults();
    tight.policy.max_limit_value = 10;
    tight.policy.default_limit   = 10;
    const auto loose_snap        = snapshot_for(loose);
    const auto tight_snap        = snapshot_for(tight);

    QueryGate        gate(loose_snap);
    std::atomic<bool> stop{false};
    std::thread       reloader([&] {
        bool flip = false;
        while (!stop.load()) {
            gate.reload(flip ? loose_snap : tight_snap);
            flip = !flip;
        }
    });

    // 한 호출 안에서는 한 정책만 적용된다: 결과는 두 정책 중 하나의 판정과 같아야 한다
    const QueryGate loose_ref(loose_snap);
    const QueryGate tight_ref(tight_snap);
    const auto      a = loose_ref.validate("SELECT * FROM t");
    const auto      b = tight_ref.validate("SELECT * FROM t");
    int             mixed = 0;
    for (int i = 0; i < 500; ++i) {
        const auto d = gate.validate("SELECT * FROM t");
        if (!(d == a) && !(d == b)) {
            ++mixed;
        }
    }
    stop.store(true);
    reloader.join();
    EXPECT_EQ(mixed, 0);
}
