// ---------------------------------------------------------------------------
// policy_enforcer.cpp
//
// [메시지 정책]
// 사용자 메시지에는 카테고리 이름까지만 담는다. 규칙 id, 매칭된 정규식,
// 차단 키워드 목록 자체는 노출하지 않는다.
//
// [LIMIT 재작성]
// - 추가: 첫 구문의 마지막 코드 토큰 뒤에 " LIMIT n" 을 붙인다.
//   뒤따르는 세미콜론과 꼬리 주석은 버린다 (-- 주석 뒤에 붙이면
//   LIMIT 이 주석 처리되므로).
// - 축소: 리터럴 값의 바이트 구간만 max_limit_value 로 교체한다.
//   LIMIT off, n / OFFSET / TOP / FETCH FIRST 형식이 그대로 유지된다.
// ---------------------------------------------------------------------------

#include "policy/policy_enforcer.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

std::string category_list(const std::vector<AttackCategory>& categories) {
    std::string out;
    for (const auto category : categories) {
        if (!out.empty()) {
            out += ", ";
        }
        out += to_string(category);
    }
    return out;
}

bool is_blocked(const StructuralFacts& facts, const RiskAssessment& assessment,
                const PolicyConfig& policy) {
    for (const auto& keyword : policy.blocked_keywords) {
        if (facts.has_keyword(keyword)) {
            return true;
        }
        // 카테고리 이름도 차단 키워드로 지정할 수 있다 (예: "union-based")
        for (const auto category : assessment.categories) {
            if (iequals(to_string(category), keyword)) {
                return true;
            }
        }
    }
    return std::any_of(policy.blocked_functions.begin(), policy.blocked_functions.end(),
                       [&facts](const std::string& f) { return facts.calls_function(f); });
}

bool forces_reject(const RiskAssessment& assessment, const PolicyConfig& policy) {
    if (assessment.tier == RiskTier::kCritical) {
        return true;
    }
    if (assessment.max_severity >= policy.reject_severity) {
        return true;
    }
    return std::any_of(assessment.categories.begin(), assessment.categories.end(),
                       [&policy](AttackCategory c) {
                           return policy.action_for(c) == CategoryAction::kReject;
                       });
}

// high 등급을 경고로 완화할 수 있는지
bool high_tier_is_soft(const RiskAssessment& assessment, const PolicyConfig& policy) {
    if (policy.high_tier_action == TierAction::kWarn) {
        return true;
    }
    return !assessment.categories.empty() &&
           std::all_of(assessment.categories.begin(), assessment.categories.end(),
                       [&policy](AttackCategory c) {
                           return policy.action_for(c) == CategoryAction::kWarn;
                       });
}

}  // namespace

std::string PolicyEnforcer::append_limit(std::string_view query, const StructuralFacts& facts,
                                         std::uint64_t limit) {
    std::size_t end = facts.statement_end;
    if (end == 0 || end > query.size()) {
        // 토큰 정보가 없으면 공백과 세미콜론 하나만 걷어낸다
        end = query.size();
        while (end > 0 && std::isspace(static_cast<unsigned char>(query[end - 1])) != 0) {
            --end;
        }
        if (end > 0 && query[end - 1] == ';') {
            --end;
        }
        while (end > 0 && std::isspace(static_cast<unsigned char>(query[end - 1])) != 0) {
            --end;
        }
    }
    return fmt::format("{} LIMIT {}", query.substr(0, end), limit);
}

std::string PolicyEnforcer::clamp_limit(std::string_view query, const LimitClause& clause,
                                        std::uint64_t max_value) {
    if (clause.value_length == 0 || clause.value_offset + clause.value_length > query.size()) {
        return std::string(query);
    }
    return fmt::format("{}{}{}", query.substr(0, clause.value_offset), max_value,
                       query.substr(clause.value_offset + clause.value_length));
}

Decision PolicyEnforcer::enforce(std::string_view                           query,
                                 const StructuralFacts&                     facts,
                                 const RiskAssessment&                      assessment,
                                 const std::shared_ptr<const PolicyConfig>& policy) const {
    Decision decision;
    decision.categories     = assessment.categories;
    decision.risk_score     = assessment.score;
    decision.tier           = assessment.tier;
    decision.statement_type = facts.statement_type;

    // [Fail-close] 정책 없이 판정하지 않는다
    if (!policy) {
        spdlog::error("policy_enforcer: no policy configured, rejecting");
        decision.verdict = Verdict::kReject;
        decision.message = "Query rejected: validation policy is not available";
        return decision;
    }

    const auto finish = [&decision, &assessment](Verdict verdict, std::string message) {
        decision.verdict = verdict;
        decision.message = std::move(message);
        if (assessment.degraded) {
            decision.reasons.push_back(ReasonCode::kAnalysisDegraded);
        }
        return decision;
    };
    const auto reject = [&decision, &finish](ReasonCode reason, std::string message) {
        decision.reasons.push_back(reason);
        return finish(Verdict::kReject, std::move(message));
    };

    // 1. 구문 유형
    if (!policy->is_allowed(facts.statement_type)) {
        return reject(ReasonCode::kStatementTypeNotAllowed,
                      fmt::format("Query rejected: {} statements are not allowed",
                                  to_string(facts.statement_type)));
    }

    // 2. 차단 키워드 / 함수
    if (is_blocked(facts, assessment, *policy)) {
        return reject(ReasonCode::kBlockedKeyword,
                      "Query rejected: it uses a keyword or function that is not permitted");
    }

    // 3. 길이
    if (facts.length > policy->max_length) {
        return reject(ReasonCode::kQueryTooLong,
                      fmt::format("Query rejected: longer than {} characters", policy->max_length));
    }

    // 복잡도 경고 (판정에는 영향 없음)
    if (facts.join_count > policy->max_joins) {
        decision.warnings.push_back(
            fmt::format("Query joins more than {} tables", policy->max_joins));
    }
    if (facts.subquery_count > policy->max_subqueries) {
        decision.warnings.push_back(
            fmt::format("Query nests more than {} subqueries", policy->max_subqueries));
    }

    // 4. 위험 판정
    if (forces_reject(assessment, *policy)) {
        spdlog::debug("policy_enforcer: high risk rejected, score={} tier={}",
                      assessment.score, to_string(assessment.tier));
        return reject(ReasonCode::kHighRiskPattern,
                      fmt::format("Query rejected: potential SQL injection ({})",
                                  category_list(assessment.categories)));
    }

    bool elevated = false;
    if (assessment.tier == RiskTier::kHigh) {
        if (!high_tier_is_soft(assessment, *policy)) {
            return reject(ReasonCode::kHighRiskPattern,
                          fmt::format("Query rejected: potential SQL injection ({})",
                                      category_list(assessment.categories)));
        }
        elevated = true;
        decision.reasons.push_back(ReasonCode::kElevatedRiskWarning);
        decision.warnings.push_back(
            fmt::format("Elevated risk ({}), review before execution",
                        category_list(assessment.categories)));
    }

    // 5. LIMIT 재작성
    std::optional<std::string> rewritten;
    std::string                rewrite_message;
    if (facts.statement_type == StatementType::kSelect && policy->require_limit && !facts.limit) {
        rewritten = append_limit(query, facts, policy->default_limit);
        decision.reasons.push_back(ReasonCode::kLimitAdded);
        rewrite_message = fmt::format("Row limit of {} added", policy->default_limit);
    } else if (facts.limit && facts.limit->value && *facts.limit->value > policy->max_limit_value &&
               facts.limit->value_length > 0) {
        rewritten = clamp_limit(query, *facts.limit, policy->max_limit_value);
        decision.reasons.push_back(ReasonCode::kLimitClamped);
        rewrite_message = fmt::format("Row limit reduced to {}", policy->max_limit_value);
    }

    if (elevated) {
        decision.suggested_query = rewritten.value_or(std::string(query));
        return finish(Verdict::kRewriteSuggested,
                      fmt::format("Query flagged for review: elevated risk ({})",
                                  category_list(assessment.categories)));
    }
    if (rewritten) {
        decision.suggested_query = std::move(rewritten);
        return finish(Verdict::kRewriteSuggested, std::move(rewrite_message));
    }

    // 6. ALLOW
    return finish(Verdict::kAllow, "Query allowed");
}
