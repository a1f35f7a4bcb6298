// ---------------------------------------------------------------------------
// types.cpp
//
// 공용 열거형의 문자열 변환 구현.
// 카테고리 이름은 규칙 파일/설정 파일/감사 로그가 모두 같은 이름을 쓰도록
// 이 파일 한 곳에서만 정의한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace {

constexpr std::array<std::pair<std::string_view, StatementType>, 21> kStatementNames = {{
    {"SELECT",   StatementType::kSelect},
    {"INSERT",   StatementType::kInsert},
    {"UPDATE",   StatementType::kUpdate},
    {"DELETE",   StatementType::kDelete},
    {"REPLACE",  StatementType::kReplace},
    {"MERGE",    StatementType::kMerge},
    {"DROP",     StatementType::kDrop},
    {"TRUNCATE", StatementType::kTruncate},
    {"ALTER",    StatementType::kAlter},
    {"CREATE",   StatementType::kCreate},
    {"RENAME",   StatementType::kRename},
    {"GRANT",    StatementType::kGrant},
    {"REVOKE",   StatementType::kRevoke},
    {"CALL",     StatementType::kCall},
    {"PREPARE",  StatementType::kPrepare},
    {"EXECUTE",  StatementType::kExecute},
    {"SHOW",     StatementType::kShow},
    {"DESCRIBE", StatementType::kDescribe},
    {"EXPLAIN",  StatementType::kExplain},
    {"SET",      StatementType::kSet},
    {"USE",      StatementType::kUse},
}};

constexpr std::array<std::pair<std::string_view, AttackCategory>, kAttackCategoryCount> kCategoryNames = {{
    {"tautology",              AttackCategory::kTautology},
    {"union-based",            AttackCategory::kUnionBased},
    {"boolean-blind",          AttackCategory::kBooleanBlind},
    {"time-based",             AttackCategory::kTimeBased},
    {"error-based",            AttackCategory::kErrorBased},
    {"nosql",                  AttackCategory::kNoSql},
    {"code-execution",         AttackCategory::kCodeExecution},
    {"information-disclosure", AttackCategory::kInformationDisclosure},
    {"file-access",            AttackCategory::kFileAccess},
    {"obfuscation",            AttackCategory::kObfuscation},
    {"other",                  AttackCategory::kOther},
}};

}  // namespace

std::string_view to_string(StatementType type) noexcept {
    for (const auto& [name, value] : kStatementNames) {
        if (value == type) {
            return name;
        }
    }
    return "UNKNOWN";
}

std::string_view to_string(AttackCategory category) noexcept {
    for (const auto& [name, value] : kCategoryNames) {
        if (value == category) {
            return name;
        }
    }
    return "other";
}

std::string_view to_string(RiskTier tier) noexcept {
    switch (tier) {
        case RiskTier::kNone:     return "none";
        case RiskTier::kLow:      return "low";
        case RiskTier::kMedium:   return "medium";
        case RiskTier::kHigh:     return "high";
        case RiskTier::kCritical: return "critical";
        default:                  return "none";
    }
}

std::string_view to_string(Verdict verdict) noexcept {
    switch (verdict) {
        case Verdict::kAllow:            return "ALLOW";
        case Verdict::kReject:           return "REJECT";
        case Verdict::kRewriteSuggested: return "REWRITE_SUGGESTED";
        default:                         return "REJECT";
    }
}

std::string_view to_string(ReasonCode reason) noexcept {
    switch (reason) {
        case ReasonCode::kStatementTypeNotAllowed: return "statement_type_not_allowed";
        case ReasonCode::kBlockedKeyword:          return "blocked_keyword";
        case ReasonCode::kQueryTooLong:            return "query_too_long";
        case ReasonCode::kLimitAdded:              return "limit_added";
        case ReasonCode::kLimitClamped:            return "limit_clamped";
        case ReasonCode::kHighRiskPattern:         return "high_risk_pattern";
        case ReasonCode::kElevatedRiskWarning:     return "elevated_risk_warning";
        case ReasonCode::kValidationDisabled:      return "validation_disabled";
        case ReasonCode::kAnalysisDegraded:        return "analysis_degraded";
        default:                                   return "unknown";
    }
}

std::string_view to_string(ConfigErrorCode code) noexcept {
    switch (code) {
        case ConfigErrorCode::kFileNotFound: return "file_not_found";
        case ConfigErrorCode::kParseError:   return "parse_error";
        case ConfigErrorCode::kInvalidValue: return "invalid_value";
        case ConfigErrorCode::kInvalidRule:  return "invalid_rule";
        default:                             return "invalid_value";
    }
}

std::optional<StatementType> statement_type_from_string(std::string_view name) {
    for (const auto& [known, value] : kStatementNames) {
        if (iequals(known, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<AttackCategory> category_from_string(std::string_view name) {
    for (const auto& [known, value] : kCategoryNames) {
        if (iequals(known, name)) {
            return value;
        }
    }
    // "union_based" 처럼 밑줄 표기도 허용
    std::string dashed(name);
    std::replace(dashed.begin(), dashed.end(), '_', '-');
    if (dashed != name) {
        return category_from_string(dashed);
    }
    return std::nullopt;
}

std::string to_upper_ascii(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}
