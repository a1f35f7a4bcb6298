// ---------------------------------------------------------------------------
// audit_record.cpp
// ---------------------------------------------------------------------------

#include "audit/audit_record.hpp"

#include <sstream>

#include <fmt/format.h>

#include "common/json_util.hpp"

namespace {

constexpr std::uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr std::uint64_t kFnvPrime       = 0x100000001b3ULL;

}  // namespace

std::string_view to_string(AlertType type) noexcept {
    switch (type) {
        case AlertType::kHighBlockRate: return "high_block_rate";
        case AlertType::kHighRiskRate:  return "high_risk_rate";
    }
    return "unknown";
}

std::string query_hash(std::string_view query) {
    std::uint64_t hash = kFnvOffsetBasis;
    for (const unsigned char ch : query) {
        hash ^= ch;
        hash *= kFnvPrime;
    }
    return fmt::format("{:016x}", hash);
}

std::string sanitize_preview(std::string_view query, std::size_t max_length) {
    const bool truncated = query.size() > max_length;
    std::string preview(query.substr(0, max_length));
    for (auto& ch : preview) {
        const auto byte = static_cast<unsigned char>(ch);
        if (byte < 0x20 || byte == 0x7F) {
            ch = ' ';
        }
    }
    if (truncated) {
        preview += "...";
    }
    return preview;
}

AuditRecord make_audit_record(std::string_view          query,
                              const Decision&           decision,
                              const RiskAssessment&     assessment,
                              std::chrono::microseconds evaluation_time,
                              bool                      bypassed,
                              std::size_t               preview_length,
                              std::string_view          rules_version) {
    AuditRecord record;
    record.timestamp       = std::chrono::system_clock::now();
    record.query_hash      = query_hash(query);
    record.query_preview   = sanitize_preview(query, preview_length);
    record.query_length    = query.size();
    record.verdict         = decision.verdict;
    record.reasons         = decision.reasons;
    record.categories      = decision.categories;
    record.risk_score      = decision.risk_score;
    record.tier            = decision.tier;
    record.statement_type  = decision.statement_type;
    record.evaluation_time = evaluation_time;
    record.bypassed        = bypassed;
    record.rules_version   = std::string(rules_version);

    record.rule_ids.reserve(assessment.matches.size());
    for (const auto& match : assessment.matches) {
        record.rule_ids.push_back(match.rule_id);
    }
    return record;
}

std::string to_json(const AuditRecord& record) {
    std::ostringstream json;
    json << R"({"event":"audit","timestamp":")" << format_iso8601(record.timestamp)
         << R"(","query_hash":")" << record.query_hash
         << R"(","query_preview":")" << escape_json_string(record.query_preview)
         << R"(","query_length":)" << record.query_length
         << R"(,"verdict":")" << to_string(record.verdict) << R"(","reasons":)";
    write_string_array(json, record.reasons, [](ReasonCode r) { return to_string(r); });
    json << R"(,"categories":)";
    write_string_array(json, record.categories, [](AttackCategory c) { return to_string(c); });
    json << R"(,"rule_ids":)";
    write_string_array(json, record.rule_ids, [](const std::string& id) { return std::string_view(id); });
    json << R"(,"risk_score":)" << record.risk_score
         << R"(,"risk_tier":")" << to_string(record.tier)
         << R"(","statement_type":")" << to_string(record.statement_type)
         << R"(","evaluation_us":)" << record.evaluation_time.count()
         << R"(,"bypassed":)" << (record.bypassed ? "true" : "false")
         << R"(,"rules_version":")" << escape_json_string(record.rules_version) << R"("})";
    return json.str();
}

std::string to_json(const SecurityAlert& alert) {
    std::ostringstream json;
    json << R"({"event":"security_alert","type":")" << to_string(alert.type)
         << R"(","timestamp":")" << format_iso8601(alert.timestamp)
         << R"(","count":)" << alert.count
         << R"(,"threshold":)" << alert.threshold
         << R"(,"window_seconds":)" << alert.window.count()
         << R"(,"message":")" << escape_json_string(alert.message) << R"("})";
    return json.str();
}
