// ---------------------------------------------------------------------------
// decision.cpp
// ---------------------------------------------------------------------------

#include "policy/decision.hpp"

#include <algorithm>
#include <sstream>

#include "common/json_util.hpp"

bool Decision::has_reason(ReasonCode reason) const {
    return std::find(reasons.begin(), reasons.end(), reason) != reasons.end();
}

std::string to_json(const Decision& decision) {
    std::ostringstream json;
    json << R"({"verdict":")" << to_string(decision.verdict) << R"(","reasons":)";
    write_string_array(json, decision.reasons, [](ReasonCode r) { return to_string(r); });

    json << R"(,"suggested_query":)";
    if (decision.suggested_query) {
        json << '"' << escape_json_string(*decision.suggested_query) << '"';
    } else {
        json << "null";
    }

    json << R"(,"categories":)";
    write_string_array(json, decision.categories, [](AttackCategory c) { return to_string(c); });

    json << R"(,"risk_score":)" << decision.risk_score
         << R"(,"risk_tier":")" << to_string(decision.tier)
         << R"(","statement_type":")" << to_string(decision.statement_type) << R"(","warnings":)";
    write_string_array(json, decision.warnings, [](const std::string& w) { return std::string_view(w); });

    json << R"(,"message":")" << escape_json_string(decision.message) << R"("})";
    return json.str();
}
