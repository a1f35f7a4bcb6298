// ---------------------------------------------------------------------------
// pattern_library.cpp
//
// 내장 규칙 집합, YAML 규칙 파일 로드, 규칙 발화 판정 구현.
//
// [내장 규칙 구성]
// - 구조적 신호(tautology, 따옴표 탈출, 다중 구문, 주석 분할, 분석 불완전)는
//   StructuralMatcher 로 표현한다. 주석을 제거한 토큰 위에서 판정하므로
//   SLEEP/**/(5) 같은 우회에도 함수 호출 규칙이 발화한다.
// - 나머지는 대소문자 무관 정규식. 무제한 .* 는 쓰지 않는다
//   (std::regex 백트래킹 비용이 입력 길이의 제곱으로 커짐).
//
// [오탐/미탐 트레이드오프]
// - union-present, obfuscation-comment 는 합법 쿼리에서도 발화하지만
//   severity 를 낮게 두어 단독으로는 low/medium 에 머문다.
// - 실행/파일 접근 계열은 단독 발화만으로 critical(90) 이 되도록 둔다.
// ---------------------------------------------------------------------------

#include "rules/pattern_library.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

constexpr std::uint32_t kMinSeverity = 1;
constexpr std::uint32_t kMaxSeverity = 100;

constexpr std::array<std::pair<std::string_view, StructuralCheck>, 15> kCheckNames = {{
    {"tautology",           StructuralCheck::kTautology},
    {"constant_false",      StructuralCheck::kConstantFalse},
    {"multi_statement",     StructuralCheck::kMultiStatement},
    {"union_count",         StructuralCheck::kUnionCount},
    {"comment_present",     StructuralCheck::kCommentPresent},
    {"comment_splits_word", StructuralCheck::kCommentSplitsWord},
    {"versioned_comment",   StructuralCheck::kVersionedComment},
    {"string_concat",       StructuralCheck::kStringConcat},
    {"nested_subqueries",   StructuralCheck::kNestedSubqueries},
    {"join_count",          StructuralCheck::kJoinCount},
    {"function_call",       StructuralCheck::kFunctionCall},
    {"degraded",            StructuralCheck::kDegraded},
    {"hex_literal",         StructuralCheck::kHexLiteral},
    {"quote_break_logic",   StructuralCheck::kQuoteBreakLogic},
    {"quote_break_union",   StructuralCheck::kQuoteBreakUnion},
}};

ConfigError rule_error(std::string message, std::string context) {
    return ConfigError{ConfigErrorCode::kInvalidRule, std::move(message), std::move(context)};
}

// 내장 정규식 규칙 정의 (id, category, severity, description, pattern)
struct PatternSpec {
    std::string_view id;
    AttackCategory   category;
    std::uint32_t    severity;
    std::string_view description;
    std::string_view pattern;
};

constexpr std::array<PatternSpec, 24> kBuiltinPatterns = {{
    // tautology
    {"tautology-classic", AttackCategory::kTautology, 30, "Classic OR/AND tautology",
     R"(\b(?:OR|AND)\s+(?:'1'\s*=\s*'1'|1\s*=\s*1|'a'\s*=\s*'a'))"},

    // union-based
    {"union-column-enum", AttackCategory::kUnionBased, 40, "UNION SELECT with NULL/number column enumeration",
     R"(\bUNION\s+(?:ALL\s+)?SELECT\s+(?:NULL|\d+)\s*(?:,|\bFROM\b|--|#|/\*|;|$))"},
    {"union-comment-tail", AttackCategory::kUnionBased, 45, "UNION SELECT followed by a comment",
     R"(\bUNION\s+(?:ALL\s+)?SELECT[^;]*(?:--|#|/\*))"},
    {"union-concat-exfil", AttackCategory::kUnionBased, 40, "UNION SELECT of concatenated columns",
     R"(\bUNION\s+(?:ALL\s+)?SELECT\s+(?:CONCAT|GROUP_CONCAT)\s*\()"},

    // boolean-blind
    {"blind-numeric-compare", AttackCategory::kBooleanBlind, 20, "Boolean test on numeric comparison",
     R"(\b(?:AND|OR)\s+\d+\s*[<>=!]+\s*\d+)"},
    {"blind-char-extract", AttackCategory::kBooleanBlind, 35, "Character extraction",
     R"(\b(?:AND|OR)\s+\(?\s*(?:ASCII|ORD|CHAR|SUBSTRING|SUBSTR|MID)\s*\()"},
    {"blind-length-test", AttackCategory::kBooleanBlind, 35, "Length test",
     R"(\b(?:AND|OR)\s+\(?\s*(?:LENGTH|LEN|CHAR_LENGTH)\s*\()"},

    // time-based
    {"time-waitfor", AttackCategory::kTimeBased, 60, "WAITFOR DELAY/TIME",
     R"(\bWAITFOR\s+(?:DELAY|TIME)\s+')"},
    {"time-conditional", AttackCategory::kTimeBased, 30, "Conditional delay",
     R"(\bIF\s*\([^)]*,\s*(?:SLEEP|BENCHMARK|PG_SLEEP|WAITFOR)\b)"},

    // error-based
    {"error-math-functions", AttackCategory::kErrorBased, 30, "Math function error trigger",
     R"(\b(?:AND|OR)\s+(?:EXP|FLOOR|RAND)\s*\([^)]*\))"},
    {"error-cast", AttackCategory::kErrorBased, 10, "Type cast error trigger",
     R"(\bCAST\s*\([^)]*\bAS\s+(?:INT|INTEGER|DECIMAL)\s*\))"},

    // nosql
    {"nosql-operator", AttackCategory::kNoSql, 40, "MongoDB query operator",
     R"(\$(?:ne|gt|lt|gte|lte|in|nin|regex|where)\b)"},
    {"nosql-javascript", AttackCategory::kNoSql, 40, "JavaScript in query",
     R"((?:\bthis\.|\bfunction\s*\())"},

    // code-execution
    {"exec-dynamic", AttackCategory::kCodeExecution, 90, "Dynamic code execution",
     R"(\b(?:EXEC|EXECUTE|EVAL)\s*\()"},
    {"exec-system-procedure", AttackCategory::kCodeExecution, 90, "Extended or system stored procedure",
     R"(\b(?:xp_\w+|sp_(?:executesql|oacreate|oamethod|configure|makewebtask|addextendedproc|password|adduser|addlogin)\b))"},
    {"exec-external-data", AttackCategory::kCodeExecution, 90, "External data source access",
     R"(\b(?:OPENROWSET|OPENDATASOURCE|OPENXML|BULK\s+INSERT)\b)"},

    // file-access
    {"file-read-write", AttackCategory::kFileAccess, 90, "File system read or write",
     R"(\b(?:LOAD_FILE\s*\(|INTO\s+(?:OUTFILE|DUMPFILE)\b|LOAD\s+DATA\b))"},
    {"file-privilege", AttackCategory::kFileAccess, 40, "File privilege lookup",
     R"(\bFILE_PRIV(?:ILEGES)?\b)"},

    // information-disclosure
    {"info-system-variable", AttackCategory::kInformationDisclosure, 20, "System variable access",
     R"((?:@@|\bGLOBAL\.|\bSESSION\.)\w+)"},
    {"info-user-function", AttackCategory::kInformationDisclosure, 10, "Current user lookup",
     R"(\b(?:USER|CURRENT_USER|SESSION_USER|SYSTEM_USER)\s*\(\s*\))"},
    {"info-database-function", AttackCategory::kInformationDisclosure, 10, "Server or database lookup",
     R"(\b(?:DATABASE|SCHEMA|VERSION|CONNECTION_ID)\s*\(\s*\))"},
    {"info-catalog-access", AttackCategory::kInformationDisclosure, 25, "System catalog access",
     R"(\b(?:INFORMATION_SCHEMA|PG_CATALOG|MYSQL\.USER|SYS\.(?:TABLES|OBJECTS|COLUMNS)|SQLITE_MASTER)\b)"},

    // obfuscation
    {"obfuscation-char-code", AttackCategory::kObfuscation, 15, "Character code encoding",
     R"(\b(?:CHAR|CHR)\s*\(\s*\d+)"},
    {"obfuscation-charset-convert", AttackCategory::kObfuscation, 5, "Character set conversion",
     R"(\b(?:CONVERT|CAST)\s*\([^)]*\bUSING\s+\w+)"},
}};

// 정규식으로 표현하지 않는 내장 규칙
std::vector<Rule> builtin_structural_rules() {
    std::vector<Rule> rules;
    rules.push_back(make_structural_rule("tautology-constant-true", AttackCategory::kTautology, 70,
        "Constant-true condition", {StructuralCheck::kTautology, 1, {}}));
    rules.push_back(make_structural_rule("tautology-quote-break", AttackCategory::kTautology, 40,
        "String literal broken out before OR/AND", {StructuralCheck::kQuoteBreakLogic, 1, {}}));
    rules.push_back(make_structural_rule("union-quote-break", AttackCategory::kUnionBased, 50,
        "String literal broken out before UNION", {StructuralCheck::kQuoteBreakUnion, 1, {}}));
    rules.push_back(make_structural_rule("union-present", AttackCategory::kUnionBased, 25,
        "UNION operator", {StructuralCheck::kUnionCount, 1, {}}));
    rules.push_back(make_structural_rule("blind-constant-false", AttackCategory::kBooleanBlind, 20,
        "Constant-false condition", {StructuralCheck::kConstantFalse, 1, {}}));
    rules.push_back(make_structural_rule("time-delay-function", AttackCategory::kTimeBased, 60,
        "Delay function call", {StructuralCheck::kFunctionCall, 1, {"SLEEP", "BENCHMARK", "PG_SLEEP"}}));
    rules.push_back(make_structural_rule("error-xml-functions", AttackCategory::kErrorBased, 50,
        "XML function error trigger", {StructuralCheck::kFunctionCall, 1, {"EXTRACTVALUE", "UPDATEXML"}}));
    rules.push_back(make_structural_rule("exec-stacked-statement", AttackCategory::kCodeExecution, 90,
        "Multiple statements", {StructuralCheck::kMultiStatement, 1, {}}));
    rules.push_back(make_structural_rule("obfuscation-comment", AttackCategory::kObfuscation, 15,
        "Comment in query", {StructuralCheck::kCommentPresent, 1, {}}));
    rules.push_back(make_structural_rule("obfuscation-versioned-comment", AttackCategory::kObfuscation, 40,
        "Executable versioned comment", {StructuralCheck::kVersionedComment, 1, {}}));
    rules.push_back(make_structural_rule("obfuscation-split-keyword", AttackCategory::kObfuscation, 50,
        "Comment splitting a word", {StructuralCheck::kCommentSplitsWord, 1, {}}));
    rules.push_back(make_structural_rule("obfuscation-hex-literal", AttackCategory::kObfuscation, 15,
        "Hexadecimal literal", {StructuralCheck::kHexLiteral, 1, {}}));
    rules.push_back(make_structural_rule("obfuscation-hex-function", AttackCategory::kObfuscation, 15,
        "Hex encoding function", {StructuralCheck::kFunctionCall, 1, {"UNHEX", "HEX"}}));
    rules.push_back(make_structural_rule("obfuscation-string-concat", AttackCategory::kObfuscation, 15,
        "String literal concatenation", {StructuralCheck::kStringConcat, 1, {}}));
    rules.push_back(make_structural_rule("other-analysis-degraded", AttackCategory::kOther, 30,
        "Query could not be fully analyzed", {StructuralCheck::kDegraded, 1, {}}));
    rules.push_back(make_structural_rule("other-nested-subqueries", AttackCategory::kOther, 10,
        "Deeply nested subqueries", {StructuralCheck::kNestedSubqueries, 3, {}}));
    rules.push_back(make_structural_rule("other-join-count", AttackCategory::kOther, 5,
        "Many joins", {StructuralCheck::kJoinCount, 5, {}}));
    return rules;
}

bool structural_fires(const StructuralMatcher& m, const StructuralFacts& facts) {
    switch (m.check) {
        case StructuralCheck::kTautology:         return facts.tautology;
        case StructuralCheck::kConstantFalse:     return facts.constant_false;
        case StructuralCheck::kMultiStatement:    return facts.multi_statement();
        case StructuralCheck::kUnionCount:        return facts.union_count >= m.threshold;
        case StructuralCheck::kCommentPresent:    return facts.has_comment;
        case StructuralCheck::kCommentSplitsWord: return facts.comment_splits_word;
        case StructuralCheck::kVersionedComment:  return facts.versioned_comment;
        case StructuralCheck::kStringConcat:      return facts.suspicious_concat_count >= m.threshold;
        case StructuralCheck::kNestedSubqueries:  return facts.subquery_count > m.threshold;
        case StructuralCheck::kJoinCount:         return facts.join_count > m.threshold;
        case StructuralCheck::kDegraded:          return facts.degraded;
        case StructuralCheck::kHexLiteral:        return facts.has_hex_literal;
        case StructuralCheck::kQuoteBreakLogic:   return facts.quote_break_before_logic;
        case StructuralCheck::kQuoteBreakUnion:   return facts.quote_break_before_union;
        case StructuralCheck::kFunctionCall:
            return std::any_of(m.functions.begin(), m.functions.end(),
                               [&facts](const std::string& f) { return facts.calls_function(f); });
        default:
            return false;
    }
}

// -- YAML --------------------------------------------------------------------

std::expected<std::uint32_t, ConfigError>
read_severity(const YAML::Node& node, const std::string& context) {
    if (!node || !node.IsScalar()) {
        return std::unexpected(rule_error("rule has no severity", context));
    }
    std::int64_t value = 0;
    try {
        value = node.as<std::int64_t>();
    } catch (const YAML::Exception&) {
        return std::unexpected(rule_error(
            fmt::format("severity '{}' is not an integer", node.Scalar()), context));
    }
    if (value < kMinSeverity || value > kMaxSeverity) {
        return std::unexpected(rule_error(
            fmt::format("severity {} outside {}..{}", value, kMinSeverity, kMaxSeverity), context));
    }
    return static_cast<std::uint32_t>(value);
}

std::expected<StructuralMatcher, ConfigError>
parse_structural(const YAML::Node& node, const std::string& context) {
    if (!node.IsMap()) {
        return std::unexpected(rule_error("structural matcher must be a map", context));
    }
    const auto check = structural_check_from_string(node["check"] ? node["check"].as<std::string>() : "");
    if (!check) {
        return std::unexpected(rule_error("unknown structural check", context));
    }

    StructuralMatcher matcher;
    matcher.check = *check;
    if (const auto threshold = node["threshold"]) {
        try {
            matcher.threshold = threshold.as<std::uint32_t>();
        } catch (const YAML::Exception&) {
            return std::unexpected(rule_error("threshold must be a non-negative integer", context));
        }
    }
    if (const auto functions = node["functions"]) {
        if (!functions.IsSequence()) {
            return std::unexpected(rule_error("functions must be a list", context));
        }
        for (const auto& f : functions) {
            matcher.functions.push_back(to_upper_ascii(f.as<std::string>()));
        }
    }
    if (matcher.check == StructuralCheck::kFunctionCall && matcher.functions.empty()) {
        return std::unexpected(rule_error("function_call check needs at least one function", context));
    }
    return matcher;
}

std::expected<Rule, ConfigError> parse_rule(const YAML::Node& node, std::size_t index,
                                            std::string_view source) {
    std::string context = fmt::format("{}: rules[{}]", source, index);
    if (!node.IsMap()) {
        return std::unexpected(rule_error("rule must be a map", context));
    }

    const std::string id = node["id"] ? node["id"].as<std::string>() : "";
    if (id.empty()) {
        return std::unexpected(rule_error("rule has no id", context));
    }
    context = fmt::format("{}: {}", source, id);

    const std::string category_name = node["category"] ? node["category"].as<std::string>() : "";
    AttackCategory category = AttackCategory::kOther;
    if (const auto parsed = category_from_string(category_name)) {
        category = *parsed;
    } else {
        spdlog::warn("pattern_library: rule '{}' has unknown category '{}', using 'other'",
                     id, category_name);
    }

    const auto severity = read_severity(node["severity"], context);
    if (!severity) {
        return std::unexpected(severity.error());
    }
    std::string description = node["description"] ? node["description"].as<std::string>() : "";

    const bool has_pattern    = static_cast<bool>(node["pattern"]);
    const bool has_structural = static_cast<bool>(node["structural"]);
    if (has_pattern == has_structural) {
        return std::unexpected(rule_error("rule needs exactly one of 'pattern' or 'structural'", context));
    }

    if (has_pattern) {
        return make_pattern_rule(id, category, *severity, std::move(description),
                                 node["pattern"].as<std::string>());
    }
    auto matcher = parse_structural(node["structural"], context);
    if (!matcher) {
        return std::unexpected(matcher.error());
    }
    return make_structural_rule(id, category, *severity, std::move(description), std::move(*matcher));
}

}  // namespace

// ---------------------------------------------------------------------------
// StructuralCheck 문자열 변환
// ---------------------------------------------------------------------------
std::string_view to_string(StructuralCheck check) noexcept {
    for (const auto& [name, value] : kCheckNames) {
        if (value == check) {
            return name;
        }
    }
    return "unknown";
}

std::optional<StructuralCheck> structural_check_from_string(std::string_view name) {
    for (const auto& [known, value] : kCheckNames) {
        if (iequals(known, name)) {
            return value;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// 규칙 생성 / 판정
// ---------------------------------------------------------------------------
std::expected<Rule, ConfigError>
make_pattern_rule(std::string id, AttackCategory category, std::uint32_t severity,
                  std::string description, const std::string& pattern) {
    std::shared_ptr<const std::regex> compiled;
    try {
        compiled = std::make_shared<const std::regex>(
            pattern, std::regex_constants::icase | std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        return std::unexpected(rule_error(fmt::format("invalid pattern: {}", e.what()), id));
    }
    return Rule{std::move(id), category, severity, std::move(description),
                PatternMatcher{pattern, std::move(compiled)}};
}

Rule make_structural_rule(std::string id, AttackCategory category, std::uint32_t severity,
                          std::string description, StructuralMatcher matcher) {
    return Rule{std::move(id), category, severity, std::move(description), std::move(matcher)};
}

bool match_rule(const Rule& rule, std::string_view text, const StructuralFacts& facts) {
    if (const auto* structural = std::get_if<StructuralMatcher>(&rule.matcher)) {
        return structural_fires(*structural, facts);
    }

    const auto& pattern = std::get<PatternMatcher>(rule.matcher);
    if (!pattern.compiled) {
        return false;
    }
    try {
        return std::regex_search(text.data(), text.data() + text.size(), *pattern.compiled);
    } catch (const std::regex_error& e) {
        spdlog::warn("pattern_library: rule '{}' could not be evaluated, counting as fired: {}",
                     rule.id, e.what());
        return true;
    }
}

// ---------------------------------------------------------------------------
// PatternLibrary
// ---------------------------------------------------------------------------
PatternLibrary::PatternLibrary(std::string version, std::vector<Rule> rules)
    : version_(std::move(version))
    , rules_(std::move(rules))
{}

std::expected<PatternLibrary, ConfigError>
PatternLibrary::from_rules(std::string version, std::vector<Rule> rules) {
    std::unordered_set<std::string> ids;
    for (const auto& rule : rules) {
        if (rule.id.empty()) {
            return std::unexpected(rule_error("rule has no id", version));
        }
        if (!ids.insert(rule.id).second) {
            return std::unexpected(rule_error("duplicate rule id", rule.id));
        }
        if (rule.severity < kMinSeverity || rule.severity > kMaxSeverity) {
            return std::unexpected(rule_error(
                fmt::format("severity {} outside {}..{}", rule.severity, kMinSeverity, kMaxSeverity),
                rule.id));
        }
        if (const auto* p = std::get_if<PatternMatcher>(&rule.matcher); p != nullptr && !p->compiled) {
            return std::unexpected(rule_error("pattern is not compiled", rule.id));
        }
    }
    return PatternLibrary(std::move(version), std::move(rules));
}

std::expected<PatternLibrary, ConfigError> PatternLibrary::builtin() {
    std::vector<Rule> rules;
    rules.reserve(kBuiltinPatterns.size() + 17);

    for (const auto& spec : kBuiltinPatterns) {
        auto rule = make_pattern_rule(std::string(spec.id), spec.category, spec.severity,
                                      std::string(spec.description), std::string(spec.pattern));
        if (!rule) {
            return std::unexpected(rule.error());
        }
        rules.push_back(std::move(*rule));
    }
    for (auto& rule : builtin_structural_rules()) {
        rules.push_back(std::move(rule));
    }
    return from_rules("builtin-1", std::move(rules));
}

std::expected<PatternLibrary, ConfigError>
PatternLibrary::from_yaml(std::string_view text, std::string_view context) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::ParserException& e) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kParseError,
            fmt::format("YAML parse error at line {}, col {}: {}", e.mark.line + 1, e.mark.column + 1, e.msg),
            std::string(context)});
    } catch (const YAML::Exception& e) {
        return std::unexpected(ConfigError{ConfigErrorCode::kParseError, e.what(), std::string(context)});
    }

    if (!root || !root.IsMap()) {
        return std::unexpected(rule_error("rules document must be a map", std::string(context)));
    }

    try {
        const std::string version = root["version"] ? root["version"].as<std::string>() : "custom";
        const YAML::Node  list    = root["rules"];
        if (!list || !list.IsSequence()) {
            return std::unexpected(rule_error("'rules' must be a list", std::string(context)));
        }

        std::vector<Rule> rules;
        rules.reserve(list.size());
        for (std::size_t i = 0; i < list.size(); ++i) {
            auto rule = parse_rule(list[i], i, context);
            if (!rule) {
                return std::unexpected(rule.error());
            }
            rules.push_back(std::move(*rule));
        }
        return from_rules(version, std::move(rules));
    } catch (const YAML::Exception& e) {
        // 스칼라가 아닌 id/pattern 등 타입 불일치
        return std::unexpected(rule_error(e.what(), std::string(context)));
    }
}

std::expected<PatternLibrary, ConfigError> PatternLibrary::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(ConfigError{ConfigErrorCode::kFileNotFound,
                                           "cannot open rules file", path.string()});
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    auto library = from_yaml(buffer.str(), path.string());
    if (library) {
        spdlog::info("pattern_library: loaded {} rules (version {}) from '{}'",
                     library->size(), library->version(), path.string());
    }
    return library;
}

std::expected<PatternLibrary, ConfigError> PatternLibrary::with_rule(Rule rule) const {
    std::vector<Rule> rules = rules_;
    rules.push_back(std::move(rule));
    return from_rules(version_, std::move(rules));
}

std::expected<PatternLibrary, ConfigError>
PatternLibrary::merged_with(const PatternLibrary& other) const {
    std::vector<Rule> rules = rules_;
    rules.insert(rules.end(), other.rules_.begin(), other.rules_.end());
    return from_rules(version_ + "+" + other.version_, std::move(rules));
}
