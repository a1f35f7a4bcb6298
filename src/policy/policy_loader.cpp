// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 설정 파일 + 환경변수를 GateConfig 로 변환한다.
//
// [설계 원칙]
// - All-or-nothing: 섹션 하나라도 실패하면 전체 실패.
// - 키가 없으면 구조체 기본값을 유지한다. 키가 있는데 값이 잘못되었으면
//   kInvalidValue 를 반환한다 (기본값으로 조용히 대체하지 않음).
// - YAML 파일 전체를 로그에 출력하지 않는다 (민감 정보 보호).
// - 알 수 없는 최상위 섹션은 경고만 출력한다 (오타 조기 발견용).
//
// [환경변수]
// - 목록 값(ALLOWED_QUERY_TYPES, BLOCKED_KEYWORDS)은 쉼표 구분, 앞뒤 공백 무시.
//   BLOCKED_KEYWORDS="" 는 "차단 키워드 없음" 으로 해석한다.
// - bool 값: true/false/1/0/yes/no/on/off (대소문자 무관).
// - MAX_LIMIT_VALUE 가 default_limit 보다 작으면 default_limit 을 함께 낮춘다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "logger/log_types.hpp"

namespace {

using Status = std::expected<void, ConfigError>;

constexpr std::array<std::string_view, 8> kKnownSections = {
    "gate", "policy", "categories", "classifier", "rules", "audit", "logging", "version"};

ConfigError invalid_value(std::string message, std::string context) {
    return ConfigError{ConfigErrorCode::kInvalidValue, std::move(message), std::move(context)};
}

std::string key_path(std::string_view section, std::string_view key) {
    return fmt::format("{}.{}", section, key);
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\n' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    return s;
}

// ---------------------------------------------------------------------------
// YAML 헬퍼
//   키가 없거나 null 이면 out 을 건드리지 않는다.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] Status read_scalar(const YAML::Node& map, std::string_view section, const char* key, T& out) {
    const YAML::Node node = map[key];
    if (!node || node.IsNull()) {
        return {};
    }
    if (!node.IsScalar()) {
        return std::unexpected(invalid_value("expected a scalar value", key_path(section, key)));
    }
    try {
        out = node.as<T>();
    } catch (const YAML::Exception&) {
        return std::unexpected(
            invalid_value(fmt::format("invalid value '{}'", node.Scalar()), key_path(section, key)));
    }
    return {};
}

[[nodiscard]] Status read_string_list(const YAML::Node& map, std::string_view section, const char* key,
                                      std::vector<std::string>& out) {
    const YAML::Node node = map[key];
    if (!node || node.IsNull()) {
        return {};
    }
    if (!node.IsSequence()) {
        return std::unexpected(invalid_value("expected a list", key_path(section, key)));
    }
    std::vector<std::string> result;
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return std::unexpected(invalid_value("list items must be scalars", key_path(section, key)));
        }
        result.push_back(item.as<std::string>());
    }
    out = std::move(result);
    return {};
}

[[nodiscard]] Status read_section_map(const YAML::Node& root, const char* name, YAML::Node& out) {
    const YAML::Node node = root[name];
    if (!node || node.IsNull()) {
        out = YAML::Node(YAML::NodeType::Undefined);
        return {};
    }
    if (!node.IsMap()) {
        return std::unexpected(invalid_value("section must be a map", name));
    }
    out = node;
    return {};
}

// 대문자 정규화 + 빈 항목 검사
[[nodiscard]] Status normalize_names(std::vector<std::string>& names, std::string_view context) {
    for (auto& name : names) {
        const auto trimmed = trim(name);
        if (trimmed.empty()) {
            return std::unexpected(invalid_value("empty name in list", std::string(context)));
        }
        name = to_upper_ascii(trimmed);
    }
    return {};
}

[[nodiscard]] Status to_statement_types(const std::vector<std::string>& names, std::string_view context,
                                        std::vector<StatementType>& out) {
    std::vector<StatementType> types;
    types.reserve(names.size());
    for (const auto& name : names) {
        const auto type = statement_type_from_string(trim(name));
        if (!type || *type == StatementType::kUnknown) {
            return std::unexpected(
                invalid_value(fmt::format("unknown statement type '{}'", name), std::string(context)));
        }
        types.push_back(*type);
    }
    out = std::move(types);
    return {};
}

// ---------------------------------------------------------------------------
// 섹션 파서
// ---------------------------------------------------------------------------
[[nodiscard]] Status parse_gate(const YAML::Node& node, GateConfig& cfg) {
    if (!node) {
        return {};
    }
    return read_scalar(node, "gate", "enabled", cfg.policy.enabled);
}

[[nodiscard]] Status parse_policy(const YAML::Node& node, PolicyConfig& policy) {
    if (!node) {
        return {};
    }

    std::vector<std::string> type_names;
    if (auto r = read_string_list(node, "policy", "allowed_types", type_names); !r) {
        return r;
    }
    if (node["allowed_types"] && node["allowed_types"].IsSequence()) {
        if (auto r = to_statement_types(type_names, "policy.allowed_types", policy.allowed_types); !r) {
            return r;
        }
    }

    if (auto r = read_scalar(node, "policy", "max_length", policy.max_length); !r) return r;
    if (auto r = read_scalar(node, "policy", "max_limit_value", policy.max_limit_value); !r) return r;
    if (auto r = read_scalar(node, "policy", "default_limit", policy.default_limit); !r) return r;
    if (auto r = read_scalar(node, "policy", "require_limit", policy.require_limit); !r) return r;
    if (auto r = read_scalar(node, "policy", "reject_severity", policy.reject_severity); !r) return r;
    if (auto r = read_scalar(node, "policy", "max_joins", policy.max_joins); !r) return r;
    if (auto r = read_scalar(node, "policy", "max_subqueries", policy.max_subqueries); !r) return r;

    if (auto r = read_string_list(node, "policy", "blocked_keywords", policy.blocked_keywords); !r) return r;
    if (auto r = normalize_names(policy.blocked_keywords, "policy.blocked_keywords"); !r) return r;
    if (auto r = read_string_list(node, "policy", "blocked_functions", policy.blocked_functions); !r) return r;
    if (auto r = normalize_names(policy.blocked_functions, "policy.blocked_functions"); !r) return r;

    std::string tier_action;
    if (auto r = read_scalar(node, "policy", "high_tier_action", tier_action); !r) {
        return r;
    }
    if (!tier_action.empty()) {
        if (iequals(tier_action, "reject")) {
            policy.high_tier_action = TierAction::kReject;
        } else if (iequals(tier_action, "warn")) {
            policy.high_tier_action = TierAction::kWarn;
        } else {
            return std::unexpected(invalid_value(
                fmt::format("'{}' is not 'reject' or 'warn'", tier_action), "policy.high_tier_action"));
        }
    }
    return {};
}

// categories:
//   boolean-blind: warn
//   code-execution: reject
[[nodiscard]] Status parse_categories(const YAML::Node& node, PolicyConfig& policy) {
    if (!node) {
        return {};
    }
    for (const auto& entry : node) {
        const auto name = entry.first.as<std::string>();
        const auto context = key_path("categories", name);
        const auto category = category_from_string(name);
        if (!category) {
            return std::unexpected(invalid_value(fmt::format("unknown category '{}'", name), context));
        }
        if (!entry.second.IsScalar()) {
            return std::unexpected(invalid_value("expected 'reject', 'warn' or 'default'", context));
        }
        const auto action = entry.second.as<std::string>();
        CategoryAction parsed{};
        if (iequals(action, "reject")) {
            parsed = CategoryAction::kReject;
        } else if (iequals(action, "warn")) {
            parsed = CategoryAction::kWarn;
        } else if (iequals(action, "default")) {
            parsed = CategoryAction::kDefault;
        } else {
            return std::unexpected(invalid_value(
                fmt::format("'{}' is not 'reject', 'warn' or 'default'", action), context));
        }
        policy.category_actions[category_index(*category)] = parsed;
    }
    return {};
}

[[nodiscard]] Status parse_classifier(const YAML::Node& node, ClassifierOptions& options) {
    if (!node) {
        return {};
    }
    if (auto r = read_scalar(node, "classifier", "score_cap", options.score_cap); !r) return r;
    if (auto r = read_scalar(node, "classifier", "pattern_scan_limit", options.pattern_scan_limit); !r) return r;

    const YAML::Node thresholds = node["thresholds"];
    if (!thresholds || thresholds.IsNull()) {
        return {};
    }
    if (!thresholds.IsMap()) {
        return std::unexpected(invalid_value("section must be a map", "classifier.thresholds"));
    }
    constexpr std::string_view kSection = "classifier.thresholds";
    if (auto r = read_scalar(thresholds, kSection, "low", options.low_threshold); !r) return r;
    if (auto r = read_scalar(thresholds, kSection, "medium", options.medium_threshold); !r) return r;
    if (auto r = read_scalar(thresholds, kSection, "high", options.high_threshold); !r) return r;
    return read_scalar(thresholds, kSection, "critical", options.critical_threshold);
}

[[nodiscard]] Status parse_rules(const YAML::Node& node, const std::filesystem::path& base_dir,
                                 GateConfig& cfg) {
    if (!node) {
        return {};
    }
    if (auto r = read_scalar(node, "rules", "include_builtin", cfg.include_builtin_rules); !r) {
        return r;
    }
    std::string path;
    if (auto r = read_scalar(node, "rules", "path", path); !r) {
        return r;
    }
    if (!path.empty()) {
        std::filesystem::path rules_path(path);
        if (rules_path.is_relative() && !base_dir.empty()) {
            rules_path = base_dir / rules_path;
        }
        cfg.rules_path = rules_path.lexically_normal();
    }
    return {};
}

[[nodiscard]] Status parse_audit(const YAML::Node& node, AuditConfig& audit) {
    if (!node) {
        return {};
    }
    if (auto r = read_scalar(node, "audit", "enabled", audit.enabled); !r) return r;
    if (auto r = read_scalar(node, "audit", "max_pending", audit.max_pending); !r) return r;
    if (auto r = read_scalar(node, "audit", "preview_length", audit.preview_length); !r) return r;

    const YAML::Node alerts = node["alerts"];
    if (!alerts || alerts.IsNull()) {
        return {};
    }
    if (!alerts.IsMap()) {
        return std::unexpected(invalid_value("section must be a map", "audit.alerts"));
    }
    constexpr std::string_view kSection = "audit.alerts";
    std::uint32_t window_seconds = static_cast<std::uint32_t>(audit.alerts.window.count());
    if (auto r = read_scalar(alerts, kSection, "window_seconds", window_seconds); !r) return r;
    if (auto r = read_scalar(alerts, kSection, "reject_threshold", audit.alerts.reject_count); !r) return r;
    if (auto r = read_scalar(alerts, kSection, "high_risk_threshold", audit.alerts.high_risk_count); !r) return r;
    audit.alerts.window = std::chrono::seconds(window_seconds);
    return {};
}

[[nodiscard]] Status parse_logging(const YAML::Node& node, LoggingConfig& logging) {
    if (!node) {
        return {};
    }
    if (auto r = read_scalar(node, "logging", "level", logging.level); !r) return r;
    if (auto r = read_scalar(node, "logging", "file", logging.file_path); !r) return r;
    if (auto r = read_scalar(node, "logging", "max_files", logging.max_files); !r) return r;

    std::size_t size_mb = logging.max_file_size / (1024 * 1024);
    if (auto r = read_scalar(node, "logging", "max_file_size_mb", size_mb); !r) return r;
    logging.max_file_size = size_mb * 1024 * 1024;
    return {};
}

// ---------------------------------------------------------------------------
// 환경변수 헬퍼
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::uint64_t, ConfigError> parse_unsigned(std::string_view raw,
                                                                       std::string_view name) {
    const auto text = trim(raw);
    std::uint64_t value{0};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(
            invalid_value(fmt::format("'{}' is not a non-negative integer", raw), std::string(name)));
    }
    return value;
}

[[nodiscard]] std::expected<bool, ConfigError> parse_bool(std::string_view raw, std::string_view name) {
    const auto text = trim(raw);
    for (const std::string_view yes : {"true", "1", "yes", "on"}) {
        if (iequals(text, yes)) {
            return true;
        }
    }
    for (const std::string_view no : {"false", "0", "no", "off"}) {
        if (iequals(text, no)) {
            return false;
        }
    }
    return std::unexpected(invalid_value(fmt::format("'{}' is not a boolean", raw), std::string(name)));
}

[[nodiscard]] std::vector<std::string> split_list(std::string_view raw) {
    std::vector<std::string> items;
    while (!raw.empty()) {
        const auto comma = raw.find(',');
        const auto item  = trim(raw.substr(0, comma));
        if (!item.empty()) {
            items.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        raw.remove_prefix(comma + 1);
    }
    return items;
}

[[nodiscard]] std::expected<GateConfig, ConfigError>
parse_document(const YAML::Node& root, const std::filesystem::path& base_dir, std::string_view context) {
    GateConfig cfg = PolicyLoader::defaults();

    // 빈 문서는 기본값
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        return std::unexpected(ConfigError{ConfigErrorCode::kParseError,
                                           "top-level document must be a map", std::string(context)});
    }

    for (const auto& entry : root) {
        const auto name = entry.first.as<std::string>();
        if (std::find(kKnownSections.begin(), kKnownSections.end(), name) == kKnownSections.end()) {
            spdlog::warn("policy_loader: ignoring unknown section '{}' in '{}'", name, context);
        }
    }

    YAML::Node gate, policy, categories, classifier, rules, audit, logging;
    if (auto r = read_section_map(root, "gate", gate); !r) return std::unexpected(r.error());
    if (auto r = read_section_map(root, "policy", policy); !r) return std::unexpected(r.error());
    if (auto r = read_section_map(root, "categories", categories); !r) return std::unexpected(r.error());
    if (auto r = read_section_map(root, "classifier", classifier); !r) return std::unexpected(r.error());
    if (auto r = read_section_map(root, "rules", rules); !r) return std::unexpected(r.error());
    if (auto r = read_section_map(root, "audit", audit); !r) return std::unexpected(r.error());
    if (auto r = read_section_map(root, "logging", logging); !r) return std::unexpected(r.error());

    if (auto r = parse_gate(gate, cfg); !r) return std::unexpected(r.error());
    if (auto r = parse_policy(policy, cfg.policy); !r) return std::unexpected(r.error());
    if (auto r = parse_categories(categories, cfg.policy); !r) return std::unexpected(r.error());
    if (auto r = parse_classifier(classifier, cfg.classifier); !r) return std::unexpected(r.error());
    if (auto r = parse_rules(rules, base_dir, cfg); !r) return std::unexpected(r.error());
    if (auto r = parse_audit(audit, cfg.audit); !r) return std::unexpected(r.error());
    if (auto r = parse_logging(logging, cfg.logging); !r) return std::unexpected(r.error());

    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader
// ---------------------------------------------------------------------------
GateConfig PolicyLoader::defaults() {
    return GateConfig{};
}

std::expected<GateConfig, ConfigError>
PolicyLoader::load_from_string(std::string_view yaml, const std::filesystem::path& base_dir,
                               std::string_view context) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        // yaml-cpp 는 0-based
        return std::unexpected(ConfigError{
            ConfigErrorCode::kParseError,
            fmt::format("YAML parse error at line {}, col {}: {}", e.mark.line + 1, e.mark.column + 1, e.msg),
            std::string(context)});
    } catch (const YAML::Exception& e) {
        return std::unexpected(ConfigError{ConfigErrorCode::kParseError, e.what(), std::string(context)});
    }

    std::expected<GateConfig, ConfigError> cfg;
    try {
        cfg = parse_document(root, base_dir, context);
    } catch (const YAML::Exception& e) {
        // 맵 키가 스칼라가 아닌 경우 등 구조 불일치
        return std::unexpected(invalid_value(e.what(), std::string(context)));
    }
    if (!cfg) {
        return cfg;
    }
    if (auto r = validate(*cfg); !r) {
        return std::unexpected(r.error());
    }
    return cfg;
}

std::expected<GateConfig, ConfigError>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return std::unexpected(ConfigError{ConfigErrorCode::kFileNotFound,
                                           fmt::format("cannot resolve config path: {}", ec.message()),
                                           config_path.string()});
    }

    std::ifstream in(canonical_path);
    if (!in) {
        return std::unexpected(ConfigError{ConfigErrorCode::kFileNotFound, "cannot open config file",
                                           canonical_path.string()});
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    spdlog::info("policy_loader: loading configuration from '{}'", canonical_path.string());

    // 2. 파싱 + 검증
    auto cfg = load_from_string(buffer.str(), canonical_path.parent_path(), canonical_path.string());
    if (cfg) {
        spdlog::info(
            "policy_loader: configuration loaded, enabled={} allowed_types={} blocked_keywords={} "
            "max_length={} max_limit_value={}",
            cfg->policy.enabled, cfg->policy.allowed_types.size(), cfg->policy.blocked_keywords.size(),
            cfg->policy.max_length, cfg->policy.max_limit_value);
    }
    return cfg;
}

std::expected<void, ConfigError> PolicyLoader::apply_environment(GateConfig& config, const EnvLookup& env) {
    if (!env) {
        return {};
    }
    // 작업 사본에 적용 후 성공 시에만 반영 (all-or-nothing)
    GateConfig working = config;

    if (const auto raw = env("MAX_QUERY_LENGTH")) {
        const auto value = parse_unsigned(*raw, "MAX_QUERY_LENGTH");
        if (!value) {
            return std::unexpected(value.error());
        }
        working.policy.max_length = static_cast<std::size_t>(*value);
    }

    if (const auto raw = env("MAX_LIMIT_VALUE")) {
        const auto value = parse_unsigned(*raw, "MAX_LIMIT_VALUE");
        if (!value) {
            return std::unexpected(value.error());
        }
        working.policy.max_limit_value = *value;
        if (working.policy.default_limit > *value && *value > 0) {
            spdlog::info("policy_loader: default_limit lowered to MAX_LIMIT_VALUE {}", *value);
            working.policy.default_limit = *value;
        }
    }

    if (const auto raw = env("ALLOWED_QUERY_TYPES")) {
        if (auto r = to_statement_types(split_list(*raw), "ALLOWED_QUERY_TYPES", working.policy.allowed_types); !r) {
            return r;
        }
    }

    if (const auto raw = env("BLOCKED_KEYWORDS")) {
        working.policy.blocked_keywords = split_list(*raw);
        if (auto r = normalize_names(working.policy.blocked_keywords, "BLOCKED_KEYWORDS"); !r) {
            return r;
        }
    }

    if (const auto raw = env("REQUIRE_LIMIT_FOR_SELECT")) {
        const auto value = parse_bool(*raw, "REQUIRE_LIMIT_FOR_SELECT");
        if (!value) {
            return std::unexpected(value.error());
        }
        working.policy.require_limit = *value;
    }

    if (const auto raw = env("ENABLE_QUERY_VALIDATION")) {
        const auto value = parse_bool(*raw, "ENABLE_QUERY_VALIDATION");
        if (!value) {
            return std::unexpected(value.error());
        }
        working.policy.enabled = *value;
    }

    if (auto r = validate(working); !r) {
        return r;
    }
    config = std::move(working);
    return {};
}

PolicyLoader::EnvLookup PolicyLoader::process_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::expected<GateConfig, ConfigError>
PolicyLoader::resolve(const std::optional<std::filesystem::path>& config_path, const EnvLookup& env) {
    GateConfig cfg = defaults();
    if (config_path) {
        auto loaded = load(*config_path);
        if (!loaded) {
            return loaded;
        }
        cfg = std::move(*loaded);
    } else {
        spdlog::info("policy_loader: no configuration file, using built-in defaults");
    }

    if (auto r = apply_environment(cfg, env); !r) {
        return std::unexpected(r.error());
    }
    return cfg;
}

std::expected<void, ConfigError> PolicyLoader::validate(const GateConfig& config) {
    const auto& policy = config.policy;

    if (policy.allowed_types.empty()) {
        return std::unexpected(invalid_value("at least one statement type must be allowed",
                                             "policy.allowed_types"));
    }
    for (const auto type : policy.allowed_types) {
        if (type == StatementType::kUnknown) {
            return std::unexpected(invalid_value("UNKNOWN cannot be allowed", "policy.allowed_types"));
        }
    }
    if (policy.max_length == 0) {
        return std::unexpected(invalid_value("must be greater than 0", "policy.max_length"));
    }
    if (policy.max_limit_value == 0) {
        return std::unexpected(invalid_value("must be at least 1", "policy.max_limit_value"));
    }
    if (policy.default_limit == 0 || policy.default_limit > policy.max_limit_value) {
        return std::unexpected(invalid_value(
            fmt::format("must be within 1..{}", policy.max_limit_value), "policy.default_limit"));
    }
    if (policy.reject_severity < 1 || policy.reject_severity > 100) {
        return std::unexpected(invalid_value("must be within 1..100", "policy.reject_severity"));
    }

    const auto& classifier = config.classifier;
    if (!(classifier.low_threshold >= 1 &&
          classifier.low_threshold < classifier.medium_threshold &&
          classifier.medium_threshold < classifier.high_threshold &&
          classifier.high_threshold < classifier.critical_threshold)) {
        return std::unexpected(invalid_value("thresholds must be strictly ascending and start at 1 or above",
                                             "classifier.thresholds"));
    }
    if (classifier.score_cap < classifier.critical_threshold) {
        return std::unexpected(invalid_value("must not be below the critical threshold",
                                             "classifier.score_cap"));
    }
    if (classifier.pattern_scan_limit == 0) {
        return std::unexpected(invalid_value("must be greater than 0", "classifier.pattern_scan_limit"));
    }

    const auto& audit = config.audit;
    if (audit.max_pending == 0) {
        return std::unexpected(invalid_value("must be greater than 0", "audit.max_pending"));
    }
    if (audit.preview_length == 0) {
        return std::unexpected(invalid_value("must be greater than 0", "audit.preview_length"));
    }
    if (audit.alerts.window.count() <= 0 || audit.alerts.reject_count == 0 ||
        audit.alerts.high_risk_count == 0) {
        return std::unexpected(invalid_value("window and thresholds must be greater than 0", "audit.alerts"));
    }

    if (!parse_log_level(config.logging.level)) {
        return std::unexpected(invalid_value(fmt::format("unknown log level '{}'", config.logging.level),
                                             "logging.level"));
    }
    if (config.logging.max_file_size == 0 || config.logging.max_files == 0) {
        return std::unexpected(invalid_value("file size and count must be greater than 0", "logging"));
    }
    return {};
}

std::expected<std::shared_ptr<const PatternLibrary>, ConfigError>
PolicyLoader::load_library(const GateConfig& config) {
    std::optional<PatternLibrary> library;

    if (config.include_builtin_rules) {
        auto builtin = PatternLibrary::builtin();
        if (!builtin) {
            return std::unexpected(builtin.error());
        }
        library = std::move(*builtin);
    }

    if (!config.rules_path.empty()) {
        auto custom = PatternLibrary::load(config.rules_path);
        if (!custom) {
            return std::unexpected(custom.error());
        }
        if (library) {
            auto merged = library->merged_with(*custom);
            if (!merged) {
                return std::unexpected(merged.error());
            }
            library = std::move(*merged);
        } else {
            library = std::move(*custom);
        }
    }

    if (!library || library->empty()) {
        // 탐지 규칙이 없으면 모든 쿼리가 score 0 이 된다
        spdlog::warn("policy_loader: pattern library is empty, risk classification is inactive");
        return std::make_shared<const PatternLibrary>();
    }
    return std::make_shared<const PatternLibrary>(std::move(*library));
}
