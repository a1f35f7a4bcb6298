// ---------------------------------------------------------------------------
// test_policy_loader.cpp
//
// PolicyLoader 단위 테스트.
//
// [테스트 범위]
// - YAML 섹션별 파싱 (policy / categories / classifier / rules / audit / logging)
// - 엄격한 오류 처리: 잘못된 값은 kInvalidValue, 문법 오류는 kParseError
// - 환경변수 오버라이드 (all-or-nothing)
// - validate() 범위 검사
// - load_library(): 내장 + 사이트 규칙 병합
// - 저장소에 포함된 config/querygate.yaml 로드
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

namespace fs = std::filesystem;

namespace {

PolicyLoader::EnvLookup env_of(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](std::string_view name) -> std::optional<std::string> {
        const auto it = vars.find(std::string(name));
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

fs::path source_config(const char* name) {
    return fs::path(QUERYGATE_SOURCE_DIR) / "config" / name;
}

class PolicyLoaderFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "querygate_test_config" / info->name();
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write(const std::string& name, const std::string& content) {
        const auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path dir_;
};

}  // namespace

// ---------------------------------------------------------------------------
// 기본값
// ---------------------------------------------------------------------------

TEST(PolicyLoader, Defaults_AreValid) {
    const auto cfg = PolicyLoader::defaults();
    EXPECT_TRUE(PolicyLoader::validate(cfg).has_value());
    EXPECT_TRUE(cfg.policy.enabled);
    EXPECT_EQ(cfg.policy.allowed_types, (std::vector<StatementType>{StatementType::kSelect}));
    EXPECT_EQ(cfg.policy.max_length, 5000u);
    EXPECT_EQ(cfg.policy.max_limit_value, 1000u);
    EXPECT_EQ(cfg.policy.default_limit, 100u);
    EXPECT_TRUE(cfg.policy.require_limit);
    EXPECT_EQ(cfg.policy.blocked_keywords.size(), 7u);
}

TEST(PolicyLoader, EmptyDocument_GivesDefaults) {
    const auto cfg = PolicyLoader::load_from_string("");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg->policy.max_length, 5000u);
}

// ---------------------------------------------------------------------------
// 섹션 파싱
// ---------------------------------------------------------------------------

TEST(PolicyLoader, PolicySection_Parsed) {
    const auto cfg = PolicyLoader::load_from_string(R"(
gate:
  enabled: false
policy:
  allowed_types: [select, Show]
  max_length: 200
  max_limit_value: 50
  default_limit: 10
  require_limit: false
  blocked_keywords: [drop, " grant "]
  blocked_functions: [load_file]
  reject_severity: 80
  high_tier_action: warn
  max_joins: 2
  max_subqueries: 1
)");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    const auto& p = cfg->policy;
    EXPECT_FALSE(p.enabled);
    EXPECT_EQ(p.allowed_types, (std::vector<StatementType>{StatementType::kSelect, StatementType::kShow}));
    EXPECT_EQ(p.max_length, 200u);
    EXPECT_EQ(p.max_limit_value, 50u);
    EXPECT_EQ(p.default_limit, 10u);
    EXPECT_FALSE(p.require_limit);
    EXPECT_EQ(p.blocked_keywords, (std::vector<std::string>{"DROP", "GRANT"}));
    EXPECT_EQ(p.blocked_functions, (std::vector<std::string>{"LOAD_FILE"}));
    EXPECT_EQ(p.reject_severity, 80u);
    EXPECT_EQ(p.high_tier_action, TierAction::kWarn);
    EXPECT_EQ(p.max_joins, 2u);
    EXPECT_EQ(p.max_subqueries, 1u);
}

TEST(PolicyLoader, CategoriesSection_Parsed) {
    const auto cfg = PolicyLoader::load_from_string(R"(
categories:
  code-execution: reject
  boolean-blind: WARN
  tautology: default
)");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg->policy.action_for(AttackCategory::kCodeExecution), CategoryAction::kReject);
    EXPECT_EQ(cfg->policy.action_for(AttackCategory::kBooleanBlind), CategoryAction::kWarn);
    EXPECT_EQ(cfg->policy.action_for(AttackCategory::kTautology), CategoryAction::kDefault);
    EXPECT_EQ(cfg->policy.action_for(AttackCategory::kNoSql), CategoryAction::kDefault);
}

TEST(PolicyLoader, ClassifierAuditLogging_Parsed) {
    const auto cfg = PolicyLoader::load_from_string(R"(
classifier:
  score_cap: 150
  pattern_scan_limit: 1024
  thresholds: {low: 5, medium: 30, high: 60, critical: 120}
audit:
  enabled: false
  max_pending: 64
  preview_length: 40
  alerts: {window_seconds: 30, reject_threshold: 3, high_risk_threshold: 4}
logging:
  level: debug
  file: /tmp/qg.log
  max_file_size_mb: 2
  max_files: 3
)");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg->classifier.score_cap, 150u);
    EXPECT_EQ(cfg->classifier.pattern_scan_limit, 1024u);
    EXPECT_EQ(cfg->classifier.low_threshold, 5u);
    EXPECT_EQ(cfg->classifier.critical_threshold, 120u);
    EXPECT_FALSE(cfg->audit.enabled);
    EXPECT_EQ(cfg->audit.max_pending, 64u);
    EXPECT_EQ(cfg->audit.preview_length, 40u);
    EXPECT_EQ(cfg->audit.alerts.window, std::chrono::seconds(30));
    EXPECT_EQ(cfg->audit.alerts.reject_count, 3u);
    EXPECT_EQ(cfg->audit.alerts.high_risk_count, 4u);
    EXPECT_EQ(cfg->logging.level, "debug");
    EXPECT_EQ(cfg->logging.file_path, "/tmp/qg.log");
    EXPECT_EQ(cfg->logging.max_file_size, 2u * 1024 * 1024);
    EXPECT_EQ(cfg->logging.max_files, 3u);
}

TEST(PolicyLoader, RulesPath_RelativeToBaseDir) {
    const auto cfg = PolicyLoader::load_from_string("rules: {path: site/rules.yaml, include_builtin: false}",
                                                    "/etc/querygate");
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg->rules_path, fs::path("/etc/querygate/site/rules.yaml"));
    EXPECT_FALSE(cfg->include_builtin_rules);
}

TEST(PolicyLoader, UnknownSection_OnlyWarns) {
    const auto cfg = PolicyLoader::load_from_string("telemetry: {enabled: true}\n");
    EXPECT_TRUE(cfg.has_value());
}

// ---------------------------------------------------------------------------
// 오류
// ---------------------------------------------------------------------------

TEST(PolicyLoader, MalformedYaml_ParseError) {
    const auto cfg = PolicyLoader::load_from_string("policy: [unclosed", {}, "broken.yaml");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, ConfigErrorCode::kParseError);
    EXPECT_EQ(cfg.error().context, "broken.yaml");
}

TEST(PolicyLoader, NonMapDocument_ParseError) {
    const auto cfg = PolicyLoader::load_from_string("- a\n- b\n");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, ConfigErrorCode::kParseError);
}

TEST(PolicyLoader, BadScalar_InvalidValueWithKey) {
    const auto cfg = PolicyLoader::load_from_string("policy: {max_length: lots}");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, ConfigErrorCode::kInvalidValue);
    EXPECT_EQ(cfg.error().context, "policy.max_length");
}

TEST(PolicyLoader, NegativeUnsigned_InvalidValue) {
    const auto cfg = PolicyLoader::load_from_string("policy: {max_limit_value: -5}");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, ConfigErrorCode::kInvalidValue);
}

TEST(PolicyLoader, UnknownStatementType_InvalidValue) {
    const auto cfg = PolicyLoader::load_from_string("policy: {allowed_types: [SELECT, FROBNICATE]}");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().context, "policy.allowed_types");
}

TEST(PolicyLoader, UnknownCategoryOrAction_InvalidValue) {
    const auto unknown = PolicyLoader::load_from_string("categories: {made-up: reject}");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, ConfigErrorCode::kInvalidValue);

    const auto action = PolicyLoader::load_from_string("categories: {nosql: ignore}");
    ASSERT_FALSE(action.has_value());
    EXPECT_EQ(action.error().context, "categories.nosql");
}

TEST(PolicyLoader, BadTierAction_InvalidValue) {
    const auto cfg = PolicyLoader::load_from_string("policy: {high_tier_action: shrug}");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().context, "policy.high_tier_action");
}

TEST(PolicyLoader, SectionNotMap_InvalidValue) {
    const auto cfg = PolicyLoader::load_from_string("policy: 3");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, ConfigErrorCode::kInvalidValue);
}

// ---------------------------------------------------------------------------
// validate
// ---------------------------------------------------------------------------

TEST(PolicyLoader, Validate_RejectsOutOfRangeValues) {
    const auto check = [](auto mutate, const char* context) {
        GateConfig cfg = PolicyLoader::defaults();
        mutate(cfg);
        const auto r = PolicyLoader::validate(cfg);
        ASSERT_FALSE(r.has_value()) << context;
        EXPECT_EQ(r.error().code, ConfigErrorCode::kInvalidValue) << context;
        EXPECT_EQ(r.error().context, context);
    };
    check([](GateConfig& c) { c.policy.allowed_types.clear(); }, "policy.allowed_types");
    check([](GateConfig& c) { c.policy.allowed_types = {StatementType::kUnknown}; }, "policy.allowed_types");
    check([](GateConfig& c) { c.policy.max_length = 0; }, "policy.max_length");
    check([](GateConfig& c) { c.policy.max_limit_value = 0; }, "policy.max_limit_value");
    check([](GateConfig& c) { c.policy.default_limit = 2000; }, "policy.default_limit");
    check([](GateConfig& c) { c.policy.reject_severity = 101; }, "policy.reject_severity");
    check([](GateConfig& c) { c.classifier.medium_threshold = 60; }, "classifier.thresholds");
    check([](GateConfig& c) { c.classifier.score_cap = 80; }, "classifier.score_cap");
    check([](GateConfig& c) { c.classifier.pattern_scan_limit = 0; }, "classifier.pattern_scan_limit");
    check([](GateConfig& c) { c.audit.max_pending = 0; }, "audit.max_pending");
    check([](GateConfig& c) { c.audit.alerts.window = std::chrono::seconds(0); }, "audit.alerts");
    check([](GateConfig& c) { c.logging.level = "chatty"; }, "logging.level");
}

TEST(PolicyLoader, LoadFromString_RunsValidation) {
    const auto cfg = PolicyLoader::load_from_string("policy: {default_limit: 5000}");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().context, "policy.default_limit");
}

// ---------------------------------------------------------------------------
// 환경변수
// ---------------------------------------------------------------------------

TEST(PolicyLoader, Environment_OverridesValues) {
    GateConfig cfg = PolicyLoader::defaults();
    const auto r = PolicyLoader::apply_environment(cfg, env_of({
        {"MAX_QUERY_LENGTH", "300"},
        {"ALLOWED_QUERY_TYPES", "select, show"},
        {"BLOCKED_KEYWORDS", "drop,grant"},
        {"REQUIRE_LIMIT_FOR_SELECT", "no"},
        {"ENABLE_QUERY_VALIDATION", "OFF"},
    }));
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(cfg.policy.max_length, 300u);
    EXPECT_EQ(cfg.policy.allowed_types,
              (std::vector<StatementType>{StatementType::kSelect, StatementType::kShow}));
    EXPECT_EQ(cfg.policy.blocked_keywords, (std::vector<std::string>{"DROP", "GRANT"}));
    EXPECT_FALSE(cfg.policy.require_limit);
    EXPECT_FALSE(cfg.policy.enabled);
}

TEST(PolicyLoader, Environment_MaxLimitLowersDefaultLimit) {
    GateConfig cfg = PolicyLoader::defaults();
    ASSERT_TRUE(PolicyLoader::apply_environment(cfg, env_of({{"MAX_LIMIT_VALUE", "50"}})).has_value());
    EXPECT_EQ(cfg.policy.max_limit_value, 50u);
    EXPECT_EQ(cfg.policy.default_limit, 50u);
}

TEST(PolicyLoader, Environment_EmptyBlockedKeywordsClearsList) {
    GateConfig cfg = PolicyLoader::defaults();
    ASSERT_TRUE(PolicyLoader::apply_environment(cfg, env_of({{"BLOCKED_KEYWORDS", ""}})).has_value());
    EXPECT_TRUE(cfg.policy.blocked_keywords.empty());
}

TEST(PolicyLoader, Environment_InvalidValueLeavesConfigUntouched) {
    GateConfig cfg = PolicyLoader::defaults();
    const auto r = PolicyLoader::apply_environment(cfg, env_of({
        {"MAX_QUERY_LENGTH", "300"},
        {"MAX_LIMIT_VALUE", "many"},
    }));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ConfigErrorCode::kInvalidValue);
    EXPECT_EQ(r.error().context, "MAX_LIMIT_VALUE");
    EXPECT_EQ(cfg.policy.max_length, 5000u);
}

TEST(PolicyLoader, Environment_BadBooleanAndType) {
    GateConfig cfg = PolicyLoader::defaults();
    EXPECT_FALSE(PolicyLoader::apply_environment(cfg, env_of({{"REQUIRE_LIMIT_FOR_SELECT", "maybe"}})).has_value());
    EXPECT_FALSE(PolicyLoader::apply_environment(cfg, env_of({{"ALLOWED_QUERY_TYPES", "SELECT,NOPE"}})).has_value());
    EXPECT_FALSE(PolicyLoader::apply_environment(cfg, env_of({{"ALLOWED_QUERY_TYPES", ""}})).has_value());
    EXPECT_FALSE(PolicyLoader::apply_environment(cfg, env_of({{"MAX_QUERY_LENGTH", "0"}})).has_value());
}

TEST(PolicyLoader, Resolve_WithoutFileUsesDefaultsPlusEnvironment) {
    const auto cfg = PolicyLoader::resolve(std::nullopt, env_of({{"MAX_QUERY_LENGTH", "1234"}}));
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->policy.max_length, 1234u);
}

// ---------------------------------------------------------------------------
// 파일 / 규칙 라이브러리
// ---------------------------------------------------------------------------

TEST_F(PolicyLoaderFileTest, Load_MissingFile) {
    const auto cfg = PolicyLoader::load(dir_ / "absent.yaml");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_EQ(cfg.error().code, ConfigErrorCode::kFileNotFound);
}

TEST_F(PolicyLoaderFileTest, Load_ResolvesRulesNextToConfig) {
    write("rules.yaml", "version: t-1\nrules:\n  - {id: t, category: other, severity: 5, pattern: x}\n");
    const auto path = write("gate.yaml", "rules: {path: rules.yaml}\n");

    const auto cfg = PolicyLoader::load(path);
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg->rules_path, fs::canonical(dir_) / "rules.yaml");

    const auto library = PolicyLoader::load_library(*cfg);
    ASSERT_TRUE(library.has_value()) << library.error().message;
    EXPECT_EQ((*library)->version(), "builtin-1+t-1");
}

TEST_F(PolicyLoaderFileTest, LoadLibrary_CustomOnly) {
    write("rules.yaml", "version: t-2\nrules:\n  - {id: t, category: other, severity: 5, pattern: x}\n");
    const auto cfg = PolicyLoader::load(write("gate.yaml", "rules: {path: rules.yaml, include_builtin: false}\n"));
    ASSERT_TRUE(cfg.has_value());

    const auto library = PolicyLoader::load_library(*cfg);
    ASSERT_TRUE(library.has_value());
    EXPECT_EQ((*library)->size(), 1u);
}

TEST_F(PolicyLoaderFileTest, LoadLibrary_BadRulesFileIsError) {
    write("rules.yaml", "rules:\n  - {id: t, category: other, severity: 500, pattern: x}\n");
    const auto cfg = PolicyLoader::load(write("gate.yaml", "rules: {path: rules.yaml}\n"));
    ASSERT_TRUE(cfg.has_value());

    const auto library = PolicyLoader::load_library(*cfg);
    ASSERT_FALSE(library.has_value());
    EXPECT_EQ(library.error().code, ConfigErrorCode::kInvalidRule);
}

TEST(PolicyLoader, LoadLibrary_NoRulesGivesEmptyLibrary) {
    GateConfig cfg            = PolicyLoader::defaults();
    cfg.include_builtin_rules = false;
    const auto library        = PolicyLoader::load_library(cfg);
    ASSERT_TRUE(library.has_value());
    EXPECT_TRUE((*library)->empty());
}

TEST(PolicyLoader, ShippedConfig_LoadsWithSiteRules) {
    const auto cfg = PolicyLoader::load(source_config("querygate.yaml"));
    ASSERT_TRUE(cfg.has_value()) << cfg.error().message;
    EXPECT_EQ(cfg->policy.blocked_functions, (std::vector<std::string>{"LOAD_FILE"}));
    EXPECT_EQ(cfg->policy.action_for(AttackCategory::kCodeExecution), CategoryAction::kReject);
    EXPECT_EQ(cfg->policy.action_for(AttackCategory::kBooleanBlind), CategoryAction::kWarn);

    const auto library = PolicyLoader::load_library(*cfg);
    ASSERT_TRUE(library.has_value()) << library.error().message;
    EXPECT_EQ((*library)->version(), "builtin-1+site-1");
}
