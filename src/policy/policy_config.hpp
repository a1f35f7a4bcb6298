#pragma once

// ---------------------------------------------------------------------------
// policy_config.hpp
//
// 게이트 설정 구조체 정의 (헤더만).
// PolicyLoader 가 config/querygate.yaml 과 환경변수로부터 채우며,
// 이후 GateSnapshot 안에서 불변으로 공유된다.
//
// [설계 원칙]
// - 모든 멤버는 기본값을 명시한다. 기본값만으로도 안전한 정책이 되어야
//   한다 (SELECT 전용, LIMIT 필수, DDL/DML 키워드 차단).
// - 구조체 자체는 판정 로직을 포함하지 않는다 (PolicyEnforcer 담당).
// ---------------------------------------------------------------------------

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "classifier/risk_classifier.hpp"  // ClassifierOptions
#include "common/types.hpp"

// ---------------------------------------------------------------------------
// CategoryAction
//   카테고리별 판정 정책.
//   kReject : 해당 카테고리가 발화하면 등급과 무관하게 REJECT
//   kWarn   : high 등급이 warn 카테고리만으로 구성되면 경고부 REWRITE 로 완화
//   kDefault: 등급 규칙을 따른다
// ---------------------------------------------------------------------------
enum class CategoryAction : std::uint8_t {
    kDefault = 0,
    kReject  = 1,
    kWarn    = 2,
};

// high 등급 처리 방식
enum class TierAction : std::uint8_t {
    kReject = 0,
    kWarn   = 1,
};

// ---------------------------------------------------------------------------
// PolicyConfig
//   blocked_keywords / blocked_functions 는 대문자로 정규화되어 저장된다.
// ---------------------------------------------------------------------------
struct PolicyConfig {
    bool                       enabled{true};  // ENABLE_QUERY_VALIDATION
    std::vector<StatementType> allowed_types{StatementType::kSelect};
    std::size_t                max_length{5000};
    std::uint64_t              max_limit_value{1000};
    std::uint64_t              default_limit{100};
    bool                       require_limit{true};
    std::vector<std::string>   blocked_keywords{
        "DROP", "DELETE", "TRUNCATE", "ALTER", "CREATE", "INSERT", "UPDATE"};
    std::vector<std::string>   blocked_functions{};
    std::uint32_t              reject_severity{90};
    TierAction                 high_tier_action{TierAction::kReject};
    std::array<CategoryAction, kAttackCategoryCount> category_actions{};  // 전부 kDefault
    std::size_t                max_joins{5};
    std::size_t                max_subqueries{3};

    [[nodiscard]] bool is_allowed(StatementType type) const {
        return std::find(allowed_types.begin(), allowed_types.end(), type) != allowed_types.end();
    }

    [[nodiscard]] CategoryAction action_for(AttackCategory category) const noexcept {
        return category_actions[category_index(category)];
    }
};

// ---------------------------------------------------------------------------
// AlertThresholds
//   window 안에서 count 를 "초과"하면 경보 (10건 초과 = 11번째에 발생).
// ---------------------------------------------------------------------------
struct AlertThresholds {
    std::uint32_t        reject_count{10};
    std::uint32_t        high_risk_count{20};
    std::chrono::seconds window{60};
};

struct AuditConfig {
    bool            enabled{true};
    std::size_t     max_pending{10000};   // 초과분은 드롭 후 카운트
    std::size_t     preview_length{100};  // 감사 로그 쿼리 미리보기 바이트
    AlertThresholds alerts{};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file_path{};               // 빈 값이면 파일 싱크 없음
    std::size_t max_file_size{10 * 1024 * 1024};
    std::size_t max_files{5};
};

// ---------------------------------------------------------------------------
// GateConfig
//   PolicyLoader 가 반환하는 루트 설정.
//   rules_path 가 비어 있으면 내장 규칙만 사용한다.
// ---------------------------------------------------------------------------
struct GateConfig {
    PolicyConfig          policy{};
    ClassifierOptions     classifier{};
    AuditConfig           audit{};
    LoggingConfig         logging{};
    std::filesystem::path rules_path{};
    bool                  include_builtin_rules{true};
};
