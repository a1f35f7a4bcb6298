#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// StatementType
//   SQL 문의 첫 번째 의미 있는 키워드 기반 분류.
//   kUnknown 은 분류 실패를 나타내며, allowed_types 에 포함될 수 없다.
//   (PolicyLoader 가 "UNKNOWN" 을 허용 목록에 넣는 설정을 거부한다)
// ---------------------------------------------------------------------------
enum class StatementType : std::uint8_t {
    kSelect   = 0,
    kInsert   = 1,
    kUpdate   = 2,
    kDelete   = 3,
    kReplace  = 4,
    kMerge    = 5,
    kDrop     = 6,
    kTruncate = 7,
    kAlter    = 8,
    kCreate   = 9,
    kRename   = 10,
    kGrant    = 11,
    kRevoke   = 12,
    kCall     = 13,
    kPrepare  = 14,
    kExecute  = 15,
    kShow     = 16,
    kDescribe = 17,
    kExplain  = 18,
    kSet      = 19,
    kUse      = 20,
    kUnknown  = 21,
};

// ---------------------------------------------------------------------------
// AttackCategory
//   공격 시그니처 분류.
//   kOther 는 필수 fallback: 규칙 파일에 알 수 없는 카테고리 이름이 오면
//   스키마 변경 없이 kOther 로 흡수한다.
//   kFileAccess / kObfuscation 은 기본 8종에 더해 확장된 카테고리.
// ---------------------------------------------------------------------------
enum class AttackCategory : std::uint8_t {
    kTautology             = 0,
    kUnionBased            = 1,
    kBooleanBlind          = 2,
    kTimeBased             = 3,
    kErrorBased            = 4,
    kNoSql                 = 5,
    kCodeExecution         = 6,
    kInformationDisclosure = 7,
    kFileAccess            = 8,
    kObfuscation           = 9,
    kOther                 = 10,
};

inline constexpr std::size_t kAttackCategoryCount = 11;

// ---------------------------------------------------------------------------
// RiskTier
//   점수 구간으로부터 파생되는 위험 등급. 순서 비교가 의미를 가진다
//   (tier >= RiskTier::kHigh 형태로 사용).
// ---------------------------------------------------------------------------
enum class RiskTier : std::uint8_t {
    kNone     = 0,
    kLow      = 1,
    kMedium   = 2,
    kHigh     = 3,
    kCritical = 4,
};

// ---------------------------------------------------------------------------
// Verdict
//   검증 최종 판정.
//   kReject 는 예외가 아니라 정상적인 반환값이다 (게이트가 제 역할을 한 것).
// ---------------------------------------------------------------------------
enum class Verdict : std::uint8_t {
    kAllow            = 0,
    kReject           = 1,
    kRewriteSuggested = 2,
};

// ---------------------------------------------------------------------------
// ReasonCode
//   Decision 에 첨부되는 판정 사유 코드. 외부로 노출되는 문자열은
//   to_string() 의 snake_case 이름을 사용한다.
// ---------------------------------------------------------------------------
enum class ReasonCode : std::uint8_t {
    kStatementTypeNotAllowed = 0,
    kBlockedKeyword          = 1,
    kQueryTooLong            = 2,
    kLimitAdded              = 3,
    kLimitClamped            = 4,
    kHighRiskPattern         = 5,
    kElevatedRiskWarning     = 6,
    kValidationDisabled      = 7,
    kAnalysisDegraded        = 8,
};

// ---------------------------------------------------------------------------
// ConfigErrorCode / ConfigError
//   설정/규칙 로드 실패 정보 (ConfigurationError).
//   std::expected<T, ConfigError> 패턴과 함께 사용한다.
//   기동 시점에만 발생하며, 호출자(main)는 즉시 프로세스를 종료해야 한다.
//   정책 없이 동작하면 모든 쿼리가 조용히 허용되기 때문이다.
// ---------------------------------------------------------------------------
enum class ConfigErrorCode : std::uint8_t {
    kFileNotFound = 0,  // 설정/규칙 파일을 열 수 없음
    kParseError   = 1,  // YAML 문법 오류
    kInvalidValue = 2,  // 값 범위/형식 오류 (환경변수 포함)
    kInvalidRule  = 3,  // 규칙 정의 오류 (잘못된 regex, 중복 id 등)
};

struct ConfigError {
    ConfigErrorCode code{ConfigErrorCode::kInvalidValue};
    std::string     message{};  // 사람이 읽을 수 있는 오류 설명
    std::string     context{};  // 오류 위치 (파일 경로, 키 이름, 규칙 id)
};

// ---------------------------------------------------------------------------
// 문자열 변환
//   to_string: 로그/JSON/설정 파일에서 사용하는 정규 이름.
//   *_from_string: 대소문자 무관. 알 수 없는 이름이면 std::nullopt.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string_view to_string(StatementType type) noexcept;
[[nodiscard]] std::string_view to_string(AttackCategory category) noexcept;
[[nodiscard]] std::string_view to_string(RiskTier tier) noexcept;
[[nodiscard]] std::string_view to_string(Verdict verdict) noexcept;
[[nodiscard]] std::string_view to_string(ReasonCode reason) noexcept;
[[nodiscard]] std::string_view to_string(ConfigErrorCode code) noexcept;

[[nodiscard]] std::optional<StatementType>  statement_type_from_string(std::string_view name);
[[nodiscard]] std::optional<AttackCategory> category_from_string(std::string_view name);

// 카테고리를 배열 인덱스로 사용할 때 (GateStats, PolicyConfig::category_actions)
[[nodiscard]] constexpr std::size_t category_index(AttackCategory category) noexcept {
    return static_cast<std::size_t>(category);
}

// ASCII 대문자 변환 / 대소문자 무관 비교 (SQL 키워드 비교용)
[[nodiscard]] std::string to_upper_ascii(std::string_view s);
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;
