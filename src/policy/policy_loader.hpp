#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// config/querygate.yaml 과 환경변수로부터 GateConfig 를 만들고,
// 설정이 가리키는 규칙 파일까지 읽어 PatternLibrary 를 구성한다.
//
// [설계 원칙]
// - All-or-nothing: 실패 시 부분 설정을 반환하지 않는다.
// - 잘못된 값은 기본값으로 대체하지 않고 ConfigError 로 반환한다.
//   (정책 값이 조용히 바뀌면 운영자가 의도한 차단이 사라진다.)
// - 우선순위: 구조체 기본값 < YAML < 환경변수.
// - 호출자(main)는 실패 시 프로세스를 시작하지 않는다.
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 않는다.
// - 상대 경로 rules.path 는 설정 파일이 있는 디렉터리 기준으로 해석한다
//   (작업 디렉터리에 따라 다른 규칙이 로드되지 않도록).
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "policy/policy_config.hpp"
#include "rules/pattern_library.hpp"

class PolicyLoader {
public:
    // EnvLookup
    //   환경변수 조회 함수. 테스트는 map 기반 람다를 주입한다.
    using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

    PolicyLoader()  = default;
    ~PolicyLoader() = default;

    PolicyLoader(const PolicyLoader&)            = default;
    PolicyLoader& operator=(const PolicyLoader&) = default;
    PolicyLoader(PolicyLoader&&)                 = default;
    PolicyLoader& operator=(PolicyLoader&&)      = default;

    // load
    //   YAML 파일을 읽어 GateConfig 로 파싱하고 validate() 까지 수행한다.
    //   파일 없음: kFileNotFound, 문법 오류: kParseError, 값 오류: kInvalidValue.
    [[nodiscard]] static std::expected<GateConfig, ConfigError>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   base_dir 은 상대 rules.path 해석 기준, context 는 오류 위치 표기용.
    [[nodiscard]] static std::expected<GateConfig, ConfigError>
    load_from_string(std::string_view             yaml,
                     const std::filesystem::path& base_dir = {},
                     std::string_view             context  = "<inline>");

    // defaults
    //   설정 파일 없이 기동할 때의 기본 설정 (SELECT 전용, LIMIT 필수).
    [[nodiscard]] static GateConfig defaults();

    // apply_environment
    //   MAX_QUERY_LENGTH, MAX_LIMIT_VALUE, ALLOWED_QUERY_TYPES,
    //   BLOCKED_KEYWORDS, REQUIRE_LIMIT_FOR_SELECT, ENABLE_QUERY_VALIDATION
    //   을 config 위에 덮어쓴다. 값 형식 오류는 kInvalidValue.
    //   실패 시 config 는 변경되지 않는다.
    [[nodiscard]] static std::expected<void, ConfigError>
    apply_environment(GateConfig& config, const EnvLookup& env);

    // process_environment
    //   std::getenv 기반 EnvLookup.
    [[nodiscard]] static EnvLookup process_environment();

    // resolve
    //   config_path 가 있으면 load, 없으면 defaults() 에서 시작하여
    //   환경변수를 적용하고 검증한다. main 의 기동 경로.
    [[nodiscard]] static std::expected<GateConfig, ConfigError>
    resolve(const std::optional<std::filesystem::path>& config_path, const EnvLookup& env);

    // validate
    //   값 사이의 관계(임계값 오름차순, default_limit <= max_limit_value 등)를 검사한다.
    [[nodiscard]] static std::expected<void, ConfigError> validate(const GateConfig& config);

    // load_library
    //   include_builtin_rules 와 rules_path 에 따라 내장 규칙과 파일 규칙을
    //   병합한다. 둘 다 없으면 빈 라이브러리를 경고와 함께 반환한다.
    [[nodiscard]] static std::expected<std::shared_ptr<const PatternLibrary>, ConfigError>
    load_library(const GateConfig& config);
};
