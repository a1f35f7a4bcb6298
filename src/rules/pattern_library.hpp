#pragma once

// ---------------------------------------------------------------------------
// pattern_library.hpp
//
// 버전이 붙은 불변 규칙 집합.
// 기동 시 builtin() 또는 load() 로 한 번 만들어져 shared_ptr<const> 로
// 모든 검증 스레드에 공유된다.
//
// [설계 원칙]
// - 불변: 규칙 추가는 with_rule() 이 새 라이브러리를 반환하는 방식이다.
//   기존 인스턴스는 절대 변경되지 않으므로 잠금 없이 공유할 수 있다.
// - 확장: 정규식으로 표현 가능한 규칙은 YAML 데이터로만 추가한다.
//   구조적 술어는 StructuralCheck 의 닫힌 목록에서 고른다.
// - 로드 실패는 ConfigError 로 반환한다 (잘못된 regex, 중복 id,
//   알 수 없는 check, severity 범위 오류). 잘못된 규칙을 건너뛰고
//   계속하면 탐지 범위가 조용히 줄어들기 때문이다.
//
// [규칙 파일 형식]
//   version: custom-1
//   rules:
//     - id: time-sleep
//       category: time-based
//       severity: 60
//       description: SLEEP call
//       pattern: '\bSLEEP\s*\('
//     - id: many-unions
//       category: union-based
//       severity: 30
//       structural: { check: union_count, threshold: 2 }
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "parser/sql_analyzer.hpp"
#include "rules/rule.hpp"

class PatternLibrary {
public:
    PatternLibrary()  = default;
    ~PatternLibrary() = default;

    PatternLibrary(const PatternLibrary&)            = default;
    PatternLibrary& operator=(const PatternLibrary&) = default;
    PatternLibrary(PatternLibrary&&)                 = default;
    PatternLibrary& operator=(PatternLibrary&&)      = default;

    // builtin
    //   모든 카테고리를 최소 1개 규칙으로 덮는 내장 규칙 집합 (version "builtin-1").
    [[nodiscard]] static std::expected<PatternLibrary, ConfigError> builtin();

    // load
    //   YAML 규칙 파일을 읽는다. 파일 없음은 kFileNotFound, 문법 오류는
    //   kParseError, 규칙 정의 오류는 kInvalidRule.
    [[nodiscard]] static std::expected<PatternLibrary, ConfigError>
    load(const std::filesystem::path& path);

    // from_yaml
    //   context 는 오류 메시지에 붙는 출처 이름 (파일 경로 등)
    [[nodiscard]] static std::expected<PatternLibrary, ConfigError>
    from_yaml(std::string_view text, std::string_view context = "<inline>");

    // from_rules
    //   id 중복, severity 범위를 검증한다.
    [[nodiscard]] static std::expected<PatternLibrary, ConfigError>
    from_rules(std::string version, std::vector<Rule> rules);

    // with_rule
    //   rule 을 덧붙인 새 라이브러리를 반환한다. *this 는 변하지 않는다.
    [[nodiscard]] std::expected<PatternLibrary, ConfigError> with_rule(Rule rule) const;

    // merged_with
    //   other 의 규칙을 뒤에 덧붙인다. 버전은 "<this>+<other>".
    [[nodiscard]] std::expected<PatternLibrary, ConfigError>
    merged_with(const PatternLibrary& other) const;

    [[nodiscard]] const std::vector<Rule>& rules() const noexcept { return rules_; }
    [[nodiscard]] const std::string&       version() const noexcept { return version_; }
    [[nodiscard]] std::size_t              size() const noexcept { return rules_.size(); }
    [[nodiscard]] bool                     empty() const noexcept { return rules_.empty(); }

private:
    PatternLibrary(std::string version, std::vector<Rule> rules);

    std::string       version_{};
    std::vector<Rule> rules_{};
};

// ---------------------------------------------------------------------------
// match_rule
//   rule 이 text / facts 에 대해 발화하는지 판정한다 (fires).
//   정규식 실행이 std::regex_error(복잡도/스택 한도)로 실패하면 발화한
//   것으로 간주한다. 분석하지 못한 입력은 위험 쪽으로 처리한다.
// ---------------------------------------------------------------------------
[[nodiscard]] bool match_rule(const Rule& rule, std::string_view text, const StructuralFacts& facts);

// make_pattern_rule
//   pattern 을 icase|ECMAScript 로 컴파일한다. 실패 시 kInvalidRule.
[[nodiscard]] std::expected<Rule, ConfigError>
make_pattern_rule(std::string id, AttackCategory category, std::uint32_t severity,
                  std::string description, const std::string& pattern);

[[nodiscard]] Rule make_structural_rule(std::string id, AttackCategory category,
                                        std::uint32_t severity, std::string description,
                                        StructuralMatcher matcher);
