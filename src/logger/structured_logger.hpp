#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   spdlog 레지스트리에도 등록하지 않는다 (테스트에서 여러 인스턴스 공존).
// - 콘솔 싱크는 stderr 를 사용한다. stdout 은 querygate 실행 파일의
//   판정 출력(JSON lines) 전용이다.
// - 원문 SQL 은 기록하지 않는다. AuditRecord 의 해시와 미리보기만 쓴다.
//
// [JSON 스키마 일관성]
// 감사/경보 로그는 audit_record.hpp 의 to_json() 한 곳에서만 직렬화한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "audit/audit_record.hpp"
#include "common/types.hpp"
#include "logger/log_types.hpp"
#include "policy/policy_config.hpp"  // LoggingConfig

class StructuredLogger {
public:
    // 생성자
    //   min_level     : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path      : 로그 파일 경로. 비어 있으면 파일 싱크 없음.
    //   max_file_size / max_files : rotating file sink 설정.
    //   실패 시 std::runtime_error (create() 는 ConfigError 로 변환).
    StructuredLogger(LogLevel                     min_level,
                     const std::filesystem::path& log_path,
                     std::size_t                  max_file_size = 10 * 1024 * 1024,
                     std::size_t                  max_files     = 5);

    // 싱크 직접 주입 (테스트용 ostream_sink 등)
    StructuredLogger(LogLevel min_level, std::vector<spdlog::sink_ptr> sinks);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // create
    //   LoggingConfig 로부터 로거를 만든다. 레벨 이름 오류, 로그 디렉터리
    //   생성 실패, 파일 열기 실패는 kInvalidValue.
    [[nodiscard]] static std::expected<std::shared_ptr<StructuredLogger>, ConfigError>
    create(const LoggingConfig& config);

    // log_decision
    //   감사 레코드를 JSON 한 줄로 기록한다. REJECT 는 warn, 나머지는 info.
    void log_decision(const AuditRecord& record);

    // log_alert
    //   보안 경보를 warn 레벨 JSON 한 줄로 기록한다.
    void log_alert(const SecurityAlert& alert);

    // 내부 진단용 spdlog 래퍼
    //   클라이언트 데이터(SQL 원문 등)를 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    void flush();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

    // spdlog 기본 로거로 등록할 때 사용 (라이브러리 모듈의 spdlog:: 진단 출력을
    // 같은 싱크로 모은다)
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& spdlog_logger() const noexcept { return logger_; }

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
