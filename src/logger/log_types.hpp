#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템 공용 타입.
//
// [순환 의존성 방지 설계]
// - spdlog 헤더를 include 하지 않는다. spdlog 레벨 변환은
//   structured_logger.cpp 안에서만 수행한다.
// - 설정 로더(policy_loader)는 이 헤더만 보고 로그 레벨 문자열을 검증한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string_view>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 의 logging.level 또는
//   QUERYGATE_LOG_LEVEL 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kTrace    = 0,
    kDebug    = 1,
    kInfo     = 2,
    kWarn     = 3,
    kError    = 4,
    kCritical = 5,
    kOff      = 6,
};

// parse_log_level
//   "trace" | "debug" | "info" | "warn" | "warning" | "error" | "critical" | "off"
//   대소문자 무관. 알 수 없는 이름이면 std::nullopt.
[[nodiscard]] inline std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (iequals(name, "trace"))    return LogLevel::kTrace;
    if (iequals(name, "debug"))    return LogLevel::kDebug;
    if (iequals(name, "info"))     return LogLevel::kInfo;
    if (iequals(name, "warn") || iequals(name, "warning")) return LogLevel::kWarn;
    if (iequals(name, "error"))    return LogLevel::kError;
    if (iequals(name, "critical")) return LogLevel::kCritical;
    if (iequals(name, "off"))      return LogLevel::kOff;
    return std::nullopt;
}

[[nodiscard]] inline std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kTrace:    return "trace";
        case LogLevel::kDebug:    return "debug";
        case LogLevel::kInfo:     return "info";
        case LogLevel::kWarn:     return "warn";
        case LogLevel::kError:    return "error";
        case LogLevel::kCritical: return "critical";
        case LogLevel::kOff:      return "off";
    }
    return "info";
}
