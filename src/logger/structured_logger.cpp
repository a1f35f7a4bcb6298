// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <stdexcept>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "querygate";

// 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 패턴은 타임스탬프 + 레벨만
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kTrace:    return spdlog::level::trace;
        case LogLevel::kDebug:    return spdlog::level::debug;
        case LogLevel::kInfo:     return spdlog::level::info;
        case LogLevel::kWarn:     return spdlog::level::warn;
        case LogLevel::kError:    return spdlog::level::err;
        case LogLevel::kCritical: return spdlog::level::critical;
        case LogLevel::kOff:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   std::size_t                  max_file_size,
                                   std::size_t                  max_files)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        if (!log_path_.empty()) {
            // 로그 디렉터리 생성
            if (log_path_.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(log_path_.parent_path(), ec);
                if (ec) {
                    throw std::runtime_error(fmt::format("cannot create log directory '{}': {}",
                                                         log_path_.parent_path().string(), ec.message()));
                }
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), max_file_size, max_files));
        }

        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level_));
        logger_->set_pattern(kPattern);
        // 감사 로그는 유실되면 안 되므로 warn 이상은 즉시 플러시
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::StructuredLogger(LogLevel min_level, std::vector<spdlog::sink_ptr> sinks)
    : min_level_(min_level)
    , logger_(std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end()))
{
    logger_->set_level(to_spdlog_level(min_level_));
    logger_->set_pattern("%v");
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

std::expected<std::shared_ptr<StructuredLogger>, ConfigError>
StructuredLogger::create(const LoggingConfig& config) {
    const auto level = parse_log_level(config.level);
    if (!level) {
        return std::unexpected(ConfigError{ConfigErrorCode::kInvalidValue,
                                           fmt::format("unknown log level '{}'", config.level),
                                           "logging.level"});
    }
    try {
        return std::make_shared<StructuredLogger>(*level, std::filesystem::path(config.file_path),
                                                  config.max_file_size, config.max_files);
    } catch (const std::runtime_error& e) {
        return std::unexpected(ConfigError{ConfigErrorCode::kInvalidValue, e.what(), config.file_path});
    }
}

// ---------------------------------------------------------------------------
// log_decision / log_alert: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_decision(const AuditRecord& record) {
    if (!logger_) {
        return;
    }
    const auto level = record.verdict == Verdict::kReject ? spdlog::level::warn : spdlog::level::info;
    if (!logger_->should_log(level)) {
        return;
    }
    logger_->log(level, to_json(record));
}

void StructuredLogger::log_alert(const SecurityAlert& alert) {
    if (!logger_ || !logger_->should_log(spdlog::level::warn)) {
        return;
    }
    logger_->warn(to_json(alert));
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

void StructuredLogger::set_level(LogLevel level) {
    min_level_ = level;
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
    }
}
