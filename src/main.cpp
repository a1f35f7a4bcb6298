#include "audit/audit_emitter.hpp"
#include "audit/audit_sink.hpp"
#include "gate/query_gate.hpp"
#include "logger/structured_logger.hpp"
#include "policy/policy_loader.hpp"

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// querygate [config.yaml]
//
// 표준 입력에서 한 줄에 SQL 하나를 읽어 판정 JSON 한 줄을 표준 출력에 쓴다.
// 진단 로그는 stderr (와 설정된 로그 파일) 로만 나간다.
//
// 종료 코드
//   0: 입력 끝까지 처리
//   2: 설정 오류 (정책 없이 기동하지 않는다)
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitConfigError = 2;

std::optional<std::string> env_str(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return std::string(val);
    }
    return std::nullopt;
}

int fail_config(const ConfigError& error) {
    spdlog::critical("configuration error [{}] {}: {}", to_string(error.code), error.context, error.message);
    return kExitConfigError;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 기동 로거: stdout 은 판정 출력 전용 ───────────────────────────────
    spdlog::set_default_logger(spdlog::stderr_logger_mt("querygate-boot"));

    // ── 설정 로드 (인자 > QUERYGATE_CONFIG > 기본값, 그 위에 환경변수) ────
    std::optional<std::filesystem::path> config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const auto env_path = env_str("QUERYGATE_CONFIG")) {
        config_path = *env_path;
    }

    auto config = PolicyLoader::resolve(config_path, PolicyLoader::process_environment());
    if (!config) {
        return fail_config(config.error());
    }
    if (const auto log_path = env_str("QUERYGATE_LOG_PATH")) {
        config->logging.file_path = *log_path;
    }
    if (const auto log_level = env_str("QUERYGATE_LOG_LEVEL")) {
        config->logging.level = *log_level;
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    auto logger = StructuredLogger::create(config->logging);
    if (!logger) {
        return fail_config(logger.error());
    }
    spdlog::set_default_logger((*logger)->spdlog_logger());

    // ── 규칙 로드 ───────────────────────────────────────────────────────
    auto library = PolicyLoader::load_library(*config);
    if (!library) {
        return fail_config(library.error());
    }

    spdlog::info("Starting querygate");
    spdlog::info("Config: {}", config_path ? config_path->string() : std::string("<defaults>"));
    spdlog::info("Rules: {} ({} rules)", (*library)->version(), (*library)->size());
    spdlog::info("Log level: {}", config->logging.level);

    // ── 감사 출력기 + 게이트 ────────────────────────────────────────────
    std::shared_ptr<AuditEmitter> emitter;
    if (config->audit.enabled) {
        emitter = std::make_shared<AuditEmitter>(std::make_shared<LoggerAuditSink>(*logger), config->audit);
    }
    QueryGate gate{make_snapshot(*config, *library), emitter};

    // ── 입력 처리 ───────────────────────────────────────────────────────
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const Decision decision = gate.validate(line);
        std::cout << to_json(decision) << '\n' << std::flush;
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    if (emitter) {
        emitter->shutdown();
    }
    const auto stats = gate.stats();
    spdlog::info("querygate finished: total={} allowed={} rewritten={} rejected={} bypassed={}",
                 stats.total, stats.allowed, stats.rewritten, stats.rejected, stats.bypassed);
    (*logger)->flush();

    return EXIT_SUCCESS;
}
