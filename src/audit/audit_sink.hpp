#pragma once

// ---------------------------------------------------------------------------
// audit_sink.hpp
//
// 감사 레코드 출력 대상 추상화.
//
// [스레드 안전성]
// AuditEmitter 의 strand 에서만 호출되므로 구현체는 내부 잠금이 필요 없다.
// 구현체를 emitter 밖에서 직접 공유하는 경우는 호출자 책임.
//
// [실패 처리]
// write / write_alert 가 false 를 반환하거나 예외를 던지면 emitter 가
// sink_failures 로 집계하고 다음 레코드로 진행한다. 감사 출력 실패가
// 검증 결과로 전파되지 않는다.
// ---------------------------------------------------------------------------

#include <memory>
#include <string>

#include "audit/audit_record.hpp"

class StructuredLogger;

class AuditSink {
public:
    virtual ~AuditSink() = default;

    // 레코드 1건 기록. 성공 시 true.
    [[nodiscard]] virtual bool write(const AuditRecord& record) = 0;

    // 보안 경보 기록. 성공 시 true.
    [[nodiscard]] virtual bool write_alert(const SecurityAlert& alert) = 0;

    virtual void flush() = 0;

    // 로그 표기용 이름 (예: "logger")
    [[nodiscard]] virtual std::string name() const = 0;
};

// ---------------------------------------------------------------------------
// LoggerAuditSink
//   StructuredLogger 로 JSON 한 줄씩 기록한다. 기본 싱크.
// ---------------------------------------------------------------------------
class LoggerAuditSink final : public AuditSink {
public:
    explicit LoggerAuditSink(std::shared_ptr<StructuredLogger> logger);
    ~LoggerAuditSink() override = default;

    LoggerAuditSink(const LoggerAuditSink&)            = delete;
    LoggerAuditSink& operator=(const LoggerAuditSink&) = delete;

    [[nodiscard]] bool write(const AuditRecord& record) override;
    [[nodiscard]] bool write_alert(const SecurityAlert& alert) override;
    void flush() override;
    [[nodiscard]] std::string name() const override { return "logger"; }

private:
    std::shared_ptr<StructuredLogger> logger_;
};
