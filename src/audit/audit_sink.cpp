// ---------------------------------------------------------------------------
// audit_sink.cpp
// ---------------------------------------------------------------------------

#include "audit/audit_sink.hpp"

#include <utility>

#include "logger/structured_logger.hpp"

LoggerAuditSink::LoggerAuditSink(std::shared_ptr<StructuredLogger> logger)
    : logger_(std::move(logger))
{}

bool LoggerAuditSink::write(const AuditRecord& record) {
    if (!logger_) {
        return false;
    }
    logger_->log_decision(record);
    return true;
}

bool LoggerAuditSink::write_alert(const SecurityAlert& alert) {
    if (!logger_) {
        return false;
    }
    logger_->log_alert(alert);
    return true;
}

void LoggerAuditSink::flush() {
    if (logger_) {
        logger_->flush();
    }
}
