#pragma once

// ---------------------------------------------------------------------------
// audit_emitter.hpp
//
// 검증 경로와 감사 I/O 를 분리하는 비동기 감사 출력기.
//
// [구조]
//   [검증 스레드 1..N] --emit()--> asio::post(strand) --> [감사 스레드 1개]
//                                                          ├─ AuditSink::write
//                                                          └─ AlertMonitor::observe → write_alert
//   단일 스레드 thread_pool + strand 이므로 싱크와 AlertMonitor 는 잠금 없이
//   순서대로 실행된다.
//
// [설계 원칙]
// - emit() 은 I/O 를 기다리지 않는다 (noexcept, post 후 즉시 반환).
// - 대기 중인 레코드가 max_pending 이상이면 새 레코드를 버리고 dropped 로
//   집계한다. 감사 적체가 검증 지연으로 번지지 않게 한다.
// - 싱크 실패는 sink_failures 로 집계만 하고 검증 결과에는 영향이 없다.
//
// [수명]
// 소멸자는 shutdown() 을 호출한다 (대기 레코드 처리 후 스레드 join).
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "audit/alert_monitor.hpp"
#include "audit/audit_record.hpp"
#include "audit/audit_sink.hpp"
#include "policy/policy_config.hpp"

namespace asio = boost::asio;

class AuditEmitter {
public:
    struct Stats {
        std::uint64_t emitted{0};        // emit() 호출 수
        std::uint64_t written{0};        // 싱크 기록 성공
        std::uint64_t dropped{0};        // 적체 또는 shutdown 이후 버림
        std::uint64_t sink_failures{0};  // 싱크 false 반환 / 예외
        std::uint64_t alerts{0};         // 발생한 보안 경보 수
    };

    // sink 가 nullptr 이면 모든 레코드를 sink_failures 로 집계한다.
    AuditEmitter(std::shared_ptr<AuditSink> sink, const AuditConfig& config);
    ~AuditEmitter();

    // 복사/이동 금지 (스레드 소유)
    AuditEmitter(const AuditEmitter&)            = delete;
    AuditEmitter& operator=(const AuditEmitter&) = delete;
    AuditEmitter(AuditEmitter&&)                 = delete;
    AuditEmitter& operator=(AuditEmitter&&)      = delete;

    // emit
    //   레코드를 감사 스레드로 넘긴다. 블로킹하지 않는다.
    void emit(AuditRecord record) noexcept;

    // flush
    //   호출 시점까지 emit 된 레코드가 모두 싱크에 기록될 때까지 기다린다.
    //   shutdown() 과 경합하면 즉시 반환하거나 최종 drain 전에 처리된다 (교착 없음).
    //   감사 스레드 안에서 호출하면 안 된다 (교착).
    void flush();

    // shutdown
    //   대기 레코드를 모두 처리하고 스레드를 join 한다. 이후 emit 은 dropped.
    //   여러 번 호출해도 안전하다.
    void shutdown();

    [[nodiscard]] Stats stats() const noexcept;

private:
    // 감사 스레드(strand) 에서만 실행
    void deliver(const AuditRecord& record);

    std::shared_ptr<AuditSink>                      sink_;
    std::size_t                                     max_pending_;
    AlertMonitor                                    monitor_;  // strand 전용

    asio::thread_pool                               pool_{1};
    asio::strand<asio::thread_pool::executor_type>  strand_;

    // running_ 과 inflight_ 는 seq_cst 로 접근한다. emit/flush 는 inflight_ 증가 후
    // running_ 을 읽고, shutdown 은 running_ 을 내린 뒤 inflight_ == 0 을 기다린다.
    std::atomic<bool>          running_{true};
    std::atomic<std::size_t>   inflight_{0};
    std::atomic<std::size_t>   pending_{0};
    std::atomic<std::uint64_t> emitted_{0};
    std::atomic<std::uint64_t> written_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> sink_failures_{0};
    std::atomic<std::uint64_t> alerts_{0};
};
