// ---------------------------------------------------------------------------
// audit_emitter.cpp
// ---------------------------------------------------------------------------

#include "audit/audit_emitter.hpp"

#include <exception>
#include <future>
#include <utility>

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace {

// emit/flush 가 running_ 확인부터 post 완료까지 머무는 구간
class InFlight {
public:
    explicit InFlight(std::atomic<std::size_t>& counter) noexcept
        : counter_(counter) {
        counter_.fetch_add(1);
    }
    ~InFlight() {
        if (counter_.fetch_sub(1) == 1) {
            counter_.notify_all();
        }
    }

    InFlight(const InFlight&)            = delete;
    InFlight& operator=(const InFlight&) = delete;

private:
    std::atomic<std::size_t>& counter_;
};

}  // namespace

AuditEmitter::AuditEmitter(std::shared_ptr<AuditSink> sink, const AuditConfig& config)
    : sink_(std::move(sink))
    , max_pending_(config.max_pending)
    , monitor_(config.alerts)
    , strand_(asio::make_strand(pool_))
{
    if (!sink_) {
        spdlog::warn("audit_emitter: no sink configured, audit records will be counted as failures");
    }
}

AuditEmitter::~AuditEmitter() {
    shutdown();
}

void AuditEmitter::emit(AuditRecord record) noexcept {
    emitted_.fetch_add(1, std::memory_order_relaxed);

    const InFlight guard(inflight_);
    if (!running_.load()) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    if (pending_.fetch_add(1, std::memory_order_acq_rel) >= max_pending_) {
        pending_.fetch_sub(1, std::memory_order_acq_rel);
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    try {
        asio::post(strand_, [this, record = std::move(record)]() { deliver(record); });
    } catch (const std::exception& e) {
        // post 실패(메모리 부족 등)는 드롭으로 집계
        pending_.fetch_sub(1, std::memory_order_acq_rel);
        dropped_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("audit_emitter: failed to queue audit record: {}", e.what());
    }
}

void AuditEmitter::deliver(const AuditRecord& record) {
    pending_.fetch_sub(1, std::memory_order_acq_rel);

    if (!sink_) {
        sink_failures_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    try {
        if (sink_->write(record)) {
            written_.fetch_add(1, std::memory_order_relaxed);
        } else {
            sink_failures_.fetch_add(1, std::memory_order_relaxed);
        }

        for (const auto& alert : monitor_.observe(record)) {
            alerts_.fetch_add(1, std::memory_order_relaxed);
            if (!sink_->write_alert(alert)) {
                sink_failures_.fetch_add(1, std::memory_order_relaxed);
            }
        }
    } catch (const std::exception& e) {
        sink_failures_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("audit_emitter: sink '{}' failed: {}", sink_->name(), e.what());
    }
}

void AuditEmitter::flush() {
    std::future<void> future;
    {
        const InFlight guard(inflight_);
        if (!running_.load()) {
            return;
        }

        // strand 는 FIFO 이므로 이 작업이 실행되면 앞선 레코드는 모두 처리된 것
        auto done = std::make_shared<std::promise<void>>();
        future    = done->get_future();
        asio::post(strand_, [this, done]() {
            if (sink_) {
                try {
                    sink_->flush();
                } catch (const std::exception& e) {
                    sink_failures_.fetch_add(1, std::memory_order_relaxed);
                    spdlog::error("audit_emitter: sink flush failed: {}", e.what());
                }
            }
            done->set_value();
        });
    }
    // post 가 끝났으므로 shutdown 의 join 전에 반드시 실행된다
    future.wait();
}

void AuditEmitter::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    // running_ 을 보고 들어온 emit/flush 가 post 를 마칠 때까지 기다린다.
    // 이후의 호출은 running_ == false 를 보므로 join 된 풀에 post 하지 않는다.
    for (auto n = inflight_.load(); n != 0; n = inflight_.load()) {
        inflight_.wait(n);
    }

    asio::post(strand_, [this]() {
        if (sink_) {
            try {
                sink_->flush();
            } catch (const std::exception& e) {
                spdlog::error("audit_emitter: sink flush failed during shutdown: {}", e.what());
            }
        }
    });
    // stop() 없이 join → 남은 작업을 모두 처리한 뒤 반환
    pool_.join();

    const auto s = stats();
    spdlog::debug("audit_emitter: shut down, emitted={} written={} dropped={} sink_failures={}",
                  s.emitted, s.written, s.dropped, s.sink_failures);
}

AuditEmitter::Stats AuditEmitter::stats() const noexcept {
    return Stats{
        .emitted       = emitted_.load(std::memory_order_relaxed),
        .written       = written_.load(std::memory_order_relaxed),
        .dropped       = dropped_.load(std::memory_order_relaxed),
        .sink_failures = sink_failures_.load(std::memory_order_relaxed),
        .alerts        = alerts_.load(std::memory_order_relaxed),
    };
}
