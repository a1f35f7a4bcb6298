#pragma once

// ---------------------------------------------------------------------------
// gate_stats.hpp
//
// 검증 결과 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_decision: 검증 경로에서 concurrent 호출 안전 (atomic 사용).
// - snapshot(): 조회 경로. 갱신 경로와 contention 없이 읽기 가능.
//   카운터별 relaxed 로드이므로 스냅샷 안의 값끼리 순간적으로
//   어긋날 수 있다 (total 이 allowed+rejected+rewritten 보다 1 클 수 있음).
//
// [격리 원칙]
// - 통계 갱신 실패가 검증 결과로 전파되지 않도록 갱신 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// GateStatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   qps       : 생성(또는 reset) 이후 평균 초당 검증 수
//   block_rate: rejected / total (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct GateStatsSnapshot {
    std::uint64_t total{0};
    std::uint64_t allowed{0};
    std::uint64_t rejected{0};
    std::uint64_t rewritten{0};
    std::uint64_t bypassed{0};      // 검증 비활성 상태에서 통과한 쿼리
    std::uint64_t high_risk{0};     // tier >= high
    std::array<std::uint64_t, kAttackCategoryCount> category_hits{};
    double        qps{0.0};
    double        block_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};

    [[nodiscard]] std::uint64_t hits(AttackCategory category) const noexcept {
        return category_hits[category_index(category)];
    }
};

class GateStats {
public:
    GateStats() noexcept
        : window_start_(std::chrono::steady_clock::now())
    {}

    ~GateStats() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    GateStats(const GateStats&)            = delete;
    GateStats& operator=(const GateStats&) = delete;
    GateStats(GateStats&&)                 = delete;
    GateStats& operator=(GateStats&&)      = delete;

    // on_decision
    //   검증 1건 완료 시 호출. categories 는 Decision::categories.
    template <typename CategoryRange>
    void on_decision(Verdict verdict, RiskTier tier, const CategoryRange& categories,
                     bool bypassed) noexcept {
        total_.fetch_add(1, std::memory_order_relaxed);
        switch (verdict) {
            case Verdict::kAllow:
                allowed_.fetch_add(1, std::memory_order_relaxed);
                break;
            case Verdict::kRewriteSuggested:
                rewritten_.fetch_add(1, std::memory_order_relaxed);
                break;
            case Verdict::kReject:
                rejected_.fetch_add(1, std::memory_order_relaxed);
                break;
        }
        if (bypassed) {
            bypassed_.fetch_add(1, std::memory_order_relaxed);
        }
        if (tier == RiskTier::kHigh || tier == RiskTier::kCritical) {
            high_risk_.fetch_add(1, std::memory_order_relaxed);
        }
        for (const auto category : categories) {
            category_hits_[category_index(category)].fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] GateStatsSnapshot snapshot() const noexcept {
        GateStatsSnapshot snap;
        snap.total       = total_.load(std::memory_order_relaxed);
        snap.allowed     = allowed_.load(std::memory_order_relaxed);
        snap.rejected    = rejected_.load(std::memory_order_relaxed);
        snap.rewritten   = rewritten_.load(std::memory_order_relaxed);
        snap.bypassed    = bypassed_.load(std::memory_order_relaxed);
        snap.high_risk   = high_risk_.load(std::memory_order_relaxed);
        for (std::size_t i = 0; i < category_hits_.size(); ++i) {
            snap.category_hits[i] = category_hits_[i].load(std::memory_order_relaxed);
        }
        snap.captured_at = std::chrono::system_clock::now();

        const double elapsed_sec = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - window_start_.load()).count();
        if (elapsed_sec > 0.0) {
            snap.qps = static_cast<double>(snap.total) / elapsed_sec;
        }
        if (snap.total > 0) {
            snap.block_rate = static_cast<double>(snap.rejected) / static_cast<double>(snap.total);
        }
        return snap;
    }

    // reset
    //   테스트 및 운영자 요청용. 진행 중인 on_decision 과 경합하면
    //   일부 증가분이 reset 이전/이후 어느 쪽에 반영될지 정해지지 않는다.
    void reset() noexcept {
        total_.store(0, std::memory_order_relaxed);
        allowed_.store(0, std::memory_order_relaxed);
        rejected_.store(0, std::memory_order_relaxed);
        rewritten_.store(0, std::memory_order_relaxed);
        bypassed_.store(0, std::memory_order_relaxed);
        high_risk_.store(0, std::memory_order_relaxed);
        for (auto& hits : category_hits_) {
            hits.store(0, std::memory_order_relaxed);
        }
        window_start_.store(std::chrono::steady_clock::now());
    }

private:
    std::atomic<std::uint64_t> total_{0};
    std::atomic<std::uint64_t> allowed_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::atomic<std::uint64_t> rewritten_{0};
    std::atomic<std::uint64_t> bypassed_{0};
    std::atomic<std::uint64_t> high_risk_{0};
    std::array<std::atomic<std::uint64_t>, kAttackCategoryCount> category_hits_{};

    std::atomic<std::chrono::steady_clock::time_point> window_start_;
};
