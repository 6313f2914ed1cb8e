#pragma once

// ---------------------------------------------------------------------------
// validation_stats.hpp
//
// 검증 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_request / on_statement: 여러 validate() 호출에서 concurrent 호출 안전.
// - snapshot(): 갱신 경로와 contention 없이 읽기 가능.
//
// [격리 원칙]
// - 통계 수집 실패가 판정 실패로 전파되지 않도록
//   모든 갱신 메서드는 noexcept 로 선언한다.
// - 판정에 영향을 주지 않는다 (관측 전용).
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

#include "parser/statement_types.hpp"  // ParseStrategy

// ---------------------------------------------------------------------------
// ValidationSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   denial_rate: denied_requests / total_requests (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct ValidationSnapshot {
    std::uint64_t                         total_requests{0};
    std::uint64_t                         denied_requests{0};
    std::uint64_t                         statements_analysed{0};
    std::uint64_t                         heuristic_parses{0};
    double                                denial_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class ValidationStats {
public:
    ValidationStats() noexcept
        : total_requests_{0}
        , denied_requests_{0}
        , statements_analysed_{0}
        , heuristic_parses_{0}
    {}

    ~ValidationStats() = default;

    // 복사 금지 (atomic 은 복사 불가)
    ValidationStats(const ValidationStats&)            = delete;
    ValidationStats& operator=(const ValidationStats&) = delete;

    ValidationStats(ValidationStats&&)            = delete;
    ValidationStats& operator=(ValidationStats&&) = delete;

    // on_request
    //   validate() 판정 완료 시 호출. denied: 거부된 요청이면 true
    void on_request(bool denied) noexcept {
        total_requests_.fetch_add(1, std::memory_order_relaxed);
        if (denied) {
            denied_requests_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // on_statement
    //   구문 하나를 분석할 때마다 호출.
    void on_statement(ParseStrategy strategy) noexcept {
        statements_analysed_.fetch_add(1, std::memory_order_relaxed);
        if (strategy == ParseStrategy::kHeuristic) {
            heuristic_parses_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    [[nodiscard]] ValidationSnapshot snapshot() const noexcept {
        const auto total    = total_requests_.load(std::memory_order_relaxed);
        const auto denied   = denied_requests_.load(std::memory_order_relaxed);
        const auto analysed = statements_analysed_.load(std::memory_order_relaxed);
        const auto fallback = heuristic_parses_.load(std::memory_order_relaxed);

        double denial_rate = 0.0;
        if (total > 0) {
            denial_rate = static_cast<double>(denied) / static_cast<double>(total);
        }

        return ValidationSnapshot{
            .total_requests      = total,
            .denied_requests     = denied,
            .statements_analysed = analysed,
            .heuristic_parses    = fallback,
            .denial_rate         = denial_rate,
            .captured_at         = std::chrono::system_clock::now(),
        };
    }

private:
    std::atomic<std::uint64_t> total_requests_;
    std::atomic<std::uint64_t> denied_requests_;
    std::atomic<std::uint64_t> statements_analysed_;
    std::atomic<std::uint64_t> heuristic_parses_;
};
