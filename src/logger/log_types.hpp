#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - policy/ 헤더를 include 하지 않는다. AccessValidator 가 판정 결과를
//   문자열/정수로 풀어서 채운다.
//
// [민감정보 취급 주의]
// - raw_sql 은 원문 SQL 전체를 포함한다. 운영 환경에서 로그 레벨/마스킹
//   정책을 별도로 적용할 것.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ValidationLog
//   validate() 한 번의 판정 결과. 허용/거부 모두 기록한다.
//   tables: "db.table" 형태, 구문 순서대로 (구문 간 중복 포함)
// ---------------------------------------------------------------------------
struct ValidationLog {
    std::uint64_t                         request_id{0};
    std::string                           user_id{};
    std::string                           connection_id{};
    std::string                           raw_sql{};         // 원문 SQL (마스킹 주의)
    std::size_t                           statement_count{0};
    std::vector<std::string>              tables{};
    std::size_t                           heuristic_statements{0};  // 휴리스틱 경로로 분석된 구문 수
    bool                                  allowed{false};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};       // 판정 소요 시간
};

// ---------------------------------------------------------------------------
// DenialLog
//   거부 이벤트.
//   statement_index: 0-based, 구문 이전 단계에서 거부되면 nullopt
//   reason: 호출자에게 돌려준 거부 사유와 같다
// ---------------------------------------------------------------------------
struct DenialLog {
    std::uint64_t                         request_id{0};
    std::string                           user_id{};
    std::string                           connection_id{};
    std::string                           raw_sql{};         // 원문 SQL (마스킹 주의)
    std::optional<std::size_t>            statement_index{};
    std::string                           reason{};
    std::chrono::system_clock::time_point timestamp{};
};
