#pragma once

// ---------------------------------------------------------------------------
// statement_types.hpp
//
// 파서/정책 계층이 공유하는 구문 분석 결과 타입.
// 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// OperationKind
//   구문의 동작 종류. kUnknown 은 분류 실패를 나타내며
//   access_type 계층에서 kMisc 로 매핑되어 비관리자에게는 항상 거부된다.
// ---------------------------------------------------------------------------
enum class OperationKind : std::uint8_t {
    kSelect   = 0,
    kInsert   = 1,
    kUpdate   = 2,
    kDelete   = 3,
    kCreate   = 4,
    kDrop     = 5,
    kAlter    = 6,
    kTruncate = 7,
    kShow     = 8,
    kDescribe = 9,
    kUse      = 10,
    kSet      = 11,
    kExplain  = 12,
    kExists   = 13,
    kCheck    = 14,
    kKill     = 15,
    kUnknown  = 16,
};

// ---------------------------------------------------------------------------
// TableReference
//   구문이 참조하는 테이블 하나.
//   database 가 없으면 구문에 명시되지 않은 것이다 (기본 DB 적용 전).
//   데이터베이스 단위 DDL 은 table == "*" 로 표현한다.
// ---------------------------------------------------------------------------
struct TableReference {
    std::optional<std::string> database{};
    std::string                table{};  // 항상 비어있지 않음

    bool operator==(const TableReference&) const = default;
};

// ---------------------------------------------------------------------------
// ParseStrategy
//   어떤 경로로 결과를 얻었는지 기록한다.
//   kHeuristic 결과는 정확도가 낮으므로 diagnostics 에 실패 원인이 남는다.
// ---------------------------------------------------------------------------
enum class ParseStrategy : std::uint8_t {
    kGrammar   = 0,  // 토크나이저 + 재귀 하강 문법
    kHeuristic = 1,  // 키워드 접두사 분류 + 정규식 추출
};

// ---------------------------------------------------------------------------
// ParsedStatement
//   SqlParser::parse 의 결과. 파싱 실패도 이 타입으로 표현된다.
// ---------------------------------------------------------------------------
struct ParsedStatement {
    std::string                 text{};                          // 원문 구문
    OperationKind               kind{OperationKind::kUnknown};
    std::vector<TableReference> tables{};                        // 등장 순서, 완전 중복 제거
    std::vector<std::string>    diagnostics{};                   // fallback 사유
    ParseStrategy               strategy{ParseStrategy::kGrammar};
};
