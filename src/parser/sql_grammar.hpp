#pragma once

// ---------------------------------------------------------------------------
// sql_grammar.hpp
//
// 재귀 하강 방식의 MySQL/ClickHouse 호환 구문 파서.
// sql_lexer 의 토큰 스트림을 sql_ast 의 Statement 트리로 변환한다.
//
// [설계 원칙]
// - 식(expression)은 괄호 균형만 맞추며 건너뛴다. 괄호 안이 SELECT/WITH 로
//   시작하면 어디서든 서브쿼리로 파싱한다 (SELECT 목록, WHERE, HAVING, SET ...).
//   FROM 절만 재귀하는 것보다 넓게 수집하는 보수적 선택이다.
// - 문법이 인식하지 못하는 구문/절은 ParseError 로 실패한다. 추측으로 채우지 않는다.
//   호출자(SqlParser)는 실패 시 정규식 fallback 으로 내려간다.
// - 중첩 깊이는 상한이 있다. 초과 시 kUnsupportedStatement 로 실패한다.
// - 테이블 함수(FROM numbers(10), remote(...), INSERT INTO FUNCTION f(...))는
//   인자에서 대상 테이블을 해석한다. 해석할 수 없으면 kTableFunctionDatabase 를 쓴다.
// - WITH 항목은 name AS ( SELECT ... ) 이면 CTE, 그 외에는 <expr> AS name 스칼라 별칭이다.
//
// [알려진 한계]
// - 괄호 없는 IN 의 오른쪽 이름은 항상 테이블로 수집한다.
//   WITH 스칼라 별칭을 가리키는 경우에도 마찬가지다 (과잉 수집).
// - db.func(...) 처럼 한정된 테이블 함수 이름은 실패 처리.
// - REPLACE, RENAME, SYSTEM, GRANT 등 목록에 없는 구문은 실패 처리.
// - 세 부분 이름(catalog.db.table)은 실패 처리.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>

#include "common/types.hpp"   // ParseError
#include "parser/sql_ast.hpp"

// parse_sql_statement
//   단일 구문(세미콜론 하나는 끝에 허용)을 파싱한다.
//   예외를 던지지 않는다 (메모리 부족 제외).
[[nodiscard]] std::expected<Statement, ParseError>
parse_sql_statement(std::string_view sql);
