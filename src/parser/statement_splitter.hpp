#pragma once

// ---------------------------------------------------------------------------
// statement_splitter.hpp
//
// 멀티 스테이트먼트 SQL 문자열을 개별 구문 문자열로 분리한다.
//
// [보안 원칙]
// - 한 배치 안에 허용된 SELECT 뒤로 DROP 같은 구문을 숨기는 piggyback 공격을
//   막기 위해, validator 는 이 함수가 돌려준 구문 각각을 독립적으로 검사한다.
// - 따옴표/백틱/주석 내부의 세미콜론은 절대 구문 구분자로 취급하지 않는다.
//
// [알려진 한계]
// - MySQL 의 # 주석과 DELIMITER 지시어는 지원하지 않는다.
// - 중첩 블록 주석은 지원하지 않는다 (첫 번째 */ 에서 종료).
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

// split_statements
//   sql 을 세미콜론 기준으로 나눈 뒤 앞뒤 공백을 제거한 비어있지 않은 구문 목록을
//   원래 순서대로 반환한다. 주석 텍스트는 구문 문자열에 그대로 남는다.
//   어떤 입력에도 예외를 던지지 않는다.
[[nodiscard]] std::vector<std::string> split_statements(std::string_view sql);
