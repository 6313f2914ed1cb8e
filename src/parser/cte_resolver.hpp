#pragma once

// ---------------------------------------------------------------------------
// cte_resolver.hpp
//
// 구문 트리에서 실제 테이블 참조를 수집하면서 CTE 이름을 걸러낸다.
//
// [스코프 규칙]
// - CTE 이름은 대소문자 무시로 비교한다 (소문자로 정규화해 보관).
// - 스코프는 값으로 복사되어 중첩 본문에 전달된다. 안쪽 WITH 가 추가한 이름은
//   바깥으로 새어 나가지 않는다.
// - CTE 이름은 자기 본문을 수집하기 전에 스코프에 들어간다 (재귀 CTE).
//   뒤쪽 CTE 본문은 앞쪽 형제 CTE 이름을 볼 수 있다.
// - database 가 명시된 참조(db.cte)는 CTE 로 보지 않는다.
//
// [보안 원칙]
// - INSERT/UPDATE/DELETE/DDL 의 대상 테이블은 CTE 이름과 같아도 제외하지 않는다.
//   쓰기 대상이 CTE 가 될 수는 없으므로 같은 이름은 실제 테이블이다.
// ---------------------------------------------------------------------------

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "parser/sql_ast.hpp"
#include "parser/statement_types.hpp"

using CteScope = std::set<std::string>;

// ---------------------------------------------------------------------------
// TableCollector
//   Statement 트리를 순회해 TableReference 목록을 만든다.
//   결과는 등장 순서를 유지하며 중복 제거는 호출자 몫이다.
// ---------------------------------------------------------------------------
class TableCollector {
public:
    TableCollector()  = default;
    ~TableCollector() = default;

    TableCollector(const TableCollector&)            = delete;
    TableCollector& operator=(const TableCollector&) = delete;
    TableCollector(TableCollector&&)                 = default;
    TableCollector& operator=(TableCollector&&)      = default;

    [[nodiscard]] std::vector<TableReference> collect(const Statement& stmt);

private:
    void visit_statement(const Statement& stmt, const CteScope& scope);
    void visit_select(const SelectStatement& select, CteScope scope);
    CteScope enter_ctes(const std::vector<CommonTableExpression>& ctes, CteScope scope);
    void visit_block(const QueryBlock& block, const CteScope& scope);
    // as_targets: UPDATE/DELETE 의 테이블 목록. CTE 이름으로 걸러내지 않는다.
    void visit_factors(const std::vector<TableFactor>& factors, const CteScope& scope,
                       bool as_targets);
    void visit_expressions(const std::vector<Expression>& exprs, const CteScope& scope);

    // scope 를 검사해 읽기 참조를 추가한다.
    void add_source(const TableName& name, const CteScope& scope);
    // 쓰기/DDL 대상과 테이블 함수 대상. CTE 검사 없이 추가한다.
    void add_target(const TableName& name);

    std::vector<TableReference> tables_;
};

// extract_cte_names
//   문법 파싱이 실패한 구문에서 CTE 이름을 찾는다 (소문자).
//   주석과 문자열 리터럴을 지운 텍스트에서 모든 WITH 위치를 검사하며
//   괄호 깊이를 추적하는 상태 머신으로 name [(cols)] AS ( ... ) , ... 를 읽는다.
[[nodiscard]] CteScope extract_cte_names(std::string_view sql);

[[nodiscard]] std::string to_lower_ascii(std::string_view s);
