#pragma once

// ---------------------------------------------------------------------------
// sql_parser.hpp
//
// 단일 SQL 구문을 분류하고 참조 테이블을 추출한다.
//
// [두 단계 전략]
// 1. 문법 경로: sql_lexer + sql_grammar 로 구문 트리를 만들고
//    TableCollector 가 CTE 를 걸러내며 테이블을 수집한다.
// 2. 휴리스틱 경로: 문법이 실패하면 첫 키워드 접두사로 분류하고
//    정해진 순서의 정규식으로 테이블을 추출한다. CTE 이름은
//    extract_cte_names 로 찾아 제외한다. 실패 원인은 diagnostics 에 남는다.
//
// [오탐/미탐 트레이드오프]
// - 휴리스틱 경로는 별칭, 컬럼명, 식별자 일부(date_from x)를 테이블로 잡을 수 있다.
//   추가로 잡힌 참조는 권한 검사에서 거부로 이어질 뿐이므로 보수적 방향이다.
// - 휴리스틱 경로는 서브쿼리 구조를 모른다. 정규식 키워드 뒤에 오지 않는
//   테이블은 놓친다 (알려진 한계).
// - WITH 로 시작하는 구문은 휴리스틱 경로에서 항상 select 로 분류된다.
//   문법 경로는 WITH ... INSERT/UPDATE/DELETE 를 올바르게 분류한다.
// ---------------------------------------------------------------------------

#include <string_view>
#include <vector>

#include "parser/statement_types.hpp"

// ---------------------------------------------------------------------------
// SqlParser
//   상태가 없으므로 여러 스레드에서 같은 인스턴스를 동시에 사용해도 안전하다.
// ---------------------------------------------------------------------------
class SqlParser {
public:
    SqlParser()  = default;
    ~SqlParser() = default;

    // 복사/이동 허용 (stateless)
    SqlParser(const SqlParser&)            = default;
    SqlParser& operator=(const SqlParser&) = default;
    SqlParser(SqlParser&&)                 = default;
    SqlParser& operator=(SqlParser&&)      = default;

    // parse
    //   statement: split_statements 가 돌려준 구문 하나
    //   반환: 항상 ParsedStatement. 분류할 수 없으면 kind == kUnknown.
    //   어떤 입력에도 예외를 던지지 않는다 (메모리 부족 제외).
    [[nodiscard]] ParsedStatement parse(std::string_view statement) const;
};

// classify_statement_prefix
//   휴리스틱 분류. 앞뒤 공백 제거 후 대문자 접두사로 판정한다.
//   SELECT/WITH → select, DESCRIBE/DESC → describe, 그 외 키워드는 같은 이름.
[[nodiscard]] OperationKind classify_statement_prefix(std::string_view statement) noexcept;

// extract_tables_heuristic
//   휴리스틱 테이블 추출. 공백을 하나로 접은 텍스트에 다음 순서로 정규식을 적용한다:
//   FROM, INTO, UPDATE, (DROP|CREATE|ALTER|TRUNCATE) TABLE, TABLE, JOIN
//   각 키워드마다 db.table 패턴 다음에 table 패턴.
//   CTE 이름과 같은 테이블은 제외한다. 중복 제거는 하지 않는다.
[[nodiscard]] std::vector<TableReference> extract_tables_heuristic(std::string_view statement);

// operation_kind_to_string
//   "select", "insert", ... "unknown" (거부 사유 메시지 및 로그용)
[[nodiscard]] std::string_view operation_kind_to_string(OperationKind kind) noexcept;
