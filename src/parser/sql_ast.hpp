#pragma once

// ---------------------------------------------------------------------------
// sql_ast.hpp
//
// sql_grammar 가 생성하는 구문 트리.
//
// [설계 원칙]
// - 접근 제어에 필요한 정보만 보존한다: 테이블 이름, CTE 정의, 서브쿼리.
//   컬럼/연산자/리터럴은 버린다. Expression 은 그 안에서 발견된 서브쿼리만 가진다.
// - 닫힌 구문 집합을 std::variant 로 표현한다. 새 구문 종류를 추가하면
//   std::visit 호출부가 컴파일 단계에서 누락을 드러낸다.
// - 모든 하위 노드는 std::unique_ptr 로 단독 소유한다. 트리는 생성 후 불변이다.
// ---------------------------------------------------------------------------

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "parser/statement_types.hpp"  // OperationKind

struct SelectStatement;
struct Statement;

// db.table 또는 table
struct TableName {
    std::optional<std::string> database{};
    std::string                table{};
};

// 테이블 함수 인자에서 대상 테이블을 알 수 없을 때 쓰는 database 이름.
// '$' 로 시작하므로 따옴표 없는 식별자나 glob 패턴과 우연히 일치하지 않는다.
// 이 database 를 명시적으로 허용한 규칙만 통과시킨다.
inline constexpr std::string_view kTableFunctionDatabase = "$table_function";

// merge(db, 'regex') 처럼 테이블을 정규식으로 고르는 경우의 table 이름.
// 테이블 패턴이 "*" 인 규칙만 일치한다.
inline constexpr std::string_view kPatternTable = "$pattern";

// 서브쿼리와 IN 오른쪽 테이블만 보존된 식.
//   subqueries: ( SELECT ... ) 가 중첩된 순서대로
//   tables    : x [GLOBAL] [NOT] IN db.table 의 테이블 (괄호 없는 ClickHouse 형식)
struct Expression {
    std::vector<std::unique_ptr<SelectStatement>> subqueries{};
    std::vector<TableName>                        tables{};
};

struct CommonTableExpression {
    std::string                      name{};
    std::unique_ptr<SelectStatement> body{};
};

// FROM 절의 실제 테이블
struct NamedTable {
    TableName                  name{};
    std::optional<std::string> alias{};
};

// FROM ( SELECT ... ) AS alias
struct DerivedTable {
    std::unique_ptr<SelectStatement> query{};
    std::optional<std::string>       alias{};
};

// FROM numbers(10), remote('host', db, t), merge(db, '^t'), ...
// tables 는 인자에서 해석한 실제 대상이다. 해석할 수 없으면
// {kTableFunctionDatabase, 함수 이름(소문자)} 하나가 들어간다.
// merge 는 {db, kPatternTable} 과 {kTableFunctionDatabase, "merge"} 둘 다 가진다.
struct TableFunction {
    std::string                name{};
    std::vector<TableName>     tables{};
    std::optional<std::string> alias{};
};

using TableFactor = std::variant<NamedTable, DerivedTable, TableFunction>;

// SELECT ... FROM ... WHERE ... 한 블록.
// from 에는 FROM 항목과 JOIN 오른쪽 항목이 등장 순서대로 평탄화되어 들어간다.
struct QueryBlock {
    std::vector<TableFactor> from{};
    std::vector<Expression>  expressions{};  // select list, ON, WHERE, GROUP BY, HAVING ...
};

// UNION/EXCEPT/INTERSECT 의 피연산자. 괄호로 감싼 select 는 중첩 구문이다.
using SetOperand = std::variant<QueryBlock, std::unique_ptr<SelectStatement>>;

struct SelectStatement {
    bool                               recursive{false};
    std::vector<CommonTableExpression> ctes{};
    std::vector<SetOperand>            operands{};
    std::vector<Expression>            modifiers{};  // ORDER BY, LIMIT, SETTINGS ...
};

struct InsertStatement {
    std::vector<CommonTableExpression> ctes{};
    TableName                          target{};
    std::vector<TableName>             function_targets{};  // INSERT INTO FUNCTION f(...) 일 때
    std::unique_ptr<SelectStatement>   source{};       // INSERT ... SELECT 일 때만
    std::vector<Expression>            expressions{};  // VALUES, SET, ON DUPLICATE KEY UPDATE
};

struct UpdateStatement {
    std::vector<CommonTableExpression> ctes{};
    std::vector<TableFactor>           targets{};
    std::vector<Expression>            expressions{};
};

struct DeleteStatement {
    std::vector<CommonTableExpression> ctes{};
    std::vector<TableFactor>           from{};   // FROM 절 (다중 테이블 형식 포함)
    std::vector<TableFactor>           using_{}; // USING 절
    std::vector<Expression>            expressions{};
};

enum class DdlObject : std::uint8_t {
    kTable    = 0,
    kView     = 1,
    kDatabase = 2,
    kIndex    = 3,
};

// CREATE / DROP / ALTER / TRUNCATE
struct DdlStatement {
    OperationKind                    kind{OperationKind::kUnknown};
    DdlObject                        object{DdlObject::kTable};
    std::vector<TableName>           tables{};      // 대상 테이블 + AS/LIKE/TO 로 참조한 테이블
    std::vector<std::string>         databases{};   // 데이터베이스 단위 DDL 대상
    std::unique_ptr<SelectStatement> query{};       // CREATE ... AS SELECT
    std::vector<Expression>          expressions{};
};

// SHOW, DESCRIBE, USE, SET, EXPLAIN, EXISTS, CHECK, KILL
struct UtilityStatement {
    OperationKind              kind{OperationKind::kUnknown};
    std::vector<TableName>     tables{};
    std::unique_ptr<Statement> inner{};  // EXPLAIN 대상 구문
    std::vector<Expression>    expressions{};
};

struct Statement {
    std::variant<SelectStatement, InsertStatement, UpdateStatement,
                 DeleteStatement, DdlStatement, UtilityStatement> node;
};

// statement_kind
//   트리 루트의 OperationKind. 분류는 문법이 인식한 구문 종류를 그대로 따른다.
[[nodiscard]] OperationKind statement_kind(const Statement& stmt) noexcept;
