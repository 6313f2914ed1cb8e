#pragma once

// ---------------------------------------------------------------------------
// system_object_reconciler.hpp
//
// 추출된 TableReference 를 권한 검사에 쓸 (database, table) 쌍으로 확정한다.
// 추출기가 db.table 을 잘못 나눈 경우와 ClickHouse system 테이블을 보정한다.
//
// [적용 순서] 순서대로 적용하며 앞 단계 결과가 뒤 단계의 입력이다.
// 0. database 없으면 default_database, table 없으면 "*".
// 1. database 가 없었고 table != "*" 이며 db 가 기본값이면, 구문 원문에서
//    db.table 패턴(DDL TABLE / FROM|JOIN|INTO|UPDATE / TABLE / SELECT ... FROM)을
//    순서대로 찾아 table 이 같은 첫 결과를 채택한다.
// 2. (1 안에서) 여전히 기본값이면 "<table>.<x>" 형태를 찾아,
//    추출기가 database 를 table 로 착각한 경우를 되돌린다.
// 3. table == "system" 이고 db != "system" 이면 FROM system.<x> 를 찾는다.
// 4. table 이 알려진 system 테이블 이름이면 database 를 "system" 으로 강제한다.
// 5. db == "system" 인데 table 이 "system" 또는 "*" 이면 FROM system.<x> 로 채운다.
//
// [알려진 한계]
// - 1, 2 단계는 원문 전체에서 첫 일치만 본다. 같은 테이블 이름이 여러
//   database 에 걸쳐 나오면 첫 번째 database 로 확정된다.
// - 4 단계 때문에 사용자 테이블 이름이 system 테이블과 같으면(users, tables ...)
//   system database 로 검사된다. grant store 는 system database 를 기본 허용하지
//   않아야 한다 (RuleGrantStore 의 allow_system_databases 기본값 false).
// - 정규식 '.' 는 줄바꿈을 넘지 않는다. SELECT 와 FROM 이 다른 줄이면
//   SELECT ... FROM 패턴은 일치하지 않는다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

#include "parser/statement_types.hpp"

inline constexpr std::string_view kSystemDatabase = "system";
inline constexpr std::string_view kWildcardTable  = "*";

struct ResolvedTable {
    std::string database{};
    std::string table{};

    bool operator==(const ResolvedTable&) const = default;
};

// reconcile_table_reference
//   default_database: 이미 확정된 유효 기본 DB (호출자가 "default" 대체까지 적용)
//   결정적이며 부작용이 없다. 참조를 버리지 않는다.
[[nodiscard]] ResolvedTable reconcile_table_reference(const TableReference& ref,
                                                      std::string_view      statement,
                                                      std::string_view      default_database);

// ClickHouse system database 의 알려진 테이블 이름인지 (소문자 비교)
[[nodiscard]] bool is_known_system_table(std::string_view table);
