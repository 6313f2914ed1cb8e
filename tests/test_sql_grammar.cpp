// ---------------------------------------------------------------------------
// test_sql_grammar.cpp
//
// parse_sql_statement / statement_kind 단위 테스트.
//
// [테스트 범위]
// - 구문 종류별 트리 형태 (SELECT, INSERT, UPDATE, DELETE, DDL, 유틸리티)
// - 서브쿼리 위치 (FROM, WHERE, SELECT 목록, 괄호 조인)
// - 테이블 함수 인자 해석, WITH 스칼라 별칭, 괄호 없는 IN 테이블
// - 지원하지 않는 형식의 실패 코드 (세 부분 이름, SELECT INTO)
// - 중첩 깊이 상한
// ---------------------------------------------------------------------------

#include "parser/sql_grammar.hpp"

#include <gtest/gtest.h>
#include <string>
#include <variant>

namespace {

Statement parse_ok(std::string_view sql) {
    auto result = parse_sql_statement(sql);
    EXPECT_TRUE(result.has_value())
        << "parse failed for: " << sql << " (" << (result ? "" : result.error().message) << ")";
    if (!result) {
        return Statement{SelectStatement{}};
    }
    return std::move(*result);
}

ParseError parse_err(std::string_view sql) {
    auto result = parse_sql_statement(sql);
    EXPECT_FALSE(result.has_value()) << "expected failure for: " << sql;
    if (result) {
        return ParseError{};
    }
    return result.error();
}

const QueryBlock& first_block(const SelectStatement& select) {
    return std::get<QueryBlock>(select.operands.front());
}

}  // namespace

// ---------------------------------------------------------------------------
// SELECT
// ---------------------------------------------------------------------------

TEST(SqlGrammar, SimpleSelect) {
    const auto stmt = parse_ok("SELECT id, name FROM users WHERE id = 1");
    ASSERT_TRUE(std::holds_alternative<SelectStatement>(stmt.node));
    EXPECT_EQ(statement_kind(stmt), OperationKind::kSelect);

    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    ASSERT_EQ(block.from.size(), 1u);
    const auto& table = std::get<NamedTable>(block.from[0]);
    EXPECT_FALSE(table.name.database.has_value());
    EXPECT_EQ(table.name.table, "users");
}

TEST(SqlGrammar, QualifiedNameAndAlias) {
    const auto stmt  = parse_ok("SELECT u.id FROM `app`.users AS u");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    ASSERT_EQ(block.from.size(), 1u);
    const auto& table = std::get<NamedTable>(block.from[0]);
    EXPECT_EQ(table.name.database, "app");
    EXPECT_EQ(table.name.table, "users");
    EXPECT_EQ(table.alias, "u");
}

TEST(SqlGrammar, JoinsCollectEveryFactor) {
    const auto stmt = parse_ok(
        "SELECT * FROM a GLOBAL ANY LEFT OUTER JOIN b ON a.id = b.id "
        "INNER JOIN c USING (id), d");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    ASSERT_EQ(block.from.size(), 4u);
    EXPECT_EQ(std::get<NamedTable>(block.from[1]).name.table, "b");
    EXPECT_EQ(std::get<NamedTable>(block.from[2]).name.table, "c");
    EXPECT_EQ(std::get<NamedTable>(block.from[3]).name.table, "d");
}

TEST(SqlGrammar, ParenthesisedJoinIsNotAnExpression) {
    const auto stmt = parse_ok("SELECT * FROM (a JOIN b ON a.x = b.x) WHERE a.y > 1");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    EXPECT_EQ(block.from.size(), 2u);
}

TEST(SqlGrammar, FunctionNamedLikeClauseKeyword) {
    const auto stmt = parse_ok("SELECT LEFT(name, 3), RIGHT(name, 1) FROM users");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    ASSERT_EQ(block.from.size(), 1u) << "LEFT( 는 함수 호출이지 조인이 아님";
    EXPECT_EQ(std::get<NamedTable>(block.from[0]).name.table, "users");
}

TEST(SqlGrammar, DerivedTableInFrom) {
    const auto stmt = parse_ok("SELECT * FROM (SELECT id FROM inner_t) AS sub");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    ASSERT_EQ(block.from.size(), 1u);
    const auto& derived = std::get<DerivedTable>(block.from[0]);
    ASSERT_NE(derived.query, nullptr);
    EXPECT_EQ(derived.alias, "sub");
}

TEST(SqlGrammar, SubqueriesInExpressions) {
    const auto stmt = parse_ok(
        "SELECT (SELECT max(x) FROM m) AS top FROM t "
        "WHERE id IN (SELECT id FROM s) AND EXISTS (SELECT 1 FROM e)");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    std::size_t subqueries = 0;
    for (const auto& expr : block.expressions) {
        subqueries += expr.subqueries.size();
    }
    EXPECT_EQ(subqueries, 3u);
}

TEST(SqlGrammar, UnionOperands) {
    const auto stmt = parse_ok("SELECT a FROM x UNION ALL (SELECT a FROM y) ORDER BY a LIMIT 5");
    const auto& select = std::get<SelectStatement>(stmt.node);
    ASSERT_EQ(select.operands.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<QueryBlock>(select.operands[0]));
    EXPECT_TRUE(std::holds_alternative<std::unique_ptr<SelectStatement>>(select.operands[1]));
}

TEST(SqlGrammar, WithClauseAndRecursive) {
    const auto stmt = parse_ok(
        "WITH RECURSIVE r(n) AS (SELECT 1 UNION ALL SELECT n + 1 FROM r), "
        "s AS (SELECT * FROM base) SELECT * FROM r JOIN s ON 1 = 1");
    const auto& select = std::get<SelectStatement>(stmt.node);
    EXPECT_TRUE(select.recursive);
    ASSERT_EQ(select.ctes.size(), 2u);
    EXPECT_EQ(select.ctes[0].name, "r");
    EXPECT_EQ(select.ctes[1].name, "s");
}

TEST(SqlGrammar, ClickHouseClauses) {
    parse_ok("SELECT count() FROM events FINAL SAMPLE 0.1 PREWHERE d > today() - 7 "
             "GROUP BY k WITH TOTALS LIMIT 10 SETTINGS max_threads = 4 FORMAT JSON");
    parse_ok("SELECT id, tag FROM t ARRAY JOIN tags AS tag");
}

TEST(SqlGrammar, TrailingSemicolonAccepted) {
    parse_ok("SELECT 1;");
}

// ---------------------------------------------------------------------------
// DML
// ---------------------------------------------------------------------------

TEST(SqlGrammar, InsertValues) {
    const auto stmt = parse_ok("INSERT INTO db.t (a, b) VALUES (1, 'x'), (2, 'y')");
    ASSERT_TRUE(std::holds_alternative<InsertStatement>(stmt.node));
    EXPECT_EQ(statement_kind(stmt), OperationKind::kInsert);
    const auto& insert = std::get<InsertStatement>(stmt.node);
    EXPECT_EQ(insert.target.database, "db");
    EXPECT_EQ(insert.target.table, "t");
    EXPECT_EQ(insert.source, nullptr);
}

TEST(SqlGrammar, InsertSelect) {
    const auto stmt = parse_ok("INSERT INTO archive SELECT * FROM live WHERE old = 1");
    const auto& insert = std::get<InsertStatement>(stmt.node);
    EXPECT_EQ(insert.target.table, "archive");
    ASSERT_NE(insert.source, nullptr);
}

TEST(SqlGrammar, WithBeforeInsertUpdateDelete) {
    EXPECT_EQ(statement_kind(parse_ok("WITH c AS (SELECT 1) INSERT INTO t SELECT * FROM c")),
              OperationKind::kInsert);
    EXPECT_EQ(statement_kind(parse_ok("WITH c AS (SELECT 1) UPDATE t SET a = 1")),
              OperationKind::kUpdate);
    EXPECT_EQ(statement_kind(parse_ok("WITH c AS (SELECT 1) DELETE FROM t")),
              OperationKind::kDelete);
}

TEST(SqlGrammar, UpdateWithJoin) {
    const auto stmt = parse_ok("UPDATE a JOIN b ON a.id = b.id SET a.x = b.x WHERE b.y = 1");
    const auto& update = std::get<UpdateStatement>(stmt.node);
    EXPECT_EQ(update.targets.size(), 2u);
}

TEST(SqlGrammar, DeleteForms) {
    const auto single = parse_ok("DELETE FROM logs WHERE ts < 10 LIMIT 100");
    EXPECT_EQ(std::get<DeleteStatement>(single.node).from.size(), 1u);

    const auto multi = parse_ok("DELETE t1 FROM t1 JOIN t2 ON t1.id = t2.id");
    EXPECT_EQ(std::get<DeleteStatement>(multi.node).from.size(), 2u);

    const auto using_form = parse_ok("DELETE FROM t1 USING t1, t2 WHERE t1.id = t2.id");
    EXPECT_EQ(std::get<DeleteStatement>(using_form.node).using_.size(), 2u);
}

// ---------------------------------------------------------------------------
// DDL
// ---------------------------------------------------------------------------

TEST(SqlGrammar, CreateTableAsSelect) {
    const auto stmt = parse_ok(
        "CREATE TABLE IF NOT EXISTS db.copy ENGINE = MergeTree ORDER BY id AS SELECT * FROM src");
    ASSERT_TRUE(std::holds_alternative<DdlStatement>(stmt.node));
    const auto& ddl = std::get<DdlStatement>(stmt.node);
    EXPECT_EQ(ddl.kind, OperationKind::kCreate);
    ASSERT_EQ(ddl.tables.size(), 1u);
    EXPECT_EQ(ddl.tables[0].database, "db");
    EXPECT_EQ(ddl.tables[0].table, "copy");
    EXPECT_NE(ddl.query, nullptr);
}

TEST(SqlGrammar, CreateTableLike) {
    const auto stmt = parse_ok("CREATE TABLE t2 LIKE t1");
    const auto& ddl = std::get<DdlStatement>(stmt.node);
    ASSERT_EQ(ddl.tables.size(), 2u);
    EXPECT_EQ(ddl.tables[1].table, "t1");
}

TEST(SqlGrammar, DropMultipleTablesAndDatabase) {
    const auto tables = parse_ok("DROP TABLE IF EXISTS a, b.c");
    const auto& ddl = std::get<DdlStatement>(tables.node);
    EXPECT_EQ(ddl.kind, OperationKind::kDrop);
    EXPECT_EQ(ddl.tables.size(), 2u);

    const auto db = parse_ok("DROP DATABASE analytics");
    const auto& db_ddl = std::get<DdlStatement>(db.node);
    EXPECT_EQ(db_ddl.object, DdlObject::kDatabase);
    ASSERT_EQ(db_ddl.databases.size(), 1u);
    EXPECT_EQ(db_ddl.databases[0], "analytics");
}

TEST(SqlGrammar, AlterRenameAddsTarget) {
    const auto stmt = parse_ok("ALTER TABLE old_name RENAME TO new_name");
    const auto& ddl = std::get<DdlStatement>(stmt.node);
    EXPECT_EQ(ddl.kind, OperationKind::kAlter);
    ASSERT_EQ(ddl.tables.size(), 2u);
    EXPECT_EQ(ddl.tables[1].table, "new_name");
}

TEST(SqlGrammar, TruncateAndIndex) {
    EXPECT_EQ(statement_kind(parse_ok("TRUNCATE TABLE t")), OperationKind::kTruncate);
    const auto index = parse_ok("CREATE UNIQUE INDEX idx ON t (a)");
    const auto& ddl = std::get<DdlStatement>(index.node);
    EXPECT_EQ(ddl.object, DdlObject::kIndex);
    ASSERT_EQ(ddl.tables.size(), 1u);
    EXPECT_EQ(ddl.tables[0].table, "t");
}

// ---------------------------------------------------------------------------
// 유틸리티
// ---------------------------------------------------------------------------

TEST(SqlGrammar, UtilityKinds) {
    EXPECT_EQ(statement_kind(parse_ok("SHOW TABLES FROM db")), OperationKind::kShow);
    EXPECT_EQ(statement_kind(parse_ok("USE analytics")), OperationKind::kUse);
    EXPECT_EQ(statement_kind(parse_ok("SET max_threads = 8")), OperationKind::kSet);
    EXPECT_EQ(statement_kind(parse_ok("KILL QUERY WHERE query_id = 'x'")), OperationKind::kKill);
    EXPECT_EQ(statement_kind(parse_ok("DESC users")), OperationKind::kDescribe);
    EXPECT_EQ(statement_kind(parse_ok("EXISTS TABLE db.t")), OperationKind::kExists);
    EXPECT_EQ(statement_kind(parse_ok("CHECK TABLE t1, t2")), OperationKind::kCheck);
}

TEST(SqlGrammar, ExplainWrapsInnerStatement) {
    const auto stmt = parse_ok("EXPLAIN PLAN SELECT * FROM t");
    EXPECT_EQ(statement_kind(stmt), OperationKind::kExplain);
    const auto& utility = std::get<UtilityStatement>(stmt.node);
    ASSERT_NE(utility.inner, nullptr);
    EXPECT_EQ(statement_kind(*utility.inner), OperationKind::kSelect);
}

TEST(SqlGrammar, DescribeTableRecordsTable) {
    const auto stmt = parse_ok("DESCRIBE TABLE db.users");
    const auto& utility = std::get<UtilityStatement>(stmt.node);
    ASSERT_EQ(utility.tables.size(), 1u);
    EXPECT_EQ(utility.tables[0].database, "db");
}

// ---------------------------------------------------------------------------
// 테이블 함수
// ---------------------------------------------------------------------------

namespace {

const TableFunction& table_function(const QueryBlock& block, std::size_t index) {
    return std::get<TableFunction>(block.from.at(index));
}

}  // namespace

TEST(SqlGrammar, UnknownTableFunctionUsesSentinelDatabase) {
    const auto stmt  = parse_ok("SELECT * FROM analytics.ok, secretdb.secret, Numbers(1) AS n");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    ASSERT_EQ(block.from.size(), 3u);
    EXPECT_EQ(std::get<NamedTable>(block.from[1]).name.table, "secret");

    const auto& function = table_function(block, 2);
    EXPECT_EQ(function.name, "Numbers");
    EXPECT_EQ(function.alias, "n");
    ASSERT_EQ(function.tables.size(), 1u);
    EXPECT_EQ(function.tables[0].database, std::string(kTableFunctionDatabase));
    EXPECT_EQ(function.tables[0].table, "numbers");
}

TEST(SqlGrammar, RemoteAndClusterArgumentsResolved) {
    struct Case {
        const char* sql;
        const char* database;
        const char* table;
    };
    const Case cases[] = {
        {"SELECT * FROM remote('10.0.0.1:9000', secretdb.secret)", "secretdb", "secret"},
        {"SELECT * FROM remoteSecure('h', secretdb, 'secret', 'u', 'p')", "secretdb", "secret"},
        {"SELECT * FROM cluster('default', secretdb, secret)", "secretdb", "secret"},
        {"SELECT * FROM clusterAllReplicas(c, `secretdb`.`secret`)", "secretdb", "secret"},
    };
    for (const auto& c : cases) {
        const auto stmt   = parse_ok(c.sql);
        const auto& block = first_block(std::get<SelectStatement>(stmt.node));
        const auto& function = table_function(block, 0);
        ASSERT_EQ(function.tables.size(), 1u) << c.sql;
        EXPECT_EQ(function.tables[0].database, c.database) << c.sql;
        EXPECT_EQ(function.tables[0].table, c.table) << c.sql;
    }
}

TEST(SqlGrammar, UnresolvableRemoteArgumentsUseSentinel) {
    const auto stmt   = parse_ok("SELECT * FROM remote('h', currentDatabase(), t)");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    const auto& function = table_function(block, 0);
    ASSERT_EQ(function.tables.size(), 1u);
    EXPECT_EQ(function.tables[0].database, std::string(kTableFunctionDatabase));
    EXPECT_EQ(function.tables[0].table, "remote");
}

TEST(SqlGrammar, MergeRequiresDatabaseAndFunction) {
    const auto stmt   = parse_ok("SELECT * FROM merge(logs, '^events_')");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    const auto& function = table_function(block, 0);
    ASSERT_EQ(function.tables.size(), 2u);
    EXPECT_EQ(function.tables[0].database, "logs");
    EXPECT_EQ(function.tables[0].table, std::string(kPatternTable));
    EXPECT_EQ(function.tables[1].database, std::string(kTableFunctionDatabase));
    EXPECT_EQ(function.tables[1].table, "merge");
}

TEST(SqlGrammar, TableFunctionSubqueryArgumentCollected) {
    const auto stmt   = parse_ok("SELECT * FROM view(SELECT * FROM secretdb.secret) AS v");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    ASSERT_EQ(block.expressions.size(), 1u);
    ASSERT_EQ(block.expressions[0].subqueries.size(), 1u);
    const auto& inner = first_block(*block.expressions[0].subqueries[0]);
    EXPECT_EQ(std::get<NamedTable>(inner.from[0]).name.database, "secretdb");
}

TEST(SqlGrammar, InsertIntoFunctionTargets) {
    const auto stmt = parse_ok("INSERT INTO TABLE FUNCTION remote('h', db.t) VALUES (1)");
    EXPECT_EQ(statement_kind(stmt), OperationKind::kInsert);
    const auto& insert = std::get<InsertStatement>(stmt.node);
    ASSERT_EQ(insert.function_targets.size(), 1u);
    EXPECT_EQ(insert.function_targets[0].database, "db");
    EXPECT_EQ(insert.function_targets[0].table, "t");
}

TEST(SqlGrammar, CreateAsTableFunction) {
    const auto stmt = parse_ok("CREATE TABLE copy AS remote('h', secretdb.secret)");
    const auto& ddl = std::get<DdlStatement>(stmt.node);
    ASSERT_EQ(ddl.tables.size(), 2u);
    EXPECT_EQ(ddl.tables[0].table, "copy");
    EXPECT_EQ(ddl.tables[1].database, "secretdb");
    EXPECT_EQ(ddl.tables[1].table, "secret");
}

// ---------------------------------------------------------------------------
// WITH 스칼라 별칭, IN 테이블
// ---------------------------------------------------------------------------

TEST(SqlGrammar, ScalarWithAliasIsNotCte) {
    const auto stmt   = parse_ok("WITH 1 AS one SELECT * FROM analytics.ok, secretdb.secret");
    const auto& select = std::get<SelectStatement>(stmt.node);
    EXPECT_TRUE(select.ctes.empty());
    const auto& block = first_block(select);
    ASSERT_EQ(block.from.size(), 2u);
    EXPECT_EQ(std::get<NamedTable>(block.from[1]).name.table, "secret");
}

TEST(SqlGrammar, ScalarWithSubqueryKept) {
    const auto stmt = parse_ok(
        "WITH (SELECT max(ts) FROM secretdb.log) AS last, c AS (SELECT 1) SELECT last FROM c");
    const auto& select = std::get<SelectStatement>(stmt.node);
    ASSERT_EQ(select.ctes.size(), 1u);
    EXPECT_EQ(select.ctes[0].name, "c");
    ASSERT_EQ(select.modifiers.size(), 1u);
    ASSERT_EQ(select.modifiers[0].subqueries.size(), 1u);
}

TEST(SqlGrammar, ScalarWithFunctionCall) {
    const auto stmt = parse_ok("WITH toDate('2024-01-01') AS d, now() AS ts SELECT d, ts");
    EXPECT_TRUE(std::get<SelectStatement>(stmt.node).ctes.empty());
}

TEST(SqlGrammar, ScalarWithMissingAliasFails) {
    parse_err("WITH 1 SELECT 2");
}

TEST(SqlGrammar, InWithoutParenthesesCollectsTable) {
    const auto stmt   = parse_ok("SELECT * FROM t WHERE x GLOBAL NOT IN secretdb.secret AND y = 1");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    ASSERT_EQ(block.expressions.size(), 1u);
    ASSERT_EQ(block.expressions[0].tables.size(), 1u);
    EXPECT_EQ(block.expressions[0].tables[0].database, "secretdb");
    EXPECT_EQ(block.expressions[0].tables[0].table, "secret");
}

TEST(SqlGrammar, InListAndFunctionAreNotTables) {
    const auto stmt = parse_ok(
        "SELECT * FROM t WHERE x IN (1, 2) AND y IN tuple(3, 4) "
        "AND MATCH(a) AGAINST ('k' IN BOOLEAN MODE)");
    const auto& block = first_block(std::get<SelectStatement>(stmt.node));
    EXPECT_TRUE(block.expressions.empty());
}

// ---------------------------------------------------------------------------
// 실패
// ---------------------------------------------------------------------------

TEST(SqlGrammar, EmptyStatementFails) {
    const auto err = parse_err("  -- only a comment\n");
    EXPECT_EQ(err.code, ParseErrorCode::kUnexpectedEnd);
}

TEST(SqlGrammar, QualifiedTableFunctionUnsupported) {
    EXPECT_EQ(parse_err("SELECT * FROM db.numbers(10)").code,
              ParseErrorCode::kUnsupportedStatement);
}

TEST(SqlGrammar, ThreePartNameUnsupported) {
    EXPECT_EQ(parse_err("SELECT * FROM cat.db.t").code, ParseErrorCode::kUnsupportedStatement);
}

TEST(SqlGrammar, SelectIntoUnsupported) {
    EXPECT_EQ(parse_err("SELECT a INTO @v FROM t").code, ParseErrorCode::kUnsupportedStatement);
}

TEST(SqlGrammar, UnknownStatementUnsupported) {
    const auto err = parse_err("GRANT SELECT ON db.* TO bob");
    EXPECT_EQ(err.code, ParseErrorCode::kUnsupportedStatement);
    EXPECT_NE(err.message.find("GRANT"), std::string::npos);
}

TEST(SqlGrammar, TrailingGarbageFails) {
    const auto err = parse_err("SELECT 1 FROM t )");
    EXPECT_EQ(err.code, ParseErrorCode::kUnexpectedToken);
    EXPECT_FALSE(err.context.empty());
}

TEST(SqlGrammar, TruncatedStatementFails) {
    EXPECT_EQ(parse_err("SELECT * FROM").code, ParseErrorCode::kUnexpectedEnd);
}

TEST(SqlGrammar, LexerErrorPropagates) {
    EXPECT_EQ(parse_err("SELECT 'open").code, ParseErrorCode::kUnterminatedToken);
}

TEST(SqlGrammar, NestingDepthLimited) {
    std::string sql = "SELECT * FROM t WHERE x = ";
    for (int i = 0; i < 300; ++i) {
        sql += "(";
    }
    sql += "1";
    for (int i = 0; i < 300; ++i) {
        sql += ")";
    }
    const auto err = parse_err(sql);
    EXPECT_EQ(err.code, ParseErrorCode::kUnsupportedStatement);
}

TEST(SqlGrammar, ModerateNestingAccepted) {
    std::string sql = "SELECT * FROM t WHERE x = ";
    for (int i = 0; i < 20; ++i) {
        sql += "(";
    }
    sql += "1";
    for (int i = 0; i < 20; ++i) {
        sql += ")";
    }
    parse_ok(sql);
}
