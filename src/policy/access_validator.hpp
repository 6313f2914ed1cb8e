#pragma once

// ---------------------------------------------------------------------------
// access_validator.hpp
//
// 여러 구문으로 된 SQL 을 구문 단위로 나누어 요청자의 역할 권한과
// 객체 단위 권한(GrantStore)을 검사하고 하나의 판정을 내린다.
//
// [fail-close 원칙: 절대 위반 금지]
// 1. 분류할 수 없는 구문(kUnknown) → kMisc → 비관리자에게 항상 거부
// 2. GrantStore 오류(std::unexpected) → 거부
// 3. GrantStore 미주입(nullptr) → 객체 검사가 필요한 모든 구문 거부
// 4. 첫 번째로 실패한 구문에서 즉시 중단한다. 이후 구문은 파싱도, 권한
//    조회도 하지 않는다 (뒤쪽 객체의 접근 가능 여부가 드러나지 않도록).
//
// [판정 순서 (validate)]
//   관리자 → 허용
//   user_id 없음 → 거부 (인증 필요)
//   구문 0개 → 거부
//   구문마다: 파싱 → 접근 종류 → 역할 권한 군 검사 → 테이블 중복 제거
//            → 시스템 객체 보정 → 테이블마다 GrantStore::check (순차)
//
// [알려진 한계]
// - 테이블 참조가 0개인 구문(SET, SHOW DATABASES 등)은 역할 권한 검사만으로
//   허용된다. 객체 단위로 검사할 대상이 없기 때문이다.
//
// [순환 의존성: 무순환 구조]
// access_validator.hpp → grant_store.hpp / sql_parser.hpp / structured_logger.hpp
// ❌ grant_store.hpp → access_validator.hpp 금지
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "logger/structured_logger.hpp"
#include "parser/sql_parser.hpp"
#include "policy/access_type.hpp"
#include "policy/grant_store.hpp"
#include "policy/system_object_reconciler.hpp"
#include "stats/validation_stats.hpp"

// ---------------------------------------------------------------------------
// ValidationResult
//   statement_index: 처음 실패한 구문의 0-based 인덱스. 허용이면 nullopt.
//   reason: 거부 사유. 허용이면 nullopt.
// ---------------------------------------------------------------------------
struct ValidationResult {
    bool                       allowed{false};  // 기본값 거부 (fail-close)
    std::optional<std::string> reason{};
    std::optional<std::size_t> statement_index{};
};

class AccessValidator {
public:
    // grant_store        : 객체 단위 권한 저장소 (nullptr 이면 객체 검사는 모두 거부)
    // families           : 역할 권한 → 접근 종류 매핑
    // fallback_database  : validate() 에 기본 DB 가 없을 때 쓰는 이름
    // logger / stats     : 선택. nullptr 이면 기록하지 않는다.
    AccessValidator(std::shared_ptr<GrantStore>       grant_store,
                    PermissionFamilies                families,
                    std::string                       fallback_database = "default",
                    std::shared_ptr<StructuredLogger> logger            = nullptr,
                    std::shared_ptr<ValidationStats>  stats             = nullptr);

    ~AccessValidator() = default;

    AccessValidator(const AccessValidator&)            = delete;
    AccessValidator& operator=(const AccessValidator&) = delete;
    AccessValidator(AccessValidator&&)                 = default;
    AccessValidator& operator=(AccessValidator&&)      = default;

    // validate
    //   sql 전체(여러 구문 가능)에 대한 판정. 예외를 던지지 않는다.
    [[nodiscard]] ValidationResult validate(const Principal&                  principal,
                                            std::string_view                  sql,
                                            const std::optional<std::string>& default_database,
                                            const ConnectionContext&          connection) const;

    // check_database_access / check_table_access
    //   관리자는 항상 true. user_id 가 없으면 std::invalid_argument.
    [[nodiscard]] bool check_database_access(const Principal&         principal,
                                             const std::string&       database,
                                             const ConnectionContext& connection,
                                             AccessType               access = AccessType::kRead) const;

    [[nodiscard]] bool check_table_access(const Principal&         principal,
                                          const std::string&       database,
                                          const std::string&       table,
                                          const ConnectionContext& connection,
                                          AccessType               access = AccessType::kRead) const;

    // filter_databases
    //   관리자는 전부. 그 외에는 읽기가 허용된 DB 만, 시스템 DB 는 항상 제외.
    //   user_id 가 없으면 std::invalid_argument.
    [[nodiscard]] std::vector<std::string>
    filter_databases(const Principal&                principal,
                     const std::vector<std::string>& databases,
                     const ConnectionContext&        connection) const;

    // filter_tables
    //   관리자는 전부. 시스템 DB 는 빈 목록. 그 외에는 읽기가 허용된 테이블만.
    //   user_id 가 없으면 std::invalid_argument.
    [[nodiscard]] std::vector<std::string>
    filter_tables(const Principal&                principal,
                  const std::string&              database,
                  const std::vector<std::string>& tables,
                  const ConnectionContext&        connection) const;

    // query_access_type / extract_tables
    //   sql 을 구문 하나로 보고 분석한다 (분리하지 않음).
    [[nodiscard]] AccessType                  query_access_type(std::string_view sql) const;
    [[nodiscard]] std::vector<TableReference> extract_tables(std::string_view sql) const;

private:
    // 구문 하나를 검사하는 동안 로그/통계용으로 모으는 정보
    struct Trace {
        std::size_t              statements{0};
        std::size_t              heuristic_statements{0};
        std::vector<std::string> tables{};
    };

    [[nodiscard]] ValidationResult validate_statement(const Principal&         principal,
                                                      std::string_view         statement,
                                                      std::size_t              index,
                                                      const std::string&       default_database,
                                                      const ConnectionContext& connection,
                                                      Trace&                   trace) const;

    [[nodiscard]] bool grant_allows(const GrantRequest& request) const;

    ValidationResult finish(ValidationResult         result,
                            const Principal&         principal,
                            std::string_view         sql,
                            const ConnectionContext& connection,
                            const Trace&             trace,
                            std::chrono::steady_clock::time_point started) const;

    std::shared_ptr<GrantStore>       grant_store_;
    PermissionFamilies                families_;
    std::string                       fallback_database_;
    std::shared_ptr<StructuredLogger> logger_;
    std::shared_ptr<ValidationStats>  stats_;
    SqlParser                         parser_;
};

// resolve_statement_tables
//   구문의 테이블 참조를 검사 대상 (database, table) 목록으로 만든다.
//   1. database 없는 참조는 같은 table 이름의 database 있는 참조가 있으면 버린다.
//   2. 남은 참조를 reconcile_table_reference 로 보정한다.
//   3. 보정 후 같은 쌍은 한 번만 남긴다 (처음 나온 순서 유지).
[[nodiscard]] std::vector<ResolvedTable>
resolve_statement_tables(const ParsedStatement& parsed, std::string_view default_database);

// statement_preview
//   앞 50 바이트를 자른 뒤 연속 공백을 공백 하나로 접는다.
[[nodiscard]] std::string statement_preview(std::string_view statement);
