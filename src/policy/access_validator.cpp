// ---------------------------------------------------------------------------
// access_validator.cpp
//
// [보안 원칙]
// - 거부 사유에는 처음 실패한 구문의 정보만 담는다.
// - 여러 구문으로 된 요청이면 사유 끝에 실패 구문의 앞부분을 붙인다.
// - 관리자 판정은 역할 카탈로그가 끝낸 상태로 들어온다. 여기서 역할 이름을
//   다시 해석하지 않는다.
// ---------------------------------------------------------------------------

#include "policy/access_validator.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "parser/statement_splitter.hpp"
#include "policy/rule_grant_store.hpp"  // is_system_database

namespace {

constexpr std::string_view kAuthRequiredReason =
    "RBAC authentication is required. Please login with RBAC credentials.";
constexpr std::string_view kNoStatementsReason = "No valid SQL statements found";
constexpr std::size_t      kPreviewLength      = 50;

void require_user(const Principal& principal, std::string_view operation) {
    if (!principal.user_id || principal.user_id->empty()) {
        throw std::invalid_argument(
            fmt::format("access_validator: {} requires an authenticated user id", operation));
    }
}

GrantRequest make_request(const Principal&           principal,
                          std::string                database,
                          std::optional<std::string> table,
                          AccessType                 access,
                          const ConnectionContext&   connection) {
    return GrantRequest{
        .user_id       = principal.user_id.value_or(""),
        .roles         = principal.roles,
        .database      = std::move(database),
        .table         = std::move(table),
        .access        = access,
        .connection_id = connection.connection_id,
    };
}

}  // namespace

// ---------------------------------------------------------------------------
// 공개 헬퍼
// ---------------------------------------------------------------------------
std::string statement_preview(std::string_view statement) {
    const std::string_view head = statement.substr(0, kPreviewLength);
    std::string            out;
    out.reserve(head.size());
    bool in_space = false;
    for (const char c : head) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!in_space) {
                out.push_back(' ');
            }
            in_space = true;
            continue;
        }
        in_space = false;
        out.push_back(c);
    }
    return out;
}

std::vector<ResolvedTable>
resolve_statement_tables(const ParsedStatement& parsed, std::string_view default_database) {
    // 1. database 있는 참조가 같은 이름의 database 없는 참조를 흡수한다
    std::vector<TableReference> deduped;
    deduped.reserve(parsed.tables.size());
    for (const auto& ref : parsed.tables) {
        if (ref.table.empty()) {
            continue;
        }
        if (!ref.database) {
            const bool shadowed = std::any_of(
                parsed.tables.begin(), parsed.tables.end(), [&ref](const TableReference& other) {
                    return other.database.has_value() && other.table == ref.table;
                });
            if (shadowed) {
                continue;
            }
        }
        if (std::find(deduped.begin(), deduped.end(), ref) == deduped.end()) {
            deduped.push_back(ref);
        }
    }

    // 2-3. 보정 후 중복 제거
    std::vector<ResolvedTable> resolved;
    resolved.reserve(deduped.size());
    for (const auto& ref : deduped) {
        auto target = reconcile_table_reference(ref, parsed.text, default_database);
        if (std::find(resolved.begin(), resolved.end(), target) == resolved.end()) {
            resolved.push_back(std::move(target));
        }
    }
    return resolved;
}

// ---------------------------------------------------------------------------
// AccessValidator
// ---------------------------------------------------------------------------
AccessValidator::AccessValidator(std::shared_ptr<GrantStore>       grant_store,
                                 PermissionFamilies                families,
                                 std::string                       fallback_database,
                                 std::shared_ptr<StructuredLogger> logger,
                                 std::shared_ptr<ValidationStats>  stats)
    : grant_store_(std::move(grant_store))
    , families_(std::move(families))
    , fallback_database_(std::move(fallback_database))
    , logger_(std::move(logger))
    , stats_(std::move(stats))
{
    if (!grant_store_) {
        spdlog::warn("access_validator: no grant store configured, object checks will deny");
    }
    if (fallback_database_.empty()) {
        fallback_database_ = "default";
    }
}

bool AccessValidator::grant_allows(const GrantRequest& request) const {
    if (!grant_store_) {
        return false;
    }
    const auto decision = grant_store_->check(request);
    if (!decision) {
        spdlog::warn("access_validator: grant store error for {}.{}: {}", request.database,
                     request.table.value_or("*"), decision.error());
        return false;
    }
    spdlog::debug("access_validator: {} {}.{} ({}): {}", request.user_id, request.database,
                  request.table.value_or("*"), access_type_to_string(request.access),
                  decision->reason);
    return decision->allowed;
}

ValidationResult AccessValidator::validate(const Principal&                  principal,
                                           std::string_view                  sql,
                                           const std::optional<std::string>& default_database,
                                           const ConnectionContext&          connection) const {
    const auto started = std::chrono::steady_clock::now();
    Trace      trace{};

    if (principal.is_admin) {
        return finish(ValidationResult{true, std::nullopt, std::nullopt}, principal, sql,
                      connection, trace, started);
    }

    if (!principal.user_id || principal.user_id->empty()) {
        return finish(ValidationResult{false, std::string(kAuthRequiredReason), std::nullopt},
                      principal, sql, connection, trace, started);
    }

    const auto statements = split_statements(sql);
    if (statements.empty()) {
        return finish(ValidationResult{false, std::string(kNoStatementsReason), std::nullopt},
                      principal, sql, connection, trace, started);
    }

    const std::string& database = (default_database && !default_database->empty())
                                      ? *default_database
                                      : fallback_database_;

    for (std::size_t i = 0; i < statements.size(); ++i) {
        auto result = validate_statement(principal, statements[i], i, database, connection, trace);
        if (!result.allowed) {
            if (statements.size() > 1 && result.reason) {
                result.reason = fmt::format("{}\nStatement: {}...", *result.reason,
                                            statement_preview(statements[i]));
            }
            return finish(std::move(result), principal, sql, connection, trace, started);
        }
    }

    return finish(ValidationResult{true, std::nullopt, std::nullopt}, principal, sql, connection,
                  trace, started);
}

ValidationResult AccessValidator::validate_statement(const Principal&         principal,
                                                     std::string_view         statement,
                                                     std::size_t              index,
                                                     const std::string&       default_database,
                                                     const ConnectionContext& connection,
                                                     Trace&                   trace) const {
    const ParsedStatement parsed = parser_.parse(statement);
    ++trace.statements;
    if (parsed.strategy == ParseStrategy::kHeuristic) {
        ++trace.heuristic_statements;
    }
    if (stats_) {
        stats_->on_statement(parsed.strategy);
    }

    const AccessType access = classify_access_type(parsed.kind);
    if (!has_permission_for(principal.permissions, access, families_)) {
        return ValidationResult{
            false,
            fmt::format("Statement {}: No permission for {} operations ({} statement)", index + 1,
                        access_type_to_string(access), operation_kind_to_string(parsed.kind)),
            index,
        };
    }

    const auto targets = resolve_statement_tables(parsed, default_database);
    if (targets.empty()) {
        // 객체 없는 구문: 역할 권한 검사로 충분
        return ValidationResult{true, std::nullopt, std::nullopt};
    }

    for (const auto& target : targets) {
        trace.tables.push_back(fmt::format("{}.{}", target.database, target.table));

        std::optional<std::string> table;
        if (target.table != kWildcardTable) {
            table = target.table;
        }
        if (!grant_allows(make_request(principal, target.database, std::move(table), access,
                                       connection))) {
            return ValidationResult{
                false,
                fmt::format("Statement {}: Access denied to {}.{} (requires {} permission)",
                            index + 1, target.database, target.table,
                            access_type_to_string(access)),
                index,
            };
        }
    }

    return ValidationResult{true, std::nullopt, std::nullopt};
}

ValidationResult AccessValidator::finish(ValidationResult         result,
                                         const Principal&         principal,
                                         std::string_view         sql,
                                         const ConnectionContext& connection,
                                         const Trace&             trace,
                                         std::chrono::steady_clock::time_point started) const {
    if (stats_) {
        stats_->on_request(!result.allowed);
    }

    if (!logger_) {
        return result;
    }

    const auto now = std::chrono::system_clock::now();
    logger_->log_validation(ValidationLog{
        .request_id           = connection.request_id,
        .user_id              = principal.user_id.value_or(""),
        .connection_id        = connection.connection_id.value_or(""),
        .raw_sql              = std::string(sql),
        .statement_count      = trace.statements,
        .tables               = trace.tables,
        .heuristic_statements = trace.heuristic_statements,
        .allowed              = result.allowed,
        .timestamp            = now,
        .duration             = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started),
    });

    if (!result.allowed) {
        logger_->log_denial(DenialLog{
            .request_id      = connection.request_id,
            .user_id         = principal.user_id.value_or(""),
            .connection_id   = connection.connection_id.value_or(""),
            .raw_sql         = std::string(sql),
            .statement_index = result.statement_index,
            .reason          = result.reason.value_or(""),
            .timestamp       = now,
        });
    }
    return result;
}

// ---------------------------------------------------------------------------
// 객체 단위 헬퍼
// ---------------------------------------------------------------------------
bool AccessValidator::check_database_access(const Principal&         principal,
                                            const std::string&       database,
                                            const ConnectionContext& connection,
                                            AccessType               access) const {
    if (principal.is_admin) {
        return true;
    }
    require_user(principal, "database access check");
    return grant_allows(make_request(principal, database, std::nullopt, access, connection));
}

bool AccessValidator::check_table_access(const Principal&         principal,
                                         const std::string&       database,
                                         const std::string&       table,
                                         const ConnectionContext& connection,
                                         AccessType               access) const {
    if (principal.is_admin) {
        return true;
    }
    require_user(principal, "table access check");
    return grant_allows(make_request(principal, database, table, access, connection));
}

std::vector<std::string>
AccessValidator::filter_databases(const Principal&                principal,
                                  const std::vector<std::string>& databases,
                                  const ConnectionContext&        connection) const {
    if (principal.is_admin) {
        return databases;
    }
    require_user(principal, "database filtering");

    std::vector<std::string> visible;
    for (const auto& database : databases) {
        if (is_system_database(database)) {
            continue;
        }
        if (grant_allows(
                make_request(principal, database, std::nullopt, AccessType::kRead, connection))) {
            visible.push_back(database);
        }
    }
    return visible;
}

std::vector<std::string>
AccessValidator::filter_tables(const Principal&                principal,
                               const std::string&              database,
                               const std::vector<std::string>& tables,
                               const ConnectionContext&        connection) const {
    if (principal.is_admin) {
        return tables;
    }
    require_user(principal, "table filtering");

    if (is_system_database(database)) {
        return {};
    }

    std::vector<std::string> visible;
    for (const auto& table : tables) {
        if (grant_allows(make_request(principal, database, table, AccessType::kRead, connection))) {
            visible.push_back(table);
        }
    }
    return visible;
}

AccessType AccessValidator::query_access_type(std::string_view sql) const {
    return classify_access_type(parser_.parse(sql).kind);
}

std::vector<TableReference> AccessValidator::extract_tables(std::string_view sql) const {
    return parser_.parse(sql).tables;
}
