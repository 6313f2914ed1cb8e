#include "logger/structured_logger.hpp"
#include "parser/sql_parser.hpp"
#include "parser/statement_splitter.hpp"
#include "policy/access_validator.hpp"
#include "policy/policy_loader.hpp"
#include "policy/role_catalog.hpp"
#include "policy/rule_grant_store.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

constexpr int kExitAllowed     = 0;
constexpr int kExitDenied      = 1;
constexpr int kExitConfigError = 2;

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

struct CliOptions {
    std::optional<std::string> user_id{};
    std::vector<std::string>   roles{};
    std::optional<std::string> database{};
    std::optional<std::string> connection_id{};
    std::optional<std::string> policy_path{};
};

void print_usage() {
    std::cerr << "usage: sqlguard --user <id> [--role <role>]... [--database <db>] "
                 "[--connection <id>] [--policy <path>] < query.sql\n";
}

// --name value 형식만 받는다. 알 수 없는 옵션이나 값 누락은 오류.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view flag = argv[i];
        if (i + 1 >= argc) {
            spdlog::error("missing value for option '{}'", flag);
            return std::nullopt;
        }
        std::string value = argv[++i];
        if (flag == "--user") {
            options.user_id = std::move(value);
        } else if (flag == "--role") {
            options.roles.push_back(std::move(value));
        } else if (flag == "--database") {
            options.database = std::move(value);
        } else if (flag == "--connection") {
            options.connection_id = std::move(value);
        } else if (flag == "--policy") {
            options.policy_path = std::move(value);
        } else {
            spdlog::error("unknown option '{}'", flag);
            return std::nullopt;
        }
    }
    return options;
}

std::string join_tables(const std::vector<ResolvedTable>& tables) {
    std::string out;
    for (const auto& table : tables) {
        if (!out.empty()) {
            out.push_back(',');
        }
        out += fmt::format("{}.{}", table.database, table.table);
    }
    return out.empty() ? "-" : out;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 인자 / 설정 (환경변수 우선, 기본값 fallback) ──────────────────────
    const auto options = parse_args(argc, argv);
    if (!options) {
        print_usage();
        return kExitConfigError;
    }

    const std::string policy_path =
        options->policy_path.value_or(env_str("SQLGUARD_POLICY_PATH", "config/policy.yaml"));

    auto policy = PolicyLoader::load(policy_path);
    if (!policy) {
        std::cerr << policy.error() << '\n';
        return kExitConfigError;
    }

    const std::string log_level = env_str("SQLGUARD_LOG_LEVEL", policy->global.log_level);
    const std::string log_path  = env_str("SQLGUARD_LOG_PATH", policy->global.log_path);

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::from_str(log_level));

    std::shared_ptr<StructuredLogger> audit_logger;
    try {
        // stdout 은 판정 결과 출력에 쓰므로 감사 로그는 파일에만 쓴다
        audit_logger = std::make_shared<StructuredLogger>(parse_log_level(log_level), log_path,
                                                          /*to_stdout=*/false);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << '\n';
        return kExitConfigError;
    }

    spdlog::debug("Policy: {}", policy_path);
    spdlog::debug("Log level: {}", log_level);

    // ── 판정기 구성 ─────────────────────────────────────────────────────
    const RoleCatalog catalog{policy->roles};
    const Principal   principal = catalog.resolve(options->user_id, options->roles);

    auto grant_store = std::make_shared<RuleGrantStore>(policy->data_access_rules,
                                                        policy->global.allow_system_databases);
    auto stats       = std::make_shared<ValidationStats>();

    const AccessValidator validator{grant_store, policy->permission_families,
                                    policy->global.default_database, audit_logger, stats};

    // ── 입력 분석 ───────────────────────────────────────────────────────
    const std::string sql{std::istreambuf_iterator<char>(std::cin),
                          std::istreambuf_iterator<char>()};

    const std::string default_database =
        options->database.value_or(policy->global.default_database);

    const SqlParser parser;
    const auto      statements = split_statements(sql);
    for (std::size_t i = 0; i < statements.size(); ++i) {
        const auto parsed = parser.parse(statements[i]);
        fmt::print("{} {} {} {}\n", i + 1, operation_kind_to_string(parsed.kind),
                   access_type_to_string(classify_access_type(parsed.kind)),
                   join_tables(resolve_statement_tables(parsed, default_database)));
    }

    const ConnectionContext connection{options->connection_id, 1};
    const auto              result =
        validator.validate(principal, sql, options->database, connection);

    if (result.allowed) {
        fmt::print("ALLOW\n");
        return kExitAllowed;
    }
    fmt::print("DENY: {}\n", result.reason.value_or("denied"));
    return kExitDenied;
}
