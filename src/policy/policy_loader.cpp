// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 파일을 로드하여 PolicyConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 정책을 반환하지 않는다.
// - YAML 파일 전체를 로그에 출력하지 않는다 (민감 정보 보호).
// - 섹션/필드 누락 시 기본값(구조체 기본값)을 적용한다.
//   permission_families 의 각 목록은 키가 있을 때만 기본값을 대체한다.
//
// [알려진 한계]
// - 규칙 id 가 없으면 "rule-<순번>" 을 부여한다. id 중복은 경고만 한다.
// - 같은 이름의 역할이 여러 번 나오면 RoleCatalog 가 첫 정의만 사용한다.
//
// [오탐/미탐 트레이드오프]
// - data_access_rules 에 잘못된 /regex/ 패턴이 있으면 RuleGrantStore 가 해당
//   패턴을 불일치로 처리한다. 허용 규칙이면 false positive(과잉 차단),
//   거부 규칙이면 false negative 가 된다. 로드 시점에 경고를 출력한다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <cstdint>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: "/regex/" 형태 패턴이 유효한지 사전 검증하고 경고 로그를 출력한다.
// ---------------------------------------------------------------------------
void validate_rule_pattern(const DataAccessRule& rule, const std::string& pattern) {
    if (pattern.size() < 2 || pattern.front() != '/' || pattern.back() != '/') {
        return;
    }
    try {
        std::regex re(pattern.substr(1, pattern.size() - 2),
                      std::regex_constants::icase | std::regex_constants::ECMAScript);
        (void)re;  // 컴파일만 확인
    } catch (const std::regex_error& e) {
        spdlog::warn(
            "policy_loader: rule '{}' pattern '{}' is invalid regex and will never match: {}",
            rule.id, pattern, e.what());
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] std::int32_t read_int32(const YAML::Node& node, std::int32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::int32_t>();
    } catch (const YAML::Exception&) {
        spdlog::warn("policy_loader: invalid integer '{}', using {}", node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] std::optional<std::string> read_optional_string(const YAML::Node& node) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    auto value = node.as<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: GlobalConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] GlobalConfig parse_global(const YAML::Node& global_node) {
    GlobalConfig cfg{};
    if (!global_node || !global_node.IsMap()) {
        return cfg;
    }

    cfg.log_level        = read_string(global_node["log_level"], cfg.log_level);
    cfg.log_path         = read_string(global_node["log_path"], cfg.log_path);
    cfg.default_database = read_string(global_node["default_database"], cfg.default_database);
    cfg.allow_system_databases =
        read_bool(global_node["allow_system_databases"], cfg.allow_system_databases);

    if (cfg.default_database.empty()) {
        spdlog::warn("policy_loader: global.default_database is empty, using 'default'");
        cfg.default_database = "default";
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: PermissionFamilies 파싱
//   키가 있으면 해당 목록 전체를 대체한다 (빈 목록 포함).
// ---------------------------------------------------------------------------
[[nodiscard]] PermissionFamilies parse_permission_families(const YAML::Node& node) {
    PermissionFamilies families{};
    if (!node || !node.IsMap()) {
        return families;
    }
    if (node["read"]) {
        families.read = read_string_sequence(node["read"]);
    }
    if (node["write"]) {
        families.write = read_string_sequence(node["write"]);
    }
    if (node["admin"]) {
        families.admin = read_string_sequence(node["admin"]);
    }
    return families;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: RoleDefinition 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<RoleDefinition, std::string>
parse_role(const YAML::Node& role_node, std::size_t index) {
    if (!role_node.IsMap()) {
        return std::unexpected(fmt::format("roles[{}] is not a map", index));
    }
    RoleDefinition role{};
    role.name = read_string(role_node["name"], "");
    if (role.name.empty()) {
        return std::unexpected(fmt::format("roles[{}] has no name", index));
    }
    role.permissions = read_string_sequence(role_node["permissions"]);
    role.admin       = read_bool(role_node["admin"], role.admin);
    return role;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: DataAccessRule 파싱
//   role 과 user 중 정확히 하나가 있어야 한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<DataAccessRule, std::string>
parse_data_access_rule(const YAML::Node& rule_node, std::size_t index) {
    if (!rule_node.IsMap()) {
        return std::unexpected(fmt::format("data_access_rules[{}] is not a map", index));
    }

    DataAccessRule rule{};
    rule.id   = read_string(rule_node["id"], fmt::format("rule-{}", index + 1));
    rule.role = read_optional_string(rule_node["role"]);
    rule.user = read_optional_string(rule_node["user"]);

    if (rule.role.has_value() == rule.user.has_value()) {
        return std::unexpected(fmt::format(
            "data_access_rules[{}] ('{}') must have exactly one of 'role' or 'user'", index,
            rule.id));
    }

    rule.connection       = read_optional_string(rule_node["connection"]);
    rule.database_pattern = read_string(rule_node["database"], rule.database_pattern);
    rule.table_pattern    = read_string(rule_node["table"], rule.table_pattern);
    rule.allowed          = read_bool(rule_node["allowed"], rule.allowed);
    rule.priority         = read_int32(rule_node["priority"], rule.priority);
    rule.description      = read_string(rule_node["description"], "");

    if (rule.database_pattern.empty() || rule.table_pattern.empty()) {
        return std::unexpected(fmt::format(
            "data_access_rules[{}] ('{}') has an empty database or table pattern", index,
            rule.id));
    }
    return rule;
}

std::unexpected<std::string> fail(std::string err) {
    spdlog::error("{}", err);
    return std::unexpected(std::move(err));
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<PolicyConfig, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        return fail(fmt::format("policy_loader: cannot resolve config path '{}': {}",
                                config_path.string(), ec.message()));
    }

    spdlog::info("policy_loader: loading policy from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        return fail(fmt::format("policy_loader: cannot open file '{}': {}",
                                canonical_path.string(), e.what()));
    } catch (const YAML::ParserException& e) {
        return fail(fmt::format("policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
                                canonical_path.string(),
                                e.mark.line + 1,  // yaml-cpp는 0-based
                                e.mark.column + 1, e.what()));
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("policy_loader: YAML error in '{}': {}",
                                canonical_path.string(), e.what()));
    }

    if (!root || !root.IsMap()) {
        return fail(fmt::format("policy_loader: '{}' is not a valid YAML map (top-level)",
                                canonical_path.string()));
    }

    // 3. 각 섹션 파싱 (try-catch per section)
    PolicyConfig cfg{};

    try {
        cfg.global = parse_global(root["global"]);
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("policy_loader: error parsing 'global' section: {}", e.what()));
    }

    try {
        cfg.permission_families = parse_permission_families(root["permission_families"]);
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("policy_loader: error parsing 'permission_families' section: {}",
                                e.what()));
    }

    try {
        const YAML::Node& roles_node = root["roles"];
        if (roles_node && roles_node.IsSequence()) {
            cfg.roles.reserve(roles_node.size());
            std::size_t index = 0;
            for (const auto& role_node : roles_node) {
                auto role = parse_role(role_node, index++);
                if (!role) {
                    return fail(fmt::format("policy_loader: {}", role.error()));
                }
                cfg.roles.push_back(std::move(*role));
            }
        }
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("policy_loader: error parsing 'roles' section: {}", e.what()));
    }

    try {
        const YAML::Node& rules_node = root["data_access_rules"];
        if (rules_node && rules_node.IsSequence()) {
            cfg.data_access_rules.reserve(rules_node.size());
            std::size_t index = 0;
            for (const auto& rule_node : rules_node) {
                auto rule = parse_data_access_rule(rule_node, index++);
                if (!rule) {
                    return fail(fmt::format("policy_loader: {}", rule.error()));
                }
                cfg.data_access_rules.push_back(std::move(*rule));
            }
        }
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("policy_loader: error parsing 'data_access_rules' section: {}",
                                e.what()));
    }

    // 4. 패턴 유효성 사전 검증 (경고만, 파싱 실패 아님)
    std::set<std::string> seen_ids;
    for (const auto& rule : cfg.data_access_rules) {
        validate_rule_pattern(rule, rule.database_pattern);
        validate_rule_pattern(rule, rule.table_pattern);
        if (!seen_ids.insert(rule.id).second) {
            spdlog::warn("policy_loader: duplicate rule id '{}'", rule.id);
        }
    }

    if (cfg.data_access_rules.empty()) {
        spdlog::warn("policy_loader: no data_access_rules defined, every table access is denied");
    }

    spdlog::info("policy_loader: policy loaded successfully, roles={}, data_access_rules={}",
                 cfg.roles.size(), cfg.data_access_rules.size());

    return cfg;
}
