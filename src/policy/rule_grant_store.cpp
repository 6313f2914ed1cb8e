// ---------------------------------------------------------------------------
// rule_grant_store.cpp
//
// [패턴 → 정규식 변환]
// glob 패턴은 '*' 를 제외한 정규식 특수문자를 이스케이프한 뒤 '*' → ".*" 로 바꾸고
// ^...$ 로 고정한다. 대소문자는 무시한다.
//
// [오탐/미탐 트레이드오프]
// - 잘못된 /regex/ 규칙은 일치하지 않는 것으로 처리한다. 허용 규칙이면 접근이
//   줄어들고(fail-close), 거부 규칙이면 그 거부가 빠진다. PolicyLoader 가 로드
//   시점에 경고를 출력한다.
// ---------------------------------------------------------------------------

#include "policy/rule_grant_store.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string glob_to_regex(std::string_view pattern) {
    static constexpr std::string_view kSpecial = ".+?^${}()|[]\\";
    std::string out = "^";
    for (const char c : pattern) {
        if (c == '*') {
            out.append(".*");
            continue;
        }
        if (kSpecial.find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('$');
    return out;
}

bool rule_applies(const DataAccessRule& rule, const GrantRequest& request) {
    if (request.connection_id && rule.connection && *rule.connection != *request.connection_id) {
        return false;
    }
    if (rule.user && *rule.user == request.user_id) {
        return true;
    }
    if (rule.role) {
        return std::find(request.roles.begin(), request.roles.end(), *rule.role) !=
               request.roles.end();
    }
    return false;
}

}  // namespace

bool is_system_database(std::string_view database) noexcept {
    static constexpr std::array<std::string_view, 3> kSystemDatabases = {
        "system", "information_schema", "INFORMATION_SCHEMA",
    };
    return std::find(kSystemDatabases.begin(), kSystemDatabases.end(), database) !=
           kSystemDatabases.end();
}

bool matches_pattern(std::string_view value, std::string_view pattern) {
    if (pattern == "*") {
        return true;
    }

    if (pattern.size() >= 2 && pattern.front() == '/' && pattern.back() == '/') {
        try {
            const std::regex re(std::string(pattern.substr(1, pattern.size() - 2)),
                                std::regex_constants::ECMAScript | std::regex_constants::icase);
            return std::regex_search(value.begin(), value.end(), re);
        } catch (const std::regex_error& e) {
            spdlog::debug("rule_grant_store: invalid regex pattern '{}': {}", pattern, e.what());
            return false;
        }
    }

    if (pattern.find('*') != std::string_view::npos) {
        const std::regex re(glob_to_regex(pattern),
                            std::regex_constants::ECMAScript | std::regex_constants::icase);
        return std::regex_match(value.begin(), value.end(), re);
    }

    return iequals(value, pattern);
}

// ---------------------------------------------------------------------------
// RuleGrantStore
// ---------------------------------------------------------------------------

RuleGrantStore::RuleGrantStore(std::vector<DataAccessRule> rules, bool allow_system_databases)
    : rules_(std::make_shared<const RuleSet>(std::move(rules)))
    , allow_system_databases_(allow_system_databases) {}

void RuleGrantStore::reload(std::vector<DataAccessRule> rules) {
    auto next = std::make_shared<const RuleSet>(std::move(rules));
    spdlog::info("rule_grant_store: reloaded {} data access rules", next->size());
    rules_.store(std::move(next));
}

std::size_t RuleGrantStore::rule_count() const {
    return rules_.load()->size();
}

std::expected<GrantDecision, std::string>
RuleGrantStore::check(const GrantRequest& request) const {
    if (request.user_id.empty()) {
        return std::unexpected(std::string("grant check requires a user id"));
    }

    if (allow_system_databases_ && is_system_database(request.database)) {
        return GrantDecision{true, "System database access allowed by default", {}};
    }

    const auto rules = rules_.load();

    // 사용자 규칙 먼저, 역할 규칙 나중 (같은 priority 에서의 상대 순서)
    std::vector<const DataAccessRule*> applicable;
    for (const auto& rule : *rules) {
        if (rule.user && rule_applies(rule, request)) {
            applicable.push_back(&rule);
        }
    }
    for (const auto& rule : *rules) {
        if (!rule.user && rule_applies(rule, request)) {
            applicable.push_back(&rule);
        }
    }

    if (applicable.empty()) {
        return GrantDecision{false, "No access rules defined", {}};
    }

    std::stable_sort(applicable.begin(), applicable.end(),
                     [](const DataAccessRule* a, const DataAccessRule* b) {
                         if (a->priority != b->priority) {
                             return a->priority > b->priority;
                         }
                         return !a->allowed && b->allowed;
                     });

    for (const auto* rule : applicable) {
        if (!matches_pattern(request.database, rule->database_pattern)) {
            continue;
        }
        if (request.table && !matches_pattern(*request.table, rule->table_pattern)) {
            continue;
        }
        return GrantDecision{
            rule->allowed,
            fmt::format("{} by rule: {}.{}", rule->allowed ? "Allowed" : "Denied",
                        rule->database_pattern, rule->table_pattern),
            rule->id,
        };
    }

    return GrantDecision{false, "No matching access rule", {}};
}
