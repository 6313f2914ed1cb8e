#pragma once

// ---------------------------------------------------------------------------
// rule_grant_store.hpp
//
// 메모리에 보관된 DataAccessRule 목록으로 판정하는 GrantStore 구현.
//
// [평가 순서]
// 1. database 가 system database 이고 allow_system_databases 이면 허용.
// 2. 요청에 적용되는 규칙을 모은다:
//    - user == request.user_id 인 규칙 (먼저), role 이 request.roles 에 있는 규칙 (나중)
//    - request 에 connection_id 가 있으면 connection 이 없거나 같은 규칙만.
//      request 에 connection_id 가 없으면 connection 과 무관하게 모두 적용.
// 3. 적용 규칙이 없으면 거부 ("No access rules defined").
// 4. priority 내림차순, 같은 priority 에서는 거부 규칙 먼저 (안정 정렬).
// 5. database 패턴이 일치하고, table 이 주어졌으면 table 패턴도 일치하는 첫 규칙이
//    결정한다. 없으면 거부 ("No matching access rule").
//
// [설계 원칙]
// - 규칙의 접근 종류(read/write)는 보지 않는다. 접근 종류는 역할 권한 군으로
//   AccessValidator 가 먼저 검사한다. 규칙은 "어떤 객체" 만 정의한다.
// - reload() 는 shared_ptr 교체로 원자적이다. 진행 중인 check() 는 이전 규칙으로 끝난다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <memory>
#include <string_view>
#include <vector>

#include "policy/grant_store.hpp"
#include "policy/rule.hpp"

class RuleGrantStore final : public GrantStore {
public:
    RuleGrantStore(std::vector<DataAccessRule> rules, bool allow_system_databases);
    ~RuleGrantStore() override = default;

    [[nodiscard]] std::expected<GrantDecision, std::string>
    check(const GrantRequest& request) const override;

    // reload
    //   규칙 목록 전체를 교체한다.
    void reload(std::vector<DataAccessRule> rules);

    [[nodiscard]] std::size_t rule_count() const;

private:
    using RuleSet = std::vector<DataAccessRule>;

    std::atomic<std::shared_ptr<const RuleSet>> rules_;
    const bool                                  allow_system_databases_;
};

// matches_pattern
//   DataAccessRule 패턴 문법으로 value 를 검사한다.
[[nodiscard]] bool matches_pattern(std::string_view value, std::string_view pattern);

// system, information_schema, INFORMATION_SCHEMA
[[nodiscard]] bool is_system_database(std::string_view database) noexcept;
