#pragma once

// ---------------------------------------------------------------------------
// grant_store.hpp
//
// 객체 단위 권한 저장소 인터페이스.
// AccessValidator 는 이 인터페이스만 알며, 규칙의 출처(YAML, DB, 원격 서비스)는
// 구현체가 결정한다.
//
// [보안 원칙]
// - check() 가 std::unexpected 를 반환하면 호출자는 거부로 처리한다.
//   저장소 장애가 허용으로 이어져서는 안 된다.
// ---------------------------------------------------------------------------

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "policy/access_type.hpp"

// ---------------------------------------------------------------------------
// GrantRequest
//   table 이 nullopt 이면 database 전체(어떤 테이블이든)에 대한 질의다.
// ---------------------------------------------------------------------------
struct GrantRequest {
    std::string                user_id{};
    std::vector<std::string>   roles{};
    std::string                database{};
    std::optional<std::string> table{};
    AccessType                 access{AccessType::kRead};
    std::optional<std::string> connection_id{};
};

struct GrantDecision {
    bool        allowed{false};
    std::string reason{};          // 감사 로그용 ("Allowed by rule: db.*" 등)
    std::string matched_rule_id{}; // 일치한 규칙이 없으면 빈 문자열
};

class GrantStore {
public:
    GrantStore()          = default;
    virtual ~GrantStore() = default;

    GrantStore(const GrantStore&)            = delete;
    GrantStore& operator=(const GrantStore&) = delete;
    GrantStore(GrantStore&&)                 = delete;
    GrantStore& operator=(GrantStore&&)      = delete;

    // check
    //   요청 하나를 판정한다. 여러 스레드에서 동시에 호출될 수 있다.
    [[nodiscard]] virtual std::expected<GrantDecision, std::string>
    check(const GrantRequest& request) const = 0;
};
