#pragma once

// ---------------------------------------------------------------------------
// role_catalog.hpp
//
// 역할 이름 → 권한 문자열 목록. 요청자의 역할을 Principal 로 풀어낸다.
//
// [보안 원칙]
// - 카탈로그에 없는 역할은 권한을 주지 않는다 (무시하고 debug 로그만 남긴다).
// - super_admin / admin 이름은 설정의 admin 플래그와 무관하게 관리자 역할이다.
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "common/types.hpp"
#include "policy/rule.hpp"

class RoleCatalog {
public:
    explicit RoleCatalog(std::vector<RoleDefinition> roles);
    ~RoleCatalog() = default;

    RoleCatalog(const RoleCatalog&)            = default;
    RoleCatalog& operator=(const RoleCatalog&) = default;
    RoleCatalog(RoleCatalog&&)                 = default;
    RoleCatalog& operator=(RoleCatalog&&)      = default;

    // resolve
    //   roles 의 권한을 순서대로 합친다 (중복 제거).
    //   하나라도 관리자 역할이면 is_admin = true.
    [[nodiscard]] Principal resolve(std::optional<std::string>      user_id,
                                    const std::vector<std::string>& roles) const;

    [[nodiscard]] bool is_admin_role(std::string_view role) const;

    // 알 수 없는 역할이면 빈 목록
    [[nodiscard]] std::vector<std::string> permissions_for(std::string_view role) const;

    [[nodiscard]] std::size_t size() const noexcept { return roles_.size(); }

private:
    std::unordered_map<std::string, RoleDefinition> roles_;
};
