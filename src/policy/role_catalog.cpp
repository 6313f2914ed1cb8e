#include "policy/role_catalog.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

bool is_builtin_admin_name(std::string_view role) noexcept {
    return role == "super_admin" || role == "admin";
}

}  // namespace

RoleCatalog::RoleCatalog(std::vector<RoleDefinition> roles) {
    roles_.reserve(roles.size());
    for (auto& role : roles) {
        if (role.name.empty()) {
            spdlog::warn("role_catalog: role without a name ignored");
            continue;
        }
        const std::string name = role.name;
        if (!roles_.emplace(name, std::move(role)).second) {
            spdlog::warn("role_catalog: duplicate role '{}' ignored", name);
        }
    }
}

bool RoleCatalog::is_admin_role(std::string_view role) const {
    if (is_builtin_admin_name(role)) {
        return true;
    }
    const auto it = roles_.find(std::string(role));
    return it != roles_.end() && it->second.admin;
}

std::vector<std::string> RoleCatalog::permissions_for(std::string_view role) const {
    const auto it = roles_.find(std::string(role));
    if (it == roles_.end()) {
        return {};
    }
    return it->second.permissions;
}

Principal RoleCatalog::resolve(std::optional<std::string>      user_id,
                               const std::vector<std::string>& roles) const {
    Principal principal{};
    principal.user_id = std::move(user_id);
    principal.roles   = roles;

    for (const auto& role : roles) {
        if (is_admin_role(role)) {
            principal.is_admin = true;
        }
        const auto it = roles_.find(role);
        if (it == roles_.end()) {
            spdlog::debug("role_catalog: unknown role '{}'", role);
            continue;
        }
        for (const auto& permission : it->second.permissions) {
            if (std::find(principal.permissions.begin(), principal.permissions.end(),
                          permission) == principal.permissions.end()) {
                principal.permissions.push_back(permission);
            }
        }
    }
    return principal;
}
