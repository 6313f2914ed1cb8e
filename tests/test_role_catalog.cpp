// ---------------------------------------------------------------------------
// test_role_catalog.cpp
//
// RoleCatalog 단위 테스트.
// ---------------------------------------------------------------------------

#include "policy/role_catalog.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

RoleCatalog make_catalog() {
    return RoleCatalog({
        RoleDefinition{"viewer", {"table:select", "database:view"}, false},
        RoleDefinition{"analyst", {"table:select", "table:insert"}, false},
        RoleDefinition{"ops", {}, true},
    });
}

}  // namespace

TEST(RoleCatalog, ResolveUnionsPermissionsWithoutDuplicates) {
    const auto catalog   = make_catalog();
    const auto principal = catalog.resolve("alice", {"viewer", "analyst"});
    EXPECT_EQ(principal.user_id, "alice");
    EXPECT_EQ(principal.roles, (std::vector<std::string>{"viewer", "analyst"}));
    EXPECT_EQ(principal.permissions,
              (std::vector<std::string>{"table:select", "database:view", "table:insert"}));
    EXPECT_FALSE(principal.is_admin);
}

TEST(RoleCatalog, UnknownRoleGrantsNothing) {
    const auto catalog   = make_catalog();
    const auto principal = catalog.resolve("bob", {"ghost"});
    EXPECT_TRUE(principal.permissions.empty());
    EXPECT_FALSE(principal.is_admin);
    EXPECT_EQ(principal.roles, std::vector<std::string>{"ghost"}) << "역할 이름은 그대로 보존";
}

TEST(RoleCatalog, AdminFlagMarksPrincipal) {
    const auto catalog = make_catalog();
    EXPECT_TRUE(catalog.resolve("carol", {"viewer", "ops"}).is_admin);
}

TEST(RoleCatalog, BuiltinAdminNames) {
    const auto catalog = make_catalog();
    EXPECT_TRUE(catalog.is_admin_role("admin"));
    EXPECT_TRUE(catalog.is_admin_role("super_admin"));
    EXPECT_TRUE(catalog.resolve("dave", {"super_admin"}).is_admin)
        << "카탈로그에 없어도 관리자 이름";
    EXPECT_FALSE(catalog.is_admin_role("Admin")) << "대소문자 구분";
    EXPECT_FALSE(catalog.is_admin_role("viewer"));
}

TEST(RoleCatalog, AnonymousPrincipal) {
    const auto catalog   = make_catalog();
    const auto principal = catalog.resolve(std::nullopt, {"viewer"});
    EXPECT_FALSE(principal.user_id.has_value());
    EXPECT_FALSE(principal.permissions.empty());
}

TEST(RoleCatalog, PermissionsFor) {
    const auto catalog = make_catalog();
    EXPECT_EQ(catalog.permissions_for("analyst"),
              (std::vector<std::string>{"table:select", "table:insert"}));
    EXPECT_TRUE(catalog.permissions_for("ghost").empty());
}

TEST(RoleCatalog, DuplicateAndUnnamedRolesIgnored) {
    const RoleCatalog catalog({
        RoleDefinition{"viewer", {"table:select"}, false},
        RoleDefinition{"viewer", {"table:drop"}, true},
        RoleDefinition{"", {"table:insert"}, false},
    });
    EXPECT_EQ(catalog.size(), 1u);
    EXPECT_EQ(catalog.permissions_for("viewer"), std::vector<std::string>{"table:select"})
        << "먼저 정의된 역할이 유지됨";
    EXPECT_FALSE(catalog.is_admin_role("viewer"));
}
