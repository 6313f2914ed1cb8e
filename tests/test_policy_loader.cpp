// ---------------------------------------------------------------------------
// test_policy_loader.cpp
//
// PolicyLoader::load 단위 테스트.
//
// [테스트 범위]
// - 정상 파일의 모든 섹션 (global, permission_families, roles, data_access_rules)
// - 기본값 (id 자동 부여, 패턴 "*", 빈 default_database)
// - fail-close: 파일 없음, YAML 문법 오류, 최상위 비-map, role/user 규칙 위반
// - 잘못된 /regex/ 패턴은 경고만 하고 로드 성공
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Fixture: 임시 정책 파일
// ---------------------------------------------------------------------------
class PolicyLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "sqlguard_test_policy" /
               (std::string(info->test_suite_name()) + "_" + info->name());
        fs::create_directories(dir_);
        path_ = dir_ / "policy.yaml";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write(const std::string& content) const {
        std::ofstream out(path_);
        out << content;
    }

    fs::path dir_;
    fs::path path_;
};

TEST_F(PolicyLoaderTest, LoadsEverySection) {
    write(R"(
global:
  log_level: debug
  log_path: /var/log/sqlguard/audit.log
  default_database: analytics
  allow_system_databases: true

permission_families:
  read: [reports:view]

roles:
  - name: viewer
    permissions: [reports:view, table:select]
  - name: ops
    admin: true

data_access_rules:
  - id: viewer-analytics
    role: viewer
    database: analytics
    table: "*"
    allowed: true
    priority: 3
    description: dashboards
  - user: alice
    connection: ch-prod
    database: "/^app_/"
    table: events
    allowed: false
)");

    const auto result = PolicyLoader::load(path_);
    ASSERT_TRUE(result.has_value()) << result.error();

    EXPECT_EQ(result->global.log_level, "debug");
    EXPECT_EQ(result->global.log_path, "/var/log/sqlguard/audit.log");
    EXPECT_EQ(result->global.default_database, "analytics");
    EXPECT_TRUE(result->global.allow_system_databases);

    EXPECT_EQ(result->permission_families.read, std::vector<std::string>{"reports:view"});
    EXPECT_EQ(result->permission_families.write, PermissionFamilies{}.write)
        << "명시하지 않은 군은 기본값 유지";

    ASSERT_EQ(result->roles.size(), 2u);
    EXPECT_EQ(result->roles[0].name, "viewer");
    EXPECT_EQ(result->roles[0].permissions.size(), 2u);
    EXPECT_FALSE(result->roles[0].admin);
    EXPECT_TRUE(result->roles[1].admin);

    ASSERT_EQ(result->data_access_rules.size(), 2u);
    const auto& first = result->data_access_rules[0];
    EXPECT_EQ(first.id, "viewer-analytics");
    EXPECT_EQ(first.role, "viewer");
    EXPECT_FALSE(first.user.has_value());
    EXPECT_EQ(first.priority, 3);
    EXPECT_EQ(first.description, "dashboards");

    const auto& second = result->data_access_rules[1];
    EXPECT_EQ(second.id, "rule-2");
    EXPECT_EQ(second.user, "alice");
    EXPECT_EQ(second.connection, "ch-prod");
    EXPECT_EQ(second.database_pattern, "/^app_/");
    EXPECT_EQ(second.table_pattern, "events");
    EXPECT_FALSE(second.allowed);
    EXPECT_EQ(second.priority, 0);
}

TEST_F(PolicyLoaderTest, DefaultsWhenSectionsMissing) {
    write(R"(
data_access_rules:
  - role: viewer
)");
    const auto result = PolicyLoader::load(path_);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->global.log_level, "info");
    EXPECT_EQ(result->global.default_database, "default");
    EXPECT_FALSE(result->global.allow_system_databases);
    EXPECT_TRUE(result->roles.empty());

    ASSERT_EQ(result->data_access_rules.size(), 1u);
    EXPECT_EQ(result->data_access_rules[0].database_pattern, "*");
    EXPECT_EQ(result->data_access_rules[0].table_pattern, "*");
    EXPECT_TRUE(result->data_access_rules[0].allowed);
}

TEST_F(PolicyLoaderTest, EmptyDefaultDatabaseReplaced) {
    write(R"(
global:
  default_database: ""
)");
    const auto result = PolicyLoader::load(path_);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->global.default_database, "default");
    EXPECT_TRUE(result->data_access_rules.empty());
}

TEST_F(PolicyLoaderTest, InvalidRegexPatternStillLoads) {
    write(R"(
data_access_rules:
  - id: broken
    role: viewer
    database: "/([unclosed/"
)");
    const auto result = PolicyLoader::load(path_);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->data_access_rules[0].database_pattern, "/([unclosed/");
}

TEST_F(PolicyLoaderTest, InvalidPriorityFallsBackToZero) {
    write(R"(
data_access_rules:
  - role: viewer
    priority: high
)");
    const auto result = PolicyLoader::load(path_);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->data_access_rules[0].priority, 0);
}

// ---------------------------------------------------------------------------
// fail-close
// ---------------------------------------------------------------------------

TEST_F(PolicyLoaderTest, MissingFileFails) {
    const auto result = PolicyLoader::load(dir_ / "does_not_exist.yaml");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("policy_loader:"), std::string::npos);
}

TEST_F(PolicyLoaderTest, SyntaxErrorFails) {
    write("roles: [unclosed\n  - name: x\n");
    const auto result = PolicyLoader::load(path_);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("YAML"), std::string::npos);
}

TEST_F(PolicyLoaderTest, TopLevelSequenceFails) {
    write("- a\n- b\n");
    const auto result = PolicyLoader::load(path_);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("not a valid YAML map"), std::string::npos);
}

TEST_F(PolicyLoaderTest, RuleWithoutRoleOrUserFails) {
    write(R"(
data_access_rules:
  - id: orphan
    database: analytics
)");
    const auto result = PolicyLoader::load(path_);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("exactly one of 'role' or 'user'"), std::string::npos);
    EXPECT_NE(result.error().find("orphan"), std::string::npos);
}

TEST_F(PolicyLoaderTest, RuleWithBothRoleAndUserFails) {
    write(R"(
data_access_rules:
  - role: viewer
    user: alice
)");
    EXPECT_FALSE(PolicyLoader::load(path_).has_value());
}

TEST_F(PolicyLoaderTest, EmptyPatternFails) {
    write(R"(
data_access_rules:
  - role: viewer
    table: ""
)");
    const auto result = PolicyLoader::load(path_);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("empty database or table pattern"), std::string::npos);
}

TEST_F(PolicyLoaderTest, RoleWithoutNameFails) {
    write(R"(
roles:
  - permissions: [table:select]
)");
    const auto result = PolicyLoader::load(path_);
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("roles[0] has no name"), std::string::npos);
}

TEST_F(PolicyLoaderTest, ShippedPolicyFileLoads) {
    const fs::path shipped = fs::path(SQLGUARD_SOURCE_DIR) / "config" / "policy.yaml";
    const auto result = PolicyLoader::load(shipped);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_FALSE(result->roles.empty());
    EXPECT_FALSE(result->data_access_rules.empty());
    EXPECT_FALSE(result->global.allow_system_databases);
}
