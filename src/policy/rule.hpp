#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 정책 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/policy.yaml 에서 로드된다.
//
// [설계 원칙]
// - 모든 컨테이너 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - 이 구조체 자체는 판정 로직을 포함하지 않는다.
//   판정은 RuleGrantStore / AccessValidator 가 수행하며 실패 시 항상 거부한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "policy/access_type.hpp"  // PermissionFamilies

// ---------------------------------------------------------------------------
// DataAccessRule
//   어떤 database/table 에 접근할 수 있는지를 정의하는 규칙.
//   role 또는 user 중 정확히 하나를 가진다 (PolicyLoader 가 검증).
//
//   [패턴 문법]
//   - "*"        : 전부 일치
//   - "/regex/"  : 대소문자 무시 정규식 (잘못된 정규식은 아무것도 일치하지 않음)
//   - "app_*"    : glob ('*' 만 와일드카드)
//   - 그 외      : 대소문자 무시 완전 일치
//
//   [우선순위]
//   priority 가 높은 규칙이 먼저 평가된다. 같은 priority 에서는 거부 규칙이 먼저다.
// ---------------------------------------------------------------------------
struct DataAccessRule {
    std::string                id{};
    std::optional<std::string> role{};        // 역할 이름
    std::optional<std::string> user{};        // RBAC 사용자 ID
    std::optional<std::string> connection{};  // 없으면 모든 커넥션에 적용
    std::string                database_pattern{"*"};
    std::string                table_pattern{"*"};
    bool                       allowed{true};
    std::int32_t               priority{0};
    std::string                description{};
};

// ---------------------------------------------------------------------------
// RoleDefinition
//   역할 이름 → 권한 문자열. admin = true 이면 모든 검사를 우회한다.
//   이름이 super_admin / admin 인 역할은 설정과 무관하게 관리자 역할이다.
// ---------------------------------------------------------------------------
struct RoleDefinition {
    std::string              name{};
    std::vector<std::string> permissions{};
    bool                     admin{false};
};

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "trace"|"debug"|"info"|"warn"|"error"|"critical"
//   default_database: 요청에 기본 DB 가 없을 때 쓰는 값
//   allow_system_databases: true 면 system/information_schema 를 규칙 없이 허용
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"/tmp/sqlguard.log"};
    std::string default_database{"default"};
    bool        allow_system_databases{false};
};

// ---------------------------------------------------------------------------
// PolicyConfig
//   전체 정책 설정의 루트 구조체.
//   PolicyLoader::load 가 반환하는 최종 결과물.
//
//   [Hot Reload 고려사항]
//   - RuleGrantStore::reload 를 통해 규칙 목록을 shared_ptr 교체 방식으로 원자적 갱신.
//   - 갱신 중 진행 중인 검사는 이전 규칙으로 완료된다.
// ---------------------------------------------------------------------------
struct PolicyConfig {
    GlobalConfig                global{};
    PermissionFamilies          permission_families{};
    std::vector<RoleDefinition> roles{};
    std::vector<DataAccessRule> data_access_rules{};
};
