#pragma once

// ---------------------------------------------------------------------------
// access_type.hpp
//
// OperationKind → AccessType 매핑과 권한 군(permission family) 검사.
//
// [보안 원칙]
// - 분류할 수 없는 구문(kUnknown)은 kMisc 로 매핑한다. kRead 로 매핑하지 않는다.
// - kMisc 는 어떤 권한 군에도 속하지 않으므로 비관리자에게는 항상 거부된다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "parser/statement_types.hpp"

enum class AccessType : std::uint8_t {
    kRead  = 0,
    kWrite = 1,
    kAdmin = 2,
    kMisc  = 3,
};

// ---------------------------------------------------------------------------
// PermissionFamilies
//   각 AccessType 을 충족시키는 권한 문자열 목록.
//   principal 의 권한 중 하나라도 해당 목록에 있으면 그 접근 종류가 허용된다.
// ---------------------------------------------------------------------------
struct PermissionFamilies {
    std::vector<std::string> read{
        "table:select", "query:execute", "database:view", "table:view",
    };
    std::vector<std::string> write{
        "table:insert", "table:update", "table:delete", "query:execute:dml",
    };
    std::vector<std::string> admin{
        "table:create", "table:alter", "table:drop",
        "database:create", "database:drop", "query:execute:ddl",
    };
};

// select → read; insert/update/delete → write;
// create/drop/alter/truncate → admin; 나머지 전부 → misc
[[nodiscard]] AccessType classify_access_type(OperationKind kind) noexcept;

// "read" | "write" | "admin" | "misc"
[[nodiscard]] std::string_view access_type_to_string(AccessType type) noexcept;

// has_permission_for
//   permissions 중 하나라도 access 에 해당하는 권한 군에 있으면 true.
//   kMisc 는 항상 false.
[[nodiscard]] bool has_permission_for(const std::vector<std::string>& permissions,
                                      AccessType                      access,
                                      const PermissionFamilies&       families);
