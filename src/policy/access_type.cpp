#include "policy/access_type.hpp"

#include <algorithm>

AccessType classify_access_type(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::kSelect:
            return AccessType::kRead;
        case OperationKind::kInsert:
        case OperationKind::kUpdate:
        case OperationKind::kDelete:
            return AccessType::kWrite;
        case OperationKind::kCreate:
        case OperationKind::kDrop:
        case OperationKind::kAlter:
        case OperationKind::kTruncate:
            return AccessType::kAdmin;
        case OperationKind::kShow:
        case OperationKind::kDescribe:
        case OperationKind::kUse:
        case OperationKind::kSet:
        case OperationKind::kExplain:
        case OperationKind::kExists:
        case OperationKind::kCheck:
        case OperationKind::kKill:
        case OperationKind::kUnknown:
            return AccessType::kMisc;
    }
    return AccessType::kMisc;
}

std::string_view access_type_to_string(AccessType type) noexcept {
    switch (type) {
        case AccessType::kRead:  return "read";
        case AccessType::kWrite: return "write";
        case AccessType::kAdmin: return "admin";
        case AccessType::kMisc:  return "misc";
    }
    return "misc";
}

bool has_permission_for(const std::vector<std::string>& permissions,
                        AccessType                      access,
                        const PermissionFamilies&       families) {
    const std::vector<std::string>* family = nullptr;
    switch (access) {
        case AccessType::kRead:  family = &families.read;  break;
        case AccessType::kWrite: family = &families.write; break;
        case AccessType::kAdmin: family = &families.admin; break;
        case AccessType::kMisc:  return false;
    }
    if (family == nullptr) {
        return false;
    }
    return std::any_of(permissions.begin(), permissions.end(), [family](const std::string& p) {
        return std::find(family->begin(), family->end(), p) != family->end();
    });
}
