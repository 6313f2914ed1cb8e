#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 정책 파일을 로드하여 PolicyConfig 로 파싱하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는
//   실패 시 반드시 기존 정책을 유지하거나 서비스를 차단해야 한다.
// - 규칙 교체는 RuleGrantStore::reload 가 담당한다. 로더는 파일 → 구조체 변환만 한다.
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp (단방향만)
// ❌ rule.hpp → policy_loader.hpp 금지
//
// [보안 고려사항]
// - YAML 파일 경로는 config/환경변수에서만 지정하고 사용자 입력을 직접 사용 금지.
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것
//   (민감 정보 노출 방지).
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "rule.hpp"  // PolicyConfig

class PolicyLoader {
public:
    PolicyLoader()  = default;
    ~PolicyLoader() = default;

    PolicyLoader(const PolicyLoader&)            = default;
    PolicyLoader& operator=(const PolicyLoader&) = default;
    PolicyLoader(PolicyLoader&&)                 = default;
    PolicyLoader& operator=(PolicyLoader&&)      = default;

    // load
    //   지정된 경로의 YAML 파일을 읽어 PolicyConfig 로 파싱한다.
    //
    //   [fail-close 요구사항]
    //   파일 없음, 파싱 오류, 스키마 불일치(role/user 가 둘 다 없거나 둘 다 있는
    //   규칙 포함) 모두 실패로 처리한다. 부분적으로 파싱된 정책을 반환하지 않는다.
    //
    //   [오탐 주의]
    //   "/regex/" 패턴이 잘못 작성되면 해당 규칙은 어떤 객체와도 일치하지 않는다.
    //   로드 시점에 경고 로그를 출력한다 (로드 자체는 성공).
    [[nodiscard]] static std::expected<PolicyConfig, std::string>
    load(const std::filesystem::path& config_path);
};
