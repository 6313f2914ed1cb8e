#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ConnectionContext
//   검증 요청 하나가 어느 커넥션(ClickHouse 접속 설정)에 대해 수행되는지를
//   식별하는 불변 컨텍스트.
//   HTTP 레이어가 생성하고 validator/grant store/logger 에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct ConnectionContext {
    std::optional<std::string> connection_id{};  // 커넥션 ID (없으면 전역 규칙만 적용)
    std::uint64_t              request_id{0};    // 요청 추적용 ID (로깅 전용)
};

// ---------------------------------------------------------------------------
// Principal
//   인증은 되었으나 신뢰할 수 없는 요청 주체.
//   user_id 가 없으면 인증되지 않은 것으로 간주한다.
// ---------------------------------------------------------------------------
struct Principal {
    std::optional<std::string> user_id{};      // RBAC 사용자 ID
    std::vector<std::string>   roles{};        // 부여된 역할 이름
    std::vector<std::string>   permissions{};  // 역할로부터 합쳐진 권한 문자열
    bool                       is_admin{false};
};

// ---------------------------------------------------------------------------
// ParseErrorCode
//   SQL 파싱 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kUnterminatedToken    = 0,  // 닫히지 않은 문자열/식별자/주석
    kUnexpectedToken      = 1,  // 문법상 허용되지 않는 토큰
    kUnexpectedEnd        = 2,  // 구문 도중 입력 종료
    kUnsupportedStatement = 3,  // 문법이 다루지 않는 구문 종류
    kInternalError        = 4,  // 파서 내부 오류
};

// ---------------------------------------------------------------------------
// ParseError
//   파싱 실패 시 반환되는 오류 정보.
//   std::expected<T, ParseError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ParseError {
    ParseErrorCode code{ParseErrorCode::kInternalError};
    std::string    message{};  // 사람이 읽을 수 있는 오류 설명
    std::string    context{};  // 오류가 발생한 위치/입력 단편 (로깅용)
};
