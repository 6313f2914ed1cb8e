#pragma once

// ---------------------------------------------------------------------------
// sql_lexer.hpp
//
// MySQL/ClickHouse 호환 SQL 토크나이저.
// sql_grammar 의 입력으로 쓰이는 토큰 스트림을 만든다.
//
// [설계 원칙]
// - 주석(--, #, /* */)은 토큰을 만들지 않고 버린다.
// - 따옴표 식별자(`x`, "x")는 따옴표를 벗긴 이름으로 kQuotedIdentifier 가 된다.
//   quoted 식별자는 절대 키워드로 해석되지 않는다.
// - 닫히지 않은 문자열/식별자/주석은 ParseError(kUnterminatedToken) 이다.
//   이 경우 호출자는 정규식 fallback 경로로 내려간다.
//
// [알려진 한계]
// - 연산자는 한 글자씩 kPunct 로 분해한다 (<=, ::, -> 도 두 토큰).
//   테이블 추출 목적에는 구분할 필요가 없다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // ParseError

enum class TokenType : std::uint8_t {
    kWord             = 0,  // 키워드 또는 따옴표 없는 식별자
    kQuotedIdentifier = 1,  // `name` 또는 "name" (따옴표 제거됨)
    kString           = 2,  // '...' 문자열 리터럴
    kNumber           = 3,
    kPunct            = 4,  // ( ) , . ; 및 기타 연산자 문자
    kEnd              = 5,
};

struct Token {
    TokenType   type{TokenType::kEnd};
    std::string text{};
    std::size_t offset{0};  // 원문 내 시작 위치 (오류 메시지용)
};

// tokenize
//   sql 전체를 토큰 벡터로 변환한다. 성공 시 마지막 원소는 항상 kEnd 이다.
[[nodiscard]] std::expected<std::vector<Token>, ParseError>
tokenize(std::string_view sql);

// is_keyword
//   tok 이 kWord 이고 keyword 와 대소문자 무시 일치하면 true.
[[nodiscard]] bool is_keyword(const Token& tok, std::string_view keyword) noexcept;

[[nodiscard]] bool is_punct(const Token& tok, char c) noexcept;
