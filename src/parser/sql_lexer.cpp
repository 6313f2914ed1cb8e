// ---------------------------------------------------------------------------
// sql_lexer.cpp
//
// 단일 패스 토크나이저 구현.
// 문자열 리터럴은 MySQL 규칙을 따른다: 백슬래시 이스케이프와 '' 이중화 모두 허용.
// ---------------------------------------------------------------------------

#include "parser/sql_lexer.hpp"

#include <cctype>

#include <fmt/format.h>

namespace {

bool is_ident_start(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) != 0 || c == '_' || c == '$' || uc >= 0x80;
}

bool is_ident_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_' || c == '$' || uc >= 0x80;
}

ParseError unterminated(std::string_view what, std::size_t offset) {
    return ParseError{
        ParseErrorCode::kUnterminatedToken,
        fmt::format("unterminated {}", what),
        fmt::format("offset {}", offset),
    };
}

// quote 로 닫히는 구간을 읽는다. 같은 따옴표 두 번은 따옴표 한 글자로 취급한다.
// allow_backslash 가 true 면 \x 를 x 로 받아들인다.
// 닫는 따옴표를 찾으면 i 는 닫는 따옴표 다음 위치를 가리킨다.
bool read_quoted(std::string_view sql, std::size_t& i, char quote,
                 bool allow_backslash, std::string& out) {
    const std::size_t len = sql.size();
    ++i;  // 여는 따옴표
    while (i < len) {
        const char c = sql[i];
        if (allow_backslash && c == '\\' && i + 1 < len) {
            out.push_back(sql[i + 1]);
            i += 2;
            continue;
        }
        if (c == quote) {
            if (i + 1 < len && sql[i + 1] == quote) {
                out.push_back(quote);
                i += 2;
                continue;
            }
            ++i;
            return true;
        }
        out.push_back(c);
        ++i;
    }
    return false;
}

}  // namespace

std::expected<std::vector<Token>, ParseError>
tokenize(std::string_view sql) {
    std::vector<Token> tokens;
    const std::size_t  len = sql.size();
    std::size_t        i   = 0;

    while (i < len) {
        const char c    = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }

        // 주석
        if ((c == '-' && next == '-') || c == '#') {
            while (i < len && sql[i] != '\n') {
                ++i;
            }
            continue;
        }
        if (c == '/' && next == '*') {
            const auto close = sql.find("*/", i + 2);
            if (close == std::string_view::npos) {
                return std::unexpected(unterminated("block comment", i));
            }
            i = close + 2;
            continue;
        }

        const std::size_t start = i;

        if (c == '\'') {
            Token tok{TokenType::kString, {}, start};
            if (!read_quoted(sql, i, '\'', true, tok.text)) {
                return std::unexpected(unterminated("string literal", start));
            }
            tokens.push_back(std::move(tok));
            continue;
        }

        if (c == '`' || c == '"') {
            Token tok{TokenType::kQuotedIdentifier, {}, start};
            if (!read_quoted(sql, i, c, c == '"', tok.text)) {
                return std::unexpected(unterminated("quoted identifier", start));
            }
            tokens.push_back(std::move(tok));
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            // 1, 1.5, 1e10, 0x1F. 숫자로 시작하는 식별자(1abc)도 같은 규칙으로 읽는다.
            while (i < len && is_ident_char(sql[i])) {
                ++i;
            }
            if (i + 1 < len && sql[i] == '.' &&
                std::isdigit(static_cast<unsigned char>(sql[i + 1])) != 0) {
                ++i;
                while (i < len && is_ident_char(sql[i])) {
                    ++i;
                }
            }
            tokens.push_back(Token{TokenType::kNumber,
                                   std::string(sql.substr(start, i - start)), start});
            continue;
        }

        if (is_ident_start(c)) {
            while (i < len && is_ident_char(sql[i])) {
                ++i;
            }
            tokens.push_back(Token{TokenType::kWord,
                                   std::string(sql.substr(start, i - start)), start});
            continue;
        }

        tokens.push_back(Token{TokenType::kPunct, std::string(1, c), start});
        ++i;
    }

    tokens.push_back(Token{TokenType::kEnd, {}, len});
    return tokens;
}

bool is_keyword(const Token& tok, std::string_view keyword) noexcept {
    if (tok.type != TokenType::kWord || tok.text.size() != keyword.size()) {
        return false;
    }
    for (std::size_t i = 0; i < keyword.size(); ++i) {
        const auto a = std::toupper(static_cast<unsigned char>(tok.text[i]));
        const auto b = std::toupper(static_cast<unsigned char>(keyword[i]));
        if (a != b) {
            return false;
        }
    }
    return true;
}

bool is_punct(const Token& tok, char c) noexcept {
    return tok.type == TokenType::kPunct && tok.text.size() == 1 && tok.text[0] == c;
}
