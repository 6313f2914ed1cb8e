// ---------------------------------------------------------------------------
// statement_splitter.cpp
//
// 상태 머신 기반 구문 분리기.
//
// [상태 전이]
//   kNormal        ── '       → kSingleQuote
//                  ── "       → kDoubleQuote
//                  ── `       → kBacktick
//                  ── --      → kLineComment
//                  ── /*      → kBlockComment
//                  ── ;       → 현재 구문 확정
//   kSingleQuote   ── \x      → (x 건너뜀, 상태 유지)
//                  ── '       → kNormal
//   kDoubleQuote / kBacktick 도 동일 규칙.
//   kLineComment   ── \n      → kNormal
//   kBlockComment  ── */      → kNormal
//
// 상태는 스캔 루프의 지역 변수로만 존재한다 (전역 상태 없음).
// ---------------------------------------------------------------------------

#include "parser/statement_splitter.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace {

enum class ScanState : std::uint8_t {
    kNormal,
    kSingleQuote,
    kDoubleQuote,
    kBacktick,
    kLineComment,
    kBlockComment,
};

std::string_view trim(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

// 현재까지 누적된 구문을 확정한다. 공백뿐인 조각(";;" 등)은 버린다.
void flush(std::string_view sql, std::size_t begin, std::size_t end,
           std::vector<std::string>& out) {
    const auto stmt = trim(sql.substr(begin, end - begin));
    if (!stmt.empty()) {
        out.emplace_back(stmt);
    }
}

// 따옴표 상태에서의 한 글자 처리. 닫는 따옴표를 만나면 kNormal 로 복귀한다.
ScanState step_quoted(ScanState state, char quote, std::string_view sql, std::size_t& i) {
    const char c = sql[i];
    if (c == '\\') {
        // 이스케이프: 다음 문자(\' \" \` 포함)는 따옴표를 닫지 않는다.
        ++i;
        return state;
    }
    if (c == quote) {
        return ScanState::kNormal;
    }
    return state;
}

}  // namespace

std::vector<std::string> split_statements(std::string_view sql) {
    std::vector<std::string> statements;

    ScanState         state = ScanState::kNormal;
    std::size_t       start = 0;
    const std::size_t len   = sql.size();

    for (std::size_t i = 0; i < len; ++i) {
        const char c    = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        switch (state) {
            case ScanState::kNormal:
                if (c == '\'') {
                    state = ScanState::kSingleQuote;
                } else if (c == '"') {
                    state = ScanState::kDoubleQuote;
                } else if (c == '`') {
                    state = ScanState::kBacktick;
                } else if (c == '-' && next == '-') {
                    state = ScanState::kLineComment;
                    ++i;
                } else if (c == '/' && next == '*') {
                    state = ScanState::kBlockComment;
                    ++i;
                } else if (c == ';') {
                    flush(sql, start, i, statements);
                    start = i + 1;
                }
                break;

            case ScanState::kSingleQuote:
                state = step_quoted(state, '\'', sql, i);
                break;

            case ScanState::kDoubleQuote:
                state = step_quoted(state, '"', sql, i);
                break;

            case ScanState::kBacktick:
                state = step_quoted(state, '`', sql, i);
                break;

            case ScanState::kLineComment:
                if (c == '\n') {
                    state = ScanState::kNormal;
                }
                break;

            case ScanState::kBlockComment:
                if (c == '*' && next == '/') {
                    state = ScanState::kNormal;
                    ++i;
                }
                break;
        }
    }

    // 마지막 구문은 세미콜론 없이 끝날 수 있다.
    // 닫히지 않은 따옴표/주석이 남아 있어도 나머지 전체를 하나의 구문으로 취급한다.
    if (start < len) {
        flush(sql, start, len, statements);
    }

    return statements;
}
