// ---------------------------------------------------------------------------
// sql_parser.cpp
//
// 문법 경로 → 실패 시 휴리스틱 경로.
//
// [휴리스틱 정규식 순서]
// 순서가 곧 결과 순서다. validator 의 중복 제거는 먼저 나온 항목을 유지하므로
// db.table 패턴이 항상 같은 키워드의 table 패턴보다 앞선다.
//   1. FROM db.t      2. FROM t
//   3. INTO db.t      4. INTO t
//   5. UPDATE db.t    6. UPDATE t
//   7. (DROP|CREATE|ALTER|TRUNCATE) TABLE db.t   8. 같은 형식의 t
//   9. TABLE db.t    10. TABLE t
//  11. JOIN db.t     12. JOIN t
// 식별자 토큰은 [`"]?\w+[`"]? 이며 따옴표는 제거한다.
//
// [알려진 한계]
// - "FROM t" 패턴은 "FROM db.t" 의 db 부분도 테이블로 잡는다 (db 만 남은 항목).
//   system_object_reconciler 의 두 번째 휴리스틱이 이를 db.t 로 되돌린다.
// ---------------------------------------------------------------------------

#include "parser/sql_parser.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "parser/cte_resolver.hpp"
#include "parser/sql_grammar.hpp"

// ---------------------------------------------------------------------------
// 익명 네임스페이스: 내부 헬퍼 함수들
// ---------------------------------------------------------------------------
namespace {

// 문자열의 앞뒤 공백(스페이스, 탭, 개행 포함)을 제거한다.
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

// 연속 공백을 스페이스 하나로 접는다.
std::string collapse_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool in_space = false;
    for (const char c : trim(s)) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (!in_space) {
                out.push_back(' ');
            }
            in_space = true;
        } else {
            out.push_back(c);
            in_space = false;
        }
    }
    return out;
}

std::string strip_quotes(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        if (c != '`' && c != '"') {
            out.push_back(c);
        }
    }
    return out;
}

bool starts_with_icase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(s[i])) !=
            std::toupper(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

const std::vector<std::regex>& heuristic_patterns() {
    static const std::vector<std::regex> kPatterns = [] {
        constexpr auto kFlags = std::regex_constants::ECMAScript | std::regex_constants::icase;
        const std::string ident = "([`\"]?\\w+[`\"]?)";
        const std::string qualified = ident + "\\." + ident;
        const std::vector<std::string> keywords = {
            "FROM\\s+",
            "INTO\\s+",
            "UPDATE\\s+",
            "(?:DROP|CREATE|ALTER|TRUNCATE)\\s+TABLE\\s+",
            "TABLE\\s+",
            "JOIN\\s+",
        };
        std::vector<std::regex> patterns;
        patterns.reserve(keywords.size() * 2);
        for (const auto& kw : keywords) {
            patterns.emplace_back(kw + qualified, kFlags);
            patterns.emplace_back(kw + ident, kFlags);
        }
        return patterns;
    }();
    return kPatterns;
}

// 완전히 같은 (database, table) 쌍의 뒤쪽 항목을 제거한다. 순서는 유지한다.
std::vector<TableReference> remove_exact_duplicates(std::vector<TableReference> tables) {
    std::vector<TableReference> unique;
    unique.reserve(tables.size());
    for (auto& ref : tables) {
        if (ref.table.empty()) {
            continue;
        }
        if (std::find(unique.begin(), unique.end(), ref) == unique.end()) {
            unique.push_back(std::move(ref));
        }
    }
    return unique;
}

}  // namespace

// ---------------------------------------------------------------------------
// 공개 함수
// ---------------------------------------------------------------------------

OperationKind classify_statement_prefix(std::string_view statement) noexcept {
    const auto s = trim(statement);

    // 접두사 비교이므로 DESCRIBE 는 DESC 보다, 더 긴 키워드가 먼저 오도록 배치한다.
    struct PrefixRule {
        std::string_view prefix;
        OperationKind    kind;
    };
    static constexpr PrefixRule kRules[] = {
        {"SELECT",   OperationKind::kSelect},
        {"WITH",     OperationKind::kSelect},
        {"INSERT",   OperationKind::kInsert},
        {"UPDATE",   OperationKind::kUpdate},
        {"DELETE",   OperationKind::kDelete},
        {"CREATE",   OperationKind::kCreate},
        {"DROP",     OperationKind::kDrop},
        {"ALTER",    OperationKind::kAlter},
        {"TRUNCATE", OperationKind::kTruncate},
        {"SHOW",     OperationKind::kShow},
        {"DESCRIBE", OperationKind::kDescribe},
        {"DESC",     OperationKind::kDescribe},
        {"USE",      OperationKind::kUse},
        {"SET",      OperationKind::kSet},
        {"EXPLAIN",  OperationKind::kExplain},
        {"EXISTS",   OperationKind::kExists},
        {"CHECK",    OperationKind::kCheck},
        {"KILL",     OperationKind::kKill},
    };

    for (const auto& rule : kRules) {
        if (starts_with_icase(s, rule.prefix)) {
            return rule.kind;
        }
    }
    return OperationKind::kUnknown;
}

std::vector<TableReference> extract_tables_heuristic(std::string_view statement) {
    std::vector<TableReference> tables;
    const std::string normalized = collapse_whitespace(statement);
    const CteScope    cte_names  = extract_cte_names(statement);

    for (const auto& re : heuristic_patterns()) {
        try {
            auto       it     = std::sregex_iterator(normalized.begin(), normalized.end(), re);
            const auto end_it = std::sregex_iterator();
            for (; it != end_it; ++it) {
                const std::smatch& m = *it;
                TableReference ref;
                if (m.size() > 2 && m[2].matched) {
                    ref.database = strip_quotes(m[1].str());
                    ref.table    = strip_quotes(m[2].str());
                } else {
                    ref.table = strip_quotes(m[1].str());
                }
                if (ref.table.empty()) {
                    continue;
                }
                // CTE 는 한정되지 않은 이름으로만 가려진다 (db.c 는 실제 테이블)
                if (!ref.database && cte_names.contains(to_lower_ascii(ref.table))) {
                    continue;
                }
                tables.push_back(std::move(ref));
            }
        } catch (const std::regex_error& e) {
            // 입력이 커서 regex 엔진이 포기한 경우. 이 패턴의 결과만 잃는다.
            spdlog::warn("sql_parser: heuristic pattern failed: {}", e.what());
        }
    }
    return tables;
}

std::string_view operation_kind_to_string(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::kSelect:   return "select";
        case OperationKind::kInsert:   return "insert";
        case OperationKind::kUpdate:   return "update";
        case OperationKind::kDelete:   return "delete";
        case OperationKind::kCreate:   return "create";
        case OperationKind::kDrop:     return "drop";
        case OperationKind::kAlter:    return "alter";
        case OperationKind::kTruncate: return "truncate";
        case OperationKind::kShow:     return "show";
        case OperationKind::kDescribe: return "describe";
        case OperationKind::kUse:      return "use";
        case OperationKind::kSet:      return "set";
        case OperationKind::kExplain:  return "explain";
        case OperationKind::kExists:   return "exists";
        case OperationKind::kCheck:    return "check";
        case OperationKind::kKill:     return "kill";
        case OperationKind::kUnknown:  return "unknown";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// SqlParser::parse
// ---------------------------------------------------------------------------
ParsedStatement SqlParser::parse(std::string_view statement) const {
    ParsedStatement result;
    result.text = std::string(statement);

    auto tree = parse_sql_statement(statement);
    if (tree) {
        TableCollector collector;
        result.kind     = statement_kind(*tree);
        result.tables   = remove_exact_duplicates(collector.collect(*tree));
        result.strategy = ParseStrategy::kGrammar;
        return result;
    }

    const ParseError& err = tree.error();
    spdlog::debug("sql_parser: grammar rejected statement ({}: {}), using heuristic path",
                  err.message, err.context);

    result.kind     = classify_statement_prefix(statement);
    result.tables   = remove_exact_duplicates(extract_tables_heuristic(statement));
    result.strategy = ParseStrategy::kHeuristic;
    result.diagnostics.push_back(
        fmt::format("Failed to parse statement (using fallback): {}", err.message));
    if (!err.context.empty()) {
        result.diagnostics.push_back(err.context);
    }
    return result;
}
