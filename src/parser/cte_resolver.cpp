// ---------------------------------------------------------------------------
// cte_resolver.cpp
// ---------------------------------------------------------------------------

#include "parser/cte_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <type_traits>
#include <variant>

namespace {

bool is_word_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) != 0 || c == '_' || c == '$' || uc >= 0x80;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

// 주석은 공백으로, 작은따옴표 문자열은 빈 리터럴('')로 바꾼다.
// 따옴표 식별자(`x`, "x")는 CTE 이름일 수 있으므로 그대로 둔다.
std::string strip_comments_and_strings(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());
    const std::size_t len = sql.size();
    std::size_t       i   = 0;

    while (i < len) {
        const char c    = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        if ((c == '-' && next == '-') || c == '#') {
            while (i < len && sql[i] != '\n') {
                ++i;
            }
            out.push_back(' ');
            continue;
        }
        if (c == '/' && next == '*') {
            const auto close = sql.find("*/", i + 2);
            i = (close == std::string_view::npos) ? len : close + 2;
            out.push_back(' ');
            continue;
        }
        if (c == '\'') {
            ++i;
            while (i < len) {
                if (sql[i] == '\\') {
                    i += 2;
                    continue;
                }
                if (sql[i] == '\'') {
                    ++i;
                    break;
                }
                ++i;
            }
            out.append("''");
            continue;
        }
        if (c == '`' || c == '"') {
            // 식별자 내부의 괄호/주석 기호가 상태 머신을 흔들지 않도록 통째로 복사한다.
            const auto close = sql.find(c, i + 1);
            const std::size_t end = (close == std::string_view::npos) ? len : close + 1;
            out.append(sql.substr(i, end - i));
            i = end;
            continue;
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

// '(' 위치에서 시작해 짝이 맞는 ')' 다음 위치를 반환한다. 짝이 없으면 끝.
std::size_t skip_balanced(std::string_view text, std::size_t i) {
    int depth = 0;
    for (; i < text.size(); ++i) {
        if (text[i] == '(') {
            ++depth;
        } else if (text[i] == ')') {
            if (--depth == 0) {
                return i + 1;
            }
        }
    }
    return text.size();
}

// 이름 하나를 읽는다. 따옴표 식별자는 따옴표를 벗긴다.
// quoted 는 따옴표 식별자였는지 알려준다 (키워드 판정 제외용).
std::string read_name(std::string_view text, std::size_t& i, bool& quoted) {
    quoted = false;
    if (i >= text.size()) {
        return {};
    }
    const char c = text[i];
    if (c == '`' || c == '"') {
        const auto close = text.find(c, i + 1);
        if (close == std::string_view::npos) {
            i = text.size();
            return {};
        }
        std::string name(text.substr(i + 1, close - i - 1));
        i      = close + 1;
        quoted = true;
        return name;
    }
    const std::size_t start = i;
    while (i < text.size() && is_word_char(text[i])) {
        ++i;
    }
    return std::string(text.substr(start, i - start));
}

enum class CteScanState : std::uint8_t {
    kExpectName,  // WITH 또는 ',' 직후
    kAfterName,   // 이름 뒤: (cols) 또는 AS
    kExpectBody,  // AS 뒤: ( ... )
    kAfterBody,   // 본문 뒤: ',' 이면 다음 CTE
};

// pos 는 WITH 바로 뒤. WITH 절이 아니면 아무것도 추가하지 않는다.
void scan_with_clause(std::string_view text, std::size_t pos, CteScope& names) {
    CteScanState state = CteScanState::kExpectName;
    std::string  pending;
    bool         first_word = true;

    while (pos < text.size()) {
        if (std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
            ++pos;
            continue;
        }
        const char c = text[pos];

        switch (state) {
            case CteScanState::kExpectName: {
                bool quoted = false;
                std::string name = read_name(text, pos, quoted);
                if (name.empty()) {
                    return;
                }
                if (!quoted && first_word && iequals(name, "RECURSIVE")) {
                    first_word = false;
                    continue;
                }
                first_word = false;
                pending    = to_lower_ascii(name);
                state      = CteScanState::kAfterName;
                break;
            }
            case CteScanState::kAfterName: {
                if (c == '(') {
                    pos = skip_balanced(text, pos);
                    continue;
                }
                bool quoted = false;
                const std::string word = read_name(text, pos, quoted);
                if (quoted || !iequals(word, "AS")) {
                    return;
                }
                state = CteScanState::kExpectBody;
                break;
            }
            case CteScanState::kExpectBody:
                if (c != '(') {
                    return;  // ClickHouse 의 WITH <expr> AS name 형식
                }
                names.insert(pending);
                pos   = skip_balanced(text, pos);
                state = CteScanState::kAfterBody;
                break;

            case CteScanState::kAfterBody:
                if (c != ',') {
                    return;
                }
                ++pos;
                state = CteScanState::kExpectName;
                break;
        }
    }
}

}  // namespace

std::string to_lower_ascii(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

CteScope extract_cte_names(std::string_view sql) {
    CteScope names;
    const std::string text = strip_comments_and_strings(sql);

    for (std::size_t i = 0; i + 4 <= text.size(); ++i) {
        if (!iequals(std::string_view(text).substr(i, 4), "WITH")) {
            continue;
        }
        const bool left_ok  = (i == 0) || !is_word_char(text[i - 1]);
        const bool right_ok = (i + 4 == text.size()) || !is_word_char(text[i + 4]);
        if (left_ok && right_ok) {
            scan_with_clause(text, i + 4, names);
        }
    }
    return names;
}

// ---------------------------------------------------------------------------
// TableCollector
// ---------------------------------------------------------------------------

std::vector<TableReference> TableCollector::collect(const Statement& stmt) {
    tables_.clear();
    visit_statement(stmt, CteScope{});
    return std::move(tables_);
}

void TableCollector::visit_statement(const Statement& stmt, const CteScope& scope) {
    std::visit(
        [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, SelectStatement>) {
                visit_select(node, scope);
            } else if constexpr (std::is_same_v<T, InsertStatement>) {
                const CteScope inner = enter_ctes(node.ctes, scope);
                if (node.function_targets.empty()) {
                    add_target(node.target);
                }
                for (const auto& name : node.function_targets) {
                    add_target(name);
                }
                if (node.source) {
                    visit_select(*node.source, inner);
                }
                visit_expressions(node.expressions, inner);
            } else if constexpr (std::is_same_v<T, UpdateStatement>) {
                const CteScope inner = enter_ctes(node.ctes, scope);
                visit_factors(node.targets, inner, true);
                visit_expressions(node.expressions, inner);
            } else if constexpr (std::is_same_v<T, DeleteStatement>) {
                const CteScope inner = enter_ctes(node.ctes, scope);
                visit_factors(node.from, inner, true);
                visit_factors(node.using_, inner, true);
                visit_expressions(node.expressions, inner);
            } else if constexpr (std::is_same_v<T, DdlStatement>) {
                for (const auto& name : node.tables) {
                    add_target(name);
                }
                for (const auto& db : node.databases) {
                    tables_.push_back(TableReference{db, "*"});
                }
                if (node.query) {
                    visit_select(*node.query, scope);
                }
                visit_expressions(node.expressions, scope);
            } else {
                for (const auto& name : node.tables) {
                    add_target(name);
                }
                if (node.inner) {
                    visit_statement(*node.inner, scope);
                }
                visit_expressions(node.expressions, scope);
            }
        },
        stmt.node);
}

void TableCollector::visit_select(const SelectStatement& select, CteScope scope) {
    scope = enter_ctes(select.ctes, std::move(scope));
    for (const auto& operand : select.operands) {
        if (const auto* block = std::get_if<QueryBlock>(&operand)) {
            visit_block(*block, scope);
        } else if (const auto& nested = std::get<std::unique_ptr<SelectStatement>>(operand)) {
            visit_select(*nested, scope);
        }
    }
    visit_expressions(select.modifiers, scope);
}

CteScope TableCollector::enter_ctes(const std::vector<CommonTableExpression>& ctes,
                                    CteScope scope) {
    for (const auto& cte : ctes) {
        scope.insert(to_lower_ascii(cte.name));
        if (cte.body) {
            visit_select(*cte.body, scope);
        }
    }
    return scope;
}

void TableCollector::visit_block(const QueryBlock& block, const CteScope& scope) {
    visit_factors(block.from, scope, false);
    visit_expressions(block.expressions, scope);
}

void TableCollector::visit_factors(const std::vector<TableFactor>& factors,
                                   const CteScope& scope, bool as_targets) {
    for (const auto& factor : factors) {
        if (const auto* table = std::get_if<NamedTable>(&factor)) {
            if (as_targets) {
                add_target(table->name);
            } else {
                add_source(table->name, scope);
            }
        } else if (const auto* function = std::get_if<TableFunction>(&factor)) {
            for (const auto& name : function->tables) {
                add_target(name);
            }
        } else if (const auto& derived = std::get<DerivedTable>(factor); derived.query) {
            visit_select(*derived.query, scope);
        }
    }
}

void TableCollector::visit_expressions(const std::vector<Expression>& exprs,
                                       const CteScope& scope) {
    for (const auto& expr : exprs) {
        for (const auto& name : expr.tables) {
            add_source(name, scope);
        }
        for (const auto& subquery : expr.subqueries) {
            if (subquery) {
                visit_select(*subquery, scope);
            }
        }
    }
}

void TableCollector::add_source(const TableName& name, const CteScope& scope) {
    if (!name.database && scope.contains(to_lower_ascii(name.table))) {
        return;
    }
    tables_.push_back(TableReference{name.database, name.table});
}

void TableCollector::add_target(const TableName& name) {
    tables_.push_back(TableReference{name.database, name.table});
}
