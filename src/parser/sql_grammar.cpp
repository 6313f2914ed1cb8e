// ---------------------------------------------------------------------------
// sql_grammar.cpp
//
// 재귀 하강 파서 구현.
//
// [오류 전파]
// 파서 내부에서는 GrammarError 예외로 즉시 빠져나오고, 진입점
// parse_sql_statement 에서 ParseError 로 변환한다.
// 예외는 이 번역 단위 밖으로 나가지 않는다.
//
// [키워드 집합]
// - kClauseStops: 최상위 식 스캔을 멈추는 단어. 그중 함수 이름으로도 쓰이는 단어
//   (LEFT, RIGHT, FORMAT, ARRAY)는 뒤에 '(' 가 오면 멈추지 않는다.
// - kReserved: 별칭이나 따옴표 없는 테이블 이름으로 받지 않는 단어.
//
// [테이블 함수]
// FROM f(...) 는 인자에서 대상 테이블을 해석한다 (resolve_table_function).
// remote/remoteSecure/cluster/clusterAllReplicas 는 db.table 또는 db, table 인자,
// merge 는 db 인자와 kPatternTable. 그 외 함수나 해석할 수 없는 인자는
// {kTableFunctionDatabase, 함수 이름} 으로 남겨 명시적으로 허용한 규칙만 통과시킨다.
// ---------------------------------------------------------------------------

#include "parser/sql_grammar.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include "parser/sql_lexer.hpp"

namespace {

constexpr std::size_t kMaxNestingDepth = 128;

class GrammarError : public std::runtime_error {
public:
    explicit GrammarError(ParseError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    [[nodiscard]] const ParseError& error() const noexcept { return error_; }

private:
    ParseError error_;
};

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

const std::unordered_set<std::string>& clause_stops() {
    static const std::unordered_set<std::string> kClauseStops = {
        "FROM", "WHERE", "PREWHERE", "GROUP", "HAVING", "ORDER", "LIMIT",
        "UNION", "EXCEPT", "INTERSECT", "MINUS", "WINDOW", "QUALIFY",
        "SETTINGS", "FORMAT", "INTO", "ON", "USING", "WITH", "SET",
        "JOIN", "INNER", "LEFT", "RIGHT", "FULL", "CROSS", "NATURAL",
        "STRAIGHT_JOIN", "ARRAY",
    };
    return kClauseStops;
}

const std::unordered_set<std::string>& reserved_words() {
    static const std::unordered_set<std::string> kReserved = [] {
        std::unordered_set<std::string> words = clause_stops();
        words.insert({
            "SELECT", "AS", "ALL", "ANY", "DISTINCT", "FINAL", "SAMPLE",
            "PARTITION", "USE", "FORCE", "IGNORE", "GLOBAL", "ASOF", "SEMI",
            "ANTI", "PASTE", "OUTER", "VALUES", "VALUE", "FOR", "LOCK",
            "RETURNING", "OFFSET", "FETCH", "AND", "OR", "NOT", "CASE", "WHEN",
            "THEN", "ELSE", "END", "IS", "NULL", "IN", "BETWEEN",
        });
        return words;
    }();
    return kReserved;
}

// 절 경계 키워드 중 함수 이름으로도 쓰이는 것. 뒤에 '(' 가 오면 식의 일부다.
const std::unordered_set<std::string>& function_like_stops() {
    static const std::unordered_set<std::string> kFunctionLike = {
        "LEFT", "RIGHT", "FORMAT", "ARRAY",
    };
    return kFunctionLike;
}

// JOIN 앞에 올 수 있는 수식어 (ClickHouse 의 GLOBAL/ANY/ASOF 등 포함)
const std::unordered_set<std::string>& join_modifiers() {
    static const std::unordered_set<std::string> kJoinModifiers = {
        "GLOBAL", "NATURAL", "INNER", "CROSS", "LEFT", "RIGHT", "FULL",
        "OUTER", "ANY", "ALL", "ASOF", "SEMI", "ANTI", "PASTE",
    };
    return kJoinModifiers;
}

enum class JoinOperator : std::uint8_t {
    kNone  = 0,
    kTable = 1,  // ... JOIN table_factor
    kArray = 2,  // ClickHouse ARRAY JOIN (오른쪽이 테이블이 아니라 배열 식)
};

void add_expression(std::vector<Expression>& out, Expression expr) {
    if (!expr.subqueries.empty() || !expr.tables.empty()) {
        out.push_back(std::move(expr));
    }
}

void append_tables(std::vector<TableName>& out, std::vector<TableName> tables) {
    for (auto& table : tables) {
        out.push_back(std::move(table));
    }
}

void append_expressions(std::vector<Expression>& out, std::vector<Expression> exprs) {
    for (auto& expr : exprs) {
        out.push_back(std::move(expr));
    }
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// 테이블 함수 인자 하나. 괄호 식이나 서브쿼리가 섞이면 nested.
struct FunctionArgument {
    std::vector<Token> tokens{};
    bool               nested{false};
};

bool is_name_token(const Token& tok) {
    return (tok.type == TokenType::kWord || tok.type == TokenType::kQuotedIdentifier ||
            tok.type == TokenType::kString) &&
           !tok.text.empty();
}

// db, `db`, 'db'
std::optional<std::string> argument_name(const FunctionArgument& arg) {
    if (arg.nested || arg.tokens.size() != 1 || !is_name_token(arg.tokens[0])) {
        return std::nullopt;
    }
    return arg.tokens[0].text;
}

// db.table
std::optional<TableName> argument_qualified_name(const FunctionArgument& arg) {
    if (arg.nested || arg.tokens.size() != 3 || !is_name_token(arg.tokens[0]) ||
        !is_punct(arg.tokens[1], '.') || !is_name_token(arg.tokens[2])) {
        return std::nullopt;
    }
    return TableName{arg.tokens[0].text, arg.tokens[2].text};
}

std::vector<TableName> resolve_table_function(std::string_view                     name,
                                              const std::vector<FunctionArgument>& args) {
    const std::string fn = to_lower(name);

    if (fn == "remote" || fn == "remotesecure" || fn == "cluster" ||
        fn == "clusterallreplicas") {
        // 첫 인자는 주소 또는 클러스터 이름
        if (args.size() >= 2) {
            if (auto qualified = argument_qualified_name(args[1])) {
                return {std::move(*qualified)};
            }
            if (args.size() >= 3) {
                auto db    = argument_name(args[1]);
                auto table = argument_name(args[2]);
                if (db && table) {
                    return {TableName{std::move(*db), std::move(*table)}};
                }
            }
        }
    } else if (fn == "merge") {
        // 정규식으로 고른 테이블에는 테이블 단위 거부 규칙을 적용할 수 없다.
        // db 접근과 함께 merge 자체에 대한 명시적 허용을 요구한다.
        std::optional<std::string> db;
        if (args.size() >= 2) {
            db = argument_name(args[0]);
        }
        if (args.size() == 1 || db) {
            return {
                TableName{std::move(db), std::string(kPatternTable)},
                TableName{std::string(kTableFunctionDatabase), fn},
            };
        }
    }
    return {TableName{std::string(kTableFunctionDatabase), fn}};
}

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    Statement parse_root() {
        Statement stmt = parse_statement();
        accept_punct(';');
        if (!at_end()) {
            fail("unexpected trailing input");
        }
        return stmt;
    }

private:
    // 재귀 깊이 제한. 병적으로 중첩된 입력이 스택을 소진하지 못하게 한다.
    class DepthGuard {
    public:
        explicit DepthGuard(Parser& parser) : parser_(parser) {
            if (++parser_.depth_ > kMaxNestingDepth) {
                parser_.fail("nesting too deep", ParseErrorCode::kUnsupportedStatement);
            }
        }
        ~DepthGuard() { --parser_.depth_; }

        DepthGuard(const DepthGuard&)            = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& parser_;
    };

    // ── 토큰 커서 ───────────────────────────────────────────────────────────

    [[nodiscard]] const Token& peek(std::size_t ahead = 0) const {
        const std::size_t idx = std::min(pos_ + ahead, tokens_.size() - 1);
        return tokens_[idx];
    }

    const Token& advance() {
        const Token& tok = tokens_[pos_];
        if (pos_ + 1 < tokens_.size()) {
            ++pos_;
        }
        return tok;
    }

    [[nodiscard]] bool at_end() const { return peek().type == TokenType::kEnd; }

    [[nodiscard]] bool at_keyword(std::string_view kw, std::size_t ahead = 0) const {
        return is_keyword(peek(ahead), kw);
    }

    [[nodiscard]] bool at_punct(char c, std::size_t ahead = 0) const {
        return is_punct(peek(ahead), c);
    }

    bool accept_keyword(std::string_view kw) {
        if (at_keyword(kw)) {
            advance();
            return true;
        }
        return false;
    }

    bool accept_punct(char c) {
        if (at_punct(c)) {
            advance();
            return true;
        }
        return false;
    }

    void expect_keyword(std::string_view kw) {
        if (!accept_keyword(kw)) {
            fail(fmt::format("expected {}", kw));
        }
    }

    void expect_punct(char c) {
        if (!accept_punct(c)) {
            fail(fmt::format("expected '{}'", c));
        }
    }

    [[nodiscard]] bool at_identifier(std::size_t ahead = 0) const {
        const Token& tok = peek(ahead);
        if (tok.type == TokenType::kQuotedIdentifier) {
            return true;
        }
        return tok.type == TokenType::kWord && !reserved_words().contains(to_upper(tok.text));
    }

    [[noreturn]] void fail(std::string_view message,
                           std::optional<ParseErrorCode> code = std::nullopt) const {
        const Token& tok = peek();
        ParseError err;
        err.code    = code.value_or(at_end() ? ParseErrorCode::kUnexpectedEnd
                                             : ParseErrorCode::kUnexpectedToken);
        err.message = std::string(message);
        err.context = at_end() ? std::string("at end of input")
                               : fmt::format("near '{}' at offset {}", tok.text, tok.offset);
        throw GrammarError(std::move(err));
    }

    // 현재 위치가 '(' 들 뒤에 SELECT/WITH 가 오는 서브쿼리 시작인지.
    [[nodiscard]] bool looks_like_subquery() const {
        std::size_t k = 0;
        while (at_punct('(', k)) {
            ++k;
        }
        return k > 0 && (at_keyword("SELECT", k) || at_keyword("WITH", k));
    }

    [[nodiscard]] bool at_statement_start() const {
        return at_keyword("SELECT") || at_keyword("WITH") || at_keyword("INSERT") ||
               at_keyword("UPDATE") || at_keyword("DELETE") || looks_like_subquery();
    }

    // ── 이름 ────────────────────────────────────────────────────────────────

    std::string parse_identifier(bool allow_reserved = false) {
        const Token& tok = peek();
        if (tok.type == TokenType::kQuotedIdentifier ||
            (tok.type == TokenType::kWord &&
             (allow_reserved || !reserved_words().contains(to_upper(tok.text))))) {
            return advance().text;
        }
        fail("expected identifier");
    }

    TableName parse_table_name() {
        TableName name;
        std::string first = parse_identifier();
        if (accept_punct('.')) {
            name.database = std::move(first);
            name.table    = parse_identifier(true);
            if (at_punct('.')) {
                fail("three-part names are not supported", ParseErrorCode::kUnsupportedStatement);
            }
        } else {
            name.table = std::move(first);
        }
        return name;
    }

    std::optional<std::string> parse_alias() {
        if (accept_keyword("AS")) {
            const Token& tok = peek();
            if (tok.type == TokenType::kString || tok.type == TokenType::kQuotedIdentifier ||
                tok.type == TokenType::kWord) {
                return advance().text;
            }
            fail("expected alias after AS");
        }
        if (at_identifier()) {
            return advance().text;
        }
        if (peek().type == TokenType::kString) {
            return advance().text;
        }
        return std::nullopt;
    }

    void skip_if_not_exists() {
        if (accept_keyword("IF")) {
            expect_keyword("NOT");
            expect_keyword("EXISTS");
        }
    }

    void skip_if_exists() {
        if (accept_keyword("IF")) {
            expect_keyword("EXISTS");
        }
    }

    // ahead 위치의 '(' 와 짝이 맞는 ')' 다음 오프셋. 짝이 없으면 0.
    [[nodiscard]] std::size_t after_matching_paren(std::size_t ahead) const {
        std::size_t depth = 0;
        for (std::size_t k = ahead; pos_ + k < tokens_.size(); ++k) {
            const Token& tok = tokens_[pos_ + k];
            if (tok.type == TokenType::kEnd) {
                return 0;
            }
            if (is_punct(tok, '(')) {
                ++depth;
            } else if (is_punct(tok, ')') && depth > 0 && --depth == 0) {
                return k + 1;
            }
        }
        return 0;
    }

    // name AS ( SELECT ... ) 또는 name (cols) AS ( SELECT ... )
    [[nodiscard]] bool at_cte_definition() const {
        if (!at_identifier()) {
            return false;
        }
        std::size_t k = 1;
        if (at_punct('(', k)) {
            k = after_matching_paren(k);
            if (k == 0) {
                return false;
            }
        }
        if (!at_keyword("AS", k) || !at_punct('(', k + 1)) {
            return false;
        }
        std::size_t j = k + 1;
        while (at_punct('(', j)) {
            ++j;
        }
        return at_keyword("SELECT", j) || at_keyword("WITH", j);
    }

    // ── 식 ──────────────────────────────────────────────────────────────────

    // x [GLOBAL] [NOT] IN db.table
    // 괄호 없는 IN 의 오른쪽 이름은 테이블로 수집한다. 뒤에 '(' 가 오면 함수 호출이다.
    // AGAINST ('x' IN BOOLEAN MODE) 는 제외.
    bool accept_in_table(Expression& expr) {
        if (!at_keyword("IN") || !at_identifier(1) || at_keyword("BOOLEAN", 1) ||
            at_keyword("NATURAL", 1)) {
            return false;
        }
        advance();
        TableName name = parse_table_name();
        if (!at_punct('(')) {
            expr.tables.push_back(std::move(name));
        }
        return true;
    }

    // 최상위 식 하나. ',', ')', ';', 입력 끝, 절 경계 키워드에서 멈춘다.
    Expression parse_expression() {
        Expression expr;
        while (true) {
            const Token& tok = peek();
            if (tok.type == TokenType::kEnd || is_punct(tok, ';') ||
                is_punct(tok, ',') || is_punct(tok, ')')) {
                break;
            }
            if (is_punct(tok, '(')) {
                scan_parenthesized(expr);
                continue;
            }
            if (tok.type == TokenType::kWord) {
                const std::string word = to_upper(tok.text);
                if (word == "SELECT") {
                    fail("unexpected SELECT inside expression");
                }
                if (accept_in_table(expr)) {
                    continue;
                }
                if (clause_stops().contains(word) &&
                    !(function_like_stops().contains(word) && at_punct('(', 1))) {
                    break;
                }
            }
            advance();
        }
        return expr;
    }

    void parse_expression_list(std::vector<Expression>& out) {
        do {
            add_expression(out, parse_expression());
        } while (accept_punct(','));
    }

    // '(' 에서 시작해 짝이 맞는 ')' 까지 소비한다.
    // 내용이 서브쿼리면 파싱해 expr 에 넣고, 아니면 중첩 괄호 안의 서브쿼리만 찾는다.
    void scan_parenthesized(Expression& expr) {
        const DepthGuard guard(*this);
        if (looks_like_subquery()) {
            expr.subqueries.push_back(parse_parenthesized_select());
            return;
        }
        expect_punct('(');
        while (!at_punct(')')) {
            if (at_end()) {
                fail("unbalanced parenthesis");
            }
            if (at_punct('(')) {
                scan_parenthesized(expr);
                continue;
            }
            if (at_keyword("SELECT")) {
                fail("unexpected SELECT inside parentheses");
            }
            if (accept_in_table(expr)) {
                continue;
            }
            advance();
        }
        expect_punct(')');
    }

    // 구문 끝까지 소비하며 괄호 안 서브쿼리만 수집한다.
    void skip_rest(std::vector<Expression>& out) {
        while (!at_end() && !at_punct(';')) {
            if (at_punct('(')) {
                Expression expr;
                scan_parenthesized(expr);
                add_expression(out, std::move(expr));
                continue;
            }
            advance();
        }
    }

    // ── SELECT ──────────────────────────────────────────────────────────────

    // WITH 목록. 항목마다 두 형식 중 하나다.
    //   name [(cols)] AS ( SELECT ... )  : CTE
    //   <expr> AS name                   : ClickHouse 스칼라 별칭. 식 안의 서브쿼리와
    //                                      IN 테이블은 scalars 로 들어간다.
    std::vector<CommonTableExpression> parse_with_clause(bool&                    recursive,
                                                         std::vector<Expression>& scalars) {
        expect_keyword("WITH");
        recursive = accept_keyword("RECURSIVE");

        std::vector<CommonTableExpression> ctes;
        do {
            if (!at_cte_definition()) {
                parse_scalar_alias(scalars);
                continue;
            }
            CommonTableExpression cte;
            cte.name = parse_identifier();
            if (at_punct('(')) {
                Expression columns;
                scan_parenthesized(columns);
            }
            expect_keyword("AS");
            if (!looks_like_subquery()) {
                fail("expected parenthesised query in WITH clause");
            }
            cte.body = parse_parenthesized_select();
            ctes.push_back(std::move(cte));
        } while (accept_punct(','));
        return ctes;
    }

    void parse_scalar_alias(std::vector<Expression>& scalars) {
        Expression expr;
        bool       consumed = false;
        while (!(consumed && at_keyword("AS"))) {
            if (at_end() || at_punct(';') || at_punct(',') || at_punct(')')) {
                fail("expected AS in WITH clause");
            }
            if (at_punct('(')) {
                scan_parenthesized(expr);
            } else if (at_keyword("SELECT")) {
                fail("unexpected SELECT in WITH clause");
            } else if (!accept_in_table(expr)) {
                advance();
            }
            consumed = true;
        }
        expect_keyword("AS");
        parse_identifier();
        add_expression(scalars, std::move(expr));
    }

    std::unique_ptr<SelectStatement> parse_parenthesized_select() {
        expect_punct('(');
        auto select = parse_select();
        expect_punct(')');
        return select;
    }

    std::unique_ptr<SelectStatement> parse_select() {
        const DepthGuard guard(*this);
        auto select = std::make_unique<SelectStatement>();
        std::vector<Expression> scalars;
        if (at_keyword("WITH")) {
            select->ctes = parse_with_clause(select->recursive, scalars);
        }
        parse_select_body(*select);
        append_expressions(select->modifiers, std::move(scalars));
        return select;
    }

    void parse_select_body(SelectStatement& select) {
        select.operands.push_back(parse_set_operand());
        while (at_keyword("UNION") || at_keyword("EXCEPT") ||
               at_keyword("INTERSECT") || at_keyword("MINUS")) {
            advance();
            if (!accept_keyword("ALL")) {
                accept_keyword("DISTINCT");
            }
            select.operands.push_back(parse_set_operand());
        }
        parse_select_modifiers(select);
    }

    SetOperand parse_set_operand() {
        if (at_punct('(')) {
            if (!looks_like_subquery()) {
                fail("expected SELECT");
            }
            return parse_parenthesized_select();
        }
        if (at_keyword("SELECT")) {
            return parse_query_block();
        }
        fail("expected SELECT");
    }

    QueryBlock parse_query_block() {
        expect_keyword("SELECT");
        QueryBlock block;
        parse_expression_list(block.expressions);

        if (at_keyword("INTO")) {
            fail("SELECT ... INTO is not supported", ParseErrorCode::kUnsupportedStatement);
        }
        if (accept_keyword("FROM")) {
            parse_table_references(block.from, block.expressions);
        }

        while (true) {
            if (accept_keyword("WHERE") || accept_keyword("PREWHERE") ||
                accept_keyword("HAVING") || accept_keyword("QUALIFY")) {
                add_expression(block.expressions, parse_expression());
            } else if (accept_keyword("GROUP")) {
                expect_keyword("BY");
                parse_expression_list(block.expressions);
                if (at_keyword("WITH") && (at_keyword("ROLLUP", 1) || at_keyword("CUBE", 1) ||
                                           at_keyword("TOTALS", 1))) {
                    advance();
                    advance();
                }
            } else if (accept_keyword("WINDOW")) {
                do {
                    parse_identifier();
                    expect_keyword("AS");
                    Expression window;
                    scan_parenthesized(window);
                    add_expression(block.expressions, std::move(window));
                } while (accept_punct(','));
            } else {
                break;
            }
        }
        return block;
    }

    void parse_select_modifiers(SelectStatement& select) {
        while (true) {
            if (accept_keyword("ORDER")) {
                expect_keyword("BY");
                parse_expression_list(select.modifiers);
            } else if (accept_keyword("LIMIT") || accept_keyword("SETTINGS")) {
                parse_expression_list(select.modifiers);
            } else if (accept_keyword("OFFSET") || accept_keyword("FETCH") ||
                       accept_keyword("FOR") || accept_keyword("LOCK")) {
                add_expression(select.modifiers, parse_expression());
            } else if (accept_keyword("FORMAT")) {
                parse_identifier(true);
            } else {
                break;
            }
        }
    }

    // ── FROM 절 ─────────────────────────────────────────────────────────────

    void parse_table_references(std::vector<TableFactor>& out, std::vector<Expression>& exprs) {
        parse_table_factor(out, exprs);
        while (true) {
            if (accept_punct(',')) {
                parse_table_factor(out, exprs);
                continue;
            }
            const JoinOperator op = accept_join_operator();
            if (op == JoinOperator::kNone) {
                break;
            }
            if (op == JoinOperator::kArray) {
                parse_expression_list(exprs);
                continue;
            }
            parse_table_factor(out, exprs);
            if (accept_keyword("ON")) {
                add_expression(exprs, parse_expression());
            } else if (accept_keyword("USING")) {
                Expression columns;
                scan_parenthesized(columns);
            }
        }
    }

    JoinOperator accept_join_operator() {
        const std::size_t saved = pos_;
        while (peek().type == TokenType::kWord && join_modifiers().contains(to_upper(peek().text))) {
            advance();
        }
        if (accept_keyword("JOIN") || accept_keyword("STRAIGHT_JOIN")) {
            return JoinOperator::kTable;
        }
        if (at_keyword("ARRAY") && at_keyword("JOIN", 1)) {
            advance();
            advance();
            return JoinOperator::kArray;
        }
        pos_ = saved;
        return JoinOperator::kNone;
    }

    void parse_table_factor(std::vector<TableFactor>& out, std::vector<Expression>& exprs) {
        const DepthGuard guard(*this);

        if (at_punct('(')) {
            if (looks_like_subquery()) {
                DerivedTable derived;
                derived.query = parse_parenthesized_select();
                derived.alias = parse_alias();
                if (at_punct('(')) {
                    Expression columns;
                    scan_parenthesized(columns);
                }
                out.emplace_back(std::move(derived));
                return;
            }
            expect_punct('(');
            parse_table_references(out, exprs);
            expect_punct(')');
            return;
        }

        NamedTable table;
        table.name = parse_table_name();
        if (at_punct('(')) {
            if (table.name.database) {
                fail("qualified table function name", ParseErrorCode::kUnsupportedStatement);
            }
            TableFunction function;
            function.name   = std::move(table.name.table);
            function.tables = resolve_table_function(function.name,
                                                     parse_function_arguments(exprs));
            function.alias  = parse_alias();
            out.emplace_back(std::move(function));
            return;
        }
        parse_table_hints(exprs);
        table.alias = parse_alias();
        parse_table_hints(exprs);
        out.emplace_back(std::move(table));
    }

    // '(' 부터 짝이 맞는 ')' 까지 테이블 함수 인자를 쉼표로 나눠 읽는다.
    // 인자 안의 서브쿼리(view(SELECT ...), (SELECT ...))는 exprs 에 넣는다.
    std::vector<FunctionArgument> parse_function_arguments(std::vector<Expression>& exprs) {
        const DepthGuard guard(*this);
        expect_punct('(');
        std::vector<FunctionArgument> args;
        if (accept_punct(')')) {
            return args;
        }
        args.emplace_back();
        while (!at_punct(')')) {
            if (at_end()) {
                fail("unbalanced parenthesis");
            }
            if (accept_punct(',')) {
                args.emplace_back();
                continue;
            }
            if (at_keyword("SELECT") || at_keyword("WITH") || at_punct('(')) {
                Expression expr;
                if (at_punct('(')) {
                    scan_parenthesized(expr);
                } else {
                    expr.subqueries.push_back(parse_select());
                }
                add_expression(exprs, std::move(expr));
                args.back().nested = true;
                continue;
            }
            args.back().tokens.push_back(advance());
        }
        expect_punct(')');
        return args;
    }

    // FINAL, SAMPLE, PARTITION (...), USE/FORCE/IGNORE INDEX (...)
    void parse_table_hints(std::vector<Expression>& exprs) {
        while (true) {
            if (accept_keyword("FINAL")) {
                continue;
            }
            if (accept_keyword("SAMPLE")) {
                add_expression(exprs, parse_expression());
                continue;
            }
            if (at_keyword("PARTITION") && at_punct('(', 1)) {
                advance();
                Expression partitions;
                scan_parenthesized(partitions);
                continue;
            }
            if ((at_keyword("USE") || at_keyword("FORCE") || at_keyword("IGNORE")) &&
                (at_keyword("INDEX", 1) || at_keyword("KEY", 1))) {
                advance();
                advance();
                while (!at_punct('(')) {
                    if (at_end()) {
                        fail("expected index list");
                    }
                    advance();
                }
                Expression indexes;
                scan_parenthesized(indexes);
                continue;
            }
            break;
        }
    }

    // ── 문장 ────────────────────────────────────────────────────────────────

    Statement parse_statement() {
        const DepthGuard guard(*this);

        if (at_keyword("WITH")) {
            bool                    recursive = false;
            std::vector<Expression> scalars;
            auto ctes = parse_with_clause(recursive, scalars);
            if (at_keyword("SELECT") || at_punct('(')) {
                SelectStatement select;
                select.recursive = recursive;
                select.ctes      = std::move(ctes);
                parse_select_body(select);
                append_expressions(select.modifiers, std::move(scalars));
                return Statement{std::move(select)};
            }
            if (at_keyword("INSERT")) {
                auto insert = parse_insert(std::move(ctes));
                append_expressions(insert.expressions, std::move(scalars));
                return Statement{std::move(insert)};
            }
            if (at_keyword("UPDATE")) {
                auto update = parse_update(std::move(ctes));
                append_expressions(update.expressions, std::move(scalars));
                return Statement{std::move(update)};
            }
            if (at_keyword("DELETE")) {
                auto del = parse_delete(std::move(ctes));
                append_expressions(del.expressions, std::move(scalars));
                return Statement{std::move(del)};
            }
            fail("expected statement after WITH clause");
        }

        if (at_keyword("SELECT") || at_punct('(')) {
            auto select = parse_select();
            return Statement{std::move(*select)};
        }

        if (peek().type != TokenType::kWord) {
            fail("expected statement keyword");
        }
        const std::string word = to_upper(peek().text);

        if (word == "INSERT")   { return Statement{parse_insert({})}; }
        if (word == "UPDATE")   { return Statement{parse_update({})}; }
        if (word == "DELETE")   { return Statement{parse_delete({})}; }
        if (word == "CREATE")   { return Statement{parse_create()}; }
        if (word == "DROP")     { return Statement{parse_drop()}; }
        if (word == "ALTER")    { return Statement{parse_alter()}; }
        if (word == "TRUNCATE") { return Statement{parse_truncate()}; }
        if (word == "SHOW" || word == "USE" || word == "SET" || word == "KILL") {
            return Statement{parse_simple_utility(word)};
        }
        if (word == "DESCRIBE" || word == "DESC") { return Statement{parse_describe()}; }
        if (word == "EXPLAIN")  { return Statement{parse_explain()}; }
        if (word == "EXISTS")   { return Statement{parse_exists()}; }
        if (word == "CHECK")    { return Statement{parse_check()}; }

        fail(fmt::format("unsupported statement '{}'", word), ParseErrorCode::kUnsupportedStatement);
    }

    InsertStatement parse_insert(std::vector<CommonTableExpression> ctes) {
        expect_keyword("INSERT");
        InsertStatement insert;
        insert.ctes = std::move(ctes);

        while (accept_keyword("LOW_PRIORITY") || accept_keyword("DELAYED") ||
               accept_keyword("HIGH_PRIORITY") || accept_keyword("IGNORE")) {
        }
        accept_keyword("INTO");
        if (at_keyword("TABLE") && at_keyword("FUNCTION", 1)) {
            advance();
        }
        if (accept_keyword("FUNCTION")) {
            const std::string name = parse_identifier(true);
            insert.function_targets =
                resolve_table_function(name, parse_function_arguments(insert.expressions));
        } else {
            accept_keyword("TABLE");
            insert.target = parse_table_name();
        }

        if (at_punct('(') && !looks_like_subquery()) {
            Expression columns;
            scan_parenthesized(columns);
            add_expression(insert.expressions, std::move(columns));
        }
        if (accept_keyword("SETTINGS")) {
            parse_expression_list(insert.expressions);
        }

        if (accept_keyword("VALUES") || accept_keyword("VALUE")) {
            parse_expression_list(insert.expressions);
        } else if (at_keyword("SELECT") || at_keyword("WITH") || looks_like_subquery()) {
            insert.source = parse_select();
        } else if (accept_keyword("SET")) {
            parse_expression_list(insert.expressions);
        } else if (accept_keyword("FORMAT")) {
            // 나머지는 인라인 데이터다.
            while (!at_end()) {
                advance();
            }
            return insert;
        } else {
            fail("expected VALUES, SELECT, SET or FORMAT");
        }

        if (accept_keyword("AS")) {
            parse_identifier();
            if (at_punct('(')) {
                Expression columns;
                scan_parenthesized(columns);
            }
        }
        if (accept_keyword("ON")) {
            expect_keyword("DUPLICATE");
            expect_keyword("KEY");
            expect_keyword("UPDATE");
            parse_expression_list(insert.expressions);
        }
        return insert;
    }

    // WHERE / ORDER BY / LIMIT (UPDATE, DELETE 공통 꼬리)
    void parse_dml_tail(std::vector<Expression>& exprs) {
        while (true) {
            if (accept_keyword("WHERE")) {
                add_expression(exprs, parse_expression());
            } else if (accept_keyword("ORDER")) {
                expect_keyword("BY");
                parse_expression_list(exprs);
            } else if (accept_keyword("LIMIT") || accept_keyword("SETTINGS")) {
                parse_expression_list(exprs);
            } else {
                break;
            }
        }
    }

    void skip_on_cluster() {
        if (at_keyword("ON") && at_keyword("CLUSTER", 1)) {
            advance();
            advance();
            if (peek().type == TokenType::kString) {
                advance();
            } else {
                parse_identifier(true);
            }
        }
    }

    UpdateStatement parse_update(std::vector<CommonTableExpression> ctes) {
        expect_keyword("UPDATE");
        UpdateStatement update;
        update.ctes = std::move(ctes);

        while (accept_keyword("LOW_PRIORITY") || accept_keyword("IGNORE")) {
        }
        parse_table_references(update.targets, update.expressions);
        skip_on_cluster();
        expect_keyword("SET");
        parse_expression_list(update.expressions);
        parse_dml_tail(update.expressions);
        return update;
    }

    DeleteStatement parse_delete(std::vector<CommonTableExpression> ctes) {
        expect_keyword("DELETE");
        DeleteStatement del;
        del.ctes = std::move(ctes);

        while (accept_keyword("LOW_PRIORITY") || accept_keyword("QUICK") ||
               accept_keyword("IGNORE")) {
        }

        if (accept_keyword("FROM")) {
            parse_table_references(del.from, del.expressions);
            if (accept_keyword("USING")) {
                parse_table_references(del.using_, del.expressions);
            }
        } else {
            // DELETE t1, t2 FROM ... : 앞쪽 이름은 FROM 절의 테이블/별칭을 가리킨다.
            do {
                parse_identifier();
                if (accept_punct('.')) {
                    if (!accept_punct('*')) {
                        parse_identifier(true);
                        if (accept_punct('.')) {
                            expect_punct('*');
                        }
                    }
                }
            } while (accept_punct(','));
            expect_keyword("FROM");
            parse_table_references(del.from, del.expressions);
        }
        skip_on_cluster();
        parse_dml_tail(del.expressions);
        return del;
    }

    // ── DDL ─────────────────────────────────────────────────────────────────

    // 대상 이름 뒤의 나머지 절을 소비한다.
    // 다른 테이블을 가리키는 절(AS t, LIKE t, TO t, RENAME TO t, FROM t)은 tables 에 추가한다.
    void parse_ddl_tail(DdlStatement& ddl) {
        const bool is_create = ddl.kind == OperationKind::kCreate;
        const bool is_alter  = ddl.kind == OperationKind::kAlter;

        while (!at_end() && !at_punct(';')) {
            if (at_punct('(')) {
                Expression expr;
                scan_parenthesized(expr);
                add_expression(ddl.expressions, std::move(expr));
                continue;
            }
            if (at_keyword("SELECT") || (at_keyword("WITH") && is_create)) {
                ddl.query = parse_select();
                continue;
            }
            if (accept_keyword("AS")) {
                if (at_keyword("SELECT") || at_keyword("WITH") || looks_like_subquery()) {
                    ddl.query = parse_select();
                } else if (is_create && at_identifier()) {
                    TableName name = parse_table_name();
                    if (!at_punct('(')) {
                        ddl.tables.push_back(std::move(name));
                    } else if (name.database) {
                        fail("qualified table function name",
                             ParseErrorCode::kUnsupportedStatement);
                    } else {
                        // CREATE TABLE t AS remote(...)
                        append_tables(ddl.tables,
                                      resolve_table_function(
                                          name.table, parse_function_arguments(ddl.expressions)));
                    }
                }
                continue;
            }
            if (is_create && at_keyword("LIKE") && at_identifier(1)) {
                advance();
                ddl.tables.push_back(parse_table_name());
                continue;
            }
            if (is_create && at_keyword("TO") && at_identifier(1)) {
                advance();
                ddl.tables.push_back(parse_table_name());
                continue;
            }
            if (is_alter && at_keyword("RENAME") &&
                (at_keyword("TO", 1) || at_keyword("AS", 1)) && at_identifier(2)) {
                advance();
                advance();
                ddl.tables.push_back(parse_table_name());
                continue;
            }
            if (is_alter && at_keyword("TO") && at_keyword("TABLE", 1)) {
                advance();
                advance();
                ddl.tables.push_back(parse_table_name());
                continue;
            }
            if (is_alter && at_keyword("FROM") && at_identifier(1)) {
                advance();
                ddl.tables.push_back(parse_table_name());
                continue;
            }
            advance();
        }
    }

    DdlStatement parse_create() {
        expect_keyword("CREATE");
        DdlStatement ddl;
        ddl.kind = OperationKind::kCreate;

        if (accept_keyword("OR")) {
            expect_keyword("REPLACE");
        }
        if (!accept_keyword("TEMPORARY")) {
            accept_keyword("TEMP");
        }

        if (accept_keyword("TABLE")) {
            ddl.object = DdlObject::kTable;
            skip_if_not_exists();
            ddl.tables.push_back(parse_table_name());
        } else if (at_keyword("MATERIALIZED") || at_keyword("VIEW")) {
            accept_keyword("MATERIALIZED");
            expect_keyword("VIEW");
            ddl.object = DdlObject::kView;
            skip_if_not_exists();
            ddl.tables.push_back(parse_table_name());
        } else if (accept_keyword("DATABASE") || accept_keyword("SCHEMA")) {
            ddl.object = DdlObject::kDatabase;
            skip_if_not_exists();
            ddl.databases.push_back(parse_identifier());
        } else if (at_keyword("UNIQUE") || at_keyword("FULLTEXT") ||
                   at_keyword("SPATIAL") || at_keyword("INDEX")) {
            if (!at_keyword("INDEX")) {
                advance();
            }
            expect_keyword("INDEX");
            ddl.object = DdlObject::kIndex;
            skip_if_not_exists();
            parse_identifier();
            expect_keyword("ON");
            ddl.tables.push_back(parse_table_name());
        } else {
            fail("unsupported CREATE target", ParseErrorCode::kUnsupportedStatement);
        }

        parse_ddl_tail(ddl);
        return ddl;
    }

    DdlStatement parse_drop() {
        expect_keyword("DROP");
        DdlStatement ddl;
        ddl.kind = OperationKind::kDrop;
        accept_keyword("TEMPORARY");

        if (at_keyword("TABLE") || at_keyword("VIEW") || at_keyword("DICTIONARY")) {
            ddl.object = at_keyword("VIEW") ? DdlObject::kView : DdlObject::kTable;
            advance();
            skip_if_exists();
            do {
                ddl.tables.push_back(parse_table_name());
            } while (accept_punct(','));
        } else if (accept_keyword("DATABASE") || accept_keyword("SCHEMA")) {
            ddl.object = DdlObject::kDatabase;
            skip_if_exists();
            ddl.databases.push_back(parse_identifier());
        } else if (accept_keyword("INDEX")) {
            ddl.object = DdlObject::kIndex;
            skip_if_exists();
            parse_identifier();
            expect_keyword("ON");
            ddl.tables.push_back(parse_table_name());
        } else {
            fail("unsupported DROP target", ParseErrorCode::kUnsupportedStatement);
        }

        parse_ddl_tail(ddl);
        return ddl;
    }

    DdlStatement parse_alter() {
        expect_keyword("ALTER");
        DdlStatement ddl;
        ddl.kind = OperationKind::kAlter;

        if (accept_keyword("TABLE")) {
            ddl.object = DdlObject::kTable;
            ddl.tables.push_back(parse_table_name());
        } else if (accept_keyword("DATABASE") || accept_keyword("SCHEMA")) {
            ddl.object = DdlObject::kDatabase;
            static const std::unordered_set<std::string> kOptionWords = {
                "CHARACTER", "CHARSET", "DEFAULT", "COLLATE", "ENCRYPTION", "READ",
            };
            if (at_identifier() && !kOptionWords.contains(to_upper(peek().text))) {
                ddl.databases.push_back(parse_identifier());
            }
        } else {
            fail("unsupported ALTER target", ParseErrorCode::kUnsupportedStatement);
        }

        parse_ddl_tail(ddl);
        return ddl;
    }

    DdlStatement parse_truncate() {
        expect_keyword("TRUNCATE");
        DdlStatement ddl;
        ddl.kind   = OperationKind::kTruncate;
        ddl.object = DdlObject::kTable;
        accept_keyword("TABLE");
        skip_if_exists();
        ddl.tables.push_back(parse_table_name());
        parse_ddl_tail(ddl);
        return ddl;
    }

    // ── 유틸리티 ────────────────────────────────────────────────────────────

    UtilityStatement parse_simple_utility(const std::string& word) {
        UtilityStatement utility;
        if (word == "SHOW") {
            utility.kind = OperationKind::kShow;
        } else if (word == "USE") {
            utility.kind = OperationKind::kUse;
        } else if (word == "SET") {
            utility.kind = OperationKind::kSet;
        } else {
            utility.kind = OperationKind::kKill;
        }
        advance();
        skip_rest(utility.expressions);
        return utility;
    }

    UtilityStatement parse_describe() {
        advance();  // DESCRIBE | DESC
        UtilityStatement utility;
        utility.kind = OperationKind::kDescribe;
        if (at_statement_start()) {
            utility.inner = std::make_unique<Statement>(parse_statement());
            return utility;
        }
        accept_keyword("TABLE");
        utility.tables.push_back(parse_table_name());
        skip_rest(utility.expressions);
        return utility;
    }

    UtilityStatement parse_explain() {
        expect_keyword("EXPLAIN");
        UtilityStatement utility;
        utility.kind = OperationKind::kExplain;
        // EXPLAIN AST / PLAN / FORMAT=JSON / key = value ... <statement>
        while (!at_statement_start()) {
            if (at_end() || at_punct(';')) {
                fail("expected statement after EXPLAIN");
            }
            advance();
        }
        utility.inner = std::make_unique<Statement>(parse_statement());
        return utility;
    }

    UtilityStatement parse_exists() {
        expect_keyword("EXISTS");
        UtilityStatement utility;
        utility.kind = OperationKind::kExists;
        accept_keyword("TEMPORARY");
        if (accept_keyword("DATABASE")) {
            parse_identifier();
        } else {
            if (!accept_keyword("TABLE") && !accept_keyword("DICTIONARY")) {
                accept_keyword("VIEW");
            }
            utility.tables.push_back(parse_table_name());
        }
        skip_rest(utility.expressions);
        return utility;
    }

    UtilityStatement parse_check() {
        expect_keyword("CHECK");
        UtilityStatement utility;
        utility.kind = OperationKind::kCheck;
        expect_keyword("TABLE");
        do {
            utility.tables.push_back(parse_table_name());
        } while (accept_punct(','));
        skip_rest(utility.expressions);
        return utility;
    }

    std::vector<Token> tokens_;
    std::size_t        pos_{0};
    std::size_t        depth_{0};
};

}  // namespace

std::expected<Statement, ParseError>
parse_sql_statement(std::string_view sql) {
    auto tokens = tokenize(sql);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    if (tokens->size() == 1) {
        return std::unexpected(ParseError{
            ParseErrorCode::kUnexpectedEnd, "empty statement", {}});
    }

    try {
        Parser parser(std::move(*tokens));
        return parser.parse_root();
    } catch (const GrammarError& e) {
        return std::unexpected(e.error());
    }
}

OperationKind statement_kind(const Statement& stmt) noexcept {
    return std::visit(
        [](const auto& node) -> OperationKind {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, SelectStatement>) {
                return OperationKind::kSelect;
            } else if constexpr (std::is_same_v<T, InsertStatement>) {
                return OperationKind::kInsert;
            } else if constexpr (std::is_same_v<T, UpdateStatement>) {
                return OperationKind::kUpdate;
            } else if constexpr (std::is_same_v<T, DeleteStatement>) {
                return OperationKind::kDelete;
            } else {
                return node.kind;  // DdlStatement, UtilityStatement
            }
        },
        stmt.node);
}
