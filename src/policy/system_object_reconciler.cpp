// ---------------------------------------------------------------------------
// system_object_reconciler.cpp
//
// 모든 정규식은 ECMAScript + icase 이며 원문(공백 정규화 전) 구문에 적용한다.
// 동적 패턴(2단계)은 table 이름을 이스케이프한 뒤 조립한다.
// ---------------------------------------------------------------------------

#include "policy/system_object_reconciler.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <regex>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr auto kRegexFlags = std::regex_constants::ECMAScript | std::regex_constants::icase;

// SELECT .*? FROM 패턴은 libstdc++ regex 에서 일치 길이만큼 재귀한다.
// 이보다 긴 구문에는 적용하지 않는다.
constexpr std::size_t kMaxLazyPatternInput = 8 * 1024;

constexpr std::array<std::string_view, 49> kSystemTables = {
    // 로그 테이블
    "query_log", "query_thread_log", "part_log", "metric_log", "trace_log",
    "text_log", "asynchronous_metric_log", "session_log", "zookeeper_log",
    "system_log", "crash_log", "asynchronous_insert_log", "backup_log",
    // 현재 지표
    "metrics", "asynchronous_metrics",
    // 시스템 정보
    "processes", "mutations", "replicas", "databases", "tables", "columns",
    "functions", "dictionaries", "formats", "table_functions", "table_engines",
    "settings", "users", "roles", "quotas", "row_policies", "grants",
    "clusters", "macros", "merges", "parts", "detached_parts", "data_skipping_indices",
    "distribution_queue", "distributed_ddl_queue", "replication_queue",
    "zookeeper", "disks", "storage_policies", "merge_tree_settings",
    "build_options", "licenses", "server_settings", "time_zones",
};

const std::string kIdent = "([`\"]?\\w+[`\"]?)";

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

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string escape_regex(std::string_view s) {
    static constexpr std::string_view kSpecial = ".*+?^${}()|[]\\";
    std::string out;
    out.reserve(s.size() * 2);
    for (const char c : s) {
        if (kSpecial.find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

// 첫 일치의 (group1, group2) 를 따옴표 제거 후 반환한다.
std::optional<std::pair<std::string, std::string>>
first_qualified_match(const std::string& statement, const std::regex& re) {
    std::smatch m;
    if (!std::regex_search(statement, m, re) || m.size() < 3 || !m[2].matched) {
        return std::nullopt;
    }
    return std::make_pair(strip_quotes(m[1].str()), strip_quotes(m[2].str()));
}

// 1단계 패턴 (순서 유지)
const std::array<std::regex, 4>& qualified_patterns() {
    static const std::array<std::regex, 4> kPatterns = {
        std::regex("(?:DROP|CREATE|ALTER|TRUNCATE)\\s+TABLE\\s+" + kIdent + "\\." + kIdent,
                   kRegexFlags),
        std::regex("(?:FROM|JOIN|INTO|UPDATE)\\s+" + kIdent + "\\." + kIdent, kRegexFlags),
        std::regex("TABLE\\s+" + kIdent + "\\." + kIdent, kRegexFlags),
        std::regex("SELECT\\s+.*?\\s+FROM\\s+" + kIdent + "\\." + kIdent, kRegexFlags),
    };
    return kPatterns;
}

const std::regex& from_system_pattern() {
    static const std::regex kPattern("FROM\\s+system\\." + kIdent, kRegexFlags);
    return kPattern;
}

std::optional<std::string> find_from_system(const std::string& statement) {
    std::smatch m;
    if (std::regex_search(statement, m, from_system_pattern())) {
        return strip_quotes(m[1].str());
    }
    return std::nullopt;
}

// 1단계: 원문에서 db.table 을 찾아 table 이 일치하면 채택한다.
bool resolve_qualified(const std::string& statement, std::string& db, std::string& tbl) {
    const auto& patterns = qualified_patterns();
    for (std::size_t i = 0; i < patterns.size(); ++i) {
        if (i == patterns.size() - 1 && statement.size() > kMaxLazyPatternInput) {
            spdlog::debug("system_object_reconciler: statement too long for SELECT..FROM scan");
            break;
        }
        const auto match = first_qualified_match(statement, patterns[i]);
        if (match && (match->second == tbl || tbl == kWildcardTable)) {
            db  = match->first;
            tbl = match->second;
            return true;
        }
    }
    return false;
}

// 2단계: 추출기가 database 부분을 table 로 넘긴 경우 (FROM app.users → table "app")
bool resolve_database_as_table(const std::string& statement, std::string& db, std::string& tbl) {
    const std::string quoted = "([`\"]?" + escape_regex(tbl) + "[`\"]?)";
    const std::array<std::string, 2> sources = {
        "(?:FROM|JOIN|INTO|UPDATE)\\s+" + quoted + "\\." + kIdent,
        "(?:DROP|CREATE|ALTER|TRUNCATE)\\s+TABLE\\s+" + quoted + "\\." + kIdent,
    };
    for (const auto& source : sources) {
        std::optional<std::pair<std::string, std::string>> match;
        try {
            match = first_qualified_match(statement, std::regex(source, kRegexFlags));
        } catch (const std::regex_error& e) {
            spdlog::warn("system_object_reconciler: pattern for '{}' rejected: {}", tbl, e.what());
            continue;
        }
        if (match && match->first == tbl && !match->second.empty()) {
            db  = match->first;
            tbl = match->second;
            return true;
        }
    }
    return false;
}

}  // namespace

bool is_known_system_table(std::string_view table) {
    const std::string lower = to_lower(table);
    return std::find(kSystemTables.begin(), kSystemTables.end(), lower) != kSystemTables.end();
}

ResolvedTable reconcile_table_reference(const TableReference& ref,
                                        std::string_view      statement,
                                        std::string_view      default_database) {
    const std::string text(statement);

    std::string db  = ref.database ? *ref.database : std::string(default_database);
    std::string tbl = ref.table.empty() ? std::string(kWildcardTable) : ref.table;

    try {
        if (!ref.database && tbl != kWildcardTable && db == default_database) {
            resolve_qualified(text, db, tbl);
            if (db == default_database && tbl != kWildcardTable) {
                resolve_database_as_table(text, db, tbl);
            }
        }

        if (db != kSystemDatabase && tbl == kSystemDatabase) {
            if (auto system_table = find_from_system(text)) {
                db  = std::string(kSystemDatabase);
                tbl = std::move(*system_table);
            }
        }
    } catch (const std::regex_error& e) {
        // 보정만 건너뛴다. 참조 자체는 남으므로 권한 검사는 그대로 수행된다.
        spdlog::warn("system_object_reconciler: regex search failed: {}", e.what());
    }

    if (tbl != kWildcardTable && is_known_system_table(tbl) && db != kSystemDatabase) {
        db = std::string(kSystemDatabase);
    }

    if (db == kSystemDatabase && (tbl == kSystemDatabase || tbl == kWildcardTable)) {
        try {
            if (auto system_table = find_from_system(text)) {
                tbl = std::move(*system_table);
            }
        } catch (const std::regex_error& e) {
            spdlog::warn("system_object_reconciler: regex search failed: {}", e.what());
        }
    }

    return ResolvedTable{std::move(db), std::move(tbl)};
}
