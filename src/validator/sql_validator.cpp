// ---------------------------------------------------------------------------
// sql_validator.cpp
//
// [평가 순서]
// 1. trim 후 빈 입력              → kEmptyInput
// 2. ANSI / MySQL 두 방언으로 골격을 만들어 각각 분리
//    어느 쪽이든 조각 > 1          → kMultipleStatements
//    조각 수가 서로 다름           → kAmbiguousSyntax
//    조각 0 (주석/세미콜론만)      → kEmptyInput
// 3. 분류 (두 골격 모두)
//    어느 쪽이든 kFileOperation    → kFileOperation
//    두 분류가 다름                → kAmbiguousSyntax
//    kFileOperation               → kFileOperation
//    kDestructiveWrite(kind)      → !read_only 허용 / admin_override 허용 / 그 외 차단
//    kSafeRead                    → 허용
//    kUnclassified                → kUnclassifiedOperation
//
// 로그는 진단용일 뿐 판정에 영향을 주지 않는다. SQL 은 반드시 sanitizer_ 를 거친다.
// ---------------------------------------------------------------------------

#include "validator/sql_validator.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "parser/lexical_normalizer.hpp"
#include "parser/statement_splitter.hpp"

namespace {

std::string suggestion_for(DestructiveKind kind) {
    std::string base;
    switch (kind) {
        case DestructiveKind::kDrop:
            base = "If you want to remove data, consider exporting it first.";
            break;
        case DestructiveKind::kDelete:
            base = "To view the rows you meant to delete, use a SELECT with the same WHERE clause.";
            break;
        case DestructiveKind::kTruncate:
            base = "To inspect the table contents, use SELECT with a LIMIT.";
            break;
        case DestructiveKind::kAlter:
            base = "Schema modifications require administrator approval.";
            break;
        case DestructiveKind::kCreate:
            base = "Creating new objects requires administrator approval.";
            break;
        case DestructiveKind::kInsert:
            base = "Adding data requires administrator approval.";
            break;
        case DestructiveKind::kUpdate:
            base = "To preview the rows that would change, use a SELECT with the same WHERE clause.";
            break;
        case DestructiveKind::kGrant:
        case DestructiveKind::kRevoke:
            base = "Permission changes require administrator access.";
            break;
    }
    return base + " Use a SELECT to inspect the data, or request an admin override.";
}

Verdict reject(RejectCode code, std::string error, std::string suggestion, OperationClass op) {
    Verdict v;
    v.is_valid       = false;
    v.error          = std::move(error);
    v.suggestion     = std::move(suggestion);
    v.code           = code;
    v.is_destructive = (op.kind == OperationKind::kDestructiveWrite);
    v.operation      = std::move(op);
    return v;
}

Verdict accept(OperationClass op) {
    Verdict v;
    v.is_valid       = true;
    v.code           = RejectCode::kNone;
    v.is_destructive = (op.kind == OperationKind::kDestructiveWrite);
    v.operation      = std::move(op);
    return v;
}

Verdict reject_ambiguous() {
    return reject(RejectCode::kAmbiguousSyntax,
                  "Query is ambiguous: its statement boundaries or type depend on the SQL dialect "
                  "(backslash escapes, # or -- comments)",
                  "Remove comments and backslash escapes and submit a single plain SELECT",
                  OperationClass{});
}

bool same_class(const OperationClass& a, const OperationClass& b) {
    return a.kind == b.kind && a.destructive_kind == b.destructive_kind;
}

bool contains_word(std::string_view text, std::string_view upper_word) {
    const auto is_word = [](char c) {
        return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
    };
    for (std::size_t i = 0; i + upper_word.size() <= text.size(); ++i) {
        bool match = true;
        for (std::size_t k = 0; k < upper_word.size(); ++k) {
            if (std::toupper(static_cast<unsigned char>(text[i + k])) != upper_word[k]) {
                match = false;
                break;
            }
        }
        if (!match) {
            continue;
        }
        const bool start_ok = (i == 0) || !is_word(text[i - 1]);
        const std::size_t end = i + upper_word.size();
        const bool end_ok = (end >= text.size()) || !is_word(text[end]);
        if (start_ok && end_ok) {
            return true;
        }
    }
    return false;
}

// SELECT * 이면서 WHERE/LIMIT 가 없는 골격 (결과가 과도할 수 있음)
bool is_overly_broad(std::string_view skeleton) {
    const auto trimmed = trim_sql(skeleton);
    constexpr std::string_view kSelect = "SELECT";
    if (trimmed.size() <= kSelect.size() || !contains_word(trimmed.substr(0, kSelect.size() + 1), kSelect)) {
        return false;
    }
    const auto after = trim_sql(trimmed.substr(kSelect.size()));
    if (after.empty() || after.front() != '*') {
        return false;
    }
    return !contains_word(skeleton, "WHERE") && !contains_word(skeleton, "LIMIT");
}

}  // namespace

SqlValidator::SqlValidator(PolicyResolver resolver, LogSanitizer sanitizer)
    : classifier_{}
    , resolver_(std::move(resolver))
    , sanitizer_(std::move(sanitizer))
{}

Verdict SqlValidator::validate(std::string_view sql) const {
    return validate(sql, resolver_.resolve_from_env());
}

Verdict SqlValidator::validate(std::string_view sql, const PolicyContext& policy) const {
    Verdict verdict;
    try {
        verdict = evaluate(sql, policy);
    } catch (const std::exception& e) {
        // [fail-close] 내부 오류는 절대 허용으로 이어지지 않는다
        spdlog::error("sql_validator: internal error, fail-close applied: {}", e.what());
        return reject(RejectCode::kInternalError,
                      "Query could not be validated",
                      "Try again or rephrase your question",
                      OperationClass{});
    }

    if (!verdict.is_valid) {
        spdlog::warn("sql_validator: blocked ({}) sql='{}'",
                     to_string(verdict.code), sanitizer_.sanitize(sql));
    } else if (verdict.is_destructive && policy.read_only) {
        spdlog::warn("sql_validator: admin override allowed destructive {} sql='{}'",
                     verdict.operation.keyword, sanitizer_.sanitize(sql));
    }
    return verdict;
}

Verdict SqlValidator::evaluate(std::string_view sql, const PolicyContext& policy) const {
    // 1. 빈 입력
    if (trim_sql(sql).empty()) {
        return reject(RejectCode::kEmptyInput,
                      "empty query",
                      "Ask your question again so a single SELECT query can be generated",
                      OperationClass{OperationKind::kEmpty, std::nullopt, ""});
    }

    // 2. 리터럴/주석 무력화 후 최상위 세미콜론 분리 (방언별)
    const std::string ansi_skeleton   = normalize_sql(sql, LexDialect::kAnsi);
    const std::string mysql_skeleton  = normalize_sql(sql, LexDialect::kMySql);
    const auto        fragments       = split_statements(ansi_skeleton);
    const auto        mysql_fragments = split_statements(mysql_skeleton);

    const std::size_t statement_count = std::max(fragments.size(), mysql_fragments.size());
    if (statement_count > 1) {
        return reject(RejectCode::kMultipleStatements,
                      "Query contains multiple statements (" + std::to_string(statement_count) +
                          "); only one statement may run at a time",
                      "Submit one statement at a time",
                      OperationClass{OperationKind::kMultipleStatements, std::nullopt, ""});
    }
    if (fragments.size() != mysql_fragments.size()) {
        return reject_ambiguous();
    }
    if (fragments.empty()) {
        return reject(RejectCode::kEmptyInput,
                      "empty query (only comments or separators)",
                      "Ask your question again so a single SELECT query can be generated",
                      OperationClass{OperationKind::kEmpty, std::nullopt, ""});
    }

    // 3. 단일 구문 분류: 두 방언의 판단이 같아야 한다
    OperationClass op       = classifier_.classify(fragments.front());
    OperationClass mysql_op = classifier_.classify(mysql_fragments.front());
    if (mysql_op.kind == OperationKind::kFileOperation) {
        op = std::move(mysql_op);
    } else if (op.kind != OperationKind::kFileOperation && !same_class(op, mysql_op)) {
        return reject_ambiguous();
    }

    switch (op.kind) {
        case OperationKind::kFileOperation:
            return reject(RejectCode::kFileOperation,
                          "File operations (INTO OUTFILE, INTO DUMPFILE, LOAD DATA, LOAD_FILE) "
                          "are not allowed",
                          "Use the export/download feature to save query results instead",
                          std::move(op));

        case OperationKind::kDestructiveWrite: {
            if (!policy.read_only || policy.admin_override) {
                return accept(std::move(op));
            }
            const DestructiveKind kind = op.destructive_kind.value_or(DestructiveKind::kDrop);
            std::string error = "Operation '" + op.keyword + "' is not allowed in READ_ONLY mode";
            return reject(RejectCode::kDestructiveOperation,
                          std::move(error),
                          suggestion_for(kind),
                          std::move(op));
        }

        case OperationKind::kSafeRead:
            if (is_overly_broad(fragments.front())) {
                spdlog::info("sql_validator: SELECT * without WHERE or LIMIT may return too much data");
            }
            return accept(std::move(op));

        case OperationKind::kEmpty:
            return reject(RejectCode::kEmptyInput,
                          "empty query",
                          "Ask your question again so a single SELECT query can be generated",
                          std::move(op));

        case OperationKind::kMultipleStatements:
            return reject(RejectCode::kMultipleStatements,
                          "Query contains multiple statements; only one statement may run at a time",
                          "Submit one statement at a time",
                          std::move(op));

        case OperationKind::kUnclassified:
        default: {
            std::string error = "Unrecognized statement '" + op.keyword +
                                "' is not allowed; only SELECT queries can run";
            return reject(RejectCode::kUnclassifiedOperation,
                          std::move(error),
                          "Rephrase your query as a SELECT statement",
                          std::move(op));
        }
    }
}
