// ---------------------------------------------------------------------------
// statement_classifier.cpp
//
// [알려진 한계]
// - 방언별 의미 분석은 하지 않는다. 선두 키워드 + 괄호 깊이 정도만 본다.
// - WITH 보정은 파괴적 키워드가 "구문 선두 위치"에 올 때만 잡는다.
//   괄호 안의 컬럼명이 delete 같은 예약어라면 오탐(차단)될 수 있다.
// ---------------------------------------------------------------------------

#include "parser/statement_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "parser/statement_splitter.hpp"  // trim_sql

namespace {

// Unclassified 오류 메시지에 넣을 토큰 최대 길이
constexpr std::size_t kMaxReportedTokenLength = 32;

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool is_word_start(char c) {
    return (std::isalpha(static_cast<unsigned char>(c)) != 0) || c == '_';
}

bool is_word_char(char c) {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' || c == '$';
}

std::optional<DestructiveKind> destructive_kind_of(const std::string& upper_word) {
    static const std::unordered_map<std::string, DestructiveKind> kDestructive = {
        {"DROP",     DestructiveKind::kDrop},
        {"DELETE",   DestructiveKind::kDelete},
        {"TRUNCATE", DestructiveKind::kTruncate},
        {"ALTER",    DestructiveKind::kAlter},
        {"INSERT",   DestructiveKind::kInsert},
        {"UPDATE",   DestructiveKind::kUpdate},
        {"CREATE",   DestructiveKind::kCreate},
        {"GRANT",    DestructiveKind::kGrant},
        {"REVOKE",   DestructiveKind::kRevoke},
    };
    const auto it = kDestructive.find(upper_word);
    if (it != kDestructive.end()) {
        return it->second;
    }
    return std::nullopt;
}

OperationClass make_destructive(DestructiveKind kind) {
    return OperationClass{OperationKind::kDestructiveWrite, kind, to_string(kind)};
}

// 골격을 단어 단위로 훑으면서 괄호 깊이와 직전 구두점을 추적한다.
// visitor(word_upper, depth, prev_punct, rest) 가 값을 반환하면 스캔을 멈춘다.
//   prev_punct: 단어 바로 앞(공백 제외)의 비단어 문자, 없으면 '\0'
//   rest:       단어 바로 뒤부터의 나머지 골격
template <typename Visitor>
std::optional<OperationClass> scan_words(std::string_view skeleton, Visitor&& visitor) {
    int         depth      = 0;
    char        prev_punct = '\0';
    std::size_t i          = 0;

    while (i < skeleton.size()) {
        const char c = skeleton[i];
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }
        if (is_word_start(c)) {
            const std::size_t begin = i;
            while (i < skeleton.size() && is_word_char(skeleton[i])) {
                ++i;
            }
            const std::string word = to_upper(skeleton.substr(begin, i - begin));
            if (auto found = visitor(word, depth, prev_punct, skeleton.substr(i))) {
                return found;
            }
            prev_punct = '\0';
            continue;
        }
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            depth = std::max(0, depth - 1);
        }
        prev_punct = c;
        ++i;
    }
    return std::nullopt;
}

// WITH 구문 내부 파괴적 키워드 탐지
std::optional<OperationClass> detect_cte_write(std::string_view skeleton) {
    return scan_words(skeleton,
        [](const std::string& word, int depth, char prev, std::string_view /*rest*/)
            -> std::optional<OperationClass> {
            const bool leading = (prev == '(') || (depth == 0 && prev == ')');
            if (!leading) {
                return std::nullopt;
            }
            if (const auto kind = destructive_kind_of(word)) {
                return make_destructive(*kind);
            }
            return std::nullopt;
        });
}

// 단어 바로 뒤 나머지에서 첫 단어(대문자)를 꺼낸다. 단어가 아니면 빈 문자열.
std::string next_word(std::string_view rest) {
    const auto trimmed = trim_sql(rest);
    std::size_t end = 0;
    while (end < trimmed.size() && is_word_char(trimmed[end])) {
        ++end;
    }
    return to_upper(trimmed.substr(0, end));
}

// 파일 연산 탐지: INTO OUTFILE / INTO DUMPFILE / LOAD_FILE( (위치 무관),
// 선두 LOAD DATA / LOAD XML
bool has_file_operation(std::string_view skeleton) {
    bool first = true;
    const auto hit = scan_words(skeleton,
        [&first](const std::string& word, int /*depth*/, char /*prev*/, std::string_view rest)
            -> std::optional<OperationClass> {
            const bool leading = first;
            first = false;

            bool matched = false;
            if (word == "INTO") {
                const auto target = next_word(rest);
                matched = (target == "OUTFILE" || target == "DUMPFILE");
            } else if (word == "LOAD_FILE") {
                const auto after = trim_sql(rest);
                matched = !after.empty() && after.front() == '(';
            } else if (leading && word == "LOAD") {
                const auto what = next_word(rest);
                matched = (what == "DATA" || what == "XML");
            }
            if (matched) {
                return OperationClass{OperationKind::kFileOperation, std::nullopt, "FILE"};
            }
            return std::nullopt;
        });
    return hit.has_value();
}

}  // namespace

OperationClass StatementClassifier::classify(std::string_view fragment) const {
    // 1. 빈 조각
    const auto trimmed = trim_sql(fragment);
    if (trimmed.empty()) {
        return OperationClass{OperationKind::kEmpty, std::nullopt, ""};
    }

    // 2. 파일 연산 (선두 키워드와 무관)
    if (has_file_operation(trimmed)) {
        return OperationClass{OperationKind::kFileOperation, std::nullopt, "FILE"};
    }

    // 3. 선두 키워드 추출: '(' 와 공백을 건너뛴 뒤 단어 문자열
    std::size_t pos = 0;
    while (pos < trimmed.size() &&
           (trimmed[pos] == '(' || std::isspace(static_cast<unsigned char>(trimmed[pos])) != 0)) {
        ++pos;
    }
    std::size_t word_end = pos;
    while (word_end < trimmed.size() && is_word_char(trimmed[word_end])) {
        ++word_end;
    }
    const std::string keyword = to_upper(trimmed.substr(pos, word_end - pos));

    // 4. SELECT / WITH
    if (keyword == "SELECT" || keyword == "WITH") {
        if (keyword == "WITH") {
            if (auto cte_write = detect_cte_write(trimmed)) {
                return *cte_write;
            }
        }
        return OperationClass{OperationKind::kSafeRead, std::nullopt, keyword};
    }

    // 5. 파괴적 키워드
    if (const auto kind = destructive_kind_of(keyword)) {
        return make_destructive(*kind);
    }

    // 6. 인식 불가: 보고용 토큰은 공백 기준 첫 토큰
    std::string token = keyword;
    if (token.empty()) {
        const auto space = trimmed.find_first_of(" \t\r\n");
        token = to_upper(trimmed.substr(0, space));
    }
    if (token.size() > kMaxReportedTokenLength) {
        token.resize(kMaxReportedTokenLength);
    }
    return OperationClass{OperationKind::kUnclassified, std::nullopt, token};
}
