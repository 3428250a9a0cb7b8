// ---------------------------------------------------------------------------
// log_sanitizer.cpp
//
// 선형 스캔 기반 마스킹 구현. std::regex 는 사용하지 않는다
// (긴 리터럴에서 libstdc++ regex 재귀로 스택이 고갈될 수 있음).
// ---------------------------------------------------------------------------

#include "sanitizer/log_sanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

bool is_field_char(char c) {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' || c == '$';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// 따옴표 없는 값의 종료 문자
bool ends_bare_value(char c) {
    return is_space(c) || c == ',' || c == ';' || c == '(' || c == ')' || c == '\'' || c == '"';
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// pos 에서 비교 연산자를 읽고 그 길이를 반환한다. 연산자가 아니면 0.
std::size_t operator_length(std::string_view sql, std::size_t pos) {
    if (pos >= sql.size()) {
        return 0;
    }
    const char c    = sql[pos];
    const char next = (pos + 1 < sql.size()) ? sql[pos + 1] : '\0';
    if (c == '=') {
        return 1;
    }
    if ((c == '!' && next == '=') || (c == '<' && next == '>') || (c == ':' && next == '=')) {
        return 2;
    }
    return 0;
}

}  // namespace

LogSanitizer::LogSanitizer(SanitizerConfig config)
    : max_length_(std::clamp(config.max_length,
                             SanitizerConfig::kMaxLengthFloor,
                             SanitizerConfig::kMaxLengthCeiling))
{
    if (max_length_ != config.max_length) {
        spdlog::warn("log_sanitizer: max_length {} out of range, clamped to {}",
                     config.max_length, max_length_);
    }

    fragments_.reserve(config.sensitive_fields.size());
    for (const auto& field : config.sensitive_fields) {
        if (field.empty()) {
            spdlog::warn("log_sanitizer: empty sensitive field fragment ignored");
            continue;
        }
        fragments_.push_back(to_lower(field));
    }
}

std::string LogSanitizer::sanitize(std::string_view sql) const {
    return truncate(redact(sql));
}

std::string LogSanitizer::redact(std::string_view sql) const {
    const std::string lower = to_lower(sql);
    const std::size_t len   = sql.size();

    std::string out;
    out.reserve(len);
    std::size_t copied_upto = 0;

    std::size_t i = 0;
    while (i < len) {
        // 1. 민감 조각 일치 여부 (먼저 일치한 조각 사용. 어느 조각이든 식별자 전체로 확장된다)
        std::size_t frag_len = 0;
        for (const auto& frag : fragments_) {
            if (lower.compare(i, frag.size(), frag) == 0) {
                frag_len = frag.size();
                break;
            }
        }
        if (frag_len == 0) {
            ++i;
            continue;
        }

        // 2. 식별자 끝까지 확장 (password_hash, "api-key", `secret`)
        std::size_t end = i + frag_len;
        while (end < len && is_field_char(sql[end])) {
            ++end;
        }
        if (end < len && (sql[end] == '"' || sql[end] == '`')) {
            ++end;
        }

        // 3. 연산자
        std::size_t pos = end;
        while (pos < len && is_space(sql[pos])) {
            ++pos;
        }
        const std::size_t op_len = operator_length(sql, pos);
        if (op_len == 0) {
            i = end;
            continue;
        }
        pos += op_len;
        while (pos < len && is_space(sql[pos])) {
            ++pos;
        }
        if (pos >= len) {
            i = pos;
            continue;
        }

        // 4. 값 범위 [value_begin, value_end)
        std::size_t value_begin = pos;
        std::size_t value_end   = pos;
        const char  quote       = sql[pos];
        if (quote == '\'' || quote == '"') {
            value_begin = pos + 1;
            value_end   = value_begin;
            while (value_end < len) {
                if (sql[value_end] == quote) {
                    if (value_end + 1 < len && sql[value_end + 1] == quote) {
                        value_end += 2;
                        continue;
                    }
                    break;
                }
                ++value_end;
            }
        } else {
            while (value_end < len && !ends_bare_value(sql[value_end])) {
                ++value_end;
            }
            if (value_end == value_begin) {
                // 서브쿼리 등 리터럴이 아닌 우변
                i = pos;
                continue;
            }
        }

        out.append(sql.substr(copied_upto, value_begin - copied_upto));
        out.append(kMask);
        copied_upto = value_end;
        i = value_end;
    }

    out.append(sql.substr(copied_upto));
    return out;
}

std::string LogSanitizer::truncate(std::string text) const {
    if (text.size() <= max_length_) {
        return text;
    }

    std::size_t cut = max_length_ - kTruncationSuffix.size();
    // UTF-8 연속 바이트(10xxxxxx) 위치에서 자르지 않는다
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) {
        --cut;
    }
    text.resize(cut);
    text.append(kTruncationSuffix);
    return text;
}

std::string sanitize_for_logging(std::string_view sql) {
    static const LogSanitizer kDefaultSanitizer{};
    return kDefaultSanitizer.sanitize(sql);
}
