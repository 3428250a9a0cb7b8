// ---------------------------------------------------------------------------
// lexical_normalizer.cpp
//
// 상태 머신 기반 리터럴/주석 무력화 구현. 방언별로 입력을 한 번만 순회한다 (O(N)).
// ---------------------------------------------------------------------------

#include "parser/lexical_normalizer.hpp"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace {

enum class State : std::uint8_t {
    kNormal,
    kSingleQuote,    // '...'
    kDoubleQuote,    // "..."
    kBacktick,       // `...` (MySQL 식별자)
    kDollarQuote,    // $tag$...$tag$ (PostgreSQL)
    kLineComment,    // -- ... \n, # ... \n (MySQL)
    kBlockComment,   // /* ... */
};

bool is_ident_char(char c) {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' || c == '$';
}

// sql[pos] == '$' 에서 시작하는 dollar-quote 태그($$ 또는 $tag$)의 길이.
// 태그가 아니면 0 ($1 같은 위치 파라미터 포함).
std::size_t dollar_tag_length(std::string_view sql, std::size_t pos) {
    if (pos > 0 && is_ident_char(sql[pos - 1])) {
        return 0;
    }
    std::size_t i = pos + 1;
    if (i < sql.size() && sql[i] == '$') {
        return 2;
    }
    if (i >= sql.size() ||
        !(std::isalpha(static_cast<unsigned char>(sql[i])) != 0 || sql[i] == '_')) {
        return 0;
    }
    while (i < sql.size() &&
           (std::isalnum(static_cast<unsigned char>(sql[i])) != 0 || sql[i] == '_')) {
        ++i;
    }
    if (i < sql.size() && sql[i] == '$') {
        return i - pos + 1;
    }
    return 0;
}

// MySQL 은 "--" 뒤에 공백/제어 문자가 있어야 주석으로 본다 (1--1 은 1 - -1).
bool mysql_dash_comment(std::string_view sql, std::size_t pos) {
    if (pos + 2 >= sql.size()) {
        return true;
    }
    const auto third = static_cast<unsigned char>(sql[pos + 2]);
    return std::isspace(third) != 0 || std::iscntrl(third) != 0;
}

// 블록 주석 구간을 공백으로 지운다 (개행은 유지).
void blank(std::string& out, std::size_t from, std::size_t to) {
    for (std::size_t k = from; k < to && k < out.size(); ++k) {
        if (out[k] != '\n') {
            out[k] = ' ';
        }
    }
}

}  // namespace

std::string normalize_sql(std::string_view sql, LexDialect dialect) {
    std::string out(sql);
    const std::size_t len   = sql.size();
    const bool        mysql = (dialect == LexDialect::kMySql);

    State       state = State::kNormal;
    std::string_view dollar_tag{};
    bool        in_exec_comment = false;  // /*! ... */ 또는 /*+ ... */ 본문 안

    std::size_t i = 0;
    while (i < len) {
        const char c    = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        switch (state) {
            case State::kNormal:
                if (c == '\'') {
                    state = State::kSingleQuote;
                } else if (c == '"') {
                    state = State::kDoubleQuote;
                } else if (c == '`') {
                    state = State::kBacktick;
                } else if (c == '$' && !mysql) {
                    const auto tag_len = dollar_tag_length(sql, i);
                    if (tag_len > 0) {
                        dollar_tag = sql.substr(i, tag_len);
                        state      = State::kDollarQuote;
                        i += tag_len;
                        continue;
                    }
                } else if (c == '#' && mysql) {
                    state  = State::kLineComment;
                    out[i] = ' ';
                    ++i;
                    continue;
                } else if (c == '-' && next == '-' && (!mysql || mysql_dash_comment(sql, i))) {
                    state = State::kLineComment;
                    blank(out, i, i + 2);
                    i += 2;
                    continue;
                } else if (c == '/' && next == '*') {
                    const char third = (i + 2 < len) ? sql[i + 2] : '\0';
                    if (third == '!' || third == '+') {
                        // 실행 주석: 여는 구분자와 버전 숫자(/*!50000)만 지운다
                        std::size_t end = i + 3;
                        if (third == '!') {
                            while (end < len &&
                                   std::isdigit(static_cast<unsigned char>(sql[end])) != 0) {
                                ++end;
                            }
                        }
                        blank(out, i, end);
                        in_exec_comment = true;
                        i = end;
                        continue;
                    }
                    state = State::kBlockComment;
                    blank(out, i, i + 2);
                    i += 2;
                    continue;
                } else if (c == '*' && next == '/' && in_exec_comment) {
                    blank(out, i, i + 2);
                    in_exec_comment = false;
                    i += 2;
                    continue;
                }
                ++i;
                break;

            case State::kSingleQuote:
            case State::kDoubleQuote:
            case State::kBacktick: {
                const char quote = (state == State::kSingleQuote) ? '\''
                                 : (state == State::kDoubleQuote) ? '"'
                                 : '`';
                if (mysql && c == '\\' && state != State::kBacktick) {
                    // MySQL 백슬래시 이스케이프: 다음 문자는 구분자가 아니다
                    out[i] = kLiteralPlaceholder;
                    if (i + 1 < len) {
                        out[i + 1] = kLiteralPlaceholder;
                    }
                    i += 2;
                    continue;
                }
                if (c == quote) {
                    if (next == quote) {
                        // 이중 구분자 이스케이프: 리터럴 계속
                        out[i]     = kLiteralPlaceholder;
                        out[i + 1] = kLiteralPlaceholder;
                        i += 2;
                        continue;
                    }
                    state = State::kNormal;
                } else {
                    out[i] = kLiteralPlaceholder;
                }
                ++i;
                break;
            }

            case State::kDollarQuote:
                if (c == '$' && sql.substr(i, dollar_tag.size()) == dollar_tag) {
                    state = State::kNormal;
                    i += dollar_tag.size();
                    continue;
                }
                out[i] = kLiteralPlaceholder;
                ++i;
                break;

            case State::kLineComment:
                if (c == '\n') {
                    state = State::kNormal;
                } else {
                    out[i] = ' ';
                }
                ++i;
                break;

            case State::kBlockComment:
                if (c == '*' && next == '/') {
                    blank(out, i, i + 2);
                    state = State::kNormal;
                    i += 2;
                    continue;
                }
                if (c != '\n') {
                    out[i] = ' ';
                }
                ++i;
                break;
        }
    }

    return out;
}
