#pragma once

// ---------------------------------------------------------------------------
// log_sanitizer.hpp
//
// 감사 로그에 기록하기 전 원문 SQL 에서 자격 증명 형태의 값을 마스킹하고
// 길이를 제한한다. 구문 구조를 알 필요가 없으며 validator 가 차단할 입력에도
// 그대로 사용할 수 있다.
//
// [마스킹 규칙]
//   <필드명> <연산자> <값>
//   - 필드명: 설정된 민감 조각(password, api_key, ...)을 포함하는 식별자
//             (대소문자 무관, u.password 같은 한정자와 "..."/`...` 인용 허용)
//   - 연산자: =, !=, <>, :=
//   - 값:     '...' / "..." (이중 따옴표 이스케이프 허용) 또는 따옴표 없는 리터럴
//   값만 *** 로 바꾸고 따옴표와 필드명, 공백은 그대로 둔다.
//     password = 'secret123'  →  password = '***'
//
// [길이 제한]
//   결과는 max_length 바이트 이하 (절단 표시 포함, 상한 500).
//   UTF-8 멀티바이트 문자 중간에서 자르지 않는다.
//
// [미탐 주의]
// - 필드명 없이 값만 있는 경우 (VALUES ('hunter2')) 는 마스킹하지 않는다.
// - LIKE / IN (...) 비교는 대상이 아니다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

#include "config/gate_config.hpp"  // SanitizerConfig

class LogSanitizer {
public:
    static constexpr std::string_view kMask              = "***";
    static constexpr std::string_view kTruncationSuffix = "...[truncated]";

    // 생성자: 민감 필드 조각은 소문자로 저장한다. 빈 조각은 경고 후 제외한다.
    //         max_length 는 [kMaxLengthFloor, kMaxLengthCeiling] 범위로 보정된다.
    explicit LogSanitizer(SanitizerConfig config = {});

    ~LogSanitizer() = default;

    LogSanitizer(const LogSanitizer&)            = default;
    LogSanitizer& operator=(const LogSanitizer&) = default;
    LogSanitizer(LogSanitizer&&)                 = default;
    LogSanitizer& operator=(LogSanitizer&&)      = default;

    // sanitize
    //   마스킹 + 길이 제한. 일치하는 패턴이 없으면 길이 제한만 적용한다.
    //   이미 마스킹된 문자열을 다시 넣어도 결과가 같다.
    [[nodiscard]] std::string sanitize(std::string_view sql) const;

    [[nodiscard]] std::size_t max_length() const noexcept { return max_length_; }

private:
    [[nodiscard]] std::string redact(std::string_view sql) const;
    [[nodiscard]] std::string truncate(std::string text) const;

    std::vector<std::string> fragments_;   // 소문자 민감 필드 조각
    std::size_t              max_length_;
};

// sanitize_for_logging
//   기본 설정 LogSanitizer 를 사용하는 편의 함수. 결과 ≤ 500 바이트.
[[nodiscard]] std::string sanitize_for_logging(std::string_view sql);
