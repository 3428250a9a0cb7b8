#pragma once

// ---------------------------------------------------------------------------
// sql_validator.hpp
//
// 신뢰할 수 없는 SQL 문자열 하나에 대해 실행 가능 여부(Verdict)를 판정한다.
// normalize_sql → split_statements → StatementClassifier → 정책 적용 순서.
//
// [fail-close 원칙: 절대 위반 금지]
// 1. 빈 입력 / 주석만 있는 입력 → 차단
// 2. 최상위 구문 2개 이상 → 정책과 무관하게 차단
// 3. 파일 연산 → 정책과 무관하게 차단
// 4. 인식 불가 선두 키워드 → 차단
// 5. 내부 예외 → 차단 (kInternalError). validate() 는 예외를 던지지 않는다.
// 6. ANSI / MySQL 어휘 규칙 중 하나라도 구문 2개 이상으로 읽으면 → 차단,
//    두 규칙의 구문 경계/분류가 어긋나면 → 차단 (kAmbiguousSyntax)
//
// [오류 메시지 계약]
// 호출자가 부분 문자열로 검사하므로 다음을 결정적으로 포함한다.
// - 파괴적 구문: 대문자 키워드 그대로 ("DROP", "DELETE", ...)
// - 파일 연산:   "File operations"
// - 복수 구문:   "multiple statements"
//
// [스레드 안전성]
// validate() 는 const 이며 내부 상태를 변경하지 않는다. 동시 호출 안전.
// ---------------------------------------------------------------------------

#include <string_view>

#include "common/types.hpp"                 // PolicyContext, Verdict
#include "parser/statement_classifier.hpp"  // StatementClassifier
#include "policy/policy_resolver.hpp"       // PolicyResolver
#include "sanitizer/log_sanitizer.hpp"      // LogSanitizer (진단 로그용)

class SqlValidator {
public:
    SqlValidator() = default;

    // resolver:  validate(sql) 에서 사용할 환경변수 이름
    // sanitizer: 차단 진단 로그에 SQL 을 남길 때 사용
    SqlValidator(PolicyResolver resolver, LogSanitizer sanitizer);

    ~SqlValidator() = default;

    SqlValidator(const SqlValidator&)            = default;
    SqlValidator& operator=(const SqlValidator&) = default;
    SqlValidator(SqlValidator&&)                 = default;
    SqlValidator& operator=(SqlValidator&&)      = default;

    // validate
    //   policy 를 명시적으로 주입한다 (테스트/재검증용). 부수효과 없음 (로그 제외).
    [[nodiscard]] Verdict validate(std::string_view sql, const PolicyContext& policy) const;

    // validate
    //   호출 시점의 환경변수로 정책을 새로 해석한 뒤 검증한다.
    [[nodiscard]] Verdict validate(std::string_view sql) const;

private:
    [[nodiscard]] Verdict evaluate(std::string_view sql, const PolicyContext& policy) const;

    StatementClassifier classifier_{};
    PolicyResolver      resolver_{};
    LogSanitizer        sanitizer_{};
};
