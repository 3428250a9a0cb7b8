#pragma once

// ---------------------------------------------------------------------------
// lexical_normalizer.hpp
//
// 문자열 리터럴과 주석을 무력화하여 키워드/세미콜론 스캔에 안전한
// "골격(skeleton)" 문자열을 만든다. 문법 파싱은 하지 않는다.
//
// [변환 규칙]
// - '...', "...", `...`, $tag$...$tag$ (kAnsi) 내부 → kLiteralPlaceholder 로 치환
//   (구분자 자체는 유지, 길이 동일)
// - 이중 구분자('' "" ``)는 리터럴을 종료하지 않는다.
// - 줄 주석 (-- 또는 #, 방언별), /* */ 블록 주석 → 공백으로 치환 (개행은 유지)
// - /*! ... */ (MySQL 실행 주석), /*+ ... */ (옵티마이저 힌트) 는 서버가 실제로
//   실행/해석하므로 구분자만 지우고 본문은 그대로 남긴다.
// - 닫히지 않은 리터럴/주석은 입력 끝까지 해당 영역으로 취급한다.
//
// [방언]
// - kAnsi  : PostgreSQL / 표준 SQL 규칙. 백슬래시는 이스케이프가 아니고
//            ('\' 는 완결된 리터럴), # 은 연산자, -- 는 항상 줄 주석,
//            $tag$ dollar-quote 를 인정한다.
// - kMySql : MySQL 규칙. '...' "..." 안의 백슬래시는 다음 문자를 이스케이프하고,
//            # 은 줄 주석, -- 는 뒤에 공백/제어 문자가 올 때만 줄 주석이다.
//            dollar-quote 는 없다.
// 같은 입력을 두 방언이 다르게 끊을 수 있으므로 (예: SELECT '\''; DROP ...)
// 호출자는 두 골격을 모두 만들어 비교해야 한다. 어느 한쪽이라도 구문이 둘 이상이거나
// 두 결과가 어긋나면 차단한다 (SqlValidator).
//
// 블록 주석 중첩은 두 방언 모두 인정하지 않는다 (MySQL 동작). PostgreSQL 중첩
// 주석은 첫 */ 이후가 노출되므로 오탐(차단)만 늘어난다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>

// 리터럴 내용 치환 문자. 키워드/세미콜론/공백 어느 것과도 겹치지 않는다.
inline constexpr char kLiteralPlaceholder = '_';

enum class LexDialect : std::uint8_t {
    kAnsi  = 0,
    kMySql = 1,
};

// normalize_sql
//   입력과 같은 길이의 골격 문자열을 반환한다. 예외를 던지지 않는다
//   (메모리 할당 실패 제외).
[[nodiscard]] std::string normalize_sql(std::string_view sql, LexDialect dialect = LexDialect::kAnsi);
