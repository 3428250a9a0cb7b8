#pragma once

// ---------------------------------------------------------------------------
// statement_classifier.hpp
//
// 골격 구문 조각 하나를 OperationClass 로 분류한다.
// "파일 연산 패턴 → 첫 번째 키워드" 순서의 경량 분류기.
//
// [분류 순서]
// 1. 빈 조각                                   → kEmpty
// 2. INTO OUTFILE / INTO DUMPFILE / LOAD_FILE( /
//    선두 LOAD DATA | LOAD XML                 → kFileOperation
//    (선두 키워드보다 먼저 검사: SELECT ... INTO OUTFILE 도 잡아야 함)
// 3. 선두 키워드 (앞의 '(' 는 건너뜀, 대소문자 무관)
//    SELECT / WITH                             → kSafeRead (아래 보정 적용)
//    DROP DELETE TRUNCATE ALTER INSERT UPDATE
//    CREATE GRANT REVOKE                       → kDestructiveWrite(kind)
//    그 외                                      → kUnclassified (fail-close)
//
// [보정]
// - WITH 구문: 괄호 직후의 단어, 또는 깊이 0 에서 ')' 직후의 단어가 파괴적
//   키워드이면 kDestructiveWrite. 데이터 변경 CTE
//   (WITH d AS (DELETE ... RETURNING *) SELECT ...) 와 CTE 접두 DML 을 잡는다.
// - SELECT ... INTO <이름> 은 보정하지 않는다 (변수 대입과 구분 불가, kSafeRead).
//
// 키워드는 단어 단위로만 비교한다 (updated_at 은 UPDATE 가 아님).
// ---------------------------------------------------------------------------

#include <string_view>

#include "common/types.hpp"  // OperationClass

class StatementClassifier {
public:
    StatementClassifier()  = default;
    ~StatementClassifier() = default;

    // 복사/이동 허용 (stateless)
    StatementClassifier(const StatementClassifier&)            = default;
    StatementClassifier& operator=(const StatementClassifier&) = default;
    StatementClassifier(StatementClassifier&&)                 = default;
    StatementClassifier& operator=(StatementClassifier&&)      = default;

    // classify
    //   fragment: split_statements() 가 반환한 골격 조각 하나
    //   반환: 정확히 하나의 OperationClass (전함수)
    //
    // [regex 미사용]
    // std::regex(libstdc++) 는 반복 매칭 시 재귀 깊이가 입력 길이에 비례하여
    // 긴 공백/리터럴 입력에서 스택이 고갈될 수 있다. 단어 단위 선형 스캔만 사용한다.
    [[nodiscard]] OperationClass classify(std::string_view fragment) const;
};
