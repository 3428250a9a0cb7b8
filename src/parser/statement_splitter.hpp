#pragma once

// ---------------------------------------------------------------------------
// statement_splitter.hpp
//
// normalize_sql() 결과(골격)를 최상위 세미콜론 기준으로 분리한다.
// 리터럴/주석은 이미 무력화되었으므로 단순 ';' 분리가 안전하다.
//
// [주의] 원문 SQL 을 직접 넘기면 리터럴 안의 ';' 에서 잘못 분리된다.
//        반드시 normalize_sql() 을 먼저 거칠 것.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

// split_statements
//   반환: 앞뒤 공백을 제거한 비어 있지 않은 구문 조각 (입력 순서 유지).
//   "SELECT 1;" 처럼 끝 세미콜론만 있는 경우 조각은 1개다.
[[nodiscard]] std::vector<std::string> split_statements(std::string_view skeleton);

// trim_sql
//   앞뒤 공백(스페이스, 탭, 개행 포함)을 제거한 view 를 반환한다.
[[nodiscard]] std::string_view trim_sql(std::string_view s);
