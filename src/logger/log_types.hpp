#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사 로그 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [민감정보 취급]
// - raw_sql 은 원문 SQL 이다. AuditLogger 가 기록 직전에 LogSanitizer 로
//   마스킹/절단하므로 호출자가 미리 마스킹할 필요는 없다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // OperationKind, RejectCode

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug"|"info"|"warn"|"error" (대소문자 무관) → LogLevel. 그 외 kInfo.
[[nodiscard]] LogLevel parse_log_level(std::string_view raw);

// JSON 문자열 값 이스케이프 (따옴표 제외). 제어 문자는 \uXXXX.
[[nodiscard]] std::string escape_json_string(std::string_view str);

// ---------------------------------------------------------------------------
// LogFormat
//   kJson: 한 줄 JSON 객체 / kText: key=value 나열
// ---------------------------------------------------------------------------
enum class LogFormat : std::uint8_t {
    kJson = 0,
    kText = 1,
};

// ---------------------------------------------------------------------------
// AuditStatus
//   호출자(QueryGate)가 판정 결과를 분기한 외부 관측 상태.
// ---------------------------------------------------------------------------
enum class AuditStatus : std::uint8_t {
    kSuccess          = 0,  // 허용, 실행 단계로 진행
    kApprovalRequired = 1,  // 허용이지만 사람 승인 필요
    kBlocked          = 2,  // 차단
};

[[nodiscard]] const char* to_string(AuditStatus status) noexcept;

// ---------------------------------------------------------------------------
// AuditLog
//   판정 1건의 감사 레코드.
// ---------------------------------------------------------------------------
struct AuditLog {
    std::string                           request_id{};
    std::string                           user_id{};
    std::string                           raw_sql{};        // 기록 시 마스킹됨
    AuditStatus                           status{AuditStatus::kBlocked};
    OperationKind                         operation{OperationKind::kUnclassified};
    std::string                           keyword{};        // 분류 키워드 (DROP, SELECT, ...)
    RejectCode                            code{RejectCode::kNone};
    std::optional<std::string>            error{};
    bool                                  revalidation{false};  // 실행 직전 재검증 여부
    std::chrono::system_clock::time_point timestamp{};
};
