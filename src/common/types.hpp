#pragma once

#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// PolicyContext
//   검증 호출 1회에 적용되는 불변 정책 스냅샷.
//   PolicyResolver 가 호출 시점에 생성하고 validator 에 값으로 전달한다.
//   read_only == false 이면 모든 파괴적 구문이 admin_override 와 무관하게 허용된다.
// ---------------------------------------------------------------------------
struct PolicyContext {
    bool read_only{true};        // 읽기 전용 모드 (기본값: 강제)
    bool admin_override{false};  // 관리자 오버라이드 (기본값: 비활성)
};

// ---------------------------------------------------------------------------
// OperationKind
//   구문 하나(또는 입력 전체)에 부여되는 분류.
//   kUnclassified 는 알 수 없는 선두 키워드이며 validator 에서 fail-close 처리한다.
// ---------------------------------------------------------------------------
enum class OperationKind : std::uint8_t {
    kSafeRead           = 0,
    kDestructiveWrite   = 1,
    kFileOperation      = 2,
    kMultipleStatements = 3,
    kEmpty              = 4,
    kUnclassified       = 5,
};

// ---------------------------------------------------------------------------
// DestructiveKind
//   스키마/데이터를 변경하는 선두 키워드 (정규화된 대문자 키워드와 1:1).
// ---------------------------------------------------------------------------
enum class DestructiveKind : std::uint8_t {
    kDrop     = 0,
    kDelete   = 1,
    kTruncate = 2,
    kAlter    = 3,
    kInsert   = 4,
    kUpdate   = 5,
    kCreate   = 6,
    kGrant    = 7,
    kRevoke   = 8,
};

// ---------------------------------------------------------------------------
// OperationClass
//   kind + (kDestructiveWrite 일 때만) destructive_kind 로 이루어진 태그드 값.
//   keyword: 분류를 결정한 대문자 키워드. kUnclassified 이면 인식하지 못한 토큰.
// ---------------------------------------------------------------------------
struct OperationClass {
    OperationKind                  kind{OperationKind::kUnclassified};
    std::optional<DestructiveKind> destructive_kind{};
    std::string                    keyword{};
};

// ---------------------------------------------------------------------------
// RejectCode
//   차단 사유 분류. 모든 차단은 예외가 아닌 Verdict 값으로 표현된다.
// ---------------------------------------------------------------------------
enum class RejectCode : std::uint8_t {
    kNone                  = 0,  // 허용
    kEmptyInput            = 1,
    kMultipleStatements    = 2,
    kDestructiveOperation  = 3,
    kFileOperation         = 4,
    kUnclassifiedOperation = 5,
    kInternalError         = 6,  // validator 내부 예외 → fail-close
    kAmbiguousSyntax       = 7,  // 방언(ANSI/MySQL)에 따라 구문 경계/분류가 달라짐
};

// ---------------------------------------------------------------------------
// Verdict
//   SQL 입력 하나에 대한 허용/차단 판정. 호출마다 새로 생성되며 저장되지 않는다.
//   error/suggestion 은 사용자에게 그대로 노출된다.
//   is_destructive 는 허용 여부와 무관하게 파괴적 구문이면 true.
// ---------------------------------------------------------------------------
struct Verdict {
    bool                       is_valid{false};  // 기본값 차단 (fail-close)
    std::optional<std::string> error{};
    std::optional<std::string> suggestion{};
    RejectCode                 code{RejectCode::kNone};
    bool                       is_destructive{false};
    OperationClass             operation{};
};

// 로그/JSON 출력용 문자열 변환
[[nodiscard]] const char* to_string(OperationKind kind) noexcept;
[[nodiscard]] const char* to_string(DestructiveKind kind) noexcept;
[[nodiscard]] const char* to_string(RejectCode code) noexcept;
