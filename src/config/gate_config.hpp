#pragma once

// ---------------------------------------------------------------------------
// gate_config.hpp
//
// 게이트 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/querygate.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. 설정 파일이 없어도 기본값으로 동작한다.
// - read_only/admin_override 값 자체는 여기 없다. 환경변수 "이름"만 보관하고
//   값은 PolicyResolver 가 검증 호출마다 새로 읽는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level:  "trace"|"debug"|"info"|"warn"|"error"|"critical"
//   log_format: "json" | "text"
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_format{"json"};
    std::string log_path{"/tmp/querygate.log"};
};

// ---------------------------------------------------------------------------
// PolicySource
//   PolicyResolver 가 읽을 환경변수 이름.
// ---------------------------------------------------------------------------
struct PolicySource {
    std::string read_only_env{"READ_ONLY"};
    std::string admin_override_env{"ADMIN_OVERRIDE"};
};

// ---------------------------------------------------------------------------
// GateOptions
//   require_approval = true 이면 허용된 모든 쿼리가 사람 승인 단계를 거친다.
//   false 여도 관리자 오버라이드로만 통과한 파괴적 구문은 승인을 요구한다.
// ---------------------------------------------------------------------------
struct GateOptions {
    bool require_approval{false};
};

// ---------------------------------------------------------------------------
// SanitizerConfig
//   sensitive_fields: 필드명 부분 문자열 (대소문자 무관)
//   max_length:       로그 문자열 최대 바이트 수 (절단 표시 포함, 상한 500)
// ---------------------------------------------------------------------------
struct SanitizerConfig {
    static constexpr std::uint32_t kMaxLengthCeiling = 500;
    static constexpr std::uint32_t kMaxLengthFloor   = 32;

    std::vector<std::string> sensitive_fields{
        "password", "passwd", "api_key", "apikey", "api-key",
        "secret", "token", "access_key", "private_key",
    };
    std::uint32_t max_length{kMaxLengthCeiling};
};

// ---------------------------------------------------------------------------
// GateConfig
//   전체 설정의 루트 구조체. ConfigLoader::load 가 반환한다.
// ---------------------------------------------------------------------------
struct GateConfig {
    GlobalConfig    global{};
    PolicySource    policy{};
    GateOptions     gate{};
    SanitizerConfig sanitizer{};
};
