#pragma once

// ---------------------------------------------------------------------------
// policy_resolver.hpp
//
// 주변 설정(읽기 전용 플래그, 관리자 오버라이드 플래그)을 검증 호출 1회용
// 불변 PolicyContext 로 변환한다.
//
// [캐시 금지]
// resolve_from_env() 는 호출될 때마다 환경변수를 새로 읽는다.
// 승인 직후 실행 직전의 재검증에서도 최신 오버라이드 값이 반영되어야 한다.
//
// [기본값: fail-close]
// 값이 없거나 "true"/"false" 로 해석되지 않으면
//   read_only = true, admin_override = false
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"  // PolicyContext

class PolicyResolver {
public:
    static constexpr const char* kDefaultReadOnlyEnv      = "READ_ONLY";
    static constexpr const char* kDefaultAdminOverrideEnv = "ADMIN_OVERRIDE";

    PolicyResolver();
    PolicyResolver(std::string read_only_env, std::string admin_override_env);

    // resolve
    //   문자열 형태의 원시 값으로부터 PolicyContext 를 만든다. 부수효과 없음.
    [[nodiscard]] static PolicyContext resolve(
        std::optional<std::string_view> read_only_raw,
        std::optional<std::string_view> admin_override_raw);

    // resolve_from_env
    //   설정된 이름의 환경변수를 지금 읽어서 resolve() 한다.
    [[nodiscard]] PolicyContext resolve_from_env() const;

    // parse_flag
    //   "true"/"false" (대소문자 무관, 앞뒤 공백 허용) → bool, 그 외 nullopt
    [[nodiscard]] static std::optional<bool> parse_flag(std::string_view raw);

    [[nodiscard]] const std::string& read_only_env() const noexcept { return read_only_env_; }
    [[nodiscard]] const std::string& admin_override_env() const noexcept { return admin_override_env_; }

private:
    std::string read_only_env_;
    std::string admin_override_env_;
};
