#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 게이트 설정 파일을 로드한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는 실패 시
//   기본 GateConfig 로 동작하거나 기동을 중단해야 한다.
// - 파싱 실패 원인은 로깅하되 YAML 파일 전체를 로그에 출력하지 않는다.
//
// [순환 의존성]
// config_loader.hpp → gate_config.hpp (단방향만)
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "gate_config.hpp"  // GateConfig

class ConfigLoader {
public:
    ConfigLoader()  = default;
    ~ConfigLoader() = default;

    ConfigLoader(const ConfigLoader&)            = default;
    ConfigLoader& operator=(const ConfigLoader&) = default;
    ConfigLoader(ConfigLoader&&)                 = default;
    ConfigLoader& operator=(ConfigLoader&&)      = default;

    // load
    //   지정된 경로의 YAML 파일을 읽어 GateConfig 로 파싱한다.
    //
    //   실패: 파일 없음, YAML 문법 오류, 최상위가 map 이 아님,
    //         sanitizer.sensitive_fields 가 빈 목록 (마스킹 비활성화 방지)
    //   누락된 키는 구조체 기본값을 적용한다.
    //   sanitizer.max_length 는 [32, 500] 범위로 보정한다 (경고 로그).
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_string
    //   YAML 문자열에서 직접 로드한다 (테스트, 내장 기본 설정용).
    [[nodiscard]] static std::expected<GateConfig, std::string>
    load_string(const std::string& yaml_text);
};
