// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 게이트 설정 파일을 GateConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 구조체 기본값을 적용한다.
// - sensitive_fields 가 명시적으로 빈 목록이면 실패 처리한다.
//   빈 목록은 로그 마스킹이 꺼진 상태이므로 설정 실수로 간주한다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        spdlog::warn("config_loader: '{}' is not a boolean, using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        spdlog::warn("config_loader: '{}' is not an unsigned integer, using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] GlobalConfig parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.log_level  = read_string(node["log_level"],  cfg.log_level);
    cfg.log_format = read_string(node["log_format"], cfg.log_format);
    cfg.log_path   = read_string(node["log_path"],   cfg.log_path);

    if (cfg.log_format != "json" && cfg.log_format != "text") {
        spdlog::warn("config_loader: global.log_format '{}' is not 'json' or 'text', "
                     "defaulting to 'json'", cfg.log_format);
        cfg.log_format = "json";
    }
    return cfg;
}

[[nodiscard]] PolicySource parse_policy(const YAML::Node& node) {
    PolicySource src{};
    if (!node || !node.IsMap()) {
        return src;
    }
    src.read_only_env      = read_string(node["read_only_env"],      src.read_only_env);
    src.admin_override_env = read_string(node["admin_override_env"], src.admin_override_env);
    return src;
}

[[nodiscard]] GateOptions parse_gate(const YAML::Node& node) {
    GateOptions opts{};
    if (!node || !node.IsMap()) {
        return opts;
    }
    opts.require_approval = read_bool(node["require_approval"], opts.require_approval);
    return opts;
}

[[nodiscard]] SanitizerConfig parse_sanitizer(const YAML::Node& node) {
    SanitizerConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    if (node["sensitive_fields"]) {
        cfg.sensitive_fields = read_string_sequence(node["sensitive_fields"]);
    }
    const std::uint32_t raw_max = read_uint32(node["max_length"], cfg.max_length);
    cfg.max_length = std::clamp(raw_max,
                                SanitizerConfig::kMaxLengthFloor,
                                SanitizerConfig::kMaxLengthCeiling);
    if (cfg.max_length != raw_max) {
        spdlog::warn("config_loader: sanitizer.max_length {} out of range [{}, {}], clamped to {}",
                     raw_max, SanitizerConfig::kMaxLengthFloor,
                     SanitizerConfig::kMaxLengthCeiling, cfg.max_length);
    }
    return cfg;
}

// 최상위 노드 → GateConfig. source 는 오류 메시지용 이름.
std::expected<GateConfig, std::string> parse_root(const YAML::Node& root, const std::string& source) {
    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)", source);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    GateConfig cfg{};
    try {
        cfg.global    = parse_global(root["global"]);
        cfg.policy    = parse_policy(root["policy"]);
        cfg.gate      = parse_gate(root["gate"]);
        cfg.sanitizer = parse_sanitizer(root["sanitizer"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (cfg.sanitizer.sensitive_fields.empty()) {
        const std::string err =
            "config_loader: sanitizer.sensitive_fields must have at least one entry "
            "(an empty list would disable log redaction)";
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (cfg.policy.read_only_env.empty() || cfg.policy.admin_override_env.empty()) {
        const std::string err =
            "config_loader: policy.read_only_env and policy.admin_override_env must not be empty";
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info(
        "config_loader: config loaded from '{}', sensitive_fields={}, max_length={}, "
        "require_approval={}",
        source, cfg.sanitizer.sensitive_fields.size(), cfg.sanitizer.max_length,
        cfg.gate.require_approval
    );
    return cfg;
}

}  // namespace

std::expected<GateConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, canonical_path.string());
}

std::expected<GateConfig, std::string>
ConfigLoader::load_string(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: YAML error: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, "<string>");
}
