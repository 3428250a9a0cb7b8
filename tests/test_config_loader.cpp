// ---------------------------------------------------------------------------
// test_config_loader.cpp
//
// ConfigLoader 단위 테스트.
//
// [테스트 범위]
// - 전체 필드 로딩 / 누락 필드 기본값
// - 존재하지 않는 파일, YAML 문법 오류, 최상위 비-map → 실패
// - sanitizer.sensitive_fields 빈 목록 → 실패 (마스킹 비활성화 방지)
// - sanitizer.max_length 범위 보정
// - 잘못된 log_format → json 으로 대체
// - config/querygate.yaml 실제 로딩
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <string>

namespace {

// 임시 YAML 파일을 만들고 소멸 시 삭제한다.
class TempYaml {
public:
    TempYaml(const std::string& name, const char* content)
        : path_(std::filesystem::temp_directory_path() / name)
    {
        std::FILE* f = std::fopen(path_.c_str(), "w");
        if (f != nullptr) {
            std::fputs(content, f);
            std::fclose(f);
        }
    }

    ~TempYaml() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempYaml(const TempYaml&)            = delete;
    TempYaml& operator=(const TempYaml&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

// ---------------------------------------------------------------------------
// 파일 로딩
// ---------------------------------------------------------------------------
TEST(ConfigLoader, LoadValidFile_Succeeds) {
    const TempYaml yaml("querygate_test_valid.yaml", R"(
global:
  log_level: debug
  log_format: text
  log_path: /tmp/querygate_test_audit.log

policy:
  read_only_env: APP_READ_ONLY
  admin_override_env: APP_ADMIN_OVERRIDE

gate:
  require_approval: true

sanitizer:
  max_length: 256
  sensitive_fields:
    - password
    - ssn
)");

    const auto result = ConfigLoader::load(yaml.path());
    ASSERT_TRUE(result.has_value()) << "Expected success but got error: " << result.error();

    const auto& cfg = result.value();
    EXPECT_EQ(cfg.global.log_level, "debug");
    EXPECT_EQ(cfg.global.log_format, "text");
    EXPECT_EQ(cfg.global.log_path, "/tmp/querygate_test_audit.log");
    EXPECT_EQ(cfg.policy.read_only_env, "APP_READ_ONLY");
    EXPECT_EQ(cfg.policy.admin_override_env, "APP_ADMIN_OVERRIDE");
    EXPECT_TRUE(cfg.gate.require_approval);
    EXPECT_EQ(cfg.sanitizer.max_length, 256u);
    ASSERT_EQ(cfg.sanitizer.sensitive_fields.size(), 2u);
    EXPECT_EQ(cfg.sanitizer.sensitive_fields[1], "ssn");
}

TEST(ConfigLoader, LoadNonExistentFile_ReturnsError) {
    const auto result = ConfigLoader::load("/nonexistent/path/querygate.yaml");
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(result.error().empty());
}

TEST(ConfigLoader, LoadMalformedFile_ReturnsError) {
    const TempYaml yaml("querygate_test_malformed.yaml", "global: [unclosed\n  log_level: info\n");
    const auto result = ConfigLoader::load(yaml.path());
    EXPECT_FALSE(result.has_value());
}

// ---------------------------------------------------------------------------
// 문자열 로딩
// ---------------------------------------------------------------------------
TEST(ConfigLoader, MissingSectionsUseDefaults) {
    const auto result = ConfigLoader::load_string("global:\n  log_level: warn\n");
    ASSERT_TRUE(result.has_value());

    const GateConfig defaults{};
    const auto&      cfg = result.value();
    EXPECT_EQ(cfg.global.log_level, "warn");
    EXPECT_EQ(cfg.global.log_format, defaults.global.log_format);
    EXPECT_EQ(cfg.policy.read_only_env, "READ_ONLY");
    EXPECT_EQ(cfg.policy.admin_override_env, "ADMIN_OVERRIDE");
    EXPECT_FALSE(cfg.gate.require_approval);
    EXPECT_EQ(cfg.sanitizer.max_length, SanitizerConfig::kMaxLengthCeiling);
    EXPECT_EQ(cfg.sanitizer.sensitive_fields, defaults.sanitizer.sensitive_fields);
}

TEST(ConfigLoader, NonMapRoot_ReturnsError) {
    EXPECT_FALSE(ConfigLoader::load_string("- just\n- a list\n").has_value());
    EXPECT_FALSE(ConfigLoader::load_string("").has_value());
}

TEST(ConfigLoader, EmptySensitiveFields_ReturnsError) {
    const auto result = ConfigLoader::load_string("sanitizer:\n  sensitive_fields: []\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().find("sensitive_fields"), std::string::npos);
}

TEST(ConfigLoader, EmptyEnvName_ReturnsError) {
    EXPECT_FALSE(ConfigLoader::load_string("policy:\n  read_only_env: \"\"\n").has_value());
}

TEST(ConfigLoader, MaxLengthClamped) {
    auto high = ConfigLoader::load_string("sanitizer:\n  max_length: 5000\n");
    ASSERT_TRUE(high.has_value());
    EXPECT_EQ(high->sanitizer.max_length, SanitizerConfig::kMaxLengthCeiling);

    auto low = ConfigLoader::load_string("sanitizer:\n  max_length: 3\n");
    ASSERT_TRUE(low.has_value());
    EXPECT_EQ(low->sanitizer.max_length, SanitizerConfig::kMaxLengthFloor);
}

TEST(ConfigLoader, NonNumericMaxLengthKeepsDefault) {
    auto result = ConfigLoader::load_string("sanitizer:\n  max_length: lots\n");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sanitizer.max_length, SanitizerConfig::kMaxLengthCeiling);
}

TEST(ConfigLoader, InvalidLogFormatFallsBackToJson) {
    auto result = ConfigLoader::load_string("global:\n  log_format: xml\n");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->global.log_format, "json");
}

TEST(ConfigLoader, InvalidBooleanKeepsDefault) {
    auto result = ConfigLoader::load_string("gate:\n  require_approval: maybe\n");
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->gate.require_approval);
}

// ---------------------------------------------------------------------------
// config/querygate.yaml 실제 로딩
// ---------------------------------------------------------------------------
TEST(ConfigLoader, LoadBundledConfig_Succeeds) {
    const std::filesystem::path path =
        std::filesystem::path(QUERYGATE_SOURCE_DIR) / "config" / "querygate.yaml";
    if (!std::filesystem::exists(path)) {
        GTEST_SKIP() << "config/querygate.yaml not found, skipping test";
    }

    const auto result = ConfigLoader::load(path);
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_FALSE(result->sanitizer.sensitive_fields.empty());
    EXPECT_LE(result->sanitizer.max_length, SanitizerConfig::kMaxLengthCeiling);
}
