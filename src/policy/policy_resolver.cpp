#include "policy/policy_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "parser/statement_splitter.hpp"  // trim_sql

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

// 환경변수 읽기. 없으면 nullopt.
std::optional<std::string_view> env_value(const std::string& name) {
    const char* val = std::getenv(name.c_str());  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr) {
        return std::nullopt;
    }
    return std::string_view{val};
}

bool resolve_flag(std::optional<std::string_view> raw, bool fallback, std::string_view what) {
    if (!raw) {
        return fallback;
    }
    const auto parsed = PolicyResolver::parse_flag(*raw);
    if (!parsed) {
        spdlog::warn("policy_resolver: {} value '{}' is not 'true'/'false', using default {}",
                     what, *raw, fallback);
        return fallback;
    }
    return *parsed;
}

}  // namespace

PolicyResolver::PolicyResolver()
    : PolicyResolver(kDefaultReadOnlyEnv, kDefaultAdminOverrideEnv)
{}

PolicyResolver::PolicyResolver(std::string read_only_env, std::string admin_override_env)
    : read_only_env_(std::move(read_only_env))
    , admin_override_env_(std::move(admin_override_env))
{}

std::optional<bool> PolicyResolver::parse_flag(std::string_view raw) {
    const auto trimmed = trim_sql(raw);
    if (iequals(trimmed, "true")) {
        return true;
    }
    if (iequals(trimmed, "false")) {
        return false;
    }
    return std::nullopt;
}

PolicyContext PolicyResolver::resolve(
    std::optional<std::string_view> read_only_raw,
    std::optional<std::string_view> admin_override_raw)
{
    const PolicyContext defaults{};
    PolicyContext ctx{};
    ctx.read_only      = resolve_flag(read_only_raw,      defaults.read_only,      "read_only");
    ctx.admin_override = resolve_flag(admin_override_raw, defaults.admin_override, "admin_override");
    return ctx;
}

PolicyContext PolicyResolver::resolve_from_env() const {
    return resolve(env_value(read_only_env_), env_value(admin_override_env_));
}
