// ---------------------------------------------------------------------------
// main.cpp
//
// querygate CLI: SQL 한 개를 검토하고 판정을 출력한다.
//
//   querygate [--config <yaml>] [--json] [<sql> ...]
//
// - SQL 인자가 없으면 stdin 전체를 SQL 로 읽는다.
// - --config 가 없으면 QUERYGATE_CONFIG 환경변수, 그것도 없으면 기본 설정.
// - 정책 플래그(READ_ONLY / ADMIN_OVERRIDE)는 항상 환경변수에서 읽는다.
//
// 종료 코드: 0 = 허용 (승인 필요 포함), 1 = 차단, 2 = 사용법/설정 오류
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"
#include "gate/query_gate.hpp"
#include "logger/audit_logger.hpp"
#include "logger/log_types.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <unistd.h>

namespace {

constexpr int kExitValid   = 0;
constexpr int kExitBlocked = 1;
constexpr int kExitUsage   = 2;

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

struct CliOptions {
    std::optional<std::string> config_path{};
    bool                       json{false};
    bool                       help{false};
    std::string                sql{};
    bool                       sql_from_args{false};
};

void print_usage(std::ostream& out) {
    out << "usage: querygate [--config <yaml>] [--json] [<sql> ...]\n"
           "  SQL is read from stdin when no SQL argument is given.\n"
           "  exit status: 0 valid, 1 blocked, 2 usage or configuration error\n";
}

// 실패 시 std::invalid_argument
CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    bool       end_of_options = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (!end_of_options && arg == "--") {
            end_of_options = true;
            continue;
        }
        if (!end_of_options && (arg == "-h" || arg == "--help")) {
            opts.help = true;
            continue;
        }
        if (!end_of_options && arg == "--json") {
            opts.json = true;
            continue;
        }
        if (!end_of_options && arg == "--config") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--config requires a path");
            }
            opts.config_path = argv[++i];
            continue;
        }
        if (!end_of_options && arg.size() > 2 && arg.starts_with("--")) {
            throw std::invalid_argument("unknown option: " + arg);
        }
        if (opts.sql_from_args) {
            opts.sql += ' ';
        }
        opts.sql += arg;
        opts.sql_from_args = true;
    }
    return opts;
}

std::string read_stdin() {
    std::ostringstream buf;
    buf << std::cin.rdbuf();
    return buf.str();
}

std::string json_optional(const std::optional<std::string>& value) {
    return value ? "\"" + escape_json_string(*value) + "\"" : std::string("null");
}

void print_outcome(const GateOutcome& outcome, std::string_view sanitized_sql, bool as_json) {
    const Verdict& v = outcome.verdict;
    if (as_json) {
        std::cout << fmt::format(
            R"({{"status":"{}","is_valid":{},"is_destructive":{},"operation":"{}","keyword":"{}",)"
            R"("code":"{}","error":{},"suggestion":{},"sql":"{}"}})",
            to_string(outcome.status), v.is_valid ? "true" : "false",
            v.is_destructive ? "true" : "false", to_string(v.operation.kind),
            escape_json_string(v.operation.keyword), to_string(v.code), json_optional(v.error),
            json_optional(v.suggestion), escape_json_string(sanitized_sql))
                  << '\n';
        return;
    }

    std::cout << "status:     " << to_string(outcome.status) << '\n'
              << "operation:  " << to_string(v.operation.kind);
    if (!v.operation.keyword.empty()) {
        std::cout << " (" << v.operation.keyword << ')';
    }
    std::cout << '\n';
    if (v.error) {
        std::cout << "error:      " << *v.error << '\n';
    }
    if (v.suggestion) {
        std::cout << "suggestion: " << *v.suggestion << '\n';
    }
    std::cout << "sql:        " << sanitized_sql << '\n';
}

std::string make_request_id() {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    return fmt::format("cli-{}-{}", static_cast<long>(::getpid()), now);
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // 진단 로그는 stderr 로 보낸다 (stdout 은 판정 출력 전용)
    spdlog::set_default_logger(spdlog::stderr_color_mt("querygate"));

    // ── 인자 파싱 ───────────────────────────────────────────────────────
    CliOptions opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "querygate: " << ex.what() << '\n';
        print_usage(std::cerr);
        return kExitUsage;
    }
    if (opts.help) {
        print_usage(std::cout);
        return kExitValid;
    }

    // ── 설정 로드 (명시된 경로가 있으면 실패 시 중단) ───────────────────
    GateConfig        config;
    const std::string config_path = opts.config_path.value_or(env_str("QUERYGATE_CONFIG", ""));
    if (!config_path.empty()) {
        auto loaded = ConfigLoader::load(config_path);
        if (!loaded) {
            std::cerr << "querygate: " << loaded.error() << '\n';
            return kExitUsage;
        }
        config = std::move(*loaded);
    }

    const LogLevel level = parse_log_level(config.global.log_level);
    spdlog::set_level(level == LogLevel::kDebug  ? spdlog::level::debug
                      : level == LogLevel::kWarn  ? spdlog::level::warn
                      : level == LogLevel::kError ? spdlog::level::err
                                                  : spdlog::level::info);

    const std::string sql = opts.sql_from_args ? opts.sql : read_stdin();

    // ── 게이트 구성 ─────────────────────────────────────────────────────
    const LogSanitizer   sanitizer{config.sanitizer};
    const PolicyResolver resolver{config.policy.read_only_env, config.policy.admin_override_env};

    std::shared_ptr<AuditLogger> audit;
    try {
        const LogFormat format =
            config.global.log_format == "text" ? LogFormat::kText : LogFormat::kJson;
        audit = std::make_shared<AuditLogger>(level, config.global.log_path, format, sanitizer,
                                              /*to_stdout=*/false);
    } catch (const std::runtime_error& ex) {
        std::cerr << "querygate: " << ex.what() << '\n';
        return kExitUsage;
    }

    const QueryGate gate{SqlValidator{resolver, sanitizer}, resolver, config.gate, audit};

    RequestContext request;
    request.request_id = make_request_id();
    request.user_id    = env_str("USER", "unknown");

    const GateOutcome outcome = gate.review(sql, request);
    print_outcome(outcome, sanitizer.sanitize(sql), opts.json);

    audit->flush();
    return outcome.verdict.is_valid ? kExitValid : kExitBlocked;
}
