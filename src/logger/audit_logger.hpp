#pragma once

// ---------------------------------------------------------------------------
// audit_logger.hpp
//
// spdlog 기반 감사 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 원문 SQL 은 반드시 내부 LogSanitizer 를 거친 뒤 싱크에 기록된다.
//   마스킹되지 않은 SQL 이 파일/stdout 에 도달하는 경로는 없다.
// - 전역 spdlog 레지스트리에 등록하지 않는다 (인스턴스 여러 개 허용).
// ---------------------------------------------------------------------------

#include "log_types.hpp"
#include "sanitizer/log_sanitizer.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// ---------------------------------------------------------------------------
// AuditLogger
//   AuditLog 를 JSON(또는 text) 한 줄로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class AuditLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   format    : kJson | kText
    //   sanitizer : raw_sql 마스킹에 사용
    //   to_stdout : stdout 싱크 추가 여부
    // 실패 시 std::runtime_error
    AuditLogger(LogLevel                     min_level,
                const std::filesystem::path& log_path,
                LogFormat                    format    = LogFormat::kJson,
                LogSanitizer                 sanitizer = LogSanitizer{},
                bool                         to_stdout = true);

    ~AuditLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    AuditLogger(const AuditLogger&)            = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    AuditLogger(AuditLogger&&)            = default;
    AuditLogger& operator=(AuditLogger&&) = default;

    // log_decision
    //   판정 1건을 기록한다. kBlocked 는 warn, 나머지는 info 레벨.
    void log_decision(const AuditLog& entry);

    // format_entry
    //   싱크에 기록될 문자열을 만든다 (마스킹 포함).
    [[nodiscard]] std::string format_entry(const AuditLog& entry) const;

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    void flush();

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    LogFormat                       format_;
    LogSanitizer                    sanitizer_;
    std::shared_ptr<spdlog::logger> logger_;
};
