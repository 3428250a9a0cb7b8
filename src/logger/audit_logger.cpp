// ---------------------------------------------------------------------------
// audit_logger.cpp
//
// spdlog 기반 감사 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/audit_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
        default:               return spdlog::level::info;
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// JSON 문자열 이스케이프 (감사 로그 / CLI --json 공용)
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }
    return result;
}

LogLevel parse_log_level(std::string_view raw) {
    std::string lower(raw);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace" || lower == "debug") {
        return LogLevel::kDebug;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::kWarn;
    }
    if (lower == "error" || lower == "critical") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

const char* to_string(AuditStatus status) noexcept {
    switch (status) {
        case AuditStatus::kSuccess:          return "success";
        case AuditStatus::kApprovalRequired: return "approval_required";
        case AuditStatus::kBlocked:          return "blocked";
        default:                             return "blocked";
    }
}

// ---------------------------------------------------------------------------
// AuditLogger 생성자
// ---------------------------------------------------------------------------
AuditLogger::AuditLogger(LogLevel                     min_level,
                         const std::filesystem::path& log_path,
                         LogFormat                    format,
                         LogSanitizer                 sanitizer,
                         bool                         to_stdout)
    : min_level_(min_level)
    , log_path_(log_path)
    , format_(format)
    , sanitizer_(std::move(sanitizer))
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        if (to_stdout) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());
        }

        // Rotating file sink (10MB, 3개 파일 유지)
        constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles    = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        logger_ = std::make_shared<spdlog::logger>("querygate_audit", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level_));

        // 구조화 로그 본문은 각 메서드에서 생성. 패턴은 타임스탬프만.
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Audit logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Audit logger initialization failed: ") + ex.what());
    }
}

AuditLogger::~AuditLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// format_entry: JSON / text 직렬화
// ---------------------------------------------------------------------------
std::string AuditLogger::format_entry(const AuditLog& entry) const {
    const std::string sql = sanitizer_.sanitize(entry.raw_sql);

    std::ostringstream out;
    if (format_ == LogFormat::kJson) {
        out << R"({"event":"query_decision","request_id":")" << escape_json_string(entry.request_id)
            << R"(","user_id":")" << escape_json_string(entry.user_id)
            << R"(","status":")" << to_string(entry.status)
            << R"(","operation":")" << to_string(entry.operation)
            << R"(","keyword":")" << escape_json_string(entry.keyword)
            << R"(","code":")" << to_string(entry.code)
            << R"(","revalidation":)" << (entry.revalidation ? "true" : "false")
            << R"(,"sql":")" << escape_json_string(sql) << '"';
        if (entry.error) {
            out << R"(,"error":")" << escape_json_string(*entry.error) << '"';
        }
        out << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";
    } else {
        out << "event=query_decision request_id=" << entry.request_id
            << " user_id=" << entry.user_id
            << " status=" << to_string(entry.status)
            << " operation=" << to_string(entry.operation)
            << " keyword=" << entry.keyword
            << " code=" << to_string(entry.code)
            << " revalidation=" << (entry.revalidation ? "true" : "false")
            << " timestamp=" << format_iso8601(entry.timestamp);
        if (entry.error) {
            out << " error=\"" << *entry.error << '"';
        }
        out << " sql=\"" << sql << '"';
    }
    return out.str();
}

void AuditLogger::log_decision(const AuditLog& entry) {
    if (!logger_) {
        return;
    }
    if (entry.status == AuditStatus::kBlocked) {
        if (static_cast<int>(min_level_) <= static_cast<int>(LogLevel::kWarn)) {
            logger_->warn(format_entry(entry));
        }
        return;
    }
    if (static_cast<int>(min_level_) <= static_cast<int>(LogLevel::kInfo)) {
        logger_->info(format_entry(entry));
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void AuditLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void AuditLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void AuditLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void AuditLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void AuditLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
