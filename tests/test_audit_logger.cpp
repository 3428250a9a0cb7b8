// ---------------------------------------------------------------------------
// test_audit_logger.cpp
//
// AuditLogger 단위 테스트.
//
// [테스트 범위]
// - JSON 직렬화 필드 (event, request_id, status, operation, code, sql, error)
// - 원문 SQL 은 마스킹된 형태로만 기록된다
// - text 포맷
// - min_level 필터링 (warn 이상이면 success 판정은 기록하지 않음)
// - 잘못된 로그 경로 → std::runtime_error
// ---------------------------------------------------------------------------

#include "logger/audit_logger.hpp"
#include "logger/log_types.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// JSON 한 줄에서 "field":"value" 문자열 값을 꺼낸다 (중첩 객체 없음).
std::string get_string_field(const std::string& json, const std::string& field) {
    const std::string key = "\"" + field + "\":\"";
    auto pos = json.find(key);
    if (pos == std::string::npos) {
        return "";
    }
    pos += key.size();
    std::string value;
    while (pos < json.size() && json[pos] != '"') {
        if (json[pos] == '\\' && pos + 1 < json.size()) {
            ++pos;
        }
        value += json[pos];
        ++pos;
    }
    return value;
}

AuditLog make_entry(AuditStatus status, const std::string& sql) {
    AuditLog entry;
    entry.request_id = "req-42";
    entry.user_id    = "analyst";
    entry.raw_sql    = sql;
    entry.status     = status;
    entry.operation  = OperationKind::kSafeRead;
    entry.keyword    = "SELECT";
    entry.code       = RejectCode::kNone;
    entry.timestamp  = std::chrono::system_clock::now();
    return entry;
}

}  // namespace

// ---------------------------------------------------------------------------
// Fixture: 임시 로그 파일
// ---------------------------------------------------------------------------
class AuditLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "querygate_test_logs" / unique_name;
        log_file_ = log_dir_ / "audit.log";
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(log_dir_, ec);
    }

    std::vector<std::string> read_log_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        std::string              line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    // 타임스탬프 패턴 이후의 JSON 부분만
    std::vector<std::string> read_json_lines() const {
        std::vector<std::string> lines;
        for (const auto& line : read_log_lines()) {
            const auto json_start = line.find('{');
            if (json_start != std::string::npos) {
                lines.push_back(line.substr(json_start));
            }
        }
        return lines;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// JSON 포맷
// ---------------------------------------------------------------------------
TEST_F(AuditLoggerTest, DecisionJsonFields) {
    AuditLogger logger(LogLevel::kInfo, log_file_, LogFormat::kJson, LogSanitizer{}, false);

    logger.log_decision(make_entry(AuditStatus::kSuccess, "SELECT * FROM customers"));
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(get_string_field(lines[0], "event"), "query_decision");
    EXPECT_EQ(get_string_field(lines[0], "request_id"), "req-42");
    EXPECT_EQ(get_string_field(lines[0], "user_id"), "analyst");
    EXPECT_EQ(get_string_field(lines[0], "status"), "success");
    EXPECT_EQ(get_string_field(lines[0], "operation"), "safe_read");
    EXPECT_EQ(get_string_field(lines[0], "keyword"), "SELECT");
    EXPECT_EQ(get_string_field(lines[0], "code"), "none");
    EXPECT_EQ(get_string_field(lines[0], "sql"), "SELECT * FROM customers");
    EXPECT_NE(lines[0].find("\"revalidation\":false"), std::string::npos);
    EXPECT_NE(lines[0].find("\"timestamp\":\""), std::string::npos);
    EXPECT_EQ(lines[0].find("\"error\""), std::string::npos);
}

TEST_F(AuditLoggerTest, BlockedDecisionIncludesError) {
    AuditLogger logger(LogLevel::kInfo, log_file_, LogFormat::kJson, LogSanitizer{}, false);

    auto entry      = make_entry(AuditStatus::kBlocked, "DROP TABLE orders");
    entry.operation = OperationKind::kDestructiveWrite;
    entry.keyword   = "DROP";
    entry.code      = RejectCode::kDestructiveOperation;
    entry.error     = "Operation 'DROP' is not allowed in READ_ONLY mode";
    logger.log_decision(entry);
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(get_string_field(lines[0], "status"), "blocked");
    EXPECT_EQ(get_string_field(lines[0], "code"), "destructive_operation");
    EXPECT_EQ(get_string_field(lines[0], "error"),
              "Operation 'DROP' is not allowed in READ_ONLY mode");
}

TEST_F(AuditLoggerTest, RawSqlIsSanitizedBeforeWriting) {
    AuditLogger logger(LogLevel::kInfo, log_file_, LogFormat::kJson, LogSanitizer{}, false);

    logger.log_decision(make_entry(AuditStatus::kSuccess,
                                   "SELECT * FROM users WHERE password = 'secret123'"));
    logger.flush();

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].find("secret123"), std::string::npos);
    EXPECT_NE(lines[0].find("***"), std::string::npos);
}

TEST_F(AuditLoggerTest, LongSqlIsTruncated) {
    AuditLogger logger(LogLevel::kInfo, log_file_, LogFormat::kJson, LogSanitizer{}, false);

    std::string sql = "SELECT '";
    sql.append(3000, 'x');
    sql += "'";
    logger.log_decision(make_entry(AuditStatus::kSuccess, sql));
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_LE(get_string_field(lines[0], "sql").size(), 500u);
}

TEST_F(AuditLoggerTest, SqlWithQuotesIsEscaped) {
    AuditLogger logger(LogLevel::kInfo, log_file_, LogFormat::kJson, LogSanitizer{}, false);

    logger.log_decision(make_entry(AuditStatus::kSuccess, "SELECT \"a\"\nFROM t"));
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find(R"(SELECT \"a\"\nFROM t)"), std::string::npos);
}

// ---------------------------------------------------------------------------
// text 포맷
// ---------------------------------------------------------------------------
TEST_F(AuditLoggerTest, TextFormat) {
    AuditLogger logger(LogLevel::kInfo, log_file_, LogFormat::kText, LogSanitizer{}, false);

    auto entry = make_entry(AuditStatus::kApprovalRequired, "DELETE FROM t WHERE api_key = 'k'");
    entry.operation = OperationKind::kDestructiveWrite;
    entry.keyword   = "DELETE";
    logger.log_decision(entry);
    logger.flush();

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("event=query_decision"), std::string::npos);
    EXPECT_NE(lines[0].find("status=approval_required"), std::string::npos);
    EXPECT_NE(lines[0].find("operation=destructive_write"), std::string::npos);
    EXPECT_EQ(lines[0].find("'k'"), std::string::npos);
}

// ---------------------------------------------------------------------------
// 레벨 필터 / 초기화 실패
// ---------------------------------------------------------------------------
TEST_F(AuditLoggerTest, WarnLevelSkipsAllowedDecisions) {
    AuditLogger logger(LogLevel::kWarn, log_file_, LogFormat::kJson, LogSanitizer{}, false);

    logger.log_decision(make_entry(AuditStatus::kSuccess, "SELECT 1"));
    logger.log_decision(make_entry(AuditStatus::kBlocked, "DROP TABLE t"));
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(get_string_field(lines[0], "status"), "blocked");
}

TEST_F(AuditLoggerTest, FormatEntryMatchesWrittenLine) {
    AuditLogger logger(LogLevel::kInfo, log_file_, LogFormat::kJson, LogSanitizer{}, false);
    const auto  entry = make_entry(AuditStatus::kSuccess, "SELECT 1");

    const std::string formatted = logger.format_entry(entry);
    logger.log_decision(entry);
    logger.flush();

    const auto lines = read_json_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], formatted);
}

TEST(AuditLoggerInit, UnwritablePathThrows) {
    EXPECT_THROW(
        AuditLogger(LogLevel::kInfo, "/proc/querygate_no_such_dir/audit.log",
                    LogFormat::kJson, LogSanitizer{}, false),
        std::runtime_error);
}

TEST(LogTypes, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("WARN"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_EQ(parse_log_level("info"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("nonsense"), LogLevel::kInfo);
}

TEST(LogTypes, EscapeJsonString) {
    EXPECT_EQ(escape_json_string(R"(say "hi")"), R"(say \"hi\")");
    EXPECT_EQ(escape_json_string("a\\b"), R"(a\\b)");
    EXPECT_EQ(escape_json_string("line1\nline2\t"), R"(line1\nline2\t)");
    EXPECT_EQ(escape_json_string(std::string("\x01", 1)), R"(\u0001)");
    EXPECT_EQ(escape_json_string("plain"), "plain");
}
