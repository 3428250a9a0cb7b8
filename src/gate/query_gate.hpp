#pragma once

// ---------------------------------------------------------------------------
// query_gate.hpp
//
// 호출자 측 3분기 처리: Verdict → success / approval_required / blocked.
// validator 는 is_valid/error/suggestion 만 반환하고, 이 클래스가 분기와
// 감사 로그 기록을 담당한다. SQL 실행 자체는 하지 않는다.
//
// [실행 직전 재검증]
// 사람이 승인한 시점과 실제 실행 시점 사이에 오버라이드 플래그가 바뀔 수 있다.
// confirm() 은 환경변수로부터 정책을 "지금" 다시 해석하여 같은 SQL 을 재검증한다.
// 재검증에서 차단되면 승인 여부와 무관하게 실행하지 않는다.
//
// [승인 필요 조건]
// - GateOptions::require_approval == true 이고 판정이 허용인 경우
// - 파괴적 구문이 admin_override 덕분에만 통과한 경우 (read_only == true)
// ---------------------------------------------------------------------------

#include <memory>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "config/gate_config.hpp"
#include "logger/audit_logger.hpp"
#include "logger/log_types.hpp"
#include "policy/policy_resolver.hpp"
#include "validator/sql_validator.hpp"

// ---------------------------------------------------------------------------
// GateOutcome
//   3분기 결과 + 근거 Verdict.
// ---------------------------------------------------------------------------
struct GateOutcome {
    AuditStatus status{AuditStatus::kBlocked};
    Verdict     verdict{};
};

// ---------------------------------------------------------------------------
// RequestContext
//   감사 로그용 요청 식별 정보.
// ---------------------------------------------------------------------------
struct RequestContext {
    std::string request_id{};
    std::string user_id{};
};

class QueryGate {
public:
    // logger 가 nullptr 이면 감사 로그를 남기지 않는다.
    QueryGate(SqlValidator                 validator,
              PolicyResolver               resolver,
              GateOptions                  options,
              std::shared_ptr<AuditLogger> logger);

    ~QueryGate() = default;

    QueryGate(const QueryGate&)            = delete;
    QueryGate& operator=(const QueryGate&) = delete;
    QueryGate(QueryGate&&)                 = default;
    QueryGate& operator=(QueryGate&&)      = default;

    // review
    //   생성된 SQL 을 처음 검토한다. policy 는 호출자가 경계에서 해석한 값.
    [[nodiscard]] GateOutcome review(std::string_view      sql,
                                     const PolicyContext&  policy,
                                     const RequestContext& request = {}) const;

    // review
    //   정책을 환경변수에서 새로 해석하여 검토한다.
    [[nodiscard]] GateOutcome review(std::string_view      sql,
                                     const RequestContext& request = {}) const;

    // confirm
    //   승인된(또는 승인이 필요 없던) SQL 을 실행 직전에 재검증한다.
    //   반환 status 는 kSuccess 또는 kBlocked 뿐이다.
    [[nodiscard]] GateOutcome confirm(std::string_view      sql,
                                      const RequestContext& request = {}) const;

private:
    void audit(std::string_view      sql,
               const GateOutcome&    outcome,
               const RequestContext& request,
               bool                  revalidation) const;

    SqlValidator                 validator_;
    PolicyResolver               resolver_;
    GateOptions                  options_;
    std::shared_ptr<AuditLogger> logger_;
};
