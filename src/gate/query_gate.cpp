#include "gate/query_gate.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

QueryGate::QueryGate(SqlValidator                 validator,
                     PolicyResolver               resolver,
                     GateOptions                  options,
                     std::shared_ptr<AuditLogger> logger)
    : validator_(std::move(validator))
    , resolver_(std::move(resolver))
    , options_(options)
    , logger_(std::move(logger))
{}

GateOutcome QueryGate::review(std::string_view      sql,
                              const PolicyContext&  policy,
                              const RequestContext& request) const {
    GateOutcome outcome;
    outcome.verdict = validator_.validate(sql, policy);

    if (!outcome.verdict.is_valid) {
        outcome.status = AuditStatus::kBlocked;
    } else {
        // 오버라이드로만 통과한 파괴적 구문은 항상 사람 확인을 거친다
        const bool override_only = outcome.verdict.is_destructive && policy.read_only;
        outcome.status = (options_.require_approval || override_only)
            ? AuditStatus::kApprovalRequired
            : AuditStatus::kSuccess;
    }

    audit(sql, outcome, request, false);
    return outcome;
}

GateOutcome QueryGate::review(std::string_view sql, const RequestContext& request) const {
    return review(sql, resolver_.resolve_from_env(), request);
}

GateOutcome QueryGate::confirm(std::string_view sql, const RequestContext& request) const {
    GateOutcome outcome;
    outcome.verdict = validator_.validate(sql, resolver_.resolve_from_env());
    outcome.status  = outcome.verdict.is_valid ? AuditStatus::kSuccess : AuditStatus::kBlocked;

    if (!outcome.verdict.is_valid) {
        spdlog::warn("query_gate: request '{}' blocked on revalidation before execution",
                     request.request_id);
    }

    audit(sql, outcome, request, true);
    return outcome;
}

void QueryGate::audit(std::string_view      sql,
                      const GateOutcome&    outcome,
                      const RequestContext& request,
                      bool                  revalidation) const {
    if (!logger_) {
        return;
    }
    AuditLog entry;
    entry.request_id   = request.request_id;
    entry.user_id      = request.user_id;
    entry.raw_sql      = std::string(sql);
    entry.status       = outcome.status;
    entry.operation    = outcome.verdict.operation.kind;
    entry.keyword      = outcome.verdict.operation.keyword;
    entry.code         = outcome.verdict.code;
    entry.error        = outcome.verdict.error;
    entry.revalidation = revalidation;
    entry.timestamp    = std::chrono::system_clock::now();
    logger_->log_decision(entry);
}
