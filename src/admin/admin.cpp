#include "admin/admin.h"

namespace admin {

TradeAdminService::TradeAdminService(trade::TradeService &trade_service, StructuredLogger &logger)
    : trade_service_(trade_service), logger_(logger) {}

TradeAdminStatus TradeAdminService::getStatus() const {
    TradeAdminStatus status;
    auto metrics = trade_service_.metrics();
    status.active_sessions = trade_service_.activeSessionCount();
    status.sessions_opened = metrics.sessions_opened;
    status.trades_completed = metrics.trades_completed;
    status.trades_cancelled = metrics.trades_cancelled;
    status.commit_failures = metrics.commit_failures;
    status.rollback_failures = metrics.rollback_failures;
    status.pending_reconciliations = trade_service_.pendingReconciliations().size();

    LogFields fields;
    fields.request_trace_id = StructuredLogger::generateTraceId();
    logger_.log("info", "admin_trade_status", "Admin trade status requested", fields);

    return status;
}

bool TradeAdminService::forceCancelTrade(trade::UserId user_id, const std::string &reason) {
    LogFields fields;
    fields.request_trace_id = StructuredLogger::generateTraceId();
    fields.user_id = user_id;
    fields.reason = reason;

    auto session = trade_service_.getSession(user_id);
    if (!session) {
        logger_.log("warn", "admin_force_cancel", "Trade session not found", fields);
        return false;
    }

    fields.trace_id = session->trace_id;
    logger_.log("info", "admin_force_cancel", "Admin cancelling trade session", fields);
    return trade_service_.cancel(user_id, "Trade cancelled by an administrator: " + reason).ok;
}

std::vector<trade::ReconciliationRecord> TradeAdminService::pendingReconciliations() const {
    return trade_service_.pendingReconciliations();
}

bool TradeAdminService::resolveReconciliation(trade::ReconciliationId record_id,
                                              const std::string &note) {
    LogFields fields;
    fields.request_trace_id = StructuredLogger::generateTraceId();
    fields.reason = note;
    if (!trade_service_.resolveReconciliation(record_id)) {
        logger_.log("warn", "admin_reconciliation_resolve", "Reconciliation record not found",
                    fields);
        return false;
    }
    logger_.log("info", "admin_reconciliation_resolve", "Reconciliation record resolved",
                fields);
    return true;
}

}  // namespace admin
