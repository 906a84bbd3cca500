#pragma once

#include "admin/logging.h"
#include "trade/trade_service.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace admin {

struct TradeAdminStatus {
    std::size_t active_sessions{0};
    std::uint64_t sessions_opened{0};
    std::uint64_t trades_completed{0};
    std::uint64_t trades_cancelled{0};
    std::uint64_t commit_failures{0};
    std::uint64_t rollback_failures{0};
    std::size_t pending_reconciliations{0};
};

class TradeAdminService {
public:
    TradeAdminService(trade::TradeService &trade_service, StructuredLogger &logger);

    TradeAdminStatus getStatus() const;
    bool forceCancelTrade(trade::UserId user_id, const std::string &reason);

    std::vector<trade::ReconciliationRecord> pendingReconciliations() const;
    bool resolveReconciliation(trade::ReconciliationId record_id, const std::string &note);

private:
    trade::TradeService &trade_service_;
    StructuredLogger &logger_;
};

}  // namespace admin
