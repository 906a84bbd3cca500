#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "admin/logging.h"
#include "inventory/currency_store.h"
#include "inventory/inventory_storage.h"
#include "player/player_directory.h"
#include "trade/exchange_executor.h"
#include "trade/offer_validator.h"
#include "trade/trade_config.h"
#include "trade/trade_models.h"
#include "trade/trade_notifier.h"
#include "trade/trade_session_registry.h"

namespace trade {

using ReconciliationId = std::uint64_t;

// A swap whose rollback did not finish. Resources may have been
// duplicated or lost and need an operator.
struct ReconciliationRecord {
    ReconciliationId record_id{0};
    std::string trace_id;
    UserId initiator_id{0};
    UserId target_id{0};
    Offer initiator_offer;
    Offer target_offer;
    std::vector<std::string> failed_steps;
    std::chrono::system_clock::time_point recorded_at{};
};

// Player-to-player trade protocol. Calls are expected from the server's
// serialized packet-handling context; the registry may be queried from
// other threads.
class TradeService {
public:
    struct Metrics {
        std::uint64_t sessions_opened{0};
        std::uint64_t trades_completed{0};
        std::uint64_t trades_cancelled{0};
        std::uint64_t commit_failures{0};
        std::uint64_t rollback_failures{0};
    };

    TradeService(inventory::InventoryStore &inventory,
                 inventory::CurrencyStore &currency,
                 const player::PlayerDirectory &directory,
                 TradeNotifier &notifier,
                 TradeSessionRegistry &registry,
                 admin::StructuredLogger &logger,
                 TradeConfig config = TradeConfig{});

    TradeService(const TradeService &) = delete;
    TradeService &operator=(const TradeService &) = delete;

    TradeResult requestTrade(UserId initiator_id,
                             const std::string &target_name,
                             std::chrono::steady_clock::time_point now);
    TradeResult updateOffer(UserId user_id,
                            const OfferEntry &entry,
                            std::chrono::steady_clock::time_point now);
    TradeResult updateOfferFromClient(UserId user_id,
                                      std::int32_t slot,
                                      std::int64_t quantity,
                                      std::chrono::steady_clock::time_point now);
    TradeResult confirm(UserId user_id, std::chrono::steady_clock::time_point now);
    TradeResult ready(UserId user_id, std::chrono::steady_clock::time_point now);
    TradeResult cancel(UserId user_id, std::optional<std::string> reason = std::nullopt);
    TradeResult reject(UserId user_id);

    // Connection lifecycle hook. Returns false if the user was not trading.
    bool handleDisconnect(UserId user_id);
    std::size_t expireIdleSessions(std::chrono::steady_clock::time_point now);

    std::optional<TradeSession> getSession(UserId user_id) const;
    bool isUserInTrade(UserId user_id) const;
    void clearSession(UserId user_id);

    Metrics metrics() const;
    std::size_t activeSessionCount() const;
    std::vector<ReconciliationRecord> pendingReconciliations() const;
    bool resolveReconciliation(ReconciliationId record_id);
    const TradeConfig &config() const;

private:
    TradeResult updateItemOffer(TradeSession &session,
                                UserId user_id,
                                const ItemOffer &request,
                                std::chrono::steady_clock::time_point now);
    TradeResult updateGoldOffer(TradeSession &session,
                                UserId user_id,
                                const GoldOffer &request,
                                std::chrono::steady_clock::time_point now);
    void markOfferChanged(TradeSession &session,
                          UserId user_id,
                          const std::string &own_message,
                          std::chrono::steady_clock::time_point now);
    TradeResult commit(const std::shared_ptr<TradeSession> &session);
    void recordReconciliation(const TradeSession &session, const ExchangeOutcome &outcome);
    void closeSession(TradeSession &session,
                      const std::string &reason,
                      const char *level,
                      const char *event,
                      TextSeverity severity);
    TradeResult fail(UserId user_id, TradeError error, std::string message);

    const player::PlayerDirectory &directory_;
    TradeNotifier &notifier_;
    TradeSessionRegistry &registry_;
    admin::StructuredLogger &logger_;
    TradeConfig config_;
    OfferValidator validator_;
    ExchangeExecutor executor_;
    Metrics metrics_{};
    ReconciliationId next_reconciliation_id_{1};
    std::vector<ReconciliationRecord> reconciliations_;
};

}  // namespace trade
