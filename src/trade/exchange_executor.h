#pragma once

#include <optional>
#include <string>
#include <vector>

#include "admin/logging.h"
#include "inventory/currency_store.h"
#include "inventory/inventory_storage.h"
#include "trade/offer_validator.h"
#include "trade/trade_models.h"
#include "trade/undo_ledger.h"

namespace trade {

struct ExchangeOutcome {
    TradeError error{TradeError::None};
    // Participant whose offer went stale or whose inventory blocked delivery.
    UserId blocked_user_id{0};
    std::string message;
    std::vector<std::string> failed_undo_steps;

    bool ok() const { return error == TradeError::None; }
};

// Swaps both offers of a session. The stores have no multi-key
// transaction, so the swap withdraws everything first, then delivers,
// recording each step in an undo ledger that is unwound on failure.
class ExchangeExecutor {
public:
    ExchangeExecutor(inventory::InventoryStore &inventory,
                     inventory::CurrencyStore &currency,
                     const OfferValidator &validator,
                     admin::StructuredLogger &logger);

    ExchangeOutcome execute(const TradeSession &session);

private:
    struct Leg {
        UserId owner_id{0};
        const Offer *offer{nullptr};
        UserId receiver_id{0};
    };

    std::optional<std::string> withdraw(const Leg &leg, UndoLedger &ledger);
    std::optional<std::string> deliver(const Leg &leg, UndoLedger &ledger);
    bool takeBack(UserId receiver,
                  const OfferedItem &item,
                  const std::vector<inventory::SlotChange> &placed);
    ExchangeOutcome abort(const TradeSession &session,
                          UndoLedger &ledger,
                          TradeError error,
                          UserId blocked_user_id,
                          std::string message);

    inventory::InventoryStore &inventory_;
    inventory::CurrencyStore &currency_;
    const OfferValidator &validator_;
    admin::StructuredLogger &logger_;
};

}  // namespace trade
