#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "inventory/currency_store.h"
#include "inventory/inventory_storage.h"
#include "trade/trade_models.h"

namespace trade {

struct ValidationFailure {
    UserId user_id{0};
    TradeError error{TradeError::InvalidOffer};
    std::string reason;
};

// Checks offers against live store state. Offer-time checks answer the
// offering user; commit-time re-validation covers a whole offer.
class OfferValidator {
public:
    OfferValidator(const inventory::InventoryStore &inventory,
                   const inventory::CurrencyStore &currency,
                   std::size_t max_offer_items);

    // On success fills `resolved` with the live item id of the slot.
    std::optional<ValidationFailure> checkItemOffer(UserId user_id,
                                                    const Offer &current,
                                                    SlotIndex slot,
                                                    Quantity quantity,
                                                    OfferedItem &resolved) const;
    std::optional<ValidationFailure> checkGoldOffer(UserId user_id, Gold amount) const;

    std::optional<ValidationFailure> revalidate(UserId user_id, const Offer &offer) const;

private:
    const inventory::InventoryStore &inventory_;
    const inventory::CurrencyStore &currency_;
    std::size_t max_offer_items_;
};

}  // namespace trade
