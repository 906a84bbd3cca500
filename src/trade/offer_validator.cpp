#include "trade/offer_validator.h"

#include <utility>

namespace trade {
namespace {

ValidationFailure makeFailure(UserId user_id, TradeError error, std::string reason) {
    ValidationFailure failure;
    failure.user_id = user_id;
    failure.error = error;
    failure.reason = std::move(reason);
    return failure;
}

}  // namespace

OfferValidator::OfferValidator(const inventory::InventoryStore &inventory,
                               const inventory::CurrencyStore &currency,
                               std::size_t max_offer_items)
    : inventory_(inventory), currency_(currency), max_offer_items_(max_offer_items) {}

std::optional<ValidationFailure> OfferValidator::checkItemOffer(UserId user_id,
                                                                const Offer &current,
                                                                SlotIndex slot,
                                                                Quantity quantity,
                                                                OfferedItem &resolved) const {
    if (slot == 0 || slot > inventory_.slotCount()) {
        return makeFailure(user_id, TradeError::InvalidOffer, "Invalid inventory slot.");
    }
    if (quantity == 0) {
        return makeFailure(user_id, TradeError::InvalidOffer, "The quantity must be positive.");
    }

    auto content = inventory_.getSlot(user_id, slot);
    if (!content.has_value() || content->quantity == 0) {
        return makeFailure(user_id, TradeError::InvalidOffer, "The selected slot is empty.");
    }
    if (quantity > content->quantity) {
        return makeFailure(user_id, TradeError::InvalidOffer,
                           "You do not have that quantity in the slot.");
    }

    auto existing = current.items.find(slot);
    if (existing != current.items.end()) {
        if (existing->second.item_id != content->item_id) {
            return makeFailure(user_id, TradeError::InvalidOffer,
                               "That slot already holds a different offer.");
        }
    } else if (current.items.size() >= max_offer_items_) {
        return makeFailure(user_id, TradeError::InvalidOffer,
                           "You cannot offer more than " + std::to_string(max_offer_items_) +
                               " different items.");
    }

    resolved.slot = slot;
    resolved.item_id = content->item_id;
    resolved.quantity = quantity;
    return std::nullopt;
}

std::optional<ValidationFailure> OfferValidator::checkGoldOffer(UserId user_id,
                                                                Gold amount) const {
    if (amount > currency_.getGold(user_id)) {
        return makeFailure(user_id, TradeError::InsufficientGold, "You do not have that much gold.");
    }
    return std::nullopt;
}

std::optional<ValidationFailure> OfferValidator::revalidate(UserId user_id,
                                                            const Offer &offer) const {
    for (const auto &entry : offer.items) {
        const auto &item = entry.second;
        auto content = inventory_.getSlot(user_id, item.slot);
        if (!content.has_value()) {
            return makeFailure(user_id, TradeError::ValidationStale,
                               "no longer has the item from slot " + std::to_string(item.slot));
        }
        if (content->item_id != item.item_id || content->quantity < item.quantity) {
            return makeFailure(user_id, TradeError::ValidationStale,
                               "changed the contents of slot " + std::to_string(item.slot));
        }
    }

    if (offer.gold > currency_.getGold(user_id)) {
        return makeFailure(user_id, TradeError::ValidationStale,
                           "no longer has the offered gold");
    }
    return std::nullopt;
}

}  // namespace trade
