#include "trade/trade_models.h"

#include <limits>
#include <utility>

namespace trade {

const char *tradeStateName(TradeState state) {
    switch (state) {
        case TradeState::Pending:
            return "pending";
        case TradeState::Active:
            return "active";
        case TradeState::Completed:
            return "completed";
        case TradeState::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

const char *tradeErrorName(TradeError error) {
    switch (error) {
        case TradeError::None:
            return "none";
        case TradeError::NoSession:
            return "no_session";
        case TradeError::UserBusy:
            return "user_busy";
        case TradeError::TargetUnavailable:
            return "target_unavailable";
        case TradeError::SelfTrade:
            return "self_trade";
        case TradeError::InvalidOffer:
            return "invalid_offer";
        case TradeError::InsufficientGold:
            return "insufficient_gold";
        case TradeError::ValidationStale:
            return "validation_stale";
        case TradeError::DeliveryBlocked:
            return "delivery_blocked";
        case TradeError::RollbackFailure:
            return "rollback_failure";
    }
    return "unknown";
}

TradeResult TradeResult::success(std::string message) {
    return TradeResult{true, TradeError::None, std::move(message)};
}

TradeResult TradeResult::failure(TradeError error, std::string message) {
    return TradeResult{false, error, std::move(message)};
}

bool Offer::empty() const {
    return items.empty() && gold == 0;
}

std::optional<OfferEntry> parseClientOffer(std::int32_t slot, std::int64_t quantity) {
    if (slot < 0 || quantity < 0) {
        return std::nullopt;
    }
    if (slot == 0) {
        return OfferEntry{GoldOffer{static_cast<Gold>(quantity)}};
    }
    if (slot > std::numeric_limits<SlotIndex>::max() ||
        quantity > std::numeric_limits<Quantity>::max()) {
        return std::nullopt;
    }
    return OfferEntry{ItemOffer{static_cast<SlotIndex>(slot), static_cast<Quantity>(quantity)}};
}

bool TradeSession::hasParticipant(UserId user_id) const {
    return user_id == initiator_id || user_id == target_id;
}

UserId TradeSession::partnerOf(UserId user_id) const {
    return user_id == initiator_id ? target_id : initiator_id;
}

const std::string &TradeSession::nameOf(UserId user_id) const {
    return user_id == initiator_id ? initiator_name : target_name;
}

Offer &TradeSession::offerOf(UserId user_id) {
    return user_id == initiator_id ? initiator_offer : target_offer;
}

const Offer &TradeSession::offerOf(UserId user_id) const {
    return user_id == initiator_id ? initiator_offer : target_offer;
}

bool &TradeSession::confirmationOf(UserId user_id) {
    return user_id == initiator_id ? initiator_confirmed : target_confirmed;
}

bool TradeSession::bothConfirmed() const {
    return initiator_confirmed && target_confirmed;
}

void TradeSession::resetConfirmations() {
    initiator_confirmed = false;
    target_confirmed = false;
}

}  // namespace trade
