#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "inventory/inventory_models.h"

namespace trade {

using UserId = inventory::UserId;
using SlotIndex = inventory::SlotIndex;
using ItemId = inventory::ItemId;
using Quantity = inventory::Quantity;
using Gold = inventory::Gold;

enum class TradeState : std::uint8_t {
    Pending = 0,
    Active = 1,
    Completed = 2,
    Cancelled = 3
};

enum class TradeError : std::uint8_t {
    None,
    NoSession,
    UserBusy,
    TargetUnavailable,
    SelfTrade,
    InvalidOffer,
    InsufficientGold,
    ValidationStale,
    DeliveryBlocked,
    RollbackFailure
};

const char *tradeStateName(TradeState state);
const char *tradeErrorName(TradeError error);

struct TradeResult {
    bool ok{false};
    TradeError error{TradeError::None};
    std::string message;

    static TradeResult success(std::string message);
    static TradeResult failure(TradeError error, std::string message);
};

struct OfferedItem {
    SlotIndex slot{0};
    ItemId item_id{0};
    Quantity quantity{0};
};

struct Offer {
    std::map<SlotIndex, OfferedItem> items;
    Gold gold{0};

    bool empty() const;
};

// Requested change to one offer entry. Quantity zero clears the entry.
struct ItemOffer {
    SlotIndex slot{0};
    Quantity quantity{0};
};

struct GoldOffer {
    Gold amount{0};
};

using OfferEntry = std::variant<ItemOffer, GoldOffer>;

// Client packets address gold as slot 0. Negative values are refused.
std::optional<OfferEntry> parseClientOffer(std::int32_t slot, std::int64_t quantity);

struct TradeSession {
    UserId initiator_id{0};
    std::string initiator_name;
    UserId target_id{0};
    std::string target_name;
    TradeState state{TradeState::Pending};
    std::chrono::steady_clock::time_point created_at{};
    std::chrono::steady_clock::time_point last_update{};
    bool initiator_confirmed{false};
    bool target_confirmed{false};
    Offer initiator_offer;
    Offer target_offer;
    std::string trace_id;

    bool hasParticipant(UserId user_id) const;
    UserId partnerOf(UserId user_id) const;
    const std::string &nameOf(UserId user_id) const;
    Offer &offerOf(UserId user_id);
    const Offer &offerOf(UserId user_id) const;
    bool &confirmationOf(UserId user_id);
    bool bothConfirmed() const;
    void resetConfirmations();
};

}  // namespace trade
