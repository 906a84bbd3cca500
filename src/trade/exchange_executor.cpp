#include "trade/exchange_executor.h"

#include <array>
#include <sstream>
#include <utility>

namespace trade {
namespace {

constexpr const char *kWithdrawReason = "trade withdraw";
constexpr const char *kDeliverReason = "trade deliver";
constexpr const char *kRollbackReason = "trade rollback";

std::string describeItem(const char *action, UserId user_id, const OfferedItem &item) {
    std::ostringstream out;
    out << action << ' ' << item.quantity << "x item " << item.item_id << " user " << user_id;
    if (item.slot != 0) {
        out << " slot " << item.slot;
    }
    return out.str();
}

std::string describeGold(const char *action, UserId user_id, Gold amount) {
    std::ostringstream out;
    out << action << ' ' << amount << " gold user " << user_id;
    return out.str();
}

}  // namespace

ExchangeExecutor::ExchangeExecutor(inventory::InventoryStore &inventory,
                                   inventory::CurrencyStore &currency,
                                   const OfferValidator &validator,
                                   admin::StructuredLogger &logger)
    : inventory_(inventory), currency_(currency), validator_(validator), logger_(logger) {}

ExchangeOutcome ExchangeExecutor::execute(const TradeSession &session) {
    const std::array<Leg, 2> legs{{
        {session.initiator_id, &session.initiator_offer, session.target_id},
        {session.target_id, &session.target_offer, session.initiator_id},
    }};

    for (const auto &leg : legs) {
        if (auto failure = validator_.revalidate(leg.owner_id, *leg.offer)) {
            ExchangeOutcome outcome;
            outcome.error = TradeError::ValidationStale;
            outcome.blocked_user_id = leg.owner_id;
            outcome.message = session.nameOf(leg.owner_id) + " " + failure->reason + ".";
            return outcome;
        }
    }

    UndoLedger ledger;
    for (const auto &leg : legs) {
        if (auto reason = withdraw(leg, ledger)) {
            return abort(session, ledger, TradeError::ValidationStale, leg.owner_id,
                         session.nameOf(leg.owner_id) + " " + *reason + ".");
        }
    }

    for (const auto &leg : legs) {
        if (auto reason = deliver(leg, ledger)) {
            return abort(session, ledger, TradeError::DeliveryBlocked, leg.receiver_id,
                         session.nameOf(leg.receiver_id) + " " + *reason + ".");
        }
    }

    ledger.commit();
    ExchangeOutcome outcome;
    outcome.message = "Trade completed.";
    return outcome;
}

std::optional<std::string> ExchangeExecutor::withdraw(const Leg &leg, UndoLedger &ledger) {
    const UserId owner = leg.owner_id;
    for (const auto &entry : leg.offer->items) {
        const OfferedItem item = entry.second;
        if (!inventory_.removeItem(owner, item.slot, item.quantity, kWithdrawReason)) {
            return "could not hand over the item from slot " + std::to_string(item.slot);
        }
        ledger.record(describeItem("restore", owner, item), [this, owner, item]() {
            return inventory_.restoreItem(owner, item.slot, item.item_id, item.quantity,
                                          kRollbackReason);
        });
    }

    const Gold gold = leg.offer->gold;
    if (gold > 0) {
        if (!currency_.removeGold(owner, gold, kWithdrawReason)) {
            return std::string("could not hand over the offered gold");
        }
        ledger.record(describeGold("refund", owner, gold), [this, owner, gold]() {
            return currency_.addGold(owner, gold, kRollbackReason).has_value();
        });
    }
    return std::nullopt;
}

std::optional<std::string> ExchangeExecutor::deliver(const Leg &leg, UndoLedger &ledger) {
    const UserId receiver = leg.receiver_id;
    for (const auto &entry : leg.offer->items) {
        OfferedItem item = entry.second;
        item.slot = 0;
        auto placed = inventory_.addItem(receiver, item.item_id, item.quantity, kDeliverReason);
        if (placed.empty()) {
            return std::string("does not have enough inventory space");
        }
        ledger.record(describeItem("take back", receiver, item),
                      [this, receiver, item, placed = std::move(placed)]() {
                          return takeBack(receiver, item, placed);
                      });
    }

    const Gold gold = leg.offer->gold;
    if (gold > 0) {
        if (!currency_.addGold(receiver, gold, kDeliverReason).has_value()) {
            return std::string("cannot hold that much gold");
        }
        ledger.record(describeGold("debit", receiver, gold), [this, receiver, gold]() {
            return currency_.removeGold(receiver, gold, kRollbackReason);
        });
    }
    return std::nullopt;
}

// Reverses one addItem slot by slot, newest slot first. A slot that no
// longer holds what was placed there is settled by item id instead.
bool ExchangeExecutor::takeBack(UserId receiver,
                                const OfferedItem &item,
                                const std::vector<inventory::SlotChange> &placed) {
    Quantity unresolved = 0;
    for (auto it = placed.rbegin(); it != placed.rend(); ++it) {
        auto content = inventory_.getSlot(receiver, it->slot);
        if (!content.has_value() || content->item_id != item.item_id ||
            !inventory_.removeItem(receiver, it->slot, it->added, kRollbackReason)) {
            unresolved += it->added;
        }
    }
    if (unresolved == 0) {
        return true;
    }
    return inventory_.removeItemByItemId(receiver, item.item_id, unresolved, kRollbackReason);
}

ExchangeOutcome ExchangeExecutor::abort(const TradeSession &session,
                                        UndoLedger &ledger,
                                        TradeError error,
                                        UserId blocked_user_id,
                                        std::string message) {
    auto report = ledger.unwind();

    ExchangeOutcome outcome;
    outcome.blocked_user_id = blocked_user_id;
    if (report.clean()) {
        outcome.error = error;
        outcome.message = std::move(message);
        return outcome;
    }

    for (const auto &step : report.failed_steps) {
        admin::LogFields fields;
        fields.trace_id = session.trace_id;
        fields.user_id = session.initiator_id;
        fields.partner_id = session.target_id;
        fields.error = tradeErrorName(error);
        fields.reason = step;
        logger_.log("error", "trade_undo_failed", "Undo step failed", fields);
    }
    outcome.error = TradeError::RollbackFailure;
    outcome.message = "The trade failed and could not be fully reverted. "
                      "An administrator will review your inventory.";
    outcome.failed_undo_steps = std::move(report.failed_steps);
    return outcome;
}

}  // namespace trade
