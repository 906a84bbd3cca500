#include "trade/trade_service.h"

#include <algorithm>
#include <limits>
#include <sstream>
#include <utility>
#include <variant>

namespace trade {
namespace {

constexpr const char *kNoSessionMessage = "You do not have an active trade.";

admin::LogFields sessionFields(const TradeSession &session) {
    admin::LogFields fields;
    fields.trace_id = session.trace_id;
    fields.user_id = session.initiator_id;
    fields.partner_id = session.target_id;
    return fields;
}

std::string joinSteps(const std::vector<std::string> &steps) {
    std::ostringstream out;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (i > 0) {
            out << "; ";
        }
        out << steps[i];
    }
    return out.str();
}

}  // namespace

TradeService::TradeService(inventory::InventoryStore &inventory,
                           inventory::CurrencyStore &currency,
                           const player::PlayerDirectory &directory,
                           TradeNotifier &notifier,
                           TradeSessionRegistry &registry,
                           admin::StructuredLogger &logger,
                           TradeConfig config)
    : directory_(directory),
      notifier_(notifier),
      registry_(registry),
      logger_(logger),
      config_(config),
      validator_(inventory, currency, config.max_offer_items),
      executor_(inventory, currency, validator_, logger) {}

TradeResult TradeService::requestTrade(UserId initiator_id,
                                       const std::string &target_name,
                                       std::chrono::steady_clock::time_point now) {
    admin::LogFields fields;
    fields.user_id = initiator_id;

    auto target_id = directory_.findUserByName(target_name);
    if (!target_id.has_value()) {
        fields.error = tradeErrorName(TradeError::TargetUnavailable);
        logger_.log("warn", "trade_request_rejected", "Trade target not online", fields);
        return fail(initiator_id, TradeError::TargetUnavailable,
                    "User '" + target_name + "' is not online.");
    }
    fields.partner_id = *target_id;
    if (*target_id == initiator_id) {
        fields.error = tradeErrorName(TradeError::SelfTrade);
        logger_.log("warn", "trade_request_rejected", "Trade with self refused", fields);
        return fail(initiator_id, TradeError::SelfTrade, "You cannot trade with yourself.");
    }

    auto session = std::make_shared<TradeSession>();
    session->initiator_id = initiator_id;
    session->initiator_name = directory_.displayName(initiator_id);
    session->target_id = *target_id;
    session->target_name = directory_.displayName(*target_id);
    session->state = TradeState::Pending;
    session->created_at = now;
    session->last_update = now;
    session->trace_id = admin::StructuredLogger::generateTraceId();

    switch (registry_.admit(session)) {
        case TradeSessionRegistry::Admission::InitiatorBusy:
            fields.error = tradeErrorName(TradeError::UserBusy);
            logger_.log("warn", "trade_request_rejected", "Initiator already trading", fields);
            return fail(initiator_id, TradeError::UserBusy, "You already have an open trade.");
        case TradeSessionRegistry::Admission::TargetBusy:
            fields.error = tradeErrorName(TradeError::UserBusy);
            logger_.log("warn", "trade_request_rejected", "Target already trading", fields);
            return fail(initiator_id, TradeError::UserBusy,
                        session->target_name + " is already trading.");
        case TradeSessionRegistry::Admission::Admitted:
            break;
    }
    ++metrics_.sessions_opened;

    notifier_.sendTradeOpened(session->initiator_id, session->target_name);
    notifier_.sendText(session->initiator_id,
                       "You started a trade with " + session->target_name + ".",
                       TextSeverity::Info);
    notifier_.sendTradeOpened(session->target_id, session->initiator_name);
    notifier_.sendText(session->target_id,
                       session->initiator_name + " wants to trade with you.",
                       TextSeverity::Info);

    logger_.log("info", "trade_opened", "Trade session opened", sessionFields(*session));
    return TradeResult::success("Trade request sent to " + session->target_name + ".");
}

TradeResult TradeService::updateOffer(UserId user_id,
                                      const OfferEntry &entry,
                                      std::chrono::steady_clock::time_point now) {
    auto session = registry_.find(user_id);
    if (!session) {
        return fail(user_id, TradeError::NoSession, kNoSessionMessage);
    }
    if (const auto *item = std::get_if<ItemOffer>(&entry)) {
        return updateItemOffer(*session, user_id, *item, now);
    }
    return updateGoldOffer(*session, user_id, std::get<GoldOffer>(entry), now);
}

TradeResult TradeService::updateOfferFromClient(UserId user_id,
                                                std::int32_t slot,
                                                std::int64_t quantity,
                                                std::chrono::steady_clock::time_point now) {
    if (!registry_.contains(user_id)) {
        return fail(user_id, TradeError::NoSession, kNoSessionMessage);
    }
    auto entry = parseClientOffer(slot, quantity);
    if (!entry.has_value()) {
        if (slot < 0 || slot > std::numeric_limits<SlotIndex>::max()) {
            return fail(user_id, TradeError::InvalidOffer, "Invalid inventory slot.");
        }
        if (quantity < 0) {
            return fail(user_id, TradeError::InvalidOffer, "The quantity must be positive.");
        }
        return fail(user_id, TradeError::InvalidOffer,
                    "You do not have that quantity in the slot.");
    }
    return updateOffer(user_id, *entry, now);
}

TradeResult TradeService::confirm(UserId user_id, std::chrono::steady_clock::time_point now) {
    auto session = registry_.find(user_id);
    if (!session) {
        return fail(user_id, TradeError::NoSession, kNoSessionMessage);
    }

    bool &confirmed = session->confirmationOf(user_id);
    if (confirmed) {
        return TradeResult::success("You already confirmed the trade.");
    }
    confirmed = true;
    session->last_update = now;
    session->state = TradeState::Active;

    const UserId partner_id = session->partnerOf(user_id);
    notifier_.sendText(user_id, "You are ready to trade.", TextSeverity::Info);
    if (!session->bothConfirmed()) {
        notifier_.sendText(partner_id, session->nameOf(user_id) + " is ready to trade.",
                           TextSeverity::Info);
        return TradeResult::success("Confirmation registered.");
    }
    return commit(session);
}

TradeResult TradeService::ready(UserId user_id, std::chrono::steady_clock::time_point now) {
    return confirm(user_id, now);
}

TradeResult TradeService::cancel(UserId user_id, std::optional<std::string> reason) {
    auto session = registry_.find(user_id);
    if (!session) {
        return fail(user_id, TradeError::NoSession, kNoSessionMessage);
    }
    const std::string message = reason.value_or("The trade was cancelled.");
    closeSession(*session, message, "info", "trade_cancelled", TextSeverity::Warning);
    return TradeResult::success(message);
}

TradeResult TradeService::reject(UserId user_id) {
    return cancel(user_id, std::string("Trade rejected."));
}

bool TradeService::handleDisconnect(UserId user_id) {
    auto session = registry_.find(user_id);
    if (!session) {
        return false;
    }
    closeSession(*session, session->nameOf(user_id) + " disconnected.", "warn",
                 "trade_disconnected", TextSeverity::Warning);
    return true;
}

std::size_t TradeService::expireIdleSessions(std::chrono::steady_clock::time_point now) {
    if (config_.idle_timeout <= std::chrono::milliseconds::zero()) {
        return 0;
    }
    std::size_t expired = 0;
    for (const auto &session : registry_.sessions()) {
        if (now - session->last_update > config_.idle_timeout) {
            closeSession(*session, "The trade expired.", "warn", "trade_expired",
                         TextSeverity::Warning);
            ++expired;
        }
    }
    return expired;
}

std::optional<TradeSession> TradeService::getSession(UserId user_id) const {
    auto session = registry_.find(user_id);
    if (!session) {
        return std::nullopt;
    }
    return *session;
}

bool TradeService::isUserInTrade(UserId user_id) const {
    return registry_.contains(user_id);
}

void TradeService::clearSession(UserId user_id) {
    registry_.clear(user_id);
}

TradeService::Metrics TradeService::metrics() const {
    return metrics_;
}

std::size_t TradeService::activeSessionCount() const {
    return registry_.sessionCount();
}

std::vector<ReconciliationRecord> TradeService::pendingReconciliations() const {
    return reconciliations_;
}

bool TradeService::resolveReconciliation(ReconciliationId record_id) {
    auto it = std::find_if(reconciliations_.begin(), reconciliations_.end(),
                           [record_id](const ReconciliationRecord &record) {
                               return record.record_id == record_id;
                           });
    if (it == reconciliations_.end()) {
        return false;
    }
    reconciliations_.erase(it);
    return true;
}

const TradeConfig &TradeService::config() const {
    return config_;
}

TradeResult TradeService::updateItemOffer(TradeSession &session,
                                          UserId user_id,
                                          const ItemOffer &request,
                                          std::chrono::steady_clock::time_point now) {
    auto &offer = session.offerOf(user_id);
    if (request.quantity == 0) {
        offer.items.erase(request.slot);
        markOfferChanged(session, user_id,
                         "You removed the offer from slot " + std::to_string(request.slot) + ".",
                         now);
        return TradeResult::success("Offer updated.");
    }

    OfferedItem resolved;
    if (auto failure =
            validator_.checkItemOffer(user_id, offer, request.slot, request.quantity, resolved)) {
        return fail(user_id, failure->error, failure->reason);
    }
    offer.items[request.slot] = resolved;

    auto fields = sessionFields(session);
    fields.user_id = user_id;
    fields.partner_id = session.partnerOf(user_id);
    fields.item_id = resolved.item_id;
    fields.slot = resolved.slot;
    fields.quantity = resolved.quantity;
    logger_.log("info", "trade_offer_updated", "Item offer updated", fields);

    markOfferChanged(session, user_id,
                     "You offer " + std::to_string(resolved.quantity) +
                         " unit(s) of the item in slot " + std::to_string(resolved.slot) + ".",
                     now);
    return TradeResult::success("Offer updated.");
}

TradeResult TradeService::updateGoldOffer(TradeSession &session,
                                          UserId user_id,
                                          const GoldOffer &request,
                                          std::chrono::steady_clock::time_point now) {
    if (request.amount > 0) {
        if (auto failure = validator_.checkGoldOffer(user_id, request.amount)) {
            return fail(user_id, failure->error, failure->reason);
        }
    }
    session.offerOf(user_id).gold = request.amount;

    auto fields = sessionFields(session);
    fields.user_id = user_id;
    fields.partner_id = session.partnerOf(user_id);
    fields.gold = request.amount;
    logger_.log("info", "trade_offer_updated", "Gold offer updated", fields);

    markOfferChanged(session, user_id,
                     request.amount == 0
                         ? std::string("You removed the gold offer.")
                         : "You offer " + std::to_string(request.amount) + " gold.",
                     now);
    return TradeResult::success("Gold offer updated.");
}

void TradeService::markOfferChanged(TradeSession &session,
                                    UserId user_id,
                                    const std::string &own_message,
                                    std::chrono::steady_clock::time_point now) {
    session.resetConfirmations();
    session.state = TradeState::Pending;
    session.last_update = now;
    notifier_.sendText(user_id, own_message, TextSeverity::Info);
    notifier_.sendText(session.partnerOf(user_id),
                       session.nameOf(user_id) + " changed their offer.", TextSeverity::Info);
}

TradeResult TradeService::commit(const std::shared_ptr<TradeSession> &session) {
    auto outcome = executor_.execute(*session);
    auto fields = sessionFields(*session);

    if (outcome.ok()) {
        session->state = TradeState::Completed;
        ++metrics_.trades_completed;
        for (UserId participant : {session->initiator_id, session->target_id}) {
            notifier_.sendText(participant, outcome.message, TextSeverity::Info);
            notifier_.sendTradeClosed(participant, outcome.message);
        }
        registry_.clear(session->initiator_id);
        fields.gold = session->initiator_offer.gold + session->target_offer.gold;
        logger_.log("info", "trade_completed", "Trade completed", fields);
        return TradeResult::success(outcome.message);
    }

    fields.error = tradeErrorName(outcome.error);
    fields.reason = outcome.message;

    if (outcome.error == TradeError::RollbackFailure) {
        ++metrics_.rollback_failures;
        recordReconciliation(*session, outcome);
        fields.reason = joinSteps(outcome.failed_undo_steps);
        logger_.log("fatal", "trade_rollback_failed",
                    "Trade rollback incomplete, manual reconciliation required", fields);
        closeSession(*session, outcome.message, "error", "trade_aborted", TextSeverity::Error);
        return TradeResult::failure(outcome.error, outcome.message);
    }

    ++metrics_.commit_failures;
    session->resetConfirmations();
    for (UserId participant : {session->initiator_id, session->target_id}) {
        notifier_.sendText(participant, outcome.message, TextSeverity::Error);
    }
    logger_.log("warn", "trade_commit_failed", "Trade commit failed", fields);
    return TradeResult::failure(outcome.error, outcome.message);
}

void TradeService::recordReconciliation(const TradeSession &session,
                                        const ExchangeOutcome &outcome) {
    ReconciliationRecord record;
    record.record_id = next_reconciliation_id_++;
    record.trace_id = session.trace_id;
    record.initiator_id = session.initiator_id;
    record.target_id = session.target_id;
    record.initiator_offer = session.initiator_offer;
    record.target_offer = session.target_offer;
    record.failed_steps = outcome.failed_undo_steps;
    record.recorded_at = std::chrono::system_clock::now();
    reconciliations_.push_back(std::move(record));
}

void TradeService::closeSession(TradeSession &session,
                                const std::string &reason,
                                const char *level,
                                const char *event,
                                TextSeverity severity) {
    session.state = TradeState::Cancelled;
    ++metrics_.trades_cancelled;
    for (UserId participant : {session.initiator_id, session.target_id}) {
        notifier_.sendTradeClosed(participant, reason);
        notifier_.sendText(participant, reason, severity);
    }
    registry_.clear(session.initiator_id);

    auto fields = sessionFields(session);
    fields.reason = reason;
    logger_.log(level, event, "Trade session closed", fields);
}

TradeResult TradeService::fail(UserId user_id, TradeError error, std::string message) {
    notifier_.sendText(user_id, message, TextSeverity::Error);
    return TradeResult::failure(error, std::move(message));
}

}  // namespace trade
