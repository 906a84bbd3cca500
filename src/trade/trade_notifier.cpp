#include "trade/trade_notifier.h"

#include <utility>

namespace trade {

EventSinkNotifier::EventSinkNotifier(EventSink sink) : event_sink_(std::move(sink)) {}

void EventSinkNotifier::setEventSink(EventSink sink) {
    event_sink_ = std::move(sink);
}

void EventSinkNotifier::sendTradeOpened(UserId user_id, const std::string &partner_name) {
    TradeEvent event;
    event.type = TradeEventType::Opened;
    event.partner_name = partner_name;
    emit(user_id, event);
}

void EventSinkNotifier::sendTradeClosed(UserId user_id, const std::string &reason) {
    TradeEvent event;
    event.type = TradeEventType::Closed;
    event.message = reason;
    emit(user_id, event);
}

void EventSinkNotifier::sendText(UserId user_id,
                                 const std::string &message,
                                 TextSeverity severity) {
    TradeEvent event;
    event.type = TradeEventType::Text;
    event.message = message;
    event.severity = severity;
    emit(user_id, event);
}

void EventSinkNotifier::emit(UserId user_id, const TradeEvent &event) {
    if (!event_sink_) {
        return;
    }
    event_sink_(user_id, event);
}

}  // namespace trade
