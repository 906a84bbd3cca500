#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "trade/trade_models.h"

namespace trade {

enum class TextSeverity : std::uint8_t {
    Info,
    Warning,
    Error
};

// All user-visible feedback of the trade protocol goes through here.
class TradeNotifier {
public:
    virtual ~TradeNotifier() = default;

    virtual void sendTradeOpened(UserId user_id, const std::string &partner_name) = 0;
    virtual void sendTradeClosed(UserId user_id, const std::string &reason) = 0;
    virtual void sendText(UserId user_id, const std::string &message, TextSeverity severity) = 0;
};

enum class TradeEventType : std::uint16_t {
    Opened = 1,
    Closed = 2,
    Text = 3
};

struct TradeEvent {
    TradeEventType type{TradeEventType::Text};
    std::string partner_name;
    std::string message;
    TextSeverity severity{TextSeverity::Info};
};

class EventSinkNotifier : public TradeNotifier {
public:
    using EventSink = std::function<void(UserId, const TradeEvent &event)>;

    EventSinkNotifier() = default;
    explicit EventSinkNotifier(EventSink sink);

    void setEventSink(EventSink sink);

    void sendTradeOpened(UserId user_id, const std::string &partner_name) override;
    void sendTradeClosed(UserId user_id, const std::string &reason) override;
    void sendText(UserId user_id, const std::string &message, TextSeverity severity) override;

private:
    void emit(UserId user_id, const TradeEvent &event);

    EventSink event_sink_;
};

}  // namespace trade
