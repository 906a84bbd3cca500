#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "trade/trade_models.h"

namespace trade {

// Maps each participant to the session they are in. A session is stored
// under both participant ids or under neither.
class TradeSessionRegistry {
public:
    enum class Admission {
        Admitted,
        InitiatorBusy,
        TargetBusy
    };

    Admission admit(std::shared_ptr<TradeSession> session);
    std::shared_ptr<TradeSession> find(UserId user_id) const;
    bool contains(UserId user_id) const;
    bool clear(UserId user_id);

    std::size_t sessionCount() const;
    std::vector<std::shared_ptr<TradeSession>> sessions() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<UserId, std::shared_ptr<TradeSession>> sessions_by_user_;
};

}  // namespace trade
