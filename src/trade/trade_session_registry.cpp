#include "trade/trade_session_registry.h"

#include <utility>

namespace trade {

TradeSessionRegistry::Admission TradeSessionRegistry::admit(
    std::shared_ptr<TradeSession> session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_by_user_.count(session->initiator_id) > 0) {
        return Admission::InitiatorBusy;
    }
    if (sessions_by_user_.count(session->target_id) > 0) {
        return Admission::TargetBusy;
    }
    const UserId initiator_id = session->initiator_id;
    const UserId target_id = session->target_id;
    sessions_by_user_.emplace(initiator_id, session);
    sessions_by_user_.emplace(target_id, std::move(session));
    return Admission::Admitted;
}

std::shared_ptr<TradeSession> TradeSessionRegistry::find(UserId user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_by_user_.find(user_id);
    if (it == sessions_by_user_.end()) {
        return nullptr;
    }
    return it->second;
}

bool TradeSessionRegistry::contains(UserId user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_by_user_.count(user_id) > 0;
}

bool TradeSessionRegistry::clear(UserId user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_by_user_.find(user_id);
    if (it == sessions_by_user_.end()) {
        return false;
    }
    auto session = it->second;
    for (UserId participant : {session->initiator_id, session->target_id}) {
        auto entry = sessions_by_user_.find(participant);
        if (entry != sessions_by_user_.end() && entry->second == session) {
            sessions_by_user_.erase(entry);
        }
    }
    return true;
}

std::size_t TradeSessionRegistry::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto &entry : sessions_by_user_) {
        if (entry.first == entry.second->initiator_id) {
            ++count;
        }
    }
    return count;
}

std::vector<std::shared_ptr<TradeSession>> TradeSessionRegistry::sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<TradeSession>> result;
    for (const auto &entry : sessions_by_user_) {
        if (entry.first == entry.second->initiator_id) {
            result.push_back(entry.second);
        }
    }
    return result;
}

}  // namespace trade
