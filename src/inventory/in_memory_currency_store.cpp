#include "inventory/in_memory_currency_store.h"

#include <algorithm>

namespace inventory {

InMemoryCurrencyStore::InMemoryCurrencyStore(Gold max_gold) : max_gold_(max_gold) {}

Gold InMemoryCurrencyStore::getGold(UserId user_id) const {
    auto it = balances_.find(user_id);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

bool InMemoryCurrencyStore::removeGold(UserId user_id, Gold amount, std::string) {
    if (amount == 0) {
        return true;
    }
    auto it = balances_.find(user_id);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    return true;
}

std::optional<Gold> InMemoryCurrencyStore::addGold(UserId user_id, Gold amount, std::string) {
    auto &balance = balances_[user_id];
    if (amount > max_gold_ - std::min(balance, max_gold_)) {
        return std::nullopt;
    }
    balance += amount;
    return balance;
}

void InMemoryCurrencyStore::setGold(UserId user_id, Gold amount) {
    balances_[user_id] = std::min(amount, max_gold_);
}

Gold InMemoryCurrencyStore::maxGold() const {
    return max_gold_;
}

}  // namespace inventory
