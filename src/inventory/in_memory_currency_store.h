#pragma once

#include <limits>
#include <unordered_map>

#include "inventory/currency_store.h"

namespace inventory {

class InMemoryCurrencyStore : public CurrencyStore {
public:
    explicit InMemoryCurrencyStore(Gold max_gold = std::numeric_limits<Gold>::max());

    Gold getGold(UserId user_id) const override;
    bool removeGold(UserId user_id, Gold amount, std::string reason) override;
    std::optional<Gold> addGold(UserId user_id, Gold amount, std::string reason) override;

    void setGold(UserId user_id, Gold amount);
    Gold maxGold() const;

private:
    Gold max_gold_;
    std::unordered_map<UserId, Gold> balances_;
};

}  // namespace inventory
