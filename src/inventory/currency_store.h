#pragma once

#include <optional>
#include <string>

#include "inventory/inventory_models.h"

namespace inventory {

class CurrencyStore {
public:
    virtual ~CurrencyStore() = default;

    virtual Gold getGold(UserId user_id) const = 0;
    virtual bool removeGold(UserId user_id, Gold amount, std::string reason) = 0;

    // Returns the new balance, or nullopt if the credit was refused.
    virtual std::optional<Gold> addGold(UserId user_id, Gold amount, std::string reason) = 0;
};

}  // namespace inventory
