#pragma once

#include <optional>
#include <string>
#include <vector>

#include "inventory/inventory_models.h"

namespace inventory {

// Per-user slot storage. Every call touches a single key; there is no
// way to group calls into a transaction.
class InventoryStore {
public:
    virtual ~InventoryStore() = default;

    virtual SlotIndex slotCount() const = 0;

    virtual std::optional<InventorySlot> getSlot(UserId user_id, SlotIndex slot) const = 0;

    virtual bool removeItem(UserId user_id,
                            SlotIndex slot,
                            Quantity quantity,
                            std::string reason) = 0;

    // Empty result means nothing was added.
    virtual std::vector<SlotChange> addItem(UserId user_id,
                                            ItemId item_id,
                                            Quantity quantity,
                                            std::string reason) = 0;

    virtual bool removeItemByItemId(UserId user_id,
                                    ItemId item_id,
                                    Quantity quantity,
                                    std::string reason) = 0;

    // Puts quantity back into a specific slot. Fails if the slot holds a
    // different item or the stack would overflow.
    virtual bool restoreItem(UserId user_id,
                             SlotIndex slot,
                             ItemId item_id,
                             Quantity quantity,
                             std::string reason) = 0;
};

}  // namespace inventory
