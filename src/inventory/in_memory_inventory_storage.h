#pragma once

#include <map>
#include <unordered_map>
#include <vector>

#include "inventory/inventory_storage.h"

namespace inventory {

class InMemoryInventoryStore : public InventoryStore {
public:
    explicit InMemoryInventoryStore(SlotIndex slot_count = 20, Quantity max_stack = 20);

    SlotIndex slotCount() const override;

    std::optional<InventorySlot> getSlot(UserId user_id, SlotIndex slot) const override;

    bool removeItem(UserId user_id,
                    SlotIndex slot,
                    Quantity quantity,
                    std::string reason) override;
    std::vector<SlotChange> addItem(UserId user_id,
                                    ItemId item_id,
                                    Quantity quantity,
                                    std::string reason) override;
    bool removeItemByItemId(UserId user_id,
                            ItemId item_id,
                            Quantity quantity,
                            std::string reason) override;
    bool restoreItem(UserId user_id,
                     SlotIndex slot,
                     ItemId item_id,
                     Quantity quantity,
                     std::string reason) override;

    // Seeds a slot directly; used by loaders and tests.
    bool setSlot(UserId user_id, SlotIndex slot, InventorySlot content);

    std::map<SlotIndex, InventorySlot> slots(UserId user_id) const;
    Quantity countItem(UserId user_id, ItemId item_id) const;
    std::vector<InventoryChange> changeLog(UserId user_id) const;

private:
    using SlotMap = std::map<SlotIndex, InventorySlot>;

    bool validSlot(SlotIndex slot) const;
    void recordChange(UserId user_id,
                      SlotIndex slot,
                      ItemId item_id,
                      Quantity quantity,
                      ChangeType type,
                      std::string reason);

    SlotIndex slot_count_;
    Quantity max_stack_;
    ChangeId next_change_id_{1};
    std::unordered_map<UserId, SlotMap> inventories_;
    std::unordered_map<UserId, std::vector<InventoryChange>> change_log_;
};

}  // namespace inventory
