#include "inventory/in_memory_inventory_storage.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <utility>

namespace inventory {

InMemoryInventoryStore::InMemoryInventoryStore(SlotIndex slot_count, Quantity max_stack)
    : slot_count_(slot_count), max_stack_(max_stack) {}

SlotIndex InMemoryInventoryStore::slotCount() const {
    return slot_count_;
}

std::optional<InventorySlot> InMemoryInventoryStore::getSlot(UserId user_id,
                                                             SlotIndex slot) const {
    auto user_it = inventories_.find(user_id);
    if (user_it == inventories_.end()) {
        return std::nullopt;
    }
    auto slot_it = user_it->second.find(slot);
    if (slot_it == user_it->second.end()) {
        return std::nullopt;
    }
    return slot_it->second;
}

bool InMemoryInventoryStore::removeItem(UserId user_id,
                                        SlotIndex slot,
                                        Quantity quantity,
                                        std::string reason) {
    if (quantity == 0 || !validSlot(slot)) {
        return false;
    }

    auto user_it = inventories_.find(user_id);
    if (user_it == inventories_.end()) {
        return false;
    }
    auto &inventory = user_it->second;
    auto it = inventory.find(slot);
    if (it == inventory.end() || it->second.quantity < quantity) {
        return false;
    }

    const ItemId item_id = it->second.item_id;
    it->second.quantity -= quantity;
    if (it->second.quantity == 0) {
        inventory.erase(it);
    }
    recordChange(user_id, slot, item_id, quantity, ChangeType::Remove, std::move(reason));
    return true;
}

std::vector<SlotChange> InMemoryInventoryStore::addItem(UserId user_id,
                                                        ItemId item_id,
                                                        Quantity quantity,
                                                        std::string reason) {
    if (quantity == 0 || item_id == 0 || max_stack_ == 0) {
        return {};
    }

    auto &inventory = inventories_[user_id];

    // Plan the whole placement first so a full inventory changes nothing.
    std::vector<std::pair<SlotIndex, Quantity>> plan;
    Quantity remaining = quantity;
    for (const auto &[slot, content] : inventory) {
        if (remaining == 0) {
            break;
        }
        if (content.item_id != item_id || content.quantity >= max_stack_) {
            continue;
        }
        const Quantity take = std::min<Quantity>(max_stack_ - content.quantity, remaining);
        plan.emplace_back(slot, take);
        remaining -= take;
    }
    for (std::uint32_t slot = 1; slot <= slot_count_ && remaining > 0; ++slot) {
        if (inventory.count(static_cast<SlotIndex>(slot)) > 0) {
            continue;
        }
        const Quantity take = std::min<Quantity>(max_stack_, remaining);
        plan.emplace_back(static_cast<SlotIndex>(slot), take);
        remaining -= take;
    }
    if (remaining > 0) {
        return {};
    }

    std::vector<SlotChange> changes;
    changes.reserve(plan.size());
    for (const auto &[slot, take] : plan) {
        auto &content = inventory[slot];
        content.item_id = item_id;
        content.quantity += take;
        changes.push_back(SlotChange{slot, content.quantity, take});
        recordChange(user_id, slot, item_id, take, ChangeType::Add, reason);
    }
    return changes;
}

bool InMemoryInventoryStore::removeItemByItemId(UserId user_id,
                                                ItemId item_id,
                                                Quantity quantity,
                                                std::string reason) {
    if (quantity == 0) {
        return false;
    }
    if (countItem(user_id, item_id) < quantity) {
        return false;
    }

    // Highest slots first: undoes the fill order used by addItem.
    auto &inventory = inventories_[user_id];
    Quantity remaining = quantity;
    for (auto it = inventory.rbegin(); it != inventory.rend() && remaining > 0;) {
        if (it->second.item_id != item_id) {
            ++it;
            continue;
        }
        const SlotIndex slot = it->first;
        const Quantity take = std::min(it->second.quantity, remaining);
        it->second.quantity -= take;
        remaining -= take;
        recordChange(user_id, slot, item_id, take, ChangeType::Remove, reason);
        if (it->second.quantity == 0) {
            it = std::make_reverse_iterator(inventory.erase(std::next(it).base()));
        } else {
            ++it;
        }
    }
    return true;
}

bool InMemoryInventoryStore::restoreItem(UserId user_id,
                                         SlotIndex slot,
                                         ItemId item_id,
                                         Quantity quantity,
                                         std::string reason) {
    if (quantity == 0 || item_id == 0 || !validSlot(slot)) {
        return false;
    }

    auto &inventory = inventories_[user_id];
    auto it = inventory.find(slot);
    if (it != inventory.end()) {
        if (it->second.item_id != item_id || quantity > max_stack_ - it->second.quantity) {
            return false;
        }
        it->second.quantity += quantity;
    } else {
        if (quantity > max_stack_) {
            return false;
        }
        inventory.emplace(slot, InventorySlot{item_id, quantity});
    }
    recordChange(user_id, slot, item_id, quantity, ChangeType::Restore, std::move(reason));
    return true;
}

bool InMemoryInventoryStore::setSlot(UserId user_id, SlotIndex slot, InventorySlot content) {
    if (!validSlot(slot) || content.quantity > max_stack_) {
        return false;
    }
    auto &inventory = inventories_[user_id];
    if (content.quantity == 0 || content.item_id == 0) {
        inventory.erase(slot);
    } else {
        inventory[slot] = content;
    }
    return true;
}

std::map<SlotIndex, InventorySlot> InMemoryInventoryStore::slots(UserId user_id) const {
    auto it = inventories_.find(user_id);
    if (it == inventories_.end()) {
        return {};
    }
    return it->second;
}

Quantity InMemoryInventoryStore::countItem(UserId user_id, ItemId item_id) const {
    auto it = inventories_.find(user_id);
    if (it == inventories_.end()) {
        return 0;
    }
    Quantity total = 0;
    for (const auto &entry : it->second) {
        if (entry.second.item_id == item_id) {
            total += entry.second.quantity;
        }
    }
    return total;
}

std::vector<InventoryChange> InMemoryInventoryStore::changeLog(UserId user_id) const {
    auto it = change_log_.find(user_id);
    if (it == change_log_.end()) {
        return {};
    }
    return it->second;
}

bool InMemoryInventoryStore::validSlot(SlotIndex slot) const {
    return slot >= 1 && slot <= slot_count_;
}

void InMemoryInventoryStore::recordChange(UserId user_id,
                                          SlotIndex slot,
                                          ItemId item_id,
                                          Quantity quantity,
                                          ChangeType type,
                                          std::string reason) {
    InventoryChange change;
    change.change_id = next_change_id_++;
    change.user_id = user_id;
    change.slot = slot;
    change.item_id = item_id;
    change.quantity = quantity;
    change.type = type;
    change.reason = std::move(reason);
    change.recorded_at = std::chrono::system_clock::now();
    change_log_[user_id].push_back(std::move(change));
}

}  // namespace inventory
