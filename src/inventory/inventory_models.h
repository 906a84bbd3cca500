#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace inventory {

using UserId = std::uint64_t;
using SlotIndex = std::uint16_t;
using ItemId = std::uint32_t;
using Quantity = std::uint32_t;
using Gold = std::uint64_t;
using ChangeId = std::uint64_t;

struct InventorySlot {
    ItemId item_id{0};
    Quantity quantity{0};
};

// Slot touched by an add: the quantity it holds afterwards and how much
// of it the add placed there.
struct SlotChange {
    SlotIndex slot{0};
    Quantity new_quantity{0};
    Quantity added{0};
};

enum class ChangeType : std::uint8_t {
    Add,
    Remove,
    Restore
};

struct InventoryChange {
    ChangeId change_id{0};
    UserId user_id{0};
    SlotIndex slot{0};
    ItemId item_id{0};
    Quantity quantity{0};
    ChangeType type{ChangeType::Add};
    std::string reason;
    std::chrono::system_clock::time_point recorded_at{};
};

}  // namespace inventory
