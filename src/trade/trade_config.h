#pragma once

#include <chrono>
#include <cstddef>

namespace trade {

struct TradeConfig {
    // Sessions idle longer than this are reaped by expireIdleSessions().
    // Zero disables reaping.
    std::chrono::milliseconds idle_timeout{std::chrono::minutes{5}};
    std::size_t max_offer_items{10};
};

}  // namespace trade
