#include "admin/admin.h"
#include "admin/logging.h"
#include "inventory/in_memory_currency_store.h"
#include "inventory/in_memory_inventory_storage.h"
#include "player/player_directory.h"
#include "trade/trade_notifier.h"
#include "trade/trade_service.h"
#include "trade/trade_session_registry.h"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

struct Options {
    std::size_t players{16};
    std::size_t rounds{500};
    std::uint64_t seed{7};
    double fail_rate{0.05};
    std::string log_path{"docs/trade_sim.log"};
};

// Deliveries fail at random so the rollback path runs under load.
class FlakyInventoryStore : public inventory::InMemoryInventoryStore {
public:
    FlakyInventoryStore(double fail_rate, std::uint64_t seed)
        : InMemoryInventoryStore(20, 20), fail_rate_(fail_rate), generator_(seed) {}

    std::vector<inventory::SlotChange> addItem(inventory::UserId user_id,
                                               inventory::ItemId item_id,
                                               inventory::Quantity quantity,
                                               std::string reason) override {
        if (armed_ && fail_rate_ > 0.0 && chance_(generator_) < fail_rate_) {
            ++injected_failures_;
            return {};
        }
        return InMemoryInventoryStore::addItem(user_id, item_id, quantity, std::move(reason));
    }

    void arm(bool armed) { armed_ = armed; }
    std::size_t injectedFailures() const { return injected_failures_; }

private:
    double fail_rate_;
    std::mt19937_64 generator_;
    std::uniform_real_distribution<double> chance_{0.0, 1.0};
    bool armed_{false};
    std::size_t injected_failures_{0};
};

struct Totals {
    std::map<inventory::ItemId, std::uint64_t> items;
    inventory::Gold gold{0};

    bool operator==(const Totals &other) const {
        return items == other.items && gold == other.gold;
    }
};

void printUsage(const char *argv0) {
    std::cout << "Usage: " << argv0
              << " [--players N] [--rounds N] [--seed N] [--fail-rate P] [--log-path PATH]\n";
}

std::optional<std::uint64_t> parseNumber(const char *value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    try {
        std::size_t idx = 0;
        std::string text(value);
        auto result = std::stoull(text, &idx, 10);
        if (idx != text.size()) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

std::optional<double> parseRate(const char *value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    try {
        std::size_t idx = 0;
        std::string text(value);
        double result = std::stod(text, &idx);
        if (idx != text.size() || result < 0.0 || result > 1.0) {
            return std::nullopt;
        }
        return result;
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

Options parseArgs(int argc, char **argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto nextValue = [&]() -> const char * {
            if (i + 1 >= argc) {
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--players") {
            if (auto value = parseNumber(nextValue())) {
                options.players = static_cast<std::size_t>(*value);
            }
        } else if (arg == "--rounds") {
            if (auto value = parseNumber(nextValue())) {
                options.rounds = static_cast<std::size_t>(*value);
            }
        } else if (arg == "--seed") {
            if (auto value = parseNumber(nextValue())) {
                options.seed = *value;
            }
        } else if (arg == "--fail-rate") {
            if (auto value = parseRate(nextValue())) {
                options.fail_rate = *value;
            }
        } else if (arg == "--log-path") {
            if (auto value = nextValue()) {
                options.log_path = value;
            }
        }
    }
    if (options.players < 2) {
        options.players = 2;
    }
    return options;
}

void ensureParentDir(const std::string &path) {
    if (path.empty()) {
        return;
    }
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
}

// Exact slot contents and balances of a trading pair.
struct Layout {
    std::map<inventory::SlotIndex, std::pair<inventory::ItemId, inventory::Quantity>> first;
    std::map<inventory::SlotIndex, std::pair<inventory::ItemId, inventory::Quantity>> second;
    inventory::Gold first_gold{0};
    inventory::Gold second_gold{0};

    bool operator==(const Layout &other) const {
        return first == other.first && second == other.second &&
               first_gold == other.first_gold && second_gold == other.second_gold;
    }
};

Layout captureLayout(const FlakyInventoryStore &inventory,
                     const inventory::InMemoryCurrencyStore &currency,
                     inventory::UserId first,
                     inventory::UserId second) {
    Layout layout;
    for (const auto &[slot, content] : inventory.slots(first)) {
        layout.first[slot] = {content.item_id, content.quantity};
    }
    for (const auto &[slot, content] : inventory.slots(second)) {
        layout.second[slot] = {content.item_id, content.quantity};
    }
    layout.first_gold = currency.getGold(first);
    layout.second_gold = currency.getGold(second);
    return layout;
}

Totals collectTotals(const FlakyInventoryStore &inventory,
                     const inventory::InMemoryCurrencyStore &currency,
                     std::size_t players) {
    Totals totals;
    for (inventory::UserId user_id = 1; user_id <= players; ++user_id) {
        for (const auto &[slot, content] : inventory.slots(user_id)) {
            totals.items[content.item_id] += content.quantity;
        }
        totals.gold += currency.getGold(user_id);
    }
    return totals;
}

}  // namespace

int main(int argc, char **argv) {
    Options options = parseArgs(argc, argv);

    std::ofstream log_file;
    std::ostream *log_stream = &std::cout;
    if (!options.log_path.empty()) {
        ensureParentDir(options.log_path);
        log_file.open(options.log_path, std::ios::out | std::ios::trunc);
        if (log_file) {
            log_stream = &log_file;
        }
    }

    admin::StructuredLogger logger(*log_stream);
    FlakyInventoryStore inventory(options.fail_rate, options.seed ^ 0x9e3779b97f4a7c15ULL);
    inventory::InMemoryCurrencyStore currency;
    player::OnlinePlayerDirectory directory;
    trade::TradeSessionRegistry registry;

    std::size_t events_sent = 0;
    trade::EventSinkNotifier notifier(
        [&events_sent](trade::UserId, const trade::TradeEvent &) { ++events_sent; });
    trade::TradeService service(inventory, currency, directory, notifier, registry, logger);
    admin::TradeAdminService admin_service(service, logger);

    std::mt19937_64 rng(options.seed);
    auto roll = [&rng](std::uint64_t low, std::uint64_t high) {
        return std::uniform_int_distribution<std::uint64_t>(low, high)(rng);
    };

    for (inventory::UserId user_id = 1; user_id <= options.players; ++user_id) {
        directory.addPlayer(user_id, "Trader" + std::to_string(user_id));
        currency.setGold(user_id, roll(0, 500));
        for (inventory::SlotIndex slot = 1; slot <= 8; ++slot) {
            inventory::InventorySlot content;
            content.item_id = static_cast<inventory::ItemId>(100 + roll(1, 12));
            content.quantity = static_cast<inventory::Quantity>(roll(1, 20));
            inventory.setSlot(user_id, slot, content);
        }
    }

    const Totals initial = collectTotals(inventory, currency, options.players);
    std::size_t conservation_breaks = 0;
    std::size_t layout_breaks = 0;
    std::size_t offers_rejected = 0;
    auto now = std::chrono::steady_clock::now();
    const auto started = std::chrono::steady_clock::now();

    for (std::size_t round = 0; round < options.rounds; ++round) {
        now += std::chrono::seconds(1);
        const auto initiator = static_cast<trade::UserId>(roll(1, options.players));
        auto target = static_cast<trade::UserId>(roll(1, options.players - 1));
        if (target >= initiator) {
            ++target;
        }

        if (!service.requestTrade(initiator, directory.displayName(target), now).ok) {
            continue;
        }

        for (trade::UserId trader : {initiator, target}) {
            const auto offers = roll(0, 3);
            for (std::uint64_t n = 0; n < offers; ++n) {
                const auto slot = static_cast<std::int32_t>(roll(1, 8));
                const auto quantity = static_cast<std::int64_t>(roll(1, 10));
                if (!service.updateOfferFromClient(trader, slot, quantity, now).ok) {
                    ++offers_rejected;
                }
            }
            if (roll(0, 1) == 1) {
                const auto gold = static_cast<std::int64_t>(roll(1, 300));
                if (!service.updateOfferFromClient(trader, 0, gold, now).ok) {
                    ++offers_rejected;
                }
            }
        }

        switch (roll(0, 9)) {
            case 0:
                service.cancel(target);
                break;
            case 1:
                service.handleDisconnect(initiator);
                break;
            default: {
                const auto layout_before = captureLayout(inventory, currency, initiator, target);
                inventory.arm(true);
                service.confirm(initiator, now);
                const auto result = service.confirm(target, now);
                inventory.arm(false);
                if (!result.ok && result.error != trade::TradeError::RollbackFailure &&
                    !(captureLayout(inventory, currency, initiator, target) == layout_before)) {
                    ++layout_breaks;
                }
                if (service.isUserInTrade(initiator)) {
                    service.cancel(initiator);
                }
                break;
            }
        }

        if (!(collectTotals(inventory, currency, options.players) == initial)) {
            ++conservation_breaks;
        }
    }

    now += std::chrono::hours(1);
    service.expireIdleSessions(now);

    const auto status = admin_service.getStatus();
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (log_file) {
        log_file.flush();
        log_file.close();
    }

    std::ostringstream summary;
    summary << "# Trade Simulation Summary\n\n";
    summary << "## Command\n";
    summary << "```bash\n";
    summary << "./build/trade_sim";
    summary << " --players " << options.players;
    summary << " --rounds " << options.rounds;
    summary << " --seed " << options.seed;
    summary << " --fail-rate " << options.fail_rate;
    if (!options.log_path.empty()) {
        summary << " --log-path " << options.log_path;
    }
    summary << "\n```\n\n";
    summary << "## Trades\n";
    summary << "- Sessions opened: " << status.sessions_opened << "\n";
    summary << "- Trades completed: " << status.trades_completed << "\n";
    summary << "- Trades cancelled: " << status.trades_cancelled << "\n";
    summary << "- Commit failures: " << status.commit_failures << "\n";
    summary << "- Rollback failures: " << status.rollback_failures << "\n";
    summary << "- Offers rejected: " << offers_rejected << "\n";
    summary << "- Injected delivery failures: " << inventory.injectedFailures() << "\n";
    summary << "- Notifications sent: " << events_sent << "\n";
    summary << "- Duration: " << duration.count() << " ms\n\n";
    summary << "## Validation\n";
    summary << "- Open sessions after expiry sweep: " << status.active_sessions << "\n";
    summary << "- Conservation breaks: " << conservation_breaks << "\n";
    summary << "- Layout changes after failed commits: " << layout_breaks << "\n";
    const bool passed = conservation_breaks == 0 && layout_breaks == 0 &&
                        status.rollback_failures == 0;
    summary << "- Status: " << (passed ? "PASS" : "FAIL") << "\n";

    std::cout << summary.str();
    return passed ? 0 : 1;
}
