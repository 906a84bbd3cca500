#include "trade_fixture.h"

#include <cassert>
#include <string>
#include <variant>

int main() {
    using trade_test::kAlice;
    using trade_test::kBob;
    using trade_test::kCarol;

    {
        auto entry = trade::parseClientOffer(0, 250);
        assert(entry.has_value());
        assert(std::get<trade::GoldOffer>(*entry).amount == 250);

        entry = trade::parseClientOffer(4, 2);
        assert(entry.has_value());
        assert(std::get<trade::ItemOffer>(*entry).slot == 4);
        assert(std::get<trade::ItemOffer>(*entry).quantity == 2);

        assert(!trade::parseClientOffer(3, -1).has_value());
        assert(!trade::parseClientOffer(-1, 1).has_value());
        assert(!trade::parseClientOffer(70000, 1).has_value());
    }

    {
        trade_test::TradeFixture fixture;
        auto result = fixture.service.updateOffer(kAlice, trade::ItemOffer{1, 1}, fixture.now);
        assert(!result.ok);
        assert(result.error == trade::TradeError::NoSession);
        result = fixture.service.updateOfferFromClient(kAlice, 0, 10, fixture.now);
        assert(result.error == trade::TradeError::NoSession);
        assert(fixture.service.confirm(kAlice, fixture.now).error == trade::TradeError::NoSession);
        assert(fixture.service.cancel(kAlice).error == trade::TradeError::NoSession);
    }

    {
        trade_test::TradeFixture fixture;
        fixture.inventory.setSlot(kAlice, 1, inventory::InventorySlot{101, 3});
        fixture.openTrade(kAlice, "Bob");

        auto result = fixture.service.updateOffer(kAlice, trade::ItemOffer{1, 5}, fixture.now);
        assert(!result.ok);
        assert(result.error == trade::TradeError::InvalidOffer);
        assert(fixture.receivedText(kAlice, "You do not have that quantity in the slot."));

        result = fixture.service.updateOffer(kAlice, trade::ItemOffer{2, 1}, fixture.now);
        assert(result.error == trade::TradeError::InvalidOffer);
        assert(result.message == "The selected slot is empty.");

        result = fixture.service.updateOffer(kAlice, trade::ItemOffer{21, 1}, fixture.now);
        assert(result.error == trade::TradeError::InvalidOffer);
        assert(result.message == "Invalid inventory slot.");

        result = fixture.service.updateOfferFromClient(kAlice, 1, -3, fixture.now);
        assert(result.error == trade::TradeError::InvalidOffer);
        assert(result.message == "The quantity must be positive.");

        result = fixture.service.updateOfferFromClient(kAlice, -1, 1, fixture.now);
        assert(result.error == trade::TradeError::InvalidOffer);
        assert(result.message == "Invalid inventory slot.");

        result = fixture.service.updateOfferFromClient(kAlice, 70000, 1, fixture.now);
        assert(result.error == trade::TradeError::InvalidOffer);
        assert(result.message == "Invalid inventory slot.");

        assert(fixture.service.getSession(kAlice)->initiator_offer.empty());
    }

    {
        trade_test::TradeFixture fixture;
        fixture.inventory.setSlot(kAlice, 1, inventory::InventorySlot{101, 3});
        fixture.openTrade(kAlice, "Bob");

        auto result = fixture.service.updateOffer(kAlice, trade::ItemOffer{1, 2}, fixture.now);
        assert(result.ok);
        auto session = fixture.service.getSession(kAlice);
        assert(session->initiator_offer.items.at(1).item_id == 101);
        assert(session->initiator_offer.items.at(1).quantity == 2);
        const auto log = fixture.log_output.str();
        assert(log.find("\"event\":\"trade_offer_updated\"") != std::string::npos);
        assert(log.find("\"item_id\":101") != std::string::npos);

        fixture.inventory.setSlot(kAlice, 1, inventory::InventorySlot{102, 3});
        result = fixture.service.updateOffer(kAlice, trade::ItemOffer{1, 1}, fixture.now);
        assert(result.error == trade::TradeError::InvalidOffer);
        assert(result.message == "That slot already holds a different offer.");
        assert(fixture.service.getSession(kAlice)->initiator_offer.items.at(1).item_id == 101);

        result = fixture.service.updateOffer(kAlice, trade::ItemOffer{1, 0}, fixture.now);
        assert(result.ok);
        assert(fixture.service.getSession(kAlice)->initiator_offer.items.empty());
        assert(fixture.receivedText(kAlice, "You removed the offer from slot 1."));
    }

    {
        trade::TradeConfig config;
        config.max_offer_items = 2;
        trade_test::TradeFixture fixture(config);
        for (inventory::SlotIndex slot = 1; slot <= 3; ++slot) {
            fixture.inventory.setSlot(kBob, slot, inventory::InventorySlot{200u + slot, 1});
        }
        fixture.openTrade(kAlice, "Bob");

        assert(fixture.service.updateOffer(kBob, trade::ItemOffer{1, 1}, fixture.now).ok);
        assert(fixture.service.updateOffer(kBob, trade::ItemOffer{2, 1}, fixture.now).ok);
        auto result = fixture.service.updateOffer(kBob, trade::ItemOffer{3, 1}, fixture.now);
        assert(result.error == trade::TradeError::InvalidOffer);
        assert(result.message == "You cannot offer more than 2 different items.");

        assert(fixture.service.updateOffer(kBob, trade::ItemOffer{2, 1}, fixture.now).ok);
        assert(fixture.service.getSession(kBob)->target_offer.items.size() == 2);
    }

    {
        trade_test::TradeFixture fixture;
        fixture.currency.setGold(kAlice, 100);
        fixture.openTrade(kAlice, "Bob");

        auto result = fixture.service.updateOffer(kAlice, trade::GoldOffer{150}, fixture.now);
        assert(result.error == trade::TradeError::InsufficientGold);
        assert(fixture.service.getSession(kAlice)->initiator_offer.gold == 0);

        result = fixture.service.updateOfferFromClient(kAlice, 0, 100, fixture.now);
        assert(result.ok);
        assert(result.message == "Gold offer updated.");
        assert(fixture.service.getSession(kAlice)->initiator_offer.gold == 100);
        assert(fixture.receivedText(kAlice, "You offer 100 gold."));

        result = fixture.service.updateOffer(kAlice, trade::GoldOffer{0}, fixture.now);
        assert(result.ok);
        assert(fixture.service.getSession(kAlice)->initiator_offer.gold == 0);
        assert(fixture.receivedText(kAlice, "You removed the gold offer."));
        assert(fixture.currency.getGold(kAlice) == 100);
    }

    {
        trade_test::TradeFixture fixture;
        fixture.inventory.setSlot(kAlice, 1, inventory::InventorySlot{101, 3});
        fixture.inventory.setSlot(kBob, 4, inventory::InventorySlot{303, 1});
        fixture.openTrade(kAlice, "Bob");

        assert(fixture.service.updateOffer(kBob, trade::ItemOffer{4, 1}, fixture.now).ok);
        assert(fixture.service.confirm(kBob, fixture.now).ok);
        auto session = fixture.service.getSession(kAlice);
        assert(session->target_confirmed);
        assert(session->state == trade::TradeState::Active);

        const auto later = fixture.now + std::chrono::seconds(5);
        assert(fixture.service.updateOffer(kAlice, trade::ItemOffer{1, 1}, later).ok);
        session = fixture.service.getSession(kBob);
        assert(!session->initiator_confirmed);
        assert(!session->target_confirmed);
        assert(session->state == trade::TradeState::Pending);
        assert(session->last_update == later);
        assert(fixture.receivedText(kBob, "Alice changed their offer."));
        assert(fixture.receivedText(kAlice, "You offer 1 unit(s) of the item in slot 1."));

        assert(fixture.inventory.getSlot(kAlice, 1)->quantity == 3);
        assert(!fixture.service.isUserInTrade(kCarol));
    }

    return 0;
}
