#include "admin/admin.h"
#include "trade/undo_ledger.h"
#include "trade_fixture.h"

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

int main() {
    using trade_test::kAlice;
    using trade_test::kBob;
    using trade_test::kCarol;

    {
        std::vector<std::string> order;
        trade::UndoLedger ledger;
        ledger.record("first", [&order]() {
            order.push_back("first");
            return true;
        });
        ledger.record("second", [&order]() {
            order.push_back("second");
            return false;
        });
        ledger.record("third", [&order]() {
            order.push_back("third");
            return true;
        });
        assert(ledger.size() == 3);

        auto report = ledger.unwind();
        assert(order.size() == 3);
        assert(order[0] == "third" && order[1] == "second" && order[2] == "first");
        assert(report.reversed == 2);
        assert(!report.clean());
        assert(report.failed_steps.size() == 1 && report.failed_steps[0] == "second");
        assert(ledger.empty());

        bool ran = false;
        ledger.record("kept", [&ran]() {
            ran = true;
            return true;
        });
        ledger.commit();
        assert(ledger.empty());
        assert(ledger.unwind().clean());
        assert(!ran);
    }

    {
        trade_test::TradeFixture fixture;
        fixture.currency.setGold(kAlice, 50);
        fixture.openTrade(kAlice, "Bob");
        assert(fixture.service.updateOffer(kAlice, trade::GoldOffer{10}, fixture.now).ok);

        assert(fixture.service.confirm(kAlice, fixture.now).ok);
        const auto texts_before = fixture.events.size();
        auto result = fixture.service.confirm(kAlice, fixture.now);
        assert(result.ok);
        assert(result.message == "You already confirmed the trade.");
        assert(fixture.events.size() == texts_before);
        assert(fixture.service.getSession(kAlice)->initiator_confirmed);
        assert(!fixture.service.getSession(kAlice)->target_confirmed);
    }

    {
        trade_test::TradeFixture fixture;
        fixture.inventory.setSlot(kAlice, 1, inventory::InventorySlot{101, 5});
        fixture.openTrade(kAlice, "Bob");
        assert(fixture.service.updateOffer(kAlice, trade::ItemOffer{1, 5}, fixture.now).ok);
        assert(fixture.service.ready(kAlice, fixture.now).ok);

        auto result = fixture.service.cancel(kBob);
        assert(result.ok);
        assert(!fixture.service.isUserInTrade(kAlice));
        assert(!fixture.service.isUserInTrade(kBob));
        assert(fixture.inventory.getSlot(kAlice, 1)->quantity == 5);
        assert(fixture.inventory.countItem(kBob, 101) == 0);
        assert(fixture.countEvents(kAlice, trade::TradeEventType::Closed) == 1);
        assert(fixture.countEvents(kBob, trade::TradeEventType::Closed) == 1);
        assert(fixture.receivedText(kAlice, "The trade was cancelled."));
        assert(fixture.service.metrics().trades_cancelled == 1);
        assert(fixture.service.cancel(kAlice).error == trade::TradeError::NoSession);
    }

    {
        trade_test::TradeFixture fixture;
        fixture.openTrade(kAlice, "Bob");
        assert(fixture.service.reject(kBob).ok);
        assert(fixture.receivedText(kAlice, "Trade rejected."));
        assert(!fixture.service.isUserInTrade(kAlice));

        fixture.openTrade(kCarol, "Alice");
        assert(fixture.service.getSession(kAlice)->initiator_id == kCarol);
    }

    {
        trade_test::TradeFixture fixture;
        fixture.openTrade(kAlice, "Bob");
        assert(!fixture.service.handleDisconnect(kCarol));
        assert(fixture.service.handleDisconnect(kBob));
        assert(!fixture.service.isUserInTrade(kAlice));
        assert(fixture.receivedText(kAlice, "Bob disconnected."));
        assert(fixture.countEvents(kAlice, trade::TradeEventType::Closed) == 1);
        assert(fixture.log_output.str().find("\"event\":\"trade_disconnected\"") !=
               std::string::npos);
        assert(!fixture.service.handleDisconnect(kBob));
    }

    {
        trade::TradeConfig config;
        config.idle_timeout = std::chrono::seconds(30);
        trade_test::TradeFixture fixture(config);
        fixture.currency.setGold(kAlice, 10);
        fixture.openTrade(kAlice, "Bob");

        assert(fixture.service.expireIdleSessions(fixture.now + std::chrono::seconds(29)) == 0);
        assert(fixture.service.isUserInTrade(kAlice));

        const auto later = fixture.now + std::chrono::seconds(20);
        assert(fixture.service.updateOffer(kAlice, trade::GoldOffer{5}, later).ok);
        assert(fixture.service.expireIdleSessions(fixture.now + std::chrono::seconds(45)) == 0);
        assert(fixture.service.expireIdleSessions(later + std::chrono::seconds(31)) == 1);
        assert(!fixture.service.isUserInTrade(kAlice));
        assert(!fixture.service.isUserInTrade(kBob));
        assert(fixture.receivedText(kBob, "The trade expired."));
        assert(fixture.currency.getGold(kAlice) == 10);
        assert(fixture.service.expireIdleSessions(later + std::chrono::hours(1)) == 0);
    }

    {
        trade::TradeConfig config;
        config.idle_timeout = std::chrono::milliseconds::zero();
        trade_test::TradeFixture fixture(config);
        fixture.openTrade(kAlice, "Bob");
        assert(fixture.service.expireIdleSessions(fixture.now + std::chrono::hours(24)) == 0);
        assert(fixture.service.isUserInTrade(kAlice));
    }

    {
        trade_test::TradeFixture fixture;
        admin::TradeAdminService admin_service(fixture.service, fixture.logger);

        fixture.openTrade(kAlice, "Bob");
        auto status = admin_service.getStatus();
        assert(status.active_sessions == 1);
        assert(status.sessions_opened == 1);
        assert(status.pending_reconciliations == 0);

        assert(!admin_service.forceCancelTrade(kCarol, "audit"));
        assert(admin_service.forceCancelTrade(kBob, "audit"));
        assert(!fixture.service.isUserInTrade(kAlice));
        assert(fixture.receivedText(kAlice, "Trade cancelled by an administrator: audit"));

        status = admin_service.getStatus();
        assert(status.active_sessions == 0);
        assert(status.trades_cancelled == 1);
        assert(fixture.log_output.str().find("\"event\":\"admin_force_cancel\"") !=
               std::string::npos);
    }

    {
        trade_test::TradeFixture fixture;
        admin::TradeAdminService admin_service(fixture.service, fixture.logger);
        fixture.inventory.setSlot(kAlice, 1, inventory::InventorySlot{101, 2});
        fixture.openTrade(kAlice, "Bob");
        assert(fixture.service.updateOffer(kAlice, trade::ItemOffer{1, 2}, fixture.now).ok);
        fixture.inventory.fail_add_for = kBob;
        fixture.inventory.fail_restore = true;
        assert(fixture.service.confirm(kAlice, fixture.now).ok);
        assert(fixture.service.confirm(kBob, fixture.now).error ==
               trade::TradeError::RollbackFailure);

        auto status = admin_service.getStatus();
        assert(status.rollback_failures == 1);
        assert(status.pending_reconciliations == 1);
        assert(status.trades_cancelled == 1);

        auto pending = admin_service.pendingReconciliations();
        assert(pending.size() == 1);
        assert(!admin_service.resolveReconciliation(pending[0].record_id + 1, "wrong id"));
        assert(admin_service.resolveReconciliation(pending[0].record_id, "restored by hand"));
        assert(admin_service.pendingReconciliations().empty());
    }

    return 0;
}
