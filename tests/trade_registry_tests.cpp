#include "trade_fixture.h"

#include <cassert>
#include <memory>

namespace {

std::shared_ptr<trade::TradeSession> makeSession(trade::UserId initiator, trade::UserId target) {
    auto session = std::make_shared<trade::TradeSession>();
    session->initiator_id = initiator;
    session->target_id = target;
    return session;
}

}  // namespace

int main() {
    using trade_test::kAlice;
    using trade_test::kBob;
    using trade_test::kCarol;

    {
        player::OnlinePlayerDirectory directory;
        assert(directory.addPlayer(7, "Alice"));
        assert(!directory.addPlayer(7, "Someone"));
        assert(!directory.addPlayer(8, " alice "));
        assert(directory.size() == 1);

        auto found = directory.findUserByName("  ALICE\t");
        assert(found.has_value() && *found == 7);
        assert(!directory.findUserByName("bob").has_value());
        assert(directory.displayName(7) == "Alice");
        assert(directory.displayName(9) == "Player9");

        assert(directory.removePlayer(7));
        assert(!directory.removePlayer(7));
        assert(!directory.findUserByName("alice").has_value());
    }

    {
        trade::TradeSessionRegistry registry;
        auto first = makeSession(kAlice, kBob);
        assert(registry.admit(first) == trade::TradeSessionRegistry::Admission::Admitted);
        assert(registry.find(kAlice) == first);
        assert(registry.find(kBob) == first);
        assert(registry.sessionCount() == 1);

        auto busy_initiator = makeSession(kAlice, kCarol);
        assert(registry.admit(busy_initiator) ==
               trade::TradeSessionRegistry::Admission::InitiatorBusy);
        auto busy_target = makeSession(kCarol, kBob);
        assert(registry.admit(busy_target) == trade::TradeSessionRegistry::Admission::TargetBusy);
        assert(!registry.contains(kCarol));

        assert(registry.clear(kBob));
        assert(!registry.contains(kAlice));
        assert(!registry.contains(kBob));
        assert(!registry.clear(kBob));
        assert(registry.sessionCount() == 0);
    }

    {
        trade_test::TradeFixture fixture;
        auto result = fixture.service.requestTrade(kAlice, "alice", fixture.now);
        assert(!result.ok);
        assert(result.error == trade::TradeError::SelfTrade);
        assert(!fixture.service.isUserInTrade(kAlice));

        result = fixture.service.requestTrade(kAlice, "Dave", fixture.now);
        assert(!result.ok);
        assert(result.error == trade::TradeError::TargetUnavailable);
        assert(fixture.receivedText(kAlice, "User 'Dave' is not online."));
    }

    {
        trade_test::TradeFixture fixture;
        auto result = fixture.service.requestTrade(kAlice, " bob ", fixture.now);
        assert(result.ok);
        assert(result.message == "Trade request sent to Bob.");

        auto session = fixture.service.getSession(kBob);
        assert(session.has_value());
        assert(session->initiator_id == kAlice);
        assert(session->target_id == kBob);
        assert(session->initiator_name == "Alice");
        assert(session->target_name == "Bob");
        assert(session->state == trade::TradeState::Pending);
        assert(!session->initiator_confirmed && !session->target_confirmed);
        assert(session->initiator_offer.empty() && session->target_offer.empty());
        assert(session->trace_id.size() == 32);

        assert(fixture.countEvents(kAlice, trade::TradeEventType::Opened) == 1);
        assert(fixture.countEvents(kBob, trade::TradeEventType::Opened) == 1);
        assert(fixture.events[0].event.partner_name == "Bob");
        assert(fixture.receivedText(kAlice, "You started a trade with Bob."));
        assert(fixture.receivedText(kBob, "Alice wants to trade with you."));
        assert(fixture.service.activeSessionCount() == 1);
        assert(fixture.service.metrics().sessions_opened == 1);
    }

    {
        trade_test::TradeFixture fixture;
        fixture.openTrade(kAlice, "Bob");

        auto result = fixture.service.requestTrade(kAlice, "Carol", fixture.now);
        assert(result.error == trade::TradeError::UserBusy);
        assert(result.message == "You already have an open trade.");

        result = fixture.service.requestTrade(kCarol, "Bob", fixture.now);
        assert(result.error == trade::TradeError::UserBusy);
        assert(result.message == "Bob is already trading.");

        result = fixture.service.requestTrade(kCarol, "Alice", fixture.now);
        assert(result.error == trade::TradeError::UserBusy);
        assert(!fixture.service.isUserInTrade(kCarol));
        assert(fixture.service.activeSessionCount() == 1);
        assert(fixture.countEvents(kCarol, trade::TradeEventType::Opened) == 0);
        assert(fixture.log_output.str().find("\"event\":\"trade_request_rejected\"") !=
               std::string::npos);
    }

    return 0;
}
