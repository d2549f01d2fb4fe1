/*
===============================================================================
 protocol::Dispatcher - Unit Tests
===============================================================================

Covered Requirements:
---------------------
D1. Every command is rejected with NotConnected outside Connected
D2. Intents serialize to the execution collaborator's JSON envelope
D3. A frame refused by the transport reports TransportRejected

===============================================================================
*/

#include <iostream>
#include <string>

#include <simdjson.h>

#include "arbwire/core/protocol/dispatcher.hpp"
#include "arbwire/core/protocol/schema/intent/cancel_execution.hpp"
#include "arbwire/core/protocol/schema/intent/execute_arbitrage.hpp"
#include "arbwire/core/protocol/schema/intent/execute_trade.hpp"
#include "arbwire/core/protocol/schema/intent/toggle_auto_trading.hpp"
#include "arbwire/core/protocol/schema/intent/wallet.hpp"
#include "common/harness/connection.hpp"

namespace protocol = arbwire::core::protocol;
namespace intent = arbwire::core::protocol::schema::intent;
using protocol::dispatch::Result;
using DispatcherUnderTest = protocol::Dispatcher<ConnectionUnderTest>;


void test_not_connected() {
    std::cout << "[TEST] D1: commands are rejected while not connected" << std::endl;
    test::ConnectionHarness h;
    DispatcherUnderTest dispatcher(*h.connection);

    protocol::schema::request::Subscription sub;
    sub.channels = {"prices"};
    TEST_CHECK(dispatcher.send_subscription(sub) == Result::NotConnected);
    TEST_CHECK(dispatcher.send_intent(intent::CancelExecution{.opportunity_id = "a"}) == Result::NotConnected);

    // Waiting for a reconnect is not connected either
    TEST_CHECK(h.connection->open("ws://localhost:3002/") == Error::None);
    h.connection->ws().emit_close(false);
    h.poll();
    TEST_CHECK(h.connection->has_pending_retry());
    TEST_CHECK(dispatcher.send_intent(intent::ToggleAutoTrading{.enabled = false}) == Result::NotConnected);
    TEST_CHECK(WebSocketUnderTest::sent().empty());
    std::cout << "[TEST] OK" << std::endl;
}

void test_intent_serialization() {
    std::cout << "[TEST] D2: intents serialize to their JSON envelope" << std::endl;
    test::ConnectionHarness h;
    DispatcherUnderTest dispatcher(*h.connection);
    TEST_CHECK(h.connection->open("ws://localhost:3002/") == Error::None);

    TEST_CHECK(dispatcher.send_intent(intent::CancelExecution{.opportunity_id = "arb_7"}) == Result::Sent);
    TEST_CHECK(WebSocketUnderTest::sent().back() == R"({"type":"cancel_execution","data":{"opportunityId":"arb_7"}})");

    TEST_CHECK(dispatcher.send_intent(intent::WalletConnect{.wallet_type = "phantom", .address = "9xQe"}) == Result::Sent);
    TEST_CHECK(WebSocketUnderTest::sent().back() == R"({"type":"wallet_connect","wallet_type":"phantom","address":"9xQe"})");

    TEST_CHECK(dispatcher.send_intent(intent::WalletDisconnect{.address = "9xQe"}) == Result::Sent);
    TEST_CHECK(WebSocketUnderTest::sent().back() == R"({"type":"wallet_disconnect","address":"9xQe"})");

    TEST_CHECK(dispatcher.send_intent(intent::ToggleAutoTrading{.enabled = false}) == Result::Sent);
    TEST_CHECK(WebSocketUnderTest::sent().back() == R"({"type":"toggle_auto_trading","enabled":false})");

    // Numeric fields are checked through a parser
    simdjson::dom::parser parser;
    simdjson::dom::element root;

    TEST_CHECK(dispatcher.send_intent(intent::ExecuteArbitrage{.opportunity_id = "arb_8", .amount = 2500.0, .slippage = 0.25}) == Result::Sent);
    TEST_CHECK(!parser.parse(WebSocketUnderTest::sent().back()).get(root));
    std::string_view sv;
    double v = 0.0;
    TEST_CHECK(!root["type"].get(sv) && sv == "execute_arbitrage");
    TEST_CHECK(!root["data"]["opportunityId"].get(sv) && sv == "arb_8");
    TEST_CHECK(!root["data"]["amount"].get(v) && v == 2500.0);
    TEST_CHECK(!root["data"]["slippage"].get(v) && v == 0.25);

    intent::ExecuteTrade trade;
    trade.opportunity.id = "arb_9";
    trade.opportunity.pair = "SOL/USDT";
    trade.opportunity.buy.exchange = "Orca";
    trade.opportunity.buy.price = 99.0;
    trade.opportunity.sell.exchange = "Binance";
    trade.opportunity.sell.price = 99.9;
    trade.opportunity.profit_percentage = 0.909;
    trade.opportunity.execution_path = {"Buy on Orca", "Transfer", "Sell on Binance"};
    TEST_CHECK(dispatcher.send_intent(trade) == Result::Sent);
    TEST_CHECK(!parser.parse(WebSocketUnderTest::sent().back()).get(root));
    TEST_CHECK(!root["type"].get(sv) && sv == "execute_trade");
    TEST_CHECK(!root["opportunity"]["id"].get(sv) && sv == "arb_9");
    TEST_CHECK(!root["opportunity"]["buy_exchange"].get(sv) && sv == "Orca");
    TEST_CHECK(!root["opportunity"]["sell_price"].get(v) && v == 99.9);
    simdjson::dom::array path;
    TEST_CHECK(!root["opportunity"]["execution_path"].get(path) && path.size() == 3);

    TEST_CHECK(WebSocketUnderTest::sent().size() == 6);
    TEST_CHECK(h.connection->tx_messages() == 6);
    std::cout << "[TEST] OK" << std::endl;
}

void test_transport_rejected() {
    std::cout << "[TEST] D3: transport refusal is reported" << std::endl;
    test::ConnectionHarness h;
    DispatcherUnderTest dispatcher(*h.connection);
    TEST_CHECK(h.connection->open("ws://localhost:3002/") == Error::None);

    WebSocketUnderTest::set_reject_sends(true);
    protocol::schema::request::Subscription sub;
    sub.action = protocol::schema::request::Action::Unsubscribe;
    sub.channels = {"mev"};
    TEST_CHECK(dispatcher.send_subscription(sub) == Result::TransportRejected);
    TEST_CHECK(dispatcher.send_intent(intent::CancelExecution{.opportunity_id = "x"}) == Result::TransportRejected);
    WebSocketUnderTest::set_reject_sends(false);

    TEST_CHECK(dispatcher.send_subscription(sub) == Result::Sent);
    TEST_CHECK(WebSocketUnderTest::sent().size() == 1);
    TEST_CHECK(WebSocketUnderTest::sent()[0] == R"({"action":"unsubscribe","channels":["mev"]})");
    TEST_CHECK(h.connection->is_connected());
    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_not_connected();
    test_intent_serialization();
    test_transport_rejected();

    std::cout << "\n[DISPATCHER TESTS PASSED]\n";
    return 0;
}
