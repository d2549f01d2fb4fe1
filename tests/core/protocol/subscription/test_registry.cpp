/*
===============================================================================
 protocol::subscription::Registry - Unit Tests
===============================================================================

Covered Requirements:
---------------------
S1. subscribe() returns only the channels that changed
S2. Idempotence: repeating a request yields no command
S3. Widening: pair sets are unioned, "every pair" overrides explicit sets
S4. unsubscribe() removes entries and reports only known channels
S5. ensure_defaults() registers the default channels for every pair
S6. replay() groups channels by identical pair set, one command per group

===============================================================================
*/

#include <iostream>
#include <string>
#include <vector>

#include "arbwire/core/protocol/subscription/registry.hpp"
#include "common/test_check.hpp"

using namespace arbwire::core;
using namespace arbwire::core::protocol;
using namespace arbwire::core::protocol::subscription;


void test_subscribe_delta() {
    std::cout << "[TEST] S1: subscribe() returns the changed channels..." << std::endl;
    Registry reg;

    auto delta = reg.subscribe({"prices", "mev"}, PairSet{"SOL/USDT"});
    TEST_CHECK(delta.has());
    TEST_CHECK(delta.value().action == schema::request::Action::Subscribe);
    TEST_CHECK(delta.value().channels == (std::vector<std::string>{"prices", "mev"}));
    TEST_CHECK(delta.value().to_json() == R"({"action":"subscribe","channels":["prices","mev"],"pairs":["SOL/USDT"]})");

    delta = reg.subscribe({"prices", "depth"}, PairSet{"SOL/USDT"});
    TEST_CHECK(delta.has());
    TEST_CHECK(delta.value().channels == (std::vector<std::string>{"depth"}));
    TEST_CHECK(reg.size() == 3);

    // Empty channel names are ignored
    TEST_CHECK(!reg.subscribe({""}, {}).has());
    std::cout << "[TEST] OK" << std::endl;
}

void test_subscribe_idempotent() {
    std::cout << "[TEST] S2: repeated request yields no command..." << std::endl;
    Registry reg;
    TEST_CHECK(reg.subscribe({"prices"}, {}).has());
    TEST_CHECK(!reg.subscribe({"prices"}, {}).has());
    TEST_CHECK(!reg.subscribe({"prices"}, PairSet{"ETH/USDT"}).has());

    TEST_CHECK(reg.subscribe({"mev"}, PairSet{"SOL/USDT", "ETH/USDT"}).has());
    TEST_CHECK(!reg.subscribe({"mev"}, PairSet{"ETH/USDT"}).has());
    TEST_CHECK(reg.size() == 2);
    std::cout << "[TEST] OK" << std::endl;
}

void test_widening() {
    std::cout << "[TEST] S3: widening only..." << std::endl;
    Registry reg;
    (void)reg.subscribe({"prices"}, PairSet{"SOL/USDT"});
    TEST_CHECK(reg.subscribe({"prices"}, PairSet{"ETH/USDT"}).has());

    auto entry = reg.find("prices");
    TEST_CHECK(entry.has());
    TEST_CHECK(entry.value().pairs.has());
    TEST_CHECK(entry.value().pairs.value() == (PairSet{"ETH/USDT", "SOL/USDT"}));

    // Every pair overrides the explicit set
    auto delta = reg.subscribe({"prices"}, {});
    TEST_CHECK(delta.has());
    TEST_CHECK(!delta.value().pairs.has());
    TEST_CHECK(!reg.find("prices").value().pairs.has());
    TEST_CHECK(delta.value().to_json() == R"({"action":"subscribe","channels":["prices"]})");
    std::cout << "[TEST] OK" << std::endl;
}

void test_unsubscribe() {
    std::cout << "[TEST] S4: unsubscribe() removes known channels..." << std::endl;
    Registry reg;
    (void)reg.subscribe({"prices", "mev"}, {});

    auto delta = reg.unsubscribe({"mev", "depth"});
    TEST_CHECK(delta.has());
    TEST_CHECK(delta.value().action == schema::request::Action::Unsubscribe);
    TEST_CHECK(delta.value().channels == (std::vector<std::string>{"mev"}));
    TEST_CHECK(!reg.contains("mev"));
    TEST_CHECK(reg.contains("prices"));

    TEST_CHECK(!reg.unsubscribe({"mev"}).has());

    // Re-subscribing after removal sends again
    TEST_CHECK(reg.subscribe({"mev"}, {}).has());
    std::cout << "[TEST] OK" << std::endl;
}

void test_defaults() {
    std::cout << "[TEST] S5: ensure_defaults() registers the default channels..." << std::endl;
    Registry reg;
    (void)reg.subscribe({"prices"}, PairSet{"SOL/USDT"});
    (void)reg.subscribe({"custom"}, PairSet{"SOL/USDT"});
    reg.ensure_defaults();
    reg.ensure_defaults();

    TEST_CHECK(reg.size() == config::DEFAULT_CHANNELS.size() + 1);
    for (auto ch : config::DEFAULT_CHANNELS) {
        auto e = reg.find(std::string(ch));
        TEST_CHECK(e.has());
        TEST_CHECK(!e.value().pairs.has());
    }
    // Non-default entries untouched
    TEST_CHECK(reg.find("custom").value().pairs.has());
    std::cout << "[TEST] OK" << std::endl;
}

void test_replay_grouping() {
    std::cout << "[TEST] S6: replay() groups by pair set..." << std::endl;
    Registry reg;
    TEST_CHECK(reg.replay().empty());

    (void)reg.subscribe({"prices", "opportunities"}, {});
    (void)reg.subscribe({"depth"}, PairSet{"SOL/USDT"});
    (void)reg.subscribe({"mev"}, PairSet{"SOL/USDT"});
    (void)reg.subscribe({"alpha"}, PairSet{"ETH/USDT"});

    const auto cmds = reg.replay();
    TEST_CHECK(cmds.size() == 3);

    // Channel-name order decides group order: alpha, depth(+mev), opportunities(+prices)
    TEST_CHECK(cmds[0].channels == (std::vector<std::string>{"alpha"}));
    TEST_CHECK(cmds[0].pairs.value() == (PairSet{"ETH/USDT"}));
    TEST_CHECK(cmds[1].channels == (std::vector<std::string>{"depth", "mev"}));
    TEST_CHECK(cmds[2].channels == (std::vector<std::string>{"opportunities", "prices"}));
    TEST_CHECK(!cmds[2].pairs.has());
    for (const auto& c : cmds) {
        TEST_CHECK(c.action == schema::request::Action::Subscribe);
    }

    // Replay is a pure read
    TEST_CHECK(reg.replay().size() == 3);
    TEST_CHECK(reg.size() == 5);
    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_subscribe_delta();
    test_subscribe_idempotent();
    test_widening();
    test_unsubscribe();
    test_defaults();
    test_replay_grouping();

    std::cout << "\n[SUBSCRIPTION REGISTRY TESTS PASSED]\n";
    return 0;
}
