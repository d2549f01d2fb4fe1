/*
===============================================================================
 arbitrage::Scanner - Unit Tests
===============================================================================

Covered Requirements:
---------------------
AS1. Best buy = lowest ask, best sell = highest bid, spread in percent
AS2. No opportunity when best bid <= best ask or below the threshold
AS3. Deterministic tie-break on the exchange name
AS4. Derived fields: net profit, confidence bounds, risk, expiry, id
AS5. Other pairs and unusable quotes are ignored
AS6. scan_all() ranks by profit, confidence, then id
AS7. One exchange holding both best sides pairs with the best other venue

===============================================================================
*/

#include <cmath>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "arbwire/core/arbitrage/scanner.hpp"
#include "common/test_check.hpp"

using namespace arbwire::core;
using namespace arbwire::core::arbitrage;
using protocol::schema::Quote;
using protocol::schema::Opportunity;

constexpr std::int64_t NOW = 1'700'000'000'000;

static Quote q(const std::string& pair, const std::string& exchange, double bid, double ask, double liquidity = 0.0) {
    Quote out;
    out.pair = pair;
    out.exchange = exchange;
    out.price = (bid + ask) / 2.0;
    out.bid = bid;
    out.ask = ask;
    out.liquidity = liquidity;
    out.timestamp_ms = NOW;
    return out;
}

static bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}


void test_reference_example() {
    std::cout << "[TEST] AS1: cross-exchange spread..." << std::endl;
    Scanner scanner;
    const std::vector<Quote> quotes = {
        q("P", "ExA", 99.90, 100.00),
        q("P", "ExB", 98.95, 99.00),
    };

    auto opp = scanner.scan("P", quotes, NOW);
    TEST_CHECK(opp.has());
    const auto& o = opp.value();
    TEST_CHECK(o.buy.exchange == "ExB");
    TEST_CHECK(o.buy.price == 99.00);
    TEST_CHECK(o.sell.exchange == "ExA");
    TEST_CHECK(o.sell.price == 99.90);
    TEST_CHECK(near(o.profit_percentage, 0.90 / 99.00 * 100.0));
    TEST_CHECK(std::round(o.profit_percentage * 1000.0) / 1000.0 == 0.909);
    TEST_CHECK(o.pair == "P");
    std::cout << "[TEST] OK" << std::endl;
}

void test_no_opportunity() {
    std::cout << "[TEST] AS2: no opportunity without a positive spread above threshold..." << std::endl;
    Scanner scanner;

    // bid <= ask everywhere
    TEST_CHECK(!scanner.scan("P", {q("P", "ExA", 99.0, 100.0), q("P", "ExB", 99.5, 100.5)}, NOW).has());
    // crossing exactly
    TEST_CHECK(!scanner.scan("P", {q("P", "ExA", 100.0, 101.0), q("P", "ExB", 99.0, 100.0)}, NOW).has());
    // 0.05 % spread is below the 0.1 % default
    TEST_CHECK(!scanner.scan("P", {q("P", "ExA", 100.05, 100.10), q("P", "ExB", 99.90, 100.00)}, NOW).has());
    // single exchange
    TEST_CHECK(!scanner.scan("P", {q("P", "ExA", 101.0, 100.0)}, NOW).has());
    // no quotes at all
    TEST_CHECK(!scanner.scan("P", {}, NOW).has());
    TEST_CHECK(scanner.sequence() == 0);

    // Threshold is configurable
    Config cfg;
    cfg.min_profit_percentage = 0.01;
    scanner.set_config(cfg);
    TEST_CHECK(scanner.scan("P", {q("P", "ExA", 100.05, 100.10), q("P", "ExB", 99.90, 100.00)}, NOW).has());
    std::cout << "[TEST] OK" << std::endl;
}

void test_tie_break() {
    std::cout << "[TEST] AS3: ties resolve to the smaller exchange name..." << std::endl;
    Scanner scanner;
    const std::vector<Quote> quotes = {
        q("P", "Zeta", 101.0, 105.0),
        q("P", "Beta", 101.0, 105.0),
        q("P", "Gamma", 95.0, 99.0),
        q("P", "Alpha", 95.0, 99.0),
    };
    auto opp = scanner.scan("P", quotes, NOW);
    TEST_CHECK(opp.has());
    TEST_CHECK(opp.value().buy.exchange == "Alpha");
    TEST_CHECK(opp.value().sell.exchange == "Beta");
    std::cout << "[TEST] OK" << std::endl;
}

void test_derived_fields() {
    std::cout << "[TEST] AS4: derived fields..." << std::endl;
    Scanner scanner;

    auto buy = q("P", "ExB", 98.0, 99.0, 2'000'000.0);
    auto sell = q("P", "ExA", 100.0, 101.0, 500'000.0);
    sell.fee = 0.2;

    auto opp = scanner.scan("P", {buy, sell}, NOW);
    TEST_CHECK(opp.has());
    const auto& o = opp.value();
    const double profit = 1.0 / 99.0 * 100.0;

    // Missing fee side counts as half the default aggregate
    TEST_CHECK(near(o.net_profit, profit - (0.05 + 0.2)));
    TEST_CHECK(near(o.confidence, 50.0 + 10.0 * profit + 0.5));
    TEST_CHECK(o.risk_level == protocol::RiskLevel::Medium);
    TEST_CHECK(o.expires_at_ms == NOW + 60'000);
    TEST_CHECK(o.timestamp_ms == NOW);
    TEST_CHECK(o.required_capital == config::REQUIRED_CAPITAL);
    TEST_CHECK(near(o.estimated_profit, config::REQUIRED_CAPITAL * profit / 100.0));
    TEST_CHECK(o.id == "arb_P_" + std::to_string(NOW) + "_1");
    TEST_CHECK(o.execution_path.size() == 3);
    TEST_CHECK(o.execution_path.front() == "Buy on ExB");
    TEST_CHECK(!is_expired(o, NOW + 59'999));
    TEST_CHECK(is_expired(o, NOW + 60'000));

    // Ids are unique per emission
    auto again = scanner.scan("P", {buy, sell}, NOW);
    TEST_CHECK(again.value().id != o.id);

    // Huge spread and liquidity: confidence capped, risk low
    auto big = scanner.scan("P", {q("P", "ExB", 80.0, 90.0, 1e9), q("P", "ExA", 100.0, 110.0, 1e9)}, NOW);
    TEST_CHECK(big.value().confidence == config::CONFIDENCE_CAP);
    TEST_CHECK(big.value().risk_level == protocol::RiskLevel::Low);

    // Thin spread: high risk
    auto thin = scanner.scan("P", {q("P", "ExB", 98.0, 100.0), q("P", "ExA", 100.3, 101.0)}, NOW);
    TEST_CHECK(thin.value().risk_level == protocol::RiskLevel::High);
    TEST_CHECK(thin.value().confidence >= 0.0 && thin.value().confidence <= 100.0);
    std::cout << "[TEST] OK" << std::endl;
}

void test_ignores_other_pairs_and_bad_quotes() {
    std::cout << "[TEST] AS5: other pairs and unusable quotes are ignored..." << std::endl;
    Scanner scanner;
    const std::vector<Quote> quotes = {
        q("P", "ExA", 99.0, 100.0),
        q("Q", "ExQ", 500.0, 1.0),       // different pair
        q("P", "ExZ", 0.0, 0.0),         // no usable book
        q("P", "ExB", 100.5, 101.0),
    };
    auto opp = scanner.scan("P", quotes, NOW);
    TEST_CHECK(opp.has());
    TEST_CHECK(opp.value().buy.exchange == "ExA");
    TEST_CHECK(opp.value().sell.exchange == "ExB");
    std::cout << "[TEST] OK" << std::endl;
}

void test_scan_all_ranking() {
    std::cout << "[TEST] AS6: scan_all() ranking..." << std::endl;
    Scanner scanner;
    const std::vector<Quote> quotes = {
        q("SOL/USDT", "ExA", 100.0, 101.0), q("SOL/USDT", "ExB", 101.5, 102.0),   // ~0.495 %
        q("ETH/USDT", "ExA", 100.0, 101.0), q("ETH/USDT", "ExB", 103.0, 104.0),   // ~1.98 %
        q("BTC/USDT", "ExA", 100.0, 101.0), q("BTC/USDT", "ExB", 100.5, 101.0),   // none
    };
    const std::set<std::string> pairs = {"SOL/USDT", "ETH/USDT", "BTC/USDT", "XRP/USDT"};
    auto ranked = scanner.scan_all(pairs, quotes, NOW);
    TEST_CHECK(ranked.size() == 2);
    TEST_CHECK(ranked[0].pair == "ETH/USDT");
    TEST_CHECK(ranked[1].pair == "SOL/USDT");

    // Equal profit and confidence: id decides
    std::vector<Opportunity> v(3);
    v[0].id = "c"; v[1].id = "a"; v[2].id = "b";
    for (auto& o : v) { o.profit_percentage = 0.5; o.confidence = 60.0; }
    v[2].confidence = 70.0;
    Scanner::rank(v);
    TEST_CHECK(v[0].id == "b");
    TEST_CHECK(v[1].id == "a");
    TEST_CHECK(v[2].id == "c");
    std::cout << "[TEST] OK" << std::endl;
}

void test_same_exchange_best_sides() {
    std::cout << "[TEST] AS7: one exchange holds both the best bid and the best ask..." << std::endl;
    Scanner scanner;

    // ExA is cheapest and richest; selling on ExB is the only cross-venue spread
    auto opp = scanner.scan("P", {q("P", "ExA", 100.5, 99.0), q("P", "ExB", 100.0, 101.0)}, NOW);
    TEST_CHECK(opp.has());
    TEST_CHECK(opp.value().buy.exchange == "ExA");
    TEST_CHECK(opp.value().buy.price == 99.0);
    TEST_CHECK(opp.value().sell.exchange == "ExB");
    TEST_CHECK(opp.value().sell.price == 100.0);
    TEST_CHECK(near(opp.value().profit_percentage, 1.0 / 99.0 * 100.0));
    TEST_CHECK(opp.value().execution_path.back() == "Sell on ExB");

    // Keeping the shared sell side is wider here
    auto rev = scanner.scan("P", {q("P", "ExA", 102.0, 99.0), q("P", "ExB", 99.5, 100.0)}, NOW);
    TEST_CHECK(rev.has());
    TEST_CHECK(rev.value().buy.exchange == "ExB");
    TEST_CHECK(rev.value().sell.exchange == "ExA");
    TEST_CHECK(near(rev.value().profit_percentage, 2.0));

    // Best opposite side is taken across all remaining venues
    auto three = scanner.scan("P", {
        q("P", "ExA", 101.0, 99.0),
        q("P", "ExB", 100.0, 100.5),
        q("P", "ExC", 99.8, 99.5),
    }, NOW);
    TEST_CHECK(three.has());
    TEST_CHECK(three.value().buy.exchange == "ExC");
    TEST_CHECK(three.value().sell.exchange == "ExA");
    TEST_CHECK(near(three.value().profit_percentage, 1.5 / 99.5 * 100.0));

    // No cross-venue pairing clears the book
    TEST_CHECK(!scanner.scan("P", {q("P", "ExA", 100.5, 99.0), q("P", "ExB", 98.0, 101.0)}, NOW).has());
    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_reference_example();
    test_no_opportunity();
    test_tie_break();
    test_derived_fields();
    test_ignores_other_pairs_and_bad_quotes();
    test_scan_all_ranking();
    test_same_exchange_best_sides();

    std::cout << "\n[ARBITRAGE SCANNER TESTS PASSED]\n";
    return 0;
}
