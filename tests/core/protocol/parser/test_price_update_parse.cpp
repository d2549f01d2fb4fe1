#include <iostream>
#include <string_view>
#include <vector>

#include "arbwire/core/protocol/parser/price_update.hpp"
#include "core/protocol/parser/parser.hpp"

using namespace arbwire::core::protocol;
using namespace arbwire::core::protocol::parser;
using tests::protocol::parser::Payload;

constexpr std::int64_t ENVELOPE_TS = 1'700'000'000'000;


void test_single_quote_full() {
    std::cout << "[TEST] price_update parser (single quote, all fields)..." << std::endl;
    Payload p(R"json({
        "pair": "SOL/USDT", "exchange": "Binance", "price": 100.5,
        "bid": 100.4, "ask": 100.6, "volume_24h": 1500000, "liquidity": 250000,
        "change_24h": -1.25, "fee": 0.075, "timestamp": 1700000001000
    })json");

    std::vector<schema::Quote> out;
    TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::Parsed);
    TEST_CHECK(out.size() == 1);
    const auto& q = out[0];
    TEST_CHECK(q.pair == "SOL/USDT");
    TEST_CHECK(q.exchange == "Binance");
    TEST_CHECK(q.price == 100.5);
    TEST_CHECK(q.bid == 100.4);
    TEST_CHECK(q.ask == 100.6);
    TEST_CHECK(q.volume_24h == 1500000.0);
    TEST_CHECK(q.liquidity == 250000.0);
    TEST_CHECK(q.change_24h == -1.25);
    TEST_CHECK(q.fee.has() && q.fee.value() == 0.075);
    TEST_CHECK(q.timestamp_ms == 1'700'000'001'000);
    std::cout << "[TEST] OK" << std::endl;
}

void test_single_quote_defaults() {
    std::cout << "[TEST] price_update parser (defaults and camelCase)..." << std::endl;
    Payload p(R"json({"pair":"ETH/USDT","exchange":"Orca","price":"2500.25","volume24h":42})json");

    std::vector<schema::Quote> out;
    TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::Parsed);
    const auto& q = out.at(0);
    // bid / ask fall back to price, numeric strings are accepted
    TEST_CHECK(q.price == 2500.25);
    TEST_CHECK(q.bid == 2500.25);
    TEST_CHECK(q.ask == 2500.25);
    TEST_CHECK(q.volume_24h == 42.0);
    TEST_CHECK(q.liquidity == 0.0);
    TEST_CHECK(!q.fee.has());
    // Envelope timestamp when the quote has none
    TEST_CHECK(q.timestamp_ms == ENVELOPE_TS);
    std::cout << "[TEST] OK" << std::endl;
}

void test_epoch_seconds_normalized() {
    std::cout << "[TEST] price_update parser (epoch seconds normalized)..." << std::endl;
    Payload p(R"json({"pair":"BTC/USDT","exchange":"Kraken","price":43000,"timestamp":1700000002})json");

    std::vector<schema::Quote> out;
    TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::Parsed);
    TEST_CHECK(out.at(0).timestamp_ms == 1'700'000'002'000);
    std::cout << "[TEST] OK" << std::endl;
}

void test_batch_form() {
    std::cout << "[TEST] price_update parser (batch form, malformed entry skipped)..." << std::endl;
    Payload p(R"json({"prices": {
        "SOL/USDT": [
            {"exchange":"Binance","price":100.0,"bid":99.9,"ask":100.1},
            {"exchange":"","price":100.0},
            {"exchange":"Orca","price":100.2}
        ],
        "ETH/USDT": [
            {"exchange":"Binance","price":2500.0}
        ]
    }})json");

    std::vector<schema::Quote> out;
    TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::Parsed);
    TEST_CHECK(out.size() == 3);
    TEST_CHECK(out[0].pair == "SOL/USDT");
    TEST_CHECK(out[0].exchange == "Binance");
    TEST_CHECK(out[1].exchange == "Orca");
    TEST_CHECK(out[2].pair == "ETH/USDT");
    std::cout << "[TEST] OK" << std::endl;
}

void test_batch_all_rejected() {
    std::cout << "[TEST] price_update parser (batch with no valid quote)..." << std::endl;
    Payload p(R"json({"prices": {"SOL/USDT": [{"exchange":"Binance","price":0}], "ETH/USDT": 5}})json");

    std::vector<schema::Quote> out;
    TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::InvalidSchema);
    TEST_CHECK(out.empty());
    std::cout << "[TEST] OK" << std::endl;
}

void test_rejections() {
    std::cout << "[TEST] price_update parser (required fields)..." << std::endl;
    std::vector<schema::Quote> out;
    {
        Payload p(R"json({"exchange":"Binance","price":1.0})json");
        TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::InvalidSchema);
    }
    {
        Payload p(R"json({"pair":"SOL/USDT","price":1.0})json");
        TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::InvalidSchema);
    }
    {
        Payload p(R"json({"pair":"SOL/USDT","exchange":"Binance"})json");
        TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::InvalidSchema);
    }
    {
        Payload p(R"json({"pair":"SOL/USDT","exchange":"Binance","price":-3})json");
        TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::InvalidValue);
    }
    {
        Payload p(R"json({"pair":"SOL/USDT","exchange":"Binance","price":"abc"})json");
        TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::InvalidValue);
    }
    {
        Payload p(R"json({"pair":"SOL/USDT","exchange":"Binance","price":1.0,"liquidity":-1})json");
        TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::InvalidValue);
    }
    {
        Payload p(R"json({"pair":"SOL/USDT","exchange":"Binance","price":1.0,"bid":true})json");
        TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::InvalidSchema);
    }
    {
        Payload p(R"json({"prices":[1,2,3]})json");
        TEST_CHECK(price_update::parse(p.root, ENVELOPE_TS, out) == Result::InvalidSchema);
    }
    TEST_CHECK(out.empty());
    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_single_quote_full();
    test_single_quote_defaults();
    test_epoch_seconds_normalized();
    test_batch_form();
    test_batch_all_rejected();
    test_rejections();

    std::cout << "\n[PRICE_UPDATE PARSER TESTS PASSED]\n";
    return 0;
}
