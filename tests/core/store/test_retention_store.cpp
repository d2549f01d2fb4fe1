/*
===============================================================================
 store::RetentionStore - Unit Tests
===============================================================================

Covered Requirements:
---------------------
R1. Capacity bound: size() never exceeds the cap, oldest evicted first
R2. Identity: a key appears at most once, updates replace in place of the
    old entry and move it according to the ordering
R3. Supersede rule: an older quote never replaces a newer one
R4. No identity: every item is retained as a new entry
R5. Snapshots are immutable once handed out

===============================================================================
*/

#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "arbwire/core/protocol/stores.hpp"
#include "common/test_check.hpp"

using namespace arbwire::core;
using namespace arbwire::core::store;
using namespace arbwire::core::protocol;

struct Item {
    std::string id;
    int value{0};
};

struct ItemKey {
    const std::string& operator()(const Item& i) const noexcept { return i.id; }
};

using RecentItems = RetentionStore<Item, ItemKey, Ordering::MostRecentFirst, 3>;
using FifoItems   = RetentionStore<Item, ItemKey, Ordering::InsertionOrder, 3>;
using Window      = RetentionStore<Item, no_identity, Ordering::MostRecentFirst, 2>;

static schema::Quote make_quote(const std::string& pair, const std::string& exchange, double price, std::int64_t ts) {
    schema::Quote q;
    q.pair = pair;
    q.exchange = exchange;
    q.price = q.bid = q.ask = price;
    q.timestamp_ms = ts;
    return q;
}


void test_capacity_most_recent_first() {
    std::cout << "[TEST] R1: capacity bound, most recent first..." << std::endl;
    RecentItems s;
    TEST_CHECK(s.empty());

    TEST_CHECK(s.upsert({"a", 1}) == UpsertResult::Inserted);
    TEST_CHECK(s.upsert({"b", 2}) == UpsertResult::Inserted);
    TEST_CHECK(s.upsert({"c", 3}) == UpsertResult::Inserted);
    TEST_CHECK(s.upsert({"d", 4}) == UpsertResult::Inserted);

    TEST_CHECK(s.size() == 3);
    TEST_CHECK(s.evicted_total() == 1);
    TEST_CHECK(s.entries()[0].id == "d");
    TEST_CHECK(s.entries()[2].id == "b");
    TEST_CHECK(!s.contains(std::string("a")));
    std::cout << "[TEST] OK" << std::endl;
}

void test_capacity_insertion_order() {
    std::cout << "[TEST] R1: capacity bound, insertion order..." << std::endl;
    FifoItems s;
    for (int i = 0; i < 10; ++i) {
        (void)s.upsert({"k" + std::to_string(i), i});
        TEST_CHECK(s.size() <= FifoItems::capacity);
    }
    TEST_CHECK(s.size() == 3);
    TEST_CHECK(s.entries().front().id == "k7");
    TEST_CHECK(s.entries().back().id == "k9");
    TEST_CHECK(s.evicted_total() == 7);
    std::cout << "[TEST] OK" << std::endl;
}

void test_identity_replaces() {
    std::cout << "[TEST] R2: identity deduplication..." << std::endl;
    RecentItems s;
    (void)s.upsert({"a", 1});
    (void)s.upsert({"b", 2});
    TEST_CHECK(s.upsert({"a", 10}) == UpsertResult::Replaced);

    TEST_CHECK(s.size() == 2);
    TEST_CHECK(s.entries()[0].id == "a");
    TEST_CHECK(s.entries()[0].value == 10);
    TEST_CHECK(s.find(std::string("a")).value().value == 10);
    TEST_CHECK(!s.find(std::string("zz")).has());

    // Replacing never evicts
    (void)s.upsert({"c", 3});
    TEST_CHECK(s.upsert({"b", 20}) == UpsertResult::Replaced);
    TEST_CHECK(s.size() == 3);
    TEST_CHECK(s.evicted_total() == 0);
    std::cout << "[TEST] OK" << std::endl;
}

void test_quote_supersede_rule() {
    std::cout << "[TEST] R3: older quote never replaces a newer one..." << std::endl;
    QuoteStore s;
    TEST_CHECK(s.upsert(make_quote("SOL/USDT", "Binance", 100.0, 2000)) == UpsertResult::Inserted);
    TEST_CHECK(s.upsert(make_quote("SOL/USDT", "Binance", 90.0, 1000)) == UpsertResult::Stale);
    TEST_CHECK(s.upsert(make_quote("SOL/USDT", "Orca", 101.0, 1000)) == UpsertResult::Inserted);
    TEST_CHECK(s.upsert(make_quote("SOL/USDT", "Binance", 102.0, 2000)) == UpsertResult::Replaced);

    using Key = std::pair<std::string_view, std::string_view>;
    auto q = s.find(Key{"SOL/USDT", "Binance"});
    TEST_CHECK(q.has());
    TEST_CHECK(q.value().price == 102.0);
    TEST_CHECK(s.size() == 2);

    // Least recently updated first: the refreshed quote moved behind Orca
    TEST_CHECK(s.entries()[0].exchange == "Orca");
    TEST_CHECK(s.entries()[1].exchange == "Binance");
    // A stale update does not move its entry
    TEST_CHECK(s.upsert(make_quote("SOL/USDT", "Orca", 99.0, 500)) == UpsertResult::Stale);
    TEST_CHECK(s.entries()[0].exchange == "Orca");
    std::cout << "[TEST] OK" << std::endl;
}

void test_quote_store_cap() {
    std::cout << "[TEST] R1/R3: quote store keeps at most 100 live quotes..." << std::endl;
    QuoteStore s;
    std::int64_t ts = 1;
    for (int round = 0; round < 3; ++round) {
        for (int p = 0; p < 12; ++p) {
            for (int e = 0; e < 17; ++e) {
                (void)s.upsert(make_quote("P" + std::to_string(p), "E" + std::to_string(e), 10.0, ts++));
                TEST_CHECK(s.size() <= config::QUOTE_STORE_CAPACITY);
            }
        }
    }
    TEST_CHECK(s.size() == config::QUOTE_STORE_CAPACITY);

    // Every key unique
    for (std::size_t i = 0; i < s.entries().size(); ++i) {
        for (std::size_t j = i + 1; j < s.entries().size(); ++j) {
            const auto& a = s.entries()[i];
            const auto& b = s.entries()[j];
            TEST_CHECK(!(a.pair == b.pair && a.exchange == b.exchange));
        }
    }
    std::cout << "[TEST] OK" << std::endl;
}

void test_no_identity_window() {
    std::cout << "[TEST] R4: no identity keeps a rolling window..." << std::endl;
    Window w;
    (void)w.upsert({"same", 1});
    (void)w.upsert({"same", 2});
    (void)w.upsert({"same", 3});
    TEST_CHECK(w.size() == 2);
    TEST_CHECK(w.entries()[0].value == 3);
    TEST_CHECK(w.entries()[1].value == 2);
    static_assert(!Window::has_identity);
    static_assert(DepthStore::capacity == 5);
    std::cout << "[TEST] OK" << std::endl;
}

void test_snapshot_immutable() {
    std::cout << "[TEST] R5: snapshots never change..." << std::endl;
    RecentItems s;
    (void)s.upsert({"a", 1});
    auto snap = s.snapshot();
    (void)s.upsert({"b", 2});
    s.clear();

    TEST_CHECK(snap->size() == 1);
    TEST_CHECK((*snap)[0].id == "a");
    TEST_CHECK(s.snapshot()->empty());
    TEST_CHECK(s.empty());
    std::cout << "[TEST] OK" << std::endl;
}

int main() {
    test_capacity_most_recent_first();
    test_capacity_insertion_order();
    test_identity_replaces();
    test_quote_supersede_rule();
    test_quote_store_cap();
    test_no_identity_window();
    test_snapshot_immutable();

    std::cout << "\n[RETENTION STORE TESTS PASSED]\n";
    return 0;
}
