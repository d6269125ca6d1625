#include "../memory_ledger.hpp"

#include "../../test/test_splitmint.h"

#include <boost/test/unit_test.hpp>

#include <limits>
#include <stdexcept>

namespace splitmint {

BOOST_FIXTURE_TEST_SUITE(splitmint_memory_ledger_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(payment_ledger_requires_addresses)
{
    BOOST_CHECK_THROW(MemoryPaymentLedger("", "spender"), std::invalid_argument);
    BOOST_CHECK_THROW(MemoryPaymentLedger("asset", ""), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(transfer_from_consumes_allowance)
{
    MemoryPaymentLedger ledger("asset", "spender");
    ledger.credit("alice", 100);
    ledger.approve("alice", "spender", 70);

    BOOST_CHECK(ledger.transfer_from("alice", "bob", 50));
    BOOST_CHECK_EQUAL(50, ledger.balance_of("alice"));
    BOOST_CHECK_EQUAL(50, ledger.balance_of("bob"));
    BOOST_CHECK_EQUAL(20, ledger.allowance("alice", "spender"));

    // allowance exhausted
    BOOST_CHECK(!ledger.transfer_from("alice", "bob", 30));
    BOOST_CHECK_EQUAL(50, ledger.balance_of("alice"));
    BOOST_CHECK_EQUAL(20, ledger.allowance("alice", "spender"));
}

BOOST_AUTO_TEST_CASE(allowance_is_per_spender)
{
    MemoryPaymentLedger ledger("asset", "spender");
    ledger.credit("alice", 100);
    ledger.approve("alice", "someone-else", 100);

    BOOST_CHECK(!ledger.transfer_from("alice", "bob", 1));
    BOOST_CHECK_EQUAL(0, ledger.allowance("alice", "spender"));
    BOOST_CHECK_EQUAL(100, ledger.allowance("alice", "someone-else"));
}

BOOST_AUTO_TEST_CASE(insufficient_balance_or_null_parties)
{
    MemoryPaymentLedger ledger("asset", "spender");
    ledger.credit("alice", 10);
    ledger.approve("alice", "spender", 100);

    BOOST_CHECK(!ledger.transfer_from("alice", "bob", 11));
    BOOST_CHECK(!ledger.transfer_from("alice", "", 1));
    BOOST_CHECK(!ledger.transfer_from("", "bob", 0));
    BOOST_CHECK_EQUAL(10, ledger.balance_of("alice"));

    // zero-amount transfers always go through
    BOOST_CHECK(ledger.transfer_from("carol", "bob", 0));
}

BOOST_AUTO_TEST_CASE(credit_overflow)
{
    MemoryPaymentLedger ledger("asset", "spender");
    ledger.credit("alice", std::numeric_limits<amount_t>::max());
    BOOST_CHECK_THROW(ledger.credit("alice", 1), std::overflow_error);
    BOOST_CHECK_THROW(ledger.credit("", 1), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(receive_hook_sees_every_credit)
{
    MemoryPaymentLedger ledger("asset", "spender");
    ledger.credit("alice", 100);
    ledger.approve("alice", "spender", 100);

    std::vector<std::string> seen;
    ledger.set_receive_hook([&](const address_t& from, const address_t& to, amount_t amount) {
        seen.push_back(from + "->" + to + ":" + std::to_string(amount));
    });

    BOOST_CHECK(ledger.transfer_from("alice", "bob", 5));
    BOOST_CHECK(ledger.transfer_from("alice", "carol", 0));

    BOOST_CHECK_EQUAL(2, seen.size());
    BOOST_CHECK_EQUAL("alice->bob:5", seen[0]);
    BOOST_CHECK_EQUAL("alice->carol:0", seen[1]);
}

BOOST_AUTO_TEST_CASE(throwing_receive_hook_propagates)
{
    MemoryPaymentLedger ledger("asset", "spender");
    ledger.credit("alice", 100);
    ledger.approve("alice", "spender", 100);
    ledger.set_receive_hook([](const address_t&, const address_t&, amount_t) { throw std::runtime_error("rejected by recipient"); });

    ledger.begin_unit();
    BOOST_CHECK_THROW(static_cast<void>(ledger.transfer_from("alice", "bob", 5)), std::runtime_error);
    ledger.rollback_unit();

    BOOST_CHECK_EQUAL(100, ledger.balance_of("alice"));
    BOOST_CHECK_EQUAL(0, ledger.balance_of("bob"));
}

BOOST_AUTO_TEST_CASE(payment_units)
{
    MemoryPaymentLedger ledger("asset", "spender");
    ledger.credit("alice", 100);
    ledger.approve("alice", "spender", 100);

    ledger.begin_unit();
    BOOST_CHECK_THROW(ledger.begin_unit(), std::logic_error);
    BOOST_CHECK(ledger.transfer_from("alice", "bob", 40));
    ledger.commit_unit();
    BOOST_CHECK_THROW(ledger.commit_unit(), std::logic_error);

    ledger.begin_unit();
    BOOST_CHECK(ledger.transfer_from("alice", "bob", 40));
    ledger.rollback_unit();

    BOOST_CHECK_EQUAL(60, ledger.balance_of("alice"));
    BOOST_CHECK_EQUAL(40, ledger.balance_of("bob"));
    BOOST_CHECK_EQUAL(60, ledger.allowance("alice", "spender"));
}

BOOST_AUTO_TEST_CASE(payment_rollback_restores_every_touched_entry)
{
    MemoryPaymentLedger ledger("asset", "spender");
    ledger.credit("alice", 100);
    ledger.approve("alice", "spender", 100);

    ledger.begin_unit();
    BOOST_CHECK(ledger.transfer_from("alice", "bob", 10));
    BOOST_CHECK(ledger.transfer_from("alice", "bob", 20));
    BOOST_CHECK(ledger.transfer_from("alice", "carol", 30));
    ledger.approve("alice", "spender", 5);
    ledger.approve("dave", "spender", 50);
    ledger.credit("dave", 50);
    BOOST_CHECK(ledger.transfer_from("dave", "alice", 50));
    ledger.rollback_unit();

    BOOST_CHECK_EQUAL(100, ledger.balance_of("alice"));
    BOOST_CHECK_EQUAL(0, ledger.balance_of("bob"));
    BOOST_CHECK_EQUAL(0, ledger.balance_of("carol"));
    BOOST_CHECK_EQUAL(0, ledger.balance_of("dave"));
    BOOST_CHECK_EQUAL(100, ledger.allowance("alice", "spender"));
    BOOST_CHECK_EQUAL(0, ledger.allowance("dave", "spender"));

    // a committed unit leaves nothing behind for a later rollback
    ledger.begin_unit();
    BOOST_CHECK(ledger.transfer_from("alice", "bob", 10));
    ledger.commit_unit();
    ledger.begin_unit();
    ledger.rollback_unit();
    BOOST_CHECK_EQUAL(90, ledger.balance_of("alice"));
    BOOST_CHECK_EQUAL(10, ledger.balance_of("bob"));
}

BOOST_AUTO_TEST_CASE(token_lifecycle)
{
    MemoryTokenStore store;
    store.create(token_id_t{3}, "alice", "ipfs://3");
    store.create(token_id_t{1}, "alice", "ipfs://1");
    store.create(token_id_t{2}, "bob", "ipfs://2");

    BOOST_CHECK_EQUAL(3, store.size());
    BOOST_CHECK(store.exists(token_id_t{2}));
    BOOST_CHECK(store.owner_of(token_id_t{1}) == address_t("alice"));
    BOOST_CHECK(store.uri_of(token_id_t{3}) == std::string("ipfs://3"));
    BOOST_CHECK(store.tokens_of("alice") == std::vector<token_id_t>({token_id_t{1}, token_id_t{3}}));

    store.set_uri(token_id_t{1}, "ipfs://1b");
    BOOST_CHECK(store.uri_of(token_id_t{1}) == std::string("ipfs://1b"));

    store.transfer(token_id_t{1}, "alice", "bob");
    BOOST_CHECK(store.owner_of(token_id_t{1}) == address_t("bob"));

    store.burn(token_id_t{1});
    BOOST_CHECK(!store.exists(token_id_t{1}));
    BOOST_CHECK(!store.owner_of(token_id_t{1}));
    BOOST_CHECK(!store.uri_of(token_id_t{1}));
    BOOST_CHECK_EQUAL(2, store.size());
}

BOOST_AUTO_TEST_CASE(token_store_rejections)
{
    MemoryTokenStore store;
    store.create(token_id_t{1}, "alice", "");

    BOOST_CHECK_THROW(store.create(token_id_t{1}, "bob", ""), std::domain_error);
    BOOST_CHECK_THROW(store.create(token_id_t{2}, "", ""), std::invalid_argument);
    BOOST_CHECK_THROW(store.transfer(token_id_t{1}, "bob", "carol"), std::domain_error);
    BOOST_CHECK_THROW(store.transfer(token_id_t{1}, "alice", ""), std::invalid_argument);
    BOOST_CHECK_THROW(store.transfer(token_id_t{9}, "alice", "bob"), std::invalid_argument);
    BOOST_CHECK_THROW(store.set_uri(token_id_t{9}, ""), std::invalid_argument);
    BOOST_CHECK_THROW(store.burn(token_id_t{9}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(token_units)
{
    MemoryTokenStore store;
    store.create(token_id_t{1}, "alice", "");

    store.begin_unit();
    store.create(token_id_t{2}, "alice", "");
    store.burn(token_id_t{1});
    store.rollback_unit();

    BOOST_CHECK(store.exists(token_id_t{1}));
    BOOST_CHECK(!store.exists(token_id_t{2}));

    store.begin_unit();
    store.create(token_id_t{2}, "alice", "");
    store.commit_unit();
    BOOST_CHECK(store.exists(token_id_t{2}));
}

BOOST_AUTO_TEST_CASE(token_rollback_undoes_repeated_changes)
{
    MemoryTokenStore store;
    store.create(token_id_t{1}, "alice", "ipfs://1");
    store.create(token_id_t{2}, "bob", "ipfs://2");

    store.begin_unit();
    store.set_uri(token_id_t{1}, "ipfs://changed");
    store.transfer(token_id_t{1}, "alice", "bob");
    store.transfer(token_id_t{1}, "bob", "carol");
    store.burn(token_id_t{1});
    store.create(token_id_t{1}, "dave", "ipfs://new");
    store.burn(token_id_t{2});
    store.create(token_id_t{3}, "alice", "");
    store.burn(token_id_t{3});
    store.create(token_id_t{4}, "alice", "");
    store.rollback_unit();

    BOOST_CHECK_EQUAL(2, store.size());
    BOOST_CHECK(store.owner_of(token_id_t{1}) == address_t("alice"));
    BOOST_CHECK(store.uri_of(token_id_t{1}) == std::string("ipfs://1"));
    BOOST_CHECK(store.owner_of(token_id_t{2}) == address_t("bob"));
    BOOST_CHECK(store.uri_of(token_id_t{2}) == std::string("ipfs://2"));
    BOOST_CHECK(!store.exists(token_id_t{3}));
    BOOST_CHECK(!store.exists(token_id_t{4}));

    // the store is usable for the next unit
    store.begin_unit();
    store.burn(token_id_t{2});
    store.commit_unit();
    BOOST_CHECK(!store.exists(token_id_t{2}));
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace splitmint
