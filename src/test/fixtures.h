// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SPLITMINT_TEST_FIXTURES_H
#define SPLITMINT_TEST_FIXTURES_H

#include "test_splitmint.h"

#include "../splitmint/controller.hpp"
#include "../splitmint/errors.hpp"
#include "../splitmint/memory_ledger.hpp"

#include <functional>
#include <vector>

/**
 * A controller over in-memory ledgers, with a fixed clock.
 * Max supply 100, minimum mint amount 100.
 */
struct MintTestingSetup : public BasicTestingSetup {
    static const splitmint::address_t administrator;
    static const splitmint::address_t buyer;
    static const splitmint::address_t controllerAddress;
    static const splitmint::address_t paymentAsset;
    static const splitmint::timestamp_t now;

    splitmint::MemoryPaymentLedger payments;
    splitmint::MemoryTokenStore tokens;
    splitmint::Controller controller;

    MintTestingSetup();

    // Gives `holder` the funds and grants the controller an allowance over them
    void Fund(const splitmint::address_t& holder, splitmint::amount_t amount);

    void MintWithPayment(splitmint::token_id_t id,
                         const std::vector<splitmint::address_t>& recipients,
                         const std::vector<splitmint::amount_t>& amounts,
                         splitmint::amount_t declaredTotal);
};

/** Collects every event delivered. */
class RecordingObserver : public splitmint::EventsObserver {
public:
    std::vector<splitmint::Event> events;

private:
    void process_event(const splitmint::Event& event) override { events.push_back(event); }
};

/** Predicate for BOOST_CHECK_EXCEPTION. */
inline std::function<bool(const splitmint::MintError&)> HasCode(splitmint::mint_errc code)
{
    return [code](const splitmint::MintError& e) { return e.code() == code; };
}

inline std::function<bool(const splitmint::PaymentError&)> HasKind(splitmint::payment_failure_kind kind)
{
    return [kind](const splitmint::PaymentError& e) { return e.kind() == kind; };
}

#endif // SPLITMINT_TEST_FIXTURES_H
