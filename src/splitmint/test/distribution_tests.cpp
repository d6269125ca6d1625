#include "../distribution.hpp"
#include "../memory_ledger.hpp"

#include "../../test/fixtures.h"
#include "../../test/test_splitmint.h"

#include <boost/test/unit_test.hpp>

#include <limits>
#include <stdexcept>
#include <vector>

namespace splitmint {
namespace {

struct DistributionTestingSetup : public BasicTestingSetup {
    MemoryPaymentLedger ledger;

    DistributionTestingSetup() : ledger("asset:usdc", "spender")
    {
        ledger.credit("payer", 1000);
        ledger.approve("payer", "spender", 1000);
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(splitmint_distribution_tests, DistributionTestingSetup)

BOOST_AUTO_TEST_CASE(split_with_residual)
{
    std::vector<Payout> payouts{{"A", 30}, {"B", 20}};

    ledger.begin_unit();
    auto receipt = distribute(ledger, "payer", payouts, 100, "admin");
    ledger.commit_unit();

    BOOST_CHECK_EQUAL(50, receipt.commissions_total);
    BOOST_CHECK_EQUAL(50, receipt.residual);
    BOOST_CHECK_EQUAL(3, receipt.transfers);

    BOOST_CHECK_EQUAL(900, ledger.balance_of("payer"));
    BOOST_CHECK_EQUAL(30, ledger.balance_of("A"));
    BOOST_CHECK_EQUAL(20, ledger.balance_of("B"));
    BOOST_CHECK_EQUAL(50, ledger.balance_of("admin"));
    BOOST_CHECK_EQUAL(900, ledger.allowance("payer", "spender"));
}

BOOST_AUTO_TEST_CASE(zero_residual_and_zero_commission)
{
    std::vector<Payout> payouts{{"A", 0}, {"B", 100}};

    auto receipt = distribute(ledger, "payer", payouts, 100, "admin");

    BOOST_CHECK_EQUAL(0, receipt.residual);
    BOOST_CHECK_EQUAL(3, receipt.transfers);
    BOOST_CHECK_EQUAL(0, ledger.balance_of("A"));
    BOOST_CHECK_EQUAL(100, ledger.balance_of("B"));
    BOOST_CHECK_EQUAL(0, ledger.balance_of("admin"));
}

BOOST_AUTO_TEST_CASE(no_recipients)
{
    auto receipt = distribute(ledger, "payer", std::vector<Payout>{}, 250, "admin");

    BOOST_CHECK_EQUAL(0, receipt.commissions_total);
    BOOST_CHECK_EQUAL(250, receipt.residual);
    BOOST_CHECK_EQUAL(250, ledger.balance_of("admin"));
}

BOOST_AUTO_TEST_CASE(amounts_exceeding_total_move_nothing)
{
    std::vector<Payout> payouts{{"A", 60}, {"B", 50}};

    BOOST_CHECK_EXCEPTION(
        distribute(ledger, "payer", payouts, 100, "admin"),
        PaymentError,
        HasKind(payment_failure_kind::amounts_exceed_total)
    );

    BOOST_CHECK_EQUAL(1000, ledger.balance_of("payer"));
    BOOST_CHECK_EQUAL(0, ledger.balance_of("A"));
    BOOST_CHECK_EQUAL(0, ledger.balance_of("B"));
}

BOOST_AUTO_TEST_CASE(overflowing_sum_exceeds_total)
{
    std::vector<Payout> payouts{{"A", std::numeric_limits<amount_t>::max()}, {"B", 2}};

    BOOST_CHECK_EXCEPTION(
        validate_payouts(payouts, 100, "admin"),
        PaymentError,
        HasKind(payment_failure_kind::amounts_exceed_total)
    );
}

BOOST_AUTO_TEST_CASE(invalid_recipients)
{
    std::vector<Payout> payouts{{"A", 10}, {"", 10}};

    BOOST_CHECK_EXCEPTION(
        validate_payouts(payouts, 100, "admin"),
        PaymentError,
        [](const PaymentError& e) {
            return e.failure() == (PaymentFailure{payment_failure_kind::invalid_recipient, 1});
        }
    );

    BOOST_CHECK_EXCEPTION(
        validate_payouts(std::vector<Payout>{{"A", 10}}, 100, ""),
        PaymentError,
        [](const PaymentError& e) {
            return e.kind() == payment_failure_kind::invalid_recipient && !e.index();
        }
    );
}

BOOST_AUTO_TEST_CASE(length_mismatch)
{
    std::vector<address_t> recipients{"A", "B"};
    std::vector<amount_t> amounts{10};

    BOOST_CHECK_EXCEPTION(
        distribute(ledger, "payer", recipients, amounts, 100, "admin"),
        PaymentError,
        HasKind(payment_failure_kind::length_mismatch)
    );
    BOOST_CHECK_EQUAL(1000, ledger.balance_of("payer"));
}

BOOST_AUTO_TEST_CASE(refused_commission_reports_its_index)
{
    ledger.approve("payer", "spender", 40);
    std::vector<Payout> payouts{{"A", 30}, {"B", 20}};

    ledger.begin_unit();
    BOOST_CHECK_EXCEPTION(
        distribute(ledger, "payer", payouts, 100, "admin"),
        PaymentError,
        [](const PaymentError& e) {
            return e.failure() == (PaymentFailure{payment_failure_kind::transfer_failed, 1});
        }
    );
    BOOST_CHECK_EQUAL(30, ledger.balance_of("A"));
    ledger.rollback_unit();

    BOOST_CHECK_EQUAL(0, ledger.balance_of("A"));
    BOOST_CHECK_EQUAL(1000, ledger.balance_of("payer"));
    BOOST_CHECK_EQUAL(40, ledger.allowance("payer", "spender"));
}

BOOST_AUTO_TEST_CASE(refused_residual)
{
    ledger.approve("payer", "spender", 60);
    std::vector<Payout> payouts{{"A", 30}, {"B", 20}};

    BOOST_CHECK_EXCEPTION(
        distribute(ledger, "payer", payouts, 100, "admin"),
        PaymentError,
        [](const PaymentError& e) {
            return e.failure() == (PaymentFailure{payment_failure_kind::residual_transfer_failed, std::nullopt});
        }
    );
}

BOOST_AUTO_TEST_CASE(describe_failures)
{
    BOOST_CHECK_EQUAL("TransferFailed{index=2}", describe(PaymentFailure{payment_failure_kind::transfer_failed, 2}));
    BOOST_CHECK_EQUAL("AmountsExceedTotal", describe(PaymentFailure{payment_failure_kind::amounts_exceed_total, std::nullopt}));
    BOOST_CHECK_EQUAL(
        std::string("Payment distribution failed: ResidualTransferFailed"),
        PaymentError(payment_failure_kind::residual_transfer_failed).what()
    );
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace splitmint
