// Copyright (c) 2025 The Splitmint developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "fixtures.h"

using namespace splitmint;

const address_t MintTestingSetup::administrator = "admin";
const address_t MintTestingSetup::buyer = "buyer";
const address_t MintTestingSetup::controllerAddress = "splitmint";
const address_t MintTestingSetup::paymentAsset = "asset:usdc";
const timestamp_t MintTestingSetup::now = 1700000000;

namespace {

MintConfiguration DefaultConfiguration()
{
    MintConfiguration configuration;
    configuration.max_supply = token_id_t{100};
    configuration.min_mint_amount = 100;
    configuration.payment_asset = MintTestingSetup::paymentAsset;
    return configuration;
}

} // namespace

MintTestingSetup::MintTestingSetup()
    : payments(paymentAsset, controllerAddress),
      controller(administrator, DefaultConfiguration(), payments, tokens, [] { return now; })
{
}

void MintTestingSetup::Fund(const address_t& holder, amount_t amount)
{
    payments.credit(holder, amount);
    payments.approve(holder, controllerAddress, payments.allowance(holder, controllerAddress) + amount);
}

void MintTestingSetup::MintWithPayment(token_id_t id,
                                       const std::vector<address_t>& recipients,
                                       const std::vector<amount_t>& amounts,
                                       amount_t declaredTotal)
{
    controller.mint_with_payment(administrator, buyer, id, recipients, amounts, "ipfs://token", declaredTotal);
}
