#include <gtest/gtest.h>
#include <remit/settlement/payment_engine.hpp>
#include <remit/testing/settlement_fixture.hpp>

#include <memory>
#include <optional>
#include <string>

namespace {

namespace accounts = remit::testing::accounts;
using remit::schema::transaction_error_code;
using remit::testing::make_native_intent;
using remit::testing::make_token_intent;
using remit::testing::with_exchange;

class payment_engine_test : public ::testing::Test {
 protected:
  /// Mint `amount` of `token` to the payer and approve the engine for it.
  void fund_payer(remit::token::ledger_token& token,
                  const remit::schema::amount_t& amount) {
    token.mint(accounts::payer, amount);
    token.approve(accounts::payer, accounts::engine, amount);
  }

  const remit::schema::transaction_event_t* last_event(
      const std::string& type) {
    const auto& events = world_.host().state().events();
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
      if (it->type == type) {
        return &*it;
      }
    }
    return nullptr;
  }

  remit::testing::settlement_world world_;
};

}  // namespace

TEST(select_funding_path, prefers_native_then_signature_then_allowance) {
  auto intent = make_native_intent(1, 1);
  intent.signature_transfer_data.use_signature_transfer = true;
  EXPECT_EQ(remit::settlement::select_funding_path(intent),
            remit::schema::funding_path_t::native_wrap);
  intent.token_in = accounts::token_a;
  EXPECT_EQ(remit::settlement::select_funding_path(intent),
            remit::schema::funding_path_t::signature_transfer);
  intent.signature_transfer_data.use_signature_transfer = false;
  EXPECT_EQ(remit::settlement::select_funding_path(intent),
            remit::schema::funding_path_t::allowance_transfer);
}

TEST_F(payment_engine_test, native_payment_refunds_surplus_and_splits_fee) {
  world_.host().credit_native(accounts::payer, 1000);

  auto error =
      world_.settle(accounts::payer, make_native_intent(1000, 990), 1000);
  ASSERT_FALSE(error.has_value()) << world_.last_error();

  EXPECT_EQ(world_.native_balance(accounts::merchant), 983);
  EXPECT_EQ(world_.native_balance(accounts::fee_receiver), 7);
  EXPECT_EQ(world_.native_balance(accounts::payer), 10);
  EXPECT_EQ(world_.native_balance(accounts::engine), 0);
  EXPECT_EQ(world_.wrapped().total_supply(), 0);

  const auto* success = last_event("PaymentSuccess");
  ASSERT_NE(success, nullptr);
  EXPECT_EQ(remit::schema::find_attribute(*success, "amount"), "983");
  EXPECT_EQ(remit::schema::find_attribute(*success, "fee"), "7");
  EXPECT_EQ(remit::schema::find_attribute(*success, "receipt_amount"), "990");
  EXPECT_EQ(remit::schema::find_attribute(*success, "funding_path"),
            "native_wrap");
  EXPECT_EQ(remit::schema::find_attribute(*success, "payer"),
            remit::schema::to_string(accounts::payer));
}

TEST_F(payment_engine_test, native_payment_settles_in_wrapped_token) {
  world_.host().credit_native(accounts::payer, 1000);
  auto intent = make_native_intent(1000, 990);
  intent.receipt_token = accounts::wrapped_native;

  auto error = world_.settle(accounts::payer, intent, 1000);
  ASSERT_FALSE(error.has_value()) << world_.last_error();

  EXPECT_EQ(world_.wrapped().balance_of(accounts::merchant), 983);
  EXPECT_EQ(world_.wrapped().balance_of(accounts::fee_receiver), 7);
  EXPECT_EQ(world_.wrapped().balance_of(accounts::engine), 0);
  EXPECT_EQ(world_.native_balance(accounts::payer), 10);
  EXPECT_EQ(world_.native_balance(accounts::merchant), 0);
  EXPECT_EQ(world_.wrapped().total_supply(), 990);
}

TEST_F(payment_engine_test, token_payment_uses_allowance) {
  fund_payer(world_.token_a(), 1000);

  auto error = world_.settle(accounts::payer,
                             make_token_intent(accounts::token_a, 1000, 1000));
  ASSERT_FALSE(error.has_value()) << world_.last_error();

  EXPECT_EQ(world_.token_a().balance_of(accounts::merchant), 992);
  EXPECT_EQ(world_.token_a().balance_of(accounts::fee_receiver), 8);
  EXPECT_EQ(world_.token_a().balance_of(accounts::payer), 0);
  EXPECT_EQ(world_.token_a().balance_of(accounts::engine), 0);
  EXPECT_EQ(world_.token_a().allowance(accounts::payer, accounts::engine), 0);
}

TEST_F(payment_engine_test, exchange_returns_unspent_input_to_payer) {
  fund_payer(world_.token_a(), 1000);
  world_.token_b().mint(accounts::exchange, 1000);

  auto intent = make_token_intent(accounts::token_a, 1000, 900);
  intent.receipt_token = accounts::token_b;
  intent = with_exchange(intent, accounts::token_a, accounts::token_b, 950,
                         900);

  auto error = world_.settle(accounts::payer, intent);
  ASSERT_FALSE(error.has_value()) << world_.last_error();

  EXPECT_EQ(world_.exchange().calls, 1);
  EXPECT_EQ(world_.token_a().balance_of(accounts::payer), 50);
  EXPECT_EQ(world_.token_a().balance_of(accounts::exchange), 950);
  EXPECT_EQ(world_.token_b().balance_of(accounts::merchant), 893);
  EXPECT_EQ(world_.token_b().balance_of(accounts::fee_receiver), 7);
  EXPECT_EQ(world_.token_a().balance_of(accounts::engine), 0);
  EXPECT_EQ(world_.token_b().balance_of(accounts::engine), 0);
}

TEST_F(payment_engine_test, exchange_surplus_output_is_refunded) {
  fund_payer(world_.token_a(), 1000);
  world_.token_b().mint(accounts::exchange, 1000);

  auto intent = make_token_intent(accounts::token_a, 1000, 900);
  intent.receipt_token = accounts::token_b;
  intent = with_exchange(intent, accounts::token_a, accounts::token_b, 1000,
                         950);

  ASSERT_FALSE(world_.settle(accounts::payer, intent).has_value())
      << world_.last_error();
  EXPECT_EQ(world_.token_b().balance_of(accounts::payer), 50);
  EXPECT_EQ(world_.token_b().balance_of(accounts::merchant), 893);
}

TEST_F(payment_engine_test, native_input_exchange_refunds_native) {
  world_.host().credit_native(accounts::payer, 1000);
  world_.token_b().mint(accounts::exchange, 1000);

  auto intent = make_native_intent(1000, 900);
  intent.receipt_token = accounts::token_b;
  intent = with_exchange(intent, accounts::wrapped_native, accounts::token_b,
                         950, 900);

  ASSERT_FALSE(world_.settle(accounts::payer, intent, 1000).has_value())
      << world_.last_error();
  EXPECT_EQ(world_.native_balance(accounts::payer), 50);
  EXPECT_EQ(world_.wrapped().balance_of(accounts::exchange), 950);
  EXPECT_EQ(world_.token_b().balance_of(accounts::merchant), 893);
  EXPECT_EQ(world_.wrapped().balance_of(accounts::engine), 0);
}

TEST_F(payment_engine_test, native_receipt_through_exchange_unwraps) {
  fund_payer(world_.token_a(), 1000);
  world_.host().credit_native(accounts::exchange, 900);
  world_.wrapped().deposit(accounts::exchange, 900);

  auto intent = make_token_intent(accounts::token_a, 1000, 900);
  intent.receipt_token = remit::schema::kNativeToken;
  intent = with_exchange(intent, accounts::token_a, accounts::wrapped_native,
                         1000, 900);

  ASSERT_FALSE(world_.settle(accounts::payer, intent).has_value())
      << world_.last_error();
  EXPECT_EQ(world_.native_balance(accounts::merchant), 893);
  EXPECT_EQ(world_.native_balance(accounts::fee_receiver), 7);
  EXPECT_EQ(world_.wrapped().balance_of(accounts::engine), 0);
}

TEST_F(payment_engine_test, short_exchange_output_rolls_everything_back) {
  fund_payer(world_.token_a(), 1000);
  world_.token_b().mint(accounts::exchange, 1000);

  auto intent = make_token_intent(accounts::token_a, 1000, 900);
  intent.receipt_token = accounts::token_b;
  intent = with_exchange(intent, accounts::token_a, accounts::token_b, 1000,
                         800);

  EXPECT_EQ(world_.settle(accounts::payer, intent),
            transaction_error_code::insufficient_settlement_amount);
  EXPECT_EQ(world_.token_a().balance_of(accounts::payer), 1000);
  EXPECT_EQ(world_.token_b().balance_of(accounts::exchange), 1000);
  EXPECT_EQ(world_.token_a().allowance(accounts::payer, accounts::engine),
            1000);
}

TEST_F(payment_engine_test, exchange_returning_input_is_an_accounting_error) {
  fund_payer(world_.token_a(), 1000);
  world_.token_a().mint(accounts::exchange, 5);

  auto intent = make_token_intent(accounts::token_a, 1000, 1000);
  intent = with_exchange(intent, accounts::token_a, accounts::token_a, 0, 5);

  EXPECT_EQ(world_.settle(accounts::payer, intent),
            transaction_error_code::exchange_accounting_mismatch);
}

TEST_F(payment_engine_test, failing_exchange_is_reported) {
  fund_payer(world_.token_a(), 1000);
  auto intent = make_token_intent(accounts::token_a, 1000, 1000);
  intent.exchange_type = remit::schema::exchange_type_t::exchange;
  intent.exchange_address = accounts::exchange;
  intent.exchange_call_data = {0xFF};

  EXPECT_EQ(world_.settle(accounts::payer, intent),
            transaction_error_code::exchange_call_failed);
  EXPECT_EQ(world_.token_a().balance_of(accounts::payer), 1000);
}

TEST_F(payment_engine_test, exchange_requires_an_address) {
  fund_payer(world_.token_a(), 1000);
  auto intent = make_token_intent(accounts::token_a, 1000, 1000);
  intent.exchange_type = remit::schema::exchange_type_t::exchange;

  EXPECT_EQ(world_.settle(accounts::payer, intent),
            transaction_error_code::invalid_exchange_address);
}

TEST_F(payment_engine_test, rejects_invalid_intents) {
  world_.host().credit_native(accounts::payer, 5000);
  fund_payer(world_.token_a(), 1000);

  EXPECT_EQ(world_.settle(accounts::payer, make_native_intent(0, 0)),
            transaction_error_code::invalid_payment_amount);
  EXPECT_EQ(world_.settle(accounts::payer, make_native_intent(1000, 990), 999),
            transaction_error_code::invalid_native_payment_amount);
  EXPECT_EQ(world_.settle(accounts::payer,
                          make_token_intent(accounts::token_a, 100, 100), 1),
            transaction_error_code::invalid_native_payment_amount);

  auto expired = make_native_intent(1000, 990);
  expired.deadline = remit::testing::kGenesisTime - 1;
  EXPECT_EQ(world_.settle(accounts::payer, expired, 1000),
            transaction_error_code::payment_expired);

  EXPECT_EQ(world_.native_balance(accounts::payer), 5000);
}

TEST_F(payment_engine_test, amount_checks_run_before_the_deadline) {
  world_.host().credit_native(accounts::payer, 5000);

  auto zero = make_native_intent(0, 0);
  zero.deadline = remit::testing::kGenesisTime - 1;
  EXPECT_EQ(world_.settle(accounts::payer, zero),
            transaction_error_code::invalid_payment_amount);

  auto mismatched = make_native_intent(1000, 990);
  mismatched.deadline = remit::testing::kGenesisTime - 1;
  EXPECT_EQ(world_.settle(accounts::payer, mismatched, 999),
            transaction_error_code::invalid_native_payment_amount);
}

TEST_F(payment_engine_test, engine_cannot_be_its_own_payee) {
  fund_payer(world_.token_a(), 1000);
  EXPECT_EQ(world_.settle(accounts::payer,
                          make_token_intent(accounts::token_a, 1000, 1000,
                                            accounts::engine)),
            transaction_error_code::invalid_address);
  EXPECT_EQ(world_.token_a().balance_of(accounts::payer), 1000);
  EXPECT_EQ(world_.token_a().balance_of(accounts::engine), 0);

  EXPECT_EQ(world_.govern([](auto& engine) {
    engine.set_fee_receiver(accounts::owner, accounts::engine);
  }),
            transaction_error_code::invalid_address);
  EXPECT_EQ(world_.engine().fee_receiver(), accounts::fee_receiver);
  EXPECT_EQ(world_.govern([](auto& engine) {
    engine.set_fee_receiver(accounts::stranger, accounts::merchant);
  }),
            transaction_error_code::unauthorized_account);
}

TEST_F(payment_engine_test, deadline_equal_to_now_is_accepted) {
  world_.host().credit_native(accounts::payer, 100);
  auto intent = make_native_intent(100, 100);
  intent.deadline = remit::testing::kGenesisTime;
  EXPECT_FALSE(world_.settle(accounts::payer, intent, 100).has_value())
      << world_.last_error();
}

TEST_F(payment_engine_test, missing_allowance_surfaces_collaborator_revert) {
  world_.token_a().mint(accounts::payer, 1000);
  EXPECT_EQ(world_.settle(accounts::payer,
                          make_token_intent(accounts::token_a, 1000, 1000)),
            transaction_error_code::collaborator_reverted);
  EXPECT_EQ(world_.last_error(), "insufficient allowance");
}

TEST_F(payment_engine_test, rejecting_native_receiver_reverts_payment) {
  const auto receiver = remit::testing::make_address(0x70);
  world_.deploy<remit::testing::failing_contract>(receiver);
  world_.host().credit_native(accounts::payer, 1000);

  EXPECT_EQ(world_.settle(accounts::payer,
                          make_native_intent(1000, 1000, receiver), 1000),
            transaction_error_code::receiver_native_payment_failed);
  EXPECT_EQ(world_.native_balance(accounts::payer), 1000);
  EXPECT_EQ(world_.native_balance(accounts::fee_receiver), 0);
}

TEST_F(payment_engine_test, rejecting_fee_receiver_reverts_payment) {
  const auto rejecting = remit::testing::make_address(0x71);
  world_.deploy<remit::testing::failing_contract>(rejecting);
  ASSERT_FALSE(world_.govern([&](auto& engine) {
    engine.set_fee_receiver(accounts::owner, rejecting);
  }));
  world_.host().credit_native(accounts::payer, 1000);

  EXPECT_EQ(world_.settle(accounts::payer, make_native_intent(1000, 1000),
                          1000),
            transaction_error_code::service_fee_native_payment_failed);
}

TEST_F(payment_engine_test, zero_fee_skips_the_fee_transfer) {
  const auto rejecting = remit::testing::make_address(0x71);
  world_.deploy<remit::testing::failing_contract>(rejecting);
  ASSERT_FALSE(world_.govern([&](auto& engine) {
    engine.set_fee_receiver(accounts::owner, rejecting);
    engine.set_service_fee_percent(accounts::owner, 0);
  }));
  world_.host().credit_native(accounts::payer, 1000);

  ASSERT_FALSE(world_
                   .settle(accounts::payer, make_native_intent(1000, 1000),
                           1000)
                   .has_value())
      << world_.last_error();
  EXPECT_EQ(world_.native_balance(accounts::merchant), 1000);
}

TEST_F(payment_engine_test, receiver_call_data_is_delivered) {
  const auto receiver = remit::testing::make_address(0x72);
  auto recorder = world_.deploy<remit::testing::recording_receiver>(receiver);
  fund_payer(world_.token_a(), 1000);

  auto intent = make_token_intent(accounts::token_a, 1000, 1000, receiver);
  intent.receiver_call_data = {0xCA, 0xFE};
  ASSERT_FALSE(world_.settle(accounts::payer, intent).has_value())
      << world_.last_error();

  EXPECT_EQ(world_.token_a().balance_of(receiver), 992);
  ASSERT_EQ(recorder->calls.size(), 1u);
  EXPECT_EQ(recorder->calls.front().caller, accounts::engine);
  EXPECT_EQ(recorder->calls.front().data, intent.receiver_call_data);
}

TEST_F(payment_engine_test, native_receiver_gets_net_value_with_data) {
  const auto receiver = remit::testing::make_address(0x72);
  auto recorder = world_.deploy<remit::testing::recording_receiver>(receiver);
  world_.host().credit_native(accounts::payer, 1000);

  auto intent = make_native_intent(1000, 1000, receiver);
  intent.receiver_call_data = {0x01};
  ASSERT_FALSE(world_.settle(accounts::payer, intent, 1000).has_value())
      << world_.last_error();

  ASSERT_EQ(recorder->calls.size(), 1u);
  EXPECT_EQ(recorder->calls.front().value, 992);
  EXPECT_EQ(recorder->calls.front().data, intent.receiver_call_data);
}

TEST_F(payment_engine_test, failing_receiver_call_reverts_token_payment) {
  const auto receiver = remit::testing::make_address(0x73);
  world_.deploy<remit::testing::failing_contract>(receiver);
  fund_payer(world_.token_a(), 1000);

  auto intent = make_token_intent(accounts::token_a, 1000, 1000, receiver);
  intent.receiver_call_data = {0x01};
  EXPECT_EQ(world_.settle(accounts::payer, intent),
            transaction_error_code::receiver_call_failed);
  EXPECT_EQ(world_.token_a().balance_of(accounts::payer), 1000);
}

TEST_F(payment_engine_test, special_fee_overrides_and_zero_falls_back) {
  ASSERT_FALSE(world_.govern([](auto& engine) {
    engine.set_special_fee(accounts::owner, accounts::merchant, 50);
  }));
  EXPECT_EQ(world_.engine().get_service_fee(accounts::merchant), 50);
  EXPECT_EQ(world_.engine().get_service_fee(accounts::stranger), 80);

  fund_payer(world_.token_a(), 2000);
  ASSERT_FALSE(world_
                   .settle(accounts::payer,
                           make_token_intent(accounts::token_a, 1000, 1000))
                   .has_value());
  EXPECT_EQ(world_.token_a().balance_of(accounts::fee_receiver), 5);

  ASSERT_FALSE(world_.govern([](auto& engine) {
    engine.set_special_fee(accounts::owner, accounts::merchant, 0);
  }));
  EXPECT_EQ(world_.engine().get_service_fee(accounts::merchant), 80);
  ASSERT_FALSE(world_
                   .settle(accounts::payer,
                           make_token_intent(accounts::token_a, 1000, 1000))
                   .has_value());
  EXPECT_EQ(world_.token_a().balance_of(accounts::fee_receiver), 13);
}

TEST_F(payment_engine_test, paused_engine_rejects_settlement) {
  world_.host().credit_native(accounts::payer, 1000);
  ASSERT_FALSE(
      world_.govern([](auto& engine) { engine.pause(accounts::owner); }));

  EXPECT_EQ(world_.settle(accounts::payer, make_native_intent(1000, 1000),
                          1000),
            transaction_error_code::enforced_pause);

  ASSERT_FALSE(
      world_.govern([](auto& engine) { engine.unpause(accounts::owner); }));
  EXPECT_FALSE(world_
                   .settle(accounts::payer, make_native_intent(1000, 1000),
                           1000)
                   .has_value());
}

TEST_F(payment_engine_test, reentrant_settlement_is_blocked) {
  const auto receiver = remit::testing::make_address(0x74);
  auto inner = make_native_intent(1, 1);
  auto attacker = world_.deploy<remit::testing::reentrant_receiver>(
      receiver, accounts::engine,
      remit::testing::scale_encoder_t{}.encode(inner));
  world_.host().credit_native(accounts::payer, 1000);

  EXPECT_EQ(world_.settle(accounts::payer,
                          make_native_intent(1000, 1000, receiver), 1000),
            transaction_error_code::receiver_native_payment_failed);
  EXPECT_NE(attacker->last_reason.find("reentrant_call"), std::string::npos);
  EXPECT_FALSE(world_.engine().paused());
  EXPECT_EQ(world_.native_balance(accounts::payer), 1000);
}

TEST_F(payment_engine_test, reentry_from_exchange_is_blocked) {
  const auto hostile_exchange = remit::testing::make_address(0x75);
  auto attacker = world_.deploy<remit::testing::reentrant_receiver>(
      hostile_exchange, accounts::engine,
      remit::testing::scale_encoder_t{}.encode(
          make_token_intent(accounts::token_a, 1, 1)));
  fund_payer(world_.token_a(), 1000);

  auto intent = make_token_intent(accounts::token_a, 1000, 1000);
  intent.exchange_type = remit::schema::exchange_type_t::exchange;
  intent.exchange_address = hostile_exchange;
  intent.exchange_call_data = {0x01};

  EXPECT_EQ(world_.settle(accounts::payer, intent),
            transaction_error_code::exchange_call_failed);
  EXPECT_NE(attacker->last_reason.find("reentrant_call"), std::string::npos);
  EXPECT_EQ(world_.token_a().balance_of(accounts::payer), 1000);
  EXPECT_EQ(world_.token_a().balance_of(accounts::engine), 0);
  EXPECT_EQ(world_.token_a().allowance(accounts::engine, hostile_exchange), 0);
}

TEST_F(payment_engine_test, reentry_from_token_receiver_callback_is_blocked) {
  const auto receiver = remit::testing::make_address(0x76);
  auto attacker = world_.deploy<remit::testing::reentrant_receiver>(
      receiver, accounts::engine,
      remit::testing::scale_encoder_t{}.encode(
          make_token_intent(accounts::token_a, 1, 1)));
  fund_payer(world_.token_a(), 1000);

  auto intent = make_token_intent(accounts::token_a, 1000, 1000, receiver);
  intent.receiver_call_data = {0xBE, 0xEF};

  EXPECT_EQ(world_.settle(accounts::payer, intent),
            transaction_error_code::receiver_call_failed);
  EXPECT_NE(attacker->last_reason.find("reentrant_call"), std::string::npos);
  EXPECT_EQ(world_.token_a().balance_of(accounts::payer), 1000);
  EXPECT_EQ(world_.token_a().balance_of(receiver), 0);
  EXPECT_EQ(world_.token_a().balance_of(accounts::fee_receiver), 0);
}

TEST_F(payment_engine_test, guard_is_released_after_blocked_reentry) {
  const auto receiver = remit::testing::make_address(0x77);
  world_.deploy<remit::testing::reentrant_receiver>(
      receiver, accounts::engine,
      remit::testing::scale_encoder_t{}.encode(make_native_intent(1, 1)));
  world_.host().credit_native(accounts::payer, 2000);

  ASSERT_EQ(world_.settle(accounts::payer,
                          make_native_intent(1000, 1000, receiver), 1000),
            transaction_error_code::receiver_native_payment_failed);

  auto error =
      world_.settle(accounts::payer, make_native_intent(1000, 1000), 1000);
  ASSERT_FALSE(error.has_value()) << world_.last_error();
  EXPECT_EQ(world_.native_balance(accounts::merchant), 992);
  EXPECT_EQ(world_.native_balance(accounts::payer), 1000);
}

TEST_F(payment_engine_test, signature_transfer_funds_the_payment) {
  if (!remit::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose ed25519";
  }
  auto keys = remit::testing::ed25519_keypair{};
  const auto payer = keys.address();
  world_.token_a().mint(payer, 1000);
  world_.token_a().approve(payer, accounts::permit_service, 1000);

  auto permit = remit::schema::permit_transfer_from_t{
      .permitted = remit::schema::token_permissions_t{.token =
                                                          accounts::token_a,
                                                      .amount = 1000},
      .nonce = 0,
      .deadline = remit::testing::kGenesisTime + 60};
  auto digest = remit::authorization::permit_service::permit_digest(
      accounts::permit_service, permit, accounts::engine);
  auto intent = make_token_intent(accounts::token_a, 1000, 1000);
  intent.signature_transfer_data = remit::schema::signature_transfer_data_t{
      .use_signature_transfer = true,
      .permit = permit,
      .transfer_details =
          remit::schema::signature_transfer_details_t{
              .to = accounts::engine, .requested_amount = 1000},
      .signature = remit::authorization::permit_service::encode_signature(
          keys.signer(),
          keys.sign(remit::schema::bytes_view_t{digest.data(),
                                                digest.size()}))};

  ASSERT_FALSE(world_.settle(payer, intent).has_value())
      << world_.last_error();
  EXPECT_EQ(world_.token_a().balance_of(accounts::merchant), 992);
  const auto* success = last_event("PaymentSuccess");
  ASSERT_NE(success, nullptr);
  EXPECT_EQ(remit::schema::find_attribute(*success, "funding_path"),
            "signature_transfer");

  world_.token_a().mint(payer, 1000);
  EXPECT_EQ(world_.settle(payer, intent),
            transaction_error_code::collaborator_reverted);
  EXPECT_EQ(world_.last_error(), "InvalidNonce");
}

TEST_F(payment_engine_test, low_level_call_decodes_intent) {
  world_.host().credit_native(accounts::payer, 1000);
  auto encoded =
      remit::testing::scale_encoder_t{}.encode(make_native_intent(1000, 1000));

  auto result = world_.host().call(accounts::payer, accounts::engine, 1000,
                                   remit::schema::make_bytes_view(encoded));
  ASSERT_TRUE(result.success) << result.reason;
  EXPECT_EQ(world_.native_balance(accounts::merchant), 992);

  auto garbage = remit::schema::bytes_t{0x00};
  auto rejected = world_.host().call(accounts::payer, accounts::engine, 0,
                                     remit::schema::make_bytes_view(garbage));
  EXPECT_FALSE(rejected.success);
}

TEST(payment_engine_construction, rejects_bad_configuration) {
  auto host = remit::ledger::host{};
  auto config = remit::settlement::payment_engine_config{
      .self = accounts::engine,
      .owner = accounts::owner,
      .signature_transfer = accounts::permit_service,
      .wrapped_native = accounts::wrapped_native,
      .fee_receiver = accounts::fee_receiver,
      .standard_fee_bps = 100};
  auto code_of = [&](const remit::settlement::payment_engine_config& value) {
    try {
      remit::settlement::payment_engine{host, value};
    } catch (const remit::settlement::settlement_error& e) {
      return std::optional{e.code()};
    }
    return std::optional<transaction_error_code>{};
  };

  EXPECT_FALSE(code_of(config).has_value());

  auto bad = config;
  bad.owner = remit::schema::kZeroAddress;
  EXPECT_EQ(code_of(bad), transaction_error_code::invalid_owner);
  bad = config;
  bad.fee_receiver = remit::schema::kZeroAddress;
  EXPECT_EQ(code_of(bad), transaction_error_code::invalid_address);
  bad = config;
  bad.wrapped_native = remit::schema::kZeroAddress;
  EXPECT_EQ(code_of(bad), transaction_error_code::invalid_address);
  bad = config;
  bad.standard_fee_bps = 101;
  EXPECT_EQ(code_of(bad), transaction_error_code::invalid_service_fee_percent);
  bad = config;
  bad.fee_receiver = accounts::engine;
  EXPECT_EQ(code_of(bad), transaction_error_code::invalid_address);
}
