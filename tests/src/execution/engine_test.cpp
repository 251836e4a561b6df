#include <gtest/gtest.h>
#include <remit/crypto/verify.hpp>
#include <remit/execution/engine.hpp>
#include <remit/execution/signature_verifier.hpp>
#include <remit/testing/execution_fixture.hpp>

#include <algorithm>
#include <string>
#include <tuple>
#include <vector>

namespace {

namespace accounts = remit::testing::accounts;
using remit::schema::transaction_error_code;
using remit::testing::address_of;
using remit::testing::execution_fixture;

constexpr uint32_t code_of(const transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

remit::schema::settle_payment_t native_payment(
    const remit::schema::amount_t& amount_in,
    const remit::schema::amount_t& receipt_amount) {
  auto intent = remit::testing::make_native_intent(amount_in, receipt_amount);
  intent.deadline = remit::testing::kGenesisTime + 10000;
  return remit::schema::settle_payment_t{.intent = intent};
}

bool has_event(const remit::schema::transaction_result_t& result,
               const std::string& type) {
  return std::any_of(
      std::begin(result.events), std::end(result.events),
      [&](const remit::schema::transaction_event_t& e) { return e.type == type; });
}

}  // namespace

TEST(execution_engine, check_transaction_rejects_undecodable_bytes) {
  auto fixture = execution_fixture{"remit_engine_checktx"};
  auto garbage = remit::schema::bytes_t{0x01, 0x02, 0x03};
  auto result =
      fixture.engine().check_transaction(remit::schema::make_bytes_view(garbage));
  EXPECT_EQ(result.code, code_of(transaction_error_code::invalid_transaction));
  EXPECT_EQ(result.codespace, "remit.checktx");

  auto empty = fixture.engine().check_transaction({});
  EXPECT_EQ(empty.code, code_of(transaction_error_code::invalid_transaction));
}

TEST(execution_engine, check_transaction_validates_envelope) {
  auto fixture = execution_fixture{"remit_engine_envelope"};
  auto tx = fixture.make_transaction(execution_fixture::owner_signer(),
                                     remit::schema::pause_t{});
  auto check = [&](const remit::schema::transaction_t& candidate) {
    auto encoded = remit::testing::encode_transaction(candidate);
    return fixture.engine()
        .check_transaction(remit::schema::make_bytes_view(encoded))
        .code;
  };

  EXPECT_EQ(check(tx), 0u);

  auto wrong_version = tx;
  wrong_version.version = 2;
  EXPECT_EQ(check(wrong_version),
            code_of(transaction_error_code::unsupported_transaction_version));

  auto wrong_chain = tx;
  wrong_chain.chain_id[0] ^= 0xFF;
  EXPECT_EQ(check(wrong_chain),
            code_of(transaction_error_code::invalid_chain_id));

  auto wrong_nonce = tx;
  wrong_nonce.nonce = 2;
  EXPECT_EQ(check(wrong_nonce), code_of(transaction_error_code::invalid_nonce));
}

TEST(execution_engine, settles_native_payment_in_a_block) {
  auto fixture = execution_fixture{"remit_engine_settle"};
  const auto payer = address_of(execution_fixture::payer_signer());
  auto tx = fixture.make_transaction(execution_fixture::payer_signer(),
                                     native_payment(1000, 990), 1000);

  auto result = fixture.execute(tx);
  ASSERT_EQ(result.code, 0u) << result.log << " " << result.info;
  EXPECT_EQ(result.info, "settle_payment accepted");
  EXPECT_TRUE(has_event(result, "PaymentSuccess"));
  EXPECT_TRUE(has_event(result, "Deposit"));

  const auto& state = fixture.world().host().state();
  EXPECT_EQ(state.native_balance(accounts::merchant), 983);
  EXPECT_EQ(state.native_balance(accounts::fee_receiver), 7);
  EXPECT_EQ(state.native_balance(payer), 100000 - 990);
  EXPECT_EQ(fixture.engine().next_nonce(payer), 2u);
  EXPECT_NE(fixture.engine().info().last_block_state_root,
            remit::schema::hash32_t{});
}

TEST(execution_engine, failed_settlement_consumes_nonce_only) {
  auto fixture = execution_fixture{"remit_engine_failed"};
  const auto payer = address_of(execution_fixture::payer_signer());
  auto payment = native_payment(1000, 990);
  payment.intent.deadline = remit::testing::kGenesisTime - 1;
  auto tx = fixture.make_transaction(execution_fixture::payer_signer(),
                                     payment, 1000);

  auto result = fixture.execute(tx);
  EXPECT_EQ(result.code, code_of(transaction_error_code::payment_expired));
  EXPECT_EQ(result.codespace, "remit.settlement");
  EXPECT_TRUE(result.events.empty());
  EXPECT_EQ(fixture.world().host().state().native_balance(payer), 100000);
  EXPECT_EQ(fixture.engine().next_nonce(payer), 2u);
  EXPECT_EQ(fixture.engine().info().last_block_state_root,
            remit::schema::hash32_t{});
}

TEST(execution_engine, governance_payloads_reject_native_value) {
  auto fixture = execution_fixture{"remit_engine_nonpayable"};
  auto tx = fixture.make_transaction(
      execution_fixture::owner_signer(),
      remit::schema::set_service_fee_t{.rate = 10}, 1);
  auto result = fixture.execute(tx);
  EXPECT_EQ(result.code, code_of(transaction_error_code::non_payable_operation));
  EXPECT_EQ(fixture.world().engine().standard_fee(),
            remit::testing::kStandardFeeBps);
}

TEST(execution_engine, governance_requires_owner_signer) {
  auto fixture = execution_fixture{"remit_engine_governance"};
  auto stranger = fixture.execute(fixture.make_transaction(
      execution_fixture::payer_signer(),
      remit::schema::set_service_fee_t{.rate = 10}));
  EXPECT_EQ(stranger.code, code_of(transaction_error_code::unauthorized_account));

  auto owner = fixture.execute(fixture.make_transaction(
      execution_fixture::owner_signer(),
      remit::schema::set_service_fee_t{.rate = 10}));
  ASSERT_EQ(owner.code, 0u) << owner.log;
  EXPECT_TRUE(has_event(owner, "FeeChanged"));

  auto key = fixture.encoder().encode(accounts::stranger);
  EXPECT_EQ(fixture.query<remit::schema::basis_points_t>("/fee/service", key),
            10);
}

TEST(execution_engine, rejecting_verifier_blocks_transactions) {
  auto fixture = execution_fixture{"remit_engine_verifier"};
  fixture.engine().set_signature_verifier(
      [](const remit::schema::bytes_view_t&, const remit::schema::signer_id_t&,
         const remit::schema::signature_t&) { return false; });
  auto result = fixture.execute(fixture.make_transaction(
      execution_fixture::owner_signer(), remit::schema::pause_t{}));
  EXPECT_EQ(result.code,
            code_of(transaction_error_code::signature_verification_failed));
  EXPECT_FALSE(fixture.world().engine().paused());
}

TEST(execution_engine, strict_crypto_requires_real_signatures) {
  if (!remit::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = execution_fixture{"remit_engine_strict", true};
  auto keys = remit::testing::ed25519_keypair{};
  fixture.world().host().credit_native(keys.address(), 5000);

  auto tx = fixture.make_transaction(keys.signer(), native_payment(1000, 1000),
                                     1000);
  auto unsigned_result = fixture.execute(tx);
  EXPECT_EQ(unsigned_result.code,
            code_of(transaction_error_code::signature_verification_failed));

  auto payload = remit::execution::make_signing_payload(tx);
  tx.signature = keys.sign(remit::schema::make_bytes_view(payload));
  auto signed_result = fixture.execute(tx);
  EXPECT_EQ(signed_result.code, 0u) << signed_result.log;
  EXPECT_EQ(fixture.world().host().state().native_balance(accounts::merchant),
            992);
}

TEST(execution_engine, strict_crypto_rejects_forged_owner_governance) {
  if (!remit::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = execution_fixture{"remit_engine_forged_owner", true};
  fixture.engine().set_signature_verifier(
      [](const remit::schema::bytes_view_t&, const remit::schema::signer_id_t&,
         const remit::schema::signature_t&) { return true; });

  for (const auto& payload : std::vector<remit::schema::transaction_payload_t>{
           remit::schema::pause_t{},
           remit::schema::set_service_fee_t{.rate = 10},
           remit::schema::transfer_ownership_t{.new_owner = accounts::stranger}}) {
    auto result = fixture.execute(
        fixture.make_transaction(execution_fixture::owner_signer(), payload));
    EXPECT_EQ(result.code,
              code_of(transaction_error_code::signature_verification_failed));
  }
  EXPECT_FALSE(fixture.world().engine().paused());
  EXPECT_EQ(fixture.world().engine().standard_fee(),
            remit::testing::kStandardFeeBps);
  EXPECT_EQ(fixture.world().engine().owner(),
            address_of(execution_fixture::owner_signer()));
}

TEST(execution_engine, queries_report_balances_and_nonces) {
  auto fixture = execution_fixture{"remit_engine_query"};
  const auto payer = address_of(execution_fixture::payer_signer());
  ASSERT_EQ(fixture
                .execute(fixture.make_transaction(
                    execution_fixture::payer_signer(),
                    native_payment(1000, 1000), 1000))
                .code,
            0u);

  auto& encoder = fixture.encoder();
  EXPECT_EQ(fixture.query<remit::schema::amount_t>(
                "/balance/native", encoder.encode(accounts::merchant)),
            992);
  EXPECT_EQ(fixture.query<uint64_t>("/nonce", encoder.encode(payer)), 2u);
  EXPECT_EQ(fixture.query<remit::schema::amount_t>(
                "/balance/token",
                encoder.encode(std::tuple{accounts::wrapped_native,
                                          accounts::engine})),
            0);

  auto config = fixture.query<remit::schema::settlement_config_t>(
      "/settlement/config", {});
  EXPECT_EQ(config.owner, address_of(execution_fixture::owner_signer()));
  EXPECT_EQ(config.standard_fee_bps, remit::testing::kStandardFeeBps);

  auto info = fixture.query<
      std::tuple<int64_t, remit::schema::hash32_t, remit::schema::hash32_t>>(
      "/engine/info", {});
  EXPECT_EQ(std::get<0>(info), 1);
  EXPECT_EQ(std::get<2>(info), fixture.engine().chain_id());

  auto short_key = remit::schema::bytes_t{0x01};
  auto invalid = fixture.engine().query(
      "/balance/native", remit::schema::make_bytes_view(short_key));
  EXPECT_EQ(invalid.code, 1u);
  auto unknown = fixture.engine().query("/nope", {});
  EXPECT_EQ(unknown.code, 2u);
}

TEST(execution_engine, committed_state_survives_restart) {
  auto fixture = execution_fixture{"remit_engine_restart"};
  const auto payer = address_of(execution_fixture::payer_signer());
  ASSERT_EQ(fixture
                .execute(fixture.make_transaction(
                    execution_fixture::payer_signer(),
                    native_payment(1000, 990), 1000))
                .code,
            0u);
  ASSERT_EQ(fixture
                .execute(fixture.make_transaction(
                    execution_fixture::owner_signer(),
                    remit::schema::set_special_fee_t{
                        .account = accounts::merchant, .rate = 20}))
                .code,
            0u);
  ASSERT_EQ(fixture
                .execute(fixture.make_transaction(
                    execution_fixture::owner_signer(), remit::schema::pause_t{}))
                .code,
            0u);
  auto root = fixture.engine().info().last_block_state_root;

  fixture.reopen();

  auto info = fixture.engine().info();
  EXPECT_EQ(info.last_block_height, 3);
  EXPECT_EQ(info.last_block_state_root, root);
  EXPECT_EQ(fixture.world().host().state().native_balance(accounts::merchant),
            983);
  EXPECT_EQ(fixture.world().host().state().native_balance(payer),
            100000 - 990);
  EXPECT_TRUE(fixture.world().engine().paused());
  EXPECT_EQ(fixture.world().engine().get_service_fee(accounts::merchant), 20);
  EXPECT_EQ(fixture.engine().next_nonce(payer), 2u);
  EXPECT_EQ(fixture.engine().next_nonce(
                address_of(execution_fixture::owner_signer())),
            3u);

  auto paused = fixture.execute(fixture.make_transaction(
      execution_fixture::payer_signer(), native_payment(1000, 990), 1000));
  EXPECT_EQ(paused.code, code_of(transaction_error_code::enforced_pause));
}

TEST(execution_engine, identical_blocks_produce_identical_roots) {
  auto first = execution_fixture{"remit_engine_root_a"};
  auto second = execution_fixture{"remit_engine_root_b"};
  for (auto* fixture : {&first, &second}) {
    ASSERT_EQ(fixture
                  ->execute(fixture->make_transaction(
                      execution_fixture::payer_signer(),
                      native_payment(500, 500), 500))
                  .code,
              0u);
  }
  EXPECT_EQ(first.engine().info().last_block_state_root,
            second.engine().info().last_block_state_root);
}
