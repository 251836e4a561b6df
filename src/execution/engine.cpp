#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <remit/blake3/hash.hpp>
#include <remit/crypto/verify.hpp>
#include <remit/execution/engine.hpp>
#include <remit/ledger/call.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/schema/transaction_error_code.hpp>
#include <remit/settlement/settlement_error.hpp>
#include <tuple>
#include <utility>

using namespace remit::schema;

namespace {

using encoder_t = remit::schema::encoding::encoder<
    remit::schema::encoding::scale_encoder_tag>;

inline constexpr auto kLedgerKey = std::string_view{"STATE|LEDGER"};
inline constexpr auto kSettlementConfigKey =
    std::string_view{"STATE|SETTLEMENT|CONFIG"};
inline constexpr auto kNoncePrefix = std::string_view{"STATE|NONCE|"};

inline constexpr auto kQueryInvalidKey = uint32_t{1};
inline constexpr auto kQueryUnsupportedPath = uint32_t{2};

remit::schema::hash32_t fold_state_root(const remit::schema::hash32_t& seed,
                                        const remit::schema::bytes_t& tx,
                                        uint64_t height,
                                        uint64_t index) {
  auto material = remit::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return remit::blake3::hash(make_bytes_view(material));
}

remit::schema::transaction_result_t make_error_result(
    const transaction_error_code code,
    const std::string_view info,
    const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::string{info};
  result.codespace = std::string{codespace};
  return result;
}

std::string nonce_key(const address_t& account) {
  auto key = std::string{kNoncePrefix};
  key.append(reinterpret_cast<const char*>(account.data()), account.size());
  return key;
}

std::string payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const settle_payment_t&) { return std::string{"settle_payment"}; },
          [](const set_service_fee_t&) {
            return std::string{"set_service_fee"};
          },
          [](const set_special_fee_t&) {
            return std::string{"set_special_fee"};
          },
          [](const set_fee_receiver_t&) {
            return std::string{"set_fee_receiver"};
          },
          [](const pause_t&) { return std::string{"pause"}; },
          [](const unpause_t&) { return std::string{"unpause"}; },
          [](const transfer_ownership_t&) {
            return std::string{"transfer_ownership"};
          },
          [](const renounce_ownership_t&) {
            return std::string{"renounce_ownership"};
          }},
      payload);
}

}  // namespace

namespace remit::execution {

engine::engine(
    remit::schema::encoding::encoder<
        remit::schema::encoding::scale_encoder_tag>& encoder,
    remit::storage::storage<remit::storage::rocksdb_storage_tag>& storage,
    ledger::host& host,
    settlement::payment_engine& settlement,
    const bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      host_{host},
      settlement_{settlement},
      chain_id_{remit::blake3::hash(kChainIdSeed)},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{[](const bytes_view_t&, const signer_id_t&,
                             const signature_t&) { return true; }} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_ && !remit::crypto::available()) {
    remit::common::critical("strict crypto requested but OpenSSL lacks "
                            "ed25519/secp256k1 support");
  }
  load_persisted_state();
  pending_state_root_ = last_committed_state_root_;
  spdlog::info("Execution engine ready at height {} (strict crypto: {})",
               last_committed_height_, require_strict_crypto_);
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  static constexpr auto kCodespace = std::string_view{"remit.checktx"};
  auto maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (raw_tx.empty() || !maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "failed to decode transaction", kCodespace);
  }
  auto sender = remit::crypto::derive_address(maybe_tx->signer);
  return validate_transaction(*maybe_tx, sender, kCodespace);
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const timestamp_seconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  static constexpr auto kCodespace = std::string_view{"remit.finalize"};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  host_.set_time(block_time);
  (void)host_.state().take_events();

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto maybe_tx = encoder_.try_decode<transaction_t>(make_bytes_view(txs[i]));
    if (txs[i].empty() || !maybe_tx) {
      spdlog::warn("Rejected undecodable transaction {} at height {}", i,
                   height);
      result.tx_results.push_back(make_error_result(
          transaction_error_code::invalid_transaction,
          "failed to decode transaction", kCodespace));
      continue;
    }
    auto sender = remit::crypto::derive_address(maybe_tx->signer);
    auto validation = validate_transaction(*maybe_tx, sender, kCodespace);
    if (validation.code != 0) {
      spdlog::warn("Rejected transaction {} from {}: {}", i, to_string(sender),
                   validation.log);
      result.tx_results.push_back(std::move(validation));
      continue;
    }

    nonces_.insert_or_assign(sender, maybe_tx->nonce);
    auto tx_result = execute_operation(*maybe_tx, sender);
    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::debug("Finalized block {} with {} transaction(s)", height,
                txs.size());
  return result;
}

transaction_result_t engine::execute_operation(const transaction_t& tx,
                                               const address_t& sender) {
  static constexpr auto kCodespace = std::string_view{"remit.settlement"};
  auto checkpoint = host_.state().checkpoint();
  auto operation = payload_name(tx.payload);
  auto result = transaction_result_t{};
  try {
    if (tx.value > 0 && !std::holds_alternative<settle_payment_t>(tx.payload)) {
      throw settlement::settlement_error{
          transaction_error_code::non_payable_operation, operation};
    }
    std::visit(
        overloaded{
            [&](const settle_payment_t& op) {
              const auto& self = settlement_.address();
              if (tx.value > 0) {
                host_.transfer_native(sender, self, tx.value);
              }
              settlement_.settle(ledger::call_context{sender, self, tx.value},
                                 op.intent);
            },
            [&](const set_service_fee_t& op) {
              settlement_.set_service_fee_percent(sender, op.rate);
            },
            [&](const set_special_fee_t& op) {
              settlement_.set_special_fee(sender, op.account, op.rate);
            },
            [&](const set_fee_receiver_t& op) {
              settlement_.set_fee_receiver(sender, op.fee_receiver);
            },
            [&](const pause_t&) { settlement_.pause(sender); },
            [&](const unpause_t&) { settlement_.unpause(sender); },
            [&](const transfer_ownership_t& op) {
              settlement_.transfer_ownership(sender, op.new_owner);
            },
            [&](const renounce_ownership_t&) {
              settlement_.renounce_ownership(sender);
            }},
        tx.payload);
  } catch (const settlement::settlement_error& e) {
    host_.state().revert_to(checkpoint);
    spdlog::warn("{} from {} failed: {}", operation, to_string(sender),
                 e.what());
    return make_error_result(e.code(), e.what(), kCodespace);
  } catch (const ledger::execution_reverted& e) {
    host_.state().revert_to(checkpoint);
    spdlog::warn("{} from {} reverted: {}", operation, to_string(sender),
                 e.what());
    return make_error_result(transaction_error_code::collaborator_reverted,
                             e.what(), kCodespace);
  }

  const auto& events = host_.state().events();
  result.events.assign(
      std::next(std::begin(events),
                static_cast<std::ptrdiff_t>(checkpoint.events)),
      std::end(events));
  result.info = operation + " accepted";
  spdlog::debug("{} from {} accepted with {} event(s)", operation,
                to_string(sender), result.events.size());
  return result;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const address_t& sender,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "expected version 1", codespace);
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "chain id mismatch", codespace);
  }
  auto expected_nonce = next_nonce(sender);
  if (tx.nonce != expected_nonce) {
    return make_error_result(
        transaction_error_code::invalid_nonce,
        "expected nonce " + std::to_string(expected_nonce), codespace);
  }
  auto payload = make_signing_payload(tx);
  auto verified =
      require_strict_crypto_
          ? remit::crypto::verify_signature(make_bytes_view(payload), tx.signer,
                                            tx.signature)
          : signature_verifier_(make_bytes_view(payload), tx.signer,
                                tx.signature);
  if (!verified) {
    return make_error_result(
        transaction_error_code::signature_verification_failed,
        "signature does not match signer", codespace);
  }
  auto result = transaction_result_t{};
  result.codespace = std::string{codespace};
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
  }

  auto writes = remit::storage::write_set{};
  writes.puts.emplace_back(make_bytes(kLedgerKey),
                           encoder_.encode(host_.state().snapshot()));
  writes.puts.emplace_back(make_bytes(kSettlementConfigKey),
                           encoder_.encode(settlement_.config()));
  auto nonces = remit::storage::prefix_replacement{
      .prefix = make_bytes(kNoncePrefix), .entries = {}};
  nonces.entries.reserve(nonces_.size());
  for (const auto& [account, nonce] : nonces_) {
    nonces.entries.emplace_back(make_bytes(nonce_key(account)),
                                encoder_.encode(nonce));
  }
  writes.replacements.push_back(std::move(nonces));
  writes.committed = remit::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_};
  storage_.commit_batch(writes);
  host_.state().discard_journal();

  spdlog::info("Committed height {}", last_committed_height_);
  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = "remit.query";

  auto invalid_key = [&]() {
    result.code = kQueryInvalidKey;
    result.log = "invalid query key";
    return result;
  };

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
  } else if (path == "/fee/service") {
    auto account = encoder_.try_decode<address_t>(data);
    if (!account) {
      return invalid_key();
    }
    result.value = encoder_.encode(settlement_.get_service_fee(*account));
  } else if (path == "/settlement/config") {
    result.value = encoder_.encode(settlement_.config());
  } else if (path == "/balance/native") {
    auto account = encoder_.try_decode<address_t>(data);
    if (!account) {
      return invalid_key();
    }
    result.value = encoder_.encode(host_.state().native_balance(*account));
  } else if (path == "/balance/token") {
    auto key = encoder_.try_decode<std::tuple<address_t, address_t>>(data);
    if (!key) {
      return invalid_key();
    }
    result.value = encoder_.encode(
        host_.state().token_balance(std::get<0>(*key), std::get<1>(*key)));
  } else if (path == "/nonce") {
    auto account = encoder_.try_decode<address_t>(data);
    if (!account) {
      return invalid_key();
    }
    result.value = encoder_.encode(next_nonce(*account));
  } else {
    result.code = kQueryUnsupportedPath;
    result.log = "unsupported query path";
    result.info = std::string{path};
  }
  return result;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_) {
    spdlog::warn("Ignoring signature verifier override in strict crypto mode");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

const hash32_t& engine::chain_id() const {
  return chain_id_;
}

uint64_t engine::next_nonce(const address_t& account) const {
  auto it = nonces_.find(account);
  if (it == std::end(nonces_)) {
    return 1;
  }
  return it->second + 1;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }
  if (auto ledger = storage_.get<ledger_snapshot_t>(
          encoder_, make_bytes_view(kLedgerKey))) {
    host_.state().restore(*ledger);
  }
  if (auto config = storage_.get<settlement_config_t>(
          encoder_, make_bytes_view(kSettlementConfigKey))) {
    settlement_.restore(*config);
  }
  nonces_.clear();
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(kNoncePrefix))) {
    if (key.size() != kNoncePrefix.size() + address_t{}.size()) {
      remit::common::critical("malformed nonce key in storage");
    }
    auto account = address_t{};
    std::copy(std::next(std::begin(key),
                        static_cast<std::ptrdiff_t>(kNoncePrefix.size())),
              std::end(key), std::begin(account));
    nonces_.insert_or_assign(account,
                             encoder_.decode<uint64_t>(make_bytes_view(value)));
  }
}

}  // namespace remit::execution
