#include <boost/program_options.hpp>
#include <openssl/evp.h>
#include <remit/blake3/hash.hpp>
#include <remit/common/critical.hpp>
#include <remit/crypto/verify.hpp>
#include <remit/execution/engine.hpp>
#include <remit/execution/signature_verifier.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = remit::schema::encoding::encoder<
    remit::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

/// Standard padded base64, the form gRPC tooling expects for `bytes` fields.
std::string to_base64(const remit::schema::bytes_view_t& bytes) {
  auto out = std::string(((bytes.size() + 2) / 3) * 4 + 1, '\0');
  auto written =
      EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                      bytes.data(), static_cast<int>(bytes.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

const std::string& require(const po::variables_map& vm,
                           const std::string& name) {
  if (!vm.contains(name)) {
    remit::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

remit::schema::address_t get_address(const po::variables_map& vm,
                                     const std::string& name) {
  auto address = remit::schema::try_make_address(require(vm, name));
  if (!address) {
    remit::common::critical("--{} must be a 20-byte hex address", name);
  }
  return *address;
}

remit::schema::address_t get_token(const po::variables_map& vm,
                                   const std::string& name) {
  if (require(vm, name) == "native") {
    return remit::schema::kNativeToken;
  }
  return get_address(vm, name);
}

remit::schema::amount_t get_amount(const po::variables_map& vm,
                                   const std::string& name) {
  auto amount = remit::schema::try_make_amount(require(vm, name));
  if (!amount) {
    remit::common::critical("--{} must be a decimal amount", name);
  }
  return *amount;
}

remit::schema::bytes_t get_hex_bytes(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  auto bytes = remit::schema::try_from_hex(vm[name].as<std::string>());
  if (!bytes) {
    remit::common::critical("--{} must be hex", name);
  }
  return *bytes;
}

template <typename Array>
Array get_fixed(const po::variables_map& vm, const std::string& name) {
  auto bytes = get_hex_bytes(vm, name);
  auto out = Array{};
  if (bytes.empty()) {
    return out;
  }
  if (bytes.size() != out.size()) {
    remit::common::critical("--{} has the wrong length", name);
  }
  std::copy(std::begin(bytes), std::end(bytes), std::begin(out));
  return out;
}

remit::schema::signer_id_t make_signer(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  if (kind == "ed25519") {
    return remit::schema::ed25519_signer_id{
        .public_key = get_fixed<std::array<uint8_t, 32>>(vm, "public-key")};
  }
  if (kind == "secp256k1") {
    return remit::schema::secp256k1_signer_id{
        .public_key = get_fixed<std::array<uint8_t, 33>>(vm, "public-key")};
  }
  remit::common::critical("signature-kind must be ed25519|secp256k1");
}

remit::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  if (kind == "ed25519") {
    return get_fixed<remit::schema::ed25519_signature_t>(vm, "signature-hex");
  }
  if (kind == "secp256k1") {
    return get_fixed<remit::schema::secp256k1_signature_t>(vm,
                                                           "signature-hex");
  }
  remit::common::critical("signature-kind must be ed25519|secp256k1");
}

remit::schema::signature_transfer_data_t build_signature_transfer(
    const po::variables_map& vm) {
  if (!vm["use-permit"].as<bool>()) {
    return {};
  }
  return remit::schema::signature_transfer_data_t{
      .use_signature_transfer = true,
      .permit =
          remit::schema::permit_transfer_from_t{
              .permitted =
                  remit::schema::token_permissions_t{
                      .token = get_token(vm, "permit-token"),
                      .amount = get_amount(vm, "permit-amount")},
              .nonce = get_amount(vm, "permit-nonce"),
              .deadline = vm["permit-deadline"].as<uint64_t>()},
      .transfer_details =
          remit::schema::signature_transfer_details_t{
              .to = get_address(vm, "permit-to"),
              .requested_amount = get_amount(vm, "permit-requested")},
      .signature = get_hex_bytes(vm, "permit-signature-hex")};
}

remit::schema::payment_intent_t build_intent(const po::variables_map& vm) {
  auto exchange_type = remit::schema::try_from_string<
      remit::schema::exchange_type_t>(vm["exchange-type"].as<std::string>());
  if (!exchange_type) {
    remit::common::critical("exchange-type must be none|exchange");
  }
  return remit::schema::payment_intent_t{
      .amount_in = get_amount(vm, "amount-in"),
      .receipt_amount = get_amount(vm, "receipt-amount"),
      .deadline = vm["deadline"].as<uint64_t>(),
      .token_in = get_token(vm, "token-in"),
      .receipt_token = get_token(vm, "receipt-token"),
      .exchange_address = *exchange_type == remit::schema::exchange_type_t::none
                              ? remit::schema::kZeroAddress
                              : get_address(vm, "exchange-address"),
      .exchange_call_data = get_hex_bytes(vm, "exchange-data-hex"),
      .exchange_type = *exchange_type,
      .payment_receiver = get_address(vm, "receiver"),
      .receiver_call_data = get_hex_bytes(vm, "receiver-data-hex"),
      .signature_transfer_data = build_signature_transfer(vm)};
}

remit::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "settle_payment") {
    return remit::schema::settle_payment_t{.intent = build_intent(vm)};
  }
  if (payload == "set_service_fee") {
    return remit::schema::set_service_fee_t{
        .rate = vm["rate"].as<remit::schema::basis_points_t>()};
  }
  if (payload == "set_special_fee") {
    return remit::schema::set_special_fee_t{
        .account = get_address(vm, "account"),
        .rate = vm["rate"].as<remit::schema::basis_points_t>()};
  }
  if (payload == "set_fee_receiver") {
    return remit::schema::set_fee_receiver_t{
        .fee_receiver = get_address(vm, "account")};
  }
  if (payload == "pause") {
    return remit::schema::pause_t{};
  }
  if (payload == "unpause") {
    return remit::schema::unpause_t{};
  }
  if (payload == "transfer_ownership") {
    return remit::schema::transfer_ownership_t{
        .new_owner = get_address(vm, "account")};
  }
  if (payload == "renounce_ownership") {
    return remit::schema::renounce_ownership_t{};
  }
  remit::common::critical("unsupported payload type");
}

remit::schema::transaction_t build_transaction(const po::variables_map& vm) {
  auto chain_id = vm.contains("chain-id")
                      ? get_fixed<remit::schema::hash32_t>(vm, "chain-id")
                      : remit::blake3::hash(remit::execution::kChainIdSeed);
  return remit::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = vm["nonce"].as<uint64_t>(),
      .signer = make_signer(vm),
      .value = vm.contains("value") ? get_amount(vm, "value")
                                    : remit::schema::amount_t{},
      .payload = build_payload(vm),
      .signature = make_signature(vm)};
}

remit::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/settlement/config") {
    return {};
  }
  if (path == "/fee/service" || path == "/balance/native" ||
      path == "/nonce") {
    return encoder.encode(get_address(vm, "account"));
  }
  if (path == "/balance/token") {
    return encoder.encode(
        std::tuple{get_token(vm, "token"), get_address(vm, "account")});
  }
  remit::common::critical("unsupported query path");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction [options]\n"
            << "  transaction_builder signing-payload [options]\n"
            << "  transaction_builder address --public-key HEX\n"
            << "  transaction_builder query-key [options]\n"
            << "  transaction_builder chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-payload|address|query-key|chain-id")(
      "payload", po::value<std::string>(), "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>(),
      "32-byte chain id hex (defaults to the settlement chain)")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "value", po::value<std::string>(), "attached native value")(
      "public-key", po::value<std::string>(), "signer public key hex")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex", po::value<std::string>(),
                           "signature bytes hex")(
      "account", po::value<std::string>(), "account address hex")(
      "token", po::value<std::string>(), "token address hex or 'native'")(
      "rate", po::value<remit::schema::basis_points_t>()->default_value(0),
      "fee rate in basis points")("amount-in", po::value<std::string>(),
                                  "payer input amount")(
      "receipt-amount", po::value<std::string>(), "merchant receipt amount")(
      "deadline", po::value<uint64_t>()->default_value(0),
      "intent deadline (seconds)")("token-in", po::value<std::string>(),
                                   "input token hex or 'native'")(
      "receipt-token", po::value<std::string>(),
      "receipt token hex or 'native'")(
      "exchange-type", po::value<std::string>()->default_value("none"),
      "none|exchange")("exchange-address", po::value<std::string>(),
                       "exchange contract address hex")(
      "exchange-data-hex", po::value<std::string>(), "exchange call data hex")(
      "receiver", po::value<std::string>(), "payment receiver address hex")(
      "receiver-data-hex", po::value<std::string>(),
      "receiver call data hex")("use-permit",
                                po::value<bool>()->default_value(false),
                                "fund through the signature transfer service")(
      "permit-token", po::value<std::string>(), "permitted token hex")(
      "permit-amount", po::value<std::string>(), "permitted amount")(
      "permit-nonce", po::value<std::string>(), "permit unordered nonce")(
      "permit-deadline", po::value<uint64_t>()->default_value(0),
      "permit deadline (seconds)")("permit-to", po::value<std::string>(),
                                   "permit transfer recipient hex")(
      "permit-requested", po::value<std::string>(), "permit requested amount")(
      "permit-signature-hex", po::value<std::string>(),
      "encoded permit signature hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      remit::common::critical("transaction mode requires --payload");
    }
    auto encoded = encoder_t{}.encode(build_transaction(vm));
    std::cout << to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "signing-payload") {
    if (!vm.contains("payload")) {
      remit::common::critical("signing-payload mode requires --payload");
    }
    auto signing_payload =
        remit::execution::make_signing_payload(build_transaction(vm));
    std::cout << remit::schema::to_hex(signing_payload) << '\n';
    return 0;
  }

  if (command == "address") {
    std::cout << remit::schema::to_string(
                     remit::crypto::derive_address(make_signer(vm)))
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      remit::common::critical("query-key mode requires --path");
    }
    std::cout << to_base64(build_query_key(vm)) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = remit::blake3::hash(remit::execution::kChainIdSeed);
    std::cout << remit::schema::to_hex(remit::schema::bytes_view_t{
                     chain_id.data(), chain_id.size()})
              << '\n';
    return 0;
  }

  remit::common::critical(
      "command must be transaction|signing-payload|address|query-key|chain-id");
}
