#include <spdlog/spdlog.h>
#include <remit/config/server_options.hpp>

namespace remit::config {

namespace po = boost::program_options;

po::options_description describe(server_options& options) {
  auto description = po::options_description{"Remit settlement server"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-port,g",
      po::value<std::string>(&options.grpc_port)->default_value("0.0.0.0:26658"),
      "IP:Port for the settlement gRPC service")(
      "db-path",
      po::value<std::string>(&options.db_path)->default_value("remit.db"),
      "RocksDB directory")(
      "owner", po::value<std::string>(&options.owner)->required(),
      "Initial owner address (hex)")(
      "fee-receiver", po::value<std::string>(&options.fee_receiver)->required(),
      "Service fee receiver address (hex)")(
      "standard-fee-bps",
      po::value<remit::schema::basis_points_t>(&options.standard_fee_bps)
          ->default_value(0),
      "Standard service fee in basis points (max 100)")(
      "wrapped-native",
      po::value<std::string>(&options.wrapped_native)->required(),
      "Address of the wrapped native currency contract")(
      "permit-service",
      po::value<std::string>(&options.permit_service)->required(),
      "Address of the signature transfer service")(
      "settlement-address",
      po::value<std::string>(&options.settlement_address)->required(),
      "Address of the settlement engine")(
      "token",
      po::value<std::vector<std::string>>(&options.tokens)->composing(),
      "Deploy a token: ADDRESS=SYMBOL (repeatable)")(
      "fund", po::value<std::vector<std::string>>(&options.funds)->composing(),
      "Genesis native balance: ADDRESS=AMOUNT (repeatable)")(
      "mint", po::value<std::vector<std::string>>(&options.mints)->composing(),
      "Genesis token balance: TOKEN:ACCOUNT=AMOUNT (repeatable)")(
      "insecure-skip-signatures",
      "Accept transactions without verifying their signatures (local "
      "testing only)")("verbose,v", "Enable debug logging");
  return description;
}

void apply_switches(const po::variables_map& vm, server_options& options) {
  options.verbose = vm.contains("verbose");
  options.require_strict_crypto = !vm.contains("insecure-skip-signatures");
  if (!options.require_strict_crypto) {
    spdlog::warn(
        "Signature verification is disabled; any transaction naming a signer "
        "is accepted as that signer");
  }
}

}  // namespace remit::config
