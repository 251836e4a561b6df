#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <boost/program_options.hpp>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <remit/authorization/permit_service.hpp>
#include <remit/common/critical.hpp>
#include <remit/config/server_options.hpp>
#include <remit/execution/engine.hpp>
#include <remit/ledger/host.hpp>
#include <remit/rpc/server.hpp>
#include <remit/settlement/payment_engine.hpp>
#include <remit/settlement/settlement_error.hpp>
#include <remit/storage/rocksdb/storage.hpp>
#include <remit/token/ledger_token.hpp>
#include <remit/token/ledger_wrapped_native.hpp>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace {

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

remit::schema::address_t parse_address(const std::string_view value,
                                       const std::string_view option) {
  auto address = remit::schema::try_make_address(value);
  if (!address) {
    remit::common::critical("--{} expects a 20-byte hex address, got '{}'",
                            option, value);
  }
  return *address;
}

remit::schema::amount_t parse_amount(const std::string_view value,
                                     const std::string_view option) {
  auto amount = remit::schema::try_make_amount(value);
  if (!amount) {
    remit::common::critical("--{} expects a decimal amount, got '{}'", option,
                            value);
  }
  return *amount;
}

/// Split "lhs=rhs"; critical when the separator is missing.
std::pair<std::string_view, std::string_view> split_assignment(
    const std::string_view value,
    const std::string_view option) {
  auto separator = value.find('=');
  if (separator == std::string_view::npos) {
    remit::common::critical("--{} expects LHS=RHS, got '{}'", option, value);
  }
  return {value.substr(0, separator), value.substr(separator + 1)};
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("remit.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "remit", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  namespace po = boost::program_options;
  auto options = remit::config::server_options{};
  auto vm = po::variables_map{};
  auto description = remit::config::describe(options);

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << "\n" << description << std::endl;
    return 1;
  }

  remit::config::apply_switches(vm, options);
  if (options.verbose) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto host = remit::ledger::host{};
  auto wrapped_address =
      parse_address(options.wrapped_native, "wrapped-native");
  auto permit_address =
      parse_address(options.permit_service, "permit-service");
  auto engine_address =
      parse_address(options.settlement_address, "settlement-address");

  auto ledger_tokens =
      std::map<remit::schema::address_t,
               std::shared_ptr<remit::token::ledger_token>>{};
  auto wrapped = std::make_shared<remit::token::ledger_wrapped_native>(
      host, wrapped_address);
  ledger_tokens.emplace(wrapped_address, wrapped);
  for (const auto& token : options.tokens) {
    auto [address, symbol] = split_assignment(token, "token");
    auto token_address = parse_address(address, "token");
    ledger_tokens.emplace(token_address,
                          std::make_shared<remit::token::ledger_token>(
                              host, token_address, std::string{symbol}));
  }

  auto settlement = std::shared_ptr<remit::settlement::payment_engine>{};
  try {
    for (const auto& [address, token] : ledger_tokens) {
      host.deploy(address, token);
    }
    host.deploy(permit_address,
                std::make_shared<remit::authorization::permit_service>(
                    host, permit_address));
    settlement = std::make_shared<remit::settlement::payment_engine>(
        host, remit::settlement::payment_engine_config{
                  .self = engine_address,
                  .owner = parse_address(options.owner, "owner"),
                  .signature_transfer = permit_address,
                  .wrapped_native = wrapped_address,
                  .fee_receiver =
                      parse_address(options.fee_receiver, "fee-receiver"),
                  .standard_fee_bps = options.standard_fee_bps});
    host.deploy(engine_address, settlement);

    for (const auto& fund : options.funds) {
      auto [address, amount] = split_assignment(fund, "fund");
      host.credit_native(parse_address(address, "fund"),
                         parse_amount(amount, "fund"));
    }
    for (const auto& mint : options.mints) {
      auto [target, amount] = split_assignment(mint, "mint");
      auto colon = target.find(':');
      if (colon == std::string_view::npos) {
        remit::common::critical("--mint expects TOKEN:ACCOUNT=AMOUNT");
      }
      auto token_address = parse_address(target.substr(0, colon), "mint");
      auto it = ledger_tokens.find(token_address);
      if (it == std::end(ledger_tokens)) {
        remit::common::critical("--mint names an undeployed token {}",
                                remit::schema::to_string(token_address));
      }
      it->second->mint(parse_address(target.substr(colon + 1), "mint"),
                       parse_amount(amount, "mint"));
    }
  } catch (const remit::settlement::settlement_error& e) {
    remit::common::critical("invalid settlement configuration: {}", e.what());
  } catch (const remit::ledger::execution_reverted& e) {
    remit::common::critical("genesis setup failed: {}", e.what());
  }
  host.state().discard_journal();

  auto encoder = remit::schema::encoding::encoder<
      remit::schema::encoding::scale_encoder_tag>{};
  auto storage =
      remit::storage::make_storage<remit::storage::rocksdb_storage_tag>(
          options.db_path);
  auto engine = remit::execution::engine{encoder, storage, host, *settlement,
                                         options.require_strict_crypto};

  spdlog::info("gRPC service listening on {}", options.grpc_port);
  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = remit::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options.grpc_port,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    remit::common::critical("failed to start gRPC server");
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("Shutting down");
  spdlog::shutdown();
  return 0;
}
