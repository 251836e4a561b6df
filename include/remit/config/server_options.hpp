#pragma once
#include <boost/program_options.hpp>
#include <remit/schema/primitives.hpp>
#include <string>
#include <vector>

namespace remit::config {

/// Command line of `remit_server`.
struct server_options final {
  std::string grpc_port;
  std::string db_path;
  std::string owner;
  std::string fee_receiver;
  remit::schema::basis_points_t standard_fee_bps{};
  std::string wrapped_native;
  std::string permit_service;
  std::string settlement_address;
  std::vector<std::string> tokens;
  std::vector<std::string> funds;
  std::vector<std::string> mints;
  /// Signatures are verified unless explicitly skipped.
  bool require_strict_crypto{true};
  bool verbose{};
};

/// Build the option description; parsed values land in `options`.
boost::program_options::options_description describe(server_options& options);

/// Apply flag-style switches from a notified variables map.
void apply_switches(const boost::program_options::variables_map& vm,
                    server_options& options);

}  // namespace remit::config
