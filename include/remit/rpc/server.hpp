#pragma once

#include <remit/v1/settlement.grpc.pb.h>
#include <remit/execution/engine.hpp>

namespace remit::rpc {

/// Copy an execution result into its wire representation.
void populate_tx_result(const remit::schema::transaction_result_t& source,
                        remit::v1::TxResult* destination);

/// Callback listener that lets a block driver run the settlement state
/// machine over gRPC.
///
/// - CheckTx: admission check for one transaction; no state mutation.
/// - FinalizeBlock: execute an ordered block; returns per-tx results and the
///   resulting state root.
/// - Commit: persist the finalized block.
/// - Query: read-only routes (see execution::engine::query).
/// - Info: last committed height and state root.
struct listener final : public remit::v1::Settlement::CallbackService {
  explicit listener(remit::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const remit::v1::RequestCheckTx* request,
      remit::v1::ResponseCheckTx* response) override final;

  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const remit::v1::RequestFinalizeBlock* request,
      remit::v1::ResponseFinalizeBlock* response) override final;

  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const remit::v1::RequestCommit* request,
      remit::v1::ResponseCommit* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const remit::v1::RequestQuery* request,
      remit::v1::ResponseQuery* response) override final;

  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const remit::v1::RequestInfo* request,
      remit::v1::ResponseInfo* response) override final;

  remit::execution::engine& execution_engine_;
};

}  // namespace remit::rpc
