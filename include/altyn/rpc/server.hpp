#pragma once

#include <altyn/execution/engine.hpp>
#include <altyn/ledger/v1/ledger.grpc.pb.h>

namespace altyn::rpc {

/// Callback gRPC service exposing the ledger engine.
///
/// Engine outcomes are reported in the `code`/`log`/`codespace` fields of
/// each response; the transport status is always OK. Amounts that fail to
/// parse are rejected with invalid_amount before reaching the engine.
struct listener final : public altyn::ledger::v1::Ledger::CallbackService {
  explicit listener(altyn::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Transfer(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::TransferRequest* request,
      altyn::ledger::v1::TransactionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* CorporateTransfer(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::CorporateTransferRequest* request,
      altyn::ledger::v1::TransactionResponse* response) override final;

  /// Marketplace or service payment; a receipt is returned only on success.
  virtual grpc::ServerUnaryReactor* Pay(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::PayRequest* request,
      altyn::ledger::v1::PayResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Emit(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::EmitRequest* request,
      altyn::ledger::v1::TransactionResponse* response) override final;

  virtual grpc::ServerUnaryReactor* IssueTokens(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::IssueTokensRequest* request,
      altyn::ledger::v1::IssueTokensResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Distribute(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::DistributeRequest* request,
      altyn::ledger::v1::DistributeResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetWallet(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::GetWalletRequest* request,
      altyn::ledger::v1::WalletResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetCorporateWallet(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::GetCorporateWalletRequest* request,
      altyn::ledger::v1::WalletResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetPortfolio(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::GetPortfolioRequest* request,
      altyn::ledger::v1::PortfolioResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetTransactions(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::GetTransactionsRequest* request,
      altyn::ledger::v1::TransactionsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetTokenHolders(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::GetTokenHoldersRequest* request,
      altyn::ledger::v1::TokenHoldersResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetTreasuryStats(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::GetTreasuryStatsRequest* request,
      altyn::ledger::v1::TreasuryStatsResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetReceipt(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::GetReceiptRequest* request,
      altyn::ledger::v1::ReceiptResponse* response) override final;

  virtual grpc::ServerUnaryReactor* GetRates(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::GetRatesRequest* request,
      altyn::ledger::v1::RatesResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Convert(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::ConvertRequest* request,
      altyn::ledger::v1::ConvertResponse* response) override final;

  virtual grpc::ServerUnaryReactor* UpdateRates(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::UpdateRatesRequest* request,
      altyn::ledger::v1::RatesResponse* response) override final;

  /// Replay the transaction log and compare it with stored balances.
  virtual grpc::ServerUnaryReactor* Audit(
      grpc::CallbackServerContext* context,
      const altyn::ledger::v1::AuditRequest* request,
      altyn::ledger::v1::AuditResponse* response) override final;

  altyn::execution::engine& engine_;
};

}  // namespace altyn::rpc
