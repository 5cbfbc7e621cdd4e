// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <starkworm/core/types/block_id.hpp>
#include <starkworm/core/types/pending.hpp>
#include <starkworm/core/types/transaction.hpp>
#include <starkworm/db/storage.hpp>
#include <starkworm/infra/concurrency/task.hpp>
#include <starkworm/rpc/common/worker_pool.hpp>
#include <starkworm/rpc/types/block.hpp>
#include <starkworm/rpc/types/error.hpp>

namespace starkworm::rpc::json_rpc {
class RequestHandler;
}

namespace starkworm::rpc::commands {

using BlockQueryError = ErrorSubset<ErrorKind::kBlockNotFound, ErrorKind::kPendingNotSupported>;
using TxIndexError = ErrorSubset<ErrorKind::kBlockNotFound, ErrorKind::kInvalidTxnIndex, ErrorKind::kPendingNotSupported>;
using TxHashError = ErrorSubset<ErrorKind::kTxnHashNotFound>;
using NoBlocksError = ErrorSubset<ErrorKind::kNoBlocks>;

template <typename T, typename E>
using Result = tl::expected<T, E>;

class StarknetRpcApi {
  public:
    //! \param pending the pending overlay, null when the node does not serve pending data
    StarknetRpcApi(db::Storage& storage, const PendingSource* pending, WorkerPool& workers)
        : storage_{storage}, pending_{pending}, workers_{workers} {}

    virtual ~StarknetRpcApi() = default;

    StarknetRpcApi(const StarknetRpcApi&) = delete;
    StarknetRpcApi& operator=(const StarknetRpcApi&) = delete;

    Task<Result<BlockWithTxHashes, BlockQueryError>> get_block_with_tx_hashes(const BlockId& block_id);
    Task<Result<BlockWithTxs, BlockQueryError>> get_block_with_txs(const BlockId& block_id);
    Task<Result<uint64_t, BlockQueryError>> get_block_transaction_count(const BlockId& block_id);
    Task<Result<Transaction, TxIndexError>> get_transaction_by_block_id_and_index(const BlockId& block_id, uint64_t index);
    Task<Result<Transaction, TxHashError>> get_transaction_by_hash(const Hash& transaction_hash);
    Task<Result<TransactionStatus, TxHashError>> get_transaction_status(const Hash& transaction_hash);
    Task<Result<TransactionReceiptReply, TxHashError>> get_transaction_receipt(const Hash& transaction_hash);
    Task<Result<BlockNum, NoBlocksError>> block_number();
    Task<Result<BlockHashAndNumber, NoBlocksError>> block_hash_and_number();
    static std::string spec_version();

  protected:
    Task<void> handle_starknet_spec_version(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_starknet_block_number(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_starknet_block_hash_and_number(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_starknet_get_block_with_tx_hashes(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_starknet_get_block_with_txs(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_starknet_get_block_transaction_count(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_starknet_get_transaction_by_block_id_and_index(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_starknet_get_transaction_by_hash(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_starknet_get_transaction_status(const nlohmann::json& request, nlohmann::json& reply);
    Task<void> handle_starknet_get_transaction_receipt(const nlohmann::json& request, nlohmann::json& reply);

  private:
    db::Storage& storage_;
    const PendingSource* pending_;
    WorkerPool& workers_;

    friend class starkworm::rpc::json_rpc::RequestHandler;
};

}  // namespace starkworm::rpc::commands
