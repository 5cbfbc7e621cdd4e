// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <starkworm/core/types/block.hpp>
#include <starkworm/core/types/pending.hpp>
#include <starkworm/core/types/transaction.hpp>
#include <starkworm/rpc/types/block.hpp>

namespace starkworm::rpc::core {

//! Finality of a persisted block: accepted on L1 iff at or below the highest L1-accepted number
BlockStatus block_status(BlockNum number, std::optional<BlockNum> l1_accepted);

//! Finality of a transaction included in a persisted block
TxFinalityStatus transaction_finality(BlockNum number, std::optional<BlockNum> l1_accepted);

TransactionReceiptReply make_transaction_receipt(const TransactionLocation& location, std::optional<BlockNum> l1_accepted);
TransactionReceiptReply make_transaction_receipt(const TransactionWithReceipt& pending_transaction);

BlockHeaderReply make_header_reply(const BlockHeader& header);
BlockHeaderReply make_header_reply(const PendingBlock& pending);

BlockWithTxHashes make_block_with_tx_hashes(const BlockHeader& header, BlockStatus status, std::vector<Hash> tx_hashes);
BlockWithTxHashes make_block_with_tx_hashes(const PendingBlock& pending);

BlockWithTxs make_block_with_txs(const BlockHeader& header, BlockStatus status, const std::vector<TransactionWithReceipt>& transactions);
BlockWithTxs make_block_with_txs(const PendingBlock& pending);

}  // namespace starkworm::rpc::core
