// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_assembler.hpp"

#include <utility>

namespace starkworm::rpc::core {

BlockStatus block_status(BlockNum number, std::optional<BlockNum> l1_accepted) {
    if (l1_accepted && number <= *l1_accepted) {
        return BlockStatus::kAcceptedOnL1;
    }
    return BlockStatus::kAcceptedOnL2;
}

TxFinalityStatus transaction_finality(BlockNum number, std::optional<BlockNum> l1_accepted) {
    return block_status(number, l1_accepted) == BlockStatus::kAcceptedOnL1 ? TxFinalityStatus::kAcceptedOnL1
                                                                           : TxFinalityStatus::kAcceptedOnL2;
}

TransactionReceiptReply make_transaction_receipt(const TransactionLocation& location, std::optional<BlockNum> l1_accepted) {
    return TransactionReceiptReply{
        .type = location.transaction.type,
        .receipt = location.receipt,
        .finality_status = transaction_finality(location.block_number, l1_accepted),
        .block_hash = location.block_hash,
        .block_number = location.block_number,
    };
}

TransactionReceiptReply make_transaction_receipt(const TransactionWithReceipt& pending_transaction) {
    return TransactionReceiptReply{
        .type = pending_transaction.transaction.type,
        .receipt = pending_transaction.receipt,
        .finality_status = TxFinalityStatus::kAcceptedOnL2,
        .block_hash = std::nullopt,
        .block_number = std::nullopt,
    };
}

BlockHeaderReply make_header_reply(const BlockHeader& header) {
    return BlockHeaderReply{
        .block_hash = header.hash,
        .parent_hash = header.parent_hash,
        .block_number = header.number,
        .new_root = header.state_commitment,
        .timestamp = header.timestamp,
        .sequencer_address = header.sequencer_address,
        .l1_gas_price = header.l1_gas_price,
        .starknet_version = header.starknet_version,
    };
}

BlockHeaderReply make_header_reply(const PendingBlock& pending) {
    return BlockHeaderReply{
        .block_hash = std::nullopt,
        .parent_hash = pending.parent_hash,
        .block_number = std::nullopt,
        .new_root = std::nullopt,
        .timestamp = pending.timestamp,
        .sequencer_address = pending.sequencer_address,
        .l1_gas_price = pending.l1_gas_price,
        .starknet_version = pending.starknet_version,
    };
}

BlockWithTxHashes make_block_with_tx_hashes(const BlockHeader& header, BlockStatus status, std::vector<Hash> tx_hashes) {
    return BlockWithTxHashes{status, make_header_reply(header), std::move(tx_hashes)};
}

BlockWithTxHashes make_block_with_tx_hashes(const PendingBlock& pending) {
    std::vector<Hash> tx_hashes;
    tx_hashes.reserve(pending.transactions.size());
    for (const auto& tx : pending.transactions) {
        tx_hashes.push_back(tx.hash);
    }
    return BlockWithTxHashes{BlockStatus::kPending, make_header_reply(pending), std::move(tx_hashes)};
}

BlockWithTxs make_block_with_txs(const BlockHeader& header, BlockStatus status, const std::vector<TransactionWithReceipt>& transactions) {
    BlockWithTxs block{status, make_header_reply(header), {}};
    block.transactions.reserve(transactions.size());
    for (const auto& tx_with_receipt : transactions) {
        block.transactions.push_back(tx_with_receipt.transaction);
    }
    return block;
}

BlockWithTxs make_block_with_txs(const PendingBlock& pending) {
    return BlockWithTxs{BlockStatus::kPending, make_header_reply(pending), pending.transactions};
}

}  // namespace starkworm::rpc::core
