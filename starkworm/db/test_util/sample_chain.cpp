// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sample_chain.hpp"

#include <starkworm/core/common/util.hpp>

namespace starkworm::db::test_util {

Hash sample_block_hash(BlockNum number) {
    return felt_from_u64(0xb10c00 + number);
}

BlockHeader sample_header(BlockNum number) {
    BlockHeader header;
    header.number = number;
    header.hash = sample_block_hash(number);
    header.parent_hash = number == 0 ? Hash{} : sample_block_hash(number - 1);
    header.state_commitment = felt_from_u64(0x5000 + number);
    header.timestamp = 1'700'000'000 + number;
    header.sequencer_address = felt_from_u64(0x5e9);
    header.l1_gas_price = ResourcePrice{.price_in_wei = 0x3b9aca00, .price_in_fri = 0x1};
    header.starknet_version = "0.12.3";
    return header;
}

TransactionWithReceipt sample_transaction(const Hash& hash, ExecutionStatus status) {
    TransactionWithReceipt tx_with_receipt;
    auto& tx = tx_with_receipt.transaction;
    tx.hash = hash;
    tx.type = TransactionType::kInvoke;
    tx.version = felt_from_u64(1);
    tx.sender_address = felt_from_u64(0xacc);
    tx.nonce = felt_from_u64(0);
    tx.max_fee = felt_from_u64(0x1000);
    tx.calldata = {felt_from_u64(1), felt_from_u64(2)};
    tx.signature = {felt_from_u64(3)};
    auto& receipt = tx_with_receipt.receipt;
    receipt.transaction_hash = hash;
    receipt.actual_fee = felt_from_u64(0x10);
    receipt.execution_status = status;
    if (status == ExecutionStatus::kReverted) {
        receipt.revert_reason = "assertion failed";
    }
    return tx_with_receipt;
}

void populate_sample_chain(MemoryStorage& storage, std::optional<BlockNum> l1_accepted) {
    storage.insert_block(sample_header(0), {});
    storage.insert_block(sample_header(1), {sample_transaction(felt_from_u64(0x11)),
                                            sample_transaction(felt_from_u64(0x12), ExecutionStatus::kReverted)});
    storage.set_l1_accepted_block_number(l1_accepted);
}

std::shared_ptr<const PendingBlock> sample_pending_block() {
    auto block = std::make_shared<PendingBlock>();
    block->parent_hash = sample_block_hash(1);
    block->timestamp = 1'700'000'100;
    block->sequencer_address = felt_from_u64(0x5e9);
    block->l1_gas_price = ResourcePrice{.price_in_wei = 0x3b9aca00, .price_in_fri = 0x1};
    block->starknet_version = "0.12.3";
    for (const auto hash : {felt_from_u64(0x21), felt_from_u64(0x22)}) {
        auto [tx, receipt] = sample_transaction(hash);
        block->transactions.push_back(std::move(tx));
        block->receipts.push_back(std::move(receipt));
    }
    return block;
}

}  // namespace starkworm::db::test_util
