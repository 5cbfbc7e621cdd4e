// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <starkworm/core/types/block.hpp>
#include <starkworm/core/types/pending.hpp>
#include <starkworm/core/types/transaction.hpp>
#include <starkworm/db/memory_storage.hpp>

namespace starkworm::db::test_util {

//! Block hash used by the sample chain for the block at given number
Hash sample_block_hash(BlockNum number);

BlockHeader sample_header(BlockNum number);

TransactionWithReceipt sample_transaction(const Hash& hash, ExecutionStatus status = ExecutionStatus::kSucceeded);

//! Populate storage with genesis (no transactions) and block 1 (transactions 0x11 and 0x12, the latter reverted)
//! \param l1_accepted the highest L1-accepted block number to record
void populate_sample_chain(MemoryStorage& storage, std::optional<BlockNum> l1_accepted);

//! Pending block on top of the sample chain carrying transactions 0x21 and 0x22
std::shared_ptr<const PendingBlock> sample_pending_block();

}  // namespace starkworm::db::test_util
