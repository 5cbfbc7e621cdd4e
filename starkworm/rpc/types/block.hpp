// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <starkworm/core/common/base.hpp>
#include <starkworm/core/types/block.hpp>
#include <starkworm/core/types/transaction.hpp>

namespace starkworm::rpc {

enum class BlockStatus {
    kPending,
    kAcceptedOnL2,
    kAcceptedOnL1,
};

std::string_view to_string(BlockStatus status);

//! Finality of a transaction already included in a block
enum class TxFinalityStatus {
    kAcceptedOnL2,
    kAcceptedOnL1,
};

std::string_view to_string(TxFinalityStatus status);

//! Header part of every block reply, whatever the source: pending blocks have no hash, number or root
struct BlockHeaderReply {
    std::optional<Hash> block_hash;
    Hash parent_hash{};
    std::optional<BlockNum> block_number;
    std::optional<Felt> new_root;
    BlockTime timestamp{0};
    Felt sequencer_address{};
    ResourcePrice l1_gas_price;
    std::string starknet_version;

    friend bool operator==(const BlockHeaderReply&, const BlockHeaderReply&) = default;
};

struct BlockWithTxHashes {
    BlockStatus status{BlockStatus::kPending};
    BlockHeaderReply header;
    std::vector<Hash> transactions;

    friend bool operator==(const BlockWithTxHashes&, const BlockWithTxHashes&) = default;
};

struct BlockWithTxs {
    BlockStatus status{BlockStatus::kPending};
    BlockHeaderReply header;
    std::vector<Transaction> transactions;

    friend bool operator==(const BlockWithTxs&, const BlockWithTxs&) = default;
};

struct BlockHashAndNumber {
    Hash block_hash{};
    BlockNum block_number{0};

    friend bool operator==(const BlockHashAndNumber&, const BlockHashAndNumber&) = default;
};

struct TransactionStatus {
    TxFinalityStatus finality_status{TxFinalityStatus::kAcceptedOnL2};
    ExecutionStatus execution_status{ExecutionStatus::kSucceeded};

    friend bool operator==(const TransactionStatus&, const TransactionStatus&) = default;
};

//! Receipt together with the finality and coordinates of the containing block: pending receipts have no coordinates
struct TransactionReceiptReply {
    TransactionType type{TransactionType::kInvoke};
    Receipt receipt;
    TxFinalityStatus finality_status{TxFinalityStatus::kAcceptedOnL2};
    std::optional<Hash> block_hash;
    std::optional<BlockNum> block_number;

    friend bool operator==(const TransactionReceiptReply&, const TransactionReceiptReply&) = default;
};

std::ostream& operator<<(std::ostream& out, BlockStatus status);
std::ostream& operator<<(std::ostream& out, const BlockWithTxHashes& block);

}  // namespace starkworm::rpc
