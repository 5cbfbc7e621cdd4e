// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <starkworm/core/common/base.hpp>
#include <starkworm/core/types/block.hpp>
#include <starkworm/core/types/transaction.hpp>

namespace starkworm {

//! Block under construction by the sequencer: it has neither hash nor number nor state root yet
struct PendingBlock {
    Hash parent_hash{};
    BlockTime timestamp{0};
    Felt sequencer_address{};
    ResourcePrice l1_gas_price;
    std::string starknet_version;
    std::vector<Transaction> transactions;
    std::vector<Receipt> receipts;  // same order as transactions

    //! Find a transaction and its receipt by hash
    std::optional<TransactionWithReceipt> find_transaction(const Hash& hash) const;
};

//! Handle to the latest pending block, replaced as a whole by the external producer
class PendingSource {
  public:
    PendingSource() = default;
    explicit PendingSource(std::shared_ptr<const PendingBlock> block) : block_{std::move(block)} {}

    PendingSource(const PendingSource&) = delete;
    PendingSource& operator=(const PendingSource&) = delete;

    //! Snapshot of the current pending block, null if none is available
    std::shared_ptr<const PendingBlock> snapshot() const;

    void update(std::shared_ptr<const PendingBlock> block);

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<const PendingBlock> block_;
};

}  // namespace starkworm
