// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "pending.hpp"

#include <algorithm>

#include <starkworm/infra/common/ensure.hpp>

namespace starkworm {

std::optional<TransactionWithReceipt> PendingBlock::find_transaction(const Hash& hash) const {
    const auto it = std::find_if(transactions.cbegin(), transactions.cend(), [&](const auto& tx) { return tx.hash == hash; });
    if (it == transactions.cend()) {
        return std::nullopt;
    }
    const auto index = static_cast<size_t>(std::distance(transactions.cbegin(), it));
    ensure_invariant(index < receipts.size(), "pending transaction without receipt");
    return TransactionWithReceipt{*it, receipts[index]};
}

std::shared_ptr<const PendingBlock> PendingSource::snapshot() const {
    std::scoped_lock lock{mutex_};
    return block_;
}

void PendingSource::update(std::shared_ptr<const PendingBlock> block) {
    std::scoped_lock lock{mutex_};
    block_ = std::move(block);
}

}  // namespace starkworm
