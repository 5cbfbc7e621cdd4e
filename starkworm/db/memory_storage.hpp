// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <starkworm/db/storage.hpp>

namespace starkworm::db {

//! Reference block store kept entirely in memory
//! \details Read transactions hold a shared lock for their whole lifetime, so they observe one consistent snapshot;
//! writers take the exclusive lock and thus wait for all open read transactions
class MemoryStorage : public Storage {
  public:
    MemoryStorage() = default;

    MemoryStorage(const MemoryStorage&) = delete;
    MemoryStorage& operator=(const MemoryStorage&) = delete;

    std::unique_ptr<Connection> connection() override;

    //! Append the next block on top of the current head
    //! \throws std::logic_error if number or parent hash do not extend the head or if hashes collide
    void insert_block(const BlockHeader& header, std::vector<TransactionWithReceipt> transactions);

    void set_l1_accepted_block_number(std::optional<BlockNum> number);

    std::optional<BlockNum> head_block_number() const;

    //! Number of connections currently open
    size_t active_connections() const { return active_connections_; }

  private:
    friend class MemoryConnection;
    friend class MemoryReadTransaction;

    struct StoredBlock {
        BlockHeader header;
        std::vector<TransactionWithReceipt> transactions;
    };

    struct TransactionPosition {
        BlockNum block_number{0};
        size_t index{0};
    };

    mutable std::shared_mutex mutex_;
    std::vector<StoredBlock> blocks_;  // indexed by block number
    std::map<Hash, BlockNum> block_numbers_by_hash_;
    std::map<Hash, TransactionPosition> transaction_positions_;
    std::optional<BlockNum> l1_accepted_;
    std::atomic<size_t> active_connections_{0};
};

}  // namespace starkworm::db
