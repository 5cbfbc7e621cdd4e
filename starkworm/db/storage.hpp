// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <starkworm/core/common/base.hpp>
#include <starkworm/core/types/block.hpp>
#include <starkworm/core/types/block_id.hpp>
#include <starkworm/core/types/transaction.hpp>

namespace starkworm::db {

//! Read-only view over one consistent snapshot of the block store
//! \remarks All methods are blocking and may throw on storage faults
class ReadTransaction {
  public:
    virtual ~ReadTransaction() = default;

    //! Header of the block identified by key, latest resolved within this transaction
    virtual std::optional<BlockHeader> block_header(const BlockKey& key) = 0;

    //! Highest block number accepted on L1, if any
    virtual std::optional<BlockNum> l1_accepted_block_number() = 0;

    virtual std::optional<std::vector<Hash>> transaction_hashes_for_block(BlockNum number) = 0;

    virtual std::optional<std::vector<TransactionWithReceipt>> transactions_for_block(BlockNum number) = 0;

    virtual std::optional<TransactionLocation> transaction_by_hash(const Hash& hash) = 0;
};

class Connection {
  public:
    virtual ~Connection() = default;

    virtual std::unique_ptr<ReadTransaction> begin_read() = 0;
};

//! Persisted block store, the source of connections
class Storage {
  public:
    virtual ~Storage() = default;

    virtual std::unique_ptr<Connection> connection() = 0;
};

}  // namespace starkworm::db
