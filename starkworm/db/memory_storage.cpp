// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_storage.hpp"

#include <mutex>
#include <set>
#include <utility>

#include <starkworm/core/common/util.hpp>
#include <starkworm/infra/common/ensure.hpp>
#include <starkworm/infra/common/log.hpp>

namespace starkworm::db {

class MemoryReadTransaction : public ReadTransaction {
  public:
    explicit MemoryReadTransaction(const MemoryStorage& storage) : storage_{storage}, lock_{storage.mutex_} {}

    std::optional<BlockHeader> block_header(const BlockKey& key) override {
        const auto number = resolve(key);
        if (!number) {
            return std::nullopt;
        }
        return storage_.blocks_[*number].header;
    }

    std::optional<BlockNum> l1_accepted_block_number() override {
        return storage_.l1_accepted_;
    }

    std::optional<std::vector<Hash>> transaction_hashes_for_block(BlockNum number) override {
        if (number >= storage_.blocks_.size()) {
            return std::nullopt;
        }
        std::vector<Hash> hashes;
        hashes.reserve(storage_.blocks_[number].transactions.size());
        for (const auto& tx_with_receipt : storage_.blocks_[number].transactions) {
            hashes.push_back(tx_with_receipt.transaction.hash);
        }
        return hashes;
    }

    std::optional<std::vector<TransactionWithReceipt>> transactions_for_block(BlockNum number) override {
        if (number >= storage_.blocks_.size()) {
            return std::nullopt;
        }
        return storage_.blocks_[number].transactions;
    }

    std::optional<TransactionLocation> transaction_by_hash(const Hash& hash) override {
        const auto it = storage_.transaction_positions_.find(hash);
        if (it == storage_.transaction_positions_.end()) {
            return std::nullopt;
        }
        const auto& [block_number, index] = it->second;
        const auto& block = storage_.blocks_[block_number];
        const auto& [transaction, receipt] = block.transactions[index];
        return TransactionLocation{transaction, receipt, block_number, block.header.hash};
    }

  private:
    std::optional<BlockNum> resolve(const BlockKey& key) const {
        if (storage_.blocks_.empty()) {
            return std::nullopt;
        }
        if (key.is_latest()) {
            return storage_.blocks_.size() - 1;
        }
        if (key.is_number()) {
            if (key.number() >= storage_.blocks_.size()) {
                return std::nullopt;
            }
            return key.number();
        }
        const auto it = storage_.block_numbers_by_hash_.find(key.hash());
        if (it == storage_.block_numbers_by_hash_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    const MemoryStorage& storage_;
    std::shared_lock<std::shared_mutex> lock_;
};

class MemoryConnection : public Connection {
  public:
    explicit MemoryConnection(MemoryStorage& storage) : storage_{storage} {
        ++storage_.active_connections_;
    }
    ~MemoryConnection() override {
        --storage_.active_connections_;
    }

    MemoryConnection(const MemoryConnection&) = delete;
    MemoryConnection& operator=(const MemoryConnection&) = delete;

    std::unique_ptr<ReadTransaction> begin_read() override {
        return std::make_unique<MemoryReadTransaction>(storage_);
    }

  private:
    MemoryStorage& storage_;
};

std::unique_ptr<Connection> MemoryStorage::connection() {
    return std::make_unique<MemoryConnection>(*this);
}

void MemoryStorage::insert_block(const BlockHeader& header, std::vector<TransactionWithReceipt> transactions) {
    std::unique_lock lock{mutex_};
    ensure(header.number == blocks_.size(), [&]() {
        return "MemoryStorage: block " + std::to_string(header.number) + " does not extend head " + std::to_string(blocks_.size());
    });
    if (!blocks_.empty()) {
        ensure(header.parent_hash == blocks_.back().header.hash, [&]() {
            return "MemoryStorage: block " + std::to_string(header.number) + " parent hash mismatch " + felt_to_hex(header.parent_hash);
        });
    }
    ensure(!block_numbers_by_hash_.contains(header.hash), [&]() {
        return "MemoryStorage: duplicate block hash " + felt_to_hex(header.hash);
    });
    std::set<Hash> block_tx_hashes;
    for (const auto& tx_with_receipt : transactions) {
        const auto& tx_hash = tx_with_receipt.transaction.hash;
        ensure(!transaction_positions_.contains(tx_hash) && block_tx_hashes.insert(tx_hash).second, [&]() {
            return "MemoryStorage: duplicate transaction hash " + felt_to_hex(tx_hash);
        });
    }
    for (size_t i{0}; i < transactions.size(); ++i) {
        transaction_positions_.emplace(transactions[i].transaction.hash, TransactionPosition{header.number, i});
    }
    block_numbers_by_hash_.emplace(header.hash, header.number);
    blocks_.push_back(StoredBlock{header, std::move(transactions)});
    STARK_TRACE << "MemoryStorage: inserted block " << header.number << " " << felt_to_hex(header.hash);
}

void MemoryStorage::set_l1_accepted_block_number(std::optional<BlockNum> number) {
    std::unique_lock lock{mutex_};
    l1_accepted_ = number;
}

std::optional<BlockNum> MemoryStorage::head_block_number() const {
    std::shared_lock lock{mutex_};
    if (blocks_.empty()) {
        return std::nullopt;
    }
    return blocks_.size() - 1;
}

}  // namespace starkworm::db
