// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "pending.hpp"

#include <atomic>
#include <thread>

#include <catch2/catch_test_macros.hpp>

#include <starkworm/core/common/util.hpp>

namespace starkworm {

static std::shared_ptr<const PendingBlock> make_pending_block(size_t num_transactions) {
    auto block = std::make_shared<PendingBlock>();
    block->starknet_version = "0.12.3";
    for (size_t i{0}; i < num_transactions; ++i) {
        Transaction tx;
        tx.hash = felt_from_u64(0x100 + i);
        block->transactions.push_back(tx);
        block->receipts.push_back(Receipt{.transaction_hash = tx.hash});
    }
    return block;
}

TEST_CASE("PendingBlock::find_transaction", "[core][types][pending]") {
    const auto block = make_pending_block(3);
    SECTION("present") {
        const auto tx_with_receipt = block->find_transaction(felt_from_u64(0x101));
        REQUIRE(tx_with_receipt.has_value());
        CHECK(tx_with_receipt->transaction.hash == felt_from_u64(0x101));
        CHECK(tx_with_receipt->receipt.transaction_hash == felt_from_u64(0x101));
    }
    SECTION("absent") {
        CHECK_FALSE(block->find_transaction(felt_from_u64(0x200)).has_value());
    }
}

TEST_CASE("PendingSource", "[core][types][pending]") {
    SECTION("empty by default") {
        PendingSource source;
        CHECK(source.snapshot() == nullptr);
    }
    SECTION("update replaces snapshot") {
        PendingSource source{make_pending_block(1)};
        const auto first = source.snapshot();
        REQUIRE(first);
        source.update(make_pending_block(2));
        const auto second = source.snapshot();
        REQUIRE(second);
        CHECK(first->transactions.size() == 1);
        CHECK(second->transactions.size() == 2);
    }
    SECTION("update to null clears snapshot") {
        PendingSource source{make_pending_block(1)};
        source.update(nullptr);
        CHECK(source.snapshot() == nullptr);
    }
    SECTION("readers always see a whole snapshot") {
        PendingSource source{make_pending_block(2)};
        std::atomic_bool stop{false};
        std::thread writer{[&]() {
            for (size_t i{0}; i < 1000; ++i) {
                source.update(make_pending_block(i % 2 == 0 ? 4 : 2));
            }
            stop = true;
        }};
        while (!stop) {
            const auto block = source.snapshot();
            REQUIRE(block);
            CHECK(block->transactions.size() == block->receipts.size());
        }
        writer.join();
    }
}

}  // namespace starkworm
