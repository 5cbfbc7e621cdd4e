// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_storage.hpp"

#include <chrono>
#include <future>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <starkworm/core/common/util.hpp>
#include <starkworm/db/test_util/sample_chain.hpp>

namespace starkworm::db {

using test_util::populate_sample_chain;
using test_util::sample_block_hash;
using test_util::sample_header;
using test_util::sample_transaction;

TEST_CASE("MemoryStorage: empty", "[db][memory_storage]") {
    MemoryStorage storage;
    CHECK_FALSE(storage.head_block_number().has_value());
    const auto connection = storage.connection();
    const auto txn = connection->begin_read();
    CHECK_FALSE(txn->block_header(BlockKey::latest()).has_value());
    CHECK_FALSE(txn->block_header(BlockKey{BlockNum{0}}).has_value());
    CHECK_FALSE(txn->l1_accepted_block_number().has_value());
    CHECK_FALSE(txn->transaction_hashes_for_block(0).has_value());
}

TEST_CASE("MemoryStorage: read", "[db][memory_storage]") {
    MemoryStorage storage;
    populate_sample_chain(storage, 0);
    const auto connection = storage.connection();
    const auto txn = connection->begin_read();

    SECTION("latest resolves to head") {
        const auto header = txn->block_header(BlockKey::latest());
        REQUIRE(header.has_value());
        CHECK(header->number == 1);
        CHECK(*header == sample_header(1));
    }
    SECTION("by number and by hash agree") {
        const auto by_number = txn->block_header(BlockKey{BlockNum{1}});
        const auto by_hash = txn->block_header(BlockKey{sample_block_hash(1)});
        REQUIRE(by_number.has_value());
        REQUIRE(by_hash.has_value());
        CHECK(*by_number == *by_hash);
    }
    SECTION("unknown number or hash") {
        CHECK_FALSE(txn->block_header(BlockKey{BlockNum{2}}).has_value());
        CHECK_FALSE(txn->block_header(BlockKey{felt_from_u64(0xdead)}).has_value());
    }
    SECTION("transaction hashes keep order") {
        const auto hashes = txn->transaction_hashes_for_block(1);
        REQUIRE(hashes.has_value());
        CHECK(*hashes == std::vector<Hash>{felt_from_u64(0x11), felt_from_u64(0x12)});
        const auto genesis_hashes = txn->transaction_hashes_for_block(0);
        REQUIRE(genesis_hashes.has_value());
        CHECK(genesis_hashes->empty());
    }
    SECTION("transactions with receipts") {
        const auto transactions = txn->transactions_for_block(1);
        REQUIRE(transactions.has_value());
        REQUIRE(transactions->size() == 2);
        CHECK((*transactions)[1].receipt.execution_status == ExecutionStatus::kReverted);
    }
    SECTION("transaction by hash") {
        const auto location = txn->transaction_by_hash(felt_from_u64(0x12));
        REQUIRE(location.has_value());
        CHECK(location->block_number == 1);
        CHECK(location->block_hash == sample_block_hash(1));
        CHECK(location->transaction.hash == felt_from_u64(0x12));
        CHECK_FALSE(txn->transaction_by_hash(felt_from_u64(0x99)).has_value());
    }
    SECTION("l1 accepted") {
        CHECK(txn->l1_accepted_block_number() == BlockNum{0});
    }
}

TEST_CASE("MemoryStorage: insert", "[db][memory_storage]") {
    MemoryStorage storage;
    storage.insert_block(sample_header(0), {});

    SECTION("gap in numbers") {
        CHECK_THROWS_AS(storage.insert_block(sample_header(2), {}), std::logic_error);
    }
    SECTION("wrong parent") {
        auto header = sample_header(1);
        header.parent_hash = felt_from_u64(0xbad);
        CHECK_THROWS_AS(storage.insert_block(header, {}), std::logic_error);
    }
    SECTION("duplicate transaction hash leaves storage untouched") {
        const auto tx = sample_transaction(felt_from_u64(0x11));
        CHECK_THROWS_AS(storage.insert_block(sample_header(1), {tx, tx}), std::logic_error);
        CHECK(storage.head_block_number() == BlockNum{0});
        CHECK_FALSE(storage.connection()->begin_read()->transaction_by_hash(felt_from_u64(0x11)).has_value());
    }
}

TEST_CASE("MemoryStorage: connection accounting", "[db][memory_storage]") {
    MemoryStorage storage;
    CHECK(storage.active_connections() == 0);
    {
        const auto c1 = storage.connection();
        const auto c2 = storage.connection();
        CHECK(storage.active_connections() == 2);
    }
    CHECK(storage.active_connections() == 0);
}

TEST_CASE("MemoryStorage: read transaction sees one snapshot", "[db][memory_storage]") {
    MemoryStorage storage;
    storage.insert_block(sample_header(0), {});
    const auto connection = storage.connection();
    auto txn = connection->begin_read();

    auto writer = std::async(std::launch::async, [&]() { storage.insert_block(sample_header(1), {}); });
    CHECK(writer.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);
    const auto header = txn->block_header(BlockKey::latest());
    REQUIRE(header.has_value());
    CHECK(header->number == 0);

    txn.reset();
    writer.get();
    CHECK(storage.head_block_number() == BlockNum{1});
}

}  // namespace starkworm::db
