// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <gmock/gmock.h>

#include <starkworm/db/storage.hpp>

namespace starkworm::db::test_util {

class MockReadTransaction : public ReadTransaction {
  public:
    MOCK_METHOD((std::optional<BlockHeader>), block_header, (const BlockKey&), (override));
    MOCK_METHOD((std::optional<BlockNum>), l1_accepted_block_number, (), (override));
    MOCK_METHOD((std::optional<std::vector<Hash>>), transaction_hashes_for_block, (BlockNum), (override));
    MOCK_METHOD((std::optional<std::vector<TransactionWithReceipt>>), transactions_for_block, (BlockNum), (override));
    MOCK_METHOD((std::optional<TransactionLocation>), transaction_by_hash, (const Hash&), (override));
};

class MockConnection : public Connection {
  public:
    MOCK_METHOD((std::unique_ptr<ReadTransaction>), begin_read, (), (override));
};

class MockStorage : public Storage {
  public:
    MOCK_METHOD((std::unique_ptr<Connection>), connection, (), (override));
};

}  // namespace starkworm::db::test_util
