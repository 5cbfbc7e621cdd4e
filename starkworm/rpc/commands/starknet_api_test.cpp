// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "starknet_api.hpp"

#include <memory>
#include <stdexcept>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <starkworm/core/common/util.hpp>
#include <starkworm/db/memory_storage.hpp>
#include <starkworm/db/test_util/mock_storage.hpp>
#include <starkworm/db/test_util/sample_chain.hpp>
#include <starkworm/infra/test_util/context_test_base.hpp>
#include <starkworm/infra/test_util/log.hpp>
#include <starkworm/rpc/json/block.hpp>
#include <starkworm/rpc/json/transaction.hpp>
#include <starkworm/rpc/json/types.hpp>

namespace starkworm::rpc::commands {

using db::test_util::MockConnection;
using db::test_util::MockReadTransaction;
using db::test_util::MockStorage;
using db::test_util::populate_sample_chain;
using db::test_util::sample_block_hash;
using db::test_util::sample_pending_block;
using testing::InvokeWithoutArgs;
using testing::Return;

//! Exposes the JSON handlers for testing
class StarknetRpcApiForTest : public StarknetRpcApi {
  public:
    using StarknetRpcApi::StarknetRpcApi;

    using StarknetRpcApi::handle_starknet_block_hash_and_number;
    using StarknetRpcApi::handle_starknet_block_number;
    using StarknetRpcApi::handle_starknet_get_block_transaction_count;
    using StarknetRpcApi::handle_starknet_get_block_with_tx_hashes;
    using StarknetRpcApi::handle_starknet_get_block_with_txs;
    using StarknetRpcApi::handle_starknet_get_transaction_by_block_id_and_index;
    using StarknetRpcApi::handle_starknet_get_transaction_by_hash;
    using StarknetRpcApi::handle_starknet_get_transaction_receipt;
    using StarknetRpcApi::handle_starknet_get_transaction_status;
    using StarknetRpcApi::handle_starknet_spec_version;
};

struct StarknetRpcApiTest : public test_util::ContextTestBase {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    WorkerPool workers{2};
    db::MemoryStorage storage;
    PendingSource pending;
};

static const Hash kTx11{felt_from_u64(0x11)};
static const Hash kTx12{felt_from_u64(0x12)};
static const Hash kTx21{felt_from_u64(0x21)};
static const Hash kUnknownHash{felt_from_u64(0xdead)};

TEST_CASE_METHOD(StarknetRpcApiTest, "StarknetRpcApi: get_block_with_tx_hashes", "[rpc][commands][starknet_api]") {
    populate_sample_chain(storage, 0);
    StarknetRpcApi api{storage, &pending, workers};

    SECTION("latest") {
        const auto block = spawn_and_wait(api.get_block_with_tx_hashes(BlockId::latest()));
        REQUIRE(block.has_value());
        CHECK(block->status == BlockStatus::kAcceptedOnL2);
        CHECK(block->header.block_number == 1);
        CHECK(block->header.block_hash == sample_block_hash(1));
        CHECK(block->header.parent_hash == sample_block_hash(0));
        CHECK((block->transactions == std::vector<Hash>{kTx11, kTx12}));
    }
    SECTION("by number within L1 finality") {
        const auto block = spawn_and_wait(api.get_block_with_tx_hashes(BlockId{BlockNum{0}}));
        REQUIRE(block.has_value());
        CHECK(block->status == BlockStatus::kAcceptedOnL1);
        CHECK(block->transactions.empty());
    }
    SECTION("by hash same as by number") {
        const auto by_hash = spawn_and_wait(api.get_block_with_tx_hashes(BlockId{sample_block_hash(1)}));
        const auto by_number = spawn_and_wait(api.get_block_with_tx_hashes(BlockId{BlockNum{1}}));
        REQUIRE(by_hash.has_value());
        REQUIRE(by_number.has_value());
        CHECK(*by_hash == *by_number);
    }
    SECTION("unknown number") {
        const auto block = spawn_and_wait(api.get_block_with_tx_hashes(BlockId{BlockNum{2}}));
        REQUIRE_FALSE(block.has_value());
        CHECK(block.error().kind() == ErrorKind::kBlockNotFound);
    }
    SECTION("unknown hash") {
        const auto block = spawn_and_wait(api.get_block_with_tx_hashes(BlockId{kUnknownHash}));
        REQUIRE_FALSE(block.has_value());
        CHECK(block.error().kind() == ErrorKind::kBlockNotFound);
    }
    CHECK(storage.active_connections() == 0);
}

TEST_CASE_METHOD(StarknetRpcApiTest, "StarknetRpcApi: pending block", "[rpc][commands][starknet_api]") {
    populate_sample_chain(storage, std::nullopt);

    SECTION("pending not served") {
        StarknetRpcApi api{storage, nullptr, workers};
        const auto block = spawn_and_wait(api.get_block_with_txs(BlockId::pending()));
        REQUIRE_FALSE(block.has_value());
        CHECK(block.error().kind() == ErrorKind::kPendingNotSupported);
        const auto count = spawn_and_wait(api.get_block_transaction_count(BlockId::pending()));
        REQUIRE_FALSE(count.has_value());
        CHECK(count.error().kind() == ErrorKind::kPendingNotSupported);
    }
    SECTION("no pending block yet") {
        StarknetRpcApi api{storage, &pending, workers};
        const auto block = spawn_and_wait(api.get_block_with_tx_hashes(BlockId::pending()));
        REQUIRE_FALSE(block.has_value());
        CHECK(block.error().kind() == ErrorKind::kBlockNotFound);
    }
    SECTION("pending block available") {
        pending.update(sample_pending_block());
        StarknetRpcApi api{storage, &pending, workers};

        const auto block = spawn_and_wait(api.get_block_with_txs(BlockId::pending()));
        REQUIRE(block.has_value());
        CHECK(block->status == BlockStatus::kPending);
        CHECK_FALSE(block->header.block_hash);
        CHECK_FALSE(block->header.block_number);
        CHECK_FALSE(block->header.new_root);
        CHECK(block->header.parent_hash == sample_block_hash(1));
        REQUIRE(block->transactions.size() == 2);
        CHECK(block->transactions[0].hash == kTx21);

        const auto count = spawn_and_wait(api.get_block_transaction_count(BlockId::pending()));
        REQUIRE(count.has_value());
        CHECK(*count == 2);

        const auto tx = spawn_and_wait(api.get_transaction_by_block_id_and_index(BlockId::pending(), 1));
        REQUIRE(tx.has_value());
        CHECK(tx->hash == felt_from_u64(0x22));

        const auto out_of_range = spawn_and_wait(api.get_transaction_by_block_id_and_index(BlockId::pending(), 2));
        REQUIRE_FALSE(out_of_range.has_value());
        CHECK(out_of_range.error().kind() == ErrorKind::kInvalidTxnIndex);

        const auto by_hash = spawn_and_wait(api.get_transaction_by_hash(kTx21));
        REQUIRE(by_hash.has_value());
        CHECK(by_hash->hash == kTx21);

        const auto status = spawn_and_wait(api.get_transaction_status(kTx21));
        REQUIRE(status.has_value());
        CHECK((*status == TransactionStatus{TxFinalityStatus::kAcceptedOnL2, ExecutionStatus::kSucceeded}));

        const auto receipt = spawn_and_wait(api.get_transaction_receipt(kTx21));
        REQUIRE(receipt.has_value());
        CHECK(receipt->receipt.transaction_hash == kTx21);
        CHECK(receipt->finality_status == TxFinalityStatus::kAcceptedOnL2);
        CHECK_FALSE(receipt->block_hash);
        CHECK_FALSE(receipt->block_number);
    }
    SECTION("latest ignores pending block") {
        pending.update(sample_pending_block());
        StarknetRpcApi api{storage, &pending, workers};
        const auto block = spawn_and_wait(api.get_block_with_tx_hashes(BlockId::latest()));
        REQUIRE(block.has_value());
        CHECK(block->header.block_number == 1);
    }
}

TEST_CASE_METHOD(StarknetRpcApiTest, "StarknetRpcApi: get_block_transaction_count", "[rpc][commands][starknet_api]") {
    populate_sample_chain(storage, std::nullopt);
    StarknetRpcApi api{storage, &pending, workers};

    CHECK(spawn_and_wait(api.get_block_transaction_count(BlockId{BlockNum{0}})) == 0u);
    CHECK(spawn_and_wait(api.get_block_transaction_count(BlockId{BlockNum{1}})) == 2u);
    CHECK(spawn_and_wait(api.get_block_transaction_count(BlockId{sample_block_hash(1)})) == 2u);
    const auto unknown = spawn_and_wait(api.get_block_transaction_count(BlockId{BlockNum{7}}));
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().kind() == ErrorKind::kBlockNotFound);
}

TEST_CASE_METHOD(StarknetRpcApiTest, "StarknetRpcApi: get_transaction_by_block_id_and_index", "[rpc][commands][starknet_api]") {
    populate_sample_chain(storage, std::nullopt);
    StarknetRpcApi api{storage, &pending, workers};

    const auto tx = spawn_and_wait(api.get_transaction_by_block_id_and_index(BlockId{BlockNum{1}}, 1));
    REQUIRE(tx.has_value());
    CHECK(tx->hash == kTx12);

    const auto out_of_range = spawn_and_wait(api.get_transaction_by_block_id_and_index(BlockId{BlockNum{0}}, 0));
    REQUIRE_FALSE(out_of_range.has_value());
    CHECK(out_of_range.error().kind() == ErrorKind::kInvalidTxnIndex);

    const auto unknown_block = spawn_and_wait(api.get_transaction_by_block_id_and_index(BlockId{kUnknownHash}, 0));
    REQUIRE_FALSE(unknown_block.has_value());
    CHECK(unknown_block.error().kind() == ErrorKind::kBlockNotFound);
}

TEST_CASE_METHOD(StarknetRpcApiTest, "StarknetRpcApi: transaction by hash", "[rpc][commands][starknet_api]") {
    populate_sample_chain(storage, std::nullopt);
    StarknetRpcApi api{storage, &pending, workers};

    SECTION("get_transaction_by_hash") {
        const auto tx = spawn_and_wait(api.get_transaction_by_hash(kTx12));
        REQUIRE(tx.has_value());
        CHECK(*tx == db::test_util::sample_transaction(kTx12, ExecutionStatus::kReverted).transaction);

        const auto unknown = spawn_and_wait(api.get_transaction_by_hash(kUnknownHash));
        REQUIRE_FALSE(unknown.has_value());
        CHECK(unknown.error().kind() == ErrorKind::kTxnHashNotFound);
    }
    SECTION("get_transaction_status before L1 acceptance") {
        const auto status = spawn_and_wait(api.get_transaction_status(kTx12));
        REQUIRE(status.has_value());
        CHECK((*status == TransactionStatus{TxFinalityStatus::kAcceptedOnL2, ExecutionStatus::kReverted}));
    }
    SECTION("get_transaction_status at L1 acceptance boundary") {
        storage.set_l1_accepted_block_number(1);
        const auto status = spawn_and_wait(api.get_transaction_status(kTx11));
        REQUIRE(status.has_value());
        CHECK((*status == TransactionStatus{TxFinalityStatus::kAcceptedOnL1, ExecutionStatus::kSucceeded}));
    }
    SECTION("get_transaction_status unknown") {
        const auto status = spawn_and_wait(api.get_transaction_status(kUnknownHash));
        REQUIRE_FALSE(status.has_value());
        CHECK(status.error().kind() == ErrorKind::kTxnHashNotFound);
    }
    SECTION("get_transaction_receipt before L1 acceptance") {
        const auto receipt = spawn_and_wait(api.get_transaction_receipt(kTx12));
        REQUIRE(receipt.has_value());
        CHECK(receipt->type == TransactionType::kInvoke);
        CHECK(receipt->receipt == db::test_util::sample_transaction(kTx12, ExecutionStatus::kReverted).receipt);
        CHECK(receipt->finality_status == TxFinalityStatus::kAcceptedOnL2);
        CHECK(receipt->block_hash == sample_block_hash(1));
        CHECK(receipt->block_number == BlockNum{1});
    }
    SECTION("get_transaction_receipt at L1 acceptance boundary") {
        storage.set_l1_accepted_block_number(1);
        const auto receipt = spawn_and_wait(api.get_transaction_receipt(kTx11));
        REQUIRE(receipt.has_value());
        CHECK(receipt->finality_status == TxFinalityStatus::kAcceptedOnL1);
        CHECK(receipt->receipt.execution_status == ExecutionStatus::kSucceeded);
    }
    SECTION("get_transaction_receipt unknown") {
        const auto receipt = spawn_and_wait(api.get_transaction_receipt(kUnknownHash));
        REQUIRE_FALSE(receipt.has_value());
        CHECK(receipt.error().kind() == ErrorKind::kTxnHashNotFound);
    }
    CHECK(storage.active_connections() == 0);
}

TEST_CASE_METHOD(StarknetRpcApiTest, "StarknetRpcApi: block_number", "[rpc][commands][starknet_api]") {
    StarknetRpcApi api{storage, &pending, workers};

    SECTION("empty chain") {
        const auto number = spawn_and_wait(api.block_number());
        REQUIRE_FALSE(number.has_value());
        CHECK(number.error().kind() == ErrorKind::kNoBlocks);
        const auto hash_and_number = spawn_and_wait(api.block_hash_and_number());
        REQUIRE_FALSE(hash_and_number.has_value());
        CHECK(hash_and_number.error().kind() == ErrorKind::kNoBlocks);
    }
    SECTION("sample chain") {
        populate_sample_chain(storage, std::nullopt);
        CHECK(spawn_and_wait(api.block_number()) == BlockNum{1});
        CHECK((spawn_and_wait(api.block_hash_and_number()) == BlockHashAndNumber{sample_block_hash(1), 1}));
    }
    SECTION("pending block is not counted") {
        populate_sample_chain(storage, std::nullopt);
        pending.update(sample_pending_block());
        CHECK(spawn_and_wait(api.block_number()) == BlockNum{1});
    }
}

TEST_CASE("StarknetRpcApi: spec_version", "[rpc][commands][starknet_api]") {
    CHECK(StarknetRpcApi::spec_version() == "0.5.1");
}

TEST_CASE_METHOD(StarknetRpcApiTest, "StarknetRpcApi: storage faults", "[rpc][commands][starknet_api]") {
    MockStorage mock_storage;
    StarknetRpcApi api{mock_storage, &pending, workers};

    SECTION("connection failure") {
        EXPECT_CALL(mock_storage, connection()).WillOnce(InvokeWithoutArgs([]() -> std::unique_ptr<db::Connection> {
            throw std::runtime_error{"too many connections"};
        }));
        const auto block = spawn_and_wait(api.get_block_with_tx_hashes(BlockId::latest()));
        REQUIRE_FALSE(block.has_value());
        CHECK(block.error().is_internal());
        CHECK(block.error().internal_message() ==
              "Database read panic or shutting down: Opening database connection: too many connections");
    }
    SECTION("header read failure") {
        EXPECT_CALL(mock_storage, connection()).WillOnce(InvokeWithoutArgs([]() -> std::unique_ptr<db::Connection> {
            auto txn = std::make_unique<MockReadTransaction>();
            EXPECT_CALL(*txn, block_header(testing::_)).WillOnce(InvokeWithoutArgs([]() -> std::optional<BlockHeader> {
                throw std::runtime_error{"disk I/O error"};
            }));
            auto connection = std::make_unique<MockConnection>();
            EXPECT_CALL(*connection, begin_read()).WillOnce(Return(testing::ByMove(std::unique_ptr<db::ReadTransaction>{std::move(txn)})));
            return connection;
        }));
        const auto count = spawn_and_wait(api.get_block_transaction_count(BlockId{BlockNum{1}}));
        REQUIRE_FALSE(count.has_value());
        CHECK(count.error().is_internal());
        CHECK(count.error().internal_message() == "Database read panic or shutting down: Reading block header: disk I/O error");
        CHECK((count.error().to_rpc_error() == Error{-32603, "Internal error", count.error().internal_message()}));
    }
    SECTION("block header without transactions") {
        EXPECT_CALL(mock_storage, connection()).WillOnce(InvokeWithoutArgs([]() -> std::unique_ptr<db::Connection> {
            auto txn = std::make_unique<MockReadTransaction>();
            EXPECT_CALL(*txn, block_header(testing::_)).WillOnce(Return(db::test_util::sample_header(1)));
            EXPECT_CALL(*txn, l1_accepted_block_number()).WillOnce(Return(std::nullopt));
            EXPECT_CALL(*txn, transaction_hashes_for_block(1)).WillOnce(Return(std::nullopt));
            auto connection = std::make_unique<MockConnection>();
            EXPECT_CALL(*connection, begin_read()).WillOnce(Return(testing::ByMove(std::unique_ptr<db::ReadTransaction>{std::move(txn)})));
            return connection;
        }));
        const auto block = spawn_and_wait(api.get_block_with_tx_hashes(BlockId{BlockNum{1}}));
        REQUIRE_FALSE(block.has_value());
        CHECK(block.error().is_internal());
        CHECK(block.error().internal_message() == "Database read panic or shutting down: Missing block");
    }
    SECTION("pool shutting down") {
        workers.shutdown();
        const auto status = spawn_and_wait(api.get_transaction_status(kUnknownHash));
        REQUIRE_FALSE(status.has_value());
        CHECK(status.error().is_internal());
    }
}

TEST_CASE_METHOD(StarknetRpcApiTest, "StarknetRpcApi: JSON handlers", "[rpc][commands][starknet_api]") {
    populate_sample_chain(storage, 0);
    pending.update(sample_pending_block());
    StarknetRpcApiForTest api{storage, &pending, workers};
    nlohmann::json reply;

    SECTION("specVersion") {
        const auto request = R"({"jsonrpc":"2.0","id":1,"method":"starknet_specVersion","params":[]})"_json;
        spawn_and_wait(api.handle_starknet_spec_version(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":1,"result":"0.5.1"})"_json));
    }
    SECTION("blockNumber") {
        const auto request = R"({"jsonrpc":"2.0","id":1,"method":"starknet_blockNumber"})"_json;
        spawn_and_wait(api.handle_starknet_block_number(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":1,"result":1})"_json));
    }
    SECTION("blockHashAndNumber") {
        const auto request = R"({"jsonrpc":"2.0","id":"a","method":"starknet_blockHashAndNumber","params":{}})"_json;
        spawn_and_wait(api.handle_starknet_block_hash_and_number(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":"a","result":{"block_hash":"0xb10c01","block_number":1}})"_json));
    }
    SECTION("blockNumber with unexpected params") {
        const auto request = R"({"jsonrpc":"2.0","id":1,"method":"starknet_blockNumber","params":[1]})"_json;
        spawn_and_wait(api.handle_starknet_block_number(request, reply));
        CHECK(reply["error"]["code"] == -32602);
    }
    SECTION("getBlockTransactionCount positional") {
        const auto request = R"({"jsonrpc":"2.0","id":2,"method":"starknet_getBlockTransactionCount","params":[{"block_number":1}]})"_json;
        spawn_and_wait(api.handle_starknet_get_block_transaction_count(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":2,"result":2})"_json));
    }
    SECTION("getBlockTransactionCount named pending") {
        const auto request = R"({"jsonrpc":"2.0","id":2,"method":"starknet_getBlockTransactionCount","params":{"block_id":"pending"}})"_json;
        spawn_and_wait(api.handle_starknet_get_block_transaction_count(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":2,"result":2})"_json));
    }
    SECTION("getBlockWithTxHashes unknown block") {
        const auto request = R"({"jsonrpc":"2.0","id":3,"method":"starknet_getBlockWithTxHashes","params":[{"block_number":42}]})"_json;
        spawn_and_wait(api.handle_starknet_get_block_with_tx_hashes(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":3,"error":{"code":24,"message":"Block not found"}})"_json));
    }
    SECTION("getBlockWithTxHashes latest") {
        const auto request = R"({"jsonrpc":"2.0","id":3,"method":"starknet_getBlockWithTxHashes","params":["latest"]})"_json;
        spawn_and_wait(api.handle_starknet_get_block_with_tx_hashes(request, reply));
        REQUIRE(reply.contains("result"));
        CHECK(reply["result"]["status"] == "ACCEPTED_ON_L2");
        CHECK(reply["result"]["block_number"] == 1);
        CHECK(reply["result"]["transactions"] == R"(["0x11","0x12"])"_json);
    }
    SECTION("getBlockWithTxs invalid block id") {
        const auto request = R"({"jsonrpc":"2.0","id":3,"method":"starknet_getBlockWithTxs","params":[{"block_number":-1}]})"_json;
        spawn_and_wait(api.handle_starknet_get_block_with_txs(request, reply));
        CHECK(reply["error"]["code"] == -32602);
    }
    SECTION("getTransactionByBlockIdAndIndex invalid index") {
        const auto request = R"({"jsonrpc":"2.0","id":4,"method":"starknet_getTransactionByBlockIdAndIndex","params":["latest",5]})"_json;
        spawn_and_wait(api.handle_starknet_get_transaction_by_block_id_and_index(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":4,"error":{"code":27,"message":"Invalid transaction index in a block"}})"_json));
    }
    SECTION("getTransactionByBlockIdAndIndex missing index") {
        const auto request = R"({"jsonrpc":"2.0","id":4,"method":"starknet_getTransactionByBlockIdAndIndex","params":["latest"]})"_json;
        spawn_and_wait(api.handle_starknet_get_transaction_by_block_id_and_index(request, reply));
        CHECK(reply["error"]["code"] == -32602);
    }
    SECTION("getTransactionByHash") {
        const auto request = R"({"jsonrpc":"2.0","id":5,"method":"starknet_getTransactionByHash","params":{"transaction_hash":"0x11"}})"_json;
        spawn_and_wait(api.handle_starknet_get_transaction_by_hash(request, reply));
        REQUIRE(reply.contains("result"));
        CHECK(reply["result"]["transaction_hash"] == "0x11");
        CHECK(reply["result"]["type"] == "INVOKE");
    }
    SECTION("getTransactionByHash not found") {
        const auto request = R"({"jsonrpc":"2.0","id":5,"method":"starknet_getTransactionByHash","params":["0xdead"]})"_json;
        spawn_and_wait(api.handle_starknet_get_transaction_by_hash(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":5,"error":{"code":29,"message":"Transaction hash not found"}})"_json));
    }
    SECTION("getTransactionByHash invalid hash") {
        const auto request = R"({"jsonrpc":"2.0","id":5,"method":"starknet_getTransactionByHash","params":["0xzz"]})"_json;
        spawn_and_wait(api.handle_starknet_get_transaction_by_hash(request, reply));
        CHECK(reply["error"]["code"] == -32602);
    }
    SECTION("getTransactionStatus") {
        const auto request = R"({"jsonrpc":"2.0","id":6,"method":"starknet_getTransactionStatus","params":["0x12"]})"_json;
        spawn_and_wait(api.handle_starknet_get_transaction_status(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":6,"result":{"finality_status":"ACCEPTED_ON_L2","execution_status":"REVERTED"}})"_json));
    }
    SECTION("getTransactionReceipt") {
        const auto request = R"({"jsonrpc":"2.0","id":7,"method":"starknet_getTransactionReceipt","params":{"transaction_hash":"0x12"}})"_json;
        spawn_and_wait(api.handle_starknet_get_transaction_receipt(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":7,"result":{
            "transaction_hash":"0x12","actual_fee":"0x10","execution_status":"REVERTED","revert_reason":"assertion failed",
            "type":"INVOKE","finality_status":"ACCEPTED_ON_L2","block_hash":"0xb10c01","block_number":1}})"_json));
    }
    SECTION("getTransactionReceipt pending") {
        const auto request = R"({"jsonrpc":"2.0","id":8,"method":"starknet_getTransactionReceipt","params":["0x22"]})"_json;
        spawn_and_wait(api.handle_starknet_get_transaction_receipt(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":8,"result":{
            "transaction_hash":"0x22","actual_fee":"0x10","execution_status":"SUCCEEDED","type":"INVOKE",
            "finality_status":"ACCEPTED_ON_L2"}})"_json));
    }
    SECTION("getTransactionReceipt not found") {
        const auto request = R"({"jsonrpc":"2.0","id":9,"method":"starknet_getTransactionReceipt","params":["0xdead"]})"_json;
        spawn_and_wait(api.handle_starknet_get_transaction_receipt(request, reply));
        CHECK((reply == R"({"jsonrpc":"2.0","id":9,"error":{"code":29,"message":"Transaction hash not found"}})"_json));
    }
    CHECK(storage.active_connections() == 0);
}

}  // namespace starkworm::rpc::commands
