// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>

#include <starkworm/core/common/util.hpp>
#include <starkworm/db/test_util/sample_chain.hpp>
#include <starkworm/rpc/json/types.hpp>

namespace starkworm {

TEST_CASE("serialize invoke transaction", "[rpc][to_json][transaction]") {
    const auto [tx, receipt] = db::test_util::sample_transaction(felt_from_u64(0x11));
    CHECK(nlohmann::json(tx) == R"({
        "transaction_hash": "0x11",
        "type": "INVOKE",
        "version": "0x1",
        "sender_address": "0xacc",
        "nonce": "0x0",
        "max_fee": "0x1000",
        "calldata": ["0x1", "0x2"],
        "signature": ["0x3"]
    })"_json);
    CHECK(nlohmann::json(tx).get<Transaction>() == tx);
}

TEST_CASE("serialize deploy account transaction", "[rpc][to_json][transaction]") {
    Transaction tx;
    tx.hash = felt_from_u64(0x1);
    tx.type = TransactionType::kDeployAccount;
    tx.version = felt_from_u64(1);
    tx.class_hash = felt_from_u64(0xc1a55);
    tx.contract_address_salt = felt_from_u64(0x5a17);
    tx.constructor_calldata = {felt_from_u64(0x7)};
    const nlohmann::json json = tx;
    CHECK(json["type"] == "DEPLOY_ACCOUNT");
    CHECK(json["constructor_calldata"] == R"(["0x7"])"_json);
    CHECK_FALSE(json.contains("calldata"));
    CHECK(json.contains("signature"));
    CHECK_FALSE(json.contains("sender_address"));
}

TEST_CASE("serialize l1 handler transaction", "[rpc][to_json][transaction]") {
    Transaction tx;
    tx.type = TransactionType::kL1Handler;
    tx.contract_address = felt_from_u64(0xc0);
    tx.entry_point_selector = felt_from_u64(0xe0);
    const nlohmann::json json = tx;
    CHECK(json["type"] == "L1_HANDLER");
    CHECK(json.contains("calldata"));
    CHECK_FALSE(json.contains("signature"));
}

TEST_CASE("deserialize transaction rejects unknown type", "[rpc][from_json][transaction]") {
    CHECK_THROWS_AS(R"({"transaction_hash": "0x1", "type": "FOO", "version": "0x1"})"_json.get<Transaction>(), std::invalid_argument);
}

TEST_CASE("serialize receipt", "[rpc][to_json][receipt]") {
    const auto [tx, receipt] = db::test_util::sample_transaction(felt_from_u64(0x12), ExecutionStatus::kReverted);
    const nlohmann::json json = receipt;
    CHECK(json == R"({
        "transaction_hash": "0x12",
        "actual_fee": "0x10",
        "execution_status": "REVERTED",
        "revert_reason": "assertion failed"
    })"_json);
    CHECK(json.get<Receipt>() == receipt);
}

TEST_CASE("serialize transaction status", "[rpc][to_json][transaction]") {
    const rpc::TransactionStatus status{rpc::TxFinalityStatus::kAcceptedOnL1, ExecutionStatus::kSucceeded};
    CHECK(nlohmann::json(status) == R"({"finality_status": "ACCEPTED_ON_L1", "execution_status": "SUCCEEDED"})"_json);
}

}  // namespace starkworm
