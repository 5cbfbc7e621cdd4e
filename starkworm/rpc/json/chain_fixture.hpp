// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <nlohmann/json.hpp>

#include <starkworm/core/types/pending.hpp>
#include <starkworm/db/memory_storage.hpp>

namespace starkworm {

void from_json(const nlohmann::json& json, TransactionWithReceipt& tx_with_receipt);
void from_json(const nlohmann::json& json, PendingBlock& block);

}  // namespace starkworm

namespace starkworm::rpc {

//! Chain content as described by a JSON fixture:
//! {
//!   "blocks": [{"header": {...}, "transactions": [{"transaction": {...}, "receipt": {...}}]}],
//!   "l1_accepted_block_number": 0,
//!   "pending": {"parent_hash": ..., "transactions": [...]}
//! }
struct ChainFixture {
    nlohmann::json blocks;
    std::optional<BlockNum> l1_accepted_block_number;
    std::shared_ptr<const PendingBlock> pending_block;
};

//! \throws std::invalid_argument (possibly nested) on malformed content
ChainFixture parse_chain_fixture(const nlohmann::json& json);

//! \throws std::runtime_error if the file cannot be read, std::invalid_argument on malformed content
ChainFixture read_chain_fixture(const std::filesystem::path& path);

//! Insert fixture blocks into storage and record the L1-accepted number
void load_chain_fixture(const ChainFixture& fixture, db::MemoryStorage& storage);

}  // namespace starkworm::rpc
