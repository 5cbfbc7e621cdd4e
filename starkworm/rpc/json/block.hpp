// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <starkworm/core/types/block.hpp>
#include <starkworm/core/types/block_id.hpp>
#include <starkworm/rpc/json/types.hpp>
#include <starkworm/rpc/types/block.hpp>

namespace starkworm {

void to_json(nlohmann::json& json, const BlockHeader& header);
void from_json(const nlohmann::json& json, BlockHeader& header);

//! Accept "pending", "latest", {"block_number": <unsigned>} or {"block_hash": <felt>}, nothing else
//! \throws std::invalid_argument on any other shape
void from_json(const nlohmann::json& json, BlockId& block_id);
void to_json(nlohmann::json& json, const BlockId& block_id);

}  // namespace starkworm

namespace starkworm::rpc {

void to_json(nlohmann::json& json, BlockStatus status);
void to_json(nlohmann::json& json, const BlockHeaderReply& header);
void to_json(nlohmann::json& json, const BlockWithTxHashes& block);
void to_json(nlohmann::json& json, const BlockWithTxs& block);
void to_json(nlohmann::json& json, const BlockHashAndNumber& block);

void from_json(const nlohmann::json& json, BlockWithTxHashes& block);

}  // namespace starkworm::rpc
