// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <starkworm/core/types/transaction.hpp>
#include <starkworm/rpc/json/types.hpp>
#include <starkworm/rpc/types/block.hpp>

namespace starkworm {

void to_json(nlohmann::json& json, const Transaction& transaction);
void from_json(const nlohmann::json& json, Transaction& transaction);

void to_json(nlohmann::json& json, const Receipt& receipt);
void from_json(const nlohmann::json& json, Receipt& receipt);

}  // namespace starkworm

namespace starkworm::rpc {

void to_json(nlohmann::json& json, const TransactionStatus& status);
void to_json(nlohmann::json& json, const TransactionReceiptReply& reply);

}  // namespace starkworm::rpc
