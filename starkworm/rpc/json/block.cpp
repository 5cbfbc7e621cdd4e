// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <stdexcept>
#include <string>

#include <starkworm/rpc/json/transaction.hpp>
#include <starkworm/rpc/json/types.hpp>

namespace starkworm {

void to_json(nlohmann::json& json, const BlockHeader& header) {
    json["block_number"] = header.number;
    json["block_hash"] = header.hash;
    json["parent_hash"] = header.parent_hash;
    json["new_root"] = header.state_commitment;
    json["timestamp"] = header.timestamp;
    json["sequencer_address"] = header.sequencer_address;
    json["l1_gas_price"] = header.l1_gas_price;
    json["starknet_version"] = header.starknet_version;
}

void from_json(const nlohmann::json& json, BlockHeader& header) {
    header.number = json.at("block_number").get<BlockNum>();
    header.hash = json.at("block_hash").get<Hash>();
    header.parent_hash = json.value("parent_hash", Hash{});
    header.state_commitment = json.value("new_root", Felt{});
    header.timestamp = json.value("timestamp", BlockTime{0});
    header.sequencer_address = json.value("sequencer_address", Felt{});
    header.l1_gas_price = json.value("l1_gas_price", ResourcePrice{});
    header.starknet_version = json.value("starknet_version", std::string{});
}

void from_json(const nlohmann::json& json, BlockId& block_id) {
    if (json.is_string()) {
        const auto& tag = json.get_ref<const std::string&>();
        if (tag == kPendingBlockId) {
            block_id = BlockId::pending();
            return;
        }
        if (tag == kLatestBlockId) {
            block_id = BlockId::latest();
            return;
        }
        throw std::invalid_argument{"invalid block tag: " + tag};
    }
    if (json.is_object() && json.size() == 1) {
        if (json.contains("block_number")) {
            const auto& number = json["block_number"];
            if (!number.is_number_unsigned()) {
                throw std::invalid_argument{"invalid block number: " + number.dump()};
            }
            block_id = BlockId{number.get<BlockNum>()};
            return;
        }
        if (json.contains("block_hash")) {
            const auto& hash = json["block_hash"];
            if (!hash.is_string()) {
                throw std::invalid_argument{"invalid block hash: " + hash.dump()};
            }
            block_id = BlockId{hash.get<Hash>()};
            return;
        }
    }
    throw std::invalid_argument{"invalid block id: " + json.dump()};
}

void to_json(nlohmann::json& json, const BlockId& block_id) {
    if (block_id.is_pending()) {
        json = kPendingBlockId;
    } else if (block_id.is_latest()) {
        json = kLatestBlockId;
    } else if (block_id.is_number()) {
        json = {{"block_number", block_id.number()}};
    } else {
        json = {{"block_hash", block_id.hash()}};
    }
}

}  // namespace starkworm

namespace starkworm::rpc {

void to_json(nlohmann::json& json, BlockStatus status) {
    json = std::string{to_string(status)};
}

void to_json(nlohmann::json& json, const BlockHeaderReply& header) {
    if (header.block_hash) {
        json["block_hash"] = *header.block_hash;
    }
    json["parent_hash"] = header.parent_hash;
    if (header.block_number) {
        json["block_number"] = *header.block_number;
    }
    if (header.new_root) {
        json["new_root"] = *header.new_root;
    }
    json["timestamp"] = header.timestamp;
    json["sequencer_address"] = header.sequencer_address;
    json["l1_gas_price"] = header.l1_gas_price;
    json["starknet_version"] = header.starknet_version;
}

void to_json(nlohmann::json& json, const BlockWithTxHashes& block) {
    json = block.header;
    json["status"] = block.status;
    json["transactions"] = block.transactions;
}

void to_json(nlohmann::json& json, const BlockWithTxs& block) {
    json = block.header;
    json["status"] = block.status;
    json["transactions"] = block.transactions;
}

void to_json(nlohmann::json& json, const BlockHashAndNumber& block) {
    json["block_hash"] = block.block_hash;
    json["block_number"] = block.block_number;
}

static BlockStatus block_status_from_string(const std::string& status) {
    for (const auto s : {BlockStatus::kPending, BlockStatus::kAcceptedOnL2, BlockStatus::kAcceptedOnL1}) {
        if (to_string(s) == status) {
            return s;
        }
    }
    throw std::invalid_argument{"invalid block status: " + status};
}

void from_json(const nlohmann::json& json, BlockWithTxHashes& block) {
    block.status = block_status_from_string(json.at("status").get<std::string>());
    auto& header = block.header;
    if (json.contains("block_hash")) {
        header.block_hash = json["block_hash"].get<Hash>();
    }
    header.parent_hash = json.at("parent_hash").get<Hash>();
    if (json.contains("block_number")) {
        header.block_number = json["block_number"].get<BlockNum>();
    }
    if (json.contains("new_root")) {
        header.new_root = json["new_root"].get<Felt>();
    }
    header.timestamp = json.at("timestamp").get<BlockTime>();
    header.sequencer_address = json.at("sequencer_address").get<Felt>();
    header.l1_gas_price = json.at("l1_gas_price").get<ResourcePrice>();
    header.starknet_version = json.at("starknet_version").get<std::string>();
    block.transactions = json.at("transactions").get<std::vector<Hash>>();
}

}  // namespace starkworm::rpc
