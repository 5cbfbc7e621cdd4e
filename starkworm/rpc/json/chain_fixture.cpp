// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "chain_fixture.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <starkworm/infra/common/log.hpp>
#include <starkworm/rpc/json/block.hpp>
#include <starkworm/rpc/json/transaction.hpp>
#include <starkworm/rpc/json/types.hpp>

namespace starkworm {

void from_json(const nlohmann::json& json, TransactionWithReceipt& tx_with_receipt) {
    tx_with_receipt.transaction = json.at("transaction").get<Transaction>();
    tx_with_receipt.receipt = json.at("receipt").get<Receipt>();
}

void from_json(const nlohmann::json& json, PendingBlock& block) {
    block.parent_hash = json.at("parent_hash").get<Hash>();
    block.timestamp = json.value("timestamp", BlockTime{0});
    block.sequencer_address = json.value("sequencer_address", Felt{});
    block.l1_gas_price = json.value("l1_gas_price", ResourcePrice{});
    block.starknet_version = json.value("starknet_version", std::string{});
    for (const auto& tx_with_receipt : json.value("transactions", std::vector<TransactionWithReceipt>{})) {
        block.transactions.push_back(tx_with_receipt.transaction);
        block.receipts.push_back(tx_with_receipt.receipt);
    }
}

}  // namespace starkworm

namespace starkworm::rpc {

ChainFixture parse_chain_fixture(const nlohmann::json& json) {
    try {
        ChainFixture fixture;
        fixture.blocks = json.value("blocks", nlohmann::json::array());
        if (!fixture.blocks.is_array()) {
            throw std::invalid_argument{"blocks must be an array"};
        }
        if (json.contains("l1_accepted_block_number") && !json["l1_accepted_block_number"].is_null()) {
            fixture.l1_accepted_block_number = json["l1_accepted_block_number"].get<BlockNum>();
        }
        if (json.contains("pending") && !json["pending"].is_null()) {
            fixture.pending_block = std::make_shared<const PendingBlock>(json["pending"].get<PendingBlock>());
        }
        return fixture;
    } catch (const nlohmann::json::exception&) {
        std::throw_with_nested(std::invalid_argument{"malformed chain fixture"});
    }
}

ChainFixture read_chain_fixture(const std::filesystem::path& path) {
    std::ifstream stream{path};
    if (!stream) {
        throw std::runtime_error{"cannot open chain fixture: " + path.string()};
    }
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(stream);
    } catch (const nlohmann::json::parse_error&) {
        std::throw_with_nested(std::invalid_argument{"cannot parse chain fixture: " + path.string()});
    }
    return parse_chain_fixture(json);
}

void load_chain_fixture(const ChainFixture& fixture, db::MemoryStorage& storage) {
    try {
        for (const auto& block : fixture.blocks) {
            storage.insert_block(block.at("header").get<BlockHeader>(),
                                 block.value("transactions", std::vector<TransactionWithReceipt>{}));
        }
    } catch (const nlohmann::json::exception&) {
        std::throw_with_nested(std::invalid_argument{"malformed chain fixture block"});
    }
    storage.set_l1_accepted_block_number(fixture.l1_accepted_block_number);
    STARK_INFO << "Chain fixture loaded: " << fixture.blocks.size() << " blocks, l1 accepted: "
               << (fixture.l1_accepted_block_number ? std::to_string(*fixture.l1_accepted_block_number) : "none")
               << ", pending: " << (fixture.pending_block ? "yes" : "no");
}

}  // namespace starkworm::rpc
