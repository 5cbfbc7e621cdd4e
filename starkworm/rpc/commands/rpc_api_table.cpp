// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "rpc_api_table.hpp"

#include <starkworm/infra/common/log.hpp>
#include <starkworm/rpc/common/constants.hpp>
#include <starkworm/rpc/json_rpc/methods.hpp>

namespace starkworm::rpc::commands {

RpcApiTable::RpcApiTable(std::string_view api_spec) {
    build_handlers(api_spec);
}

std::optional<RpcApiTable::HandleMethod> RpcApiTable::find_json_handler(const std::string& method) const {
    const auto handle_method_pair = method_handlers_.find(method);
    if (handle_method_pair == method_handlers_.end()) {
        return std::nullopt;
    }
    return handle_method_pair->second;
}

void RpcApiTable::build_handlers(std::string_view api_spec) {
    size_t start = 0;
    size_t end = api_spec.find(kApiSpecSeparator);
    while (end != std::string_view::npos) {
        add_handlers(api_spec.substr(start, end - start));
        start = end + kApiSpecSeparator.length();
        end = api_spec.find(kApiSpecSeparator, start);
    }
    add_handlers(api_spec.substr(start));
}

void RpcApiTable::add_handlers(std::string_view api_namespace) {
    if (api_namespace == kStarknetApiNamespace) {
        add_starknet_handlers();
    } else {
        STARK_WARN << "RpcApiTable::add_handlers invalid namespace [" << api_namespace << "] ignored";
    }
}

void RpcApiTable::add_starknet_handlers() {
    method_handlers_[json_rpc::method::k_starknet_specVersion] = &commands::RpcApi::handle_starknet_spec_version;
    method_handlers_[json_rpc::method::k_starknet_blockNumber] = &commands::RpcApi::handle_starknet_block_number;
    method_handlers_[json_rpc::method::k_starknet_blockHashAndNumber] = &commands::RpcApi::handle_starknet_block_hash_and_number;
    method_handlers_[json_rpc::method::k_starknet_getBlockWithTxHashes] = &commands::RpcApi::handle_starknet_get_block_with_tx_hashes;
    method_handlers_[json_rpc::method::k_starknet_getBlockWithTxs] = &commands::RpcApi::handle_starknet_get_block_with_txs;
    method_handlers_[json_rpc::method::k_starknet_getBlockTransactionCount] = &commands::RpcApi::handle_starknet_get_block_transaction_count;
    method_handlers_[json_rpc::method::k_starknet_getTransactionByBlockIdAndIndex] = &commands::RpcApi::handle_starknet_get_transaction_by_block_id_and_index;
    method_handlers_[json_rpc::method::k_starknet_getTransactionByHash] = &commands::RpcApi::handle_starknet_get_transaction_by_hash;
    method_handlers_[json_rpc::method::k_starknet_getTransactionStatus] = &commands::RpcApi::handle_starknet_get_transaction_status;
    method_handlers_[json_rpc::method::k_starknet_getTransactionReceipt] = &commands::RpcApi::handle_starknet_get_transaction_receipt;
}

}  // namespace starkworm::rpc::commands
