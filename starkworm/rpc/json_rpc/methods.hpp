// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace starkworm::rpc::json_rpc::method {

// NOLINTBEGIN(readability-identifier-naming)

inline constexpr const char* k_starknet_specVersion{"starknet_specVersion"};
inline constexpr const char* k_starknet_blockNumber{"starknet_blockNumber"};
inline constexpr const char* k_starknet_blockHashAndNumber{"starknet_blockHashAndNumber"};
inline constexpr const char* k_starknet_getBlockWithTxHashes{"starknet_getBlockWithTxHashes"};
inline constexpr const char* k_starknet_getBlockWithTxs{"starknet_getBlockWithTxs"};
inline constexpr const char* k_starknet_getBlockTransactionCount{"starknet_getBlockTransactionCount"};
inline constexpr const char* k_starknet_getTransactionByBlockIdAndIndex{"starknet_getTransactionByBlockIdAndIndex"};
inline constexpr const char* k_starknet_getTransactionByHash{"starknet_getTransactionByHash"};
inline constexpr const char* k_starknet_getTransactionStatus{"starknet_getTransactionStatus"};
inline constexpr const char* k_starknet_getTransactionReceipt{"starknet_getTransactionReceipt"};

// NOLINTEND(readability-identifier-naming)

}  // namespace starkworm::rpc::json_rpc::method
