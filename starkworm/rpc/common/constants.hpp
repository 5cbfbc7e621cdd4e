// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace starkworm::rpc {

inline constexpr std::string_view kStarknetApiNamespace{"starknet"};

inline constexpr std::string_view kDefaultApiSpec{kStarknetApiNamespace};
inline constexpr std::string_view kApiSpecSeparator{","};

//! Version of the Starknet JSON-RPC specification served
inline constexpr std::string_view kStarknetSpecVersion{"0.5.1"};

}  // namespace starkworm::rpc
