// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic types and constants.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>

#include <evmc/evmc.hpp>

namespace starkworm {

using BlockNum = uint64_t;

inline constexpr BlockNum kGenesisBlockNum{0};
inline constexpr BlockNum kMaxBlockNum = std::numeric_limits<BlockNum>::max();

using BlockTime = uint64_t;

inline constexpr size_t kHashLength{32};

//! Starknet field element, stored as 32 big-endian bytes (always below the field prime)
using Felt = evmc::bytes32;

//! Hashes (block, transaction, class) are field elements
using Hash = Felt;

using Bytes = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

}  // namespace starkworm
