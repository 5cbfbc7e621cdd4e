// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <starkworm/core/common/util.hpp>

namespace starkworm {

std::ostream& operator<<(std::ostream& out, const BlockHeader& header) {
    out << "number: " << header.number
        << " hash: " << felt_to_hex(header.hash)
        << " parent_hash: " << felt_to_hex(header.parent_hash)
        << " timestamp: " << header.timestamp
        << " starknet_version: " << header.starknet_version;
    return out;
}

}  // namespace starkworm
