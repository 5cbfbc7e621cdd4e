// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block.hpp"

#include <starkworm/core/common/util.hpp>

namespace starkworm::rpc {

std::string_view to_string(BlockStatus status) {
    switch (status) {
        case BlockStatus::kPending:
            return "PENDING";
        case BlockStatus::kAcceptedOnL2:
            return "ACCEPTED_ON_L2";
        case BlockStatus::kAcceptedOnL1:
            return "ACCEPTED_ON_L1";
    }
    return "UNKNOWN";
}

std::string_view to_string(TxFinalityStatus status) {
    switch (status) {
        case TxFinalityStatus::kAcceptedOnL2:
            return "ACCEPTED_ON_L2";
        case TxFinalityStatus::kAcceptedOnL1:
            return "ACCEPTED_ON_L1";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, BlockStatus status) {
    out << to_string(status);
    return out;
}

std::ostream& operator<<(std::ostream& out, const BlockWithTxHashes& block) {
    out << "status: " << block.status;
    if (block.header.block_number) {
        out << " number: " << *block.header.block_number;
    }
    if (block.header.block_hash) {
        out << " hash: " << felt_to_hex(*block.header.block_hash);
    }
    out << " #transactions: " << block.transactions.size();
    return out;
}

}  // namespace starkworm::rpc
