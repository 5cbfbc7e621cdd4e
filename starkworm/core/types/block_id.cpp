// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_id.hpp"

#include <starkworm/core/common/util.hpp>
#include <starkworm/infra/common/ensure.hpp>

namespace starkworm {

std::string BlockKey::to_string() const {
    if (is_number()) {
        return std::to_string(number());
    }
    if (is_hash()) {
        return felt_to_hex(hash());
    }
    return kLatestBlockId;
}

BlockId BlockId::pending() noexcept {
    BlockId block_id;
    block_id.value_ = PendingTag{};
    return block_id;
}

BlockKey BlockId::to_block_key() const {
    ensure_invariant(!is_pending(), "pending block id has no persisted block key");
    if (is_number()) {
        return BlockKey{number()};
    }
    if (is_hash()) {
        return BlockKey{hash()};
    }
    return BlockKey::latest();
}

std::string BlockId::to_string() const {
    if (is_pending()) {
        return kPendingBlockId;
    }
    return to_block_key().to_string();
}

std::ostream& operator<<(std::ostream& out, const BlockKey& key) {
    out << key.to_string();
    return out;
}

std::ostream& operator<<(std::ostream& out, const BlockId& block_id) {
    out << block_id.to_string();
    return out;
}

}  // namespace starkworm
