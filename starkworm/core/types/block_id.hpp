// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <string>
#include <variant>

#include <starkworm/core/common/base.hpp>

namespace starkworm {

inline constexpr const char* kPendingBlockId{"pending"};
inline constexpr const char* kLatestBlockId{"latest"};

struct PendingTag {
    friend bool operator==(const PendingTag&, const PendingTag&) = default;
};

struct LatestTag {
    friend bool operator==(const LatestTag&, const LatestTag&) = default;
};

//! Key for looking up one persisted block: latest, by number or by hash
class BlockKey {
  public:
    BlockKey() noexcept : value_{LatestTag{}} {}
    explicit BlockKey(BlockNum number) noexcept : value_{number} {}
    explicit BlockKey(const Hash& hash) noexcept : value_{hash} {}

    static BlockKey latest() noexcept { return BlockKey{}; }

    bool is_latest() const { return std::holds_alternative<LatestTag>(value_); }
    bool is_number() const { return std::holds_alternative<BlockNum>(value_); }
    bool is_hash() const { return std::holds_alternative<Hash>(value_); }

    BlockNum number() const { return is_number() ? std::get<BlockNum>(value_) : 0; }
    Hash hash() const { return is_hash() ? std::get<Hash>(value_) : Hash{}; }

    std::string to_string() const;

    friend bool operator==(const BlockKey&, const BlockKey&) = default;

  private:
    std::variant<LatestTag, BlockNum, Hash> value_;
};

//! Client-supplied block reference: the pending tag, the latest tag, a block number or a block hash
class BlockId {
  public:
    BlockId() noexcept : value_{LatestTag{}} {}
    explicit BlockId(BlockNum number) noexcept : value_{number} {}
    explicit BlockId(const Hash& hash) noexcept : value_{hash} {}

    static BlockId pending() noexcept;
    static BlockId latest() noexcept { return BlockId{}; }

    bool is_pending() const { return std::holds_alternative<PendingTag>(value_); }
    bool is_latest() const { return std::holds_alternative<LatestTag>(value_); }
    bool is_number() const { return std::holds_alternative<BlockNum>(value_); }
    bool is_hash() const { return std::holds_alternative<Hash>(value_); }

    BlockNum number() const { return is_number() ? std::get<BlockNum>(value_) : 0; }
    Hash hash() const { return is_hash() ? std::get<Hash>(value_) : Hash{}; }

    //! Convert into the key for persisted lookup
    //! \throws std::logic_error if this is the pending tag, which has no persisted counterpart
    BlockKey to_block_key() const;

    std::string to_string() const;

    friend bool operator==(const BlockId&, const BlockId&) = default;

  private:
    std::variant<PendingTag, LatestTag, BlockNum, Hash> value_;
};

std::ostream& operator<<(std::ostream& out, const BlockKey& key);
std::ostream& operator<<(std::ostream& out, const BlockId& block_id);

}  // namespace starkworm
