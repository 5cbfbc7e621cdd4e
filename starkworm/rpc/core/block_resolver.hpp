// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <variant>

#include <tl/expected.hpp>

#include <starkworm/core/types/block_id.hpp>
#include <starkworm/core/types/pending.hpp>
#include <starkworm/rpc/types/error.hpp>

namespace starkworm::rpc::core {

//! Answer straight from the pending snapshot, no storage read needed
struct PendingShortCircuit {
    std::shared_ptr<const PendingBlock> block;
};

//! Look the block up in persisted storage
struct PersistedLookup {
    BlockKey key;
};

using ResolutionPlan = std::variant<PendingShortCircuit, PersistedLookup>;

using ResolveError = ErrorSubset<ErrorKind::kBlockNotFound, ErrorKind::kPendingNotSupported>;

//! Classify the block reference against the pending overlay, without any I/O
//! \param pending the pending overlay, null if the node is not configured to serve pending data
tl::expected<ResolutionPlan, ResolveError> resolve(const BlockId& block_id, const PendingSource* pending);

}  // namespace starkworm::rpc::core
