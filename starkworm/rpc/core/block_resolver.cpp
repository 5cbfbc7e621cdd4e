// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_resolver.hpp"

#include <starkworm/infra/common/log.hpp>

namespace starkworm::rpc::core {

tl::expected<ResolutionPlan, ResolveError> resolve(const BlockId& block_id, const PendingSource* pending) {
    if (!block_id.is_pending()) {
        return PersistedLookup{block_id.to_block_key()};
    }
    if (!pending) {
        STARK_DEBUG << "resolve: pending data not supported";
        return tl::make_unexpected(ResolveError{errors::kPendingNotSupported});
    }
    auto snapshot = pending->snapshot();
    if (!snapshot) {
        STARK_DEBUG << "resolve: no pending block available";
        return tl::make_unexpected(ResolveError{errors::kBlockNotFound});
    }
    return PendingShortCircuit{std::move(snapshot)};
}

}  // namespace starkworm::rpc::core
