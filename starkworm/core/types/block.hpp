// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <string>

#include <intx/intx.hpp>

#include <starkworm/core/common/base.hpp>

namespace starkworm {

//! L1 gas price quoted in both supported units
struct ResourcePrice {
    intx::uint128 price_in_wei{0};
    intx::uint128 price_in_fri{0};

    friend bool operator==(const ResourcePrice&, const ResourcePrice&) = default;
};

//! Persisted block header
struct BlockHeader {
    BlockNum number{0};
    Hash hash{};
    Hash parent_hash{};  // zero for genesis
    Felt state_commitment{};
    BlockTime timestamp{0};
    Felt sequencer_address{};
    ResourcePrice l1_gas_price;
    std::string starknet_version;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

std::ostream& operator<<(std::ostream& out, const BlockHeader& header);

}  // namespace starkworm
