// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <starkworm/core/common/base.hpp>

namespace starkworm {

//! Returns a string representing the hex form of provided bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! Returns the hex form of provided bytes without leading zero digits ("0" for all-zero or empty input)
std::string to_hex_no_leading_zeros(ByteView bytes);

//! Decodes a single hex digit (case insensitive)
std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! Decodes an hex string (optional 0x prefix, odd length allowed) into bytes
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! Whether the provided 32-byte big-endian value is a valid field element, i.e. below 2^251 + 17 * 2^192 + 1
bool is_valid_felt(const evmc::bytes32& value) noexcept;

//! Parses a 0x-prefixed hex string of at most 64 digits into a field element
//! \return std::nullopt on missing prefix, bad digits, too many digits or value overflowing the field
std::optional<Felt> felt_from_hex(std::string_view hex) noexcept;

//! Formats a field element as 0x-prefixed hex without leading zeros (i.e. "0x0" for zero)
std::string felt_to_hex(const Felt& felt);

//! Builds a field element from an unsigned integer
Felt felt_from_u64(uint64_t value) noexcept;

//! Builds a field element right-aligning the provided raw bytes (at most 31, so that the result is always valid)
Felt felt_from_bytes(std::string_view bytes);

}  // namespace starkworm
