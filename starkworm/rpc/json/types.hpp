// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <starkworm/core/types/block.hpp>
#include <starkworm/rpc/types/error.hpp>

namespace evmc {

//! Field elements are rendered as 0x-prefixed hex without leading zeros
void to_json(nlohmann::json& json, const bytes32& b32);

//! \throws std::invalid_argument if the string is not a valid field element
void from_json(const nlohmann::json& json, bytes32& b32);

}  // namespace evmc

namespace intx {

void to_json(nlohmann::json& json, const uint128& ui128);
void from_json(const nlohmann::json& json, uint128& ui128);

}  // namespace intx

namespace starkworm {

void to_json(nlohmann::json& json, const ResourcePrice& price);
void from_json(const nlohmann::json& json, ResourcePrice& price);

}  // namespace starkworm

namespace starkworm::rpc {

inline constexpr const char* kJsonVersion{"2.0"};

void to_json(nlohmann::json& json, const Error& error);

std::string to_quantity(const intx::uint128& number);

nlohmann::json make_json_content(const nlohmann::json& request_json, const nlohmann::json& result);
nlohmann::json make_json_error(const nlohmann::json& request_json, int code, const std::string& message);
nlohmann::json make_json_error(const nlohmann::json& request_json, const Error& error);

//! Internal error reply for an unexpected fault: the exception chain goes into data, never into the message
nlohmann::json make_json_internal_error(const nlohmann::json& request_json, std::exception_ptr eptr);

}  // namespace starkworm::rpc
