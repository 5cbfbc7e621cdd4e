// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <starkworm/core/common/util.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = starkworm::felt_to_hex(b32);
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    const auto& hex = json.get_ref<const std::string&>();
    const auto felt = starkworm::felt_from_hex(hex);
    if (!felt) {
        throw std::invalid_argument{"invalid field element: " + hex};
    }
    b32 = *felt;
}

}  // namespace evmc

namespace intx {

void to_json(nlohmann::json& json, const uint128& ui128) {
    json = starkworm::rpc::to_quantity(ui128);
}

void from_json(const nlohmann::json& json, uint128& ui128) {
    const auto& quantity = json.get_ref<const std::string&>();
    if (!quantity.starts_with("0x") || quantity.size() < 3) {
        throw std::invalid_argument{"invalid quantity: " + quantity};
    }
    ui128 = intx::from_string<uint128>(quantity);
}

}  // namespace intx

namespace starkworm {

void to_json(nlohmann::json& json, const ResourcePrice& price) {
    json["price_in_fri"] = price.price_in_fri;
    json["price_in_wei"] = price.price_in_wei;
}

void from_json(const nlohmann::json& json, ResourcePrice& price) {
    price.price_in_fri = json.at("price_in_fri").get<intx::uint128>();
    price.price_in_wei = json.at("price_in_wei").get<intx::uint128>();
}

}  // namespace starkworm

namespace starkworm::rpc {

void to_json(nlohmann::json& json, const Error& error) {
    json = {{"code", error.code}, {"message", error.message}};
    if (error.data) {
        json["data"] = *error.data;
    }
}

std::string to_quantity(const intx::uint128& number) {
    return "0x" + intx::hex(number);
}

nlohmann::json make_json_content(const nlohmann::json& request_json, const nlohmann::json& result) {
    const nlohmann::json id = request_json.is_object() && request_json.contains("id") ? request_json["id"] : nullptr;
    nlohmann::json json{{"jsonrpc", kJsonVersion}, {"id", id}, {"result", result}};
    return json;
}

nlohmann::json make_json_error(const nlohmann::json& request_json, int code, const std::string& message) {
    return make_json_error(request_json, Error{code, message, std::nullopt});
}

nlohmann::json make_json_error(const nlohmann::json& request_json, const Error& error) {
    const nlohmann::json id = request_json.is_object() && request_json.contains("id") ? request_json["id"] : nullptr;
    return {{"jsonrpc", kJsonVersion}, {"id", id}, {"error", error}};
}

nlohmann::json make_json_internal_error(const nlohmann::json& request_json, std::exception_ptr eptr) {
    return make_json_error(request_json, InternalError::from_exception(std::move(eptr)).to_rpc_error());
}

}  // namespace starkworm::rpc
