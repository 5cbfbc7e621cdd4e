// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "validator.hpp"

#include <starkworm/rpc/json/types.hpp>

namespace starkworm::rpc::json_rpc {

static const std::string kRequestFieldJsonRpc{"jsonrpc"};
static const std::string kRequestFieldId{"id"};
static const std::string kRequestFieldMethod{"method"};
static const std::string kRequestFieldParameters{"params"};
static const std::string kRequestRequiredFields{kRequestFieldJsonRpc + "," + kRequestFieldId + "," + kRequestFieldMethod};

ValidationResult Validator::validate(const nlohmann::json& request) {
    if (!request.is_object()) {
        return tl::make_unexpected("Request not valid, expected object");
    }
    return check_request_fields(request);
}

ValidationResult Validator::check_request_fields(const nlohmann::json& request) {
    // Expected fields: jsonrpc, id, method, params (optional)
    auto required_fields = 0b111;

    for (auto item = request.begin(); item != request.end(); ++item) {
        if (item.key() == kRequestFieldMethod) {
            if (!item.value().is_string() || item.value().get_ref<const std::string&>().empty()) {
                return tl::make_unexpected("Invalid field: " + item.key());
            }
            required_fields &= 0b110;
        } else if (item.key() == kRequestFieldId) {
            if (!item.value().is_number_integer() && !item.value().is_string() && !item.value().is_null()) {
                return tl::make_unexpected("Invalid field: " + item.key());
            }
            required_fields &= 0b101;
        } else if (item.key() == kRequestFieldParameters) {
            if (!item.value().is_array() && !item.value().is_object()) {
                return tl::make_unexpected("Invalid field: " + item.key());
            }
        } else if (item.key() == kRequestFieldJsonRpc) {
            if (!item.value().is_string() || item.value().get_ref<const std::string&>() != kJsonVersion) {
                return tl::make_unexpected("Invalid field: " + item.key());
            }
            required_fields &= 0b011;
        } else {
            return tl::make_unexpected("Invalid field: " + item.key());
        }
    }

    if (required_fields != 0) {
        return tl::make_unexpected("Request not valid, required fields: " + kRequestRequiredFields);
    }

    return {};
}

}  // namespace starkworm::rpc::json_rpc
