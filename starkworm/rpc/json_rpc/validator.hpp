// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace starkworm::rpc::json_rpc {

using ValidationResult = tl::expected<void, std::string>;

//! Structural check of a JSON-RPC 2.0 request object
//! \details Method parameters are checked by each handler against its own signature
class Validator {
  public:
    ValidationResult validate(const nlohmann::json& request);

  private:
    ValidationResult check_request_fields(const nlohmann::json& request);
};

}  // namespace starkworm::rpc::json_rpc
