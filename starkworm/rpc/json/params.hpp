// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace starkworm::rpc {

//! Method parameters given either by position or by name, validated against the method signature
//! \details Unknown names, surplus positions and missing parameters are rejected: every failure is reported as
//! std::invalid_argument, to be turned into an invalid params error
class Params {
  public:
    //! \param params the "params" member of the request (null when absent)
    //! \param names the parameter names in positional order
    Params(const nlohmann::json& params, std::initializer_list<std::string_view> names);

    template <typename T>
    T get(std::string_view name) const {
        const auto& value = at(name);
        try {
            return value.get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument{"invalid " + std::string{name} + ": " + e.what()};
        }
    }

    //! Non-negative integer parameter: negative or fractional numbers are rejected
    uint64_t get_unsigned(std::string_view name) const;

  private:
    const nlohmann::json& at(std::string_view name) const;

    std::vector<std::string_view> names_;
    std::vector<const nlohmann::json*> values_;  // one per name
};

}  // namespace starkworm::rpc
