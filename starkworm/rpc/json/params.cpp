// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "params.hpp"

#include <algorithm>

namespace starkworm::rpc {

Params::Params(const nlohmann::json& params, std::initializer_list<std::string_view> names)
    : names_{names}, values_(names.size(), nullptr) {
    if (params.is_array()) {
        if (params.size() > names_.size()) {
            throw std::invalid_argument{"too many params: expected " + std::to_string(names_.size()) +
                                        " got " + std::to_string(params.size())};
        }
        for (size_t i{0}; i < params.size(); ++i) {
            values_[i] = &params[i];
        }
    } else if (params.is_object()) {
        for (const auto& item : params.items()) {
            const auto it = std::find(names_.cbegin(), names_.cend(), item.key());
            if (it == names_.cend()) {
                throw std::invalid_argument{"unknown param: " + item.key()};
            }
            values_[static_cast<size_t>(std::distance(names_.cbegin(), it))] = &item.value();
        }
    } else if (!params.is_null()) {
        throw std::invalid_argument{"params must be an array or an object"};
    }
}

uint64_t Params::get_unsigned(std::string_view name) const {
    const auto& value = at(name);
    if (!value.is_number_unsigned()) {
        throw std::invalid_argument{"invalid " + std::string{name} + ": " + value.dump()};
    }
    return value.get<uint64_t>();
}

const nlohmann::json& Params::at(std::string_view name) const {
    const auto it = std::find(names_.cbegin(), names_.cend(), name);
    if (it == names_.cend()) {
        throw std::logic_error{"undeclared param: " + std::string{name}};
    }
    const auto* value = values_[static_cast<size_t>(std::distance(names_.cbegin(), it))];
    if (!value) {
        throw std::invalid_argument{"missing param: " + std::string{name}};
    }
    return *value;
}

}  // namespace starkworm::rpc
