// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <starkworm/infra/concurrency/task.hpp>
#include <starkworm/rpc/commands/rpc_api.hpp>

namespace starkworm::rpc::commands {

//! Routing table from method name to handler, built from the enabled API namespaces
class RpcApiTable {
  public:
    using HandleMethod = Task<void> (RpcApi::*)(const nlohmann::json&, nlohmann::json&);

    //! \param api_spec comma-separated list of the API namespaces to enable
    explicit RpcApiTable(std::string_view api_spec);

    RpcApiTable(const RpcApiTable&) = delete;
    RpcApiTable& operator=(const RpcApiTable&) = delete;
    RpcApiTable(RpcApiTable&&) = default;

    std::optional<HandleMethod> find_json_handler(const std::string& method) const;

    size_t size() const { return method_handlers_.size(); }

  private:
    void build_handlers(std::string_view api_spec);
    void add_handlers(std::string_view api_namespace);
    void add_starknet_handlers();

    std::map<std::string, HandleMethod> method_handlers_;
};

}  // namespace starkworm::rpc::commands
