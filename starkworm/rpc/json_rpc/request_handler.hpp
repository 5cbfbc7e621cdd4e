// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <starkworm/infra/concurrency/task.hpp>
#include <starkworm/rpc/commands/rpc_api.hpp>
#include <starkworm/rpc/commands/rpc_api_table.hpp>
#include <starkworm/rpc/json_rpc/validator.hpp>

namespace starkworm::rpc::json_rpc {

//! Entry point of the JSON-RPC protocol: parses requests, dispatches them and serializes replies
class RequestHandler {
  public:
    RequestHandler(commands::RpcApi& rpc_api, const commands::RpcApiTable& rpc_api_table);
    virtual ~RequestHandler() = default;

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    //! Handle a single request or a batch of requests, returning the serialized reply
    Task<std::string> handle(const std::string& request);

  protected:
    Task<void> handle_request_and_create_reply(const nlohmann::json& request_json, std::string& response);

  private:
    static nlohmann::json prevalidate_and_parse(const std::string& request);
    ValidationResult is_valid_jsonrpc(const nlohmann::json& request_json);

    Task<void> handle_single_request(const nlohmann::json& request_json, std::string& response);
    Task<void> handle_request(commands::RpcApiTable::HandleMethod handler, const nlohmann::json& request_json, std::string& response);

    commands::RpcApi& rpc_api_;

    const commands::RpcApiTable& rpc_api_table_;

    Validator json_rpc_validator_;
};

}  // namespace starkworm::rpc::json_rpc
