// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "request_handler.hpp"

#include <chrono>
#include <exception>
#include <sstream>
#include <stdexcept>

#include <starkworm/infra/common/log.hpp>
#include <starkworm/rpc/json/types.hpp>
#include <starkworm/rpc/protocol/errors.hpp>

namespace starkworm::rpc::json_rpc {

RequestHandler::RequestHandler(commands::RpcApi& rpc_api, const commands::RpcApiTable& rpc_api_table)
    : rpc_api_{rpc_api}, rpc_api_table_{rpc_api_table} {}

Task<std::string> RequestHandler::handle(const std::string& request) {
    const auto start = std::chrono::steady_clock::now();

    nlohmann::json request_json;
    try {
        request_json = prevalidate_and_parse(request);
    } catch (const nlohmann::json::exception& e) {
        STARK_ERROR << "RequestHandler::handle nlohmann::json::exception: " << e.what();
        request_json = nlohmann::json::value_t::discarded;
    } catch (const std::runtime_error& re) {
        STARK_ERROR << "RequestHandler::handle runtime error: " << re.what();
        request_json = nlohmann::json::value_t::discarded;
    }
    if (request_json.is_discarded()) {
        co_return make_json_error(nullptr, kParseError, "parse error").dump();
    }

    std::string response;
    if (request_json.is_array()) {
        if (request_json.empty()) {
            co_return make_json_error(nullptr, kInvalidRequest, "empty batch").dump();
        }
        std::stringstream batch_reply_content;
        batch_reply_content << "[";
        int index = 0;
        for (const auto& single_request_json : request_json) {
            if (index++ > 0) {
                batch_reply_content << ",";
            }
            std::string single_reply;
            co_await handle_single_request(single_request_json, single_reply);
            batch_reply_content << single_reply;
        }
        batch_reply_content << "]";
        response = batch_reply_content.str();
    } else {
        co_await handle_single_request(request_json, response);
    }

    STARK_TRACE << "handle request t="
                << std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start).count() << "us";
    co_return response;
}

//! Parse the JSON request, rejecting nil characters outside quoted strings
nlohmann::json RequestHandler::prevalidate_and_parse(const std::string& request) {
    bool inside_quote = false;
    bool previous_char_escape = false;
    for (auto ch : request) {
        if (!inside_quote && ch == 0x0) {
            throw std::runtime_error("invalid request: nil character");
        }

        if (ch == '"' && !previous_char_escape) {
            inside_quote = !inside_quote;
        }
        previous_char_escape = ch == '\\' && !previous_char_escape;
    }

    return nlohmann::json::parse(request);
}

ValidationResult RequestHandler::is_valid_jsonrpc(const nlohmann::json& request_json) {
    return json_rpc_validator_.validate(request_json);
}

Task<void> RequestHandler::handle_single_request(const nlohmann::json& request_json, std::string& response) {
    if (const auto valid_result{is_valid_jsonrpc(request_json)}; !valid_result) {
        STARK_WARN << "RequestHandler: invalid request: " << valid_result.error();
        response = make_json_error(request_json, kInvalidRequest, valid_result.error()).dump();
        co_return;
    }
    co_await handle_request_and_create_reply(request_json, response);
}

Task<void> RequestHandler::handle_request_and_create_reply(const nlohmann::json& request_json, std::string& response) {
    const auto method = request_json["method"].get<std::string>();
    const auto id = request_json.contains("id") ? request_json["id"].dump() : "null";
    log::ScopeGuard scope_guard{log::Scope{"req=" + id + " " + method}};

    const auto json_handler = rpc_api_table_.find_json_handler(method);
    if (!json_handler) {
        STARK_DEBUG << "method not found: " << method;
        response = make_json_error(request_json, kMethodNotFound, "the method " + method + " does not exist/is not available").dump();
        co_return;
    }

    STARK_TRACE << "--> handle RPC request: " << method;
    co_await handle_request(*json_handler, request_json, response);
    STARK_TRACE << "<-- handle RPC request: " << method;
}

Task<void> RequestHandler::handle_request(commands::RpcApiTable::HandleMethod handler, const nlohmann::json& request_json, std::string& response) {
    try {
        nlohmann::json reply_json;
        co_await (rpc_api_.*handler)(request_json, reply_json);
        response = reply_json.dump(
            /*indent=*/-1, /*indent_char=*/' ', /*ensure_ascii=*/false, nlohmann::json::error_handler_t::replace);
    } catch (const std::exception& e) {
        STARK_ERROR << "exception: " << e.what();
        response = make_json_internal_error(request_json, std::current_exception()).dump();
    }
}

}  // namespace starkworm::rpc::json_rpc
