// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <stdexcept>
#include <string>

#include <starkworm/rpc/json/types.hpp>

namespace starkworm {

template <typename T>
static void set_if_present(nlohmann::json& json, const char* name, const std::optional<T>& value) {
    if (value) {
        json[name] = *value;
    }
}

template <typename T>
static void get_if_present(const nlohmann::json& json, const char* name, std::optional<T>& value) {
    if (json.contains(name)) {
        value = json.at(name).get<T>();
    }
}

static bool has_calldata(TransactionType type) {
    return type == TransactionType::kInvoke || type == TransactionType::kL1Handler;
}

static bool has_constructor_calldata(TransactionType type) {
    return type == TransactionType::kDeploy || type == TransactionType::kDeployAccount;
}

static bool has_signature(TransactionType type) {
    return type != TransactionType::kDeploy && type != TransactionType::kL1Handler;
}

void to_json(nlohmann::json& json, const Transaction& transaction) {
    json["transaction_hash"] = transaction.hash;
    json["type"] = std::string{to_string(transaction.type)};
    json["version"] = transaction.version;
    set_if_present(json, "sender_address", transaction.sender_address);
    set_if_present(json, "contract_address", transaction.contract_address);
    set_if_present(json, "class_hash", transaction.class_hash);
    set_if_present(json, "compiled_class_hash", transaction.compiled_class_hash);
    set_if_present(json, "contract_address_salt", transaction.contract_address_salt);
    set_if_present(json, "entry_point_selector", transaction.entry_point_selector);
    set_if_present(json, "nonce", transaction.nonce);
    set_if_present(json, "max_fee", transaction.max_fee);
    if (has_calldata(transaction.type)) {
        json["calldata"] = transaction.calldata;
    }
    if (has_constructor_calldata(transaction.type)) {
        json["constructor_calldata"] = transaction.constructor_calldata;
    }
    if (has_signature(transaction.type)) {
        json["signature"] = transaction.signature;
    }
}

void from_json(const nlohmann::json& json, Transaction& transaction) {
    transaction.hash = json.at("transaction_hash").get<Hash>();
    const auto& type = json.at("type").get_ref<const std::string&>();
    const auto transaction_type = transaction_type_from_string(type);
    if (!transaction_type) {
        throw std::invalid_argument{"invalid transaction type: " + type};
    }
    transaction.type = *transaction_type;
    transaction.version = json.at("version").get<Felt>();
    get_if_present(json, "sender_address", transaction.sender_address);
    get_if_present(json, "contract_address", transaction.contract_address);
    get_if_present(json, "class_hash", transaction.class_hash);
    get_if_present(json, "compiled_class_hash", transaction.compiled_class_hash);
    get_if_present(json, "contract_address_salt", transaction.contract_address_salt);
    get_if_present(json, "entry_point_selector", transaction.entry_point_selector);
    get_if_present(json, "nonce", transaction.nonce);
    get_if_present(json, "max_fee", transaction.max_fee);
    transaction.calldata = json.value("calldata", std::vector<Felt>{});
    transaction.constructor_calldata = json.value("constructor_calldata", std::vector<Felt>{});
    transaction.signature = json.value("signature", std::vector<Felt>{});
}

void to_json(nlohmann::json& json, const Receipt& receipt) {
    json["transaction_hash"] = receipt.transaction_hash;
    json["actual_fee"] = receipt.actual_fee;
    json["execution_status"] = std::string{to_string(receipt.execution_status)};
    set_if_present(json, "revert_reason", receipt.revert_reason);
}

void from_json(const nlohmann::json& json, Receipt& receipt) {
    receipt.transaction_hash = json.at("transaction_hash").get<Hash>();
    receipt.actual_fee = json.value("actual_fee", Felt{});
    const auto status = json.value("execution_status", std::string{to_string(ExecutionStatus::kSucceeded)});
    if (status == to_string(ExecutionStatus::kSucceeded)) {
        receipt.execution_status = ExecutionStatus::kSucceeded;
    } else if (status == to_string(ExecutionStatus::kReverted)) {
        receipt.execution_status = ExecutionStatus::kReverted;
    } else {
        throw std::invalid_argument{"invalid execution status: " + status};
    }
    get_if_present(json, "revert_reason", receipt.revert_reason);
}

}  // namespace starkworm

namespace starkworm::rpc {

void to_json(nlohmann::json& json, const TransactionStatus& status) {
    json["finality_status"] = std::string{to_string(status.finality_status)};
    json["execution_status"] = std::string{to_string(status.execution_status)};
}

void to_json(nlohmann::json& json, const TransactionReceiptReply& reply) {
    json = reply.receipt;
    json["type"] = std::string{to_string(reply.type)};
    json["finality_status"] = std::string{to_string(reply.finality_status)};
    if (reply.block_hash) {
        json["block_hash"] = *reply.block_hash;
    }
    if (reply.block_number) {
        json["block_number"] = *reply.block_number;
    }
}

}  // namespace starkworm::rpc
