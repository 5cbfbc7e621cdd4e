// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <starkworm/core/common/base.hpp>

namespace starkworm {

enum class TransactionType {
    kInvoke,
    kDeclare,
    kDeploy,
    kDeployAccount,
    kL1Handler,
};

std::string_view to_string(TransactionType type);
std::optional<TransactionType> transaction_type_from_string(std::string_view type);

//! Transaction as stored: the populated optional fields depend on type and version
struct Transaction {
    Hash hash{};
    TransactionType type{TransactionType::kInvoke};
    Felt version{};
    std::optional<Felt> sender_address;
    std::optional<Felt> contract_address;
    std::optional<Hash> class_hash;
    std::optional<Hash> compiled_class_hash;
    std::optional<Felt> contract_address_salt;
    std::optional<Felt> entry_point_selector;
    std::optional<Felt> nonce;
    std::optional<Felt> max_fee;
    std::vector<Felt> calldata;
    std::vector<Felt> constructor_calldata;
    std::vector<Felt> signature;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

enum class ExecutionStatus {
    kSucceeded,
    kReverted,
};

std::string_view to_string(ExecutionStatus status);

struct Receipt {
    Hash transaction_hash{};
    Felt actual_fee{};
    ExecutionStatus execution_status{ExecutionStatus::kSucceeded};
    std::optional<std::string> revert_reason;

    friend bool operator==(const Receipt&, const Receipt&) = default;
};

struct TransactionWithReceipt {
    Transaction transaction;
    Receipt receipt;

    friend bool operator==(const TransactionWithReceipt&, const TransactionWithReceipt&) = default;
};

//! Transaction found by hash together with the coordinates of its containing block
struct TransactionLocation {
    Transaction transaction;
    Receipt receipt;
    BlockNum block_number{0};
    Hash block_hash{};
};

std::ostream& operator<<(std::ostream& out, const Transaction& transaction);

}  // namespace starkworm
