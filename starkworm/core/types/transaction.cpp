// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <starkworm/core/common/util.hpp>

namespace starkworm {

std::string_view to_string(TransactionType type) {
    switch (type) {
        case TransactionType::kInvoke:
            return "INVOKE";
        case TransactionType::kDeclare:
            return "DECLARE";
        case TransactionType::kDeploy:
            return "DEPLOY";
        case TransactionType::kDeployAccount:
            return "DEPLOY_ACCOUNT";
        case TransactionType::kL1Handler:
            return "L1_HANDLER";
    }
    return "UNKNOWN";
}

std::optional<TransactionType> transaction_type_from_string(std::string_view type) {
    for (const auto t : {TransactionType::kInvoke, TransactionType::kDeclare, TransactionType::kDeploy,
                         TransactionType::kDeployAccount, TransactionType::kL1Handler}) {
        if (to_string(t) == type) {
            return t;
        }
    }
    return std::nullopt;
}

std::string_view to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kSucceeded:
            return "SUCCEEDED";
        case ExecutionStatus::kReverted:
            return "REVERTED";
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& out, const Transaction& transaction) {
    out << "hash: " << felt_to_hex(transaction.hash)
        << " type: " << to_string(transaction.type)
        << " version: " << felt_to_hex(transaction.version);
    return out;
}

}  // namespace starkworm
