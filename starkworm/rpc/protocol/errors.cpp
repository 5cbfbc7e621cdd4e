// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <string>

namespace starkworm::rpc {

// avoid GCC non-virtual-dtor warning
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnon-virtual-dtor"

// NOLINTNEXTLINE(cppcoreguidelines-virtual-class-destructor)
class ProtocolErrorCategory final : public boost::system::error_category {
  public:
    const char* name() const noexcept override {
        return "rpc::ProtocolErrorCategory";
    };

    std::string message(int ev) const override {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::kParseError:
                return "Parse error";
            case ErrorCode::kInvalidRequest:
                return "Invalid request";
            case ErrorCode::kMethodNotFound:
                return "Method not found";
            case ErrorCode::kInvalidParams:
                return "Invalid params";
            case ErrorCode::kInternalError:
                return "Internal error";
            case ErrorCode::kBlockNotFound:
                return "Block not found";
            case ErrorCode::kInvalidTxnIndex:
                return "Invalid transaction index in a block";
            case ErrorCode::kTxnHashNotFound:
                return "Transaction hash not found";
            case ErrorCode::kNoBlocks:
                return "There are no blocks";
            case ErrorCode::kPendingNotSupported:
                return "Pending data not supported in this configuration";
            default:
                return "Unknown error";
        }
    }

    static ProtocolErrorCategory instance;
};

#pragma GCC diagnostic pop

ProtocolErrorCategory ProtocolErrorCategory::instance;

boost::system::error_code to_system_code(ErrorCode e) {
    return {static_cast<int>(e), ProtocolErrorCategory::instance};
}

}  // namespace starkworm::rpc
