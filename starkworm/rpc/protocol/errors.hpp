// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <boost/system/system_error.hpp>

namespace starkworm::rpc {

enum ErrorCode : int64_t {
    /** Generic JSON-RPC API errors **/
    kParseError = -32700,      // Invalid JSON was received by the server
    kInvalidRequest = -32600,  // The JSON sent is not a valid Request object
    kMethodNotFound = -32601,  // The method does not exist / is not available
    kInvalidParams = -32602,   // Invalid method parameter(s)
    kInternalError = -32603,   // Internal JSON-RPC error

    /** Starknet API errors: codes are permanent **/
    kBlockNotFound = 24,              // Requested block does not exist
    kInvalidTxnIndex = 27,            // Transaction index out of the block range
    kTxnHashNotFound = 29,            // Requested transaction does not exist
    kNoBlocks = 32,                   // Storage holds no block yet
    kPendingNotSupported = -32001,    // Node configured without pending data
};

// To raise a boost::system::system_error exception:
//    throw boost::system::system_error{rpc::to_system_code(rpc::ErrorCode::kSomething)};
boost::system::error_code to_system_code(ErrorCode e);

}  // namespace starkworm::rpc
