// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "error.hpp"

#include <starkworm/rpc/protocol/errors.hpp>

namespace starkworm::rpc {

std::ostream& operator<<(std::ostream& out, const Error& error) {
    out << " code: " << error.code << " message: " << error.message;
    if (error.data) {
        out << " data: " << *error.data;
    }
    return out;
}

static ErrorCode to_error_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kBlockNotFound:
            return ErrorCode::kBlockNotFound;
        case ErrorKind::kInvalidTxnIndex:
            return ErrorCode::kInvalidTxnIndex;
        case ErrorKind::kTxnHashNotFound:
            return ErrorCode::kTxnHashNotFound;
        case ErrorKind::kNoBlocks:
            return ErrorCode::kNoBlocks;
        case ErrorKind::kPendingNotSupported:
            return ErrorCode::kPendingNotSupported;
        case ErrorKind::kInternal:
            return ErrorCode::kInternalError;
    }
    return ErrorCode::kInternalError;
}

int error_code(ErrorKind kind) {
    return static_cast<int>(to_error_code(kind));
}

std::string error_message(ErrorKind kind) {
    return to_system_code(to_error_code(kind)).message();
}

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kBlockNotFound:
            return "BlockNotFound";
        case ErrorKind::kInvalidTxnIndex:
            return "InvalidTxnIndex";
        case ErrorKind::kTxnHashNotFound:
            return "TxnHashNotFound";
        case ErrorKind::kNoBlocks:
            return "NoBlocks";
        case ErrorKind::kPendingNotSupported:
            return "PendingNotSupported";
        case ErrorKind::kInternal:
            return "Internal";
    }
    return "Unknown";
}

static void append_exception(std::string& out, const std::exception& e) {
    out += e.what();
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& nested) {
        out += ": ";
        append_exception(out, nested);
    } catch (...) {
        out += ": unknown exception";
    }
}

std::string flatten_exception(std::exception_ptr eptr) {
    if (!eptr) {
        return {};
    }
    std::string chain;
    try {
        std::rethrow_exception(std::move(eptr));
    } catch (const std::exception& e) {
        append_exception(chain, e);
    } catch (...) {
        chain = "unknown exception";
    }
    return chain;
}

}  // namespace starkworm::rpc
