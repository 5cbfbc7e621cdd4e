// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace starkworm::rpc {

//! Wire-level error object
struct Error {
    int code{0};
    std::string message;
    std::optional<std::string> data;

    friend bool operator==(const Error&, const Error&) = default;
};

std::ostream& operator<<(std::ostream& out, const Error& error);

//! Global vocabulary of failures any Starknet query may report
//! \warning append only: the protocol code of each kind never changes
enum class ErrorKind {
    kBlockNotFound,
    kInvalidTxnIndex,
    kTxnHashNotFound,
    kNoBlocks,
    kPendingNotSupported,
    kInternal,
};

int error_code(ErrorKind kind);
std::string error_message(ErrorKind kind);
std::string_view to_string(ErrorKind kind);

//! Flatten an exception and its nested chain into "outer: inner: ..."
std::string flatten_exception(std::exception_ptr eptr);

template <ErrorKind K>
struct KindTag {
    static constexpr ErrorKind kKind = K;
};

namespace errors {
    inline constexpr KindTag<ErrorKind::kBlockNotFound> kBlockNotFound{};
    inline constexpr KindTag<ErrorKind::kInvalidTxnIndex> kInvalidTxnIndex{};
    inline constexpr KindTag<ErrorKind::kTxnHashNotFound> kTxnHashNotFound{};
    inline constexpr KindTag<ErrorKind::kNoBlocks> kNoBlocks{};
    inline constexpr KindTag<ErrorKind::kPendingNotSupported> kPendingNotSupported{};
}  // namespace errors

template <ErrorKind K, ErrorKind... Kinds>
inline constexpr bool kIsOneOf = ((K == Kinds) || ...);

//! Closed subset of the global vocabulary that one query declares, plus the internal catch-all
//! \details Building a subset from a kind outside \code Kinds does not compile. A subset converts implicitly into
//! any wider subset, so that errors raised by shared helpers flow into each query result unchanged.
template <ErrorKind... Kinds>
class ErrorSubset {
  public:
    template <ErrorKind K>
        requires(kIsOneOf<K, Kinds...>)
    ErrorSubset(KindTag<K>) noexcept : kind_{K} {}  // NOLINT(google-explicit-constructor)

    template <ErrorKind... Others>
        requires((kIsOneOf<Others, Kinds...> && ...))
    ErrorSubset(const ErrorSubset<Others...>& other)  // NOLINT(google-explicit-constructor)
        : kind_{other.kind()}, internal_message_{other.internal_message()} {}

    static ErrorSubset internal(std::string message) {
        return ErrorSubset{ErrorKind::kInternal, std::move(message)};
    }

    static ErrorSubset from_exception(std::exception_ptr eptr) {
        return internal(flatten_exception(std::move(eptr)));
    }

    //! Whether this subset declares the given kind (internal is always admitted)
    static constexpr bool declares(ErrorKind kind) {
        return kind == ErrorKind::kInternal || ((kind == Kinds) || ...);
    }

    ErrorKind kind() const { return kind_; }
    bool is_internal() const { return kind_ == ErrorKind::kInternal; }
    const std::string& internal_message() const { return internal_message_; }

    //! Wire error: internal errors carry their context chain as data
    Error to_rpc_error() const {
        Error error{error_code(kind_), error_message(kind_), std::nullopt};
        if (is_internal() && !internal_message_.empty()) {
            error.data = internal_message_;
        }
        return error;
    }

    friend bool operator==(const ErrorSubset&, const ErrorSubset&) = default;

    friend std::ostream& operator<<(std::ostream& out, const ErrorSubset& error) {
        out << to_string(error.kind_);
        if (!error.internal_message_.empty()) {
            out << " (" << error.internal_message_ << ")";
        }
        return out;
    }

  private:
    template <ErrorKind...>
    friend class ErrorSubset;

    ErrorSubset(ErrorKind kind, std::string message) : kind_{kind}, internal_message_{std::move(message)} {}

    ErrorKind kind_;
    std::string internal_message_;
};

//! Error of queries which can fail only internally
using InternalError = ErrorSubset<>;

}  // namespace starkworm::rpc
