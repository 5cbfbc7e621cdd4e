// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "starknet_api.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <starkworm/core/common/util.hpp>
#include <starkworm/infra/common/ensure.hpp>
#include <starkworm/infra/common/log.hpp>
#include <starkworm/rpc/common/async_task.hpp>
#include <starkworm/rpc/common/constants.hpp>
#include <starkworm/rpc/core/block_assembler.hpp>
#include <starkworm/rpc/core/block_resolver.hpp>
#include <starkworm/rpc/json/block.hpp>
#include <starkworm/rpc/json/params.hpp>
#include <starkworm/rpc/json/transaction.hpp>
#include <starkworm/rpc/json/types.hpp>
#include <starkworm/rpc/protocol/errors.hpp>

namespace starkworm::rpc::commands {

namespace {

    //! Run one storage step, nesting any fault under the step description
    template <typename F>
    auto read_step(const char* step, F&& f) -> decltype(f()) {
        try {
            return f();
        } catch (...) {
            std::throw_with_nested(std::runtime_error{step});
        }
    }

    //! Connection and read transaction held for the duration of one query
    struct ReadSession {
        std::unique_ptr<db::Connection> connection;
        std::unique_ptr<db::ReadTransaction> txn;  // released before the connection
    };

    ReadSession open_read_session(db::Storage& storage) {
        ReadSession session;
        session.connection = read_step("Opening database connection", [&]() {
            auto connection = storage.connection();
            ensure(connection != nullptr, "no connection available");
            return connection;
        });
        session.txn = read_step("Creating database transaction", [&]() {
            auto txn = session.connection->begin_read();
            ensure(txn != nullptr, "no transaction available");
            return txn;
        });
        return session;
    }

    struct PersistedBlock {
        BlockHeader header;
        BlockStatus status;
    };

    //! Header and finality of the block identified by key, read within the same transaction
    std::optional<PersistedBlock> read_block(db::ReadTransaction& txn, const BlockKey& key) {
        auto header = read_step("Reading block header", [&]() { return txn.block_header(key); });
        if (!header) {
            return std::nullopt;
        }
        const auto l1_accepted = read_step("Reading L1 accepted block number", [&]() { return txn.l1_accepted_block_number(); });
        const auto status = core::block_status(header->number, l1_accepted);
        return PersistedBlock{std::move(*header), status};
    }

    std::vector<Hash> read_transaction_hashes(db::ReadTransaction& txn, BlockNum number) {
        auto tx_hashes = read_step("Reading transaction hashes", [&]() { return txn.transaction_hashes_for_block(number); });
        if (!tx_hashes) {
            throw std::runtime_error{"Missing block"};
        }
        return std::move(*tx_hashes);
    }

    std::vector<TransactionWithReceipt> read_transactions(db::ReadTransaction& txn, BlockNum number) {
        auto transactions = read_step("Reading transactions", [&]() { return txn.transactions_for_block(number); });
        if (!transactions) {
            throw std::runtime_error{"Missing block"};
        }
        return std::move(*transactions);
    }

    template <typename F>
    auto parse_params(const nlohmann::json& request, std::initializer_list<std::string_view> names, F&& extract)
        -> tl::expected<decltype(extract(std::declval<const Params&>())), std::string> {
        try {
            const auto params_json = request.contains("params") ? request["params"] : nlohmann::json{};
            const Params params{params_json, names};
            return extract(params);
        } catch (const std::invalid_argument& e) {
            return tl::make_unexpected(std::string{e.what()});
        }
    }

    tl::expected<void, std::string> check_no_params(const nlohmann::json& request) {
        try {
            const auto params_json = request.contains("params") ? request["params"] : nlohmann::json{};
            [[maybe_unused]] const Params params{params_json, {}};
            return {};
        } catch (const std::invalid_argument& e) {
            return tl::make_unexpected(std::string{e.what()});
        }
    }

    nlohmann::json make_invalid_params_error(const nlohmann::json& request, const std::string& reason) {
        const auto error_msg = "invalid " + request.value("method", std::string{}) + " params: " + reason;
        STARK_ERROR << error_msg;
        return make_json_error(request, kInvalidParams, error_msg);
    }

    template <typename T, typename E>
    nlohmann::json make_json_result(const nlohmann::json& request, const tl::expected<T, E>& result) {
        if (!result) {
            const auto& error = result.error();
            if (error.is_internal()) {
                STARK_ERROR << "internal error: " << error.internal_message() << " processing request: " << request.dump();
            }
            return make_json_error(request, error.to_rpc_error());
        }
        return make_json_content(request, *result);
    }

}  // namespace

Task<Result<BlockWithTxHashes, BlockQueryError>> StarknetRpcApi::get_block_with_tx_hashes(const BlockId& block_id) {
    const auto plan = core::resolve(block_id, pending_);
    if (!plan) {
        co_return tl::make_unexpected(plan.error());
    }
    if (const auto* pending = std::get_if<core::PendingShortCircuit>(&*plan)) {
        co_return core::make_block_with_tx_hashes(*pending->block);
    }
    const auto key = std::get<core::PersistedLookup>(*plan).key;
    co_return co_await run_blocking(workers_, [this, key]() -> Result<BlockWithTxHashes, BlockQueryError> {
        const auto session = open_read_session(storage_);
        auto block = read_block(*session.txn, key);
        if (!block) {
            return tl::make_unexpected(BlockQueryError{errors::kBlockNotFound});
        }
        auto tx_hashes = read_transaction_hashes(*session.txn, block->header.number);
        return core::make_block_with_tx_hashes(block->header, block->status, std::move(tx_hashes));
    });
}

Task<Result<BlockWithTxs, BlockQueryError>> StarknetRpcApi::get_block_with_txs(const BlockId& block_id) {
    const auto plan = core::resolve(block_id, pending_);
    if (!plan) {
        co_return tl::make_unexpected(plan.error());
    }
    if (const auto* pending = std::get_if<core::PendingShortCircuit>(&*plan)) {
        co_return core::make_block_with_txs(*pending->block);
    }
    const auto key = std::get<core::PersistedLookup>(*plan).key;
    co_return co_await run_blocking(workers_, [this, key]() -> Result<BlockWithTxs, BlockQueryError> {
        const auto session = open_read_session(storage_);
        const auto block = read_block(*session.txn, key);
        if (!block) {
            return tl::make_unexpected(BlockQueryError{errors::kBlockNotFound});
        }
        const auto transactions = read_transactions(*session.txn, block->header.number);
        return core::make_block_with_txs(block->header, block->status, transactions);
    });
}

Task<Result<uint64_t, BlockQueryError>> StarknetRpcApi::get_block_transaction_count(const BlockId& block_id) {
    const auto plan = core::resolve(block_id, pending_);
    if (!plan) {
        co_return tl::make_unexpected(plan.error());
    }
    if (const auto* pending = std::get_if<core::PendingShortCircuit>(&*plan)) {
        co_return pending->block->transactions.size();
    }
    const auto key = std::get<core::PersistedLookup>(*plan).key;
    co_return co_await run_blocking(workers_, [this, key]() -> Result<uint64_t, BlockQueryError> {
        const auto session = open_read_session(storage_);
        const auto header = read_step("Reading block header", [&]() { return session.txn->block_header(key); });
        if (!header) {
            return tl::make_unexpected(BlockQueryError{errors::kBlockNotFound});
        }
        return read_transaction_hashes(*session.txn, header->number).size();
    });
}

Task<Result<Transaction, TxIndexError>> StarknetRpcApi::get_transaction_by_block_id_and_index(const BlockId& block_id, uint64_t index) {
    const auto plan = core::resolve(block_id, pending_);
    if (!plan) {
        co_return tl::make_unexpected(plan.error());
    }
    if (const auto* pending = std::get_if<core::PendingShortCircuit>(&*plan)) {
        const auto& transactions = pending->block->transactions;
        if (index >= transactions.size()) {
            co_return tl::make_unexpected(TxIndexError{errors::kInvalidTxnIndex});
        }
        co_return transactions[index];
    }
    const auto key = std::get<core::PersistedLookup>(*plan).key;
    co_return co_await run_blocking(workers_, [this, key, index]() -> Result<Transaction, TxIndexError> {
        const auto session = open_read_session(storage_);
        const auto header = read_step("Reading block header", [&]() { return session.txn->block_header(key); });
        if (!header) {
            return tl::make_unexpected(TxIndexError{errors::kBlockNotFound});
        }
        auto transactions = read_transactions(*session.txn, header->number);
        if (index >= transactions.size()) {
            return tl::make_unexpected(TxIndexError{errors::kInvalidTxnIndex});
        }
        return std::move(transactions[index].transaction);
    });
}

Task<Result<Transaction, TxHashError>> StarknetRpcApi::get_transaction_by_hash(const Hash& transaction_hash) {
    if (pending_) {
        if (const auto block = pending_->snapshot()) {
            if (auto tx_with_receipt = block->find_transaction(transaction_hash)) {
                co_return std::move(tx_with_receipt->transaction);
            }
        }
    }
    co_return co_await run_blocking(workers_, [this, transaction_hash]() -> Result<Transaction, TxHashError> {
        const auto session = open_read_session(storage_);
        auto location = read_step("Reading transaction", [&]() { return session.txn->transaction_by_hash(transaction_hash); });
        if (!location) {
            return tl::make_unexpected(TxHashError{errors::kTxnHashNotFound});
        }
        return std::move(location->transaction);
    });
}

Task<Result<TransactionStatus, TxHashError>> StarknetRpcApi::get_transaction_status(const Hash& transaction_hash) {
    if (pending_) {
        if (const auto block = pending_->snapshot()) {
            if (const auto tx_with_receipt = block->find_transaction(transaction_hash)) {
                co_return TransactionStatus{TxFinalityStatus::kAcceptedOnL2, tx_with_receipt->receipt.execution_status};
            }
        }
    }
    co_return co_await run_blocking(workers_, [this, transaction_hash]() -> Result<TransactionStatus, TxHashError> {
        const auto session = open_read_session(storage_);
        const auto location = read_step("Reading transaction", [&]() { return session.txn->transaction_by_hash(transaction_hash); });
        if (!location) {
            return tl::make_unexpected(TxHashError{errors::kTxnHashNotFound});
        }
        const auto l1_accepted = read_step("Reading L1 accepted block number", [&]() { return session.txn->l1_accepted_block_number(); });
        return TransactionStatus{core::transaction_finality(location->block_number, l1_accepted), location->receipt.execution_status};
    });
}

Task<Result<TransactionReceiptReply, TxHashError>> StarknetRpcApi::get_transaction_receipt(const Hash& transaction_hash) {
    if (pending_) {
        if (const auto block = pending_->snapshot()) {
            if (const auto tx_with_receipt = block->find_transaction(transaction_hash)) {
                co_return core::make_transaction_receipt(*tx_with_receipt);
            }
        }
    }
    co_return co_await run_blocking(workers_, [this, transaction_hash]() -> Result<TransactionReceiptReply, TxHashError> {
        const auto session = open_read_session(storage_);
        const auto location = read_step("Reading transaction", [&]() { return session.txn->transaction_by_hash(transaction_hash); });
        if (!location) {
            return tl::make_unexpected(TxHashError{errors::kTxnHashNotFound});
        }
        const auto l1_accepted = read_step("Reading L1 accepted block number", [&]() { return session.txn->l1_accepted_block_number(); });
        return core::make_transaction_receipt(*location, l1_accepted);
    });
}

Task<Result<BlockNum, NoBlocksError>> StarknetRpcApi::block_number() {
    const auto block = co_await block_hash_and_number();
    if (!block) {
        co_return tl::make_unexpected(block.error());
    }
    co_return block->block_number;
}

Task<Result<BlockHashAndNumber, NoBlocksError>> StarknetRpcApi::block_hash_and_number() {
    co_return co_await run_blocking(workers_, [this]() -> Result<BlockHashAndNumber, NoBlocksError> {
        const auto session = open_read_session(storage_);
        const auto header = read_step("Reading block header", [&]() { return session.txn->block_header(BlockKey::latest()); });
        if (!header) {
            return tl::make_unexpected(NoBlocksError{errors::kNoBlocks});
        }
        return BlockHashAndNumber{header->hash, header->number};
    });
}

std::string StarknetRpcApi::spec_version() {
    return std::string{kStarknetSpecVersion};
}

// https://github.com/starkware-libs/starknet-specs/blob/v0.5.1/api/starknet_api_openrpc.json#L11
Task<void> StarknetRpcApi::handle_starknet_spec_version(const nlohmann::json& request, nlohmann::json& reply) {
    if (const auto checked = check_no_params(request); !checked) {
        reply = make_invalid_params_error(request, checked.error());
        co_return;
    }
    reply = make_json_content(request, spec_version());
    co_return;
}

// https://github.com/starkware-libs/starknet-specs/blob/v0.5.1/api/starknet_api_openrpc.json#L621
Task<void> StarknetRpcApi::handle_starknet_block_number(const nlohmann::json& request, nlohmann::json& reply) {
    if (const auto checked = check_no_params(request); !checked) {
        reply = make_invalid_params_error(request, checked.error());
        co_return;
    }
    try {
        reply = make_json_result(request, co_await block_number());
    } catch (const std::exception& e) {
        STARK_ERROR << "exception: " << e.what() << " processing request: " << request.dump();
        reply = make_json_internal_error(request, std::current_exception());
    }
    co_return;
}

// https://github.com/starkware-libs/starknet-specs/blob/v0.5.1/api/starknet_api_openrpc.json#L640
Task<void> StarknetRpcApi::handle_starknet_block_hash_and_number(const nlohmann::json& request, nlohmann::json& reply) {
    if (const auto checked = check_no_params(request); !checked) {
        reply = make_invalid_params_error(request, checked.error());
        co_return;
    }
    try {
        reply = make_json_result(request, co_await block_hash_and_number());
    } catch (const std::exception& e) {
        STARK_ERROR << "exception: " << e.what() << " processing request: " << request.dump();
        reply = make_json_internal_error(request, std::current_exception());
    }
    co_return;
}

// https://github.com/starkware-libs/starknet-specs/blob/v0.5.1/api/starknet_api_openrpc.json#L25
Task<void> StarknetRpcApi::handle_starknet_get_block_with_tx_hashes(const nlohmann::json& request, nlohmann::json& reply) {
    const auto block_id = parse_params(request, {"block_id"}, [](const Params& params) { return params.get<BlockId>("block_id"); });
    if (!block_id) {
        reply = make_invalid_params_error(request, block_id.error());
        co_return;
    }
    STARK_DEBUG << "block_id: " << *block_id;

    try {
        reply = make_json_result(request, co_await get_block_with_tx_hashes(*block_id));
    } catch (const std::exception& e) {
        STARK_ERROR << "exception: " << e.what() << " processing request: " << request.dump();
        reply = make_json_internal_error(request, std::current_exception());
    }
    co_return;
}

// https://github.com/starkware-libs/starknet-specs/blob/v0.5.1/api/starknet_api_openrpc.json#L64
Task<void> StarknetRpcApi::handle_starknet_get_block_with_txs(const nlohmann::json& request, nlohmann::json& reply) {
    const auto block_id = parse_params(request, {"block_id"}, [](const Params& params) { return params.get<BlockId>("block_id"); });
    if (!block_id) {
        reply = make_invalid_params_error(request, block_id.error());
        co_return;
    }
    STARK_DEBUG << "block_id: " << *block_id;

    try {
        reply = make_json_result(request, co_await get_block_with_txs(*block_id));
    } catch (const std::exception& e) {
        STARK_ERROR << "exception: " << e.what() << " processing request: " << request.dump();
        reply = make_json_internal_error(request, std::current_exception());
    }
    co_return;
}

// https://github.com/starkware-libs/starknet-specs/blob/v0.5.1/api/starknet_api_openrpc.json#L575
Task<void> StarknetRpcApi::handle_starknet_get_block_transaction_count(const nlohmann::json& request, nlohmann::json& reply) {
    const auto block_id = parse_params(request, {"block_id"}, [](const Params& params) { return params.get<BlockId>("block_id"); });
    if (!block_id) {
        reply = make_invalid_params_error(request, block_id.error());
        co_return;
    }
    STARK_DEBUG << "block_id: " << *block_id;

    try {
        reply = make_json_result(request, co_await get_block_transaction_count(*block_id));
    } catch (const std::exception& e) {
        STARK_ERROR << "exception: " << e.what() << " processing request: " << request.dump();
        reply = make_json_internal_error(request, std::current_exception());
    }
    co_return;
}

// https://github.com/starkware-libs/starknet-specs/blob/v0.5.1/api/starknet_api_openrpc.json#L393
Task<void> StarknetRpcApi::handle_starknet_get_transaction_by_block_id_and_index(const nlohmann::json& request, nlohmann::json& reply) {
    const auto block_id_and_index = parse_params(request, {"block_id", "index"}, [](const Params& params) {
        return std::make_pair(params.get<BlockId>("block_id"), params.get_unsigned("index"));
    });
    if (!block_id_and_index) {
        reply = make_invalid_params_error(request, block_id_and_index.error());
        co_return;
    }
    const auto& [block_id, index] = *block_id_and_index;
    STARK_DEBUG << "block_id: " << block_id << " index: " << index;

    try {
        reply = make_json_result(request, co_await get_transaction_by_block_id_and_index(block_id, index));
    } catch (const std::exception& e) {
        STARK_ERROR << "exception: " << e.what() << " processing request: " << request.dump();
        reply = make_json_internal_error(request, std::current_exception());
    }
    co_return;
}

// https://github.com/starkware-libs/starknet-specs/blob/v0.5.1/api/starknet_api_openrpc.json#L363
Task<void> StarknetRpcApi::handle_starknet_get_transaction_by_hash(const nlohmann::json& request, nlohmann::json& reply) {
    const auto transaction_hash = parse_params(request, {"transaction_hash"}, [](const Params& params) { return params.get<Hash>("transaction_hash"); });
    if (!transaction_hash) {
        reply = make_invalid_params_error(request, transaction_hash.error());
        co_return;
    }
    STARK_DEBUG << "transaction_hash: " << felt_to_hex(*transaction_hash);

    try {
        reply = make_json_result(request, co_await get_transaction_by_hash(*transaction_hash));
    } catch (const std::exception& e) {
        STARK_ERROR << "exception: " << e.what() << " processing request: " << request.dump();
        reply = make_json_internal_error(request, std::current_exception());
    }
    co_return;
}

// https://github.com/starkware-libs/starknet-specs/blob/v0.5.1/api/starknet_api_openrpc.json#L225
Task<void> StarknetRpcApi::handle_starknet_get_transaction_status(const nlohmann::json& request, nlohmann::json& reply) {
    const auto transaction_hash = parse_params(request, {"transaction_hash"}, [](const Params& params) { return params.get<Hash>("transaction_hash"); });
    if (!transaction_hash) {
        reply = make_invalid_params_error(request, transaction_hash.error());
        co_return;
    }
    STARK_DEBUG << "transaction_hash: " << felt_to_hex(*transaction_hash);

    try {
        reply = make_json_result(request, co_await get_transaction_status(*transaction_hash));
    } catch (const std::exception& e) {
        STARK_ERROR << "exception: " << e.what() << " processing request: " << request.dump();
        reply = make_json_internal_error(request, std::current_exception());
    }
    co_return;
}

// https://github.com/starkware-libs/starknet-specs/blob/v0.5.1/api/starknet_api_openrpc.json#L253
Task<void> StarknetRpcApi::handle_starknet_get_transaction_receipt(const nlohmann::json& request, nlohmann::json& reply) {
    const auto transaction_hash = parse_params(request, {"transaction_hash"}, [](const Params& params) { return params.get<Hash>("transaction_hash"); });
    if (!transaction_hash) {
        reply = make_invalid_params_error(request, transaction_hash.error());
        co_return;
    }
    STARK_DEBUG << "transaction_hash: " << felt_to_hex(*transaction_hash);

    try {
        reply = make_json_result(request, co_await get_transaction_receipt(*transaction_hash));
    } catch (const std::exception& e) {
        STARK_ERROR << "exception: " << e.what() << " processing request: " << request.dump();
        reply = make_json_internal_error(request, std::current_exception());
    }
    co_return;
}

}  // namespace starkworm::rpc::commands
