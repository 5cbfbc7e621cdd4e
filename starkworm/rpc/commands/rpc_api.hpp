// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <starkworm/core/types/pending.hpp>
#include <starkworm/db/storage.hpp>
#include <starkworm/rpc/commands/starknet_api.hpp>
#include <starkworm/rpc/common/worker_pool.hpp>

namespace starkworm::rpc::json_rpc {
class RequestHandler;
}

namespace starkworm::rpc::commands {

class RpcApiTable;

class RpcApi : protected StarknetRpcApi {
  public:
    RpcApi(db::Storage& storage, const PendingSource* pending, WorkerPool& workers)
        : StarknetRpcApi{storage, pending, workers} {}

    ~RpcApi() override = default;

    RpcApi(const RpcApi&) = delete;
    RpcApi& operator=(const RpcApi&) = delete;

    friend class RpcApiTable;
    friend class starkworm::rpc::json_rpc::RequestHandler;
};

}  // namespace starkworm::rpc::commands
