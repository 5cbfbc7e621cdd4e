// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <starkworm/core/types/pending.hpp>
#include <starkworm/db/memory_storage.hpp>
#include <starkworm/rpc/commands/rpc_api.hpp>
#include <starkworm/rpc/commands/rpc_api_table.hpp>
#include <starkworm/rpc/common/worker_pool.hpp>
#include <starkworm/rpc/json/chain_fixture.hpp>
#include <starkworm/rpc/json_rpc/request_handler.hpp>
#include <starkworm/rpc/settings.hpp>

namespace starkworm::rpc {

//! JSON-RPC service over newline-delimited streams, backed by the in-memory storage
class Daemon {
  public:
    //! Load the configured chain fixture and serve stdin until end of input
    static int run(const Settings& settings);

    Daemon(const Settings& settings, const ChainFixture& fixture);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    //! Answer each non-empty input line with one reply line
    //! \return the number of requests served
    size_t serve(std::istream& in, std::ostream& out);

    //! The pending overlay fed by the external producer, null when pending is not served
    PendingSource* pending() { return pending_.get(); }

  private:
    Settings settings_;
    db::MemoryStorage storage_;
    std::unique_ptr<PendingSource> pending_;
    WorkerPool workers_;
    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::thread context_thread_;
    commands::RpcApi rpc_api_;
    commands::RpcApiTable rpc_api_table_;
    json_rpc::RequestHandler request_handler_;
};

}  // namespace starkworm::rpc
