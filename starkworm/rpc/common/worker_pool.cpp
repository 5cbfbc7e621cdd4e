// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "worker_pool.hpp"

#include <starkworm/infra/common/log.hpp>

namespace starkworm::rpc {

WorkerPool::WorkerPool(uint32_t num_workers)
    : boost::asio::thread_pool(num_workers), num_workers_{num_workers} {
    STARK_DEBUG << "WorkerPool started with " << num_workers_ << " workers";
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }
    STARK_DEBUG << "WorkerPool::shutdown draining workers";
    join();
    STARK_DEBUG << "WorkerPool::shutdown workers stopped";
}

}  // namespace starkworm::rpc
