// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <thread>

#include <boost/asio/thread_pool.hpp>

namespace starkworm::rpc {

//! Default number of threads in worker pool (i.e. dedicated to blocking storage reads)
inline const uint32_t kDefaultNumWorkers{std::max(1u, std::thread::hardware_concurrency() / 2)};

//! Pool of worker threads dedicated to blocking storage reads, sized independently of request concurrency
class WorkerPool : public boost::asio::thread_pool {
  public:
    explicit WorkerPool(uint32_t num_workers = kDefaultNumWorkers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    //! Stop accepting work and wait for all submitted work to complete
    //! \details Work already queued is drained, so every submitter is resumed with a result
    void shutdown();

    bool is_stopping() const { return stopping_; }

    uint32_t num_workers() const { return num_workers_; }

  private:
    uint32_t num_workers_;
    std::atomic_bool stopping_{false};
};

}  // namespace starkworm::rpc
