// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <starkworm/infra/common/log.hpp>
#include <starkworm/rpc/common/constants.hpp>
#include <starkworm/rpc/common/worker_pool.hpp>

namespace starkworm::rpc {

struct Settings {
    log::Settings log_settings;
    uint32_t num_workers{kDefaultNumWorkers};
    //! Whether the pending overlay is served: when false, pending references fail with PendingNotSupported
    bool pending_supported{true};
    //! JSON chain fixture loaded at startup, empty chain if absent
    std::optional<std::filesystem::path> chain_file;
    std::string api_spec{kDefaultApiSpec};
};

}  // namespace starkworm::rpc
