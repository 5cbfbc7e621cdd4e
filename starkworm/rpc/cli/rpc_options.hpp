// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <starkworm/rpc/settings.hpp>

namespace starkworm::cmd::common {

void add_rpc_options(CLI::App& cli, rpc::Settings& settings);

}  // namespace starkworm::cmd::common
