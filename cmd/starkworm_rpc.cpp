// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <CLI/CLI.hpp>

#include <starkworm/infra/cli/common.hpp>
#include <starkworm/rpc/cli/rpc_options.hpp>
#include <starkworm/rpc/daemon.hpp>

using namespace starkworm;
using namespace starkworm::cmd::common;
using namespace starkworm::rpc;

int main(int argc, char* argv[]) {
    CLI::App cli{"Starkworm - C++ implementation of Starknet JSON RPC API query service"};

    Settings settings;

    try {
        // Parse and validate program arguments
        add_logging_options(cli, settings.log_settings);
        add_rpc_options(cli, settings);
        cli.parse(argc, argv);

        return Daemon::run(settings);
    } catch (const CLI::ParseError& pe) {
        return cli.exit(pe);
    }
}
