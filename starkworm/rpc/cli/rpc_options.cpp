// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "rpc_options.hpp"

#include <algorithm>
#include <array>
#include <string>

#include <absl/strings/str_split.h>

#include <starkworm/infra/cli/common.hpp>
#include <starkworm/rpc/common/constants.hpp>

namespace starkworm::cmd::common {

//! All Starknet JSON RPC API namespaces
static constexpr std::array kAllStarknetNamespaces{
    rpc::kStarknetApiNamespace};

//! CLI11 validator for Starknet JSON API namespace specification
struct ApiSpecValidator : public CLI::Validator {
    explicit ApiSpecValidator() {
        func_ = [](const std::string& value) -> std::string {
            // Parse the entire API namespace specification, i.e. comma-separated list of API namespaces
            for (const auto ns : absl::StrSplit(value, rpc::kApiSpecSeparator)) {
                const auto it = std::find(kAllStarknetNamespaces.cbegin(), kAllStarknetNamespaces.cend(), ns);
                if (it == kAllStarknetNamespaces.cend()) {
                    return "Value " + std::string{ns} + " is not a valid API namespace";
                }
            }
            return {};
        };
    }
};

void add_rpc_options(CLI::App& cli, rpc::Settings& settings) {
    add_option_existing_file(cli, "--chain.file", settings.chain_file,
                             "JSON chain fixture loaded into the in-memory storage at startup");

    cli.add_option("--workers", settings.num_workers)
        ->description("Number of worker threads dedicated to storage reads")
        ->check(CLI::Range(1, 1024))
        ->capture_default_str();

    cli.add_option("--api", settings.api_spec)
        ->description("Starknet JSON RPC API namespaces as comma-separated list of strings")
        ->check(ApiSpecValidator())
        ->capture_default_str();

    cli.add_flag("--pending,!--no-pending", settings.pending_supported)
        ->description("Serve the pending block for the \"pending\" block reference")
        ->capture_default_str();
}

}  // namespace starkworm::cmd::common
