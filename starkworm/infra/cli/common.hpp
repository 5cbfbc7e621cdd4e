// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include <starkworm/infra/common/log.hpp>

namespace starkworm::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up option for an optional existing file path
void add_option_existing_file(CLI::App& cli, const std::string& name, std::optional<std::filesystem::path>& file,
                              const std::string& description);

}  // namespace starkworm::cmd::common
