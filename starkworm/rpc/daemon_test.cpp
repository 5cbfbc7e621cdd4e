// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "daemon.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include <starkworm/infra/test_util/log.hpp>

namespace starkworm::rpc {

static const nlohmann::json kChain = R"({
    "blocks": [
        {"header": {"block_number": 0, "block_hash": "0xa0"}},
        {
            "header": {"block_number": 1, "block_hash": "0xa1", "parent_hash": "0xa0"},
            "transactions": [
                {"transaction": {"transaction_hash": "0x11", "type": "INVOKE", "version": "0x1"},
                 "receipt": {"transaction_hash": "0x11", "execution_status": "SUCCEEDED"}}
            ]
        }
    ],
    "l1_accepted_block_number": 1,
    "pending": {
        "parent_hash": "0xa1",
        "transactions": [
            {"transaction": {"transaction_hash": "0x21", "type": "INVOKE", "version": "0x1"},
             "receipt": {"transaction_hash": "0x21", "execution_status": "SUCCEEDED"}}
        ]
    }
})"_json;

static std::vector<nlohmann::json> read_replies(const std::string& output) {
    std::vector<nlohmann::json> replies;
    std::istringstream stream{output};
    std::string line;
    while (std::getline(stream, line)) {
        replies.push_back(nlohmann::json::parse(line));
    }
    return replies;
}

TEST_CASE("Daemon: serve newline-delimited requests", "[rpc][daemon]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    Settings settings;
    settings.num_workers = 1;
    Daemon daemon{settings, parse_chain_fixture(kChain)};

    std::istringstream in{
        R"({"jsonrpc":"2.0","id":1,"method":"starknet_blockNumber"})"
        "\n\n"
        R"({"jsonrpc":"2.0","id":2,"method":"starknet_getBlockTransactionCount","params":["pending"]})"
        "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"starknet_getTransactionStatus","params":["0x11"]})"
        "\n"
        "not json\n"};
    std::ostringstream out;
    CHECK(daemon.serve(in, out) == 4);

    const auto replies = read_replies(out.str());
    REQUIRE(replies.size() == 4);
    CHECK(replies[0]["result"] == 1);
    CHECK(replies[1]["result"] == 1);
    CHECK(replies[2]["result"]["finality_status"] == "ACCEPTED_ON_L1");
    CHECK(replies[3]["error"]["code"] == -32700);
}

TEST_CASE("Daemon: pending updates are visible", "[rpc][daemon]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    Settings settings;
    settings.num_workers = 1;
    Daemon daemon{settings, parse_chain_fixture(kChain)};
    REQUIRE(daemon.pending());
    daemon.pending()->update(std::make_shared<PendingBlock>());

    std::istringstream in{R"({"jsonrpc":"2.0","id":1,"method":"starknet_getBlockTransactionCount","params":["pending"]})"};
    std::ostringstream out;
    CHECK(daemon.serve(in, out) == 1);
    CHECK(read_replies(out.str())[0]["result"] == 0);
}

TEST_CASE("Daemon: pending not served", "[rpc][daemon]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    Settings settings;
    settings.num_workers = 1;
    settings.pending_supported = false;
    Daemon daemon{settings, parse_chain_fixture(kChain)};
    CHECK_FALSE(daemon.pending());

    std::istringstream in{R"({"jsonrpc":"2.0","id":1,"method":"starknet_getBlockWithTxHashes","params":["pending"]})"};
    std::ostringstream out;
    daemon.serve(in, out);
    CHECK(read_replies(out.str())[0]["error"]["code"] == -32001);
}

TEST_CASE("Daemon: broken chain fixture", "[rpc][daemon]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    Settings settings;
    settings.num_workers = 1;
    const auto fixture = parse_chain_fixture(R"({"blocks": [{"header": {"block_number": 3, "block_hash": "0x3"}}]})"_json);
    CHECK_THROWS_AS(Daemon(settings, fixture), std::logic_error);
}

}  // namespace starkworm::rpc
