// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "daemon.hpp"

#include <iostream>
#include <string>

#include <starkworm/infra/common/log.hpp>
#include <starkworm/infra/concurrency/spawn.hpp>

namespace starkworm::rpc {

int Daemon::run(const Settings& settings) {
    log::init(settings.log_settings);
    log::set_thread_name("main");

    ChainFixture fixture;
    if (settings.chain_file) {
        try {
            fixture = read_chain_fixture(*settings.chain_file);
        } catch (const std::exception& e) {
            STARK_CRIT << "Cannot load chain fixture " << settings.chain_file->string() << ": " << e.what();
            return -1;
        }
    }

    try {
        Daemon daemon{settings, fixture};
        const auto num_requests = daemon.serve(std::cin, std::cout);
        STARK_INFO << "Daemon: end of input after " << num_requests << " requests";
    } catch (const std::exception& e) {
        STARK_CRIT << "Daemon exception: " << e.what();
        return -1;
    }
    return 0;
}

Daemon::Daemon(const Settings& settings, const ChainFixture& fixture)
    : settings_{settings},
      pending_{settings.pending_supported ? std::make_unique<PendingSource>(fixture.pending_block) : nullptr},
      workers_{settings.num_workers},
      work_guard_{boost::asio::make_work_guard(ioc_)},
      rpc_api_{storage_, pending_.get(), workers_},
      rpc_api_table_{settings.api_spec},
      request_handler_{rpc_api_, rpc_api_table_} {
    load_chain_fixture(fixture, storage_);
    if (!pending_ && fixture.pending_block) {
        STARK_WARN << "Daemon: pending block in chain fixture ignored, pending data not served";
    }
    context_thread_ = std::thread{[&]() {
        log::set_thread_name("io-context");
        ioc_.run();
    }};
    STARK_INFO << "Daemon started: workers=" << workers_.num_workers() << " api=" << settings_.api_spec
               << " pending=" << (pending_ ? "on" : "off");
}

Daemon::~Daemon() {
    work_guard_.reset();
    ioc_.stop();
    if (context_thread_.joinable()) {
        context_thread_.join();
    }
    workers_.shutdown();
}

size_t Daemon::serve(std::istream& in, std::ostream& out) {
    size_t num_requests{0};
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        const auto reply = concurrency::spawn_future(ioc_, request_handler_.handle(line)).get();
        out << reply << '\n'
            << std::flush;
        ++num_requests;
    }
    return num_requests;
}

}  // namespace starkworm::rpc
