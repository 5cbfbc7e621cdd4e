// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "context_test_base.hpp"

#include <starkworm/infra/common/log.hpp>

namespace starkworm::test_util {

ContextTestBase::ContextTestBase()
    : work_guard_{boost::asio::make_work_guard(ioc_)},
      context_thread_{[&]() {
          log::set_thread_name("io-context");
          ioc_.run();
      }} {}

ContextTestBase::~ContextTestBase() {
    work_guard_.reset();
    ioc_.stop();
    if (context_thread_.joinable()) {
        context_thread_.join();
    }
}

}  // namespace starkworm::test_util
