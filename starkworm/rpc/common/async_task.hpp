// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include <boost/asio/compose.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <tl/expected.hpp>

#include <starkworm/infra/common/log.hpp>
#include <starkworm/infra/concurrency/task.hpp>
#include <starkworm/rpc/common/worker_pool.hpp>
#include <starkworm/rpc/types/error.hpp>

namespace starkworm::rpc {

//! Helper trait for any completion handler signature
template <typename R, typename F, typename... Args>
struct CompletionHandler {
    using type = void(std::exception_ptr, R);
};

//! Partial specialization for \code void return type
template <typename F, typename... Args>
struct CompletionHandler<void, F, Args...> {
    using type = void(std::exception_ptr);
};

//! Alias helper trait for the completion handler signature of any task
template <typename F, typename... Args>
using TaskCompletionHandler = typename CompletionHandler<std::invoke_result_t<F, Args...>, F, Args...>::type;

namespace detail {

    //! Completion of a task returning \code void, posted back to the caller executor
    template <typename Self>
    struct TaskVoidCompletion {
        Self self;
        std::exception_ptr eptr;

        void operator()() { self.complete(eptr); }
    };

    //! Completion of a task returning \code R, posted back to the caller executor
    template <typename Self, typename R>
    struct TaskValueCompletion {
        Self self;
        std::exception_ptr eptr;
        R result;

        void operator()() { self.complete(eptr, std::move(result)); }
    };

    //! Work item executed on the runner thread under the log scope of the submitter
    template <typename CallerExecutor, typename Self, typename F, typename... Args>
    struct TaskWork {
        CallerExecutor caller_executor;
        log::Scope scope;
        F fn;
        std::tuple<Args...> args;
        Self self;

        void operator()() {
            using R = std::invoke_result_t<F&, Args&...>;
            log::ScopeGuard scope_guard{std::move(scope)};
            std::exception_ptr eptr;
            if constexpr (std::is_void_v<R>) {
                try {
                    std::apply(fn, args);
                } catch (...) {
                    eptr = std::current_exception();
                }
                auto executor = caller_executor;
                boost::asio::post(executor, TaskVoidCompletion<Self>{std::move(self), eptr});
            } else {
                std::optional<R> result;
                try {
                    result.emplace(std::apply(fn, args));
                } catch (...) {
                    eptr = std::current_exception();
                }
                auto executor = caller_executor;
                boost::asio::post(executor, TaskValueCompletion<Self, R>{std::move(self), eptr, result ? std::move(*result) : R{}});
            }
        }
    };

    //! Initiation of the composed operation: moves the work and the operation state onto the runner
    template <typename CallerExecutor, typename Runner, typename F, typename... Args>
    struct TaskInitiation {
        CallerExecutor caller_executor;
        Runner runner;
        log::Scope scope;
        F fn;
        std::tuple<Args...> args;

        template <typename Self>
        void operator()(Self& self) {
            // self owns this initiation: every member is moved out before self itself
            auto target = runner;
            boost::asio::post(target, TaskWork<CallerExecutor, std::decay_t<Self>, F, Args...>{
                                          caller_executor,
                                          std::move(scope),
                                          std::move(fn),
                                          std::move(args),
                                          std::move(self),
                                      });
        }
    };

}  // namespace detail

//! Asynchronous \code co_await-able task executing function \code fn with arguments \code args in \code runner executor
//! \details The log scope active at submission is installed on the runner thread while \code fn executes
template <typename Executor, typename F, typename... Args>
// NOLINTNEXTLINE(cppcoreguidelines-missing-std-forward) because of https://github.com/llvm/llvm-project/issues/68105
Task<std::invoke_result_t<F, Args...>> async_task(Executor runner, F&& fn, Args&&... args) {
    auto this_executor = co_await boost::asio::this_coro::executor;
    using Initiation = detail::TaskInitiation<decltype(this_executor), Executor, std::decay_t<F>, std::decay_t<Args>...>;
    Initiation initiation{
        this_executor,
        runner,
        log::current_scope(),
        std::forward<F>(fn),
        std::tuple<std::decay_t<Args>...>{std::forward<Args>(args)...},
    };
    co_return co_await boost::asio::async_compose<decltype(boost::asio::use_awaitable), TaskCompletionHandler<F, Args...>>(
        std::move(initiation), boost::asio::use_awaitable);
}

template <typename T>
struct IsExpected : std::false_type {};

template <typename T, typename E>
struct IsExpected<tl::expected<T, E>> : std::true_type {};

//! Context prefix of every fault raised while running blocking work
inline constexpr const char* kBlockingFailureContext{"Database read panic or shutting down"};

//! Run blocking function \code fn returning a \code tl::expected on the worker pool and suspend until it completes
//! \details Any fault (exception thrown by \code fn or pool shutting down) is folded into the internal error of the
//! declared error subset, prefixed by \code kBlockingFailureContext
template <typename F>
Task<std::invoke_result_t<F>> run_blocking(WorkerPool& pool, F&& fn) {
    using Result = std::invoke_result_t<F>;
    static_assert(IsExpected<Result>::value, "run_blocking requires a function returning tl::expected");
    using ErrorType = typename Result::error_type;

    if (pool.is_stopping()) {
        STARK_ERROR << "run_blocking: worker pool is shutting down";
        co_return tl::make_unexpected(ErrorType::internal(std::string{kBlockingFailureContext} + ": worker pool is shutting down"));
    }

    std::exception_ptr eptr;
    try {
        co_return co_await async_task(pool.get_executor(), std::forward<F>(fn));
    } catch (...) {
        eptr = std::current_exception();
    }
    auto error = ErrorType::internal(std::string{kBlockingFailureContext} + ": " + flatten_exception(eptr));
    STARK_ERROR << "run_blocking: " << error.internal_message();
    co_return tl::make_unexpected(std::move(error));
}

}  // namespace starkworm::rpc
