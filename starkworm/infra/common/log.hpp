// Copyright 2025 The Starkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <starkworm/infra/common/terminal.hpp>

namespace starkworm::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether timestamps should include the timezone identifier
    bool log_timezone{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to trim log level
    bool log_trim{false};
    //! Whether to print thread ids in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kNone};
    //! Log to file
    std::string log_file;
    //! Thousands separator
    char log_thousands_sep{'\''};
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
//! \note This function is not thread safe as it's meant to be used in tests
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void tee_file(const std::filesystem::path& path);

//! \brief Correlation tag printed on every log line emitted by the current thread (e.g. "req=7 starknet_blockNumber")
//! \remarks Scopes are thread-local: code hopping threads must carry the scope along (see rpc::async_task)
struct Scope {
    std::string tag;

    bool empty() const { return tag.empty(); }
};

//! \brief Returns the scope active on the current thread
const Scope& current_scope();

//! \brief RAII helper installing a scope on the current thread and restoring the previous one on exit
class ScopeGuard {
  public:
    explicit ScopeGuard(Scope scope);
    ~ScopeGuard();

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

  private:
    Scope previous_;
};

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    // Accumulators
    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    void append(const Args& args) {
        append("", args);
    }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args) {
        if (!should_print_) return;
        ss_ << std::left << std::setw(41) << std::setfill(' ') << msg;
        bool left{true};
        for (const auto& arg : args) {
            ss_ << (left ? kColorGreen : kColorWhite) << arg << kColorReset << (left ? "=" : " ") << kColorReset;
            left = !left;
        }
    }
    void flush();
    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace starkworm::log

#define STARK_LOGBUFFER(level_, ...)               \
    if (!starkworm::log::test_verbosity(level_)) { \
    } else                                         \
        starkworm::log::LogBuffer<level_>(__VA_ARGS__)

#define STARK_TRACE_M(...) STARK_LOGBUFFER(starkworm::log::Level::kTrace, __VA_ARGS__)
#define STARK_DEBUG_M(...) STARK_LOGBUFFER(starkworm::log::Level::kDebug, __VA_ARGS__)
#define STARK_INFO_M(...) STARK_LOGBUFFER(starkworm::log::Level::kInfo, __VA_ARGS__)
#define STARK_WARN_M(...) STARK_LOGBUFFER(starkworm::log::Level::kWarning, __VA_ARGS__)
#define STARK_ERROR_M(...) STARK_LOGBUFFER(starkworm::log::Level::kError, __VA_ARGS__)
#define STARK_CRIT_M(...) STARK_LOGBUFFER(starkworm::log::Level::kCritical, __VA_ARGS__)
#define STARK_LOG_M(...) STARK_LOGBUFFER(starkworm::log::Level::kNone, __VA_ARGS__)

#define STARK_TRACE STARK_TRACE_M()
#define STARK_DEBUG STARK_DEBUG_M()
#define STARK_INFO STARK_INFO_M()
#define STARK_WARN STARK_WARN_M()
#define STARK_ERROR STARK_ERROR_M()
#define STARK_CRIT STARK_CRIT_M()
#define STARK_LOG STARK_LOG_M()
