// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <blocksub/infra/common/terminal.hpp>

namespace blocksub::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Line with no severity, always printed when logging is enabled
    kCritical,  // Unrecoverable failure
    kError,     // Failure we may recover from (e.g. a dropped websocket)
    kWarning,   // Something the operator may want to look at
    kInfo,      // Regular operations
    kDebug,     // Per-header details
    kTrace      // Function level tracing
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
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kNone};
    //! Tee log lines to this file
    std::string log_file;
    //! Thousands separator for numbers
    char log_thousands_sep{'\''};
};

//! \brief Initializes logging facilities
//! \note Not thread safe, call once at process start
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note Not thread safe, meant for process start and tests
void set_verbosity(Level level);

//! \brief Sets the name for this thread, printed when Settings::log_threads is on
void set_thread_name(const char* name);

//! \brief Returns the name set for the calling thread or its id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! Key/value pairs appended to a log line: {"key1", "value1", "key2", "value2", ...}
using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    BufferBase& operator<<(const T& t) {
        if (should_print_) ss_ << t;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    void append_message(std::string_view msg);
    void append_args(const Args& args);
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

}  // namespace blocksub::log

#define BLOCKSUB_LOGBUFFER(level_, ...)           \
    if (!blocksub::log::test_verbosity(level_)) { \
    } else                                        \
        blocksub::log::LogBuffer<level_>(__VA_ARGS__)

#define BLOCKSUB_TRACE_M(...) BLOCKSUB_LOGBUFFER(blocksub::log::Level::kTrace, __VA_ARGS__)
#define BLOCKSUB_DEBUG_M(...) BLOCKSUB_LOGBUFFER(blocksub::log::Level::kDebug, __VA_ARGS__)
#define BLOCKSUB_INFO_M(...) BLOCKSUB_LOGBUFFER(blocksub::log::Level::kInfo, __VA_ARGS__)
#define BLOCKSUB_WARN_M(...) BLOCKSUB_LOGBUFFER(blocksub::log::Level::kWarning, __VA_ARGS__)
#define BLOCKSUB_ERROR_M(...) BLOCKSUB_LOGBUFFER(blocksub::log::Level::kError, __VA_ARGS__)
#define BLOCKSUB_CRIT_M(...) BLOCKSUB_LOGBUFFER(blocksub::log::Level::kCritical, __VA_ARGS__)
#define BLOCKSUB_LOG_M(...) BLOCKSUB_LOGBUFFER(blocksub::log::Level::kNone, __VA_ARGS__)

#define BLOCKSUB_TRACE BLOCKSUB_TRACE_M()
#define BLOCKSUB_DEBUG BLOCKSUB_DEBUG_M()
#define BLOCKSUB_INFO BLOCKSUB_INFO_M()
#define BLOCKSUB_WARN BLOCKSUB_WARN_M()
#define BLOCKSUB_ERROR BLOCKSUB_ERROR_M()
#define BLOCKSUB_CRIT BLOCKSUB_CRIT_M()
#define BLOCKSUB_LOG BLOCKSUB_LOG_M()
