/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Exception hierarchy with source location and stack trace

**************************************************/

#ifndef CADENCE_ERROR_EXCEPTION_HPP
#define CADENCE_ERROR_EXCEPTION_HPP

#include <exception>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "cadence/error/stacktrace.hpp"
#include "cadence/macro.hpp"

namespace cadence::error {

/**
 * @brief Base exception of the cadence library.
 *
 * Records where it was thrown (file, line, function), the throwing thread and
 * the call stack at construction. The message is built by streaming every
 * extra constructor argument, so callers can write
 * `THROW_RUNTIME_ERROR("job ", id, " failed")`.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an exception.
     *
     * @param file Source file of the throw site.
     * @param line Source line of the throw site.
     * @param func Function containing the throw site.
     * @param args Message fragments, concatenated with operator<<.
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func, Args&&... args)
        : file_(file), line_(line), func_(func) {
        std::ostringstream oss;
        ((oss << std::forward<Args>(args)), ...);
        message_ = oss.str();
    }

    /**
     * @brief Full description including location, thread and stack trace.
     */
    auto what() const noexcept -> const char* override;

    auto getFile() const -> std::string;
    auto getLine() const -> int;
    auto getFunction() const -> std::string;
    /**
     * @brief The plain message, without location or stack trace.
     */
    auto getMessage() const -> std::string;
    auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_ = std::this_thread::get_id();
    StackTrace stack_trace_;
};

#define THROW_EXCEPTION(...)                                       \
    throw cadence::error::Exception(CADENCE_FILE_NAME, CADENCE_FILE_LINE, \
                                    CADENCE_FUNC_NAME, __VA_ARGS__)

class RuntimeError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_RUNTIME_ERROR(...)                                      \
    throw cadence::error::RuntimeError(CADENCE_FILE_NAME, CADENCE_FILE_LINE, \
                                       CADENCE_FUNC_NAME, __VA_ARGS__)

class InvalidArgument : public Exception {
public:
    using Exception::Exception;
};

#define THROW_INVALID_ARGUMENT(...)                                      \
    throw cadence::error::InvalidArgument(CADENCE_FILE_NAME,             \
                                          CADENCE_FILE_LINE,             \
                                          CADENCE_FUNC_NAME, __VA_ARGS__)

// -------------------------------------------------------------------
// Scheduler errors
// -------------------------------------------------------------------

/**
 * @brief Operation attempted while the engine is stopped, missing callback,
 * or invalid configuration values.
 */
class ConfigurationError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_CONFIGURATION_ERROR(...)                                      \
    throw cadence::error::ConfigurationError(CADENCE_FILE_NAME,             \
                                             CADENCE_FILE_LINE,             \
                                             CADENCE_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Natural-language schedule text could not be turned into a trigger.
 */
class UnparsableScheduleError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_UNPARSABLE_SCHEDULE(...)                                  \
    throw cadence::error::UnparsableScheduleError(                      \
        CADENCE_FILE_NAME, CADENCE_FILE_LINE, CADENCE_FUNC_NAME, __VA_ARGS__)

/**
 * @brief A one-shot trigger has no future fire time.
 */
class TriggerExhaustedError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_TRIGGER_EXHAUSTED(...)                                    \
    throw cadence::error::TriggerExhaustedError(                        \
        CADENCE_FILE_NAME, CADENCE_FILE_LINE, CADENCE_FUNC_NAME, __VA_ARGS__)

/**
 * @brief Cron search ran past its forward window without a match.
 */
class NoMatchError : public Exception {
public:
    using Exception::Exception;
};

#define THROW_NO_MATCH_ERROR(...)                                         \
    throw cadence::error::NoMatchError(CADENCE_FILE_NAME, CADENCE_FILE_LINE, \
                                       CADENCE_FUNC_NAME, __VA_ARGS__)

/**
 * @brief The command callback raised while executing a job.
 */
class CallbackFailure : public Exception {
public:
    using Exception::Exception;
};

#define THROW_CALLBACK_FAILURE(...)                                         \
    throw cadence::error::CallbackFailure(CADENCE_FILE_NAME,                \
                                          CADENCE_FILE_LINE,                \
                                          CADENCE_FUNC_NAME, __VA_ARGS__)

}  // namespace cadence::error

#endif  // CADENCE_ERROR_EXCEPTION_HPP
