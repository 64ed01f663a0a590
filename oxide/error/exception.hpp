/*
 * exception.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Better Exception Library

**************************************************/

#ifndef OXIDE_ERROR_EXCEPTION_HPP
#define OXIDE_ERROR_EXCEPTION_HPP

#include <exception>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include "oxide/macro.hpp"

#if OXIDE_ENABLE_STACKTRACE
#ifdef OXIDE_USE_BOOST_STACKTRACE
#include <boost/stacktrace.hpp>
#else
#include "oxide/error/stacktrace.hpp"
#endif
#endif

namespace oxide::error {

/**
 * @brief Base class of every exception thrown by oxide.
 *
 * Records where it was thrown from (file, line, function), the throwing
 * thread and, when enabled, the stack at the throw site. `what()` renders
 * all of it; `getMessage()` returns the message alone.
 */
class Exception : public std::exception {
public:
    /**
     * @brief Constructs an exception from a fmt-style format string.
     *
     * With no format arguments the message is taken verbatim, so caller
     * supplied text containing braces is never interpreted.
     *
     * @param file Source file of the throw site.
     * @param line Source line of the throw site.
     * @param func Function containing the throw site.
     * @param format Message, or format string when args are given.
     * @param args Format arguments.
     */
    template <typename... Args>
    Exception(const char* file, int line, const char* func,
              std::string_view format, Args&&... args)
        : file_(file),
          line_(line),
          func_(func),
          thread_id_(std::this_thread::get_id()) {
        if constexpr (sizeof...(Args) == 0) {
            message_ = std::string(format);
        } else {
            message_ = fmt::vformat(
                fmt::string_view(format.data(), format.size()),
                fmt::make_format_args(args...));
        }
    }

    /**
     * @brief Full report: location, thread id, message and stack trace.
     */
    [[nodiscard]] auto what() const noexcept -> const char* override;

    [[nodiscard]] auto getFile() const -> std::string;
    [[nodiscard]] auto getLine() const -> int;
    [[nodiscard]] auto getFunction() const -> std::string;
    [[nodiscard]] auto getMessage() const -> std::string;
    [[nodiscard]] auto getThreadId() const -> std::thread::id;

private:
    std::string file_;
    int line_;
    std::string func_;
    std::string message_;
    mutable std::string full_message_;
    std::thread::id thread_id_;
#if OXIDE_ENABLE_STACKTRACE
#ifdef OXIDE_USE_BOOST_STACKTRACE
    boost::stacktrace::stacktrace stack_trace_;
#else
    StackTrace stack_trace_;
#endif
#endif
};

/**
 * @brief Raised when a payload is extracted from the variant that does not
 * hold it: unwrapping a Failure or an Absent, or unwrapping the error of a
 * Success.
 */
class UnwrapFailure : public Exception {
public:
    using Exception::Exception;
};

/// Message used when an unwrap failure carries no diagnostic of its own.
inline constexpr std::string_view DEFAULT_UNWRAP_MESSAGE = "Unwrap failed.";

/**
 * @brief Logs and throws an UnwrapFailure attributed to @p location.
 *
 * An empty @p message is replaced by DEFAULT_UNWRAP_MESSAGE.
 */
[[noreturn]] void throwUnwrapFailure(const std::source_location& location,
                                     std::string_view message);

}  // namespace oxide::error

#define THROW_EXCEPTION(...)                                                \
    throw oxide::error::Exception(OXIDE_FILE_NAME, OXIDE_FILE_LINE,         \
                                  OXIDE_FUNC_NAME, __VA_ARGS__)

#define THROW_UNWRAP_FAILURE(...)                                           \
    throw oxide::error::UnwrapFailure(OXIDE_FILE_NAME, OXIDE_FILE_LINE,     \
                                      OXIDE_FUNC_NAME, __VA_ARGS__)

#endif  // OXIDE_ERROR_EXCEPTION_HPP
