/*
 * exception.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: Better Exception Library

**************************************************/

#include "exception.hpp"

#include <sstream>

#include "oxide/log/logging.hpp"

namespace oxide::error {

auto Exception::what() const noexcept -> const char* {
    if (full_message_.empty()) {
        std::ostringstream oss;
        oss << "Exception occurred:\n";
        oss << "  File: " << file_ << "\n";
        oss << "  Line: " << line_ << "\n";
        oss << "  Function: " << func_ << "()\n";
        oss << "  Thread ID: " << thread_id_ << "\n";
        oss << "  Message: " << message_ << "\n";
#if !OXIDE_ENABLE_STACKTRACE
        oss << "  Stack trace: <disabled>\n";
#elif defined(OXIDE_USE_BOOST_STACKTRACE)
        oss << "  Stack trace:\n" << boost::stacktrace::to_string(stack_trace_);
#else
        oss << "  " << stack_trace_.toString();
#endif
        full_message_ = oss.str();
    }
    return full_message_.c_str();
}

auto Exception::getFile() const -> std::string { return file_; }
auto Exception::getLine() const -> int { return line_; }
auto Exception::getFunction() const -> std::string { return func_; }
auto Exception::getMessage() const -> std::string { return message_; }
auto Exception::getThreadId() const -> std::thread::id { return thread_id_; }

void throwUnwrapFailure(const std::source_location& location,
                        std::string_view message) {
    if (message.empty()) {
        message = DEFAULT_UNWRAP_MESSAGE;
    }
#if OXIDE_LOG_UNWRAP_FAILURES
    log::getLogger()->debug("Unwrap failure at {}:{} in {}: {}",
                            location.file_name(), location.line(),
                            location.function_name(), message);
#endif
    throw UnwrapFailure(location.file_name(), static_cast<int>(location.line()),
                        location.function_name(), message);
}

}  // namespace oxide::error
