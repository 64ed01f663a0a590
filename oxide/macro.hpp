/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-10-19

Description: Source position helpers and compile-time switches for oxide

**************************************************/

#ifndef OXIDE_MACRO_HPP
#define OXIDE_MACRO_HPP

#define OXIDE_FILE_NAME __FILE__
#define OXIDE_FILE_LINE __LINE__

#if defined(__GNUC__) || defined(__clang__)
#define OXIDE_FUNC_NAME __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
#define OXIDE_FUNC_NAME __FUNCSIG__
#else
#define OXIDE_FUNC_NAME __func__
#endif

// Capture a stack trace in every oxide::error::Exception.
#ifndef OXIDE_ENABLE_STACKTRACE
#define OXIDE_ENABLE_STACKTRACE 1
#endif

// Log unwrap failures through the "oxide" logger before throwing.
#ifndef OXIDE_LOG_UNWRAP_FAILURES
#define OXIDE_LOG_UNWRAP_FAILURES 1
#endif

#endif  // OXIDE_MACRO_HPP
