#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <source_location>
#include <string>
#include <thread>

#include "oxide/error/exception.hpp"
#include "oxide/error/stacktrace.hpp"

using namespace oxide::error;
using ::testing::HasSubstr;

class ExceptionTest : public ::testing::Test {};

TEST_F(ExceptionTest, ThrowMacroRecordsLocation) {
    try {
        THROW_EXCEPTION("plain message");
    } catch (const Exception& e) {
        EXPECT_EQ(e.getMessage(), "plain message");
        EXPECT_THAT(e.getFile(), HasSubstr("test_exception.cpp"));
        EXPECT_GT(e.getLine(), 0);
        EXPECT_THAT(e.getFunction(), HasSubstr("ThrowMacroRecordsLocation"));
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
    }
}

TEST_F(ExceptionTest, FormatsArguments) {
    try {
        THROW_EXCEPTION("value {} out of range [{}, {}]", 12, 0, 10);
    } catch (const Exception& e) {
        EXPECT_EQ(e.getMessage(), "value 12 out of range [0, 10]");
    }
}

TEST_F(ExceptionTest, MessageWithoutArgumentsIsVerbatim) {
    try {
        THROW_EXCEPTION("braces {} stay as written");
    } catch (const Exception& e) {
        EXPECT_EQ(e.getMessage(), "braces {} stay as written");
    }
}

TEST_F(ExceptionTest, WhatContainsFullReport) {
    try {
        THROW_UNWRAP_FAILURE("report me");
    } catch (const std::exception& e) {
        std::string report = e.what();
        EXPECT_THAT(report, HasSubstr("File:"));
        EXPECT_THAT(report, HasSubstr("Line:"));
        EXPECT_THAT(report, HasSubstr("Function:"));
        EXPECT_THAT(report, HasSubstr("Thread ID:"));
        EXPECT_THAT(report, HasSubstr("Message: report me"));
        EXPECT_THAT(report, HasSubstr("Stack trace"));
    }
}

TEST_F(ExceptionTest, UnwrapFailureIsAnException) {
    EXPECT_THROW(THROW_UNWRAP_FAILURE("failed"), Exception);
    EXPECT_THROW(THROW_UNWRAP_FAILURE("failed"), UnwrapFailure);
}

TEST_F(ExceptionTest, ThrowUnwrapFailureUsesCallerLocation) {
    const auto location = std::source_location::current();
    try {
        throwUnwrapFailure(location, "from helper");
    } catch (const UnwrapFailure& e) {
        EXPECT_EQ(e.getMessage(), "from helper");
        EXPECT_EQ(e.getLine(), static_cast<int>(location.line()));
        EXPECT_EQ(e.getFile(), location.file_name());
    }
}

TEST_F(ExceptionTest, ThrowUnwrapFailureDefaultMessage) {
    try {
        throwUnwrapFailure(std::source_location::current(), "");
    } catch (const UnwrapFailure& e) {
        EXPECT_EQ(e.getMessage(), std::string(DEFAULT_UNWRAP_MESSAGE));
    }
}

TEST_F(ExceptionTest, CopiedExceptionKeepsReport) {
    try {
        THROW_UNWRAP_FAILURE("copy me");
    } catch (const UnwrapFailure& e) {
        UnwrapFailure copy = e;
        EXPECT_EQ(copy.getMessage(), "copy me");
        EXPECT_STREQ(copy.what(), e.what());
    }
}

#if !defined(OXIDE_USE_BOOST_STACKTRACE)
TEST(StackTraceTest, CapturesFrames) {
    StackTrace trace;
    EXPECT_GT(trace.size(), 0U);
    EXPECT_THAT(trace.toString(), HasSubstr("Stack trace:"));
}
#endif
