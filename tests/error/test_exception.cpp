#include <gtest/gtest.h>

#include <string>
#include <thread>

#include "cadence/error/exception.hpp"

using namespace cadence::error;

class ExceptionTest : public ::testing::Test {};

TEST_F(ExceptionTest, MessageConcatenatesArguments) {
    try {
        THROW_RUNTIME_ERROR("job ", "alarm", " failed ", 3, " times");
        FAIL() << "Expected RuntimeError";
    } catch (const RuntimeError& e) {
        EXPECT_EQ(e.getMessage(), "job alarm failed 3 times");
    }
}

TEST_F(ExceptionTest, RecordsThrowSite) {
    try {
        THROW_INVALID_ARGUMENT("bad value");
    } catch (const InvalidArgument& e) {
        EXPECT_NE(e.getFile().find("test_exception.cpp"), std::string::npos);
        EXPECT_GT(e.getLine(), 0);
        EXPECT_EQ(e.getFunction(), "TestBody");
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
    }
}

TEST_F(ExceptionTest, WhatContainsLocationAndMessage) {
    try {
        THROW_CONFIGURATION_ERROR("tick must be positive");
    } catch (const std::exception& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("tick must be positive"), std::string::npos);
        EXPECT_NE(what.find("test_exception.cpp"), std::string::npos);
        EXPECT_NE(what.find("Thread ID"), std::string::npos);
    }
}

TEST_F(ExceptionTest, SchedulerErrorsDeriveFromException) {
    EXPECT_THROW(THROW_UNPARSABLE_SCHEDULE("x"), Exception);
    EXPECT_THROW(THROW_TRIGGER_EXHAUSTED("x"), Exception);
    EXPECT_THROW(THROW_NO_MATCH_ERROR("x"), Exception);
    EXPECT_THROW(THROW_CALLBACK_FAILURE("x"), Exception);
    EXPECT_THROW(THROW_CONFIGURATION_ERROR("x"), std::exception);
}

TEST_F(ExceptionTest, StackTraceRendersFrames) {
    StackTrace trace;
    const std::string text = trace.toString();
    EXPECT_FALSE(text.empty());
}
