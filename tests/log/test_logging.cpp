#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "oxide/log/logging.hpp"
#include "oxide/type/result.hpp"

using namespace oxide;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger_ = log::getLogger();
        sink_ = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_);
        sink_->set_pattern("%l|%v");
        logger_->sinks().push_back(sink_);
        previousLevel_ = logger_->level();
    }

    void TearDown() override {
        auto& sinks = logger_->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_),
                    sinks.end());
        logger_->set_level(previousLevel_);
    }

    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    spdlog::level::level_enum previousLevel_{spdlog::level::info};
};

TEST_F(LoggingTest, LoggerIsRegisteredOnce) {
    EXPECT_EQ(log::getLogger(), logger_);
    EXPECT_EQ(spdlog::get(std::string(log::LOGGER_NAME)), logger_);
    EXPECT_EQ(logger_->name(), log::LOGGER_NAME);
}

TEST_F(LoggingTest, SetLevelAffectsLibraryLogger) {
    log::setLevel(spdlog::level::warn);
    EXPECT_EQ(logger_->level(), spdlog::level::warn);

    logger_->info("hidden");
    logger_->warn("shown");
    EXPECT_EQ(stream_.str().find("hidden"), std::string::npos);
    EXPECT_NE(stream_.str().find("shown"), std::string::npos);
}

TEST_F(LoggingTest, InitLoggingKeepsLogger) {
    log::initLogging();
    EXPECT_EQ(log::getLogger(), logger_);
}

#if OXIDE_LOG_UNWRAP_FAILURES
TEST_F(LoggingTest, UnwrapFailureIsLoggedAtDebug) {
    log::setLevel(spdlog::level::debug);

    type::Result<int> failed = type::failure("disk full");
    EXPECT_THROW(static_cast<void>(failed.unwrap()), error::UnwrapFailure);

    const std::string output = stream_.str();
    EXPECT_NE(output.find("debug|"), std::string::npos);
    EXPECT_NE(output.find("disk full"), std::string::npos);
}
#endif
