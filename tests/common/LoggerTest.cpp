#include <gtest/gtest.h>
#include <starmap/common/Logger.h>

#include <memory>
#include <utility>
#include <vector>

using namespace starmap;

namespace {

class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::vector<std::pair<LogLevel, std::string>>& sink) : sink_(sink) {}

    void log(LogLevel level, const std::string& message, const std::source_location&) override {
        if (level >= minLevel_) {
            sink_.emplace_back(level, message);
        }
    }
    void setLevel(LogLevel level) override { minLevel_ = level; }
    void flush() override {}

private:
    std::vector<std::pair<LogLevel, std::string>>& sink_;
    LogLevel minLevel_ = LogLevel::Trace;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setBackend(std::make_unique<RecordingBackend>(records_));
        Logger::enableCapture(true);
        Logger::clearCapturedLogs();
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
        Logger::setBackend(nullptr);
    }

    std::vector<std::pair<LogLevel, std::string>> records_;
};

TEST_F(LoggerTest, InjectedBackendReceivesMessages) {
    LOG_INFO("Loaded {} routes", 3);
    LOG_WARN("Route {} skipped", "R1");

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0].first, LogLevel::Info);
    EXPECT_NE(records_[0].second.find("Loaded 3 routes"), std::string::npos);
    EXPECT_EQ(records_[1].first, LogLevel::Warn);
}

TEST_F(LoggerTest, BackendLevelFilters) {
    Logger::setLevel(LogLevel::Warn);

    LOG_DEBUG("hidden");
    LOG_ERROR("shown");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_NE(records_[0].second.find("shown"), std::string::npos);
}

TEST_F(LoggerTest, CaptureTagsLevelAndFiltersByPattern) {
    Logger::setLevel(LogLevel::Error);

    LOG_DEBUG("first route");
    LOG_WARN("second route");
    LOG_INFO("unrelated");

    auto lines = Logger::getCapturedLogs("route");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].rfind("[debug] ", 0), 0u);
    EXPECT_EQ(lines[1].rfind("[warn] ", 0), 0u);

    auto last = Logger::getCapturedLogs("", 1);
    ASSERT_EQ(last.size(), 1u);
    EXPECT_NE(last[0].find("unrelated"), std::string::npos);
}

TEST_F(LoggerTest, CaptureDisabledRecordsNothing) {
    Logger::enableCapture(false);

    LOG_WARN("not captured");

    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}
