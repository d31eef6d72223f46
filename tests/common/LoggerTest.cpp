#include <gtest/gtest.h>
#include <routegrid/backends/SpdlogBackend.h>
#include <routegrid/common/Logger.h>
#include <routegrid/routing/RoutingMatrixCache.h>

#include <memory>
#include <vector>

using namespace routegrid;

namespace {

struct RecordedLog {
    LogLevel level;
    std::string message;
};

class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::vector<RecordedLog>& sink) : sink_(sink) {}

    void log(LogLevel level, const std::string& message,
             const std::source_location&) override {
        sink_.push_back({level, message});
    }
    void setLevel(LogLevel) override {}
    void flush() override {}

private:
    std::vector<RecordedLog>& sink_;
};

}  // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setBackend(std::make_unique<RecordingBackend>(records_));
        Logger::clearCapturedLogs();
        Logger::enableCapture(true);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
        Logger::setBackend(std::make_unique<SpdlogBackend>());
    }

    std::vector<RecordedLog> records_;
};

TEST_F(LoggerTest, InjectedBackendReceivesMessages) {
    LOG_INFO("matrix {}x{}", 3, 4);

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, LogLevel::Info);
    EXPECT_NE(records_[0].message.find("matrix 3x4"), std::string::npos);
}

TEST_F(LoggerTest, MessagesArePrefixedWithFunctionName) {
    LOG_WARN("careful");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_NE(records_[0].message.find("() - careful"), std::string::npos);
}

TEST_F(LoggerTest, CaptureFiltersByPattern) {
    LOG_DEBUG("first");
    LOG_ERROR("second");

    auto all = Logger::getCapturedLogs();
    auto errors = Logger::getCapturedLogs("[error]");

    EXPECT_EQ(all.size(), 2u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("second"), std::string::npos);
}

TEST_F(LoggerTest, CaptureMaxLinesKeepsNewest) {
    LOG_INFO("one");
    LOG_INFO("two");
    LOG_INFO("three");

    auto last = Logger::getCapturedLogs("", 1);

    ASSERT_EQ(last.size(), 1u);
    EXPECT_NE(last[0].find("three"), std::string::npos);
}

TEST_F(LoggerTest, DisabledCaptureStoresNothing) {
    Logger::enableCapture(false);
    LOG_INFO("ignored");

    EXPECT_FALSE(Logger::isCaptureEnabled());
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
    EXPECT_EQ(records_.size(), 1u);
}

TEST_F(LoggerTest, RasterizationIsLogged) {
    GeometrySnapshot snapshot;
    snapshot.viewport = {100.0f, 100.0f};
    snapshot.nodes.push_back({1, {10.0f, 10.0f, 10.0f, 10.0f}});

    RoutingMatrixCache cache(5);
    cache.routingMatrix(snapshot);

    EXPECT_FALSE(Logger::getCapturedLogs("Canvas matrix 20x20").empty());
    EXPECT_FALSE(Logger::getCapturedLogs("Rasterized 1 nodes").empty());
}
