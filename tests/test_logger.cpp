// VirtGate Unit Tests - logging with a sink that cannot write
// Tests: log calls and noexcept release paths survive an unusable log file

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "Utils/Logger.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/vmm/ResourceTracker.hpp"

namespace {

// The parent "directory" is a regular file, so the sink can never create it.
class BrokenFileSink : public ::testing::Environment {
public:
    void SetUp() override {
        BoostLogger::Config cfg;
        cfg.enable_console = false;
        cfg.enable_file = true;
        cfg.file_level = BoostLogger::Level::Trace;
        cfg.file_path = "/etc/passwd/virtgate/virtgate.log";
        BoostLogger::Init(cfg);
    }
};

::testing::Environment* const kBrokenFileSink = ::testing::AddGlobalTestEnvironment(new BrokenFileSink);

class CountingHandle : public IReleasable {
public:
    explicit CountingHandle(bool ok) : ok(ok) {}
    bool release() noexcept override { ++calls; return ok; }
    std::string describe() const override { return "counting handle"; }
    int calls{0};

private:
    bool ok;
};

} // namespace

// ============================================================
// LoggerSinkFailureTest
// ============================================================

TEST(LoggerSinkFailureTest, LogCallsDoNotThrow) {
    EXPECT_NO_THROW(BoostLogger::Trace("trace record"));
    EXPECT_NO_THROW(BoostLogger::Debug("debug {}", 1));
    EXPECT_NO_THROW(BoostLogger::Info("info {}", "record"));
    EXPECT_NO_THROW(BoostLogger::Warn("warn record"));
    EXPECT_NO_THROW(BoostLogger::Error("error {}", 2));
    EXPECT_NO_THROW(BoostLogger::Critical("critical record"));
}

TEST(LoggerSinkFailureTest, TrackerDrainsDespiteSinkFailure) {
    auto good = std::make_shared<CountingHandle>(true);
    auto bad = std::make_shared<CountingHandle>(false);

    ResourceTracker tracker;
    tracker.track(good);
    tracker.track(bad);
    auto stats = tracker.drain();

    EXPECT_EQ(stats.registered, 2u);
    EXPECT_EQ(stats.released, 2u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(good->calls, 1);
    EXPECT_EQ(bad->calls, 1);
}

TEST(LoggerSinkFailureTest, ConnectorReleasesDespiteSinkFailure) {
    HypervisorConnector connector("test:///default");
    connector.acquire();
    ASSERT_TRUE(connector.isConnected());
    connector.release();
    EXPECT_FALSE(connector.isConnected());
}
