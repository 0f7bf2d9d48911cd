// VirtGate Unit Tests - per-request handle release
// Tests: track, drain, ordering, failure isolation, misuse

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "TestSupport.hpp"
#include "Virtualization/vmm/ResourceTracker.hpp"

namespace {

// Records each release attempt; optionally reports failure.
class FakeHandle : public IReleasable {
public:
    FakeHandle(std::string label, std::vector<std::string>& journal, bool failRelease = false)
        : label(std::move(label)), journal(journal), failRelease(failRelease) {}

    bool release() noexcept override {
        ++releaseCalls;
        journal.push_back(label);
        return !failRelease;
    }

    std::string describe() const override { return "fake '" + label + "'"; }

    int releaseCalls{0};

private:
    std::string label;
    std::vector<std::string>& journal;
    bool failRelease;
};

} // namespace

class ResourceTrackerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHandle> make(const std::string& label, bool fail = false) {
        return std::make_shared<FakeHandle>(label, journal, fail);
    }

    std::vector<std::string> journal;
};

// ============================================================
// Release semantics
// ============================================================

TEST_F(ResourceTrackerTest, ReleasesInRegistrationOrder) {
    ResourceTracker tracker;
    EXPECT_TRUE(tracker.track(make("a")));
    EXPECT_TRUE(tracker.track(make("b")));
    EXPECT_TRUE(tracker.track(make("c")));
    EXPECT_EQ(tracker.pending(), 3u);

    auto stats = tracker.drain();
    EXPECT_EQ(journal, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(stats.registered, 3u);
    EXPECT_EQ(stats.released, 3u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(tracker.pending(), 0u);
    EXPECT_TRUE(tracker.isDrained());
}

TEST_F(ResourceTrackerTest, EachHandleReleasedExactlyOnce) {
    auto a = make("a");
    auto b = make("b");
    {
        ResourceTracker tracker;
        tracker.track(a);
        tracker.track(b);
        tracker.drain();
        tracker.drain();
    }
    EXPECT_EQ(a->releaseCalls, 1);
    EXPECT_EQ(b->releaseCalls, 1);
}

TEST_F(ResourceTrackerTest, DuplicateRegistrationIgnored) {
    ResourceTracker tracker;
    auto a = make("a");
    EXPECT_TRUE(tracker.track(a));
    EXPECT_FALSE(tracker.track(a));
    auto stats = tracker.drain();
    EXPECT_EQ(stats.registered, 1u);
    EXPECT_EQ(a->releaseCalls, 1);
}

TEST_F(ResourceTrackerTest, FailedReleaseDoesNotStopOthers) {
    ResourceTracker tracker;
    auto a = make("a");
    auto bad = make("bad", true);
    auto c = make("c");
    tracker.track(a);
    tracker.track(bad);
    tracker.track(c);

    auto stats = tracker.drain();
    EXPECT_EQ(journal, (std::vector<std::string>{"a", "bad", "c"}));
    EXPECT_EQ(stats.registered, 3u);
    EXPECT_EQ(stats.released, 3u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(c->releaseCalls, 1);
}

TEST_F(ResourceTrackerTest, DestructorDrains) {
    auto a = make("a");
    {
        ResourceTracker tracker;
        tracker.track(a);
    }
    EXPECT_EQ(a->releaseCalls, 1);
}

TEST_F(ResourceTrackerTest, EmptyDrain) {
    ResourceTracker tracker;
    auto stats = tracker.drain();
    EXPECT_EQ(stats.registered, 0u);
    EXPECT_EQ(stats.released, 0u);
}

// ============================================================
// Misuse
// ============================================================

TEST_F(ResourceTrackerTest, TrackAfterDrainIsLogicError) {
    ResourceTracker tracker;
    tracker.drain();
    auto late = make("late");
    EXPECT_THROW(tracker.track(late), std::logic_error);
    EXPECT_EQ(late->releaseCalls, 0);
}

TEST_F(ResourceTrackerTest, NullHandleRejected) {
    ResourceTracker tracker;
    EXPECT_THROW(tracker.track(nullptr), std::invalid_argument);
}

TEST_F(ResourceTrackerTest, SecondDrainReturnsSameStats) {
    ResourceTracker tracker;
    tracker.track(make("a", true));
    auto first = tracker.drain();
    auto second = tracker.drain();
    EXPECT_EQ(first.registered, second.registered);
    EXPECT_EQ(first.released, second.released);
    EXPECT_EQ(first.failed, second.failed);
    EXPECT_EQ(journal.size(), 1u);
}
