#include <gtest/gtest.h>
#include "job/Manager.hpp"
#include "test_utils.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace cs;
using namespace cs::job;
using namespace std::chrono_literals;
using json = nlohmann::json;

class JobManagerTest : public ::testing::Test {
protected:
    test::TempDir dir;
    std::unique_ptr<Manager> manager = std::make_unique<Manager>(dir / "jobs", dir / "locks");

    std::mutex eventsMutex;
    std::vector<std::string> events;

    void record(const std::string& e) {
        std::scoped_lock lock(eventsMutex);
        events.push_back(e);
    }

    static bool waitForState(const Job& job, const State s) {
        for (int i = 0; i < 200; ++i) {
            if (job.state() == s) return true;
            std::this_thread::sleep_for(10ms);
        }
        return false;
    }
};

TEST_F(JobManagerTest, SameKeyRunsOneAtATime) {
    std::promise<void> releaseA;
    auto gateA = releaseA.get_future().share();

    const auto a = manager->submit("cloudsync.sync", "cloud_sync:1", [&, gateA](Job&) {
        record("A start");
        gateA.wait();
        record("A end");
        return json(true);
    });
    ASSERT_TRUE(waitForState(*a, State::Running));

    const auto b = manager->submit("cloudsync.sync", "cloud_sync:1", [&](Job&) {
        record("B start");
        return json(true);
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(b->state(), State::Waiting);

    releaseA.set_value();
    EXPECT_EQ(a->wait(), State::Success);
    EXPECT_EQ(b->wait(), State::Success);

    const std::vector<std::string> expected = {"A start", "A end", "B start"};
    EXPECT_EQ(events, expected);
}

TEST_F(JobManagerTest, ThirdRequestCoalescesIntoWaitingJob) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<int> runs{0};

    const auto fn = [&, gate](Job&) {
        ++runs;
        gate.wait();
        return json(nullptr);
    };

    const auto a = manager->submit("m", "cloud_sync:7", fn);
    ASSERT_TRUE(waitForState(*a, State::Running));
    const auto b = manager->submit("m", "cloud_sync:7", fn);
    const auto c = manager->submit("m", "cloud_sync:7", fn);

    EXPECT_NE(a->id(), b->id());
    EXPECT_EQ(b.get(), c.get());

    release.set_value();
    a->wait();
    b->wait();
    EXPECT_EQ(runs.load(), 2);
}

TEST_F(JobManagerTest, DifferentKeysRunConcurrently) {
    std::promise<void> release;
    auto gate = release.get_future().share();

    const auto fn = [gate](Job&) {
        gate.wait();
        return json(true);
    };

    const auto a = manager->submit("m", "cloud_sync:1", fn);
    const auto b = manager->submit("m", "cloud_sync:2", fn);

    EXPECT_TRUE(waitForState(*a, State::Running));
    EXPECT_TRUE(waitForState(*b, State::Running));

    release.set_value();
    EXPECT_EQ(a->wait(), State::Success);
    EXPECT_EQ(b->wait(), State::Success);
}

TEST_F(JobManagerTest, FailureAndAbortAreTerminalStates) {
    const auto failing = manager->submit("m", "k1", [](Job&) -> json { throw std::runtime_error("boom"); });
    EXPECT_EQ(failing->wait(), State::Failed);
    EXPECT_EQ(failing->error(), "boom");

    const auto abortable = manager->submit("m", "k2", [](Job& job) -> json {
        while (!job.abortRequested()) std::this_thread::sleep_for(5ms);
        throw std::runtime_error("Aborted");
    });
    ASSERT_TRUE(waitForState(*abortable, State::Running));
    abortable->abort();
    EXPECT_EQ(abortable->wait(), State::Aborted);
}

TEST_F(JobManagerTest, LockIsReleasedAfterFailure) {
    const auto first = manager->submit("m", "k", [](Job&) -> json { throw std::runtime_error("x"); });
    first->wait();

    const auto second = manager->submit("m", "k", [](Job&) { return json(1); });
    EXPECT_EQ(second->wait(), State::Success);
    EXPECT_EQ(second->result(), 1);
}

TEST_F(JobManagerTest, ProgressAndLogs) {
    std::vector<std::string> seen;
    const auto job = manager->submit("m", "k", [](Job& j) {
        j.appendLog("line one");
        j.appendLog("line two");
        j.setProgress(std::nullopt, "1 MiB / 2 MiB");
        return json(true);
    });
    job->wait();

    EXPECT_EQ(job->progress().description, "1 MiB / 2 MiB");
    EXPECT_FALSE(job->progress().percent.has_value());
    EXPECT_EQ(job->logTail().size(), 2u);
    EXPECT_EQ(test::readFile(job->logPath()), "line one\nline two\n");
    EXPECT_EQ(job->toJson()["state"], "SUCCESS");
}

// Separate Managers stand in for separate cloudsyncctl processes: they share
// nothing but the lock directory.
TEST_F(JobManagerTest, SeparateManagersSerializeTheSameKey) {
    Manager second(dir / "jobs", dir / "locks");
    Manager third(dir / "jobs", dir / "locks");

    std::promise<void> releaseA;
    auto gateA = releaseA.get_future().share();

    const auto a = manager->submit("cloudsync.sync", "cloud_sync:5", [&, gateA](Job&) {
        record("A start");
        gateA.wait();
        record("A end");
        return json(true);
    });
    ASSERT_TRUE(waitForState(*a, State::Running));

    const auto b = second.submit("cloudsync.sync", "cloud_sync:5", [&](Job&) {
        record("B start");
        return json(true);
    });
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(b->state(), State::Waiting);

    std::atomic<bool> thirdRan{false};
    const auto c = third.submit("cloudsync.sync", "cloud_sync:5", [&](Job&) {
        thirdRan = true;
        return json(true);
    });
    EXPECT_EQ(c->wait(), State::Success);
    EXPECT_EQ(c->result(), Manager::ALREADY_QUEUED);
    EXPECT_FALSE(thirdRan.load());

    releaseA.set_value();
    EXPECT_EQ(a->wait(), State::Success);
    EXPECT_EQ(b->wait(), State::Success);

    const std::vector<std::string> expected = {"A start", "A end", "B start"};
    std::scoped_lock lock(eventsMutex);
    EXPECT_EQ(events, expected);
}

TEST_F(JobManagerTest, AbortingACrossProcessWaiterFreesTheQueueSlot) {
    Manager second(dir / "jobs", dir / "locks");
    Manager third(dir / "jobs", dir / "locks");

    std::promise<void> release;
    auto gate = release.get_future().share();

    const auto a = manager->submit("m", "cloud_sync:6", [gate](Job&) {
        gate.wait();
        return json(true);
    });
    ASSERT_TRUE(waitForState(*a, State::Running));

    const auto b = second.submit("m", "cloud_sync:6", [](Job&) { return json(true); });
    std::this_thread::sleep_for(300ms);
    b->abort();
    EXPECT_EQ(b->wait(), State::Aborted);

    const auto c = third.submit("m", "cloud_sync:6", [](Job&) { return json("ran"); });
    std::this_thread::sleep_for(300ms);
    EXPECT_EQ(c->state(), State::Waiting);

    release.set_value();
    EXPECT_EQ(a->wait(), State::Success);
    EXPECT_EQ(c->wait(), State::Success);
    EXPECT_EQ(c->result(), "ran");
}

TEST_F(JobManagerTest, LogFilesAreDistinctAcrossManagers) {
    Manager other(dir / "jobs", dir / "locks");

    const auto mine = manager->submit("m", "cloud_sync:1", [](Job& j) {
        j.appendLog("from the first");
        return json(true);
    });
    const auto theirs = other.submit("m", "cloud_sync:2", [](Job& j) {
        j.appendLog("from the second");
        return json(true);
    });
    mine->wait();
    theirs->wait();

    EXPECT_EQ(mine->id(), theirs->id());
    EXPECT_NE(mine->logPath(), theirs->logPath());
    EXPECT_EQ(mine->logPath().parent_path(), dir / "jobs");
    EXPECT_EQ(test::readFile(mine->logPath()), "from the first\n");
    EXPECT_EQ(test::readFile(theirs->logPath()), "from the second\n");
}

TEST(JobTest, LogFileStartsEmptyEvenIfThePathExists) {
    test::TempDir dir;
    const auto path = dir / "stale.log";
    test::writeFile(path, "left over from an earlier run\n");

    Job job(1, "m", "k", path);
    job.appendLog("fresh");
    EXPECT_EQ(test::readFile(path), "fresh\n");
}
