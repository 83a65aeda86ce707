#include <gtest/gtest.h>
#include <scheduler/timekeeper.hpp>
#include <managers/dg4202_manager.hpp>
#include <managers/edux1002a_manager.hpp>
#include <core/log.hpp>
#include <platform/file_lock.hpp>
#include <platform/platform.hpp>
#include <limits>
#include <thread>
#include <unistd.h>
#include <mutex>
#include <vector>
#include <algorithm>
#include "test_helpers.hpp"

using namespace std::chrono_literals;

namespace {

class TimekeeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_dir(dir / "logs");
    }

    TempDir dir;
    StateStore state{dir / "state.json", 1s};
    StateStore jobs{dir / "jobs.json", 1s};
    StateStore archive{dir / "archive.json", 1s};
    FakeResourceManager rm;
    Dg4202Manager gen{state, rm, true};
    Edux1002aManager scope{state, rm, true, 64};
    TaskRegistry registry = build_default_registry();
    Worker worker{registry, Instruments{gen, scope}};
    Timekeeper tk{jobs, archive, registry, worker, 20ms};

    nlohmann::json toggle(int channel, bool status) {
        return {{"channel", channel}, {"status", status}};
    }

    // A claim written the way another scheduler would leave it.
    Job claimed_by(int pid, const std::string& task = "DG4202_TOGGLE") {
        Job job;
        job.job_id = generate_job_id(task);
        job.task = task;
        job.schedule_time = Clock::now() - std::chrono::minutes(1);
        job.kwargs = toggle(1, true);
        job.running = true;
        job.owner_pid = pid;
        job.owner_instance = 1;
        job.claimed_at = now_iso();
        jobs.write({{job.job_id, job_to_json(job)}});
        return job;
    }
};

} // namespace

TEST_F(TimekeeperTest, AddJobPersists) {
    TimePoint when = Clock::now() + 1h;
    auto r = tk.add_job("dg4202_toggle", when, toggle(1, true));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(task_from_job_id(r.value), "DG4202_TOGGLE");

    // A second handle on the same file sees the job
    StateStore reader(dir / "jobs.json", 1s);
    auto doc = reader.read();
    ASSERT_TRUE(doc.contains(r.value));
    EXPECT_EQ(doc[r.value]["task"], "DG4202_TOGGLE");
    EXPECT_EQ(doc[r.value]["kwargs"]["channel"], 1);

    auto pending = tk.get_jobs();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(to_iso_ms(pending.at(r.value).schedule_time), to_iso_ms(when));
}

TEST_F(TimekeeperTest, AddJobRejectsUnknownTask) {
    auto r = tk.add_job("DG4202_SELF_DESTRUCT", Clock::now());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Unknown task: DG4202_SELF_DESTRUCT");
    EXPECT_TRUE(tk.get_jobs().empty());
}

TEST_F(TimekeeperTest, SequenceNumbersIncrease) {
    TimePoint when = Clock::now() + 1h;
    auto a = tk.add_job("EDUX1002A_AUTO", when).value;
    auto b = tk.add_job("EDUX1002A_AUTO", when).value;
    auto c = tk.add_job("EDUX1002A_AUTO", when).value;
    auto pending = tk.get_jobs();
    EXPECT_LT(pending.at(a).seq, pending.at(b).seq);
    EXPECT_LT(pending.at(b).seq, pending.at(c).seq);
}

TEST_F(TimekeeperTest, TickFiresOnlyDueJobs) {
    TimePoint now = Clock::now();
    auto due = tk.add_job("DG4202_TOGGLE", now - 1s, toggle(1, true)).value;
    auto later = tk.add_job("DG4202_TOGGLE", now + 1h, toggle(2, true)).value;

    EXPECT_EQ(tk.tick(now), 1u);
    worker.wait_idle();

    auto pending = tk.get_jobs();
    EXPECT_EQ(pending.count(due), 0u);
    EXPECT_EQ(pending.count(later), 1u);

    auto entry = tk.archive_entry(due);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, "completed");
    EXPECT_EQ(entry->task, "DG4202_TOGGLE");
    EXPECT_EQ(entry->result, "toggle CH1 ON");
    EXPECT_EQ(entry->kwargs["channel"], 1);
    EXPECT_FALSE(entry->completion_time.empty());
    EXPECT_TRUE(gen.channel_status(1)->output_on);
    EXPECT_FALSE(gen.channel_status(2)->output_on);
}

TEST_F(TimekeeperTest, FiresExactlyOnce) {
    TimePoint now = Clock::now();
    auto id = tk.add_job("EDUX1002A_AUTO", now).value;

    EXPECT_EQ(tk.tick(now), 1u);
    EXPECT_EQ(tk.tick(now + 1s), 0u);
    worker.wait_idle();

    auto handle = scope.get_device();
    ASSERT_NE(handle, nullptr);
    auto sent = std::static_pointer_cast<SimulatedDevice>(handle)->history();
    EXPECT_EQ(std::count(sent.begin(), sent.end(), ":AUToscale"), 1);
    EXPECT_EQ(tk.archived_jobs().size(), 1u);
    EXPECT_TRUE(tk.archive_entry(id).has_value());
}

TEST_F(TimekeeperTest, TwoSchedulersShareOneQueue) {
    // A second process would see the same files through its own stores
    StateStore jobs2(dir / "jobs.json", 1s);
    StateStore archive2(dir / "archive.json", 1s);
    Worker worker2(registry, Instruments{gen, scope});
    Timekeeper tk2(jobs2, archive2, registry, worker2, 20ms);

    TimePoint now = Clock::now();
    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(tk.add_job("EDUX1002A_AUTO", now - 1s).is_ok());
    }

    size_t fired_a = 0, fired_b = 0;
    std::thread a([&]() { fired_a = tk.tick(now); });
    std::thread b([&]() { fired_b = tk2.tick(now); });
    a.join();
    b.join();
    worker.wait_idle();
    worker2.wait_idle();

    EXPECT_EQ(fired_a + fired_b, 6u);
    EXPECT_EQ(tk.archived_jobs().size(), 6u);
    EXPECT_TRUE(tk.get_jobs().empty());
}

TEST_F(TimekeeperTest, CancelPendingJob) {
    auto id = tk.add_job("EDUX1002A_AUTO", Clock::now() + 1h).value;
    EXPECT_TRUE(tk.cancel_job(id));
    EXPECT_TRUE(tk.get_jobs().empty());
    EXPECT_FALSE(tk.cancel_job(id));
}

TEST_F(TimekeeperTest, CancelAfterFireIsNoOp) {
    TimePoint now = Clock::now();
    auto id = tk.add_job("EDUX1002A_AUTO", now).value;
    tk.tick(now);
    worker.wait_idle();

    EXPECT_FALSE(tk.cancel_job(id));
    ASSERT_TRUE(tk.archive_entry(id).has_value());
    EXPECT_EQ(tk.archive_entry(id)->status, "completed");
}

TEST_F(TimekeeperTest, FailedDispatchIsArchived) {
    TimePoint now = Clock::now();
    gen.set_mock_state(true);
    auto id = tk.add_job("DG4202_TOGGLE", now, toggle(1, true)).value;
    tk.tick(now);
    worker.wait_idle();

    auto entry = tk.archive_entry(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->failed());
    EXPECT_NE(entry->result.find("DG4202"), std::string::npos);
    EXPECT_TRUE(tk.get_jobs().empty());
}

TEST_F(TimekeeperTest, InvalidArgumentsFailAtDispatch) {
    TimePoint now = Clock::now();
    auto id = tk.add_job("DG4202_TOGGLE", now, {{"channel", 9}, {"status", true}}).value;
    tk.tick(now);
    worker.wait_idle();
    auto entry = tk.archive_entry(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, "failed");
    EXPECT_NE(entry->result.find("Invalid value: channel"), std::string::npos);
}

TEST_F(TimekeeperTest, UnreadableEntriesAreDropped) {
    jobs.write({{"garbage", {{"task", 5}}}, {"also-garbage", "text"}});
    TimePoint now = Clock::now();
    auto id = tk.add_job("EDUX1002A_AUTO", now).value;

    EXPECT_EQ(tk.tick(now), 1u);
    worker.wait_idle();
    EXPECT_TRUE(jobs.read().empty());
    EXPECT_TRUE(tk.archive_entry(id).has_value());
    EXPECT_FALSE(tk.archive_entry("garbage").has_value());
}

TEST_F(TimekeeperTest, FiringOrderFollowsTimeThenInsertion) {
    TimePoint now = Clock::now();
    std::vector<std::string> order;
    std::mutex m;
    tk.set_callback([&](SchedulerEvent event, const std::string& id) {
        if (event != SchedulerEvent::Fired) return;
        std::lock_guard<std::mutex> lock(m);
        order.push_back(id);
    });

    auto late = tk.add_job("EDUX1002A_AUTO", now - 1s).value;
    auto first = tk.add_job("EDUX1002A_AUTO", now - 5s).value;
    auto second = tk.add_job("EDUX1002A_AUTO", now - 5s).value;

    EXPECT_EQ(tk.tick(now), 3u);
    worker.wait_idle();
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], first);
    EXPECT_EQ(order[1], second);
    EXPECT_EQ(order[2], late);
}

TEST_F(TimekeeperTest, SameTickJobsReachInstrumentInOrder) {
    for (int round = 0; round < 20; ++round) {
        TimePoint t0 = Clock::now();
        ASSERT_TRUE(tk.add_job("DG4202_TOGGLE", t0, toggle(1, true)).is_ok());
        ASSERT_TRUE(tk.add_job("DG4202_TOGGLE", t0 + 100ms, toggle(1, false)).is_ok());
        ASSERT_EQ(tk.tick(t0 + 200ms), 2u);
        worker.wait_idle();
        ASSERT_FALSE(gen.channel_status(1)->output_on) << "round " << round;
    }

    auto sent = std::static_pointer_cast<SimulatedDevice>(gen.get_device())->history();
    std::vector<std::string> switches;
    for (const auto& cmd : sent) {
        if (cmd == ":OUTPut1:STATe ON" || cmd == ":OUTPut1:STATe OFF") switches.push_back(cmd);
    }
    ASSERT_EQ(switches.size(), 40u);
    for (size_t i = 0; i < switches.size(); ++i) {
        EXPECT_EQ(switches[i], i % 2 == 0 ? ":OUTPut1:STATe ON" : ":OUTPut1:STATe OFF") << i;
    }
}

TEST_F(TimekeeperTest, OverdueBacklogRunsInScheduleOrder) {
    TimePoint now = Clock::now();
    // Inserted out of order; the last to fire switches the output off
    tk.add_job("DG4202_TOGGLE", now - 1s, toggle(2, false));
    tk.add_job("DG4202_TOGGLE", now - 3s, toggle(2, true));
    tk.add_job("DG4202_TOGGLE", now - 2s, toggle(2, true));
    tk.add_job("EDUX1002A_AUTO", now - 2s);

    EXPECT_EQ(tk.tick(now), 4u);
    worker.wait_idle();
    EXPECT_FALSE(gen.channel_status(2)->output_on);
    EXPECT_EQ(tk.archived_jobs().size(), 4u);
}

TEST_F(TimekeeperTest, HeldArchiveLockKeepsJobInFlight) {
    StateStore impatient(dir / "archive.json", 50ms);
    Timekeeper tk2(jobs, impatient, registry, worker, 20ms);
    std::vector<SchedulerEvent> events;
    std::mutex m;
    tk2.set_callback([&](SchedulerEvent event, const std::string&) {
        std::lock_guard<std::mutex> lock(m);
        events.push_back(event);
    });

    TimePoint now = Clock::now();
    auto id = tk2.add_job("EDUX1002A_AUTO", now).value;
    {
        FileLock held(impatient.lock_path().string(), 100ms);
        EXPECT_EQ(tk2.tick(now), 1u);
        worker.wait_idle();

        EXPECT_EQ(tk2.unarchived(), 1u);
        EXPECT_TRUE(tk2.get_jobs().empty());
        auto running = tk2.in_flight_jobs();
        ASSERT_EQ(running.count(id), 1u);
        EXPECT_EQ(running.at(id).owner_pid, platform::current_pid());
        EXPECT_FALSE(running.at(id).claimed_at.empty());
        EXPECT_FALSE(tk2.cancel_job(id));

        // Neither scheduler fires it again, and the retry waits for the lock
        EXPECT_EQ(tk.tick(now + 1s), 0u);
        EXPECT_EQ(tk2.tick(now + 1s), 0u);
        EXPECT_EQ(tk2.unarchived(), 1u);
    }

    EXPECT_EQ(tk2.tick(now + 2s), 0u);
    EXPECT_EQ(tk2.unarchived(), 0u);
    auto entry = tk2.archive_entry(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, "completed");
    EXPECT_TRUE(tk2.in_flight_jobs().empty());
    EXPECT_TRUE(jobs.read().empty());

    auto sent = std::static_pointer_cast<SimulatedDevice>(scope.get_device())->history();
    EXPECT_EQ(std::count(sent.begin(), sent.end(), ":AUToscale"), 1);
    std::vector<SchedulerEvent> expected = {
        SchedulerEvent::Added, SchedulerEvent::Fired, SchedulerEvent::Completed,
    };
    EXPECT_EQ(events, expected);
}

TEST_F(TimekeeperTest, OutcomeLostWithItsSchedulerIsRecovered) {
    StateStore impatient(dir / "archive.json", 50ms);
    TimePoint now = Clock::now();
    std::string id;
    {
        FileLock held(archive.lock_path().string(), 100ms);
        Timekeeper doomed(jobs, impatient, registry, worker, 20ms);
        id = doomed.add_job("EDUX1002A_AUTO", now).value;
        EXPECT_EQ(doomed.tick(now), 1u);
        worker.wait_idle();
    }

    ASSERT_EQ(tk.in_flight_jobs().count(id), 1u);
    EXPECT_EQ(tk.tick(now), 0u);
    auto entry = tk.archive_entry(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->failed());
    EXPECT_NE(entry->result.find("Interrupted"), std::string::npos) << entry->result;
    EXPECT_TRUE(jobs.read().empty());
}

TEST_F(TimekeeperTest, ClaimOfExitedProcessIsArchivedAsInterrupted) {
    Job job = claimed_by(std::numeric_limits<int>::max());
    EXPECT_TRUE(tk.get_jobs().empty());
    EXPECT_EQ(tk.in_flight_jobs().size(), 1u);

    EXPECT_EQ(tk.tick(), 0u);
    auto entry = tk.archive_entry(job.job_id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, "failed");
    EXPECT_NE(entry->result.find("Interrupted"), std::string::npos);
    EXPECT_EQ(entry->kwargs["channel"], 1);
    EXPECT_TRUE(jobs.read().empty());
    // Not run a second time
    EXPECT_FALSE(gen.channel_status(1)->output_on);
}

TEST_F(TimekeeperTest, ClaimAlreadyArchivedIsOnlyRemoved) {
    Job job = claimed_by(std::numeric_limits<int>::max());
    ArchiveEntry done;
    done.job_id = job.job_id;
    done.task = job.task;
    done.status = "completed";
    done.result = "toggle CH1 ON";
    archive.write({{job.job_id, archive_to_json(done)}});

    tk.tick();
    auto entry = tk.archive_entry(job.job_id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, "completed");
    EXPECT_EQ(entry->result, "toggle CH1 ON");
    EXPECT_TRUE(jobs.read().empty());
}

TEST_F(TimekeeperTest, ClaimOfLiveProcessIsLeftAlone) {
    Job job = claimed_by(static_cast<int>(getppid()));
    EXPECT_EQ(tk.tick(), 0u);
    EXPECT_EQ(tk.in_flight_jobs().count(job.job_id), 1u);
    EXPECT_FALSE(tk.archive_entry(job.job_id).has_value());
    EXPECT_FALSE(tk.cancel_job(job.job_id));
}

TEST_F(TimekeeperTest, CallbackSeesEveryEvent) {
    std::vector<SchedulerEvent> events;
    std::mutex m;
    tk.set_callback([&](SchedulerEvent event, const std::string&) {
        std::lock_guard<std::mutex> lock(m);
        events.push_back(event);
    });

    TimePoint now = Clock::now();
    auto id = tk.add_job("EDUX1002A_AUTO", now + 1h).value;
    tk.cancel_job(id);
    tk.add_job("EDUX1002A_AUTO", now);
    tk.tick(now);
    worker.wait_idle();
    tk.clear_archive();

    std::vector<SchedulerEvent> expected = {
        SchedulerEvent::Added, SchedulerEvent::Cancelled, SchedulerEvent::Added,
        SchedulerEvent::Fired, SchedulerEvent::Completed, SchedulerEvent::ArchiveCleared,
    };
    EXPECT_EQ(events, expected);
    EXPECT_TRUE(tk.archived_jobs().empty());
}

TEST_F(TimekeeperTest, ThrowingCallbackDoesNotBreakScheduling) {
    tk.set_callback([](SchedulerEvent, const std::string&) {
        throw std::runtime_error("ui went away");
    });
    auto r = tk.add_job("EDUX1002A_AUTO", Clock::now() + 1h);
    EXPECT_TRUE(r.is_ok());
    EXPECT_EQ(tk.get_jobs().size(), 1u);
}

TEST_F(TimekeeperTest, LockContentionSurfacesAsLockTimeout) {
    StateStore impatient(dir / "jobs.json", 50ms);
    Timekeeper tk2(impatient, archive, registry, worker, 20ms);
    FileLock held(impatient.lock_path().string(), 100ms);
    EXPECT_THROW(tk2.add_job("EDUX1002A_AUTO", Clock::now()), LockTimeout);
}

TEST_F(TimekeeperTest, BackgroundLoopFiresOverdueJobs) {
    // Jobs already due before start fire on the first tick
    auto overdue = tk.add_job("EDUX1002A_AUTO", Clock::now() - 1h).value;
    auto soon = tk.add_job("DG4202_TOGGLE", Clock::now() + 100ms, toggle(2, true)).value;

    tk.start();
    EXPECT_TRUE(tk.running());
    for (int i = 0; i < 200 && tk.archived_jobs().size() < 2; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    tk.stop();
    EXPECT_FALSE(tk.running());

    EXPECT_TRUE(tk.archive_entry(overdue).has_value());
    EXPECT_TRUE(tk.archive_entry(soon).has_value());
    EXPECT_TRUE(tk.get_jobs().empty());
}

TEST_F(TimekeeperTest, PendingJobsSurviveRestart) {
    TimePoint when = Clock::now() + 1h;
    std::string id;
    {
        StateStore jobs2(dir / "jobs.json", 1s);
        Timekeeper first(jobs2, archive, registry, worker, 20ms);
        id = first.add_job("EDUX1002A_AUTO", when).value;
    }
    auto pending = tk.get_jobs();
    ASSERT_EQ(pending.count(id), 1u);
    EXPECT_EQ(pending.at(id).task, "EDUX1002A_AUTO");
}

TEST(JobRecord, JobIdFormat) {
    std::string id = generate_job_id("DG4202_TOGGLE");
    // 2026-02-15T14-44-10-637__DG4202_TOGGLE__3f2a
    ASSERT_EQ(id.size(), 23u + 2 + 13 + 2 + 4);
    EXPECT_EQ(id[10], 'T');
    EXPECT_EQ(id.substr(23, 17), "__DG4202_TOGGLE__");
    EXPECT_EQ(task_from_job_id(id), "DG4202_TOGGLE");
    EXPECT_NE(generate_job_id("X"), generate_job_id("X"));
}

TEST(JobRecord, TiesBreakBySequence) {
    Job a, b;
    a.schedule_time = b.schedule_time = Clock::now();
    a.seq = 1;
    b.seq = 2;
    EXPECT_TRUE(fires_before(a, b));
    EXPECT_FALSE(fires_before(b, a));
    b.schedule_time -= 1s;
    EXPECT_TRUE(fires_before(b, a));
}

TEST(JobRecord, RejectsMalformedJson) {
    Job out;
    EXPECT_FALSE(job_from_json("x", "text", out));
    EXPECT_FALSE(job_from_json("x", {{"task", "T"}}, out));
    EXPECT_FALSE(job_from_json("x", {{"task", "T"}, {"schedule_time", "soon"}}, out));
    EXPECT_TRUE(job_from_json("x", {{"task", "T"}, {"schedule_time", "2026-01-01T00:00:00.000"}}, out));
    EXPECT_EQ(out.task, "T");
    EXPECT_TRUE(out.kwargs.empty());
    EXPECT_FALSE(out.running);
}

TEST(JobRecord, ClaimFieldsPersist) {
    Job job;
    job.job_id = "x";
    job.task = "EDUX1002A_AUTO";
    job.schedule_time = Clock::now();
    EXPECT_EQ(job_to_json(job)["state"], "pending");
    EXPECT_FALSE(job_to_json(job).contains("owner_pid"));

    job.running = true;
    job.owner_pid = 4242;
    job.owner_instance = 7;
    job.claimed_at = "2026-01-01T00:00:00.000";
    Job back;
    ASSERT_TRUE(job_from_json("x", job_to_json(job), back));
    EXPECT_TRUE(back.running);
    EXPECT_EQ(back.owner_pid, 4242);
    EXPECT_EQ(back.owner_instance, 7u);
    EXPECT_EQ(back.claimed_at, "2026-01-01T00:00:00.000");
}
