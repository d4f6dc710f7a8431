#include <gtest/gtest.h>
#include "core/policy_store.hpp"
#include "daemon/supervisor.hpp"
#include "fakes.hpp"

#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

class SupervisorTest : public ::testing::Test {
protected:
    fs::path dir;
    std::unique_ptr<PolicyStore> store;
    FakeRegistry registry;
    FakeControl control{&registry};
    FakeQueueProbe probe;
    ManualClock clock;
    std::unique_ptr<Supervisor> supervisor;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("svcguard-test-supervisor-" + std::to_string(getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
        store = std::make_unique<PolicyStore>((dir / "auto_restart.json").string());
        make_supervisor();
    }

    void TearDown() override {
        supervisor.reset();
        fs::remove_all(dir);
    }

    void make_supervisor() {
        supervisor.reset();
        supervisor = std::make_unique<Supervisor>(*store, registry, control, probe, clock, options());
    }

    static Supervisor::Options options() {
        Supervisor::Options opts;
        opts.check_interval = std::chrono::milliseconds(20);
        opts.error_retry_interval = std::chrono::milliseconds(20);
        opts.restart.restart_delay = std::chrono::seconds(120);
        opts.restart.queue_restart_delay = std::chrono::seconds(60);
        opts.restart.poll_interval = std::chrono::milliseconds(5);
        return opts;
    }

    static AutoRestartPolicy policy(bool enabled = true, double cpu = 80.0, double mem_mb = 1000.0) {
        AutoRestartPolicy p;
        p.enabled = enabled;
        p.cpu_threshold_percent = cpu;
        p.memory_threshold_bytes = mb_to_bytes(mem_mb);
        return p;
    }

    bool wait_phase(const std::string& name, RestartPhase phase) {
        return wait_until([&] { return supervisor->phase(name) == phase; });
    }

    void touch(const fs::path& p) {
        fs::create_directories(p.parent_path());
        std::ofstream(p) << "PK";
    }
};

// ── Restart cycle end to end ────────────────────────────────

TEST_F(SupervisorTest, CpuBreachRestartsAfterDelay) {
    registry.set({make_record(4321, "/srv/billing/billing.jar", 95.0, 400.0)});
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", policy()).success);

    auto accepted = supervisor->run_pass();
    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_EQ(accepted[0].pid, 4321);
    EXPECT_TRUE(has_reason(accepted[0].reason, BreachReason::Cpu));

    ASSERT_TRUE(wait_phase("billing", RestartPhase::Delaying));
    EXPECT_EQ(control.stops(), std::vector<pid_t>{4321});

    // A pass during the delay neither re-triggers nor drops the cycle
    EXPECT_TRUE(supervisor->run_pass().empty());
    EXPECT_EQ(supervisor->phase("billing"), RestartPhase::Delaying);

    clock.advance(std::chrono::seconds(119));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_TRUE(control.launches().empty());

    clock.advance(std::chrono::seconds(2));
    ASSERT_TRUE(wait_until([&] { return control.launches().size() == 1; }));
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Idle));
    EXPECT_EQ(control.launches()[0].artifact_path, "/srv/billing/billing.jar");

    auto services = supervisor->list_services();
    ASSERT_EQ(services.size(), 1u);
    EXPECT_EQ(services[0].record.pid, 5000);
    EXPECT_TRUE(services[0].has_policy);
    EXPECT_TRUE(services[0].policy.enabled);
    EXPECT_FALSE(services[0].restarting);
    EXPECT_TRUE(services[0].last_error.empty());
}

TEST_F(SupervisorTest, PolicyFollowsServiceAcrossPids) {
    registry.set({make_record(4321, "/srv/billing/billing.jar", 95.0)});
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", policy(true, 70.0)).success);
    ASSERT_EQ(supervisor->run_pass().size(), 1u);
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Delaying));
    clock.advance(std::chrono::seconds(121));
    ASSERT_TRUE(wait_until([&] { return control.launches().size() == 1; }));
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Idle));

    auto by_pid = supervisor->get_auto_restart_config("5000");
    EXPECT_EQ(by_pid.logical_name, "billing");
    EXPECT_TRUE(by_pid.enabled);
    EXPECT_DOUBLE_EQ(by_pid.cpu_threshold_percent, 70.0);

    // The new process breaches too: a second cycle starts against it
    registry.set({make_record(5000, "/srv/billing/billing.jar", 99.0)});
    auto accepted = supervisor->run_pass();
    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_EQ(accepted[0].pid, 5000);
}

TEST_F(SupervisorTest, DisablingDuringDelayLetsCycleFinish) {
    registry.set({make_record(4321, "/srv/billing/billing.jar", 95.0)});
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", policy()).success);
    ASSERT_EQ(supervisor->run_pass().size(), 1u);
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Delaying));

    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", policy(false)).success);
    clock.advance(std::chrono::seconds(121));
    ASSERT_TRUE(wait_until([&] { return control.launches().size() == 1; }));
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Idle));

    registry.set({make_record(5000, "/srv/billing/billing.jar", 99.0)});
    EXPECT_TRUE(supervisor->run_pass().empty());
}

TEST_F(SupervisorTest, QueueBreachUsesShortDelay) {
    registry.set({make_record(10, "/srv/billing/billing.jar")});
    auto p = policy();
    p.queue_threshold_count = 1000;
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", p).success);
    probe.set("billing", 5000);

    auto accepted = supervisor->run_pass();
    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_EQ(accepted[0].reason, BreachReason::Queue);

    ASSERT_TRUE(wait_phase("billing", RestartPhase::Delaying));
    clock.advance(std::chrono::seconds(61));
    ASSERT_TRUE(wait_until([&] { return control.launches().size() == 1; }));
}

TEST_F(SupervisorTest, ServicesWithoutPolicyAreNeverRestarted) {
    registry.set({make_record(10, "/srv/billing/billing.jar", 99.0, 9000.0)});
    EXPECT_TRUE(supervisor->run_pass().empty());

    auto services = supervisor->list_services();
    ASSERT_EQ(services.size(), 1u);
    EXPECT_FALSE(services[0].has_policy);
    EXPECT_FALSE(services[0].policy.enabled);
    EXPECT_DOUBLE_EQ(services[0].policy.cpu_threshold_percent, 80.0);
}

TEST_F(SupervisorTest, LaunchFailureIsRecordedAsLastError) {
    registry.set({make_record(10, "/srv/billing/billing.jar", 95.0)});
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", policy()).success);
    control.fail_launch(LaunchError::Kind::ArtifactNotFound);

    ASSERT_EQ(supervisor->run_pass().size(), 1u);
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Delaying));
    clock.advance(std::chrono::seconds(121));
    ASSERT_TRUE(wait_until([&] { return !supervisor->last_error("billing").empty(); }));
    EXPECT_EQ(supervisor->last_error("Billing").rfind("RestartFailed", 0), 0u);
    EXPECT_EQ(supervisor->phase("billing"), RestartPhase::Idle);
}

TEST_F(SupervisorTest, BackgroundTaskRunsPasses) {
    supervisor->start();
    ASSERT_TRUE(wait_until([&] { return registry.discover_calls() >= 3; }));
    supervisor->stop();
    int calls = registry.discover_calls();
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(registry.discover_calls(), calls);
}

// ── Auto-restart configuration ──────────────────────────────

TEST_F(SupervisorTest, ValidationErrors) {
    auto cpu = supervisor->set_auto_restart_config("billing", policy(true, 0.5));
    EXPECT_FALSE(cpu.success);
    EXPECT_EQ(cpu.error, "CPU threshold must be between 1 and 100");

    auto mem = supervisor->set_auto_restart_config("billing", policy(true, 80.0, 20000.0));
    EXPECT_FALSE(mem.success);
    EXPECT_EQ(mem.error, "Memory threshold must be between 1 MB and 10240 MB (10 GB)");

    auto q = policy();
    q.queue_threshold_count = 0;
    auto queue = supervisor->set_auto_restart_config("billing", q);
    EXPECT_FALSE(queue.success);
    EXPECT_EQ(queue.error, "Queue threshold must be between 1 and 1000000 messages");

    EXPECT_FALSE(supervisor->set_auto_restart_config("", policy()).success);

    // Nothing was stored
    EXPECT_FALSE(fs::exists(dir / "auto_restart.json"));
    EXPECT_FALSE(supervisor->get_auto_restart_config("billing").enabled);
}

TEST_F(SupervisorTest, BoundaryValuesAreAccepted) {
    EXPECT_TRUE(supervisor->set_auto_restart_config("a", policy(true, 1.0, 1.0)).success);
    EXPECT_TRUE(supervisor->set_auto_restart_config("b", policy(true, 100.0, 10240.0)).success);
}

TEST_F(SupervisorTest, PoliciesPersistAcrossRestarts) {
    auto p = policy(true, 65.0, 1500.0);
    p.queue_threshold_count = 250;
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", p).success);

    auto snapshot = PolicyStore(store->path()).load();
    ASSERT_EQ(snapshot.policies.count("billing"), 1u);
    EXPECT_DOUBLE_EQ(snapshot.policies.at("billing").cpu_threshold_percent, 65.0);

    make_supervisor();
    auto loaded = supervisor->get_auto_restart_config("BILLING");
    EXPECT_TRUE(loaded.enabled);
    EXPECT_DOUBLE_EQ(loaded.cpu_threshold_percent, 65.0);
    EXPECT_DOUBLE_EQ(bytes_to_mb(loaded.memory_threshold_bytes), 1500.0);
    ASSERT_TRUE(loaded.queue_threshold_count.has_value());
    EXPECT_EQ(*loaded.queue_threshold_count, 250u);
}

TEST_F(SupervisorTest, NamesAreCaseInsensitiveAndKeepFirstSpelling) {
    ASSERT_TRUE(supervisor->set_auto_restart_config("Billing", policy(true, 70.0)).success);
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", policy(true, 90.0)).success);

    auto p = supervisor->get_auto_restart_config("BILLING");
    EXPECT_EQ(p.logical_name, "Billing");
    EXPECT_DOUBLE_EQ(p.cpu_threshold_percent, 90.0);
    EXPECT_EQ(PolicyStore(store->path()).load().policies.size(), 1u);
}

TEST_F(SupervisorTest, DeletePolicy) {
    registry.set({make_record(10, "/srv/billing/billing.jar", 95.0)});
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", policy()).success);

    auto removed = supervisor->delete_auto_restart_config("billing");
    EXPECT_TRUE(removed.success);
    EXPECT_TRUE(PolicyStore(store->path()).load().policies.empty());
    EXPECT_TRUE(supervisor->run_pass().empty());

    auto again = supervisor->delete_auto_restart_config("billing");
    EXPECT_TRUE(again.success);
}

TEST_F(SupervisorTest, SaveFailureKeepsInMemoryPolicy) {
    touch(dir / "blocker");
    supervisor.reset();
    store = std::make_unique<PolicyStore>((dir / "blocker" / "auto_restart.json").string());
    make_supervisor();

    auto result = supervisor->set_auto_restart_config("billing", policy(true, 55.0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.rfind("Failed to save configuration: ", 0), 0u);
    EXPECT_TRUE(result.message.empty());
    EXPECT_DOUBLE_EQ(supervisor->get_auto_restart_config("billing").cpu_threshold_percent, 55.0);
}

// ── Manual operations ───────────────────────────────────────

TEST_F(SupervisorTest, StopService) {
    registry.set({make_record(77, "/srv/orders/orders.jar")});
    auto result = supervisor->stop_service(77);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(control.stops(), std::vector<pid_t>{77});
    EXPECT_TRUE(supervisor->list_services().empty());

    auto missing = supervisor->stop_service(78);
    EXPECT_FALSE(missing.success);
    EXPECT_TRUE(missing.not_found);
}

TEST_F(SupervisorTest, StopDuringDelayCancelsRelaunch) {
    registry.set({make_record(4321, "/srv/billing/billing.jar", 95.0)});
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", policy()).success);
    ASSERT_EQ(supervisor->run_pass().size(), 1u);
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Delaying));

    auto result = supervisor->stop_service(4321);
    EXPECT_TRUE(result.success) << result.error;
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Idle));

    clock.advance(std::chrono::seconds(300));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_TRUE(control.launches().empty());
    EXPECT_TRUE(supervisor->list_services().empty());
}

TEST_F(SupervisorTest, BreachDuringOperatorStopIsHeldOff) {
    registry.set({make_record(100, "/srv/billing/billing.jar", 95.0)});
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", policy()).success);

    control.hold_stop();
    OpResult stopped;
    std::thread op([&] { stopped = supervisor->stop_service(100); });

    bool stopping = wait_until([&] { return control.stops().size() == 1; });
    std::vector<RestartTrigger> during;
    OpResult manual;
    RestartPhase phase_during = RestartPhase::Idle;
    if (stopping) {
        during = supervisor->run_pass();
        manual = supervisor->restart_service(100);
        phase_during = supervisor->phase("billing");
    }
    control.release_stop();
    op.join();

    ASSERT_TRUE(stopping);
    EXPECT_TRUE(during.empty());
    EXPECT_FALSE(manual.success);
    EXPECT_EQ(phase_during, RestartPhase::Idle);
    EXPECT_TRUE(stopped.success) << stopped.error;
    EXPECT_EQ(control.stops(), std::vector<pid_t>{100});

    // Once the stop is done the name takes exactly one cycle again
    registry.set({make_record(200, "/srv/billing/billing.jar", 95.0)});
    auto accepted = supervisor->run_pass();
    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_EQ(accepted[0].pid, 200);
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Delaying));

    registry.add(make_record(201, "/srv/billing/billing.jar", 95.0));
    EXPECT_TRUE(supervisor->run_pass().empty());
    EXPECT_EQ(supervisor->phase("billing"), RestartPhase::Delaying);

    clock.advance(std::chrono::seconds(121));
    ASSERT_TRUE(wait_until([&] { return control.launches().size() == 1; }));
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Idle));
    EXPECT_EQ(control.stops(), (std::vector<pid_t>{100, 200}));
}

TEST_F(SupervisorTest, StopOfAnotherInstanceWaitsForCycle) {
    registry.set({make_record(100, "/srv/billing/billing.jar", 95.0),
                  make_record(101, "/srv/billing/billing.jar")});
    ASSERT_TRUE(supervisor->set_auto_restart_config("billing", policy()).success);
    ASSERT_EQ(supervisor->run_pass().size(), 1u);
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Delaying));

    auto result = supervisor->stop_service(101);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.not_found);
    EXPECT_EQ(result.error, "Restart of billing in progress; try again shortly");
    EXPECT_EQ(control.stops(), std::vector<pid_t>{100});
    EXPECT_EQ(supervisor->phase("billing"), RestartPhase::Delaying);
}

TEST_F(SupervisorTest, StartService) {
    auto empty = supervisor->start_service("");
    EXPECT_FALSE(empty.success);
    EXPECT_EQ(empty.error, "jar_path is required");

    auto started = supervisor->start_service("/srv/orders/orders.jar", "/srv/orders", {"--fast"});
    ASSERT_TRUE(started.success);
    EXPECT_EQ(started.pid, 5000);
    auto launches = control.launches();
    ASSERT_EQ(launches.size(), 1u);
    EXPECT_EQ(launches[0].working_directory, "/srv/orders");
    EXPECT_EQ(launches[0].extra_args, std::vector<std::string>{"--fast"});

    control.fail_launch(LaunchError::Kind::PermissionDenied);
    auto failed = supervisor->start_service("/srv/orders/orders.jar");
    EXPECT_FALSE(failed.success);
    EXPECT_FALSE(failed.error.empty());
    EXPECT_EQ(supervisor->last_error("orders"), failed.error);
}

TEST_F(SupervisorTest, ManualRestartUsesSameCycle) {
    registry.set({make_record(30, "/srv/tools/tools.jar")});
    auto result = supervisor->restart_service(30);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_NE(result.message.find("120"), std::string::npos);

    auto again = supervisor->restart_service(30);
    EXPECT_FALSE(again.success);

    ASSERT_TRUE(wait_phase("tools", RestartPhase::Delaying));
    clock.advance(std::chrono::seconds(121));
    ASSERT_TRUE(wait_until([&] { return control.launches().size() == 1; }));
    EXPECT_EQ(control.launches()[0].artifact_path, "/srv/tools/tools.jar");
}

TEST_F(SupervisorTest, ManualRestartResolvesArtifactInFolder) {
    touch(dir / "billing" / "billing.jar");
    ASSERT_TRUE(supervisor->set_folder_path(dir.string()).success);
    registry.set({make_record(40, "/old/billing/billing.jar")});

    auto missing = supervisor->restart_service(40, "nope.jar");
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.error.rfind("JAR file not found: ", 0), 0u);

    ASSERT_TRUE(supervisor->restart_service(40, "billing.jar").success);
    ASSERT_TRUE(wait_phase("billing", RestartPhase::Delaying));
    clock.advance(std::chrono::seconds(121));
    ASSERT_TRUE(wait_until([&] { return control.launches().size() == 1; }));
    EXPECT_EQ(control.launches()[0].artifact_path,
              (dir / "billing" / "billing.jar").lexically_normal().string());
}

TEST_F(SupervisorTest, ManualRestartOfUnknownPid) {
    auto result = supervisor->restart_service(999);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.not_found);
    EXPECT_EQ(result.error, "Service not found");
}

TEST_F(SupervisorTest, ServiceDetail) {
    registry.set({make_record(12, "/srv/billing/billing.jar")});
    auto detail = supervisor->get_service_detail(12);
    ASSERT_TRUE(detail.has_value());
    EXPECT_EQ(detail->record.logical_name, "billing");
    EXPECT_FALSE(supervisor->get_service_detail(13).has_value());
}

// ── Folder ──────────────────────────────────────────────────

TEST_F(SupervisorTest, FolderPath) {
    EXPECT_EQ(supervisor->set_folder_path("").error, "folder_path is required");
    auto missing = supervisor->set_folder_path((dir / "absent").string());
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.error.rfind("Folder does not exist", 0), 0u);
    EXPECT_FALSE(supervisor->folder_path().has_value());

    touch(dir / "svc" / "svc.jar");
    ASSERT_TRUE(supervisor->set_folder_path(dir.string()).success);
    EXPECT_EQ(supervisor->folder_path(), dir.string());

    auto listed = supervisor->list_artifacts();
    ASSERT_TRUE(listed.success);
    ASSERT_EQ(listed.artifacts.size(), 1u);
    EXPECT_EQ(listed.artifacts[0].name, "svc.jar");

    make_supervisor();
    EXPECT_EQ(supervisor->folder_path(), dir.string());
}
