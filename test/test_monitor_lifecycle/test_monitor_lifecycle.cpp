/*
 * File: test/test_monitor_lifecycle/test_monitor_lifecycle.cpp
 * Description: PrintMonitor start/stop, poll scheduling, per-printer error
 * isolation and printer-level holds during admission.
 */
#include <unity.h>
#include "PrintMonitor.h"
#include "CrashRecoveryRegistry.h"
#include "MockKioskHAL.h"
#include "MockSpooler.h"
#include "MockBudgetStore.h"
#include "MockEventListener.h"

// --- Constants ---
const MonitorDefaults defaults = { 1000, true, 1.0, 3.0, 0, 0, 0 };
const MonitorDefaults noHoldDefaults = { 1000, false, 1.0, 3.0, 0, 0, 0 };

// --- Fixture ---
struct Fixture {
    MockKioskHAL hal;
    MockSpooler spooler;
    MockBudgetStore store;
    MockEventListener events;
    CrashRecoveryRegistry recovery;
    PrintMonitor monitor;

    explicit Fixture(const MonitorDefaults& defs = defaults)
        : recovery(hal, spooler),
          monitor(hal, spooler, store, recovery, events, defs) {
        spooler.addPrinter("P1");
        spooler.addPrinter("P2");
        store.setPricing(1.0, 3.0);
        store.setBudget("u1", 100.0);
        monitor.setUserId("u1");
    }

    void poll() {
        hal.advanceTime(1000);
        monitor.tick();
    }
};

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// START / STOP
// ============================================================================

void test_start_without_user_fails(void) {
    Fixture f;
    f.monitor.setUserId("");

    TEST_ASSERT_FALSE(f.monitor.startMonitoring());
    TEST_ASSERT_EQUAL(MONITOR_STOPPED, f.monitor.getState());
    TEST_ASSERT_EQUAL(0, f.spooler.listPrintersCount);
}

void test_start_seeds_known_jobs_and_enters_monitoring(void) {
    Fixture f;
    f.spooler.submitJob("P1", 1, 1);
    f.spooler.submitJob("P2", 2, 1);

    TEST_ASSERT_TRUE(f.monitor.startMonitoring());
    TEST_ASSERT_EQUAL(MONITOR_MONITORING, f.monitor.getState());
    TEST_ASSERT_TRUE(f.monitor.getLedger().isKnown("P1", 1));
    TEST_ASSERT_TRUE(f.monitor.getLedger().isKnown("P2", 2));
    TEST_ASSERT_EQUAL_FLOAT(1.0, f.monitor.getPricing().blackWhitePricePerPage);
}

void test_second_start_is_a_noop(void) {
    Fixture f;
    TEST_ASSERT_TRUE(f.monitor.startMonitoring());

    // A job arriving now must still be treated as new after the repeated start
    f.spooler.submitJob("P1", 5, 2);
    TEST_ASSERT_TRUE(f.monitor.startMonitoring());
    TEST_ASSERT_FALSE(f.monitor.getLedger().isKnown("P1", 5));

    f.poll();
    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
}

void test_stop_clears_known_jobs(void) {
    Fixture f;
    f.spooler.submitJob("P1", 1, 1);
    f.monitor.startMonitoring();
    TEST_ASSERT_EQUAL(1, (int)f.monitor.getLedger().totalKnown());

    f.monitor.stopMonitoring();

    TEST_ASSERT_EQUAL(MONITOR_STOPPED, f.monitor.getState());
    TEST_ASSERT_EQUAL(0, (int)f.monitor.getLedger().totalKnown());
}

void test_stop_leaves_held_printers_to_recovery(void) {
    Fixture f;
    f.monitor.startMonitoring();
    f.recovery.markHeld("P1");

    f.monitor.stopMonitoring();

    TEST_ASSERT_EQUAL(0, f.spooler.countCalls("resumePrinter"));
    TEST_ASSERT_TRUE(f.recovery.isHeld("P1"));
}

void test_stopped_monitor_does_not_poll(void) {
    Fixture f;
    f.monitor.startMonitoring();
    f.monitor.stopMonitoring();
    int listed = f.spooler.listJobsCount;

    f.spooler.submitJob("P1", 9, 1);
    f.poll();
    f.poll();

    TEST_ASSERT_EQUAL(listed, f.spooler.listJobsCount);
    TEST_ASSERT_EQUAL(0, f.spooler.countCalls("pauseJob"));
}

void test_restart_treats_queued_jobs_as_existing(void) {
    Fixture f;
    f.monitor.startMonitoring();
    f.monitor.stopMonitoring();

    // Submitted while stopped: never charged
    f.spooler.submitJob("P1", 11, 1);
    f.monitor.startMonitoring();
    f.poll();

    TEST_ASSERT_EQUAL(0, f.spooler.countCalls("pauseJob"));
    TEST_ASSERT_TRUE(f.monitor.getLedger().isKnown("P1", 11));
}

// ============================================================================
// POLL SCHEDULING
// ============================================================================

void test_poll_waits_for_interval(void) {
    Fixture f;
    f.monitor.startMonitoring();
    int listed = f.spooler.listPrintersCount;

    f.hal.advanceTime(500);
    f.monitor.tick();
    TEST_ASSERT_EQUAL(listed, f.spooler.listPrintersCount);

    f.hal.advanceTime(500);
    f.monitor.tick();
    TEST_ASSERT_EQUAL(listed + 1, f.spooler.listPrintersCount);
    TEST_ASSERT_EQUAL_UINT32(1, f.monitor.getStats().pollCount);
}

void test_vanished_jobs_are_forgotten(void) {
    Fixture f;
    f.spooler.submitJob("P1", 1, 1);
    f.monitor.startMonitoring();

    f.spooler.removeJob("P1", 1);
    f.poll();

    TEST_ASSERT_FALSE(f.monitor.getLedger().isKnown("P1", 1));
    TEST_ASSERT_EQUAL(0, (int)f.monitor.getLedger().knownCount("P1"));
}

// ============================================================================
// ERROR ISOLATION
// ============================================================================

void test_failing_printer_does_not_stop_others(void) {
    Fixture f;
    f.monitor.startMonitoring();
    f.spooler.throwOnListJobs.insert("P1");

    f.spooler.submitJob("P2", 20, 2);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_TRUE(f.spooler.hasCall("resumeJob:P2:20"));
    TEST_ASSERT_TRUE(f.hal.hasLogContaining("Error polling 'P1'"));
    TEST_ASSERT_EQUAL(MONITOR_MONITORING, f.monitor.getState());
}

void test_failing_printer_recovers_on_next_poll(void) {
    Fixture f;
    f.monitor.startMonitoring();
    f.spooler.throwOnListJobs.insert("P1");
    f.spooler.submitJob("P1", 21, 1);
    f.poll();
    TEST_ASSERT_EQUAL(0, f.events.allowedCount);

    f.spooler.throwOnListJobs.clear();
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL(1, f.spooler.countCalls("pauseJob:P1:21"));
}

void test_unreadable_queue_keeps_known_jobs(void) {
    Fixture f;
    f.monitor.startMonitoring();

    // Charged but left paused: it stays in the queue
    f.spooler.failResumeJob.insert(7);
    f.spooler.submitJob("P1", 7, 2);
    f.poll();
    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL_FLOAT(98.0, f.store.getBudget("u1"));

    f.spooler.failListJobs.insert("P1");
    f.poll();
    TEST_ASSERT_TRUE(f.monitor.getLedger().isKnown("P1", 7));
    TEST_ASSERT_TRUE(f.hal.hasLogContaining("Queue 'P1' unreadable"));

    f.spooler.failListJobs.clear();
    f.poll();

    TEST_ASSERT_EQUAL(1, f.spooler.countCalls("pauseJob:P1:7"));
    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL_FLOAT(98.0, f.store.getBudget("u1"));
}

void test_non_std_exception_does_not_escape_tick(void) {
    Fixture f;
    f.monitor.startMonitoring();
    f.spooler.throwCodeOnListJobs.insert("P1");

    f.spooler.submitJob("P2", 22, 1);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_TRUE(f.hal.hasLogContaining("Error polling 'P1': unknown exception"));
    TEST_ASSERT_EQUAL(MONITOR_MONITORING, f.monitor.getState());
}

// ============================================================================
// PRINTER HOLD
// ============================================================================

void test_printer_is_held_around_admission(void) {
    Fixture f;
    f.monitor.startMonitoring();

    f.spooler.submitJob("P1", 30, 1);
    f.poll();

    int holdIdx = f.spooler.indexOf("pausePrinter:P1");
    int pauseIdx = f.spooler.indexOf("pauseJob:P1:30");
    int resumeIdx = f.spooler.indexOf("resumeJob:P1:30");
    int releaseIdx = f.spooler.indexOf("resumePrinter:P1");

    TEST_ASSERT_TRUE(holdIdx >= 0);
    TEST_ASSERT_TRUE(holdIdx < pauseIdx);
    TEST_ASSERT_TRUE(resumeIdx < releaseIdx);
    TEST_ASSERT_FALSE(f.recovery.isHeld("P1"));

    // Journal written on hold and on release
    TEST_ASSERT_EQUAL(2, f.hal.journalSaveCount);
    TEST_ASSERT_EQUAL(0, (int)f.hal.savedJournal.size());
}

void test_idle_printers_are_not_held(void) {
    Fixture f;
    f.monitor.startMonitoring();
    f.poll();

    TEST_ASSERT_EQUAL(0, f.spooler.countCalls("pausePrinter"));
    TEST_ASSERT_EQUAL(0, f.hal.journalSaveCount);
}

void test_hold_failure_falls_back_to_job_pause(void) {
    Fixture f;
    f.monitor.startMonitoring();
    f.spooler.failPausePrinter.insert("P1");

    f.spooler.submitJob("P1", 31, 1);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_FALSE(f.spooler.hasCall("resumePrinter:P1"));
    TEST_ASSERT_FALSE(f.recovery.isHeld("P1"));
}

void test_release_failure_keeps_printer_in_journal(void) {
    Fixture f;
    f.monitor.startMonitoring();
    f.spooler.failResumePrinter.insert("P1");

    f.spooler.submitJob("P1", 32, 1);
    f.poll();

    TEST_ASSERT_TRUE(f.recovery.isHeld("P1"));
    TEST_ASSERT_EQUAL(1, (int)f.hal.savedJournal.size());
    TEST_ASSERT_EQUAL_STRING("P1", f.hal.savedJournal[0].c_str());

    // Exit handler succeeds later
    f.spooler.failResumePrinter.clear();
    TEST_ASSERT_EQUAL(1, (int)f.recovery.resumeAll("Process Exit"));
    TEST_ASSERT_FALSE(f.recovery.isHeld("P1"));
}

void test_hold_disabled_uses_job_pause_only(void) {
    Fixture f(noHoldDefaults);
    f.monitor.startMonitoring();

    f.spooler.submitJob("P1", 33, 1);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL(0, f.spooler.countCalls("pausePrinter"));
    TEST_ASSERT_EQUAL(0, f.spooler.countCalls("resumePrinter"));
}

int main(void) {
    UNITY_BEGIN();

    // Start / Stop
    RUN_TEST(test_start_without_user_fails);
    RUN_TEST(test_start_seeds_known_jobs_and_enters_monitoring);
    RUN_TEST(test_second_start_is_a_noop);
    RUN_TEST(test_stop_clears_known_jobs);
    RUN_TEST(test_stop_leaves_held_printers_to_recovery);
    RUN_TEST(test_stopped_monitor_does_not_poll);
    RUN_TEST(test_restart_treats_queued_jobs_as_existing);

    // Scheduling
    RUN_TEST(test_poll_waits_for_interval);
    RUN_TEST(test_vanished_jobs_are_forgotten);

    // Error isolation
    RUN_TEST(test_failing_printer_does_not_stop_others);
    RUN_TEST(test_failing_printer_recovers_on_next_poll);
    RUN_TEST(test_unreadable_queue_keeps_known_jobs);
    RUN_TEST(test_non_std_exception_does_not_escape_tick);

    // Printer hold
    RUN_TEST(test_printer_is_held_around_admission);
    RUN_TEST(test_idle_printers_are_not_held);
    RUN_TEST(test_hold_failure_falls_back_to_job_pause);
    RUN_TEST(test_release_failure_keeps_printer_in_journal);
    RUN_TEST(test_hold_disabled_uses_job_pause_only);

    return UNITY_END();
}
