/*
 * File: test/test_admission_protocol/test_admission_protocol.cpp
 * Description: Admission of newly observed print jobs.
 * Covers pause-before-charge, budget checks against fresh reads, cancellation,
 * unmetered jobs, at-most-once charging, concurrent balance changes and
 * page counts of jobs still spooling.
 */
#include <unity.h>
#include "PrintMonitor.h"
#include "CrashRecoveryRegistry.h"
#include "MockKioskHAL.h"
#include "MockSpooler.h"
#include "MockBudgetStore.h"
#include "MockEventListener.h"

// --- Constants ---
const MonitorDefaults defaults = {
    1000,  // pollIntervalMs
    true,  // holdPrinterDuringAdmission
    1.0,   // defaultBlackWhitePrice
    3.0,   // defaultColorPrice
    0,     // heartbeatIntervalMs (off)
    0,     // spoolWaitAttempts (off)
    0      // spoolWaitIntervalMs
};

const MonitorDefaults spoolWaitDefaults = { 1000, true, 1.0, 3.0, 0, 6, 500 };

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
        store.setPricing(0.5, 2.0);
        store.setBudget("u1", 10.0);
        monitor.setUserId("u1");
    }

    void start() {
        TEST_ASSERT_TRUE(monitor.startMonitoring());
    }

    void poll() {
        hal.advanceTime(defaults.pollIntervalMs);
        monitor.tick();
    }
};

void setUp(void) {}
void tearDown(void) {}

// ============================================================================
// ALLOWED
// ============================================================================

void test_affordable_job_is_paused_charged_and_resumed(void) {
    Fixture f;
    f.start();

    f.spooler.submitJob("P1", 7, 4);
    f.poll();

    int pauseIdx = f.spooler.indexOf("pauseJob:P1:7");
    int resumeIdx = f.spooler.indexOf("resumeJob:P1:7");
    TEST_ASSERT_TRUE(pauseIdx >= 0);
    TEST_ASSERT_TRUE(resumeIdx > pauseIdx);
    TEST_ASSERT_FALSE(f.spooler.hasCall("cancelJob:P1:7"));

    // 4 pages x 0.5
    TEST_ASSERT_EQUAL_FLOAT(8.0, f.store.getBudget("u1"));
    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL(4, f.events.lastPages);
    TEST_ASSERT_EQUAL_FLOAT(2.0, f.events.lastCost);
    TEST_ASSERT_EQUAL_FLOAT(8.0, f.events.lastRemaining);
    TEST_ASSERT_EQUAL(1, (int)f.events.budgetUpdates.size());
    TEST_ASSERT_EQUAL_FLOAT(8.0, f.events.budgetUpdates[0]);
    TEST_ASSERT_EQUAL_UINT32(1, f.monitor.getStats().jobsAllowed);
}

void test_color_job_uses_color_price(void) {
    Fixture f;
    f.start();

    f.spooler.submitJob("P1", 8, 3, true);
    f.poll();

    // 3 pages x 2.0
    TEST_ASSERT_EQUAL_FLOAT(4.0, f.store.getBudget("u1"));
    TEST_ASSERT_EQUAL_FLOAT(6.0, f.events.lastCost);
}

void test_copies_multiply_billed_pages(void) {
    Fixture f;
    f.start();

    f.spooler.submitJob("P1", 9, 2, false, 3);
    f.poll();

    TEST_ASSERT_EQUAL(6, f.events.lastPages);
    TEST_ASSERT_EQUAL_FLOAT(3.0, f.events.lastCost);
    TEST_ASSERT_EQUAL_FLOAT(7.0, f.store.getBudget("u1"));
}

void test_unknown_page_count_is_billed_as_one_page(void) {
    Fixture f;
    f.start();

    f.spooler.submitJob("P1", 10, 0);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.lastPages);
    TEST_ASSERT_EQUAL_FLOAT(9.5, f.store.getBudget("u1"));
}

void test_budget_exactly_equal_to_cost_is_allowed(void) {
    Fixture f;
    f.store.setBudget("u1", 2.0);
    f.start();

    f.spooler.submitJob("P1", 11, 4);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL_FLOAT(0.0, f.store.getBudget("u1"));
}

void test_default_prices_apply_when_metadata_missing(void) {
    Fixture f;
    f.store.docs.erase(STORE_PATH_METADATA);
    f.start();

    f.spooler.submitJob("P1", 12, 2, true);
    f.poll();

    // 2 pages x 3.0 default color price
    TEST_ASSERT_EQUAL_FLOAT(6.0, f.events.lastCost);
    TEST_ASSERT_EQUAL_FLOAT(4.0, f.store.getBudget("u1"));
}

void test_job_charged_but_not_resumed_reports_error(void) {
    Fixture f;
    f.start();
    f.spooler.failResumeJob.insert(13);

    f.spooler.submitJob("P1", 13, 2);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL_FLOAT(9.0, f.store.getBudget("u1"));
    TEST_ASSERT_EQUAL(1, (int)f.events.errors.size());
    TEST_ASSERT_FALSE(f.spooler.hasCall("cancelJob:P1:13"));
}

void test_huge_page_and_copy_counts_are_capped_not_credited(void) {
    Fixture f;
    f.start();

    f.spooler.submitJob("P1", 40, 300000, false, 9999);
    f.poll();

    TEST_ASSERT_EQUAL(0, f.events.allowedCount);
    TEST_ASSERT_EQUAL(1, f.events.blockedCount);
    TEST_ASSERT_EQUAL(MAX_BILLED_PAGES, f.events.lastPages);
    TEST_ASSERT_EQUAL_FLOAT(MAX_BILLED_PAGES * 0.5, f.events.lastCost);
    TEST_ASSERT_EQUAL_FLOAT(10.0, f.store.getBudget("u1"));
    TEST_ASSERT_TRUE(f.spooler.hasCall("cancelJob:P1:40"));
    TEST_ASSERT_FALSE(f.spooler.hasCall("resumeJob:P1:40"));
}

void test_negative_stored_balance_allows_free_job(void) {
    Fixture f;
    f.store.setPricing(0.0, 0.0);
    f.store.setBudget("u1", -2.0);
    f.start();

    f.spooler.submitJob("P1", 41, 3);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL(0, (int)f.events.errors.size());
    TEST_ASSERT_EQUAL(1, f.store.casCount);
    TEST_ASSERT_TRUE(f.spooler.hasCall("resumeJob:P1:41"));
    TEST_ASSERT_FALSE(f.spooler.hasCall("cancelJob:P1:41"));
    TEST_ASSERT_EQUAL_FLOAT(0.0, f.store.getBudget("u1"));
}

// ============================================================================
// SPOOLING
// ============================================================================

void test_spooling_job_is_billed_for_final_page_count(void) {
    Fixture f(spoolWaitDefaults);
    f.start();

    f.spooler.submitJob("P1", 50, 0);
    f.spooler.scriptSpooling("P1", 50, {5, 5});
    f.poll();

    TEST_ASSERT_EQUAL(2, f.spooler.getJobCount);
    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL(5, f.events.lastPages);
    TEST_ASSERT_EQUAL_FLOAT(2.5, f.events.lastCost);
    TEST_ASSERT_EQUAL_FLOAT(7.5, f.store.getBudget("u1"));

    // Re-reads happen only while the job is paused
    TEST_ASSERT_TRUE(f.spooler.indexOf("pauseJob:P1:50") >= 0);
    TEST_ASSERT_TRUE(f.spooler.indexOf("resumeJob:P1:50") > f.spooler.indexOf("pauseJob:P1:50"));
}

void test_spooling_job_priced_once_page_count_is_stable(void) {
    Fixture f(spoolWaitDefaults);
    f.start();

    f.spooler.submitJob("P1", 51, 1);
    f.spooler.scriptSpooling("P1", 51, {3, 3, 3, 3}, true);
    f.poll();

    TEST_ASSERT_EQUAL(3, f.spooler.getJobCount);
    TEST_ASSERT_EQUAL(3, f.events.lastPages);
    TEST_ASSERT_TRUE(f.hal.hasLogContaining("page count stable at 3"));
}

void test_spool_wait_gives_up_after_configured_attempts(void) {
    Fixture f(spoolWaitDefaults);
    f.start();

    f.spooler.submitJob("P1", 52, 0);
    f.spooler.scriptSpooling("P1", 52, {0}, true);
    f.poll();

    TEST_ASSERT_EQUAL(6, f.hal.delayCount);
    TEST_ASSERT_EQUAL(6, f.spooler.getJobCount);
    TEST_ASSERT_TRUE(f.hal.hasLogContaining("Spool wait timed out for job 52"));
    TEST_ASSERT_EQUAL(1, f.events.lastPages);
    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
}

void test_completed_job_is_not_reread(void) {
    Fixture f(spoolWaitDefaults);
    f.start();

    f.spooler.submitJob("P1", 53, 4);
    f.poll();

    TEST_ASSERT_EQUAL(0, f.spooler.getJobCount);
    TEST_ASSERT_EQUAL(0, f.hal.delayCount);
    TEST_ASSERT_EQUAL(4, f.events.lastPages);
}

// ============================================================================
// BLOCKED
// ============================================================================

void test_unaffordable_job_is_cancelled_without_charge(void) {
    Fixture f;
    f.store.setBudget("u1", 1.0);
    f.start();

    f.spooler.submitJob("P1", 20, 4);
    f.poll();

    TEST_ASSERT_TRUE(f.spooler.hasCall("pauseJob:P1:20"));
    TEST_ASSERT_TRUE(f.spooler.hasCall("cancelJob:P1:20"));
    TEST_ASSERT_FALSE(f.spooler.hasCall("resumeJob:P1:20"));
    TEST_ASSERT_FALSE(f.spooler.hasJob("P1", 20));

    TEST_ASSERT_EQUAL_FLOAT(1.0, f.store.getBudget("u1"));
    TEST_ASSERT_EQUAL(1, f.events.blockedCount);
    TEST_ASSERT_EQUAL(0, f.events.allowedCount);
    TEST_ASSERT_EQUAL_FLOAT(2.0, f.events.lastCost);
    TEST_ASSERT_EQUAL_FLOAT(1.0, f.events.lastBudgetAtCheck);
    TEST_ASSERT_EQUAL(0, f.store.casCount);
}

void test_missing_budget_field_counts_as_zero(void) {
    Fixture f;
    f.store.user("u1").clear();
    f.store.user("u1")["name"] = "Alex";
    f.start();

    f.spooler.submitJob("P1", 21, 1);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.blockedCount);
    TEST_ASSERT_EQUAL_FLOAT(0.0, f.events.lastBudgetAtCheck);
}

void test_budget_is_read_fresh_for_every_job(void) {
    Fixture f;
    f.start();

    f.spooler.submitJob("P1", 22, 2);
    f.poll();
    TEST_ASSERT_EQUAL_FLOAT(9.0, f.store.getBudget("u1"));

    // Balance drained elsewhere between polls
    f.store.setBudget("u1", 0.5);
    f.spooler.submitJob("P1", 23, 2);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.blockedCount);
    TEST_ASSERT_EQUAL_FLOAT(0.5, f.store.getBudget("u1"));
}

// ============================================================================
// UNMETERED & FAILED
// ============================================================================

void test_job_that_cannot_be_paused_is_never_charged(void) {
    Fixture f;
    f.start();
    f.spooler.failPauseJob.insert(30);

    f.spooler.submitJob("P1", 30, 4);
    f.poll();

    TEST_ASSERT_FALSE(f.spooler.hasCall("cancelJob:P1:30"));
    TEST_ASSERT_FALSE(f.spooler.hasCall("resumeJob:P1:30"));
    TEST_ASSERT_EQUAL_FLOAT(10.0, f.store.getBudget("u1"));
    TEST_ASSERT_EQUAL(0, f.events.allowedCount);
    TEST_ASSERT_EQUAL(0, f.events.blockedCount);
    TEST_ASSERT_EQUAL_UINT32(1, f.monitor.getStats().jobsUnmetered);
    TEST_ASSERT_TRUE(f.hal.hasLogContaining("SECURITY"));

    // Not re-evaluated on later polls
    f.poll();
    TEST_ASSERT_EQUAL(1, f.spooler.countCalls("pauseJob:P1:30"));
}

void test_budget_read_failure_cancels_job(void) {
    Fixture f;
    f.start();
    f.store.failGetPath = "users/u1";

    f.spooler.submitJob("P1", 31, 1);
    f.poll();

    TEST_ASSERT_TRUE(f.spooler.hasCall("cancelJob:P1:31"));
    TEST_ASSERT_FALSE(f.spooler.hasCall("resumeJob:P1:31"));
    TEST_ASSERT_EQUAL(1, (int)f.events.errors.size());
    TEST_ASSERT_EQUAL_UINT32(1, f.monitor.getStats().jobsFailed);
}

void test_deduction_failure_cancels_job(void) {
    Fixture f;
    f.start();
    f.store.failUpdate = true;

    f.spooler.submitJob("P1", 32, 1);
    f.poll();

    TEST_ASSERT_TRUE(f.spooler.hasCall("cancelJob:P1:32"));
    TEST_ASSERT_FALSE(f.spooler.hasCall("resumeJob:P1:32"));
    TEST_ASSERT_EQUAL_FLOAT(10.0, f.store.getBudget("u1"));
    TEST_ASSERT_EQUAL(0, f.events.allowedCount);
    TEST_ASSERT_EQUAL(1, (int)f.events.errors.size());
}

// ============================================================================
// AT-MOST-ONCE
// ============================================================================

void test_jobs_queued_before_start_are_never_charged(void) {
    Fixture f;
    f.spooler.submitJob("P1", 40, 5);
    f.spooler.submitJob("P1", 41, 5);
    f.start();

    f.poll();
    f.poll();

    TEST_ASSERT_EQUAL(0, f.spooler.countCalls("pauseJob"));
    TEST_ASSERT_EQUAL_FLOAT(10.0, f.store.getBudget("u1"));
    TEST_ASSERT_EQUAL(2, (int)f.monitor.getLedger().knownCount("P1"));
}

void test_job_seen_across_polls_is_charged_once(void) {
    Fixture f;
    f.start();

    f.spooler.submitJob("P1", 42, 2);
    for (int i = 0; i < 5; i++) f.poll();

    TEST_ASSERT_EQUAL(1, f.spooler.countCalls("pauseJob:P1:42"));
    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL_FLOAT(9.0, f.store.getBudget("u1"));
}

void test_multiple_new_jobs_are_admitted_in_id_order(void) {
    Fixture f;
    f.start();

    f.spooler.submitJob("P1", 51, 1);
    f.spooler.submitJob("P1", 50, 1);
    f.poll();

    TEST_ASSERT_TRUE(f.spooler.indexOf("pauseJob:P1:50") < f.spooler.indexOf("pauseJob:P1:51"));
    TEST_ASSERT_EQUAL(2, f.events.allowedCount);
    TEST_ASSERT_EQUAL_FLOAT(9.0, f.store.getBudget("u1"));
}

// ============================================================================
// CONCURRENT BALANCE CHANGES
// ============================================================================

void test_conflicting_write_rereads_and_charges_new_balance(void) {
    Fixture f;
    f.start();
    f.store.conflictsToInject = 1;
    f.store.concurrentBudget = 5.0;

    f.spooler.submitJob("P1", 60, 4);
    f.poll();

    // Second attempt sees 5.0 and charges 2.0
    TEST_ASSERT_EQUAL(2, f.store.casCount);
    TEST_ASSERT_EQUAL_FLOAT(3.0, f.store.getBudget("u1"));
    TEST_ASSERT_EQUAL(1, f.events.allowedCount);
    TEST_ASSERT_EQUAL(1, f.spooler.countCalls("resumeJob:P1:60"));
}

void test_conflict_that_drains_balance_blocks_job(void) {
    Fixture f;
    f.start();
    f.store.conflictsToInject = 1;
    f.store.concurrentBudget = 1.0;

    f.spooler.submitJob("P1", 61, 4);
    f.poll();

    TEST_ASSERT_EQUAL(1, f.events.blockedCount);
    TEST_ASSERT_TRUE(f.spooler.hasCall("cancelJob:P1:61"));
    TEST_ASSERT_EQUAL_FLOAT(1.0, f.store.getBudget("u1"));
}

void test_repeated_conflicts_cancel_job(void) {
    Fixture f;
    f.start();
    f.store.conflictsToInject = 2;
    f.store.concurrentBudget = 9.0;

    f.spooler.submitJob("P1", 62, 1);
    f.poll();

    TEST_ASSERT_TRUE(f.spooler.hasCall("cancelJob:P1:62"));
    TEST_ASSERT_FALSE(f.spooler.hasCall("resumeJob:P1:62"));
    TEST_ASSERT_EQUAL(0, f.events.allowedCount);
    TEST_ASSERT_EQUAL_UINT32(1, f.monitor.getStats().jobsFailed);
}

void test_store_without_conditional_writes_uses_plain_update(void) {
    Fixture f;
    f.store.supportsCas = false;
    f.start();

    f.spooler.submitJob("P1", 63, 2);
    f.poll();

    TEST_ASSERT_EQUAL(0, f.store.casCount);
    TEST_ASSERT_EQUAL(1, f.store.updateCount);
    TEST_ASSERT_EQUAL_FLOAT(9.0, f.store.getBudget("u1"));
    TEST_ASSERT_EQUAL_STRING("2026-01-01T12:00:00", f.store.user("u1")[FIELD_UPDATED_AT] | "");
}

// ============================================================================
// REFERENCE SCENARIOS (HP1, B/W 1.0 per page)
// ============================================================================

void test_scenario_five_pages_with_ten_credits(void) {
    Fixture f;
    f.spooler.addPrinter("HP1");
    f.store.setPricing(1.0, 3.0);
    f.start();

    f.spooler.submitJob("HP1", 100, 5, false, 1, "thesis.pdf");
    f.poll();

    TEST_ASSERT_TRUE(f.spooler.indexOf("pauseJob:HP1:100") < f.spooler.indexOf("resumeJob:HP1:100"));
    TEST_ASSERT_EQUAL_FLOAT(5.0, f.store.getBudget("u1"));
    TEST_ASSERT_EQUAL_STRING("thesis.pdf", f.events.lastDocument.c_str());
    TEST_ASSERT_EQUAL(5, f.events.lastPages);
    TEST_ASSERT_EQUAL_FLOAT(5.0, f.events.lastCost);
    TEST_ASSERT_EQUAL_FLOAT(5.0, f.events.lastRemaining);
}

void test_scenario_five_pages_with_three_credits(void) {
    Fixture f;
    f.spooler.addPrinter("HP1");
    f.store.setPricing(1.0, 3.0);
    f.store.setBudget("u1", 3.0);
    f.start();

    f.spooler.submitJob("HP1", 101, 5, false, 1, "thesis.pdf");
    f.poll();

    TEST_ASSERT_TRUE(f.spooler.indexOf("pauseJob:HP1:101") < f.spooler.indexOf("cancelJob:HP1:101"));
    TEST_ASSERT_EQUAL(1, f.events.blockedCount);
    TEST_ASSERT_EQUAL(5, f.events.lastPages);
    TEST_ASSERT_EQUAL_FLOAT(5.0, f.events.lastCost);
    TEST_ASSERT_EQUAL_FLOAT(3.0, f.events.lastBudgetAtCheck);
    TEST_ASSERT_EQUAL_FLOAT(3.0, f.store.getBudget("u1"));
}

int main(void) {
    UNITY_BEGIN();

    // Allowed
    RUN_TEST(test_affordable_job_is_paused_charged_and_resumed);
    RUN_TEST(test_color_job_uses_color_price);
    RUN_TEST(test_copies_multiply_billed_pages);
    RUN_TEST(test_unknown_page_count_is_billed_as_one_page);
    RUN_TEST(test_budget_exactly_equal_to_cost_is_allowed);
    RUN_TEST(test_default_prices_apply_when_metadata_missing);
    RUN_TEST(test_job_charged_but_not_resumed_reports_error);
    RUN_TEST(test_huge_page_and_copy_counts_are_capped_not_credited);
    RUN_TEST(test_negative_stored_balance_allows_free_job);

    // Spooling
    RUN_TEST(test_spooling_job_is_billed_for_final_page_count);
    RUN_TEST(test_spooling_job_priced_once_page_count_is_stable);
    RUN_TEST(test_spool_wait_gives_up_after_configured_attempts);
    RUN_TEST(test_completed_job_is_not_reread);

    // Blocked
    RUN_TEST(test_unaffordable_job_is_cancelled_without_charge);
    RUN_TEST(test_missing_budget_field_counts_as_zero);
    RUN_TEST(test_budget_is_read_fresh_for_every_job);

    // Unmetered & Failed
    RUN_TEST(test_job_that_cannot_be_paused_is_never_charged);
    RUN_TEST(test_budget_read_failure_cancels_job);
    RUN_TEST(test_deduction_failure_cancels_job);

    // At-most-once
    RUN_TEST(test_jobs_queued_before_start_are_never_charged);
    RUN_TEST(test_job_seen_across_polls_is_charged_once);
    RUN_TEST(test_multiple_new_jobs_are_admitted_in_id_order);

    // Concurrency
    RUN_TEST(test_conflicting_write_rereads_and_charges_new_balance);
    RUN_TEST(test_conflict_that_drains_balance_blocks_job);
    RUN_TEST(test_repeated_conflicts_cancel_job);
    RUN_TEST(test_store_without_conditional_writes_uses_plain_update);

    // Reference scenarios
    RUN_TEST(test_scenario_five_pages_with_ten_credits);
    RUN_TEST(test_scenario_five_pages_with_three_credits);

    return UNITY_END();
}
