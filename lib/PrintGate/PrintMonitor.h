/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/PrintMonitor.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Header for the PrintMonitor class (the print budget gate).
 *
 * NOTES:
 * 1. Decoupled from the OS spooler via ISpoolerAdapter.
 * 2. Decoupled from the remote database via IBudgetStore.
 * 3. Driven by the host loop through tick(); polls on its own schedule.
 * 4. Holds printer queues during admission, tracked by CrashRecoveryRegistry.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>
#include "Types.h"
#include "KioskContext.h"
#include "SpoolerContext.h"
#include "BudgetStore.h"
#include "PrintEvents.h"
#include "PricingCache.h"
#include "JobLedger.h"
#include "CrashRecoveryRegistry.h"

class PrintMonitor {
public:
    PrintMonitor(IKioskHAL& hal,
                 ISpoolerAdapter& spooler,
                 IBudgetStore& store,
                 CrashRecoveryRegistry& recovery,
                 IPrintEventListener& listener,
                 const MonitorDefaults& defaults);

    // --- Main Loop Tick ---
    // Cheap to call often. Runs a poll cycle when the interval has elapsed.
    void tick();

    // --- API Commands ---
    void setUserId(const std::string& userId) { _userId = userId; }
    bool startMonitoring();
    void stopMonitoring();

    // --- State Accessors (Read-Only) ---
    MonitorState getState() const { return _state; }
    bool isMonitoring() const { return _state == MONITOR_MONITORING; }
    const std::string& getUserId() const { return _userId; }
    const JobLedger& getLedger() const { return _ledger; }
    const PricingSnapshot& getPricing() const { return _pricing.get(); }
    const MonitorStats& getStats() const { return _stats; }
    const MonitorDefaults& getDefaults() const { return _defaults; }

    void printStartupDiagnostics();

private:
    // --- Dependencies ---
    IKioskHAL& _hal;
    ISpoolerAdapter& _spooler;
    IBudgetStore& _store;
    CrashRecoveryRegistry& _recovery;
    IPrintEventListener& _listener;

    // --- Configuration ---
    MonitorDefaults _defaults;

    // --- Dynamic State ---
    MonitorState _state;
    std::string _userId;
    PricingCache _pricing;
    JobLedger _ledger;
    MonitorStats _stats;

    unsigned long _lastPollTime;
    unsigned long _lastHeartbeatTime;

    // =========================================================================
    // SECTION: STATE TRANSITION SYSTEM
    // =========================================================================

    void changeState(MonitorState newState);

    // =========================================================================
    // SECTION: POLLING
    // =========================================================================

    void seedKnownJobs();
    void runPollCycle();
    void pollPrinter(const std::string& printer);
    void logHeartbeat();

    bool holdPrinter(const std::string& printer);
    void releasePrinter(const std::string& printer);

    // =========================================================================
    // SECTION: ADMISSION
    // =========================================================================

    AdmissionOutcome admitJob(const PrintJob& detected);
    AdmissionOutcome rejectJob(const PrintJob& job, const char* reason);
    PrintJob waitForSpoolComplete(const PrintJob& job);
    bool readBudget(double& outBudget, double& outStored, std::string& errorMsg);
    StoreErrorKind deductBudget(double storedBudget, double currentBudget, double cost, double& outNewBudget);

    std::string userPath() const { return std::string(STORE_PATH_USERS) + _userId; }

    void logKeyValue(const char *key, const char *value);
};
