/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/PrintMonitor.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Print budget gate.
 * - Polls the spooler and diffs against the known-jobs table.
 * - Every new job is paused, priced, checked against a fresh budget read,
 *   charged, then resumed or cancelled.
 * - Holds the printer queue for the duration of an admission batch.
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>
#include <exception>

#include "PrintMonitor.h"
#include "StoreParsers.h"

// Absorbs binary rounding in "budget >= cost" (0.1 * 3 vs 0.3).
static const double BUDGET_EPSILON = 1e-9;

// Equal non-zero page counts in a row before a spooling job is priced.
static const uint32_t SPOOL_STABLE_READS = 2;

// pages x copies without overflow, capped at MAX_BILLED_PAGES.
static int billablePages(int32_t pages, int32_t copies) {
    int64_t billed = (int64_t)pages * (int64_t)copies;
    if (billed > MAX_BILLED_PAGES) billed = MAX_BILLED_PAGES;
    return (int)billed;
}

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

PrintMonitor::PrintMonitor(IKioskHAL& hal,
                           ISpoolerAdapter& spooler,
                           IBudgetStore& store,
                           CrashRecoveryRegistry& recovery,
                           IPrintEventListener& listener,
                           const MonitorDefaults& defaults)
    : _hal(hal),
      _spooler(spooler),
      _store(store),
      _recovery(recovery),
      _listener(listener),
      _defaults(defaults),
      _state(MONITOR_STOPPED),
      _pricing(hal, PricingSnapshot{defaults.defaultBlackWhitePrice, defaults.defaultColorPrice})
{
    memset(&_stats, 0, sizeof(_stats));
    _lastPollTime = 0;
    _lastHeartbeatTime = 0;
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging)
// =================================================================================

void PrintMonitor::logKeyValue(const char *key, const char *value) {
    char tempBuf[MAX_LOG_LENGTH];
    // Format: " Key : Value"
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void PrintMonitor::printStartupDiagnostics() {
    char logBuf[128];
    const char* boolStr[] = { "NO", "YES" };

    _hal.log("==========================================================================");
    _hal.log("                         PRINT MONITOR DIAGNOSTICS                        ");
    _hal.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: CURRENT STATE
    // -------------------------------------------------------------------------
    _hal.log("[ MONITOR STATE ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Current Mode", monitorStateToString(_state));
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "User", _userId.empty() ? "(none)" : _userId.c_str());
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u on %u printer(s)", "Known Jobs",
             (unsigned)_ledger.totalKnown(), (unsigned)_ledger.printerCount());
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Held Printers", (unsigned)_recovery.size());
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: CONFIGURATION
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ CONFIGURATION ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Poll Interval", _defaults.pollIntervalMs);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Hold Printer On Admit", boolStr[_defaults.holdPrinterDuringAdmission]);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u x %u ms", "Spool Wait", _defaults.spoolWaitAttempts,
             _defaults.spoolWaitIntervalMs);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.2f", "B/W Price Per Page", _pricing.get().blackWhitePricePerPage);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.2f", "Color Price Per Page", _pricing.get().colorPricePerPage);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Pricing Source", _pricing.isUsingDefaults() ? "DEFAULTS" : "STORE");
    _hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: STATISTICS
    // -------------------------------------------------------------------------
    _hal.log("");
    _hal.log("[ ADMISSION STATS ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Poll Cycles", _stats.pollCount);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Jobs Allowed", _stats.jobsAllowed);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Jobs Blocked", _stats.jobsBlocked);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Jobs Unmetered", _stats.jobsUnmetered);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Jobs Failed", _stats.jobsFailed);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %.2f", "Total Charged", _stats.totalCharged);
    _hal.log(logBuf);
}

// =================================================================================
// SECTION: STATE TRANSITION SYSTEM
// =================================================================================

void PrintMonitor::changeState(MonitorState newState) {
    if (_state == newState) return;
    _state = newState;

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), ">>> STATE CHANGE: %s", monitorStateToString(_state));
    logKeyValue("Monitor", logBuf);
}

// =================================================================================
// SECTION: API COMMANDS
// =================================================================================

/**
 * Loads pricing, records every job already queued as known (those are never
 * charged), and arms the poll schedule. A second call is a no-op and keeps
 * the known-jobs table intact.
 */
bool PrintMonitor::startMonitoring() {
    if (_state == MONITOR_MONITORING) {
        logKeyValue("Monitor", "WARNING: Already monitoring. Start ignored.");
        return true;
    }

    if (_userId.empty()) {
        logKeyValue("Monitor", "Start Failed: No user assigned.");
        return false;
    }

    _pricing.load(_store);
    seedKnownJobs();

    _lastPollTime = _hal.getMillis();
    _lastHeartbeatTime = _lastPollTime;

    changeState(MONITOR_MONITORING);
    return true;
}

/**
 * Disarms polling and forgets known jobs. Held printers are left to the
 * CrashRecoveryRegistry (admission never spans a stop).
 */
void PrintMonitor::stopMonitoring() {
    if (_state == MONITOR_STOPPED) return;

    _ledger.clear();
    changeState(MONITOR_STOPPED);
}

// =================================================================================
// SECTION: MAIN TICK
// =================================================================================

void PrintMonitor::tick() {
    if (_state != MONITOR_MONITORING) return;

    unsigned long now = _hal.getMillis();
    if (now - _lastPollTime < _defaults.pollIntervalMs) return;
    _lastPollTime = now;

    runPollCycle();

    if (_defaults.heartbeatIntervalMs > 0 && now - _lastHeartbeatTime >= _defaults.heartbeatIntervalMs) {
        _lastHeartbeatTime = now;
        logHeartbeat();
    }
}

// =================================================================================
// SECTION: POLLING
// =================================================================================

void PrintMonitor::seedKnownJobs() {
    char logBuf[MAX_LOG_LENGTH];
    _ledger.clear();

    std::vector<std::string> printers;
    try {
        printers = _spooler.listPrinters();
    } catch (const std::exception& e) {
        snprintf(logBuf, sizeof(logBuf), "Printer enumeration failed: %s", e.what());
        logKeyValue("Monitor", logBuf);
        return;
    } catch (...) {
        logKeyValue("Monitor", "Printer enumeration failed: unknown exception");
        return;
    }

    for (size_t i = 0; i < printers.size(); i++) {
        try {
            std::vector<PrintJob> jobs;
            if (_spooler.listJobs(printers[i], jobs)) {
                _ledger.replace(printers[i], JobLedger::idsOf(jobs));
            } else {
                snprintf(logBuf, sizeof(logBuf), "Seeding '%s' failed: queue unreadable", printers[i].c_str());
                logKeyValue("Monitor", logBuf);
            }
        } catch (const std::exception& e) {
            snprintf(logBuf, sizeof(logBuf), "Seeding '%s' failed: %s", printers[i].c_str(), e.what());
            logKeyValue("Monitor", logBuf);
        } catch (...) {
            snprintf(logBuf, sizeof(logBuf), "Seeding '%s' failed: unknown exception", printers[i].c_str());
            logKeyValue("Monitor", logBuf);
        }
    }

    snprintf(logBuf, sizeof(logBuf), "Found %u printer(s), %u existing job(s) ignored",
             (unsigned)printers.size(), (unsigned)_ledger.totalKnown());
    logKeyValue("Monitor", logBuf);
}

void PrintMonitor::runPollCycle() {
    char logBuf[MAX_LOG_LENGTH];
    _stats.pollCount++;

    std::vector<std::string> printers;
    try {
        printers = _spooler.listPrinters();
    } catch (const std::exception& e) {
        snprintf(logBuf, sizeof(logBuf), "Printer enumeration failed: %s", e.what());
        logKeyValue("Monitor", logBuf);
        return;
    } catch (...) {
        logKeyValue("Monitor", "Printer enumeration failed: unknown exception");
        return;
    }

    for (size_t i = 0; i < printers.size(); i++) {
        // A listener may have stopped us mid-cycle
        if (_state != MONITOR_MONITORING) return;

        try {
            pollPrinter(printers[i]);
        } catch (const std::exception& e) {
            snprintf(logBuf, sizeof(logBuf), "Error polling '%s': %s", printers[i].c_str(), e.what());
            logKeyValue("Monitor", logBuf);
        } catch (...) {
            snprintf(logBuf, sizeof(logBuf), "Error polling '%s': unknown exception", printers[i].c_str());
            logKeyValue("Monitor", logBuf);
        }
    }
}

void PrintMonitor::pollPrinter(const std::string& printer) {
    char logBuf[MAX_LOG_LENGTH];

    std::vector<PrintJob> jobs;
    if (!_spooler.listJobs(printer, jobs)) {
        // Unreadable is not empty: keep the known ids so nothing is admitted twice
        snprintf(logBuf, sizeof(logBuf), "Queue '%s' unreadable. Known jobs kept.", printer.c_str());
        logKeyValue("Monitor", logBuf);
        return;
    }

    JobLedger::JobIdSet current = JobLedger::idsOf(jobs);
    std::vector<uint32_t> fresh = _ledger.findNew(printer, current);

    if (!fresh.empty()) {
        bool held = holdPrinter(printer);

        for (size_t n = 0; n < fresh.size(); n++) {
            for (size_t j = 0; j < jobs.size(); j++) {
                if (jobs[j].jobId != fresh[n]) continue;

                // One bad job must not leave the queue held or the table stale
                try {
                    admitJob(jobs[j]);
                } catch (const std::exception& e) {
                    _stats.jobsFailed++;
                    snprintf(logBuf, sizeof(logBuf), "Admission of job %u threw: %s", jobs[j].jobId, e.what());
                    logKeyValue("Monitor", logBuf);
                } catch (...) {
                    _stats.jobsFailed++;
                    snprintf(logBuf, sizeof(logBuf), "Admission of job %u threw: unknown exception", jobs[j].jobId);
                    logKeyValue("Monitor", logBuf);
                }
                break;
            }
        }

        if (held) releasePrinter(printer);
    }

    if (_state == MONITOR_MONITORING) {
        _ledger.replace(printer, current);
    }
}

void PrintMonitor::logHeartbeat() {
    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "Alive: %u polls, %u known job(s), %u allowed / %u blocked",
             _stats.pollCount, (unsigned)_ledger.totalKnown(), _stats.jobsAllowed, _stats.jobsBlocked);
    logKeyValue("Monitor", logBuf);
}

/**
 * Registers the printer before pausing it, so a crash between the two
 * still leaves a journal entry to repair.
 */
bool PrintMonitor::holdPrinter(const std::string& printer) {
    if (!_defaults.holdPrinterDuringAdmission) return false;

    char logBuf[MAX_LOG_LENGTH];
    _recovery.markHeld(printer);

    if (!_spooler.pausePrinter(printer)) {
        _recovery.markReleased(printer);
        snprintf(logBuf, sizeof(logBuf), "WARNING: Could not hold queue '%s'. Using job-level pause only.", printer.c_str());
        logKeyValue("Monitor", logBuf);
        return false;
    }
    return true;
}

void PrintMonitor::releasePrinter(const std::string& printer) {
    char logBuf[MAX_LOG_LENGTH];

    if (_spooler.resumePrinter(printer)) {
        _recovery.markReleased(printer);
        return;
    }

    // Stays registered: the next hold or the exit handler retries it.
    snprintf(logBuf, sizeof(logBuf), "ERROR: Could not release queue '%s'. Left for recovery.", printer.c_str());
    logKeyValue("Monitor", logBuf);
}

// =================================================================================
// SECTION: ADMISSION
// =================================================================================

bool PrintMonitor::readBudget(double& outBudget, double& outStored, std::string& errorMsg) {
    StoreResult<JsonDocument> result = _store.get(userPath());
    const JsonDocument* doc = result.get();

    if (doc == nullptr) {
        errorMsg = std::string(storeErrorToString(result.errorKind())) + ": " + result.errorMessage();
        return false;
    }
    return StoreParsers::parseBudget(doc->as<JsonVariantConst>(), outBudget, outStored, errorMsg);
}

/**
 * Writes max(0, current - cost). Uses compare-and-swap against the stored
 * value we just read when the store supports it, a plain update otherwise.
 * Returns STORE_OK, STORE_CONFLICT, or the failing error kind.
 */
StoreErrorKind PrintMonitor::deductBudget(double storedBudget, double currentBudget, double cost, double& outNewBudget) {
    double newBudget = currentBudget - cost;
    if (newBudget < 0.0) newBudget = 0.0;

    char timestamp[32];
    _hal.formatTimestamp(timestamp, sizeof(timestamp));

    JsonDocument fields;
    fields[FIELD_REMAINING_PRINTS] = newBudget;
    fields[FIELD_UPDATED_AT] = timestamp;

    StoreResult<StoreAck> result = _store.updateIfEquals(userPath(), FIELD_REMAINING_PRINTS, storedBudget, fields);
    if (result.errorKind() == STORE_UNSUPPORTED) {
        result = _store.update(userPath(), fields);
    }

    if (!result.isOk()) {
        char logBuf[MAX_LOG_LENGTH];
        snprintf(logBuf, sizeof(logBuf), "Deduct failed (%s): %s", storeErrorToString(result.errorKind()),
                 result.errorMessage().c_str());
        logKeyValue("Budget", logBuf);
        return result.errorKind();
    }

    outNewBudget = newBudget;
    return STORE_OK;
}

AdmissionOutcome PrintMonitor::rejectJob(const PrintJob& job, const char* reason) {
    char logBuf[MAX_LOG_LENGTH];

    if (!_spooler.cancelJob(job.printerName, job.jobId)) {
        snprintf(logBuf, sizeof(logBuf), "SECURITY: Cancel of job %u failed. Job remains paused.", job.jobId);
        logKeyValue("Monitor", logBuf);
    }

    _stats.jobsFailed++;
    snprintf(logBuf, sizeof(logBuf), "Job %u '%s' cancelled: %s", job.jobId, job.documentName.c_str(), reason);
    logKeyValue("Monitor", logBuf);

    _listener.onPrintError(std::string("Print job '") + job.documentName + "' was cancelled: " + reason);
    return ADMIT_FAILED;
}

/**
 * Re-reads a job caught while its document was still arriving, until the
 * scheduler reports it complete or the page count holds steady. The job is
 * already paused, so waiting cannot let it print. Bounded by spoolWaitAttempts.
 */
PrintJob PrintMonitor::waitForSpoolComplete(const PrintJob& job) {
    if (_defaults.spoolWaitAttempts == 0) return job;
    if (!job.spooling && job.totalPages > 0) return job;

    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "Job %u still spooling (%d page(s)). Waiting for final count.",
             job.jobId, job.totalPages);
    logKeyValue("Monitor", logBuf);

    PrintJob latest = job;
    int32_t lastPages = job.totalPages;
    uint32_t stableReads = 0;

    for (uint32_t attempt = 0; attempt < _defaults.spoolWaitAttempts; attempt++) {
        _hal.delay(_defaults.spoolWaitIntervalMs);

        PrintJob current;
        if (!_spooler.getJob(job.printerName, job.jobId, current)) {
            snprintf(logBuf, sizeof(logBuf), "WARNING: Job %u disappeared during spool wait.", job.jobId);
            logKeyValue("Monitor", logBuf);
            return latest;
        }
        if (current.documentName.empty()) current.documentName = job.documentName;
        latest = current;

        if (!current.spooling && current.totalPages > 0) {
            snprintf(logBuf, sizeof(logBuf), "Job %u spooled: %d page(s)", job.jobId, current.totalPages);
            logKeyValue("Monitor", logBuf);
            return current;
        }

        if (current.totalPages > 0 && current.totalPages == lastPages) {
            if (++stableReads >= SPOOL_STABLE_READS) {
                snprintf(logBuf, sizeof(logBuf), "Job %u page count stable at %d", job.jobId, current.totalPages);
                logKeyValue("Monitor", logBuf);
                return current;
            }
        } else {
            stableReads = 0;
        }
        lastPages = current.totalPages;
    }

    snprintf(logBuf, sizeof(logBuf), "WARNING: Spool wait timed out for job %u (%d page(s)).", job.jobId,
             latest.totalPages);
    logKeyValue("Monitor", logBuf);
    return latest;
}

/**
 * Admission protocol for one newly observed job:
 * pause -> settle page count -> price -> fresh budget read -> deduct ->
 * resume, or cancel.
 * Nothing is charged unless the pause succeeded, and nothing is resumed
 * unless the deduction was written.
 */
AdmissionOutcome PrintMonitor::admitJob(const PrintJob& detected) {
    char logBuf[MAX_LOG_LENGTH];

    snprintf(logBuf, sizeof(logBuf), "New job %u on '%s': '%s'", detected.jobId, detected.printerName.c_str(),
             detected.documentName.c_str());
    logKeyValue("Monitor", logBuf);

    // 1. Pause first. Without a pause we cannot gate the job.
    if (!_spooler.pauseJob(detected.printerName, detected.jobId)) {
        _stats.jobsUnmetered++;
        snprintf(logBuf, sizeof(logBuf), "SECURITY: Could not pause job %u on '%s'. Job NOT metered.",
                 detected.jobId, detected.printerName.c_str());
        logKeyValue("Monitor", logBuf);
        return ADMIT_UNMETERED;
    }

    // 2. Settle the page count while the job is frozen
    const PrintJob job = waitForSpoolComplete(detected);

    // 3. Normalize (unknown counts are billed as one page)
    int32_t pages = job.totalPages > 0 ? job.totalPages : 1;
    int32_t copies = job.copies > 0 ? job.copies : 1;
    int billedPages = billablePages(pages, copies);

    snprintf(logBuf, sizeof(logBuf), "Job %u: %d page(s) x %d copies = %d billed", job.jobId, pages, copies,
             billedPages);
    logKeyValue("Monitor", logBuf);
    if ((int64_t)pages * copies > MAX_BILLED_PAGES) {
        snprintf(logBuf, sizeof(logBuf), "WARNING: Job %u page count capped at %d", job.jobId, MAX_BILLED_PAGES);
        logKeyValue("Monitor", logBuf);
    }

    // 4. Price
    double cost = _pricing.costOf(billedPages, job.isColor);

    // 5-6. Fresh read, decide, deduct. One retry if a concurrent writer won the CAS.
    for (int attempt = 0; attempt < 2; attempt++) {
        double budget = 0.0;
        double stored = 0.0;
        std::string errorMsg;
        if (!readBudget(budget, stored, errorMsg)) {
            snprintf(logBuf, sizeof(logBuf), "Budget read failed: %s", errorMsg.c_str());
            logKeyValue("Budget", logBuf);
            return rejectJob(job, "budget could not be verified");
        }

        snprintf(logBuf, sizeof(logBuf), "Job %u: cost %.2f, budget %.2f", job.jobId, cost, budget);
        logKeyValue("Budget", logBuf);

        if (budget + BUDGET_EPSILON < cost) {
            if (!_spooler.cancelJob(job.printerName, job.jobId)) {
                snprintf(logBuf, sizeof(logBuf), "SECURITY: Cancel of job %u failed. Job remains paused.", job.jobId);
                logKeyValue("Monitor", logBuf);
            }
            _stats.jobsBlocked++;
            snprintf(logBuf, sizeof(logBuf), "BLOCKED job %u '%s' (cost %.2f > budget %.2f)", job.jobId,
                     job.documentName.c_str(), cost, budget);
            logKeyValue("Monitor", logBuf);
            _listener.onJobBlocked(job.documentName, billedPages, cost, budget);
            return ADMIT_BLOCKED;
        }

        double newBudget = 0.0;
        StoreErrorKind deduct = deductBudget(stored, budget, cost, newBudget);

        if (deduct == STORE_CONFLICT && attempt == 0) {
            logKeyValue("Budget", "Balance changed concurrently. Re-reading.");
            continue;
        }
        if (deduct != STORE_OK) {
            return rejectJob(job, "budget deduction failed");
        }

        // Charged. Release the job.
        if (!_spooler.resumeJob(job.printerName, job.jobId)) {
            snprintf(logBuf, sizeof(logBuf), "ERROR: Job %u was charged but could not be resumed.", job.jobId);
            logKeyValue("Monitor", logBuf);
            _listener.onPrintError(std::string("Print job '") + job.documentName + "' was charged but is still paused.");
        }

        _stats.jobsAllowed++;
        _stats.totalCharged += cost;
        snprintf(logBuf, sizeof(logBuf), "ALLOWED job %u '%s' (charged %.2f, remaining %.2f)", job.jobId,
                 job.documentName.c_str(), cost, newBudget);
        logKeyValue("Monitor", logBuf);

        _listener.onBudgetUpdated(newBudget);
        _listener.onJobAllowed(job.documentName, billedPages, cost, newBudget);
        return ADMIT_ALLOWED;
    }

    return rejectJob(job, "budget changed during admission");
}
