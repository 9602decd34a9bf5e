/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/CrashRecoveryRegistry.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Held-printer bookkeeping and the exit safety handler.
 * =================================================================================
 */
#include <stdio.h>
#include <exception>

#include "CrashRecoveryRegistry.h"

CrashRecoveryRegistry::CrashRecoveryRegistry(IKioskHAL& hal, ISpoolerAdapter& spooler)
    : _hal(hal), _spooler(spooler) {}

void CrashRecoveryRegistry::logKeyValue(const char *key, const char *value) {
    char tempBuf[MAX_LOG_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

// =================================================================================
// SECTION: BOOKKEEPING
// =================================================================================

void CrashRecoveryRegistry::markHeld(const std::string& printer) {
    std::lock_guard<std::mutex> guard(_mutex);
    if (_held.insert(printer).second) {
        persistLocked();
    }
}

void CrashRecoveryRegistry::markReleased(const std::string& printer) {
    std::lock_guard<std::mutex> guard(_mutex);
    if (_held.erase(printer) > 0) {
        persistLocked();
    }
}

bool CrashRecoveryRegistry::isHeld(const std::string& printer) const {
    std::lock_guard<std::mutex> guard(_mutex);
    return _held.count(printer) > 0;
}

std::vector<std::string> CrashRecoveryRegistry::snapshot() const {
    std::lock_guard<std::mutex> guard(_mutex);
    return std::vector<std::string>(_held.begin(), _held.end());
}

size_t CrashRecoveryRegistry::size() const {
    std::lock_guard<std::mutex> guard(_mutex);
    return _held.size();
}

void CrashRecoveryRegistry::persistLocked() {
    _hal.saveHeldPrinters(std::vector<std::string>(_held.begin(), _held.end()));
}

// =================================================================================
// SECTION: RECOVERY
// =================================================================================

bool CrashRecoveryRegistry::tryResume(const std::string& printer) {
    char logBuf[MAX_LOG_LENGTH];
    bool resumed = false;

    try {
        resumed = _spooler.resumePrinter(printer);
    } catch (const std::exception& e) {
        snprintf(logBuf, sizeof(logBuf), "Resume of '%s' threw: %s", printer.c_str(), e.what());
        logKeyValue("Recovery", logBuf);
        return false;
    } catch (...) {
        snprintf(logBuf, sizeof(logBuf), "Resume of '%s' threw: unknown exception", printer.c_str());
        logKeyValue("Recovery", logBuf);
        return false;
    }

    snprintf(logBuf, sizeof(logBuf), "Resume '%s': %s", printer.c_str(), resumed ? "OK" : "FAILED");
    logKeyValue("Recovery", logBuf);
    return resumed;
}

size_t CrashRecoveryRegistry::resumeAll(const char* source) {
    // Work on a copy so the spooler is never called with the lock held.
    std::vector<std::string> pending = snapshot();
    if (pending.empty()) return 0;

    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "%s: resuming %u held printer(s)", source, (unsigned)pending.size());
    logKeyValue("Recovery", logBuf);

    size_t resumedCount = 0;
    for (size_t i = 0; i < pending.size(); i++) {
        if (tryResume(pending[i])) {
            markReleased(pending[i]);
            resumedCount++;
        }
    }

    if (resumedCount < pending.size()) {
        snprintf(logBuf, sizeof(logBuf), "WARNING: %u printer(s) still held (kept in journal)",
                 (unsigned)(pending.size() - resumedCount));
        logKeyValue("Recovery", logBuf);
    }
    return resumedCount;
}

size_t CrashRecoveryRegistry::restoreFromJournal() {
    std::vector<std::string> leftovers;
    if (!_hal.loadHeldPrinters(leftovers) || leftovers.empty()) {
        logKeyValue("Recovery", "Journal clean. No held printers from a previous run.");
        return 0;
    }

    {
        std::lock_guard<std::mutex> guard(_mutex);
        _held.insert(leftovers.begin(), leftovers.end());
    }

    logKeyValue("Recovery", "Previous run left printers held. Recovering...");
    return resumeAll("Journal Replay");
}
