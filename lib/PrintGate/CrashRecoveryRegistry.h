/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/CrashRecoveryRegistry.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Process-wide set of printers held (paused) at queue level.
 * - Shared by the poll thread and the exit/signal handlers, hence the mutex.
 * - Every change is mirrored to the HAL crash journal so that a hard crash
 *   can be repaired on the next start.
 * =================================================================================
 */
#pragma once
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "KioskContext.h"
#include "SpoolerContext.h"

class CrashRecoveryRegistry {
public:
    CrashRecoveryRegistry(IKioskHAL& hal, ISpoolerAdapter& spooler);

    void markHeld(const std::string& printer);
    void markReleased(const std::string& printer);

    bool isHeld(const std::string& printer) const;
    std::vector<std::string> snapshot() const;
    size_t size() const;

    /**
     * Exit safety handler. Issues resumePrinter for every held printer.
     * Best-effort: failures (including exceptions) are logged and the loop
     * continues. Printers that resume are removed, so repeated calls only
     * retry the ones still held. Never throws.
     * @return number of printers resumed.
     */
    size_t resumeAll(const char* source);

    // Loads printers left held by a previous (crashed) run and resumes them.
    size_t restoreFromJournal();

private:
    IKioskHAL& _hal;
    ISpoolerAdapter& _spooler;

    mutable std::mutex _mutex;
    std::set<std::string> _held;

    // Caller holds _mutex
    void persistLocked();
    bool tryResume(const std::string& printer);

    void logKeyValue(const char *key, const char *value);
};
