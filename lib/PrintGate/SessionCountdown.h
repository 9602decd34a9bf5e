/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/SessionCountdown.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Header for the SessionCountdown class.
 * - Per-second countdown of the purchased time, with one-shot warnings.
 * - Periodic sync of the remaining time to the store, offline tracking.
 * - Operating hours enforcement.
 * - Owns the PrintMonitor lifecycle: monitoring runs exactly while a
 *   session is active.
 * =================================================================================
 */
#pragma once
#include <string>
#include "Types.h"
#include "KioskContext.h"
#include "BudgetStore.h"
#include "PrintEvents.h"
#include "PrintMonitor.h"

class SessionCountdown {
public:
    SessionCountdown(IKioskHAL& hal,
                     IBudgetStore& store,
                     PrintMonitor& monitor,
                     ISessionListener& listener,
                     const CountdownDefaults& defaults,
                     const OperatingHours& hoursDefaults);

    // --- Main Loop Tick (1x/sec) ---
    void tick();

    // --- API Commands ---
    // Returns 200, or 400 (bad request), 403 (outside hours), 409 (already active),
    // 503 (store rejected the session start).
    int startSession(const std::string& userId, uint32_t remainingSeconds);
    int endSession(SessionEndReason reason);

    // --- State Accessors (Read-Only) ---
    SessionState getState() const { return _state; }
    const std::string& getUserId() const { return _userId; }
    uint32_t getRemainingSeconds() const { return _remainingSeconds; }
    uint32_t getElapsedSeconds() const { return _elapsedSeconds; }
    bool isOnline() const { return _online; }
    uint32_t getConsecutiveSyncFailures() const { return _syncFailures; }
    SessionEndReason getLastEndReason() const { return _lastEndReason; }
    const OperatingHours& getOperatingHours() const { return _hours; }

    void printStartupDiagnostics();

private:
    // --- Dependencies ---
    IKioskHAL& _hal;
    IBudgetStore& _store;
    PrintMonitor& _monitor;
    ISessionListener& _listener;

    // --- Configuration ---
    CountdownDefaults _defaults;
    OperatingHours _hoursDefaults;
    OperatingHours _hours;

    // --- Dynamic State ---
    SessionState _state;
    std::string _userId;
    uint32_t _remainingSeconds;
    uint32_t _elapsedSeconds;
    SessionEndReason _lastEndReason;

    // --- One-shot Warning Flags (reset per session) ---
    bool _warnedFirst;
    bool _warnedFinal;
    bool _warnedHours;

    // --- Sync State ---
    uint32_t _ticksSinceSync;
    uint32_t _ticksSinceHoursCheck;
    uint32_t _syncFailures;
    bool _online;

    void changeState(SessionState newState);

    void loadOperatingHours();
    bool isWithinOperatingHours();
    void checkOperatingHours();
    void checkTimeWarnings();
    void syncRemainingTime();
    void finalSync();

    std::string userPath() const { return std::string(STORE_PATH_USERS) + _userId; }

    void logKeyValue(const char *key, const char *value);
};
