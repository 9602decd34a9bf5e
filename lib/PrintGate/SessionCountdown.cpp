/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/SessionCountdown.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Session time budget.
 * - Counts down locally once per tick; the store is only written every
 *   syncIntervalSeconds and at the end.
 * - Starts/stops the PrintMonitor together with the session.
 * =================================================================================
 */
#include <stdio.h>

#include "SessionCountdown.h"
#include "StoreParsers.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

SessionCountdown::SessionCountdown(IKioskHAL& hal,
                                   IBudgetStore& store,
                                   PrintMonitor& monitor,
                                   ISessionListener& listener,
                                   const CountdownDefaults& defaults,
                                   const OperatingHours& hoursDefaults)
    : _hal(hal),
      _store(store),
      _monitor(monitor),
      _listener(listener),
      _defaults(defaults),
      _hoursDefaults(hoursDefaults),
      _hours(hoursDefaults)
{
    _state = SESSION_IDLE;
    _remainingSeconds = 0;
    _elapsedSeconds = 0;
    _lastEndReason = END_USER;

    _warnedFirst = false;
    _warnedFinal = false;
    _warnedHours = false;

    _ticksSinceSync = 0;
    _ticksSinceHoursCheck = 0;
    _syncFailures = 0;
    _online = true;
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging & Diagnostics)
// =================================================================================

void SessionCountdown::logKeyValue(const char *key, const char *value) {
    char tempBuf[MAX_LOG_LENGTH];
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

void SessionCountdown::printStartupDiagnostics() {
    char logBuf[128];
    char timeStr[48];
    const char* boolStr[] = { "NO", "YES" };

    _hal.log("==========================================================================");
    _hal.log("                        SESSION COUNTDOWN DIAGNOSTICS                     ");
    _hal.log("==========================================================================");

    _hal.log("[ SESSION STATE ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Current Mode", sessionStateToString(_state));
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "User", _userId.empty() ? "(none)" : _userId.c_str());
    _hal.log(logBuf);

    TimeUtils::formatSeconds(_remainingSeconds, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Remaining", timeStr);
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s (%u consecutive failures)", "Store Online",
             boolStr[_online], _syncFailures);
    _hal.log(logBuf);

    _hal.log("");
    _hal.log("[ TIMING ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u s", "Sync Interval", _defaults.syncIntervalSeconds);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u s / %u s", "Warnings At",
             _defaults.firstWarningSeconds, _defaults.finalWarningSeconds);
    _hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Max Sync Failures", _defaults.maxSyncFailures);
    _hal.log(logBuf);

    _hal.log("");
    _hal.log("[ OPERATING HOURS ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Enforced", boolStr[_hours.enabled]);
    _hal.log(logBuf);

    if (_hours.enabled) {
        char startStr[8];
        char endStr[8];
        TimeUtils::formatClock(_hours.startMinute, startStr, sizeof(startStr));
        TimeUtils::formatClock(_hours.endMinute, endStr, sizeof(endStr));
        snprintf(logBuf, sizeof(logBuf), " %-25s : %s - %s", "Window", startStr, endStr);
        _hal.log(logBuf);
        snprintf(logBuf, sizeof(logBuf), " %-25s : %u min (%s)", "Grace Period",
                 _hours.gracePeriodMinutes, _hours.forceEnd ? "force" : "graceful");
        _hal.log(logBuf);
    }
}

void SessionCountdown::changeState(SessionState newState) {
    if (_state == newState) return;
    _state = newState;

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), ">>> STATE CHANGE: %s", sessionStateToString(_state));
    logKeyValue("Session", logBuf);
}

// =================================================================================
// SECTION: OPERATING HOURS
// =================================================================================

void SessionCountdown::loadOperatingHours() {
    _hours = _hoursDefaults;

    StoreResult<JsonDocument> result = _store.get(STORE_PATH_OPERATING_HOURS);
    const JsonDocument* doc = result.get();
    if (doc == nullptr) {
        if (result.errorKind() != STORE_NOT_FOUND) {
            logKeyValue("Hours", "WARNING: Could not load operating hours. Using defaults.");
        }
        return;
    }

    OperatingHours parsed = _hoursDefaults;
    std::string errorMsg;
    if (!StoreParsers::parseOperatingHours(doc->as<JsonVariantConst>(), parsed, errorMsg)) {
        char logBuf[MAX_LOG_LENGTH];
        snprintf(logBuf, sizeof(logBuf), "WARNING: %s Using defaults.", errorMsg.c_str());
        logKeyValue("Hours", logBuf);
        return;
    }
    _hours = parsed;
}

bool SessionCountdown::isWithinOperatingHours() {
    if (!_hours.enabled) return true;
    return TimeUtils::isWithinWindow(_hal.getMinutesOfDay(), _hours.startMinute, _hours.endMinute);
}

void SessionCountdown::checkOperatingHours() {
    if (!_hours.enabled) return;

    char logBuf[MAX_LOG_LENGTH];
    int now = _hal.getMinutesOfDay();

    if (!TimeUtils::isWithinWindow(now, _hours.startMinute, _hours.endMinute)) {
        snprintf(logBuf, sizeof(logBuf), "Closing time reached (%s). Ending session.",
                 _hours.forceEnd ? "force" : "graceful");
        logKeyValue("Hours", logBuf);
        endSession(END_HOURS);
        return;
    }

    int minutesLeft = TimeUtils::minutesUntil(now, _hours.endMinute);
    if (!_warnedHours && minutesLeft > 0 && (uint32_t)minutesLeft <= _hours.gracePeriodMinutes) {
        _warnedHours = true;
        snprintf(logBuf, sizeof(logBuf), "Closing in %d min.", minutesLeft);
        logKeyValue("Hours", logBuf);
        _listener.onOperatingHoursWarning((uint32_t)minutesLeft);
    }
}

// =================================================================================
// SECTION: SYNC
// =================================================================================

void SessionCountdown::syncRemainingTime() {
    char timestamp[32];
    _hal.formatTimestamp(timestamp, sizeof(timestamp));

    JsonDocument fields;
    fields[FIELD_REMAINING_TIME] = _remainingSeconds;
    fields[FIELD_UPDATED_AT] = timestamp;

    StoreResult<StoreAck> result = _store.update(userPath(), fields);
    char logBuf[MAX_LOG_LENGTH];

    if (!result.isOk()) {
        _syncFailures++;
        snprintf(logBuf, sizeof(logBuf), "Sync failed (%u/%u): %s", _syncFailures, _defaults.maxSyncFailures,
                 result.errorMessage().c_str());
        logKeyValue("Sync", logBuf);

        if (_online && _syncFailures >= _defaults.maxSyncFailures) {
            _online = false;
            logKeyValue("Sync", "Store unreachable. Session continues offline.");
            _listener.onSyncFailed();
        }
        return;
    }

    _syncFailures = 0;
    if (!_online) {
        _online = true;
        logKeyValue("Sync", "Store reachable again.");
        _listener.onSyncRestored();
    }
}

void SessionCountdown::finalSync() {
    char timestamp[32];
    _hal.formatTimestamp(timestamp, sizeof(timestamp));

    JsonDocument fields;
    fields[FIELD_REMAINING_TIME] = _remainingSeconds;
    fields[FIELD_SESSION_ACTIVE] = false;
    fields[FIELD_SESSION_START] = nullptr;
    fields[FIELD_UPDATED_AT] = timestamp;

    StoreResult<StoreAck> result = _store.update(userPath(), fields);
    if (!result.isOk()) {
        char logBuf[MAX_LOG_LENGTH];
        snprintf(logBuf, sizeof(logBuf), "ERROR: Final sync failed: %s", result.errorMessage().c_str());
        logKeyValue("Sync", logBuf);
    }
}

// =================================================================================
// SECTION: MAIN TICK
// =================================================================================

void SessionCountdown::checkTimeWarnings() {
    if (!_warnedFirst && _remainingSeconds <= _defaults.firstWarningSeconds) {
        _warnedFirst = true;
        _listener.onTimeWarning(_remainingSeconds);
    }
    if (!_warnedFinal && _remainingSeconds <= _defaults.finalWarningSeconds) {
        _warnedFinal = true;
        _listener.onTimeWarning(_remainingSeconds);
    }
}

/**
 * Called 1x/sec by the host loop.
 */
void SessionCountdown::tick() {
    if (_state != SESSION_ACTIVE) return;

    if (_remainingSeconds > 0) _remainingSeconds--;
    _elapsedSeconds++;

    _listener.onTimeUpdated(_remainingSeconds);

    if (_remainingSeconds == 0) {
        logKeyValue("Session", "Time expired.");
        endSession(END_EXPIRED);
        return;
    }

    checkTimeWarnings();

    if (++_ticksSinceSync >= _defaults.syncIntervalSeconds) {
        _ticksSinceSync = 0;
        syncRemainingTime();
    }

    if (_hours.enabled && ++_ticksSinceHoursCheck >= _defaults.hoursCheckIntervalSeconds) {
        _ticksSinceHoursCheck = 0;
        checkOperatingHours();
    }
}

// =================================================================================
// SECTION: ACTIONS & TRANSITIONS
// =================================================================================

int SessionCountdown::startSession(const std::string& userId, uint32_t remainingSeconds) {
    char logBuf[MAX_LOG_LENGTH];

    if (_state == SESSION_ACTIVE) {
        logKeyValue("Session", "Start Failed: Session already active.");
        return 409;
    }
    if (userId.empty() || remainingSeconds == 0) {
        logKeyValue("Session", "Start Failed: No user or no time remaining.");
        return 400;
    }

    _userId = userId;

    // 1. Operating hours gate
    loadOperatingHours();
    if (!isWithinOperatingHours()) {
        logKeyValue("Session", "Start Failed: Outside operating hours.");
        return 403;
    }

    // 2. Mark the session active remotely
    char timestamp[32];
    _hal.formatTimestamp(timestamp, sizeof(timestamp));

    JsonDocument fields;
    fields[FIELD_SESSION_ACTIVE] = true;
    fields[FIELD_SESSION_START] = timestamp;
    fields[FIELD_UPDATED_AT] = timestamp;

    StoreResult<StoreAck> result = _store.update(userPath(), fields);
    if (!result.isOk()) {
        snprintf(logBuf, sizeof(logBuf), "Start Failed: %s", result.errorMessage().c_str());
        logKeyValue("Session", logBuf);
        return 503;
    }

    // 3. Reset per-session state
    _remainingSeconds = remainingSeconds;
    _elapsedSeconds = 0;
    _warnedFirst = false;
    _warnedFinal = false;
    _warnedHours = false;
    _ticksSinceSync = 0;
    _ticksSinceHoursCheck = 0;
    _syncFailures = 0;
    _online = true;

    changeState(SESSION_ACTIVE);

    char timeStr[48];
    TimeUtils::formatSeconds(_remainingSeconds, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), "Started for '%s' with %s", _userId.c_str(), timeStr);
    logKeyValue("Session", logBuf);

    // 4. Print gate follows the session
    _monitor.setUserId(_userId);
    if (!_monitor.startMonitoring()) {
        logKeyValue("Session", "WARNING: Print monitoring could not start.");
    }

    _listener.onSessionStarted(_userId, _remainingSeconds);
    return 200;
}

int SessionCountdown::endSession(SessionEndReason reason) {
    if (_state != SESSION_ACTIVE) {
        logKeyValue("Session", "End ignored: No active session.");
        return 409;
    }

    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "Ending session (reason: %s)", endReasonToString(reason));
    logKeyValue("Session", logBuf);

    // Stop metering before anything else so no job slips into a closed session
    _monitor.stopMonitoring();

    finalSync();

    _lastEndReason = reason;
    changeState(SESSION_IDLE);

    _listener.onSessionEnded(reason);
    return 200;
}
