/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file. Defines application identity, default file
 * locations, polling/countdown defaults and safety limits for settings.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// --- Application Name String ---
#define KIOSK_NAME "kiosk-printgate"
#ifndef KIOSK_VERSION
#define KIOSK_VERSION "1.0.0"
#endif

// =================================================================================
// SECTION: FILE LOCATIONS
// =================================================================================

#define DEFAULT_CONFIG_PATH "/etc/kiosk-printgate/printgate.json"
#define DEFAULT_STORE_PATH "/var/lib/kiosk-printgate/store.json"
#define DEFAULT_JOURNAL_PATH "/var/lib/kiosk-printgate/held-printers.json"
#define DEFAULT_LOG_PATH ""  // empty = stderr only

// =================================================================================
// SECTION: MAIN LOOP
// =================================================================================

#define MAIN_LOOP_SLEEP_MS 100
#define STATE_LOCK_TIMEOUT_MS 100
#define LOG_LINES_PER_FLUSH 20

// --- Safety Limits (SettingsManager clamps to these) ---
#define MIN_POLL_INTERVAL_MS 250
#define MAX_POLL_INTERVAL_MS 10000
#define MIN_SYNC_INTERVAL_S 10
#define MAX_SYNC_INTERVAL_S 600
#define MAX_PRICE_PER_PAGE 1000.0
#define MAX_SPOOL_WAIT_ATTEMPTS 20
#define MIN_SPOOL_WAIT_INTERVAL_MS 100
#define MAX_SPOOL_WAIT_INTERVAL_MS 2000
#define MAX_SESSION_SECONDS 86400

#ifdef DEBUG_MODE
// ============================================================================
// DEBUG / DEVELOPMENT DEFAULTS
// ============================================================================
static const MonitorDefaults DEFAULT_MONITOR_DEFS = {
    1000,  // pollIntervalMs
    true,  // holdPrinterDuringAdmission
    1.0,   // defaultBlackWhitePrice
    3.0,   // defaultColorPrice
    10000, // heartbeatIntervalMs
    6,     // spoolWaitAttempts
    500    // spoolWaitIntervalMs
};

static const CountdownDefaults DEFAULT_COUNTDOWN_DEFS = {
    10,  // syncIntervalSeconds
    300, // firstWarningSeconds
    60,  // finalWarningSeconds
    3,   // maxSyncFailures
    10   // hoursCheckIntervalSeconds
};

#else
// ============================================================================
// PRODUCTION / RELEASE DEFAULTS
// ============================================================================
static const MonitorDefaults DEFAULT_MONITOR_DEFS = {
    1000,  // pollIntervalMs
    true,  // holdPrinterDuringAdmission
    1.0,   // defaultBlackWhitePrice
    3.0,   // defaultColorPrice
    30000, // heartbeatIntervalMs
    6,     // spoolWaitAttempts
    500    // spoolWaitIntervalMs
};

static const CountdownDefaults DEFAULT_COUNTDOWN_DEFS = {
    60,  // syncIntervalSeconds
    300, // firstWarningSeconds
    60,  // finalWarningSeconds
    3,   // maxSyncFailures
    30   // hoursCheckIntervalSeconds
};
#endif

// Operating hours apply only when the store enables them.
static const OperatingHours DEFAULT_OPERATING_HOURS = {
    false,   // enabled
    6 * 60,  // startMinute (06:00)
    0,       // endMinute (00:00)
    5,       // gracePeriodMinutes
    false    // forceEnd ("graceful")
};
