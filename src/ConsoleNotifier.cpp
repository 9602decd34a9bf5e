/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      src/ConsoleNotifier.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <stdio.h>

#include "ConsoleNotifier.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: PRINT EVENTS
// =================================================================================

void ConsoleNotifier::onJobAllowed(const std::string &document, int pages, double cost, double remainingBudget) {
  char logBuf[MAX_LOG_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "Printing '%s' (%d page(s), %.2f). Balance: %.2f", document.c_str(), pages, cost,
           remainingBudget);
  _hal.logKeyValue("Notify", logBuf);
}

void ConsoleNotifier::onJobBlocked(const std::string &document, int pages, double cost, double budgetAtCheck) {
  char logBuf[MAX_LOG_LENGTH];
  snprintf(logBuf, sizeof(logBuf), "Not enough balance for '%s' (%d page(s), %.2f needed, %.2f available)",
           document.c_str(), pages, cost, budgetAtCheck);
  _hal.logKeyValue("Notify", logBuf);
}

void ConsoleNotifier::onBudgetUpdated(double newBudget) {
  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Print balance: %.2f", newBudget);
  _hal.logKeyValue("Notify", logBuf);
}

void ConsoleNotifier::onPrintError(const std::string &message) { _hal.logKeyValue("Notify", message.c_str()); }

// =================================================================================
// SECTION: SESSION EVENTS
// =================================================================================

void ConsoleNotifier::onSessionStarted(const std::string &userId, uint32_t remainingSeconds) {
  char timeStr[48];
  char logBuf[MAX_LOG_LENGTH];
  TimeUtils::formatSeconds(remainingSeconds, timeStr, sizeof(timeStr));
  snprintf(logBuf, sizeof(logBuf), "Welcome %s. Time available: %s", userId.c_str(), timeStr);
  _hal.logKeyValue("Notify", logBuf);
  _sessionOver = false;
}

void ConsoleNotifier::onTimeUpdated(uint32_t remainingSeconds) {
  // Once a minute is enough for a console
  if (remainingSeconds % 60 != 0)
    return;
  char timeStr[48];
  char logBuf[64];
  TimeUtils::formatSeconds(remainingSeconds, timeStr, sizeof(timeStr));
  snprintf(logBuf, sizeof(logBuf), "Time left: %s", timeStr);
  _hal.logKeyValue("Notify", logBuf);
}

void ConsoleNotifier::onTimeWarning(uint32_t secondsRemaining) {
  char timeStr[48];
  char logBuf[64];
  TimeUtils::formatSeconds(secondsRemaining, timeStr, sizeof(timeStr));
  snprintf(logBuf, sizeof(logBuf), "WARNING: Only %s left!", timeStr);
  _hal.logKeyValue("Notify", logBuf);
}

void ConsoleNotifier::onSessionEnded(SessionEndReason reason) {
  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Session ended (%s).", endReasonToString(reason));
  _hal.logKeyValue("Notify", logBuf);
  _sessionOver = true;
}

void ConsoleNotifier::onSyncFailed() { _hal.logKeyValue("Notify", "Connection lost. Working offline."); }

void ConsoleNotifier::onSyncRestored() { _hal.logKeyValue("Notify", "Connection restored."); }

void ConsoleNotifier::onOperatingHoursWarning(uint32_t minutesLeft) {
  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Closing in %u minute(s). Please save your work.", minutesLeft);
  _hal.logKeyValue("Notify", logBuf);
}
