/*
 * =================================================================================
 * File:      include/ConsoleNotifier.h
 * Description: Headless stand-in for the kiosk UI. Turns admission and
 * session events into user-facing log lines.
 * =================================================================================
 */
#pragma once
#include "PrintEvents.h"
#include "LinuxKioskHAL.h"

class ConsoleNotifier : public IPrintEventListener, public ISessionListener {
public:
  explicit ConsoleNotifier(LinuxKioskHAL &hal) : _hal(hal), _sessionOver(false) {}

  // --- Print Events ---
  void onJobAllowed(const std::string &document, int pages, double cost, double remainingBudget) override;
  void onJobBlocked(const std::string &document, int pages, double cost, double budgetAtCheck) override;
  void onBudgetUpdated(double newBudget) override;
  void onPrintError(const std::string &message) override;

  // --- Session Events ---
  void onSessionStarted(const std::string &userId, uint32_t remainingSeconds) override;
  void onTimeUpdated(uint32_t remainingSeconds) override;
  void onTimeWarning(uint32_t secondsRemaining) override;
  void onSessionEnded(SessionEndReason reason) override;
  void onSyncFailed() override;
  void onSyncRestored() override;
  void onOperatingHoursWarning(uint32_t minutesLeft) override;

  // True once the session ended, for the main loop.
  bool isSessionOver() const { return _sessionOver; }

private:
  LinuxKioskHAL &_hal;
  bool _sessionOver;
};
