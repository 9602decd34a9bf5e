/*
 * =================================================================================
 * File:      lib/PrintGate/PrintEvents.h
 * Description: Listener interfaces for admission and session events (UI layer).
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <string>
#include "Types.h"

class IPrintEventListener {
public:
    virtual ~IPrintEventListener() {}

    virtual void onJobAllowed(const std::string& document, int pages, double cost, double remainingBudget) = 0;
    virtual void onJobBlocked(const std::string& document, int pages, double cost, double budgetAtCheck) = 0;
    virtual void onBudgetUpdated(double newBudget) = 0;
    virtual void onPrintError(const std::string& message) = 0;
};

class ISessionListener {
public:
    virtual ~ISessionListener() {}

    virtual void onSessionStarted(const std::string& userId, uint32_t remainingSeconds) = 0;
    virtual void onTimeUpdated(uint32_t remainingSeconds) = 0;
    virtual void onTimeWarning(uint32_t secondsRemaining) = 0;
    virtual void onSessionEnded(SessionEndReason reason) = 0;
    virtual void onSyncFailed() = 0;
    virtual void onSyncRestored() = 0;
    virtual void onOperatingHoursWarning(uint32_t minutesLeft) = 0;
};
