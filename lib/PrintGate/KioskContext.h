/*
 * =================================================================================
 * File:      lib/PrintGate/KioskContext.h
 * Description: Abstraction layer (HAL) for Clock, Persistence, and Logging.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>
#include "Types.h"

class IKioskHAL {
public:
    virtual ~IKioskHAL() {}

    // --- Logging ---
    // Must be safe to call from the exit/signal thread.
    virtual void log(const char* message) = 0;

    // --- Clock ---
    // Monotonic milliseconds (never jumps with wall-clock changes).
    virtual unsigned long getMillis() = 0;

    // Local wall-clock time as ISO-8601 ("2024-05-01T13:45:10").
    virtual void formatTimestamp(char* buffer, size_t size) = 0;

    // Local wall-clock minutes since midnight (0..1439).
    virtual int getMinutesOfDay() = 0;

    // Blocks the calling thread.
    virtual void delay(uint32_t ms) = 0;

    // --- Storage (Crash Journal) ---
    // Persists the set of printers currently held at queue level.
    virtual void saveHeldPrinters(const std::vector<std::string>& printers) = 0;

    // Returns false if no journal exists.
    virtual bool loadHeldPrinters(std::vector<std::string>& printers) = 0;
};
