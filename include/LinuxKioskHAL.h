/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      include/LinuxKioskHAL.h
 * Description: Header for the Linux implementation of IKioskHAL.
 * Encapsulates Clock, Logging (RAM ring + stderr/file queue), the state lock
 * and the crash journal.
 * =================================================================================
 */
#pragma once

#include <chrono>
#include <mutex>
#include <stdio.h>
#include <string>
#include <vector>

#include "KioskContext.h"
#include "Types.h"

class LinuxKioskHAL : public IKioskHAL {
private:
  LinuxKioskHAL();

  // --- Synchronization ---
  std::recursive_timed_mutex _stateMutex;
  std::mutex _logMutex;

  // --- Log State (RAM + Output Queue) ---
  char _logBuffer[LOG_BUFFER_SIZE][MAX_LOG_LENGTH];
  int _logBufferIndex;
  char _outputQueue[LOG_QUEUE_SIZE][MAX_LOG_LENGTH];
  int _queueHead;
  int _queueTail;
  unsigned long _overflowWrites;
  FILE *_logFile;

  // --- Clock ---
  std::chrono::steady_clock::time_point _bootTime;

  // --- Journal ---
  std::string _journalPath;

  // Writes one formatted line to stderr and the log file. Caller holds _logMutex.
  void writeLineLocked(const char *line);

public:
  static LinuxKioskHAL &getInstance();

  void initialize(const std::string &logPath, const std::string &journalPath);
  void tick();
  void shutdown();

  // --- Thread Safety (Mutex Wrapper) ---
  // Returns true if lock acquired, false if timeout/busy
  bool lockState(uint32_t timeoutMs = 100);
  void unlockState();

  // --- Logging API ---
  void log(const char *message) override;
  void logKeyValue(const char *key, const char *value);
  void processLogQueue(int maxLines);
  void printStartupDiagnostics();

  const char *getLogLine(int index) const {
    if (index >= 0 && index < LOG_BUFFER_SIZE)
      return _logBuffer[index];
    return "";
  }
  int getLogBufferIndex() const { return _logBufferIndex; }
  unsigned long getOverflowWrites() const { return _overflowWrites; }

  // --- IKioskHAL Implementation ---
  unsigned long getMillis() override;
  void formatTimestamp(char *buffer, size_t size) override;
  int getMinutesOfDay() override;
  void delay(uint32_t ms) override;
  void saveHeldPrinters(const std::vector<std::string> &printers) override;
  bool loadHeldPrinters(std::vector<std::string> &printers) override;
};
