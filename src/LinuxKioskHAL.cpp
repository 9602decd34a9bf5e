/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      src/LinuxKioskHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Linux platform layer. Monotonic clock, local wall-clock, thread-safe
 * logging with a RAM history and a bounded output queue, recursive state
 * lock shared by the main loop and the signal thread, crash journal.
 * =================================================================================
 */
#include <errno.h>
#include <string.h>
#include <time.h>
#include <unistd.h>

#include "Config.h"
#include "LinuxKioskHAL.h"
#include "SettingsManager.h"
#include "Storage.h"

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

LinuxKioskHAL::LinuxKioskHAL()
    : _logBufferIndex(0), _queueHead(0), _queueTail(0), _overflowWrites(0), _logFile(NULL),
      _bootTime(std::chrono::steady_clock::now()) {
  // Clear log buffer
  for (int i = 0; i < LOG_BUFFER_SIZE; i++)
    _logBuffer[i][0] = '\0';
}

LinuxKioskHAL &LinuxKioskHAL::getInstance() {
  static LinuxKioskHAL instance;
  return instance;
}

// --- Initialization ---

void LinuxKioskHAL::initialize(const std::string &logPath, const std::string &journalPath) {
  _journalPath = journalPath;

  // 1. Optional log file (append)
  if (!logPath.empty()) {
    ensureParentDirectory(logPath);
    _logFile = fopen(logPath.c_str(), "a");
    if (_logFile == NULL) {
      char logBuf[MAX_LOG_LENGTH];
      snprintf(logBuf, sizeof(logBuf), "Cannot open log file %s (%s). Using stderr only.", logPath.c_str(), strerror(errno));
      logKeyValue("System", logBuf);
    }
  }

  logKeyValue("System", "Platform layer initialized.");
}

// --- Main Tick ---

void LinuxKioskHAL::tick() {
  // Flush a batch of logs without stalling the loop
  processLogQueue(LOG_LINES_PER_FLUSH);
}

void LinuxKioskHAL::shutdown() {
  processLogQueue(LOG_QUEUE_SIZE);

  std::lock_guard<std::mutex> guard(_logMutex);
  if (_logFile != NULL) {
    fclose(_logFile);
    _logFile = NULL;
  }
}

// =================================================================================
// SECTION: SYNCHRONIZATION
// =================================================================================

bool LinuxKioskHAL::lockState(uint32_t timeoutMs) {
  return _stateMutex.try_lock_for(std::chrono::milliseconds(timeoutMs));
}

void LinuxKioskHAL::unlockState() { _stateMutex.unlock(); }

// =================================================================================
// SECTION: LOGGING SYSTEM
// =================================================================================

void LinuxKioskHAL::log(const char *message) {
  // Prefix with wall-clock time for the output sinks
  char stamp[32];
  formatTimestamp(stamp, sizeof(stamp));

  std::lock_guard<std::mutex> guard(_logMutex);

  // 1. Write to RAM history
  strncpy(_logBuffer[_logBufferIndex], message, MAX_LOG_LENGTH);
  _logBuffer[_logBufferIndex][MAX_LOG_LENGTH - 1] = '\0';

  _logBufferIndex++;
  if (_logBufferIndex >= LOG_BUFFER_SIZE) {
    _logBufferIndex = 0;
  }

  // 2. Write to Output Queue
  int nextHead = (_queueHead + 1) % LOG_QUEUE_SIZE;
  if (nextHead == _queueTail) {
    // Queue full: write the oldest line now so nothing is lost
    writeLineLocked(_outputQueue[_queueTail]);
    _queueTail = (_queueTail + 1) % LOG_QUEUE_SIZE;
    _overflowWrites++;
  }
  snprintf(_outputQueue[_queueHead], MAX_LOG_LENGTH, "%s %s", stamp, message);
  _queueHead = nextHead;
}

void LinuxKioskHAL::writeLineLocked(const char *line) {
  fprintf(stderr, "%s\n", line);
  if (_logFile != NULL) {
    fprintf(_logFile, "%s\n", line);
  }
}

void LinuxKioskHAL::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, MAX_LOG_LENGTH, " %-8s : %s", key, value);
  log(tempBuf);
}

void LinuxKioskHAL::processLogQueue(int maxLines) {
  std::lock_guard<std::mutex> guard(_logMutex);

  while (_queueHead != _queueTail && maxLines > 0) {
    writeLineLocked(_outputQueue[_queueTail]);
    _queueTail = (_queueTail + 1) % LOG_QUEUE_SIZE;
    maxLines--;
  }

  if (_logFile != NULL)
    fflush(_logFile);
}

void LinuxKioskHAL::printStartupDiagnostics() {
  char logBuf[128];

  log("==========================================================================");
  log("                            HOST DIAGNOSTICS                              ");
  log("==========================================================================");

  log("[ SYSTEM ]");

  char hostname[64];
  if (gethostname(hostname, sizeof(hostname)) != 0)
    snprintf(hostname, sizeof(hostname), "unknown");
  hostname[sizeof(hostname) - 1] = '\0';
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Hostname", hostname);
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %d", "PID", (int)getpid());
  log(logBuf);

  char stamp[32];
  formatTimestamp(stamp, sizeof(stamp));
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Local Time", stamp);
  log(logBuf);

  log("");
  log("[ LOGGING & JOURNAL ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Log File", _logFile != NULL ? "ENABLED" : "DISABLED");
  log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %d lines", "RAM History", LOG_BUFFER_SIZE);
  log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Crash Journal", _journalPath.empty() ? "DISABLED" : _journalPath.c_str());
  log(logBuf);
}

// =================================================================================
// SECTION: CLOCK
// =================================================================================

unsigned long LinuxKioskHAL::getMillis() {
  std::chrono::steady_clock::duration elapsed = std::chrono::steady_clock::now() - _bootTime;
  return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

void LinuxKioskHAL::formatTimestamp(char *buffer, size_t size) {
  time_t now = time(NULL);
  struct tm local;
  if (localtime_r(&now, &local) == NULL || strftime(buffer, size, "%Y-%m-%dT%H:%M:%S", &local) == 0) {
    snprintf(buffer, size, "%ld", (long)now);
  }
}

int LinuxKioskHAL::getMinutesOfDay() {
  time_t now = time(NULL);
  struct tm local;
  if (localtime_r(&now, &local) == NULL)
    return 0;
  return local.tm_hour * 60 + local.tm_min;
}

void LinuxKioskHAL::delay(uint32_t ms) { usleep((useconds_t)ms * 1000); }

// =================================================================================
// SECTION: CRASH JOURNAL
// =================================================================================

void LinuxKioskHAL::saveHeldPrinters(const std::vector<std::string> &printers) {
  if (_journalPath.empty())
    return;
  SettingsManager::saveHeldPrinters(_journalPath, printers);
}

bool LinuxKioskHAL::loadHeldPrinters(std::vector<std::string> &printers) {
  if (_journalPath.empty())
    return false;
  return SettingsManager::loadHeldPrinters(_journalPath, printers);
}
