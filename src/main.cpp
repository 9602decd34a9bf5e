/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      main.cpp
 * Description: Application entry point.
 * Usage:     kiosk-printgate [config.json] [userId] [seconds]
 * =================================================================================
 */

#include <atomic>
#include <exception>
#include <pthread.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <thread>
#include <unistd.h>

// --- Module Includes ---
#include "Config.h"
#include "ConsoleNotifier.h"
#include "CupsSpooler.h"
#include "JsonFileStore.h"
#include "LinuxKioskHAL.h"
#include "SettingsManager.h"

// --- Print Gate Includes ---
#include "CrashRecoveryRegistry.h"
#include "PrintMonitor.h"
#include "SessionCountdown.h"

// --- Dependencies ---
LinuxKioskHAL &hal = LinuxKioskHAL::getInstance();
AppSettings settings;

CupsSpooler *spooler = nullptr;
JsonFileStore *store = nullptr;
CrashRecoveryRegistry *recovery = nullptr;
ConsoleNotifier *notifier = nullptr;

// --- Print Gate ---
PrintMonitor *printMonitor = nullptr;
SessionCountdown *sessionCountdown = nullptr;

// --- Shutdown Flags ---
static std::atomic<bool> g_running(true);
static std::atomic<int> g_stopSignal(0);

/**
 * Prints application identity and build information.
 */
void printApplicationDiagnostics() {
    char logBuf[128];

    hal.log("==========================================================================");
    hal.log("                       APPLICATION IDENTITY                               ");
    hal.log("==========================================================================");

    // -------------------------------------------------------------------------
    // SECTION: IDENTITY
    // -------------------------------------------------------------------------
    hal.log("[ VERSION INFO ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Application", KIOSK_NAME);
    hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Version", KIOSK_VERSION);
    hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: BUILD METADATA
    // -------------------------------------------------------------------------
    hal.log("");
    hal.log("[ BUILD DETAILS ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
    hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
    hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", __cplusplus);
    hal.log(logBuf);

    // -------------------------------------------------------------------------
    // SECTION: CONFIGURATION
    // -------------------------------------------------------------------------
    hal.log("");
    hal.log("[ FILES ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Budget Store", settings.storePath.c_str());
    hal.log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Log File", settings.logPath.empty() ? "(stderr)" : settings.logPath.c_str());
    hal.log(logBuf);

    hal.log("==========================================================================");
}

// =================================================================
// --- Exit Safety Handlers ---
// =================================================================

// Runs on normal process exit (return from main, exit()).
static void resumeHeldPrintersAtExit() {
  if (recovery != nullptr) {
    recovery->resumeAll("Process Exit");
  }
  hal.shutdown();
}

// Runs when an exception escapes. Must not return.
static void resumeHeldPrintersOnTerminate() {
  if (recovery != nullptr) {
    recovery->resumeAll("Terminate");
  }
  hal.shutdown();
  abort();
}

/**
 * Dedicated signal thread. SIGINT/SIGTERM/SIGHUP are blocked in every other
 * thread, so they are only ever delivered here and handled outside of an
 * async-signal context.
 */
static void signalWatcher(sigset_t signals) {
  int sig = 0;
  if (sigwait(&signals, &sig) != 0)
    return;

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Signal %d (%s) received. Shutting down.", sig, strsignal(sig));
  hal.logKeyValue("System", logBuf);

  // Let an in-flight admission finish before touching the queues
  bool locked = hal.lockState(2000);
  if (recovery != nullptr) {
    recovery->resumeAll("Signal");
  }
  if (locked)
    hal.unlockState();

  g_stopSignal = sig;
  g_running = false;
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

int setup(int argc, char **argv) {
  // 1. Signals: block before any thread exists so all threads inherit the mask
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGHUP);
  pthread_sigmask(SIG_BLOCK, &signals, NULL);

  // 2. Configuration
  SettingsManager::loadDefaults(settings);
  const char *configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;
  SettingsManager::loadAppSettings(configPath, settings);

  if (argc > 2)
    settings.userId = argv[2];
  if (argc > 3)
    settings.initialSeconds = SettingsManager::validateAndClamp((uint32_t)strtoul(argv[3], NULL, 10), 0, MAX_SESSION_SECONDS,
                                                                "Initial Time");

  // 3. Platform
  hal.initialize(settings.logPath, settings.journalPath);
  printApplicationDiagnostics();
  hal.printStartupDiagnostics();
  hal.tick();

  // 4. Adapters
  spooler = new CupsSpooler(hal);
  store = new JsonFileStore(settings.storePath);
  recovery = new CrashRecoveryRegistry(hal, *spooler);
  notifier = new ConsoleNotifier(hal);

  spooler->printStartupDiagnostics();
  hal.tick();

  // 5. Crash recovery: repair what a previous run left held, then arm handlers
  recovery->restoreFromJournal();
  atexit(resumeHeldPrintersAtExit);
  std::set_terminate(resumeHeldPrintersOnTerminate);
  std::thread(signalWatcher, signals).detach();

  // 6. Print Gate
  printMonitor = new PrintMonitor(hal, *spooler, *store, *recovery, *notifier, settings.monitor);
  sessionCountdown = new SessionCountdown(hal, *store, *printMonitor, *notifier, settings.countdown, DEFAULT_OPERATING_HOURS);

  // 7. Session
  int status = sessionCountdown->startSession(settings.userId, settings.initialSeconds);

  printMonitor->printStartupDiagnostics();
  sessionCountdown->printStartupDiagnostics();
  hal.log("==========================================================================");
  hal.tick();

  if (status != 200) {
    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), "Session start rejected (%d).", status);
    hal.logKeyValue("System", logBuf);
    return status;
  }
  return 0;
}

void loop() {
  unsigned long lastSecond = hal.getMillis();
  uint32_t pendingTicks = 0;

  hal.logKeyValue("Session", "Entering main loop.");

  while (g_running && !notifier->isSessionOver()) {
    // 1. Housekeeping (logging)
    hal.tick();

    // 2. Accumulate whole seconds
    unsigned long now = hal.getMillis();
    while (now - lastSecond >= 1000) {
      pendingTicks++;
      lastSecond += 1000;
    }

    // 3. Countdown & Print Gate
    if (hal.lockState(STATE_LOCK_TIMEOUT_MS)) {
      while (pendingTicks > 0 && sessionCountdown->getState() == SESSION_ACTIVE) {
        sessionCountdown->tick();
        pendingTicks--;
      }
      pendingTicks = 0;

      printMonitor->tick();
      hal.unlockState();
    }

    usleep(MAIN_LOOP_SLEEP_MS * 1000);
  }
}

int main(int argc, char **argv) {
  int status = setup(argc, argv);

  if (status == 0) {
    loop();
  }

  // Orderly shutdown: end the session (stops monitoring, final sync)
  if (hal.lockState(2000)) {
    if (sessionCountdown != nullptr && sessionCountdown->getState() == SESSION_ACTIVE) {
      sessionCountdown->endSession(g_stopSignal != 0 ? END_FORCED : END_USER);
    }
    hal.unlockState();
  }

  if (recovery != nullptr) {
    recovery->resumeAll("Shutdown");
  }
  hal.logKeyValue("System", "Goodbye.");

  return status == 0 ? 0 : 1;
}
