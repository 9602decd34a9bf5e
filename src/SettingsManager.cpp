/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Implementation of configuration loading, validation and the
 * crash journal.
 * =================================================================================
 */
#include "SettingsManager.h"
#include "Config.h"
#include "LinuxKioskHAL.h" // For logging
#include "Storage.h"

#include <stdio.h>

// Helper for logging via HAL
void SettingsManager::log(const char *key, const char *val) { LinuxKioskHAL::getInstance().logKeyValue(key, val); }

// =================================================================================
// SECTION: LOADER
// =================================================================================

void SettingsManager::loadDefaults(AppSettings &settings) {
  settings.userId = "";
  settings.initialSeconds = 0;
  settings.storePath = DEFAULT_STORE_PATH;
  settings.journalPath = DEFAULT_JOURNAL_PATH;
  settings.logPath = DEFAULT_LOG_PATH;
  settings.monitor = DEFAULT_MONITOR_DEFS;
  settings.countdown = DEFAULT_COUNTDOWN_DEFS;
}

bool SettingsManager::loadAppSettings(const std::string &configPath, AppSettings &settings) {
  JsonDocument doc;
  std::string errorMsg;
  bool missing = false;

  if (!readJsonFile(configPath, doc, errorMsg, missing)) {
    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "%s%s. Using defaults.", missing ? "No config file: " : "Config unreadable: ",
             errorMsg.c_str());
    log("Settings", logBuf);
    return false;
  }

  applyAppSettings(doc.as<JsonVariantConst>(), settings);
  log("Settings", "Configuration loaded.");
  return true;
}

void SettingsManager::applyAppSettings(JsonVariantConst json, AppSettings &settings) {
  // 1. Identity & Paths
  settings.userId = json["userId"] | settings.userId;
  settings.storePath = json["storePath"] | settings.storePath;
  settings.journalPath = json["journalPath"] | settings.journalPath;
  settings.logPath = json["logPath"] | settings.logPath;

  if (json["initialSeconds"].is<uint32_t>()) {
    settings.initialSeconds = validateAndClamp(json["initialSeconds"].as<uint32_t>(), 0, MAX_SESSION_SECONDS, "Initial Time");
  }

  // 2. Monitor
  JsonVariantConst monitor = json["monitor"];
  if (monitor.is<JsonObjectConst>()) {
    MonitorDefaults &m = settings.monitor;
    if (monitor["pollIntervalMs"].is<uint32_t>()) {
      m.pollIntervalMs = validateAndClamp(monitor["pollIntervalMs"].as<uint32_t>(), MIN_POLL_INTERVAL_MS, MAX_POLL_INTERVAL_MS,
                                          "Poll Interval");
    }
    m.holdPrinterDuringAdmission = monitor["holdPrinterDuringAdmission"] | m.holdPrinterDuringAdmission;
    if (monitor["defaultBlackWhitePrice"].is<double>()) {
      m.defaultBlackWhitePrice = validatePrice(monitor["defaultBlackWhitePrice"].as<double>(), m.defaultBlackWhitePrice, "Default B/W Price");
    }
    if (monitor["defaultColorPrice"].is<double>()) {
      m.defaultColorPrice = validatePrice(monitor["defaultColorPrice"].as<double>(), m.defaultColorPrice, "Default Color Price");
    }
    if (monitor["heartbeatIntervalMs"].is<uint32_t>()) {
      m.heartbeatIntervalMs = monitor["heartbeatIntervalMs"].as<uint32_t>();
    }
    if (monitor["spoolWaitAttempts"].is<uint32_t>()) {
      m.spoolWaitAttempts = validateAndClamp(monitor["spoolWaitAttempts"].as<uint32_t>(), 0, MAX_SPOOL_WAIT_ATTEMPTS,
                                             "Spool Wait Attempts");
    }
    if (monitor["spoolWaitIntervalMs"].is<uint32_t>()) {
      m.spoolWaitIntervalMs = validateAndClamp(monitor["spoolWaitIntervalMs"].as<uint32_t>(), MIN_SPOOL_WAIT_INTERVAL_MS,
                                               MAX_SPOOL_WAIT_INTERVAL_MS, "Spool Wait Interval");
    }
  }

  // 3. Countdown
  JsonVariantConst countdown = json["countdown"];
  if (countdown.is<JsonObjectConst>()) {
    CountdownDefaults &c = settings.countdown;
    if (countdown["syncIntervalSeconds"].is<uint32_t>()) {
      c.syncIntervalSeconds = validateAndClamp(countdown["syncIntervalSeconds"].as<uint32_t>(), MIN_SYNC_INTERVAL_S,
                                               MAX_SYNC_INTERVAL_S, "Sync Interval");
    }
    if (countdown["firstWarningSeconds"].is<uint32_t>()) {
      c.firstWarningSeconds = validateAndClamp(countdown["firstWarningSeconds"].as<uint32_t>(), 0, 3600, "First Warning");
    }
    if (countdown["finalWarningSeconds"].is<uint32_t>()) {
      c.finalWarningSeconds = validateAndClamp(countdown["finalWarningSeconds"].as<uint32_t>(), 0, c.firstWarningSeconds,
                                               "Final Warning");
    }
    if (countdown["maxSyncFailures"].is<uint32_t>()) {
      c.maxSyncFailures = validateAndClamp(countdown["maxSyncFailures"].as<uint32_t>(), 1, 100, "Max Sync Failures");
    }
    if (countdown["hoursCheckIntervalSeconds"].is<uint32_t>()) {
      c.hoursCheckIntervalSeconds = validateAndClamp(countdown["hoursCheckIntervalSeconds"].as<uint32_t>(), 1, 3600,
                                                     "Hours Check Interval");
    }
  }
}

// =================================================================================
// SECTION: VALIDATED NUMERICS
// =================================================================================

uint32_t SettingsManager::validateAndClamp(uint32_t value, uint32_t min, uint32_t max, const char *label) {
  uint32_t finalValue = value;
  const char *note = "";

  if (finalValue < min) {
    finalValue = min;
    note = " (Clamped Min)";
  } else if (finalValue > max) {
    finalValue = max;
    note = " (Clamped Max)";
  }

  if (value != finalValue) {
    char logBuf[128];
    snprintf(logBuf, sizeof(logBuf), "%s: %u%s (Req: %u)", label, finalValue, note, value);
    log("Settings", logBuf);
  }
  return finalValue;
}

double SettingsManager::validatePrice(double value, double fallback, const char *label) {
  if (value >= 0.0 && value <= MAX_PRICE_PER_PAGE)
    return value;

  char logBuf[128];
  snprintf(logBuf, sizeof(logBuf), "%s: %.2f rejected, keeping %.2f", label, value, fallback);
  log("Settings", logBuf);
  return fallback;
}

// =================================================================================
// SECTION: CRASH JOURNAL
// =================================================================================

void SettingsManager::saveHeldPrinters(const std::string &path, const std::vector<std::string> &printers) {
  JsonDocument doc;
  JsonArray held = doc["heldPrinters"].to<JsonArray>();
  for (size_t i = 0; i < printers.size(); i++) {
    held.add(printers[i]);
  }

  std::string errorMsg;
  if (!writeJsonFileAtomic(path, doc, errorMsg)) {
    char logBuf[MAX_LOG_LENGTH];
    snprintf(logBuf, sizeof(logBuf), "CRITICAL: Journal write failed: %s", errorMsg.c_str());
    log("Settings", logBuf);
  }
}

bool SettingsManager::loadHeldPrinters(const std::string &path, std::vector<std::string> &printers) {
  JsonDocument doc;
  std::string errorMsg;
  bool missing = false;

  printers.clear();
  if (!readJsonFile(path, doc, errorMsg, missing)) {
    if (!missing) {
      char logBuf[MAX_LOG_LENGTH];
      snprintf(logBuf, sizeof(logBuf), "Journal unreadable: %s", errorMsg.c_str());
      log("Settings", logBuf);
    }
    return false;
  }

  if (!doc["heldPrinters"].is<JsonArray>())
    return false;

  for (JsonVariant v : doc["heldPrinters"].as<JsonArray>()) {
    const char *name = v | "";
    if (name[0] != '\0')
      printers.push_back(name);
  }
  return true;
}
