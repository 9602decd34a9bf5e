/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Central controller for daemon configuration and local persistence.
 * - Loads the JSON configuration file.
 * - Validates numeric inputs against safety limits.
 * - Owns the held-printer crash journal format.
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <stdint.h>
#include <string>
#include <vector>
#include "Types.h"

struct AppSettings {
  std::string userId;
  uint32_t initialSeconds;
  std::string storePath;
  std::string journalPath;
  std::string logPath;
  MonitorDefaults monitor;
  CountdownDefaults countdown;
};

class SettingsManager {
public:
  // --- Daemon Configuration ---
  // Compile-time defaults from Config.h.
  static void loadDefaults(AppSettings &settings);

  // Reads 'configPath' over the defaults. Returns false (keeping defaults)
  // if the file is missing or unparsable.
  static bool loadAppSettings(const std::string &configPath, AppSettings &settings);

  // Applies a parsed configuration document. Unknown keys are ignored,
  // out-of-range numbers are clamped.
  static void applyAppSettings(JsonVariantConst json, AppSettings &settings);

  // --- Crash Journal (Save/Load) ---
  static void saveHeldPrinters(const std::string &path, const std::vector<std::string> &printers);
  static bool loadHeldPrinters(const std::string &path, std::vector<std::string> &printers);

  // --- Validated Numerics ---
  static uint32_t validateAndClamp(uint32_t value, uint32_t min, uint32_t max, const char *label);
  static double validatePrice(double value, double fallback, const char *label);

private:
  static void log(const char *key, const char *value);
};
