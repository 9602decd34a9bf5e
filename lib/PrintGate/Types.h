/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/Types.h
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <string>

// --- Enums ---
enum MonitorState : uint8_t { MONITOR_STOPPED, MONITOR_MONITORING };
enum SessionState : uint8_t { SESSION_IDLE, SESSION_ACTIVE };
enum SessionEndReason : uint8_t { END_USER, END_EXPIRED, END_FORCED, END_ERROR, END_HOURS };
enum AdmissionOutcome : uint8_t { ADMIT_ALLOWED, ADMIT_BLOCKED, ADMIT_UNMETERED, ADMIT_FAILED };
enum StoreErrorKind : uint8_t {
  STORE_OK,
  STORE_NOT_FOUND,
  STORE_UNAVAILABLE,
  STORE_IO,
  STORE_PARSE,
  STORE_CONFLICT,
  STORE_UNSUPPORTED
};

// --- Constants ---

// Logging
#define LOG_QUEUE_SIZE 64
#define LOG_BUFFER_SIZE 200
#define MAX_LOG_LENGTH 200

// Store paths & fields
#define STORE_PATH_METADATA "metadata"
#define STORE_PATH_OPERATING_HOURS "metadata/settings/operatingHours"
#define STORE_PATH_USERS "users/"
#define FIELD_BW_PRICE "blackAndWhitePrice"
#define FIELD_COLOR_PRICE "colorPrice"
#define FIELD_REMAINING_PRINTS "remainingPrints"
#define FIELD_REMAINING_TIME "remainingTime"
#define FIELD_SESSION_ACTIVE "isSessionActive"
#define FIELD_SESSION_START "sessionStartTime"
#define FIELD_UPDATED_AT "updatedAt"

// Admission limits. Page and copy counts come from the spooler client and are
// clamped before pricing.
#define MAX_BILLED_PAGES 100000

// --- Domain Structs ---
struct PrintJob {
  uint32_t jobId;
  std::string printerName;
  std::string documentName;
  int32_t totalPages; // <= 0 means unknown
  int32_t copies;     // <= 0 means unknown
  bool isColor;
  bool spooling; // document data still arriving, page count may grow
};

struct PricingSnapshot {
  double blackWhitePricePerPage;
  double colorPricePerPage;
};

struct OperatingHours {
  bool enabled;
  uint16_t startMinute; // minutes after midnight
  uint16_t endMinute;
  uint32_t gracePeriodMinutes;
  bool forceEnd; // "force" grace behavior
};

// --- Configuration Structs ---
struct MonitorDefaults {
  uint32_t pollIntervalMs;
  bool holdPrinterDuringAdmission;
  double defaultBlackWhitePrice;
  double defaultColorPrice;
  uint32_t heartbeatIntervalMs;
  uint32_t spoolWaitAttempts; // 0 disables the spool wait
  uint32_t spoolWaitIntervalMs;
};

struct CountdownDefaults {
  uint32_t syncIntervalSeconds;
  uint32_t firstWarningSeconds;
  uint32_t finalWarningSeconds;
  uint32_t maxSyncFailures;
  uint32_t hoursCheckIntervalSeconds;
};

// --- Statistics ---
struct MonitorStats {
  uint32_t pollCount;
  uint32_t jobsAllowed;
  uint32_t jobsBlocked;
  uint32_t jobsUnmetered;
  uint32_t jobsFailed;
  double totalCharged;
};

extern const char *monitorStateToString(MonitorState s);
extern const char *sessionStateToString(SessionState s);
extern const char *endReasonToString(SessionEndReason r);
extern const char *storeErrorToString(StoreErrorKind k);
