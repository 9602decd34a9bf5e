/*
 * =================================================================================
 * Project:   Kiosk PrintGate - Session & Print Budget Manager
 * File:      lib/PrintGate/Types.cpp
 * =================================================================================
 */

#include "Types.h"

const char *monitorStateToString(MonitorState s) {
  switch (s) {
  case MONITOR_MONITORING:
    return "MONITORING";
  default:
    return "STOPPED";
  }
}

const char *sessionStateToString(SessionState s) {
  switch (s) {
  case SESSION_ACTIVE:
    return "ACTIVE";
  default:
    return "IDLE";
  }
}

// Values match the "reason" strings the session service reports.
const char *endReasonToString(SessionEndReason r) {
  switch (r) {
  case END_EXPIRED:
    return "expired";
  case END_FORCED:
    return "forced";
  case END_ERROR:
    return "error";
  case END_HOURS:
    return "hours";
  default:
    return "user";
  }
}

const char *storeErrorToString(StoreErrorKind k) {
  switch (k) {
  case STORE_OK:
    return "OK";
  case STORE_NOT_FOUND:
    return "NOT_FOUND";
  case STORE_UNAVAILABLE:
    return "UNAVAILABLE";
  case STORE_IO:
    return "IO";
  case STORE_PARSE:
    return "PARSE";
  case STORE_CONFLICT:
    return "CONFLICT";
  case STORE_UNSUPPORTED:
    return "UNSUPPORTED";
  default:
    return "UNKNOWN";
  }
}
